#pragma once

/**
 * @file realtime_server.h
 * @brief TCP listener feeding realtime connections to the signal router
 *
 * Wire format: every frame is a 4-byte big-endian length followed by UTF-8
 * JSON. The first frame a client sends must be
 * {"type":"hello","token":"...","room_id":"..."}.
 */

#include "signal_router.h"
#include "socket.h"
#include "socket_transport.h"
#include "threadmanager.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace cloudless {

class RealtimeServer : public ThreadManager {
public:
    /**
     * @param port Port to listen on, 0 for an ephemeral port
     * @param send_timeout_ms Bound applied to every send on accepted sockets
     */
    RealtimeServer(SignalRouter& router, int port, int send_timeout_ms);
    ~RealtimeServer() override;

    bool start();

    /**
     * Stop accepting, close every open connection and join all threads
     */
    void stop();

    bool is_running() const { return running_.load(); }

    /**
     * Port actually bound, valid after start()
     */
    int get_port() const { return bound_port_; }

    size_t get_connection_count() const;
    uint64_t get_accepted_count() const { return accepted_count_.load(); }

private:
    SignalRouter& router_;
    int port_;
    int send_timeout_ms_;
    int bound_port_;
    socket_t listen_socket_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> accepted_count_;

    // Per-connection threads; ids land in finished_connections_ once their thread is done
    mutable std::mutex connections_mutex_;
    uint64_t next_connection_id_;
    std::unordered_map<uint64_t, std::thread> connection_threads_;
    std::unordered_map<uint64_t, std::shared_ptr<SocketTransport>> open_transports_;
    std::vector<uint64_t> finished_connections_;

    void accept_loop();
    void handle_connection(uint64_t connection_id, std::shared_ptr<SocketTransport> transport);
    void reap_finished_connections();
    void join_connection_threads();

    /**
     * Read and validate the hello frame
     * @return false if the client sent anything else or went away
     */
    bool read_hello(Transport& transport, std::string& token, std::string& room_id);
};

} // namespace cloudless
