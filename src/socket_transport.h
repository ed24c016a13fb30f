#pragma once

#include "socket.h"
#include "transport.h"
#include <atomic>
#include <mutex>
#include <string>

namespace cloudless {

/**
 * Transport over a connected TCP socket using 4-byte length-prefixed JSON frames.
 * The socket is owned by the transport and closed when it is destroyed.
 */
class SocketTransport : public Transport {
public:
    /**
     * @param socket Connected socket, ownership is taken
     * @param send_timeout_ms Bound on each blocking send (0 for none)
     */
    SocketTransport(socket_t socket, int send_timeout_ms);
    ~SocketTransport() override;

    bool send_text(const std::string& message) override;
    bool receive_text(std::string& message) override;
    void close(int code, const std::string& reason) override;
    bool is_closed() const override { return closed_.load(); }
    std::string describe() const override { return peer_address_; }


private:
    socket_t socket_;
    std::string peer_address_;
    std::mutex send_mutex_;
    std::atomic<bool> closed_;

    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;
};

} // namespace cloudless
