#include "realtime_server.h"
#include "cloudless_log_macros.h"
#include <nlohmann/json.hpp>

namespace cloudless {

RealtimeServer::RealtimeServer(SignalRouter& router, int port, int send_timeout_ms)
    : router_(router),
      port_(port),
      send_timeout_ms_(send_timeout_ms),
      bound_port_(-1),
      listen_socket_(INVALID_SOCKET_VALUE),
      running_(false),
      accepted_count_(0),
      next_connection_id_(1) {
}

RealtimeServer::~RealtimeServer() {
    stop();
}

bool RealtimeServer::start() {
    if (running_.load()) {
        LOG_SERVER_WARN("Realtime server is already running");
        return false;
    }

    listen_socket_ = create_tcp_server(port_);
    if (!is_valid_socket(listen_socket_)) {
        LOG_SERVER_ERROR("Failed to listen on port " << port_);
        return false;
    }
    bound_port_ = get_bound_port(listen_socket_);

    reset_shutdown();
    running_.store(true);
    add_managed_thread(std::thread(&RealtimeServer::accept_loop, this), "realtime-accept");

    LOG_SERVER_INFO("Realtime server listening on port " << bound_port_);
    return true;
}

void RealtimeServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_SERVER_INFO("Stopping realtime server");
    shutdown_all_threads();

    // Unblocks accept()
    shutdown_socket(listen_socket_);

    std::vector<std::shared_ptr<SocketTransport>> open;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto& entry : open_transports_) {
            open.push_back(entry.second);
        }
    }
    for (auto& transport : open) {
        transport->close(CLOSE_NORMAL, "Server shutting down");
    }

    join_all_active_threads();
    join_connection_threads();

    close_socket(listen_socket_);
    listen_socket_ = INVALID_SOCKET_VALUE;
    LOG_SERVER_INFO("Realtime server stopped");
}

size_t RealtimeServer::get_connection_count() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return open_transports_.size();
}

void RealtimeServer::accept_loop() {
    LOG_SERVER_DEBUG("Accept loop started");

    while (!is_shutdown_requested()) {
        socket_t client = accept_client(listen_socket_);
        if (!is_valid_socket(client)) {
            if (is_shutdown_requested()) {
                break;
            }
            LOG_SERVER_WARN("accept failed, retrying");
            if (!wait_for_shutdown_or(std::chrono::milliseconds(100))) {
                break;
            }
            continue;
        }

        auto transport = std::make_shared<SocketTransport>(client, send_timeout_ms_);
        accepted_count_++;
        LOG_SERVER_DEBUG("Accepted connection from " << transport->describe());

        reap_finished_connections();

        std::lock_guard<std::mutex> lock(connections_mutex_);
        if (is_shutdown_requested()) {
            transport->close(CLOSE_NORMAL, "Server shutting down");
            break;
        }
        uint64_t connection_id = next_connection_id_++;
        open_transports_[connection_id] = transport;
        connection_threads_.emplace(connection_id,
                                    std::thread(&RealtimeServer::handle_connection, this, connection_id, transport));
    }

    LOG_SERVER_DEBUG("Accept loop exited");
}

void RealtimeServer::handle_connection(uint64_t connection_id, std::shared_ptr<SocketTransport> transport) {
    std::string token;
    std::string room_id;
    if (read_hello(*transport, token, room_id)) {
        router_.serve(transport, token, room_id);
    }
    transport->close(CLOSE_NORMAL, "Connection ended");

    std::lock_guard<std::mutex> lock(connections_mutex_);
    open_transports_.erase(connection_id);
    finished_connections_.push_back(connection_id);
}

bool RealtimeServer::read_hello(Transport& transport, std::string& token, std::string& room_id) {
    std::string text;
    if (!transport.receive_text(text)) {
        LOG_SERVER_DEBUG("Client " << transport.describe() << " left before hello");
        return false;
    }

    nlohmann::json hello = nlohmann::json::parse(text, nullptr, false);
    if (hello.is_discarded() || !hello.is_object() ||
        !hello.contains("type") || hello["type"] != "hello" ||
        !hello.contains("token") || !hello["token"].is_string() ||
        !hello.contains("room_id") || !hello["room_id"].is_string()) {
        LOG_SERVER_INFO("Client " << transport.describe() << " sent a malformed hello");
        transport.close(CLOSE_INVALID_TOKEN, "Expected hello frame");
        return false;
    }

    token = hello["token"].get<std::string>();
    room_id = hello["room_id"].get<std::string>();
    return true;
}

void RealtimeServer::reap_finished_connections() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (uint64_t connection_id : finished_connections_) {
            auto it = connection_threads_.find(connection_id);
            if (it != connection_threads_.end()) {
                done.push_back(std::move(it->second));
                connection_threads_.erase(it);
            }
        }
        finished_connections_.clear();
    }

    for (auto& t : done) {
        if (t.joinable()) {
            t.join();
        }
    }
}

void RealtimeServer::join_connection_threads() {
    std::vector<std::thread> remaining;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto& entry : connection_threads_) {
            remaining.push_back(std::move(entry.second));
        }
        connection_threads_.clear();
        finished_connections_.clear();
    }

    LOG_SERVER_DEBUG("Joining " << remaining.size() << " connection threads");
    for (auto& t : remaining) {
        if (t.joinable()) {
            t.join();
        }
    }
}

} // namespace cloudless
