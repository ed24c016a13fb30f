#include "socket_transport.h"
#include "cloudless_log_macros.h"
#include <nlohmann/json.hpp>

namespace cloudless {

SocketTransport::SocketTransport(socket_t socket, int send_timeout_ms)
    : socket_(socket), closed_(false) {
    peer_address_ = get_peer_address(socket_);
    if (peer_address_.empty()) {
        peer_address_ = "socket:" + std::to_string(socket_);
    }
    if (send_timeout_ms > 0) {
        set_socket_send_timeout(socket_, send_timeout_ms);
    }
}

SocketTransport::~SocketTransport() {
    close_socket(socket_);
}

bool SocketTransport::send_text(const std::string& message) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (closed_.load()) {
        return false;
    }
    if (send_tcp_string_framed(socket_, message) < 0) {
        LOG_SOCKET_DEBUG("Send to " << peer_address_ << " failed");
        return false;
    }
    return true;
}

bool SocketTransport::receive_text(std::string& message) {
    if (closed_.load()) {
        return false;
    }
    return receive_tcp_string_framed(socket_, message);
}

void SocketTransport::close(int code, const std::string& reason) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (closed_.exchange(true)) {
        return;
    }

    nlohmann::json frame;
    frame["type"] = "close";
    frame["code"] = code;
    frame["reason"] = reason;
    if (send_tcp_string_framed(socket_, frame.dump()) < 0) {
        LOG_SOCKET_DEBUG("Peer " << peer_address_ << " gone before close frame");
    }

    shutdown_socket(socket_);
    LOG_SOCKET_DEBUG("Closed transport to " << peer_address_ << " (code " << code << ": " << reason << ")");
}

} // namespace cloudless
