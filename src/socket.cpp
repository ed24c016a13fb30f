#include "socket.h"
#include "cloudless_log_macros.h"
#include <cstring>
#include <cerrno>
#include <netdb.h>
#include <sys/time.h>

namespace cloudless {

socket_t create_tcp_client(const std::string& host, int port) {
    LOG_SOCKET_DEBUG("Creating TCP client socket for " << host << ":" << port);

    if (port <= 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port << " (must be 1-65535)");
        return INVALID_SOCKET_VALUE;
    }

    addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* results = nullptr;
    std::string port_str = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &results);
    if (rc != 0) {
        LOG_SOCKET_ERROR("Failed to resolve hostname " << host << ": " << gai_strerror(rc));
        return INVALID_SOCKET_VALUE;
    }

    socket_t client_socket = INVALID_SOCKET_VALUE;
    for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        client_socket = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (client_socket == INVALID_SOCKET_VALUE) {
            continue;
        }
        if (connect(client_socket, ai->ai_addr, ai->ai_addrlen) == 0) {
            break;
        }
        close_socket(client_socket);
        client_socket = INVALID_SOCKET_VALUE;
    }
    freeaddrinfo(results);

    if (client_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Connection to " << host << ":" << port << " failed");
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_DEBUG("Connected to " << host << ":" << port);
    return client_socket;
}

socket_t create_tcp_server(int port, int backlog) {
    LOG_SOCKET_DEBUG("Creating TCP server socket (dual stack) on port " << port);

    if (port < 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port << " (must be 0-65535)");
        return INVALID_SOCKET_VALUE;
    }

    socket_t server_socket = socket(AF_INET6, SOCK_STREAM, 0);
    if (server_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Failed to create dual stack server socket");
        return INVALID_SOCKET_VALUE;
    }

    int opt = 1;
    if (setsockopt(server_socket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to set dual stack socket options");
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    // Accept IPv4-mapped connections too
    int ipv6_only = 0;
    if (setsockopt(server_socket, IPPROTO_IPV6, IPV6_V6ONLY, &ipv6_only, sizeof(ipv6_only)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_WARN("Failed to disable IPv6-only mode, will be IPv6 only");
    }

    sockaddr_in6 server_addr;
    memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin6_family = AF_INET6;
    server_addr.sin6_addr = in6addr_any;
    server_addr.sin6_port = htons(static_cast<uint16_t>(port));

    if (bind(server_socket, reinterpret_cast<sockaddr*>(&server_addr), sizeof(server_addr)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to bind dual stack server socket to port " << port << " (" << strerror(errno) << ")");
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    if (listen(server_socket, backlog) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to listen on dual stack server socket");
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_INFO("Dual stack server listening on port " << get_bound_port(server_socket) << " (backlog: " << backlog << ")");
    return server_socket;
}

socket_t accept_client(socket_t server_socket) {
    sockaddr_storage client_addr;
    socklen_t client_addr_len = sizeof(client_addr);

    socket_t client_socket = accept(server_socket, reinterpret_cast<sockaddr*>(&client_addr), &client_addr_len);
    if (client_socket == INVALID_SOCKET_VALUE) {
        // Expected when the listener is shut down
        LOG_SOCKET_DEBUG("accept() returned no client (" << strerror(errno) << ")");
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_DEBUG("Client connected from " << get_peer_address(client_socket));
    return client_socket;
}

std::string get_peer_address(socket_t socket) {
    sockaddr_storage peer_addr;
    socklen_t peer_addr_len = sizeof(peer_addr);

    if (getpeername(socket, reinterpret_cast<sockaddr*>(&peer_addr), &peer_addr_len) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to get peer address for socket " << socket);
        return "";
    }

    std::string peer_ip;
    uint16_t peer_port = 0;

    if (peer_addr.ss_family == AF_INET) {
        char ip_str[INET_ADDRSTRLEN];
        auto* addr_in = reinterpret_cast<sockaddr_in*>(&peer_addr);
        inet_ntop(AF_INET, &addr_in->sin_addr, ip_str, INET_ADDRSTRLEN);
        peer_ip = ip_str;
        peer_port = ntohs(addr_in->sin_port);
    } else if (peer_addr.ss_family == AF_INET6) {
        char ip_str[INET6_ADDRSTRLEN];
        auto* addr_in6 = reinterpret_cast<sockaddr_in6*>(&peer_addr);
        inet_ntop(AF_INET6, &addr_in6->sin6_addr, ip_str, INET6_ADDRSTRLEN);
        peer_ip = ip_str;
        peer_port = ntohs(addr_in6->sin6_port);
    } else {
        LOG_SOCKET_ERROR("Unknown address family for socket " << socket);
        return "";
    }

    return peer_ip + ":" + std::to_string(peer_port);
}

int get_bound_port(socket_t socket) {
    sockaddr_storage addr;
    socklen_t addr_len = sizeof(addr);
    if (getsockname(socket, reinterpret_cast<sockaddr*>(&addr), &addr_len) == SOCKET_ERROR_VALUE) {
        return -1;
    }
    if (addr.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
    }
    return -1;
}

bool set_socket_send_timeout(socket_t socket, int timeout_ms) {
    timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    if (setsockopt(socket, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_WARN("Failed to set send timeout on socket " << socket);
        return false;
    }
    return true;
}

bool send_exact_bytes(socket_t socket, const uint8_t* data, size_t size) {
    size_t total_sent = 0;
    while (total_sent < size) {
        ssize_t sent = send(socket, data + total_sent, size - total_sent, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_SOCKET_DEBUG("send() failed on socket " << socket << ": " << strerror(errno));
            return false;
        }
        if (sent == 0) {
            return false;
        }
        total_sent += static_cast<size_t>(sent);
    }
    return true;
}

std::vector<uint8_t> receive_exact_bytes(socket_t socket, size_t num_bytes) {
    std::vector<uint8_t> buffer(num_bytes);
    size_t total_received = 0;

    while (total_received < num_bytes) {
        ssize_t received = recv(socket, buffer.data() + total_received, num_bytes - total_received, 0);
        if (received < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_SOCKET_DEBUG("recv() failed on socket " << socket << ": " << strerror(errno));
            return std::vector<uint8_t>();
        }
        if (received == 0) {
            // Orderly close by the peer
            return std::vector<uint8_t>();
        }
        total_received += static_cast<size_t>(received);
    }
    return buffer;
}

int send_tcp_string_framed(socket_t socket, const std::string& message) {
    if (message.size() > MAX_FRAME_SIZE) {
        LOG_SOCKET_ERROR("Refusing to send oversized frame (" << message.size() << " bytes)");
        return -1;
    }

    uint32_t length = static_cast<uint32_t>(message.size());
    std::vector<uint8_t> frame;
    frame.reserve(4 + message.size());
    frame.push_back(static_cast<uint8_t>((length >> 24) & 0xFF));
    frame.push_back(static_cast<uint8_t>((length >> 16) & 0xFF));
    frame.push_back(static_cast<uint8_t>((length >> 8) & 0xFF));
    frame.push_back(static_cast<uint8_t>(length & 0xFF));
    frame.insert(frame.end(), message.begin(), message.end());

    if (!send_exact_bytes(socket, frame.data(), frame.size())) {
        return -1;
    }
    return static_cast<int>(frame.size());
}

bool receive_tcp_string_framed(socket_t socket, std::string& message) {
    std::vector<uint8_t> header = receive_exact_bytes(socket, 4);
    if (header.size() != 4) {
        return false;
    }

    uint32_t length = (static_cast<uint32_t>(header[0]) << 24) |
                      (static_cast<uint32_t>(header[1]) << 16) |
                      (static_cast<uint32_t>(header[2]) << 8) |
                      static_cast<uint32_t>(header[3]);
    if (length > MAX_FRAME_SIZE) {
        LOG_SOCKET_WARN("Oversized frame length " << length << " on socket " << socket);
        return false;
    }

    if (length == 0) {
        message.clear();
        return true;
    }

    std::vector<uint8_t> payload = receive_exact_bytes(socket, length);
    if (payload.size() != length) {
        return false;
    }
    message.assign(payload.begin(), payload.end());
    return true;
}

void shutdown_socket(socket_t socket) {
    if (is_valid_socket(socket)) {
        shutdown(socket, SHUT_RDWR);
    }
}

void close_socket(socket_t socket) {
    if (is_valid_socket(socket)) {
        LOG_SOCKET_DEBUG("Closing socket " << socket);
        close(socket);
    }
}

bool is_valid_socket(socket_t socket) {
    return socket != INVALID_SOCKET_VALUE;
}

} // namespace cloudless
