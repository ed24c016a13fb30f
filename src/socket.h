#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <sys/socket.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <unistd.h>

typedef int socket_t;
#define INVALID_SOCKET_VALUE -1
#define SOCKET_ERROR_VALUE -1

namespace cloudless {

/**
 * Upper bound for one framed message; larger length prefixes are treated as a
 * protocol error.
 */
constexpr uint32_t MAX_FRAME_SIZE = 16 * 1024 * 1024;

// TCP Socket Functions

/**
 * Create a TCP client socket and connect to a server (IPv4 or IPv6 literal or hostname)
 * @param host The hostname or IP address to connect to
 * @param port The port number to connect to
 * @return Socket handle, or INVALID_SOCKET_VALUE on error
 */
socket_t create_tcp_client(const std::string& host, int port);

/**
 * Create a TCP server socket and bind to a port using dual stack (IPv6 with IPv4 support)
 * @param port The port number to bind to (0 picks an ephemeral port)
 * @param backlog The maximum number of pending connections
 * @return Socket handle, or INVALID_SOCKET_VALUE on error
 */
socket_t create_tcp_server(int port, int backlog = 16);

/**
 * Accept a client connection on a server socket
 * @param server_socket The server socket handle
 * @return Client socket handle, or INVALID_SOCKET_VALUE on error
 */
socket_t accept_client(socket_t server_socket);

/**
 * Get the peer address (IP:port) from a connected socket
 * @return Peer address string in format "IP:port", or empty string on error
 */
std::string get_peer_address(socket_t socket);

/**
 * Port a bound socket is listening on, or -1 on error
 */
int get_bound_port(socket_t socket);

/**
 * Bound every blocking send on this socket
 * @param timeout_ms Timeout in milliseconds (0 disables the bound)
 */
bool set_socket_send_timeout(socket_t socket, int timeout_ms);

/**
 * Send every byte of `data`, retrying short writes
 * @return true if the whole buffer was written
 */
bool send_exact_bytes(socket_t socket, const uint8_t* data, size_t size);

/**
 * Receive exact number of bytes from a TCP socket (blocking until complete)
 * @return Received binary data, empty vector on error or connection close
 */
std::vector<uint8_t> receive_exact_bytes(socket_t socket, size_t num_bytes);

/**
 * Send a framed string message: 4-byte big-endian length followed by the payload
 * @return Total bytes sent (including length prefix), or -1 on error
 */
int send_tcp_string_framed(socket_t socket, const std::string& message);

/**
 * Receive a complete framed string message
 * @param message Receives the payload
 * @return false on error, connection close or oversized frame
 */
bool receive_tcp_string_framed(socket_t socket, std::string& message);

// Common Socket Functions

/**
 * Stop both directions of a connected socket, unblocking a pending receive
 */
void shutdown_socket(socket_t socket);

/**
 * Close a socket
 */
void close_socket(socket_t socket);

bool is_valid_socket(socket_t socket);

} // namespace cloudless
