#pragma once

// Socket helpers shared by the SSH session and the local tunnel listener.

#include <poll.h>
#include <string>

using socket_t = int;
#define KNADMIN_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Open a TCP connection to host:port, waiting at most timeout_ms for the
// handshake. The returned socket is non-blocking.
socket_t connect_tcp(const std::string& host, int port, int timeout_ms, std::string& error);

// Bind and listen on 127.0.0.1:port.
socket_t listen_local(int port, int backlog, std::string& error);

// Check if a local TCP port is accepting connections.
bool is_port_open(int port);

} // namespace platform
