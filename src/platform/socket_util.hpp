#pragma once

// Socket utilities for raw SCPI links.

#include <string>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define MRILABS_INVALID_SOCKET INVALID_SOCKET
#else
#  include <poll.h>
   using socket_t = int;
#  define MRILABS_INVALID_SOCKET (-1)
#endif

namespace platform {

// Initialize networking (WSAStartup on Windows, no-op on Unix).
void init_networking();

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Open a TCP connection, giving up after timeout_ms.
// Returns MRILABS_INVALID_SOCKET on failure; the socket is left non-blocking.
socket_t connect_tcp(const std::string& host, int port, int timeout_ms);

// Write all of `data`, polling for writability. Returns false on error/timeout.
bool send_all(socket_t sock, const std::string& data, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
