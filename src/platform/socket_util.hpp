#pragma once

#include <string>
#include <poll.h>

using socket_t = int;
#define PXRELAY_INVALID_SOCKET (-1)

namespace platform {

// Resolve host:port and open a TCP connection, waiting at most timeout_ms.
// Returns PXRELAY_INVALID_SOCKET and fills `error` on failure.
socket_t connect_tcp(const std::string& host, int port, int timeout_ms, std::string& error);

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Enable TCP keepalive probes (idle 60s, interval 15s, 4 probes).
void enable_tcp_keepalive(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
