#pragma once

#include <chrono>
#include <string>
#include <poll.h>
#include <core/types.hpp>

using socket_t = int;
#define REXEC_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Milliseconds left until deadline, never negative.
int remaining_ms(std::chrono::steady_clock::time_point deadline);

// Resolve host and open a non-blocking TCP connection to host:port, trying
// resolved addresses in order. timeout_ms bounds the whole call, not each
// address.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms);

} // namespace platform
