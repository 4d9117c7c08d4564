#pragma once

#include <string>
#include <poll.h>
#include <core/types.hpp>

using socket_t = int;
#define MCB_INVALID_SOCKET (-1)

namespace platform {

// Bind and listen on host:port (IPv4). Returns the listening socket.
Result<socket_t> listen_tcp(const std::string& host, int port, int backlog);

// Port the socket is bound to (useful after binding port 0).
int bound_port(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Write the whole buffer. False if the peer went away.
bool send_all(socket_t sock, const std::string& data);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
