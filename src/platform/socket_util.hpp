#pragma once

#include <string>
#include <core/types.hpp>
#include <poll.h>

using socket_t = int;
#define SSHC_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

enum class ConnectStatus {
    Ok,
    Timeout,    // no answer within the connect timeout (or ETIMEDOUT)
    Refused,    // ECONNREFUSED
    Failed,     // resolution failure, unreachable network, ...
};

struct ConnectOutcome {
    ConnectStatus status;
    socket_t sock;
    std::string error;
};

// Resolve host and connect over TCP, trying each address in turn.
// timeout_secs <= 0 waits for the OS connect timeout.
// On success the socket is left in blocking mode.
ConnectOutcome connect_tcp(const std::string& host, int port, int timeout_secs);

// Bind and listen on addr:port (SO_REUSEADDR set).
Result<socket_t> listen_tcp(const std::string& addr, int port, int backlog);

// Port a bound socket is listening on (for sockets bound to port 0).
int local_port(socket_t sock);

} // namespace platform
