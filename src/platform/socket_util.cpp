#include "socket_util.hpp"
#include <fmt/format.h>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace platform {

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

static void set_blocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags & ~O_NONBLOCK);
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret;
    do {
        ret = poll(&pfd, 1, timeout_ms);
    } while (ret < 0 && errno == EINTR);
    return (ret > 0) ? pfd.revents : 0;
}

void close_socket(socket_t sock) {
    if (sock >= 0) close(sock);
}

static ConnectStatus classify_errno(int err) {
    if (err == ECONNREFUSED) return ConnectStatus::Refused;
    if (err == ETIMEDOUT) return ConnectStatus::Timeout;
    return ConnectStatus::Failed;
}

// One address: non-blocking connect, then wait for writability.
static ConnectOutcome connect_one(const struct addrinfo* ai, int timeout_secs) {
    socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (sock < 0) {
        return {ConnectStatus::Failed, SSHC_INVALID_SOCKET,
                fmt::format("socket() failed: {}", std::strerror(errno))};
    }
    fcntl(sock, F_SETFD, FD_CLOEXEC);
    set_nonblocking(sock);

    int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
    if (ret < 0 && errno != EINPROGRESS) {
        int err = errno;
        close_socket(sock);
        return {classify_errno(err), SSHC_INVALID_SOCKET, std::strerror(err)};
    }

    if (ret < 0) {
        int timeout_ms = timeout_secs > 0 ? timeout_secs * 1000 : -1;
        int revents = poll_socket(sock, POLLOUT, timeout_ms);
        if (revents == 0) {
            close_socket(sock);
            return {ConnectStatus::Timeout, SSHC_INVALID_SOCKET, "connection timed out"};
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
        if (sock_err != 0) {
            close_socket(sock);
            return {classify_errno(sock_err), SSHC_INVALID_SOCKET, std::strerror(sock_err)};
        }
    }

    set_blocking(sock);
    return {ConnectStatus::Ok, sock, ""};
}

ConnectOutcome connect_tcp(const std::string& host, int port, int timeout_secs) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0) {
        return {ConnectStatus::Failed, SSHC_INVALID_SOCKET,
                fmt::format("could not resolve hostname {}: {}", host, gai_strerror(rc))};
    }

    // Report the most retryable failure if every address fails
    ConnectOutcome last{ConnectStatus::Failed, SSHC_INVALID_SOCKET, "no usable address"};
    for (auto* ai = res; ai; ai = ai->ai_next) {
        auto outcome = connect_one(ai, timeout_secs);
        if (outcome.status == ConnectStatus::Ok) {
            freeaddrinfo(res);
            return outcome;
        }
        if (last.status == ConnectStatus::Failed || outcome.status != ConnectStatus::Failed) {
            last = outcome;
        }
    }
    freeaddrinfo(res);
    return last;
}

Result<socket_t> listen_tcp(const std::string& addr, int port, int backlog) {
    socket_t fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return Result<socket_t>::Err(fmt::format("socket() failed for port {}: {}",
                                                 port, std::strerror(errno)));
    }
    fcntl(fd, F_SETFD, FD_CLOEXEC);

    int reuse = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, addr.c_str(), &sa.sin_addr) != 1) {
        close_socket(fd);
        return Result<socket_t>::Err(fmt::format("invalid bind address {}", addr));
    }

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&sa), sizeof(sa)) < 0) {
        int err = errno;
        close_socket(fd);
        return Result<socket_t>::Err(fmt::format("bind {}:{} failed: {}", addr, port, std::strerror(err)));
    }
    if (listen(fd, backlog) < 0) {
        int err = errno;
        close_socket(fd);
        return Result<socket_t>::Err(fmt::format("listen on {}:{} failed: {}", addr, port, std::strerror(err)));
    }
    return Result<socket_t>::Ok(fd);
}

int local_port(socket_t sock) {
    struct sockaddr_in sa{};
    socklen_t len = sizeof(sa);
    if (getsockname(sock, reinterpret_cast<struct sockaddr*>(&sa), &len) != 0) return 0;
    return ntohs(sa.sin_port);
}

} // namespace platform
