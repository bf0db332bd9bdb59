#include "libssh2_transport.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#include <chrono>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

using Clock = std::chrono::steady_clock;

// ── Helpers ────────────────────────────────────────────────────

static std::once_flag g_init_once;
static int g_init_rc = 0;

bool init_libssh2() {
    std::call_once(g_init_once, [] { g_init_rc = libssh2_init(0); });
    return g_init_rc == 0;
}

static std::string last_error(LIBSSH2_SESSION* session) {
    if (!session) return "session closed";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, len) : "unknown libssh2 error";
}

// Wait until the socket is ready in whatever direction libssh2 is
// blocked on. Capped so threads waiting on different channels notice
// data another thread already pulled off the socket.
static void wait_socket(SessionLink& link, int timeout_ms) {
    int dir;
    {
        std::lock_guard<std::mutex> lock(link.mutex);
        if (link.closed) return;
        dir = libssh2_session_block_directions(link.session);
    }
    short events = 0;
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) events = POLLIN;
    platform::poll_socket(link.sock, events, timeout_ms);
}

// Run op under the session lock until it stops returning EAGAIN.
// Gives up with EAGAIN after max_wait_ms (negative waits forever).
template <typename Op>
static int run_locked(SessionLink& link, Op op, int max_wait_ms = -1) {
    auto deadline = Clock::now() + std::chrono::milliseconds(max_wait_ms);
    for (;;) {
        int rc;
        {
            std::lock_guard<std::mutex> lock(link.mutex);
            if (link.closed) return LIBSSH2_ERROR_SOCKET_DISCONNECT;
            rc = op(link.session);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) return rc;
        if (max_wait_ms >= 0 && Clock::now() >= deadline) return rc;
        wait_socket(link, CHANNEL_POLL_MS);
    }
}

static std::string locked_last_error(SessionLink& link) {
    std::lock_guard<std::mutex> lock(link.mutex);
    return link.closed ? "session closed" : last_error(link.session);
}

static const char* host_key_type_name(int type) {
    switch (type) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:        return "ssh-rsa";
    case LIBSSH2_HOSTKEY_TYPE_DSS:        return "ssh-dss";
#ifdef LIBSSH2_HOSTKEY_TYPE_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:  return "ecdsa-sha2-nistp256";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:  return "ecdsa-sha2-nistp384";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:  return "ecdsa-sha2-nistp521";
#endif
#ifdef LIBSSH2_HOSTKEY_TYPE_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:    return "ssh-ed25519";
#endif
    default:                              return "unknown";
    }
}

// ── Libssh2Channel ─────────────────────────────────────────────

Libssh2Channel::Libssh2Channel(std::shared_ptr<SessionLink> link, LIBSSH2_CHANNEL* ch)
    : link_(std::move(link)), ch_(ch) {}

Libssh2Channel::~Libssh2Channel() {
    close();
}

Result<void> Libssh2Channel::exec(const std::string& command) {
    int rc = run_locked(*link_, [&](LIBSSH2_SESSION*) {
        return libssh2_channel_process_startup(ch_, "exec", 4, command.data(),
                                               static_cast<unsigned int>(command.size()));
    });
    if (rc != 0) return Result<void>::Err("exec request failed: " + locked_last_error(*link_));
    return Result<void>::Ok();
}

Result<void> Libssh2Channel::request_pty(const std::string& term, int cols, int rows) {
    int rc = run_locked(*link_, [&](LIBSSH2_SESSION*) {
        return libssh2_channel_request_pty_ex(ch_, term.data(),
                                              static_cast<unsigned int>(term.size()),
                                              nullptr, 0, cols, rows, 0, 0);
    });
    if (rc != 0) return Result<void>::Err("pty request failed: " + locked_last_error(*link_));
    return Result<void>::Ok();
}

Result<void> Libssh2Channel::shell() {
    int rc = run_locked(*link_, [&](LIBSSH2_SESSION*) {
        return libssh2_channel_shell(ch_);
    });
    if (rc != 0) return Result<void>::Err("shell request failed: " + locked_last_error(*link_));
    return Result<void>::Ok();
}

Result<void> Libssh2Channel::resize(int cols, int rows) {
    int rc = run_locked(*link_, [&](LIBSSH2_SESSION*) {
        return libssh2_channel_request_pty_size(ch_, cols, rows);
    });
    if (rc != 0) return Result<void>::Err("window change failed: " + locked_last_error(*link_));
    return Result<void>::Ok();
}

int Libssh2Channel::read(char* buf, size_t len, ChannelStream stream, int timeout_ms) {
    int stream_id = stream == ChannelStream::Stderr ? SSH_EXTENDED_DATA_STDERR : 0;
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    for (;;) {
        ssize_t n;
        {
            std::lock_guard<std::mutex> lock(link_->mutex);
            if (link_->closed || closed_) return CHANNEL_ERROR;
            n = libssh2_channel_read_ex(ch_, stream_id, buf, len);
            if (n == 0 && !libssh2_channel_eof(ch_)) n = LIBSSH2_ERROR_EAGAIN;
        }
        if (n > 0) return static_cast<int>(n);
        if (n == 0) return CHANNEL_EOF;
        if (n != LIBSSH2_ERROR_EAGAIN) return CHANNEL_ERROR;
        if (Clock::now() >= deadline) return CHANNEL_AGAIN;
        wait_socket(*link_, CHANNEL_POLL_MS);
    }
}

bool Libssh2Channel::write_all(const char* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(link_->mutex);
            if (link_->closed || closed_) return false;
            w = libssh2_channel_write_ex(ch_, 0, data + sent, len - sent);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            wait_socket(*link_, CHANNEL_POLL_MS);
            continue;
        }
        if (w < 0) return false;
        sent += static_cast<size_t>(w);
    }
    return true;
}

void Libssh2Channel::send_eof() {
    int rc = run_locked(*link_, [&](LIBSSH2_SESSION*) {
        return libssh2_channel_send_eof(ch_);
    }, CHANNEL_POLL_MS * DISCONNECT_MAX_POLLS);
    if (rc != 0) sshc_log(fmt::format("channel send_eof failed ({})", rc));
}

std::optional<int> Libssh2Channel::exit_status() {
    // exit-status arrives just before the channel close; wait for it
    run_locked(*link_, [&](LIBSSH2_SESSION*) {
        return libssh2_channel_wait_closed(ch_);
    }, EXEC_DRAIN_POLL_MS * DISCONNECT_MAX_POLLS);

    std::lock_guard<std::mutex> lock(link_->mutex);
    if (link_->closed) return std::nullopt;
    return libssh2_channel_get_exit_status(ch_);
}

void Libssh2Channel::close() {
    if (closed_) return;
    closed_ = true;

    // A disconnected session already freed its channels
    int rc = run_locked(*link_, [&](LIBSSH2_SESSION*) {
        return libssh2_channel_close(ch_);
    }, CHANNEL_POLL_MS * DISCONNECT_MAX_POLLS);
    if (rc == LIBSSH2_ERROR_SOCKET_DISCONNECT) return;

    run_locked(*link_, [&](LIBSSH2_SESSION*) {
        return libssh2_channel_free(ch_);
    }, CHANNEL_POLL_MS * DISCONNECT_MAX_POLLS);
}

// ── Libssh2Session ─────────────────────────────────────────────

Libssh2Session::Libssh2Session(LIBSSH2_SESSION* session, socket_t sock)
    : link_(std::make_shared<SessionLink>()) {
    link_->session = session;
    link_->sock = sock;
}

Libssh2Session::~Libssh2Session() {
    disconnect("Session closed");
}

HostKey Libssh2Session::host_key() {
    std::lock_guard<std::mutex> lock(link_->mutex);
    HostKey key;
    if (link_->closed) return key;
    size_t len = 0;
    int type = 0;
    const char* blob = libssh2_session_hostkey(link_->session, &len, &type);
    if (blob) {
        key.blob.assign(blob, len);
        key.type = host_key_type_name(type);
    }
    return key;
}

Result<void> Libssh2Session::login_with_key_data(const std::string& user, const std::string& key_data) {
    int rc = run_locked(*link_, [&](LIBSSH2_SESSION* s) {
        return libssh2_userauth_publickey_frommemory(s, user.data(), user.size(),
                                                     nullptr, 0,
                                                     key_data.data(), key_data.size(),
                                                     nullptr);
    });
    if (rc != 0) return Result<void>::Err(locked_last_error(*link_));
    return Result<void>::Ok();
}

Result<void> Libssh2Session::login_with_agent(const std::string& user,
                                              const std::optional<std::string>& agent_socket) {
    LIBSSH2_AGENT* agent;
    {
        std::lock_guard<std::mutex> lock(link_->mutex);
        if (link_->closed) return Result<void>::Err("session closed");
        agent = libssh2_agent_init(link_->session);
    }
    if (!agent) return Result<void>::Err("failed to initialize agent support");

    auto cleanup = [&] {
        std::lock_guard<std::mutex> lock(link_->mutex);
        libssh2_agent_disconnect(agent);
        libssh2_agent_free(agent);
    };

    {
        std::lock_guard<std::mutex> lock(link_->mutex);
        if (agent_socket) libssh2_agent_set_identity_path(agent, agent_socket->c_str());
        if (libssh2_agent_connect(agent) != 0) {
            std::string err = "could not connect to ssh-agent: " + last_error(link_->session);
            libssh2_agent_free(agent);
            return Result<void>::Err(err);
        }
        if (libssh2_agent_list_identities(agent) != 0) {
            std::string err = "could not list agent identities: " + last_error(link_->session);
            libssh2_agent_disconnect(agent);
            libssh2_agent_free(agent);
            return Result<void>::Err(err);
        }
    }

    struct libssh2_agent_publickey* identity = nullptr;
    struct libssh2_agent_publickey* prev = nullptr;
    for (;;) {
        int rc;
        {
            std::lock_guard<std::mutex> lock(link_->mutex);
            rc = libssh2_agent_get_identity(agent, &identity, prev);
        }
        if (rc != 0) break;  // 1 = no more identities, <0 = error

        rc = run_locked(*link_, [&](LIBSSH2_SESSION*) {
            return libssh2_agent_userauth(agent, user.c_str(), identity);
        });
        if (rc == 0) {
            sshc_log(fmt::format("agent identity '{}' accepted", identity->comment ? identity->comment : ""));
            cleanup();
            return Result<void>::Ok();
        }
        sshc_log(fmt::format("agent identity '{}' rejected", identity->comment ? identity->comment : ""));
        prev = identity;
    }

    cleanup();
    return Result<void>::Err("no agent identity was accepted");
}

Result<void> Libssh2Session::login_with_key_file(const std::string& user,
                                                 const std::string& private_key,
                                                 const std::string& public_key) {
    int rc = run_locked(*link_, [&](LIBSSH2_SESSION* s) {
        return libssh2_userauth_publickey_fromfile_ex(s, user.data(),
                                                      static_cast<unsigned int>(user.size()),
                                                      public_key.empty() ? nullptr : public_key.c_str(),
                                                      private_key.c_str(),
                                                      nullptr);
    });
    if (rc != 0) return Result<void>::Err(locked_last_error(*link_));
    return Result<void>::Ok();
}

Result<std::unique_ptr<Channel>> Libssh2Session::open_session_channel() {
    LIBSSH2_CHANNEL* ch = nullptr;
    int rc = run_locked(*link_, [&](LIBSSH2_SESSION* s) {
        ch = libssh2_channel_open_session(s);
        return ch ? 0 : libssh2_session_last_errno(s);
    });
    if (rc != 0 || !ch) {
        return Result<std::unique_ptr<Channel>>::Err("failed to open session channel: " +
                                                     locked_last_error(*link_));
    }
    return Result<std::unique_ptr<Channel>>::Ok(std::make_unique<Libssh2Channel>(link_, ch));
}

Result<std::unique_ptr<Channel>> Libssh2Session::open_tunnel_channel(const std::string& remote_host,
                                                                     int remote_port,
                                                                     const std::string& origin_host,
                                                                     int origin_port) {
    LIBSSH2_CHANNEL* ch = nullptr;
    int rc = run_locked(*link_, [&](LIBSSH2_SESSION* s) {
        ch = libssh2_channel_direct_tcpip_ex(s, remote_host.c_str(), remote_port,
                                             origin_host.c_str(), origin_port);
        return ch ? 0 : libssh2_session_last_errno(s);
    });
    if (rc != 0 || !ch) {
        return Result<std::unique_ptr<Channel>>::Err(fmt::format(
            "direct-tcpip to {}:{} failed: {}", remote_host, remote_port, locked_last_error(*link_)));
    }
    return Result<std::unique_ptr<Channel>>::Ok(std::make_unique<Libssh2Channel>(link_, ch));
}

void Libssh2Session::configure_keepalive(bool want_reply, int interval_secs) {
    std::lock_guard<std::mutex> lock(link_->mutex);
    if (link_->closed) return;
    libssh2_keepalive_config(link_->session, want_reply ? 1 : 0,
                             static_cast<unsigned int>(interval_secs));
}

Result<int> Libssh2Session::send_keepalive() {
    int next = 0;
    int rc = run_locked(*link_, [&](LIBSSH2_SESSION* s) {
        return libssh2_keepalive_send(s, &next);
    }, CHANNEL_POLL_MS * DISCONNECT_MAX_POLLS);
    if (rc != 0) {
        return Result<int>::Err(fmt::format("keepalive failed ({}): {}", rc, locked_last_error(*link_)));
    }
    return Result<int>::Ok(next);
}

void Libssh2Session::disconnect(const std::string& reason) {
    std::lock_guard<std::mutex> lock(link_->mutex);
    if (link_->closed) return;

    // Bounded: the peer may already be gone
    for (int i = 0; i < DISCONNECT_MAX_POLLS; i++) {
        int rc = libssh2_session_disconnect(link_->session, reason.c_str());
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        platform::poll_socket(link_->sock, POLLOUT, CHANNEL_POLL_MS);
    }
    libssh2_session_free(link_->session);
    link_->session = nullptr;
    platform::close_socket(link_->sock);
    link_->sock = SSHC_INVALID_SOCKET;
    link_->closed = true;
}

// ── Libssh2Connector ───────────────────────────────────────────

static void enable_tcp_keepalive(socket_t sock) {
    int on = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
    int keepidle = 60;
    int keepintvl = 15;
    int keepcnt = 4;
#ifdef TCP_KEEPIDLE
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPINTVL, &keepintvl, sizeof(keepintvl));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPCNT, &keepcnt, sizeof(keepcnt));
#endif
}

std::unique_ptr<Session> Libssh2Connector::connect(const std::string& host, int port, int timeout_secs) {
    if (!init_libssh2()) {
        throw SessionError(ErrorKind::Protocol, "Failed to initialize libssh2");
    }

    sshc_log(fmt::format("connecting to {}:{} (timeout {}s)", host, port, timeout_secs));
    auto outcome = platform::connect_tcp(host, port, timeout_secs);
    switch (outcome.status) {
    case platform::ConnectStatus::Ok:
        break;
    case platform::ConnectStatus::Timeout:
        throw SessionError(ErrorKind::ConnectTimeout,
                           fmt::format("connect to {}:{} timed out", host, port));
    case platform::ConnectStatus::Refused:
        throw SessionError(ErrorKind::ConnectionRefused,
                           fmt::format("connect to {}:{} refused", host, port));
    case platform::ConnectStatus::Failed:
        throw SessionError(ErrorKind::Protocol,
                           fmt::format("connect to {}:{} failed: {}", host, port, outcome.error));
    }

    socket_t sock = outcome.sock;
    enable_tcp_keepalive(sock);
    platform::set_nonblocking(sock);

    LIBSSH2_SESSION* session = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session) {
        platform::close_socket(sock);
        throw SessionError(ErrorKind::Protocol, "Failed to create SSH session");
    }
    libssh2_session_set_blocking(session, 0);

    // The connect timeout also bounds the key exchange
    auto deadline = Clock::now() + std::chrono::seconds(timeout_secs);
    int rc;
    while ((rc = libssh2_session_handshake(session, sock)) == LIBSSH2_ERROR_EAGAIN) {
        if (timeout_secs > 0 && Clock::now() >= deadline) break;
        int dir = libssh2_session_block_directions(session);
        short events = (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) ? POLLOUT : POLLIN;
        platform::poll_socket(sock, events, HANDSHAKE_POLL_MS);
    }

    if (rc != 0) {
        std::string err = rc == LIBSSH2_ERROR_EAGAIN ? "timed out" : last_error(session);
        libssh2_session_free(session);
        platform::close_socket(sock);
        if (rc == LIBSSH2_ERROR_EAGAIN) {
            throw SessionError(ErrorKind::ConnectTimeout,
                               fmt::format("SSH handshake with {}:{} timed out", host, port));
        }
        throw SessionError(ErrorKind::Protocol,
                           fmt::format("SSH handshake with {}:{} failed: {}", host, port, err));
    }

    sshc_log(fmt::format("handshake with {}:{} complete", host, port));
    return std::make_unique<Libssh2Session>(session, sock);
}
