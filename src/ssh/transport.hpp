#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <core/types.hpp>

// Abstract view of the SSH transport. The session orchestration code
// (trust, auth, channels, tunnels, keepalive) only talks to these
// interfaces; libssh2_transport.hpp is the production binding.

// Channel::read() results besides a positive byte count
constexpr int CHANNEL_EOF   = 0;
constexpr int CHANNEL_AGAIN = -1;   // nothing arrived within the timeout
constexpr int CHANNEL_ERROR = -2;

enum class ChannelStream { Stdout, Stderr };

struct HostKey {
    std::string type;   // "ssh-ed25519", "ssh-rsa", "ecdsa-sha2-nistp256", ...
    std::string blob;   // raw wire-format key
};

// One logical stream on a session. Owned by exactly one flow (shell,
// exec, or one tunnel connection). Distinct channels may be used from
// different threads at the same time.
class Channel {
public:
    virtual ~Channel() = default;

    virtual Result<void> exec(const std::string& command) = 0;
    virtual Result<void> request_pty(const std::string& term, int cols, int rows) = 0;
    virtual Result<void> shell() = 0;
    virtual Result<void> resize(int cols, int rows) = 0;

    // Read up to len bytes from the given stream, waiting at most
    // timeout_ms. Returns bytes read, CHANNEL_EOF, CHANNEL_AGAIN or
    // CHANNEL_ERROR.
    virtual int read(char* buf, size_t len, ChannelStream stream, int timeout_ms) = 0;

    // Write everything or fail.
    virtual bool write_all(const char* data, size_t len) = 0;

    virtual void send_eof() = 0;

    // Remote exit status once the command has finished, if the server sent one.
    virtual std::optional<int> exit_status() = 0;

    // Idempotent. Also run by the destructor.
    virtual void close() = 0;
};

// An established, not yet authenticated SSH session.
// Session-level calls are serialized by the implementation.
class Session {
public:
    virtual ~Session() = default;

    virtual HostKey host_key() = 0;

    virtual Result<void> login_with_key_data(const std::string& user, const std::string& key_data) = 0;
    virtual Result<void> login_with_agent(const std::string& user,
                                          const std::optional<std::string>& agent_socket) = 0;
    virtual Result<void> login_with_key_file(const std::string& user,
                                             const std::string& private_key,
                                             const std::string& public_key) = 0;

    virtual Result<std::unique_ptr<Channel>> open_session_channel() = 0;

    // direct-tcpip channel to remote_host:remote_port, tagged with the
    // originating local address.
    virtual Result<std::unique_ptr<Channel>> open_tunnel_channel(const std::string& remote_host,
                                                                 int remote_port,
                                                                 const std::string& origin_host,
                                                                 int origin_port) = 0;

    virtual void configure_keepalive(bool want_reply, int interval_secs) = 0;

    // Send one keepalive probe. Ok carries the seconds until the next
    // probe is due.
    virtual Result<int> send_keepalive() = 0;

    // Best effort. Channels opened on this session become unusable.
    virtual void disconnect(const std::string& reason) = 0;
};

// Opens fresh sessions. connect() throws SessionError: ConnectTimeout or
// ConnectionRefused for retryable transport failures, Protocol otherwise.
class Connector {
public:
    virtual ~Connector() = default;

    virtual std::unique_ptr<Session> connect(const std::string& host, int port, int timeout_secs) = 0;
};
