#pragma once

#include <memory>
#include <mutex>
#include <string>
#include "transport.hpp"
#include <platform/socket_util.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// Process-wide libssh2_init(), run once. False if it failed.
bool init_libssh2();

// State shared by a session and every channel opened on it. The session
// runs in non-blocking mode and every libssh2 call is made under mutex,
// so session-level and channel-level calls from different threads never
// overlap inside libssh2.
struct SessionLink {
    std::mutex mutex;
    LIBSSH2_SESSION* session = nullptr;
    socket_t sock = SSHC_INVALID_SOCKET;
    bool closed = false;
};

class Libssh2Channel : public Channel {
public:
    Libssh2Channel(std::shared_ptr<SessionLink> link, LIBSSH2_CHANNEL* ch);
    ~Libssh2Channel() override;

    Result<void> exec(const std::string& command) override;
    Result<void> request_pty(const std::string& term, int cols, int rows) override;
    Result<void> shell() override;
    Result<void> resize(int cols, int rows) override;
    int read(char* buf, size_t len, ChannelStream stream, int timeout_ms) override;
    bool write_all(const char* data, size_t len) override;
    void send_eof() override;
    std::optional<int> exit_status() override;
    void close() override;

private:
    std::shared_ptr<SessionLink> link_;
    LIBSSH2_CHANNEL* ch_;
    bool closed_ = false;
};

class Libssh2Session : public Session {
public:
    Libssh2Session(LIBSSH2_SESSION* session, socket_t sock);
    ~Libssh2Session() override;

    HostKey host_key() override;
    Result<void> login_with_key_data(const std::string& user, const std::string& key_data) override;
    Result<void> login_with_agent(const std::string& user,
                                  const std::optional<std::string>& agent_socket) override;
    Result<void> login_with_key_file(const std::string& user,
                                     const std::string& private_key,
                                     const std::string& public_key) override;
    Result<std::unique_ptr<Channel>> open_session_channel() override;
    Result<std::unique_ptr<Channel>> open_tunnel_channel(const std::string& remote_host,
                                                         int remote_port,
                                                         const std::string& origin_host,
                                                         int origin_port) override;
    void configure_keepalive(bool want_reply, int interval_secs) override;
    Result<int> send_keepalive() override;
    void disconnect(const std::string& reason) override;

private:
    std::shared_ptr<SessionLink> link_;
};

class Libssh2Connector : public Connector {
public:
    std::unique_ptr<Session> connect(const std::string& host, int port, int timeout_secs) override;
};
