#pragma once

#include <string>
#include <vector>
#include <memory>
#include <thread>
#include <atomic>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include <ssh/transport.hpp>

// A single active forward: listen socket + accept thread.
struct TunnelHandle {
    ForwardSpec spec;
    int bound_port = 0;
    std::atomic<bool> stop{false};
    std::thread thread;
    socket_t listen_fd = SSHC_INVALID_SOCKET;

    ~TunnelHandle();

    // Non-copyable, non-movable (thread + atomic)
    TunnelHandle() = default;
    TunnelHandle(const TunnelHandle&) = delete;
    TunnelHandle& operator=(const TunnelHandle&) = delete;
};

// Local port forwards over one session. Each forward listens on
// 127.0.0.1:local_port; every accepted connection gets its own
// direct-tcpip channel and handler thread.
class TunnelManager {
public:
    explicit TunnelManager(Session& session);
    ~TunnelManager();

    TunnelManager(const TunnelManager&) = delete;
    TunnelManager& operator=(const TunnelManager&) = delete;

    // Bind every forward and start accept loops for those that bound. A
    // failed bind does not stop the others. Returns one message per
    // failed bind; empty means every forward is listening.
    std::vector<std::string> start(const std::vector<ForwardSpec>& specs);

    // Stop accept loops and connection handlers, close listeners.
    void stop();

    // Actual listening ports, in forward order (differs from local_port
    // when it asked for port 0).
    std::vector<int> bound_ports() const;

    const std::vector<std::shared_ptr<TunnelHandle>>& handles() const { return handles_; }

private:
    Session& session_;
    std::vector<std::shared_ptr<TunnelHandle>> handles_;

    static void accept_loop(Session& session, TunnelHandle& handle);
    static void forward_connection(Session& session, ForwardSpec spec, int origin_port,
                                   socket_t client, std::atomic<bool>& stop_flag);
};
