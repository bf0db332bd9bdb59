#pragma once

#include <functional>
#include <optional>
#include <string>
#include <core/types.hpp>
#include <ssh/channel_mux.hpp>
#include <ssh/keepalive.hpp>
#include <ssh/transport.hpp>

class TrustStore;

// Top-level attempt loop. Each attempt opens a fresh session, verifies
// the host key, authenticates, starts the keepalive watchdog and the
// port forwards, then runs the multiplexer in the foreground. Connect
// timeouts and refusals are retried after a fixed pause; every other
// failure ends the run immediately.
class ConnectionSupervisor {
public:
    using Sleeper = std::function<void(int ms)>;

    // trust may be null when host key checking is disabled.
    // key_data is the in-memory private key, if one was fetched.
    ConnectionSupervisor(const ResolvedConfig& config, Connector& connector, TrustStore* trust,
                         std::optional<std::string> key_data = std::nullopt);

    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }
    void set_terminal_io(TerminalIo io) { io_ = io; }
    void set_dead_handler(KeepaliveWatchdog::DeadHandler handler) { on_dead_ = std::move(handler); }

    // Returns the process exit code: the foreground result on success,
    // 1 on any fatal failure or when every attempt failed.
    int run();

    int attempts_made() const { return attempts_; }

private:
    const ResolvedConfig& config_;
    Connector& connector_;
    TrustStore* trust_;
    std::optional<std::string> key_data_;
    Sleeper sleeper_;
    TerminalIo io_;
    KeepaliveWatchdog::DeadHandler on_dead_;
    int attempts_ = 0;

    // One authenticated session, start to finish. Throws SessionError.
    int run_session(Session& session);
};
