#include "connection_supervisor.hpp"
#include "port_forwarder.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <ssh/auth_chain.hpp>
#include <ssh/trust_store.hpp>
#include <fmt/format.h>
#include <chrono>
#include <memory>

// Disconnects the session on every exit path of an attempt.
struct SessionCloser {
    Session& session;
    ~SessionCloser() { session.disconnect("Session closed"); }
};

ConnectionSupervisor::ConnectionSupervisor(const ResolvedConfig& config, Connector& connector,
                                           TrustStore* trust, std::optional<std::string> key_data)
    : config_(config),
      connector_(connector),
      trust_(trust),
      key_data_(std::move(key_data)),
      sleeper_(platform::sleep_ms) {}

int ConnectionSupervisor::run_session(Session& session) {
    if (trust_) trust_->verify(session, config_.host, config_.port);

    AuthenticationChain auth(config_, key_data_);
    auth.authenticate(session);

    // Destroyed in reverse: multiplexer, tunnels, watchdog
    std::unique_ptr<KeepaliveWatchdog> watchdog;
    if (config_.server_alive_interval > 0) {
        watchdog = std::make_unique<KeepaliveWatchdog>(
            session, std::chrono::seconds(config_.server_alive_interval), on_dead_);
        watchdog->start();
    }

    TunnelManager tunnels(session);
    if (!config_.forwards.empty()) {
        auto failures = tunnels.start(config_.forwards);
        if (!failures.empty()) {
            for (const auto& msg : failures) sshc_error(msg);
            throw SessionError(ErrorKind::ListenerBindFailure,
                               fmt::format("{} of {} port forwards could not listen",
                                           failures.size(), config_.forwards.size()));
        }
    }

    SessionChannelMultiplexer mux(session, io_);
    return mux.run(config_.command);
}

int ConnectionSupervisor::run() {
    int max_attempts = config_.connection_attempts > 0 ? config_.connection_attempts : 1;

    for (int attempt = 1; attempt <= max_attempts; attempt++) {
        attempts_ = attempt;
        try {
            auto session = connector_.connect(config_.host, config_.port, config_.connect_timeout);
            SessionCloser closer{*session};
            return run_session(*session);
        } catch (const SessionError& e) {
            if (!e.retryable()) {
                sshc_log(fmt::format("fatal ({}): {}", error_kind_name(e.kind()), e.what()));
                sshc_error(e.what());
                return 1;
            }
            sshc_log(fmt::format("attempt {}/{} failed: {}", attempt, max_attempts, e.what()));
            if (attempt < max_attempts) sleeper_(RETRY_BACKOFF_MS);
        }
    }

    sshc_error(fmt::format("Failed to connect to {}:{}", config_.host, config_.port));
    return 1;
}
