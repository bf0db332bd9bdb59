#include "keepalive.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/terminal.hpp>
#include <fmt/format.h>
#include <cstdio>
#include <cstdlib>

KeepaliveWatchdog::KeepaliveWatchdog(Session& session, std::chrono::milliseconds interval,
                                     DeadHandler on_dead)
    : session_(session),
      interval_(interval),
      on_dead_(on_dead ? std::move(on_dead) : DeadHandler(&KeepaliveWatchdog::exit_process)) {}

KeepaliveWatchdog::~KeepaliveWatchdog() {
    stop();
}

void KeepaliveWatchdog::exit_process() {
    platform::RawModeGuard::restore_active();
    std::fflush(stdout);
    std::fflush(stderr);
    std::_Exit(1);
}

void KeepaliveWatchdog::start() {
    if (thread_.joinable()) return;
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(interval_).count();
    session_.configure_keepalive(true, static_cast<int>(secs > 0 ? secs : 1));
    sshc_log(fmt::format("keepalive every {}ms", interval_.count()));
    thread_ = std::thread(&KeepaliveWatchdog::loop, this);
}

void KeepaliveWatchdog::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stop_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void KeepaliveWatchdog::loop() {
    for (;;) {
        {
            std::unique_lock<std::mutex> lock(mtx_);
            if (cv_.wait_for(lock, interval_, [this] { return stop_; })) return;
        }

        auto probe = session_.send_keepalive();
        if (probe.is_ok()) {
            if (failures_.load() > 0) sshc_log("keepalive: peer answered, failure count reset");
            failures_ = 0;
            continue;
        }

        int n = ++failures_;
        sshc_log(fmt::format("keepalive: probe failed ({}/{}): {}", n, KEEPALIVE_MAX_FAILURES, probe.error));
        if (n < KEEPALIVE_MAX_FAILURES) continue;

        fired_ = true;
        sshc_error(fmt::format("Connection appears dead after {} keepalive failures. Disconnecting.",
                               KEEPALIVE_MAX_FAILURES));
        session_.disconnect("Keepalive timeout");
        on_dead_();
        return;
    }
}
