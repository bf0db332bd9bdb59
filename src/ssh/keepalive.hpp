#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include "transport.hpp"

// Probes the session every interval. KEEPALIVE_MAX_FAILURES consecutive
// failed probes mean the peer is gone: the session is disconnected and the
// dead handler runs. The default handler restores the terminal and ends
// the process with status 1, since the foreground task may be stuck on a
// socket that will never answer.
class KeepaliveWatchdog {
public:
    using DeadHandler = std::function<void()>;

    KeepaliveWatchdog(Session& session, std::chrono::milliseconds interval,
                      DeadHandler on_dead = nullptr);
    ~KeepaliveWatchdog();

    KeepaliveWatchdog(const KeepaliveWatchdog&) = delete;
    KeepaliveWatchdog& operator=(const KeepaliveWatchdog&) = delete;

    // Configure transport keepalive (want-reply) and start probing.
    void start();

    // Wake and join the probe thread. Idempotent.
    void stop();

    int consecutive_failures() const { return failures_.load(); }
    bool fired() const { return fired_.load(); }

    static void exit_process();

private:
    Session& session_;
    std::chrono::milliseconds interval_;
    DeadHandler on_dead_;

    std::mutex mtx_;
    std::condition_variable cv_;
    bool stop_ = false;
    std::thread thread_;

    std::atomic<int> failures_{0};
    std::atomic<bool> fired_{false};

    void loop();
};
