#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>

namespace platform {

struct TermSize {
    int rows;
    int cols;
};

// Current size of the terminal on fd (stdout by default).
// Falls back to 24x80 when the query fails.
TermSize term_size(int fd = 1);

// RAII guard for raw terminal mode (cfmakeraw).
// Constructor saves current mode and enters raw mode.
// Destructor restores the saved mode.
struct RawModeGuard {
    explicit RawModeGuard(int fd = 0);
    ~RawModeGuard();

    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

    // False if fd is not a terminal (nothing was changed).
    bool active() const;

    // Restore whichever guard is currently active. Only for paths that end
    // the process without unwinding (the keepalive watchdog's forced exit).
    static void restore_active();

private:
    struct Impl;
    Impl* impl_ = nullptr;

    static std::mutex active_mutex_;
    static Impl* active_;
};

// Poll fd for readability with a timeout.
// Returns 1 if readable (or hung up), 0 on timeout, -1 on error.
int poll_readable(int fd, int timeout_ms);

// Window-resize event source. While alive, every SIGWINCH runs the
// callback on a dedicated dispatcher thread (never in signal context).
// Only one watcher may exist at a time; the destructor restores the
// previous SIGWINCH disposition and joins the dispatcher.
class ResizeWatcher {
public:
    using Callback = std::function<void()>;

    explicit ResizeWatcher(Callback cb);
    ~ResizeWatcher();

    ResizeWatcher(const ResizeWatcher&) = delete;
    ResizeWatcher& operator=(const ResizeWatcher&) = delete;

    // Queue one resize event, as if SIGWINCH had arrived.
    void notify();

private:
    Callback cb_;
    int pipe_[2] = {-1, -1};
    std::atomic<bool> stop_{false};
    std::thread thread_;

    void dispatch_loop();
};

} // namespace platform
