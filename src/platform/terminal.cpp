#include "terminal.hpp"
#include <core/constants.hpp>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <stdexcept>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace platform {

// ── Terminal dimensions ──────────────────────────────────────

TermSize term_size(int fd) {
    struct winsize ws;
    if (ioctl(fd, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0 && ws.ws_col > 0)
        return {ws.ws_row, ws.ws_col};
    return {DEFAULT_TERM_ROWS, DEFAULT_TERM_COLS};
}

// ── RawModeGuard ─────────────────────────────────────────────

struct RawModeGuard::Impl {
    int fd;
    struct termios old_term;
};

std::mutex RawModeGuard::active_mutex_;
RawModeGuard::Impl* RawModeGuard::active_ = nullptr;

RawModeGuard::RawModeGuard(int fd) {
    struct termios old_term;
    if (!isatty(fd) || tcgetattr(fd, &old_term) != 0) return;

    impl_ = new Impl{fd, old_term};
    struct termios raw = old_term;
    cfmakeraw(&raw);
    tcsetattr(fd, TCSAFLUSH, &raw);

    std::lock_guard<std::mutex> lock(active_mutex_);
    active_ = impl_;
}

RawModeGuard::~RawModeGuard() {
    if (impl_) {
        {
            std::lock_guard<std::mutex> lock(active_mutex_);
            if (active_ == impl_) active_ = nullptr;
        }
        tcsetattr(impl_->fd, TCSAFLUSH, &impl_->old_term);
        delete impl_;
    }
}

bool RawModeGuard::active() const {
    return impl_ != nullptr;
}

void RawModeGuard::restore_active() {
    std::lock_guard<std::mutex> lock(active_mutex_);
    if (active_) {
        tcsetattr(active_->fd, TCSANOW, &active_->old_term);
        active_ = nullptr;
    }
}

// ── poll_readable ────────────────────────────────────────────

int poll_readable(int fd, int timeout_ms) {
    struct pollfd pfd = {fd, POLLIN, 0};
    int pr;
    do {
        pr = poll(&pfd, 1, timeout_ms);
    } while (pr < 0 && errno == EINTR);
    if (pr < 0) return -1;
    if (pr == 0) return 0;
    return (pfd.revents & (POLLIN | POLLHUP | POLLERR)) ? 1 : -1;
}

// ── ResizeWatcher ────────────────────────────────────────────

// Signal handlers cannot carry state; this is the watcher's pipe.
static volatile sig_atomic_t g_resize_fd = -1;
static struct sigaction g_old_sa;

static void sigwinch_handler(int) {
    int saved = errno;
    int fd = g_resize_fd;
    if (fd >= 0) {
        char c = 'W';
        ssize_t ignored = write(fd, &c, 1);
        (void)ignored;
    }
    errno = saved;
}

ResizeWatcher::ResizeWatcher(Callback cb) : cb_(std::move(cb)) {
    if (pipe(pipe_) != 0) {
        throw std::runtime_error("Failed to create resize notification pipe");
    }
    for (int fd : pipe_) {
        fcntl(fd, F_SETFL, fcntl(fd, F_GETFL, 0) | O_NONBLOCK);
        fcntl(fd, F_SETFD, FD_CLOEXEC);
    }
    g_resize_fd = pipe_[1];

    struct sigaction sa;
    sa.sa_handler = sigwinch_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    sigaction(SIGWINCH, &sa, &g_old_sa);

    thread_ = std::thread(&ResizeWatcher::dispatch_loop, this);
}

ResizeWatcher::~ResizeWatcher() {
    sigaction(SIGWINCH, &g_old_sa, nullptr);
    g_resize_fd = -1;

    stop_.store(true);
    if (thread_.joinable()) thread_.join();
    close(pipe_[0]);
    close(pipe_[1]);
}

void ResizeWatcher::notify() {
    char c = 'N';
    ssize_t ignored = write(pipe_[1], &c, 1);
    (void)ignored;
}

void ResizeWatcher::dispatch_loop() {
    char buf[64];
    while (!stop_.load()) {
        if (poll_readable(pipe_[0], PUMP_POLL_MS) <= 0) continue;
        // Coalesce a burst of signals into one resize
        bool any = false;
        while (read(pipe_[0], buf, sizeof(buf)) > 0) any = true;
        if (any && !stop_.load() && cb_) cb_();
    }
}

} // namespace platform
