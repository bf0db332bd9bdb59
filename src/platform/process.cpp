#include "process.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    // Reap so a forgotten child does not linger as a zombie
    if (pid_ > 0) wait();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    other.pid_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        if (pid_ > 0) wait();
        pid_ = other.pid_;
        other.pid_ = -1;
    }
    return *this;
}

int ProcessHandle::wait() {
    if (pid_ <= 0) return -1;
    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    pid_ = -1;
    if (ret < 0) return -1;
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

// ── run_capture ──────────────────────────────────────────────

static void close_pipe(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
}

Result<std::string> run_capture(
    const std::string& program,
    const std::vector<std::string>& args,
    const std::vector<std::pair<std::string, std::string>>& env) {

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0) {
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        return Result<std::string>::Err(fmt::format("pipe() failed: {}", std::strerror(errno)));
    }

    // argv must be built before fork(): no allocation in the child
    std::vector<std::string> argv_store;
    argv_store.push_back(program);
    argv_store.insert(argv_store.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (auto& a : argv_store) argv.push_back(a.data());
    argv.push_back(nullptr);

    ProcessHandle handle;
    pid_t pid = fork();
    if (pid < 0) {
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        return Result<std::string>::Err(fmt::format("fork() failed: {}", std::strerror(errno)));
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        for (const auto& kv : env) {
            setenv(kv.first.c_str(), kv.second.c_str(), 1);
        }
        execvp(program.c_str(), argv.data());
        _exit(127);
    }

    handle.pid_ = pid;
    close(out_pipe[1]);
    close(err_pipe[1]);

    std::string out, err;
    struct pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
    int open_fds = 2;
    char buf[4096];
    while (open_fds > 0) {
        int pr = poll(fds, 2, -1);
        if (pr < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; i++) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                close(fds[i].fd);
                fds[i].fd = -1;
                open_fds--;
                continue;
            }
            (i == 0 ? out : err).append(buf, static_cast<size_t>(n));
        }
    }
    for (auto& p : fds) {
        if (p.fd >= 0) close(p.fd);
    }

    int code = handle.wait();
    if (code == 127) {
        return Result<std::string>::Err(fmt::format("'{}' not found in PATH", program));
    }
    if (code != 0) {
        trim(err);
        return Result<std::string>::Err(
            err.empty() ? fmt::format("{} exited with status {}", program, code) : err);
    }
    return Result<std::string>::Ok(std::move(out));
}

} // namespace platform
