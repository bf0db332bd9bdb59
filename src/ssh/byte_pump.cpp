#include "byte_pump.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>
#include <fmt/format.h>
#include <cerrno>
#include <unistd.h>

void pump_fd_to_channel(int fd, Channel& ch, std::atomic<bool>& stop) {
    char buf[TUNNEL_BUF_SIZE];
    while (!stop.load()) {
        int pr = platform::poll_readable(fd, PUMP_POLL_MS);
        if (pr < 0) return;
        if (pr == 0) continue;

        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
        if (n <= 0) return;
        if (!ch.write_all(buf, static_cast<size_t>(n))) return;
    }
}

void pump_channel_to_fd(Channel& ch, int fd, std::atomic<bool>& stop) {
    char buf[TUNNEL_BUF_SIZE];
    while (!stop.load()) {
        int n = ch.read(buf, sizeof(buf), ChannelStream::Stdout, PUMP_POLL_MS);
        if (n == CHANNEL_AGAIN) continue;
        if (n <= 0) return;
        if (!platform::write_all(fd, buf, static_cast<size_t>(n))) return;
    }
}

PumpEnd run_pump_pair(Channel& ch, int in_fd, int out_fd, const std::atomic<bool>* cancel) {
    std::atomic<bool> stop{false};
    std::mutex mtx;
    std::condition_variable cv;
    std::optional<PumpEnd> first;

    auto finished = [&](PumpEnd side) {
        std::lock_guard<std::mutex> lock(mtx);
        if (!first) first = side;
        cv.notify_all();
    };

    std::thread local_to_remote;
    std::thread remote_to_local;
    try {
        local_to_remote = std::thread([&] {
            pump_fd_to_channel(in_fd, ch, stop);
            finished(PumpEnd::Local);
        });
        remote_to_local = std::thread([&] {
            pump_channel_to_fd(ch, out_fd, stop);
            finished(PumpEnd::Remote);
        });
    } catch (const std::system_error& e) {
        sshc_warn(fmt::format("cannot start pump thread: {}", e.what()));
        stop.store(true);
        if (local_to_remote.joinable()) local_to_remote.join();
        return PumpEnd::Failed;
    }

    PumpEnd end;
    {
        std::unique_lock<std::mutex> lock(mtx);
        while (!cv.wait_for(lock, std::chrono::milliseconds(PUMP_POLL_MS),
                            [&] { return first.has_value(); })) {
            if (cancel && cancel->load()) break;
        }
        end = first ? *first : PumpEnd::Cancelled;
    }
    stop.store(true);
    local_to_remote.join();
    remote_to_local.join();
    return end;
}
