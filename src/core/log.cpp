#include "log.hpp"
#include <cli/theme.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <mutex>
#include <unistd.h>

static std::mutex g_log_mutex;
static std::atomic<bool> g_debug{false};

std::string sshc_log_path() {
    static std::string path = (platform::temp_dir() / "sshc_debug.log").string();
    return path;
}

void set_debug_logging(bool enabled) { g_debug.store(enabled); }
bool debug_logging() { return g_debug.load(); }

static std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    return fmt::format("{:02}:{:02}:{:02}.{:03}", tm_buf.tm_hour, tm_buf.tm_min,
                       tm_buf.tm_sec, static_cast<int>(ms.count()));
}

// In raw mode a bare \n does not return the carriage, so lines always end \r\n.
static void write_stderr(const std::string& text) {
    std::string line = text + "\r\n";
    std::fwrite(line.data(), 1, line.size(), stderr);
    std::fflush(stderr);
}

void sshc_log(const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    {
        std::ofstream out(sshc_log_path(), std::ios::app);
        if (out) out << "[" << timestamp() << "] " << msg << "\n";
    }
    if (g_debug.load()) {
        write_stderr(theme::dim("debug: " + msg));
    }
}

void sshc_warn(const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    write_stderr(theme::yellow("Warning: " + msg));
}

void sshc_error(const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    write_stderr(theme::red("Error: " + msg));
}

void sshc_stderr(const std::string& line) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    write_stderr(line);
}
