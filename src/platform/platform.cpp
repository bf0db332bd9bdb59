#include "platform.hpp"
#include <cerrno>
#include <cstdlib>
#include <pwd.h>
#include <sys/socket.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return fs::path(home);
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) return fs::path(pw->pw_dir);
    return temp_dir();
}

fs::path temp_dir() {
    std::error_code ec;
    auto p = fs::temp_directory_path(ec);
    return ec ? fs::path("/tmp") : p;
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

bool is_tty(int fd) {
    return isatty(fd) != 0;
}

bool write_all(int fd, const char* data, size_t len) {
    size_t sent = 0;
    bool is_socket = true;
    while (sent < len) {
        ssize_t w;
        if (is_socket) {
            w = send(fd, data + sent, len - sent, MSG_NOSIGNAL);
            if (w < 0 && errno == ENOTSOCK) {
                is_socket = false;
                continue;
            }
        } else {
            w = write(fd, data + sent, len - sent);
        }
        if (w < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(w);
    }
    return true;
}

} // namespace platform
