#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the passwd entry).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// True if the file descriptor refers to a terminal.
bool is_tty(int fd);

// Write all of [data, data+len) to fd, retrying on EINTR and short writes.
// Sockets are written with MSG_NOSIGNAL so a closed peer is an error, not SIGPIPE.
bool write_all(int fd, const char* data, size_t len);

} // namespace platform
