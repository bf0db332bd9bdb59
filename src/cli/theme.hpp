#pragma once

#include <string>
#include <fmt/format.h>
#include <unistd.h>

namespace theme {

// ANSI escape sequences. Everything sshc prints goes to stderr, so color
// is decided by whether stderr is a terminal.
namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string RED       = "\033[91m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline bool enabled() {
    static const bool tty = isatty(STDERR_FILENO) != 0;
    return tty;
}

inline std::string paint(const std::string& code, const std::string& s) {
    return enabled() ? code + s + color::RESET : s;
}

// Shorthand wrappers
inline std::string blue(const std::string& s)    { return paint(color::BLUE, s); }
inline std::string bold(const std::string& s)    { return paint(color::BOLD, s); }
inline std::string dim(const std::string& s)     { return paint(color::DIM, s); }
inline std::string red(const std::string& s)     { return paint(color::RED, s); }
inline std::string yellow(const std::string& s)  { return paint(color::YELLOW, s); }

// ── Layout ──────────────────────────────────────────────

// Usage section header
inline std::string section(const std::string& title) {
    return "\n" + bold(title) + "\n";
}

// Option row for --help: flag column padded, description dimmed
inline std::string option(const std::string& flag, const std::string& desc) {
    return "  " + blue(fmt::format("{:<34}", flag)) + dim(desc) + "\n";
}

} // namespace theme
