#pragma once

#include <string>

// Debug log file: $TMPDIR/sshc_debug.log
std::string sshc_log_path();

// Enables echoing of sshc_log() lines to stderr (-d / --debug).
void set_debug_logging(bool enabled);
bool debug_logging();

// Timestamped diagnostic. Always appended to the log file; echoed to
// stderr only in debug mode.
void sshc_log(const std::string& msg);

// User-facing messages on stderr, printed regardless of debug mode.
void sshc_warn(const std::string& msg);
void sshc_error(const std::string& msg);

// Raw stderr line (no prefix), for multi-line banners.
void sshc_stderr(const std::string& line);
