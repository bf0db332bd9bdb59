#pragma once

#include <string>
#include <vector>
#include <filesystem>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Strict port parse: digits only, 1..65535. Returns 0 when invalid.
int parse_port(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

std::string to_lower(std::string s);

// Split on any run of spaces/tabs.
std::vector<std::string> split_whitespace(const std::string& s);

std::string base64_encode(const std::string& input);

// OpenSSH-style wildcard match: only * and ? are special, so
// "[host]:2222" matches itself literally.
bool glob_match(const std::string& pattern, const std::string& text);

// "~/x" and "~" relative to home; anything else unchanged.
std::filesystem::path expand_home(const std::string& path, const std::filesystem::path& home);
