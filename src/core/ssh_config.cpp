#include "ssh_config.hpp"
#include "utils.hpp"
#include <fstream>

fs::path default_ssh_config_path(const fs::path& home) {
    return home / ".ssh" / "config";
}

// "Key Value" or "Key=Value"; values may be double-quoted.
static bool split_directive(const std::string& line, std::string& key, std::string& value) {
    auto sep = line.find_first_of(" \t=");
    if (sep == std::string::npos) return false;
    key = to_lower(line.substr(0, sep));
    value = line.substr(sep + 1);
    trim(value);
    if (!value.empty() && value.front() == '=') {
        value.erase(0, 1);
        trim(value);
    }
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    return !value.empty();
}

static bool host_patterns_match(const std::string& patterns, const std::string& host) {
    bool matched = false;
    for (const auto& pat : split_whitespace(patterns)) {
        if (!pat.empty() && pat[0] == '!') {
            if (glob_match(pat.substr(1), host)) return false;
        } else if (glob_match(pat, host)) {
            matched = true;
        }
    }
    return matched;
}

static std::optional<bool> parse_yes_no(const std::string& v) {
    std::string s = to_lower(v);
    if (s == "yes" || s == "true") return true;
    if (s == "no" || s == "false") return false;
    return std::nullopt;
}

SshConfigEntry parse_ssh_config(std::istream& in,
                                const std::string& target_host,
                                const fs::path& home) {
    SshConfigEntry entry;
    bool active = true;  // directives before the first Host apply to all hosts

    std::string raw;
    while (std::getline(in, raw)) {
        std::string line = raw;
        trim(line);
        if (line.empty() || line[0] == '#') continue;

        std::string key, val;
        if (!split_directive(line, key, val)) continue;

        if (key == "host") {
            active = host_patterns_match(val, target_host);
            continue;
        }
        if (key == "match") {
            // Match blocks need runtime criteria we do not evaluate
            active = false;
            continue;
        }
        if (!active) continue;

        if (key == "hostname") {
            if (!entry.hostname) entry.hostname = val;
        } else if (key == "user") {
            if (!entry.user) entry.user = val;
        } else if (key == "port") {
            int p = parse_port(val);
            if (!entry.port && p > 0) entry.port = p;
        } else if (key == "identityfile") {
            entry.identity_files.push_back(expand_home(val, home).string());
        } else if (key == "userknownhostsfile") {
            // Only the first of several space-separated files is used
            auto files = split_whitespace(val);
            if (!entry.known_hosts_file && !files.empty())
                entry.known_hosts_file = expand_home(files[0], home).string();
        } else if (key == "identitiesonly") {
            if (!entry.identities_only) entry.identities_only = parse_yes_no(val);
        } else if (key == "serveraliveinterval") {
            int secs = safe_stoi(val, -1);
            if (!entry.server_alive_interval && secs >= 0) entry.server_alive_interval = secs;
        }
    }
    return entry;
}

Result<SshConfigEntry> load_ssh_config(const fs::path& path,
                                       const std::string& target_host,
                                       const fs::path& home) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<SshConfigEntry>::Ok(SshConfigEntry{});
    }
    std::ifstream in(path);
    if (!in) {
        return Result<SshConfigEntry>::Err("Cannot read " + path.string());
    }
    return Result<SshConfigEntry>::Ok(parse_ssh_config(in, target_host, home));
}
