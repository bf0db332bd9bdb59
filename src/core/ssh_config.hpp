#pragma once

#include <string>
#include <optional>
#include <vector>
#include <filesystem>
#include <istream>
#include "types.hpp"

namespace fs = std::filesystem;

// Settings from the ~/.ssh/config blocks whose Host patterns match the
// target. As in OpenSSH, the first value seen for a key wins (IdentityFile
// accumulates).
struct SshConfigEntry {
    std::optional<std::string> hostname;
    std::optional<std::string> user;
    std::optional<int> port;
    std::vector<std::string> identity_files;
    std::optional<std::string> known_hosts_file;
    std::optional<bool> identities_only;
    std::optional<int> server_alive_interval;
};

fs::path default_ssh_config_path(const fs::path& home);

// A missing file yields an empty entry.
Result<SshConfigEntry> load_ssh_config(const fs::path& path,
                                       const std::string& target_host,
                                       const fs::path& home);

// Parse config text directly (used by load_ssh_config and tests).
SshConfigEntry parse_ssh_config(std::istream& in,
                                const std::string& target_host,
                                const fs::path& home);
