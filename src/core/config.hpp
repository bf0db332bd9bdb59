#pragma once

#include <string>
#include <optional>
#include <vector>
#include <filesystem>
#include "types.hpp"
#include "ssh_config.hpp"

namespace fs = std::filesystem;

// Client-wide defaults from ~/.sshc/config.yaml. Every key is optional.
struct ClientDefaults {
    int connect_timeout = 0;
    int connection_attempts = 1;
    int server_alive_interval = 0;
    std::optional<std::string> known_hosts;
    std::optional<std::string> aws_region;
    bool no_agent = false;
};

// Values given on the command line. Unset optionals defer to ssh_config,
// then to ClientDefaults.
struct ConfigOverrides {
    std::string host;
    std::optional<std::string> user;
    std::optional<int> port;
    std::optional<std::string> identity;
    bool no_agent = false;
    std::optional<bool> identities_only;
    std::optional<std::string> known_hosts;
    bool no_known_hosts = false;
    std::optional<int> server_alive_interval;
    std::vector<std::string> forwards;
    std::optional<int> connect_timeout;
    std::optional<int> connection_attempts;
    std::optional<std::string> command;

    std::optional<std::string> ssm_secret_path;
    std::optional<std::string> aws_region;
    std::optional<std::string> aws_access_key_id;
    std::optional<std::string> aws_secret_access_key;

    bool debug = false;
};

// Process environment the resolver depends on.
struct Environment {
    fs::path home;
    std::optional<std::string> user;
    std::optional<std::string> agent_socket;
    std::optional<std::string> aws_region;
    std::optional<std::string> aws_access_key_id;
    std::optional<std::string> aws_secret_access_key;

    static Environment from_process();
};

fs::path get_client_config_dir(const fs::path& home);
fs::path get_client_config_path(const fs::path& home);

// Load ~/.sshc/config.yaml. A missing file yields defaults.
Result<ClientDefaults> load_client_defaults(const fs::path& path);

// Merge flags > ssh_config > client defaults > built-ins, validating
// ports and forward specs before any network activity.
Result<ResolvedConfig> resolve_config(const ConfigOverrides& flags,
                                      const SshConfigEntry& ssh_config,
                                      const ClientDefaults& defaults,
                                      const Environment& env);

// Load both config files for flags.host from their standard locations and resolve.
Result<ResolvedConfig> load_config(const ConfigOverrides& flags, const Environment& env);
