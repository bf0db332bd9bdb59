#include "config.hpp"
#include "constants.hpp"
#include "forward_spec.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <cstdlib>

namespace fs = std::filesystem;

static std::optional<std::string> getenv_nonempty(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

Environment Environment::from_process() {
    Environment env;
    env.home = platform::home_dir();
    env.user = getenv_nonempty("USER");
    env.agent_socket = getenv_nonempty("SSH_AUTH_SOCK");
    env.aws_region = getenv_nonempty("AWS_REGION");
    if (!env.aws_region) env.aws_region = getenv_nonempty("AWS_DEFAULT_REGION");
    env.aws_access_key_id = getenv_nonempty("AWS_ACCESS_KEY_ID");
    env.aws_secret_access_key = getenv_nonempty("AWS_SECRET_ACCESS_KEY");
    return env;
}

fs::path get_client_config_dir(const fs::path& home) {
    return home / ".sshc";
}

fs::path get_client_config_path(const fs::path& home) {
    return get_client_config_dir(home) / "config.yaml";
}

Result<ClientDefaults> load_client_defaults(const fs::path& path) {
    ClientDefaults defaults;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<ClientDefaults>::Ok(defaults);
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root || root.IsNull()) {
            return Result<ClientDefaults>::Ok(defaults);
        }
        if (!root.IsMap()) {
            return Result<ClientDefaults>::Err(path.string() + ": top level must be a mapping");
        }

        defaults.connect_timeout = root["connect_timeout"].as<int>(0);
        defaults.connection_attempts = (std::max)(root["connection_attempts"].as<int>(1), 1);
        defaults.server_alive_interval = (std::max)(root["server_alive_interval"].as<int>(0), 0);
        defaults.no_agent = root["no_agent"].as<bool>(false);

        if (root["known_hosts"]) {
            defaults.known_hosts = root["known_hosts"].as<std::string>();
        }
        if (root["aws_region"]) {
            defaults.aws_region = root["aws_region"].as<std::string>();
        }

        return Result<ClientDefaults>::Ok(defaults);
    } catch (const std::exception& e) {
        return Result<ClientDefaults>::Err(std::string("Failed to parse client config: ") + e.what());
    }
}

Result<ResolvedConfig> resolve_config(const ConfigOverrides& flags,
                                      const SshConfigEntry& ssh_config,
                                      const ClientDefaults& defaults,
                                      const Environment& env) {
    if (flags.host.empty()) {
        return Result<ResolvedConfig>::Err("host cannot be empty");
    }
    if (flags.identity && flags.ssm_secret_path) {
        return Result<ResolvedConfig>::Err("--identity and --ssm-secret-path are mutually exclusive");
    }

    ResolvedConfig cfg;

    // HostName alias resolution
    cfg.host = ssh_config.hostname.value_or(flags.host);
    cfg.port = flags.port.value_or(ssh_config.port.value_or(DEFAULT_SSH_PORT));
    cfg.user = flags.user ? *flags.user
             : ssh_config.user ? *ssh_config.user
             : env.user.value_or("root");

    if (cfg.port <= 0 || cfg.port > 65535) {
        return Result<ResolvedConfig>::Err(fmt::format("invalid port '{}'", cfg.port));
    }

    // ── Authentication ──────────────────────────────────────
    if (flags.identity) {
        std::error_code ec;
        if (!fs::exists(*flags.identity, ec)) {
            return Result<ResolvedConfig>::Err("key file not found: " + *flags.identity);
        }
        cfg.identity = flags.identity;
    } else {
        for (const auto& f : ssh_config.identity_files) {
            std::error_code ec;
            if (fs::exists(f, ec)) {
                cfg.identity = f;
                break;
            }
        }
    }

    for (const char* name : {"id_ed25519", "id_rsa", "id_ecdsa"}) {
        cfg.discovery_keys.push_back((env.home / ".ssh" / name).string());
    }

    cfg.identities_only = flags.identities_only.value_or(ssh_config.identities_only.value_or(false));
    cfg.no_agent = flags.no_agent || defaults.no_agent;
    cfg.agent_socket = env.agent_socket;

    // ── Host verification ───────────────────────────────────
    if (flags.known_hosts) {
        cfg.known_hosts = expand_home(*flags.known_hosts, env.home).string();
    } else if (ssh_config.known_hosts_file) {
        cfg.known_hosts = *ssh_config.known_hosts_file;
    } else if (defaults.known_hosts) {
        cfg.known_hosts = expand_home(*defaults.known_hosts, env.home).string();
    } else {
        cfg.known_hosts = (env.home / ".ssh" / "known_hosts").string();
    }
    cfg.verify_host_key = !flags.no_known_hosts;

    // ── Session behaviour ───────────────────────────────────
    cfg.server_alive_interval = flags.server_alive_interval.value_or(
        ssh_config.server_alive_interval.value_or(defaults.server_alive_interval));
    cfg.connect_timeout = (std::max)(flags.connect_timeout.value_or(defaults.connect_timeout), 0);
    cfg.connection_attempts = (std::max)(
        flags.connection_attempts.value_or(defaults.connection_attempts), 1);

    auto forwards = parse_forward_specs(flags.forwards);
    if (forwards.is_err()) {
        return Result<ResolvedConfig>::Err(forwards.error);
    }
    cfg.forwards = std::move(forwards.value);

    if (flags.command && !flags.command->empty()) {
        cfg.command = flags.command;
    }

    // ── Secret store ────────────────────────────────────────
    if (flags.ssm_secret_path) {
        SecretRef ref;
        ref.path = *flags.ssm_secret_path;
        ref.region = flags.aws_region ? *flags.aws_region
                   : env.aws_region ? *env.aws_region
                   : defaults.aws_region.value_or(DEFAULT_AWS_REGION);
        ref.access_key_id = flags.aws_access_key_id ? flags.aws_access_key_id : env.aws_access_key_id;
        ref.secret_access_key = flags.aws_secret_access_key ? flags.aws_secret_access_key
                                                            : env.aws_secret_access_key;
        cfg.secret = ref;
    }

    cfg.debug = flags.debug;
    return Result<ResolvedConfig>::Ok(cfg);
}

Result<ResolvedConfig> load_config(const ConfigOverrides& flags, const Environment& env) {
    auto defaults = load_client_defaults(get_client_config_path(env.home));
    if (defaults.is_err()) {
        return Result<ResolvedConfig>::Err(defaults.error);
    }

    auto ssh_config = load_ssh_config(default_ssh_config_path(env.home), flags.host, env.home);
    if (ssh_config.is_err()) {
        return Result<ResolvedConfig>::Err(ssh_config.error);
    }

    return resolve_config(flags, ssh_config.value, defaults.value, env);
}
