#pragma once

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Local port forward: 127.0.0.1:local_port → remote_host:remote_port
// through a direct-tcpip channel.
struct ForwardSpec {
    int local_port = 0;
    std::string remote_host;
    int remote_port = 0;

    bool operator==(const ForwardSpec& o) const {
        return local_port == o.local_port && remote_host == o.remote_host &&
               remote_port == o.remote_port;
    }
};

// Where to fetch an in-memory private key from (AWS SSM Parameter Store).
struct SecretRef {
    std::string path;
    std::string region;
    std::optional<std::string> access_key_id;
    std::optional<std::string> secret_access_key;
};

// Fully resolved connection settings. Assembled once from flags,
// ~/.ssh/config and ~/.sshc/config.yaml, then read-only.
struct ResolvedConfig {
    std::string host;
    int port = 22;
    std::string user;

    std::optional<std::string> identity;          // -i or first existing IdentityFile
    std::vector<std::string> discovery_keys;      // id_ed25519, id_rsa, id_ecdsa
    bool identities_only = false;
    bool no_agent = false;
    std::optional<std::string> agent_socket;      // SSH_AUTH_SOCK

    std::string known_hosts;
    bool verify_host_key = true;                  // false only with --no-known-hosts

    int server_alive_interval = 0;                // seconds, 0 = disabled
    std::vector<ForwardSpec> forwards;
    int connect_timeout = 0;                      // seconds, 0 = OS default
    int connection_attempts = 1;

    std::optional<std::string> command;           // one-shot exec; shell if empty
    std::optional<SecretRef> secret;
    bool debug = false;
};
