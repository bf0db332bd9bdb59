#include "auth_chain.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <filesystem>

namespace fs = std::filesystem;

static const char* AUTH_EXHAUSTED_MSG =
    "No valid authentication method succeeded. Use -i, --ssm-secret-path, or ensure ssh-agent is running.";

std::string describe_credential(const Credential& cred) {
    if (std::holds_alternative<InMemoryKey>(cred)) return "in-memory key";
    if (std::holds_alternative<AgentDelegated>(cred)) return "ssh-agent";
    return "key file " + std::get<KeyFilePair>(cred).private_path;
}

AuthenticationChain::AuthenticationChain(const ResolvedConfig& config,
                                         std::optional<std::string> key_data)
    : config_(config), key_data_(std::move(key_data)) {}

std::vector<Credential> AuthenticationChain::plan() const {
    std::vector<Credential> creds;

    if (key_data_) {
        creds.emplace_back(InMemoryKey{*key_data_});
        return creds;
    }

    if (!config_.no_agent && !config_.identities_only && config_.agent_socket) {
        creds.emplace_back(AgentDelegated{config_.agent_socket});
    }

    std::vector<std::string> candidates;
    if (config_.identity) {
        candidates.push_back(*config_.identity);
    } else if (!config_.identities_only) {
        candidates = config_.discovery_keys;
    }

    for (const auto& path : candidates) {
        std::error_code ec;
        if (!fs::exists(path, ec)) continue;
        std::string pub = path + ".pub";
        if (!fs::exists(pub, ec)) pub.clear();
        creds.emplace_back(KeyFilePair{path, pub});
    }
    return creds;
}

Result<void> AuthenticationChain::try_credential(Session& session, const Credential& cred) {
    if (auto* key = std::get_if<InMemoryKey>(&cred)) {
        return session.login_with_key_data(config_.user, key->data);
    }
    if (auto* agent = std::get_if<AgentDelegated>(&cred)) {
        return session.login_with_agent(config_.user, agent->socket);
    }
    const auto& pair = std::get<KeyFilePair>(cred);
    return session.login_with_key_file(config_.user, pair.private_path, pair.public_path);
}

Credential AuthenticationChain::authenticate(Session& session) {
    for (const auto& cred : plan()) {
        auto result = try_credential(session, cred);
        if (result.is_ok()) {
            sshc_log(fmt::format("authenticated as {} via {}", config_.user, describe_credential(cred)));
            return cred;
        }

        // An explicitly supplied in-memory key never falls through
        if (std::holds_alternative<InMemoryKey>(cred)) {
            throw SessionError(ErrorKind::AuthExhausted, "SSM key auth failed: " + result.error);
        }
        sshc_log(fmt::format("{} rejected: {}", describe_credential(cred), result.error));
    }

    throw SessionError(ErrorKind::AuthExhausted, AUTH_EXHAUSTED_MSG);
}
