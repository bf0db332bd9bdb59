#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <core/types.hpp>
#include "transport.hpp"

// Private key held only in memory (fetched from a secret store).
struct InMemoryKey {
    std::string data;
};

// Let the running ssh-agent sign.
struct AgentDelegated {
    std::optional<std::string> socket;
};

struct KeyFilePair {
    std::string private_path;
    std::string public_path;   // empty when no .pub file sits beside the key
};

using Credential = std::variant<InMemoryKey, AgentDelegated, KeyFilePair>;

std::string describe_credential(const Credential& cred);

// Tries credential sources in fixed priority order against one session
// and stops at the first success:
//
//   1. in-memory key (if supplied); failure here is fatal
//   2. ssh-agent, unless disabled, identities-only, or no agent socket
//   3. the explicit identity, or id_ed25519 / id_rsa / id_ecdsa when
//      identities-only is off; only files that exist are tried
class AuthenticationChain {
public:
    AuthenticationChain(const ResolvedConfig& config,
                        std::optional<std::string> key_data = std::nullopt);

    // Credentials authenticate() will try, in order.
    std::vector<Credential> plan() const;

    // Returns the credential that logged in. Throws SessionError
    // (AuthExhausted) when nothing succeeded.
    Credential authenticate(Session& session);

private:
    const ResolvedConfig& config_;
    std::optional<std::string> key_data_;

    Result<void> try_credential(Session& session, const Credential& cred);
};
