#pragma once

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "known_hosts.hpp"
#include "transport.hpp"

// Trust-on-first-use host verification against a known_hosts file.
//
//   MATCH     proceed, nothing written
//   NOTFOUND  show fingerprint; confirm on a terminal, auto-accept
//             otherwise; append and persist the entry
//   MISMATCH  always fatal, file untouched
//
// Decisions taken during this process are remembered: an accepted key
// stays trusted even if persisting it failed, and a mismatched host is
// never accepted later.
class TrustStore {
public:
    // Returns the user's answer, or nullopt on end of input.
    using Prompter = std::function<std::optional<std::string>(const std::string& prompt)>;

    // prompter defaults to a readline prompt on the controlling terminal.
    TrustStore(std::string known_hosts_path, bool interactive, Prompter prompter = nullptr);

    // Throws SessionError (TrustMismatch, TrustDeclined, Protocol).
    void verify(Session& session, const std::string& host, int port);

    const std::string& path() const { return path_; }

private:
    std::string path_;
    bool interactive_;
    Prompter prompter_;
    std::vector<std::pair<std::string, HostKey>> accepted_;   // host_id, key
    std::set<std::string> mismatched_;

    void report_mismatch(const std::string& host_id, const HostKey& key);
    bool confirm(const std::string& host_id, const HostKey& key);
};

// "yes" / "y", any case, surrounding whitespace ignored.
bool is_affirmative(const std::string& answer);
