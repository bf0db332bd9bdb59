#include "trust_store.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <cli/theme.hpp>
#include <fmt/format.h>
#include <readline/readline.h>
#include <cstdio>
#include <cstdlib>

static std::optional<std::string> readline_prompt(const std::string& prompt) {
    // Prompts belong on stderr; stdout may be piped
    rl_outstream = stderr;
    char* line = readline(prompt.c_str());
    if (!line) return std::nullopt;
    std::string answer(line);
    std::free(line);
    return answer;
}

bool is_affirmative(const std::string& answer) {
    std::string a = answer;
    trim(a);
    a = to_lower(a);
    return a == "yes" || a == "y";
}

TrustStore::TrustStore(std::string known_hosts_path, bool interactive, Prompter prompter)
    : path_(std::move(known_hosts_path)),
      interactive_(interactive),
      prompter_(prompter ? std::move(prompter) : Prompter(readline_prompt)) {}

void TrustStore::report_mismatch(const std::string& host_id, const HostKey& key) {
    const std::string rule = "@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@@";
    sshc_stderr(theme::red(rule));
    sshc_stderr(theme::red("@    WARNING: REMOTE HOST IDENTIFICATION HAS CHANGED!     @"));
    sshc_stderr(theme::red(rule));
    sshc_stderr("IT IS POSSIBLE THAT SOMEONE IS DOING SOMETHING NASTY!");
    sshc_stderr("Someone could be eavesdropping on you right now (man-in-the-middle attack)!");
    sshc_stderr("It is also possible that a host key has just been changed.");
    sshc_stderr(fmt::format("The {} key sent by the remote host '{}' is", key.type, host_id));
    sshc_stderr(host_key_fingerprint(key.blob) + ".");
    sshc_stderr(fmt::format("Offending entries are in {}.", path_));
    sshc_stderr(fmt::format("Remove them with: ssh-keygen -R {} -f {}", host_id, path_));
}

bool TrustStore::confirm(const std::string& host_id, const HostKey& key) {
    sshc_stderr(fmt::format("The authenticity of host '{}' can't be established.", host_id));
    sshc_stderr(fmt::format("{} key fingerprint is {}.", key.type, host_key_fingerprint(key.blob)));

    if (!interactive_) {
        sshc_warn("non-interactive session, auto-accepting host key.");
        return true;
    }

    auto answer = prompter_("Are you sure you want to continue connecting? (yes/no) ");
    return answer && is_affirmative(*answer);
}

void TrustStore::verify(Session& session, const std::string& host, int port) {
    std::string host_id = canonical_host_id(host, port);
    HostKey key = session.host_key();
    if (key.blob.empty()) {
        throw SessionError(ErrorKind::Protocol, "Could not read the server's host key");
    }

    if (mismatched_.count(host_id)) {
        report_mismatch(host_id, key);
        throw SessionError(ErrorKind::TrustMismatch,
                           fmt::format("Host key verification failed for {}", host_id));
    }

    for (const auto& a : accepted_) {
        if (a.first == host_id && a.second.type == key.type && a.second.blob == key.blob) {
            sshc_log(fmt::format("host key for {} accepted earlier in this process", host_id));
            return;
        }
    }

    KnownHostsFile db(path_);
    auto loaded = db.load();
    if (loaded.is_err()) {
        sshc_warn(loaded.error);
    }

    auto checked = db.check(host_id, key);
    if (checked.is_err()) throw SessionError(ErrorKind::Protocol, checked.error);

    switch (checked.value) {
    case HostKeyCheck::Match:
        sshc_log(fmt::format("host key for {} matches {}", host_id, path_));
        return;

    case HostKeyCheck::Mismatch:
        mismatched_.insert(host_id);
        report_mismatch(host_id, key);
        throw SessionError(ErrorKind::TrustMismatch,
                           fmt::format("Host key verification failed for {}", host_id));

    case HostKeyCheck::NotFound:
        break;
    }

    if (!confirm(host_id, key)) {
        throw SessionError(ErrorKind::TrustDeclined, "Host key verification failed.");
    }

    accepted_.emplace_back(host_id, key);

    // Never write to a file we could not read
    if (loaded.is_err()) return;

    auto saved = db.add(host_id, key);
    if (saved.is_ok()) saved = db.save();
    if (saved.is_err()) {
        sshc_warn(fmt::format("could not save host key: {}", saved.error));
        return;
    }
    sshc_warn(fmt::format("Permanently added '{}' ({}) to {}.", host_id, key.type, path_));
}
