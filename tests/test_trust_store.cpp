#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <ssh/trust_store.hpp>
#include "fake_transport.hpp"
#include <sstream>

namespace fs = std::filesystem;

static std::string read_file(const fs::path& p) {
    std::ifstream in(p);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static size_t count_lines(const std::string& s) {
    size_t n = 0;
    for (char c : s) if (c == '\n') n++;
    return n;
}

// Prompter that must never be consulted.
static std::optional<std::string> no_prompt(const std::string&) {
    ADD_FAILURE() << "unexpected prompt";
    return std::nullopt;
}

static ErrorKind verify_error(TrustStore& store, Session& s, const std::string& host, int port) {
    try {
        store.verify(s, host, port);
    } catch (const SessionError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "verify did not throw";
    return ErrorKind::Protocol;
}

TEST(TrustStore, FirstUseNonInteractivePersistsThenMatches) {
    TempDir dir;
    auto path = dir.file("known_hosts", "");
    FakeSession session;

    TrustStore first(path.string(), false, no_prompt);
    first.verify(session, "host", 22);
    std::string after_first = read_file(path);
    EXPECT_EQ(count_lines(after_first), 1u);
    EXPECT_EQ(after_first.rfind("host ssh-ed25519 ", 0), 0u);

    // A fresh store (next process) sees the persisted entry
    TrustStore second(path.string(), false, no_prompt);
    second.verify(session, "host", 22);
    EXPECT_EQ(read_file(path), after_first);
}

TEST(TrustStore, NonDefaultPortStoredBracketed) {
    TempDir dir;
    auto path = dir.path / "known_hosts";
    FakeSession session;
    TrustStore store(path.string(), false, no_prompt);
    store.verify(session, "host", 2222);
    EXPECT_EQ(read_file(path).rfind("[host]:2222 ssh-ed25519 ", 0), 0u);
}

TEST(TrustStore, MismatchIsFatalAndLeavesFileUnchanged) {
    TempDir dir;
    // Stored key has another type than the live one
    auto path = dir.file("known_hosts", "host ssh-rsa AAAAB3NzaC1yc2E=\n");
    std::string before = read_file(path);
    FakeSession session;

    TrustStore non_interactive(path.string(), false, no_prompt);
    EXPECT_EQ(verify_error(non_interactive, session, "host", 22), ErrorKind::TrustMismatch);

    // Interactive mode has no way to override either
    TrustStore interactive(path.string(), true, no_prompt);
    EXPECT_EQ(verify_error(interactive, session, "host", 22), ErrorKind::TrustMismatch);

    EXPECT_EQ(read_file(path), before);
}

TEST(TrustStore, MismatchIsNeverDowngradedLater) {
    TempDir dir;
    auto path = dir.file("known_hosts", "host ssh-rsa AAAAB3NzaC1yc2E=\n");
    FakeSession session;
    TrustStore store(path.string(), false, no_prompt);
    EXPECT_EQ(verify_error(store, session, "host", 22), ErrorKind::TrustMismatch);

    // Even with the offending entry gone, this process keeps refusing
    std::ofstream(path, std::ios::trunc).close();
    EXPECT_EQ(verify_error(store, session, "host", 22), ErrorKind::TrustMismatch);
}

TEST(TrustStore, InteractiveYesAccepts) {
    TempDir dir;
    auto path = dir.path / "known_hosts";
    FakeSession session;
    std::string seen_prompt;
    TrustStore store(path.string(), true, [&](const std::string& prompt) {
        seen_prompt = prompt;
        return std::optional<std::string>("YES");
    });
    store.verify(session, "host", 22);
    EXPECT_NE(seen_prompt.find("(yes/no)"), std::string::npos);
    EXPECT_EQ(count_lines(read_file(path)), 1u);
}

TEST(TrustStore, InteractiveOtherAnswersDecline) {
    for (const char* answer : {"no", "n", "", "yess", "sure"}) {
        TempDir dir;
        auto path = dir.path / "known_hosts";
        FakeSession session;
        TrustStore store(path.string(), true, [&](const std::string&) {
            return std::optional<std::string>(answer);
        });
        EXPECT_EQ(verify_error(store, session, "host", 22), ErrorKind::TrustDeclined) << answer;
        EXPECT_FALSE(fs::exists(path)) << answer;
    }
}

TEST(TrustStore, InteractiveEndOfInputDeclines) {
    TempDir dir;
    FakeSession session;
    TrustStore store((dir.path / "known_hosts").string(), true,
                     [](const std::string&) { return std::optional<std::string>(); });
    EXPECT_EQ(verify_error(store, session, "host", 22), ErrorKind::TrustDeclined);
}

TEST(TrustStore, PersistFailureStillTrustsForThisProcess) {
    TempDir dir;
    // Parent "directory" is a regular file, so saving must fail
    auto blocker = dir.file("not_a_dir", "x");
    auto path = blocker / "known_hosts";
    FakeSession session;

    TrustStore store(path.string(), false, no_prompt);
    store.verify(session, "host", 22);
    store.verify(session, "host", 22);
    EXPECT_FALSE(fs::exists(path));
}

TEST(TrustStore, Affirmative) {
    EXPECT_TRUE(is_affirmative("yes"));
    EXPECT_TRUE(is_affirmative("Y"));
    EXPECT_TRUE(is_affirmative(" Yes \n"));
    EXPECT_FALSE(is_affirmative("no"));
    EXPECT_FALSE(is_affirmative("ye"));
}
