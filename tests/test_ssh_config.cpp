#include <gtest/gtest.h>
#include <core/ssh_config.hpp>
#include <sstream>

static SshConfigEntry parse(const std::string& text, const std::string& host) {
    std::istringstream in(text);
    return parse_ssh_config(in, host, "/home/u");
}

TEST(SshConfig, MatchingHostBlock) {
    auto e = parse(
        "Host bastion\n"
        "    HostName 10.0.0.5\n"
        "    User ops\n"
        "    Port 2222\n"
        "    IdentityFile ~/.ssh/bastion_key\n"
        "Host other\n"
        "    User nobody\n",
        "bastion");
    EXPECT_EQ(e.hostname.value_or(""), "10.0.0.5");
    EXPECT_EQ(e.user.value_or(""), "ops");
    EXPECT_EQ(e.port.value_or(0), 2222);
    ASSERT_EQ(e.identity_files.size(), 1u);
    EXPECT_EQ(e.identity_files[0], "/home/u/.ssh/bastion_key");
}

TEST(SshConfig, NonMatchingHostIgnored) {
    auto e = parse("Host other\n  User nobody\n", "bastion");
    EXPECT_FALSE(e.user.has_value());
}

TEST(SshConfig, FirstValueWins) {
    auto e = parse(
        "Host web*\n  User first\n  ServerAliveInterval 15\n"
        "Host *\n  User second\n  ServerAliveInterval 60\n  IdentitiesOnly yes\n",
        "web1");
    EXPECT_EQ(e.user.value_or(""), "first");
    EXPECT_EQ(e.server_alive_interval.value_or(0), 15);
    EXPECT_EQ(e.identities_only.value_or(false), true);
}

TEST(SshConfig, NegatedPattern) {
    auto e = parse("Host * !secret\n  User shared\n", "secret");
    EXPECT_FALSE(e.user.has_value());
    auto e2 = parse("Host * !secret\n  User shared\n", "public");
    EXPECT_EQ(e2.user.value_or(""), "shared");
}

TEST(SshConfig, EqualsSyntaxAndKnownHosts) {
    auto e = parse("Host=db\nUserKnownHostsFile=\"~/.ssh/kh_db\"\n", "db");
    EXPECT_EQ(e.known_hosts_file.value_or(""), "/home/u/.ssh/kh_db");
}

TEST(SshConfig, GlobalDirectivesBeforeFirstHost) {
    auto e = parse("User everyone\nHost x\n  User xuser\n", "y");
    EXPECT_EQ(e.user.value_or(""), "everyone");
}

TEST(SshConfig, MatchBlockSkipped) {
    auto e = parse("Match host db exec \"true\"\n  User matched\n", "db");
    EXPECT_FALSE(e.user.has_value());
}

TEST(SshConfig, CommentsAndBlankLines) {
    auto e = parse("# comment\n\nHost db\n  # inner\n  Port 2200\n", "db");
    EXPECT_EQ(e.port.value_or(0), 2200);
}

TEST(SshConfig, MissingFileIsEmpty) {
    auto r = load_ssh_config("/nonexistent/sshc/config", "db", "/home/u");
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value.user.has_value());
}
