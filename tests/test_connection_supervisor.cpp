#include <gtest/gtest.h>
#include <managers/connection_supervisor.hpp>
#include <ssh/trust_store.hpp>
#include "fake_transport.hpp"

// Session that authenticates with the agent and runs one exec channel.
static std::shared_ptr<FakeSession> exec_session(int status) {
    auto s = std::make_shared<FakeSession>();
    s->agent_ok = true;
    auto ch = std::make_shared<ChannelState>();
    ch->stdout_chunks = {"done\n"};
    ch->status = status;
    s->session_channels.push_back(ch);
    return s;
}

class SupervisorTest : public ::testing::Test {
protected:
    ResolvedConfig cfg;
    FakeConnector connector;
    std::vector<int> sleeps;
    int out[2] = {-1, -1};

    void SetUp() override {
        cfg.host = "example.com";
        cfg.port = 22;
        cfg.user = "alice";
        cfg.agent_socket = "/tmp/agent.sock";
        cfg.command = "uptime";
        ASSERT_EQ(pipe(out), 0);
    }

    void TearDown() override {
        ::close(out[0]);
        ::close(out[1]);
    }

    int run(TrustStore* trust = nullptr) {
        ConnectionSupervisor sup(cfg, connector, trust);
        sup.set_sleeper([this](int ms) { sleeps.push_back(ms); });
        sup.set_terminal_io(TerminalIo{-1, out[1], out[1]});
        int rc = sup.run();
        attempts = sup.attempts_made();
        return rc;
    }

    int attempts = 0;
};

TEST_F(SupervisorTest, TimeoutsUseEveryAttemptWithFixedPauses) {
    for (int n : {1, 2, 4}) {
        cfg.connection_attempts = n;
        connector.calls = 0;
        sleeps.clear();
        connector.factory = [](int) -> std::unique_ptr<Session> {
            throw SessionError(ErrorKind::ConnectTimeout, "timed out");
        };
        EXPECT_EQ(run(), 1);
        EXPECT_EQ(connector.calls, n);
        EXPECT_EQ(attempts, n);
        EXPECT_EQ(sleeps, std::vector<int>(n - 1, 1000));
    }
}

TEST_F(SupervisorTest, RefusedIsRetryable) {
    cfg.connection_attempts = 3;
    connector.factory = [](int) -> std::unique_ptr<Session> {
        throw SessionError(ErrorKind::ConnectionRefused, "refused");
    };
    EXPECT_EQ(run(), 1);
    EXPECT_EQ(connector.calls, 3);
    EXPECT_EQ(sleeps.size(), 2u);
}

TEST_F(SupervisorTest, SucceedsAfterTransientFailures) {
    cfg.connection_attempts = 5;
    auto session = exec_session(42);
    connector.factory = [&](int attempt) -> std::unique_ptr<Session> {
        if (attempt < 3) throw SessionError(ErrorKind::ConnectTimeout, "timed out");
        return std::make_unique<SessionProxy>(session);
    };
    EXPECT_EQ(run(), 42);
    EXPECT_EQ(connector.calls, 3);
    EXPECT_EQ(sleeps.size(), 2u);
    EXPECT_EQ(session->disconnects.load(), 1);
}

TEST_F(SupervisorTest, AuthExhaustionIsFatalWithoutRetry) {
    cfg.connection_attempts = 4;
    auto session = std::make_shared<FakeSession>();   // rejects everything
    connector.factory = [&](int) -> std::unique_ptr<Session> {
        return std::make_unique<SessionProxy>(session);
    };
    EXPECT_EQ(run(), 1);
    EXPECT_EQ(connector.calls, 1);
    EXPECT_TRUE(sleeps.empty());
    EXPECT_EQ(session->disconnects.load(), 1);
}

TEST_F(SupervisorTest, ProtocolErrorIsFatal) {
    cfg.connection_attempts = 3;
    connector.factory = [](int) -> std::unique_ptr<Session> {
        throw SessionError(ErrorKind::Protocol, "handshake failed");
    };
    EXPECT_EQ(run(), 1);
    EXPECT_EQ(connector.calls, 1);
}

TEST_F(SupervisorTest, TrustMismatchStopsBeforeAuthentication) {
    TempDir dir;
    auto kh = dir.file("known_hosts", "example.com ssh-rsa AAAAB3NzaC1yc2E=\n");
    TrustStore trust(kh.string(), false, [](const std::string&) { return std::optional<std::string>(); });

    cfg.connection_attempts = 3;
    auto session = exec_session(0);
    connector.factory = [&](int) -> std::unique_ptr<Session> {
        return std::make_unique<SessionProxy>(session);
    };
    EXPECT_EQ(run(&trust), 1);
    EXPECT_EQ(connector.calls, 1);
    EXPECT_TRUE(session->auth_attempts().empty());
    EXPECT_EQ(session->disconnects.load(), 1);
}

TEST_F(SupervisorTest, TrustedHostRunsCommand) {
    TempDir dir;
    TrustStore trust((dir.path / "known_hosts").string(), false);
    auto session = exec_session(7);
    connector.factory = [&](int) -> std::unique_ptr<Session> {
        return std::make_unique<SessionProxy>(session);
    };
    EXPECT_EQ(run(&trust), 7);
    EXPECT_EQ(session->auth_attempts(), (std::vector<std::string>{"agent"}));
}

TEST_F(SupervisorTest, ListenerBindFailureIsFatalBeforeForeground) {
    auto busy = platform::listen_tcp("127.0.0.1", 0, 1);
    ASSERT_TRUE(busy.is_ok());
    cfg.forwards = {ForwardSpec{platform::local_port(busy.value), "localhost", 80}};
    cfg.connection_attempts = 2;

    auto session = exec_session(0);
    connector.factory = [&](int) -> std::unique_ptr<Session> {
        return std::make_unique<SessionProxy>(session);
    };
    EXPECT_EQ(run(), 1);
    EXPECT_EQ(connector.calls, 1);
    // The exec channel was never opened
    EXPECT_EQ(session->session_channels.size(), 1u);
    platform::close_socket(busy.value);
}

TEST_F(SupervisorTest, WatchdogRunsWhenIntervalSet) {
    cfg.server_alive_interval = 30;
    auto session = exec_session(0);
    connector.factory = [&](int) -> std::unique_ptr<Session> {
        return std::make_unique<SessionProxy>(session);
    };
    EXPECT_EQ(run(), 0);
    std::lock_guard<std::mutex> lock(session->mtx);
    EXPECT_TRUE(session->keepalive_want_reply);
    EXPECT_EQ(session->keepalive_interval, 30);
}
