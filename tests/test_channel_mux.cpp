#include <gtest/gtest.h>
#include <ssh/byte_pump.hpp>
#include <ssh/channel_mux.hpp>
#include "fake_transport.hpp"
#include <chrono>
#include <csignal>
#include <future>
#include <poll.h>
#include <sys/socket.h>

// Read exactly n bytes from fd or give up after timeout_ms.
static std::string read_exact(int fd, size_t n, int timeout_ms = 5000) {
    std::string out;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    char buf[256];
    while (out.size() < n && std::chrono::steady_clock::now() < deadline) {
        struct pollfd pfd = {fd, POLLIN, 0};
        if (poll(&pfd, 1, 50) <= 0) continue;
        ssize_t r = ::read(fd, buf, (std::min)(sizeof(buf), n - out.size()));
        if (r <= 0) break;
        out.append(buf, static_cast<size_t>(r));
    }
    return out;
}

static std::string read_all(int fd) {
    std::string out;
    char buf[256];
    ssize_t r;
    while ((r = ::read(fd, buf, sizeof(buf))) > 0) out.append(buf, static_cast<size_t>(r));
    return out;
}

static bool wait_for(const std::function<bool()>& pred, int timeout_ms = 5000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        platform::sleep_ms(10);
    }
    return pred();
}

struct Pipe {
    int fds[2] = {-1, -1};
    Pipe() { EXPECT_EQ(pipe(fds), 0); }
    ~Pipe() { close_read(); close_write(); }
    int r() const { return fds[0]; }
    int w() const { return fds[1]; }
    void close_read() { if (fds[0] >= 0) ::close(fds[0]); fds[0] = -1; }
    void close_write() { if (fds[1] >= 0) ::close(fds[1]); fds[1] = -1; }
};

// ── Exec mode ──────────────────────────────────────────────────

TEST(ChannelMux, ExecPropagatesExitStatusAndStreams) {
    FakeSession session;
    auto ch = std::make_shared<ChannelState>();
    ch->stdout_chunks = {"hel", "", "lo ", "", "", "world\n"};
    ch->stderr_chunks = {"", "warn: a\n", "warn: b\n"};
    ch->status = 42;
    session.session_channels.push_back(ch);

    Pipe out, err;
    SessionChannelMultiplexer mux(session, TerminalIo{-1, out.w(), err.w()});
    EXPECT_EQ(mux.run(std::string("exit 42")), 42);

    out.close_write();
    err.close_write();
    EXPECT_EQ(read_all(out.r()), "hello world\n");
    EXPECT_EQ(read_all(err.r()), "warn: a\nwarn: b\n");

    auto log = ch->log();
    ASSERT_FALSE(log.empty());
    EXPECT_EQ(log.front(), "exec:exit 42");
    EXPECT_TRUE(ch->saw("close"));
}

TEST(ChannelMux, ExecWithoutExitStatusReturnsZero) {
    FakeSession session;
    auto ch = std::make_shared<ChannelState>();
    ch->stdout_chunks = {"ok\n"};
    session.session_channels.push_back(ch);

    Pipe out, err;
    SessionChannelMultiplexer mux(session, TerminalIo{-1, out.w(), err.w()});
    EXPECT_EQ(mux.run_exec("true"), 0);
}

TEST(ChannelMux, ExecKeepsDrainingAfterLocalOutputCloses) {
    FakeSession session;
    auto ch = std::make_shared<ChannelState>();
    ch->stdout_chunks = {"a", "b", "c"};
    ch->stderr_chunks = {"e"};
    ch->status = 3;
    session.session_channels.push_back(ch);

    Pipe out, err;
    out.close_read();   // writes to out now fail with EPIPE
    std::signal(SIGPIPE, SIG_IGN);
    SessionChannelMultiplexer mux(session, TerminalIo{-1, out.w(), err.w()});
    EXPECT_EQ(mux.run_exec("cmd"), 3);
    err.close_write();
    EXPECT_EQ(read_all(err.r()), "e");
}

TEST(ChannelMux, ChannelOpenFailureThrows) {
    FakeSession session;
    SessionChannelMultiplexer mux(session, TerminalIo{-1, -1, -1});
    EXPECT_THROW(mux.run_exec("ls"), SessionError);
}

// ── Shell mode ─────────────────────────────────────────────────

TEST(ChannelMux, ShellPumpsBothWaysAndForwardsResize) {
    int sp[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, sp), 0);
    int remote = sp[1];

    FakeSession session;
    auto ch = std::make_shared<ChannelState>();
    ch->fd = sp[0];
    session.session_channels.push_back(ch);

    Pipe in, out;
    std::atomic<int> size_calls{0};
    SessionChannelMultiplexer mux(session, TerminalIo{in.r(), out.w(), 2}, [&] {
        return size_calls++ == 0 ? platform::TermSize{24, 80} : platform::TermSize{40, 100};
    });

    auto result = std::async(std::launch::async, [&] { return mux.run_shell(); });

    ASSERT_TRUE(wait_for([&] { return ch->saw("shell"); }));
    EXPECT_TRUE(ch->saw("pty:xterm-256color:80x24"));

    // Resize notification while the pumps run
    kill(getpid(), SIGWINCH);
    EXPECT_TRUE(wait_for([&] { return ch->saw("resize:100x40"); }));

    // remote → local stdout
    const std::string prompt = "user@host:~$ ";
    ASSERT_TRUE(platform::write_all(remote, prompt.data(), prompt.size()));
    EXPECT_EQ(read_exact(out.r(), prompt.size()), prompt);

    // local stdin → remote, byte for byte
    const std::string typed("ls -la\r\x03\x1b[A", 11);
    ASSERT_EQ(::write(in.w(), typed.data(), typed.size()), static_cast<ssize_t>(typed.size()));
    EXPECT_EQ(read_exact(remote, typed.size()), typed);

    // Remote end of stream ends the mode
    ::close(remote);
    ASSERT_EQ(result.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(result.get(), 0);
    EXPECT_TRUE(ch->saw("close"));
}

TEST(ChannelMux, ShellEndsWhenLocalInputCloses) {
    int sp[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, sp), 0);

    FakeSession session;
    auto ch = std::make_shared<ChannelState>();
    ch->fd = sp[0];
    session.session_channels.push_back(ch);

    Pipe in, out;
    SessionChannelMultiplexer mux(session, TerminalIo{in.r(), out.w(), 2},
                                  [] { return platform::TermSize{24, 80}; });
    auto result = std::async(std::launch::async, [&] { return mux.run_shell(); });

    ASSERT_TRUE(wait_for([&] { return ch->saw("shell"); }));
    in.close_write();
    ASSERT_EQ(result.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(result.get(), 0);
    ::close(sp[1]);
}

TEST(ChannelMux, ShellRequestFailureClosesChannel) {
    FakeSession session;
    auto ch = std::make_shared<ChannelState>();
    ch->fail_shell = true;
    session.session_channels.push_back(ch);

    Pipe in, out;
    SessionChannelMultiplexer mux(session, TerminalIo{in.r(), out.w(), 2},
                                  [] { return platform::TermSize{24, 80}; });
    EXPECT_THROW(mux.run_shell(), SessionError);
    EXPECT_TRUE(ch->saw("close"));
}

// ── Byte pump ──────────────────────────────────────────────────

static bool pump_pair_reports_thread_failure() {
    FakeChannel chan(std::make_shared<ChannelState>());
    Pipe in, out;
    PumpEnd end;
    {
        AddressSpaceCap cap;
        end = run_pump_pair(chan, in.r(), out.w());
    }
    if (end != PumpEnd::Failed) return false;

    // With room again both directions start; the empty remote stream ends first
    return run_pump_pair(chan, in.r(), out.w()) == PumpEnd::Remote;
}

TEST(BytePumpDeathTest, ThreadStartFailureIsReported) {
    ::testing::FLAGS_gtest_death_test_style = "threadsafe";
    EXPECT_EXIT(std::_Exit(pump_pair_reports_thread_failure() ? 0 : 1),
                ::testing::ExitedWithCode(0), "");
}
