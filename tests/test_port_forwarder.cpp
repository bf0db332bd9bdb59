#include <gtest/gtest.h>
#include <managers/port_forwarder.hpp>
#include "fake_transport.hpp"
#include <chrono>
#include <csignal>
#include <random>
#include <sys/socket.h>
#include <netinet/in.h>

static std::string recv_exact(int fd, size_t n, int timeout_ms = 5000) {
    std::string out;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    char buf[8192];
    while (out.size() < n && std::chrono::steady_clock::now() < deadline) {
        if (!(platform::poll_socket(fd, POLLIN, 50) & (POLLIN | POLLHUP))) continue;
        ssize_t r = ::recv(fd, buf, (std::min)(sizeof(buf), n - out.size()), 0);
        if (r <= 0) break;
        out.append(buf, static_cast<size_t>(r));
    }
    return out;
}

static std::string random_bytes(size_t n, unsigned seed) {
    std::mt19937 gen(seed);
    std::string s(n, '\0');
    for (auto& c : s) c = static_cast<char>(gen() & 0xFF);
    return s;
}

static socket_t connect_local(int port) {
    auto c = platform::connect_tcp("127.0.0.1", port, 2);
    EXPECT_EQ(c.status, platform::ConnectStatus::Ok) << c.error;
    return c.sock;
}

// Echo server standing in for the remote destination.
struct EchoServer {
    socket_t fd = SSHC_INVALID_SOCKET;
    int port = 0;
    std::atomic<bool> stop{false};
    std::thread thread;

    EchoServer() {
        auto l = platform::listen_tcp("127.0.0.1", 0, 8);
        EXPECT_TRUE(l.is_ok()) << l.error;
        fd = l.value;
        port = platform::local_port(fd);
        thread = std::thread([this] {
            std::vector<std::thread> conns;
            while (!stop.load()) {
                if (!(platform::poll_socket(fd, POLLIN, 50) & POLLIN)) continue;
                socket_t c = accept(fd, nullptr, nullptr);
                if (c < 0) continue;
                conns.emplace_back([this, c] {
                    char buf[8192];
                    while (!stop.load()) {
                        if (!(platform::poll_socket(c, POLLIN, 50) & (POLLIN | POLLHUP))) continue;
                        ssize_t n = ::recv(c, buf, sizeof(buf), 0);
                        if (n <= 0) break;
                        if (!platform::write_all(c, buf, static_cast<size_t>(n))) break;
                    }
                    platform::close_socket(c);
                });
            }
            for (auto& t : conns) t.join();
        });
    }

    ~EchoServer() {
        stop.store(true);
        thread.join();
        platform::close_socket(fd);
    }
};

// Plain loopback connect, no resolver involved.
static socket_t connect_raw(int port) {
    socket_t fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return fd;
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        platform::close_socket(fd);
        return SSHC_INVALID_SOCKET;
    }
    return fd;
}

class PortForwarderTest : public ::testing::Test {
protected:
    void SetUp() override { std::signal(SIGPIPE, SIG_IGN); }
};

TEST_F(PortForwarderTest, BridgesBinaryPayloadsExactlyBothWays) {
    // Destination: reads the full request, then answers with its own payload
    auto listener = platform::listen_tcp("127.0.0.1", 0, 4);
    ASSERT_TRUE(listener.is_ok()) << listener.error;
    int dest_port = platform::local_port(listener.value);

    const std::string request = random_bytes(200 * 1024, 1);
    const std::string response = random_bytes(96 * 1024 + 7, 2);
    std::string received;

    std::thread dest([&] {
        if (!(platform::poll_socket(listener.value, POLLIN, 5000) & POLLIN)) return;
        socket_t c = accept(listener.value, nullptr, nullptr);
        if (c < 0) return;
        received = recv_exact(c, request.size());
        platform::write_all(c, response.data(), response.size());
        recv_exact(c, 1, 2000);   // wait for the client to hang up
        platform::close_socket(c);
    });

    FakeSession session;
    TunnelManager tunnels(session);
    auto failures = tunnels.start({ForwardSpec{0, "localhost", dest_port}});
    ASSERT_TRUE(failures.empty());
    int local_port = tunnels.bound_ports().at(0);

    socket_t client = connect_local(local_port);
    ASSERT_TRUE(platform::write_all(client, request.data(), request.size()));
    std::string answer = recv_exact(client, response.size());
    platform::close_socket(client);
    dest.join();
    platform::close_socket(listener.value);

    EXPECT_TRUE(received == request) << "request corrupted, got " << received.size() << " bytes";
    EXPECT_TRUE(answer == response) << "response corrupted, got " << answer.size() << " bytes";

    std::lock_guard<std::mutex> lock(session.mtx);
    ASSERT_EQ(session.tunnel_log.size(), 1u);
    EXPECT_EQ(session.tunnel_log[0], fmt::format("localhost:{}<-127.0.0.1:{}", dest_port, local_port));
}

TEST_F(PortForwarderTest, ConcurrentConnectionsAreIndependent) {
    EchoServer echo;
    FakeSession session;
    TunnelManager tunnels(session);
    ASSERT_TRUE(tunnels.start({ForwardSpec{0, "localhost", echo.port}}).empty());
    int port = tunnels.bound_ports().at(0);

    socket_t a = connect_local(port);
    socket_t b = connect_local(port);
    const std::string pa = random_bytes(50000, 3);
    const std::string pb = random_bytes(70000, 4);
    ASSERT_TRUE(platform::write_all(a, pa.data(), pa.size()));
    ASSERT_TRUE(platform::write_all(b, pb.data(), pb.size()));
    EXPECT_TRUE(recv_exact(b, pb.size()) == pb);
    EXPECT_TRUE(recv_exact(a, pa.size()) == pa);
    platform::close_socket(a);
    platform::close_socket(b);
}

TEST_F(PortForwarderTest, ChannelOpenFailureClosesOnlyThatConnection) {
    EchoServer echo;
    FakeSession session;
    session.fail_tunnels = true;
    TunnelManager tunnels(session);
    ASSERT_TRUE(tunnels.start({ForwardSpec{0, "localhost", echo.port}}).empty());
    int port = tunnels.bound_ports().at(0);

    socket_t rejected = connect_local(port);
    char c;
    ASSERT_TRUE(platform::poll_socket(rejected, POLLIN, 5000) & (POLLIN | POLLHUP));
    EXPECT_LE(::recv(rejected, &c, 1, 0), 0);
    platform::close_socket(rejected);

    {
        std::lock_guard<std::mutex> lock(session.mtx);
        session.fail_tunnels = false;
    }

    // The listener is still accepting
    socket_t ok = connect_local(port);
    ASSERT_TRUE(platform::write_all(ok, "ping", 4));
    EXPECT_EQ(recv_exact(ok, 4), "ping");
    platform::close_socket(ok);
}

TEST_F(PortForwarderTest, BindFailureReportedOthersStillStart) {
    auto busy = platform::listen_tcp("127.0.0.1", 0, 1);
    ASSERT_TRUE(busy.is_ok());
    int busy_port = platform::local_port(busy.value);

    FakeSession session;
    TunnelManager tunnels(session);
    auto failures = tunnels.start({ForwardSpec{busy_port, "localhost", 80},
                                   ForwardSpec{0, "localhost", 81}});
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_NE(failures[0].find(std::to_string(busy_port)), std::string::npos);
    EXPECT_EQ(tunnels.handles().size(), 1u);
    platform::close_socket(busy.value);
}

TEST_F(PortForwarderTest, StopEndsActiveConnections) {
    EchoServer echo;
    FakeSession session;
    TunnelManager tunnels(session);
    ASSERT_TRUE(tunnels.start({ForwardSpec{0, "localhost", echo.port}}).empty());
    int port = tunnels.bound_ports().at(0);

    socket_t client = connect_local(port);
    ASSERT_TRUE(platform::write_all(client, "x", 1));
    EXPECT_EQ(recv_exact(client, 1), "x");

    auto start = std::chrono::steady_clock::now();
    tunnels.stop();
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_LT(elapsed, std::chrono::seconds(3));
    EXPECT_TRUE(tunnels.handles().empty());

    // Local side sees the bridge go away
    ASSERT_TRUE(platform::poll_socket(client, POLLIN, 2000) & (POLLIN | POLLHUP));
    char c;
    EXPECT_LE(::recv(client, &c, 1, 0), 0);
    platform::close_socket(client);
}

// Connections that cannot get a handler thread are closed; the listener
// and the connections already bridged carry on.
static bool forwards_survive_thread_exhaustion() {
    std::signal(SIGPIPE, SIG_IGN);
    EchoServer echo;
    FakeSession session;
    TunnelManager tunnels(session);
    if (!tunnels.start({ForwardSpec{0, "localhost", echo.port}}).empty()) return false;
    int port = tunnels.bound_ports().at(0);

    socket_t open_conn = connect_local(port);
    bool ok = platform::write_all(open_conn, "a", 1) && recv_exact(open_conn, 1) == "a";
    {
        AddressSpaceCap cap;
        for (int i = 0; i < 5 && ok; i++) {
            socket_t c = connect_raw(port);
            ok = c >= 0 && (platform::poll_socket(c, POLLIN, 5000) & (POLLIN | POLLHUP));
            char byte;
            ok = ok && ::recv(c, &byte, 1, 0) <= 0;
            platform::close_socket(c);
        }
    }

    ok = ok && platform::write_all(open_conn, "b", 1) && recv_exact(open_conn, 1) == "b";
    socket_t later = connect_local(port);
    ok = ok && platform::write_all(later, "ping", 4) && recv_exact(later, 4) == "ping";
    platform::close_socket(later);
    platform::close_socket(open_conn);
    return ok;
}

TEST(PortForwarderDeathTest, ThreadExhaustionDropsOnlyNewConnections) {
    ::testing::FLAGS_gtest_death_test_style = "threadsafe";
    EXPECT_EXIT(std::_Exit(forwards_survive_thread_exhaustion() ? 0 : 1),
                ::testing::ExitedWithCode(0), "");
}
