#include "port_forwarder.hpp"
#include <core/constants.hpp>
#include <core/forward_spec.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <ssh/byte_pump.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <sys/socket.h>
#include <netinet/in.h>

// ── TunnelHandle ──────────────────────────────────────────

TunnelHandle::~TunnelHandle() {
    stop.store(true);
    if (thread.joinable()) thread.join();
    platform::close_socket(listen_fd);
}

// ── TunnelManager ─────────────────────────────────────────

TunnelManager::TunnelManager(Session& session) : session_(session) {}

TunnelManager::~TunnelManager() {
    stop();
}

// ── Connection handler ────────────────────────────────────

// Bridge one accepted local connection through a direct-tcpip channel.
// The channel and the socket are closed whichever side ends first.
void TunnelManager::forward_connection(Session& session, ForwardSpec spec, int origin_port,
                                       socket_t client, std::atomic<bool>& stop_flag) {
    auto ch = session.open_tunnel_channel(spec.remote_host, spec.remote_port,
                                          TUNNEL_BIND_ADDR, origin_port);
    if (ch.is_err()) {
        sshc_warn(fmt::format("forward {}: {}", format_forward_spec(spec), ch.error));
        platform::close_socket(client);
        return;
    }
    if (stop_flag.load()) {
        ch.value->close();
        platform::close_socket(client);
        return;
    }

    sshc_log(fmt::format("forward {}: connection open", format_forward_spec(spec)));
    PumpEnd end = run_pump_pair(*ch.value, client, client, &stop_flag);
    ch.value->close();
    platform::close_socket(client);
    if (end == PumpEnd::Failed) {
        sshc_warn(fmt::format("forward {}: connection dropped", format_forward_spec(spec)));
        return;
    }
    sshc_log(fmt::format("forward {}: connection closed ({})", format_forward_spec(spec),
                         end == PumpEnd::Local ? "local eof"
                         : end == PumpEnd::Remote ? "remote eof" : "stopped"));
}

// ── Accept loop ───────────────────────────────────────────

struct ConnectionThread {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
};

void TunnelManager::accept_loop(Session& session, TunnelHandle& handle) {
    std::vector<ConnectionThread> conns;

    auto reap = [&conns] {
        for (auto it = conns.begin(); it != conns.end();) {
            if (it->done->load()) {
                it->thread.join();
                it = conns.erase(it);
            } else {
                ++it;
            }
        }
    };

    while (!handle.stop.load()) {
        reap();

        // Accept with timeout so we can check stop flag
        int revents = platform::poll_socket(handle.listen_fd, POLLIN, TUNNEL_ACCEPT_POLL_MS);
        if (revents == 0) continue;
        if (revents & (POLLERR | POLLNVAL)) {
            sshc_error(fmt::format("forward {}: listener failed", format_forward_spec(handle.spec)));
            break;
        }

        struct sockaddr_in client_addr{};
        socklen_t len = sizeof(client_addr);
        socket_t client = accept(handle.listen_fd, reinterpret_cast<struct sockaddr*>(&client_addr), &len);
        if (client < 0) {
            int err = errno;
            if (err == EINTR || err == EAGAIN || err == ECONNABORTED || err == EPROTO) continue;
            if (err == EMFILE || err == ENFILE || err == ENOBUFS || err == ENOMEM) {
                sshc_log(fmt::format("forward {}: accept: {}", format_forward_spec(handle.spec),
                                     std::strerror(err)));
                platform::sleep_ms(TUNNEL_ACCEPT_POLL_MS);
                continue;
            }
            sshc_error(fmt::format("forward {}: accept failed: {}", format_forward_spec(handle.spec),
                                   std::strerror(err)));
            break;
        }

        auto done = std::make_shared<std::atomic<bool>>(false);
        ConnectionThread ct;
        ct.done = done;
        try {
            ct.thread = std::thread([&session, &handle, client, done] {
                forward_connection(session, handle.spec, handle.bound_port, client, handle.stop);
                done->store(true);
            });
        } catch (const std::system_error& e) {
            // Out of threads: drop this connection, keep listening
            sshc_warn(fmt::format("forward {}: cannot handle connection: {}",
                                  format_forward_spec(handle.spec), e.what()));
            platform::close_socket(client);
            continue;
        }
        conns.push_back(std::move(ct));
    }

    // Handlers see the stop flag within one pump poll interval
    handle.stop.store(true);
    for (auto& c : conns) {
        if (c.thread.joinable()) c.thread.join();
    }
}

// ── Start/Stop ────────────────────────────────────────────

std::vector<std::string> TunnelManager::start(const std::vector<ForwardSpec>& specs) {
    std::vector<std::string> failures;

    for (const auto& spec : specs) {
        auto listener = platform::listen_tcp(TUNNEL_BIND_ADDR, spec.local_port, TUNNEL_LISTEN_BACKLOG);
        if (listener.is_err()) {
            std::string msg = fmt::format("cannot forward {}: {}", format_forward_spec(spec), listener.error);
            sshc_log(msg);
            failures.push_back(msg);
            continue;
        }

        auto handle = std::make_shared<TunnelHandle>();
        handle->spec = spec;
        handle->listen_fd = listener.value;
        handle->bound_port = platform::local_port(listener.value);
        try {
            handle->thread = std::thread(accept_loop, std::ref(session_), std::ref(*handle));
        } catch (const std::system_error& e) {
            // Handle destructor closes the listener
            std::string msg = fmt::format("cannot forward {}: {}", format_forward_spec(spec), e.what());
            sshc_log(msg);
            failures.push_back(msg);
            continue;
        }

        sshc_log(fmt::format("forward {} listening on port {}", format_forward_spec(spec), handle->bound_port));
        handles_.push_back(std::move(handle));
    }

    return failures;
}

void TunnelManager::stop() {
    for (auto& h : handles_) {
        if (h) h->stop.store(true);
    }
    // Destructor joins threads and closes sockets
    handles_.clear();
}

std::vector<int> TunnelManager::bound_ports() const {
    std::vector<int> ports;
    for (const auto& h : handles_) ports.push_back(h->bound_port);
    return ports;
}
