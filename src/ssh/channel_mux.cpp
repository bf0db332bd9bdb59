#include "channel_mux.hpp"
#include "byte_pump.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

SessionChannelMultiplexer::SessionChannelMultiplexer(Session& session, TerminalIo io,
                                                     TermSizeFn size_fn)
    : session_(session), io_(io), size_fn_(std::move(size_fn)) {
    if (!size_fn_) {
        int fd = io_.out;
        size_fn_ = [fd] { return platform::term_size(fd); };
    }
}

int SessionChannelMultiplexer::run(const std::optional<std::string>& command) {
    if (command) return run_exec(*command);
    return run_shell();
}

std::unique_ptr<Channel> SessionChannelMultiplexer::open_channel() {
    auto ch = session_.open_session_channel();
    if (ch.is_err()) throw SessionError(ErrorKind::Protocol, ch.error);
    return std::move(ch.value);
}

// ── Exec mode ──────────────────────────────────────────────────

int SessionChannelMultiplexer::run_exec(const std::string& command) {
    auto ch = open_channel();
    auto started = ch->exec(command);
    if (started.is_err()) throw SessionError(ErrorKind::Protocol, started.error);
    sshc_log(fmt::format("exec: {}", command));

    // Local stdin is not forwarded in exec mode
    ch->send_eof();

    bool out_eof = false;
    bool err_eof = false;
    bool out_ok = true;
    bool err_ok = true;
    char buf[SSH_READ_BUF_SIZE];

    // Drain one stream. Local write failures discard output but keep
    // draining so the remote side never stalls.
    auto drain = [&](ChannelStream stream, int fd, bool& eof, bool& ok) {
        int n = ch->read(buf, sizeof(buf), stream, EXEC_DRAIN_POLL_MS);
        if (n == CHANNEL_AGAIN) return;
        if (n <= 0) {
            eof = true;
            return;
        }
        if (ok && !platform::write_all(fd, buf, static_cast<size_t>(n))) {
            sshc_log(fmt::format("exec: local fd {} closed, discarding output", fd));
            ok = false;
        }
    };

    while (!out_eof || !err_eof) {
        if (!out_eof) drain(ChannelStream::Stdout, io_.out, out_eof, out_ok);
        if (!err_eof) drain(ChannelStream::Stderr, io_.err, err_eof, err_ok);
    }

    int status = ch->exit_status().value_or(0);
    ch->close();
    sshc_log(fmt::format("exec finished with status {}", status));
    return status;
}

// ── Shell mode ─────────────────────────────────────────────────

int SessionChannelMultiplexer::run_shell() {
    platform::RawModeGuard raw(io_.in);

    auto ch = open_channel();

    auto size = size_fn_();
    auto pty = ch->request_pty(PTY_TERM_TYPE, size.cols, size.rows);
    if (pty.is_err()) throw SessionError(ErrorKind::Protocol, pty.error);

    Channel& chan = *ch;
    platform::ResizeWatcher watcher([this, &chan] {
        auto s = size_fn_();
        auto r = chan.resize(s.cols, s.rows);
        if (r.is_err()) sshc_log(r.error);
        else sshc_log(fmt::format("window resized to {}x{}", s.cols, s.rows));
    });

    auto started = ch->shell();
    if (started.is_err()) throw SessionError(ErrorKind::Protocol, started.error);
    sshc_log(fmt::format("shell started ({}x{}, {})", size.cols, size.rows, PTY_TERM_TYPE));

    PumpEnd end = run_pump_pair(chan, io_.in, io_.out);
    if (end == PumpEnd::Failed) throw SessionError(ErrorKind::Protocol, "shell: cannot start I/O threads");
    sshc_log(end == PumpEnd::Remote ? "shell: remote end closed" : "shell: local input closed");
    return 0;
}
