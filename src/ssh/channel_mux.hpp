#pragma once

#include <functional>
#include <optional>
#include <string>
#include <platform/terminal.hpp>
#include "transport.hpp"

// Local side of the session: the process's standard streams by default.
struct TerminalIo {
    int in = 0;
    int out = 1;
    int err = 2;
};

// Runs the foreground task on one session channel: a one-shot command
// (exec mode) or an interactive shell on a remote PTY (shell mode).
class SessionChannelMultiplexer {
public:
    using TermSizeFn = std::function<platform::TermSize()>;

    // size_fn defaults to the size of the terminal on io.out.
    explicit SessionChannelMultiplexer(Session& session, TerminalIo io = {},
                                       TermSizeFn size_fn = nullptr);

    // Exec mode when command is set, shell mode otherwise.
    // Returns the exit code for the process.
    int run(const std::optional<std::string>& command);

    // Stream remote stdout/stderr to io.out/io.err until both reach end
    // of stream. Returns the remote exit status, 0 if none was sent.
    int run_exec(const std::string& command);

    // Raw local terminal, remote PTY, resize forwarding and two pumps.
    // Ends when either direction finishes. Returns 0.
    int run_shell();

private:
    Session& session_;
    TerminalIo io_;
    TermSizeFn size_fn_;

    std::unique_ptr<Channel> open_channel();
};
