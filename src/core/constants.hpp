#pragma once

constexpr const char* SSHC_VERSION = "0.4.0";

// ── Connection ──────────────────────────────────────────────
constexpr int DEFAULT_SSH_PORT           = 22;
constexpr int RETRY_BACKOFF_MS           = 1000;  // Fixed pause between connect attempts
constexpr int HANDSHAKE_POLL_MS          = 100;
constexpr int DISCONNECT_MAX_POLLS       = 20;    // Bounded wait when tearing down a dead session

// ── Keepalive ───────────────────────────────────────────────
constexpr int KEEPALIVE_MAX_FAILURES     = 3;     // Consecutive failed probes before the session is dead

// ── Channel I/O ─────────────────────────────────────────────
constexpr int CHANNEL_POLL_MS            = 20;    // Max wait per socket poll inside a channel read
constexpr int PUMP_POLL_MS               = 100;   // Pumps re-check their stop flag at this interval
constexpr int EXEC_DRAIN_POLL_MS         = 50;    // Per-stream wait in the exec drain loop
constexpr int SSH_READ_BUF_SIZE          = 4096;
constexpr int TUNNEL_BUF_SIZE            = 16384;

// ── Terminal ────────────────────────────────────────────────
constexpr const char* PTY_TERM_TYPE      = "xterm-256color";
constexpr int DEFAULT_TERM_ROWS          = 24;
constexpr int DEFAULT_TERM_COLS          = 80;

// ── Tunnels ─────────────────────────────────────────────────
constexpr const char* TUNNEL_BIND_ADDR   = "127.0.0.1";
constexpr int TUNNEL_LISTEN_BACKLOG      = 16;
constexpr int TUNNEL_ACCEPT_POLL_MS      = 500;

// ── Secrets ─────────────────────────────────────────────────
constexpr const char* DEFAULT_AWS_REGION = "us-east-1";
