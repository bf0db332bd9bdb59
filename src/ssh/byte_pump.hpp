#pragma once

#include <atomic>
#include "transport.hpp"

// Copy loops between a local file descriptor and a channel. Each pump
// re-checks stop at least every PUMP_POLL_MS and returns on end of
// stream, on error, or once stop is set. Byte order within a direction
// is preserved.

// Local fd → channel. Returns when fd reaches EOF or the channel write fails.
void pump_fd_to_channel(int fd, Channel& ch, std::atomic<bool>& stop);

// Channel stdout → local fd. Returns on channel EOF or when fd write fails.
void pump_channel_to_fd(Channel& ch, int fd, std::atomic<bool>& stop);

enum class PumpEnd { Local, Remote, Cancelled, Failed };

// Run both directions concurrently until either finishes (or cancel is
// set), then stop and join both. Returns which side ended first, or
// Failed when a pump thread could not be started.
PumpEnd run_pump_pair(Channel& ch, int in_fd, int out_fd,
                      const std::atomic<bool>* cancel = nullptr);
