#pragma once

namespace shardline {

/// SIGINT and SIGTERM request shutdown; SIGPIPE is ignored.
void setup_signal_handlers();

/// Blocks until a signal arrives or request_shutdown() is called.
void wait_for_shutdown();

/// Wakes wait_for_shutdown() from any thread.
void request_shutdown() noexcept;

[[nodiscard]] auto shutdown_requested() noexcept -> bool;

} // namespace shardline
