#pragma once

#include <atomic>

namespace rdaemon {

// Raised by SIGTERM, SIGINT and SIGHUP once setup_signal_handlers() ran.
extern std::atomic<bool> g_shutdown_requested;

void setup_signal_handlers();
void restore_signal_handlers();

// Blocks until a shutdown is requested.
void wait_for_shutdown();

// Same effect as a termination signal, from inside the process.
void request_shutdown();
void reset_shutdown_request();

}  // namespace rdaemon
