#include "rdaemon/util/signals.hpp"

#include <csignal>

namespace rdaemon {

std::atomic<bool> g_shutdown_requested{false};

namespace {

constexpr int kShutdownSignals[] = {SIGINT, SIGTERM, SIGHUP};

void signal_handler(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
  g_shutdown_requested.notify_all();
}

}  // namespace

void setup_signal_handlers() {
  for (int sig : kShutdownSignals) {
    std::signal(sig, signal_handler);
  }
}

void restore_signal_handlers() {
  for (int sig : kShutdownSignals) {
    std::signal(sig, SIG_DFL);
  }
}

void wait_for_shutdown() {
  g_shutdown_requested.wait(false, std::memory_order_acquire);
}

void request_shutdown() {
  g_shutdown_requested.store(true, std::memory_order_release);
  g_shutdown_requested.notify_all();
}

void reset_shutdown_request() {
  g_shutdown_requested.store(false, std::memory_order_release);
}

}  // namespace rdaemon
