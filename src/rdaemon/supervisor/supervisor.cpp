#include "rdaemon/supervisor/supervisor.hpp"

#include "rdaemon/util/log.hpp"
#include "rdaemon/util/signals.hpp"

#include <exception>
#include <stdexcept>
#include <thread>

#include <unistd.h>

namespace rdaemon {

DaemonSupervisor::DaemonSupervisor(SupervisionContext& context,
                                   std::string name,
                                   std::unique_ptr<IDaemon> daemon)
    : context_(context), name_(std::move(name)), daemon_(std::move(daemon)) {
  if (!daemon_) {
    throw std::invalid_argument("DaemonSupervisor requires a daemon");
  }
}

auto DaemonSupervisor::daemonize(SupervisionContext& context,
                                 Bookkeeping& bookkeeping, const DaemonKey& key,
                                 const process::DetachOptions& detach)
    -> Result<void> {
  log::info("Daemonizing {} ({} bookkeeping at {})", key.name(),
            to_string_view(bookkeeping.method()), bookkeeping.locator(key));

  auto r = bookkeeping.daemonize(key, detach);
  context.adopt_current_process();
  if (!r) {
    log::error("Daemon {} could not be recorded: {}", key.name(),
               r.error().message());
    return r;
  }

  context.add_cleanup("release " + key.name(),
                      [&bookkeeping, key] { bookkeeping.release(key); });
  log::info("Daemon {} detached (pid {})", key.name(), ::getpid());
  return ok();
}

auto DaemonSupervisor::supervise() -> int {
  // Registered last so it runs before the release of the record.
  context_.add_cleanup("terminate " + name_, [this] { daemon_->terminate(); });

  reset_shutdown_request();
  setup_signal_handlers();
  std::jthread watcher([this](std::stop_token st) {
    wait_for_shutdown();
    if (!st.stop_requested()) {
      log::info("Daemon {} received a termination signal", name_);
      daemon_->terminate();
    }
  });

  int exit_code = 0;
  try {
    daemon_->run();
    log::info("Daemon {} exited", name_);
  } catch (const std::exception& e) {
    log::error("Daemon {} exited with an error: {}", name_, e.what());
    exit_code = 1;
  } catch (...) {
    log::error("Daemon {} exited with a non-standard exception", name_);
    exit_code = 1;
  }

  watcher.request_stop();
  request_shutdown();
  watcher.join();
  restore_signal_handlers();

  context_.run_cleanups();
  return exit_code;
}

auto DaemonSupervisor::run() -> void {
  static_cast<void>(supervise());
}

auto DaemonSupervisor::notify() -> void {
  daemon_->notify();
}

auto DaemonSupervisor::terminate() -> void {
  daemon_->terminate();
}

auto DaemonSupervisor::is_terminated() const -> bool {
  return daemon_->is_terminated();
}

}  // namespace rdaemon
