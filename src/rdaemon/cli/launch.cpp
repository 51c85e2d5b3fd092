#include "rdaemon/cli/commands.hpp"
#include "rdaemon/daemon/periodic_scheduler.hpp"
#include "rdaemon/daemon/tasks.hpp"
#include "rdaemon/supervisor/launch.hpp"

#include <print>

namespace rdaemon::cli {

auto cmd_launch(const LaunchOptions& opts) -> int {
  const auto& daemon = opts.config.daemon;
  auto command = opts.command.empty() ? daemon.command : opts.command;
  if (command.empty()) {
    std::println(stderr, "Error: no command to launch");
    return 1;
  }

  auto key = DaemonKey::make(daemon.name, daemon.group);
  if (!key) {
    std::println(stderr, "Error: invalid daemon name '{}' or group '{}'",
                 daemon.name, daemon.group);
    return 1;
  }

  auto bookkeeping = make_bookkeeping(opts.config.bookkeeping);
  if (bookkeeping->is_running(*key)) {
    std::println(stderr, "Error: {} is already running", daemon.name);
    return 1;
  }

  auto period = wakeup_period(daemon);
  auto event = daemon.event;
  auto name = daemon.name;
  auto result = launch_daemon(
      to_launch_options(opts.config),
      [command, period, event, name]() -> std::unique_ptr<IDaemon> {
        return std::make_unique<PeriodicScheduler>(
            name, std::make_unique<CommandTask>(command), period, event);
      });
  if (!result) {
    std::println(stderr, "Error: failed to launch {}: {}", daemon.name,
                 result.error().message());
    return 1;
  }

  if (!wait_until_running(*bookkeeping, *key, timing::kDaemonStartTimeout)) {
    std::println(stderr, "Error: {} did not start (see {}/{}.log)", daemon.name,
                 opts.config.logging.output_path, daemon.name);
    return 1;
  }

  auto pids = bookkeeping->get_pids(*key);
  std::println("Launched {} (pid {})", daemon.name,
               pids && !pids->empty() ? pids->front() : -1);
  return 0;
}

}  // namespace rdaemon::cli
