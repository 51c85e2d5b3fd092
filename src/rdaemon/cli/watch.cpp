#include "rdaemon/cli/commands.hpp"
#include "rdaemon/daemon/periodic_scheduler.hpp"
#include "rdaemon/daemon/tasks.hpp"
#include "rdaemon/supervisor/supervision_context.hpp"
#include "rdaemon/supervisor/supervisor.hpp"

#include <chrono>
#include <print>

namespace rdaemon::cli {

auto cmd_watch(const WatchOptions& opts) -> int {
  auto key = DaemonKey::make(opts.name, opts.scope.group);
  if (!key) {
    std::println(stderr, "Error: invalid daemon name '{}' or group '{}'",
                 opts.name, opts.scope.group);
    return 1;
  }

  auto bookkeeping = make_bookkeeping(opts.scope.bookkeeping);
  bool dead = false;
  auto checker = std::make_unique<IsAliveChecker>(
      *bookkeeping, *key, [&dead, &opts] {
        dead = true;
        std::println("{}: not running", opts.name);
      });

  auto period = std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::duration<double>(opts.period_sec));
  SupervisionContext context;
  DaemonSupervisor supervisor(
      context, "watch-" + opts.name,
      std::make_unique<PeriodicScheduler>("watch-" + opts.name,
                                          std::move(checker), period));
  if (auto code = supervisor.supervise(); code != 0) {
    return code;
  }
  return dead ? 0 : kExitInterrupted;
}

}  // namespace rdaemon::cli
