#pragma once

#include "rdaemon/bookkeeping/bookkeeping.hpp"
#include "rdaemon/core/constants.hpp"
#include "rdaemon/supervisor/launch.hpp"
#include "rdaemon/sync/wake_event.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace rdaemon {

struct DaemonConfig {
  std::string name;
  std::string group;
  double wakeup_period_sec{1.0};
  WakeEventKind event{WakeEventKind::Thread};
  int launcher_timeout_sec{static_cast<int>(timing::kDefaultLauncherTimeout.count())};
  std::vector<std::string> command;
};

struct SystemConfig {
  LogOptions logging;
  BookkeepingOptions bookkeeping;
  DaemonConfig daemon;
};

[[nodiscard]] inline auto wakeup_period(const DaemonConfig& d)
    -> std::chrono::nanoseconds {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::duration<double>(d.wakeup_period_sec));
}

[[nodiscard]] inline auto to_launch_options(const SystemConfig& c)
    -> LaunchOptions {
  LaunchOptions options;
  options.name = c.daemon.name;
  options.group = c.daemon.group;
  options.bookkeeping = c.bookkeeping;
  options.log = c.logging;
  options.launcher_timeout = std::chrono::seconds(c.daemon.launcher_timeout_sec);
  return options;
}

}  // namespace rdaemon
