#pragma once

#include "rdaemon/bookkeeping/bookkeeping.hpp"
#include "rdaemon/core/constants.hpp"
#include "rdaemon/core/error.hpp"
#include "rdaemon/daemon/daemon.hpp"
#include "rdaemon/process/process.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace rdaemon {

struct LogOptions {
  std::string level{"info"};
  // The daemon logs to "<output_path>/<name>.log".
  std::string output_path{paths::kDefaultLogPath};
  std::uintmax_t max_bytes{0};
  int backups{0};
};

struct LaunchOptions {
  std::string name;
  std::string group;
  BookkeepingOptions bookkeeping;
  LogOptions log;
  process::DetachOptions detach;
  std::chrono::milliseconds launcher_timeout{timing::kDefaultLauncherTimeout};
};

// Builds the daemon object. Called inside the detached daemon process.
using DaemonTarget = std::function<std::unique_ptr<IDaemon>()>;

// Points the logger at "<output_path>/<name>.log" and starts it.
[[nodiscard]] auto init_daemon_logging(const LogOptions& options,
                                       std::string_view name) -> bool;

// Forks a launcher process that detaches, records and runs target under a
// DaemonSupervisor, then waits for the launcher up to launcher_timeout.
// Success means the daemon was detached, not that it is running yet; use
// wait_until_running() for that.
[[nodiscard]] auto launch_daemon(const LaunchOptions& options,
                                 DaemonTarget target) -> Result<void>;

// The launcher side of launch_daemon(), for callers that want to turn the
// current process into the daemon. Never returns; the process exits with
// the daemon's exit code.
[[noreturn]] auto run_as_daemon(const LaunchOptions& options,
                                const DaemonKey& key, const DaemonTarget& target)
    -> void;

}  // namespace rdaemon
