#pragma once

#include "rdaemon/bookkeeping/bookkeeping.hpp"
#include "rdaemon/config/system_config.hpp"

#include <string>
#include <vector>

namespace rdaemon::cli {

// Exit code of `status` for a daemon that is not running.
inline constexpr int kExitNotRunning = 3;
// Exit code of `watch` when interrupted before the daemon died.
inline constexpr int kExitInterrupted = 130;

// Which backend and group a command addresses.
struct Scope {
  BookkeepingOptions bookkeeping;
  std::string group;
};

struct LaunchOptions {
  SystemConfig config;
  std::vector<std::string> command;
};

struct StatusOptions {
  Scope scope;
  std::string name;
};

struct KillOptions {
  Scope scope;
  std::string name;
  bool force{false};
};

struct KillAllOptions {
  Scope scope;
  bool force{false};
};

struct ListOptions {
  Scope scope;
};

struct ClearOptions {
  Scope scope;
};

struct WatchOptions {
  Scope scope;
  std::string name;
  double period_sec{1.0};
};

[[nodiscard]] auto cmd_launch(const LaunchOptions& opts) -> int;
[[nodiscard]] auto cmd_status(const StatusOptions& opts) -> int;
[[nodiscard]] auto cmd_kill(const KillOptions& opts) -> int;
[[nodiscard]] auto cmd_kill_all(const KillAllOptions& opts) -> int;
[[nodiscard]] auto cmd_list(const ListOptions& opts) -> int;
[[nodiscard]] auto cmd_clear(const ClearOptions& opts) -> int;
[[nodiscard]] auto cmd_watch(const WatchOptions& opts) -> int;

}  // namespace rdaemon::cli
