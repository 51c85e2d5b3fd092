#pragma once

#include "rdaemon/core/constants.hpp"
#include "rdaemon/core/error.hpp"

#include <csignal>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string_view>

#include <sys/types.h>

namespace rdaemon::process {

struct DetachOptions {
  std::filesystem::path work_dir{paths::kWorkDir};
  mode_t umask{0};
};

// kill(pid, 0) probe. EPERM counts as alive. Non-positive pids are
// InvalidArgument (0 and -1 address whole groups, not one process).
[[nodiscard]] auto pid_exists(pid_t pid) -> Result<bool>;

[[nodiscard]] auto kill_process(pid_t pid, int sig = SIGTERM) -> bool;

// Extracts the "Tgid:" field of a /proc/<pid>/status document.
[[nodiscard]] auto parse_tgid(std::string_view status) -> std::optional<pid_t>;

// Thread-group leader of pid, or pid itself when /proc has no answer.
[[nodiscard]] auto thread_group_leader(pid_t pid) -> pid_t;

// Signals every distinct thread-group leader among pids once. Returns how
// many leaders accepted the signal.
auto kill_multiple_process(std::span<const pid_t> pids, int sig = SIGTERM)
    -> std::size_t;

// Hard RLIMIT_NOFILE, or detach::kMaxFdFallback when unbounded.
[[nodiscard]] auto max_fd() -> int;

// Double-fork detachment. Only the grandchild returns; parents _exit(0).
// Any failure prints to stderr and _exit(1)s.
auto convert_to_daemon(const DetachOptions& opts = {}) -> void;

}  // namespace rdaemon::process
