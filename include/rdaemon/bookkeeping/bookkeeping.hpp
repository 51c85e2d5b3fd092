#pragma once

#include "rdaemon/core/constants.hpp"
#include "rdaemon/core/error.hpp"
#include "rdaemon/process/process.hpp"

#include <chrono>
#include <csignal>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace rdaemon {

// Delivering this signal also deletes the daemon's bookkeeping record.
inline constexpr int kConfirmSignal = SIGKILL;

enum class BookkeepingMethod { File, Cgroup };

[[nodiscard]] constexpr auto to_string_view(BookkeepingMethod method) noexcept
    -> std::string_view {
  switch (method) {
    case BookkeepingMethod::File: return "file";
    case BookkeepingMethod::Cgroup: return "cgroup";
  }
  return "file";
}

[[nodiscard]] constexpr auto parse_bookkeeping_method(std::string_view str) noexcept
    -> std::optional<BookkeepingMethod> {
  if (str == "file") return BookkeepingMethod::File;
  if (str == "cgroup" || str == "cgroups") return BookkeepingMethod::Cgroup;
  return std::nullopt;
}

// Rejects absolute paths and ".." components. Empty means the backend root.
[[nodiscard]] auto validate_sub_path(std::string_view sub_path) -> Result<void>;

// Identity of one tracked daemon: a name inside an optional group sub path.
class DaemonKey {
public:
  [[nodiscard]] static auto make(std::string name, std::string sub_path = {})
      -> Result<DaemonKey>;

  [[nodiscard]] auto name() const noexcept -> const std::string& {
    return name_;
  }
  [[nodiscard]] auto sub_path() const noexcept -> const std::string& {
    return sub_path_;
  }

  [[nodiscard]] friend auto operator==(const DaemonKey&, const DaemonKey&)
      -> bool = default;

private:
  DaemonKey(std::string name, std::string sub_path)
      : name_(std::move(name)), sub_path_(std::move(sub_path)) {}

  std::string name_;
  std::string sub_path_;
};

struct BookkeepingOptions {
  BookkeepingMethod method{BookkeepingMethod::File};
  std::string pid_root{paths::kDefaultPidRoot};
  std::string cgroup_mount{paths::kDefaultCgroupMount};
  std::string cgroup_root{paths::kDefaultCgroupRoot};
};

// Where a daemon is recorded and how to find, probe and signal it later.
// Absent or empty records mean "not running"; lookups never throw.
class Bookkeeping {
public:
  virtual ~Bookkeeping() = default;

  [[nodiscard]] virtual auto method() const noexcept -> BookkeepingMethod = 0;

  // PID file path or group path of the record.
  [[nodiscard]] virtual auto locator(const DaemonKey& key) const
      -> std::string = 0;

  // Detaches the calling process and records it. Returns only in the
  // detached daemon.
  [[nodiscard]] virtual auto daemonize(
      const DaemonKey& key, const process::DetachOptions& detach = {})
      -> Result<void> = 0;

  // Removes the record of the calling daemon at exit. Best-effort.
  virtual auto release(const DaemonKey& key) -> void = 0;

  [[nodiscard]] virtual auto get_pids(const DaemonKey& key)
      -> Result<std::vector<pid_t>> = 0;

  [[nodiscard]] virtual auto is_running(const DaemonKey& key) -> bool = 0;

  virtual auto kill(const DaemonKey& key, int sig = SIGTERM) -> bool = 0;

  virtual auto kill_all(std::string_view sub_path = {}, int sig = SIGTERM)
      -> void = 0;

  virtual auto clear_empty(std::string_view sub_path = {}) -> void = 0;

  [[nodiscard]] virtual auto list(std::string_view sub_path = {})
      -> std::vector<DaemonKey> = 0;
};

[[nodiscard]] auto make_bookkeeping(const BookkeepingOptions& options)
    -> std::unique_ptr<Bookkeeping>;

// Polls until the record shows the daemon alive or the timeout elapses.
[[nodiscard]] auto wait_until_running(Bookkeeping& bookkeeping,
                                      const DaemonKey& key,
                                      std::chrono::milliseconds timeout)
    -> bool;

}  // namespace rdaemon
