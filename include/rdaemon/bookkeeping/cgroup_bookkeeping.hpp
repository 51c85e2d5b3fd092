#pragma once

#include "rdaemon/bookkeeping/bookkeeping.hpp"

#include <chrono>
#include <filesystem>

namespace rdaemon {

// One cgroup v2 group per daemon at "<mount>/<root>/<sub_path>/<name>".
// Children of a daemon join its group automatically, so a kill reaches the
// whole process tree.
class CgroupBookkeeping final : public Bookkeeping {
public:
  explicit CgroupBookkeeping(
      std::filesystem::path mount = std::filesystem::path(paths::kDefaultCgroupMount),
      std::string root = std::string(paths::kDefaultCgroupRoot));

  // True when mount is a cgroup2 filesystem we may create groups in.
  [[nodiscard]] static auto is_available(const std::filesystem::path& mount)
      -> bool;

  [[nodiscard]] static auto parse_pid_list(std::string_view text)
      -> std::vector<pid_t>;

  // "<root>/<sub_path>/<name>", relative to the mount.
  [[nodiscard]] auto group_path(const DaemonKey& key) const -> std::string;
  [[nodiscard]] auto group_dir(const DaemonKey& key) const
      -> std::filesystem::path;

  [[nodiscard]] auto method() const noexcept -> BookkeepingMethod override {
    return BookkeepingMethod::Cgroup;
  }
  [[nodiscard]] auto locator(const DaemonKey& key) const
      -> std::string override;
  [[nodiscard]] auto daemonize(const DaemonKey& key,
                               const process::DetachOptions& detach = {})
      -> Result<void> override;
  auto release(const DaemonKey& key) -> void override;
  [[nodiscard]] auto get_pids(const DaemonKey& key)
      -> Result<std::vector<pid_t>> override;
  [[nodiscard]] auto is_running(const DaemonKey& key) -> bool override;
  auto kill(const DaemonKey& key, int sig = SIGTERM) -> bool override;
  auto kill_all(std::string_view sub_path = {}, int sig = SIGTERM)
      -> void override;
  auto clear_empty(std::string_view sub_path = {}) -> void override;
  [[nodiscard]] auto list(std::string_view sub_path = {})
      -> std::vector<DaemonKey> override;

private:
  [[nodiscard]] auto base_dir(std::string_view sub_path) const
      -> std::filesystem::path;
  [[nodiscard]] static auto read_procs(const std::filesystem::path& dir)
      -> Result<std::vector<pid_t>>;
  [[nodiscard]] static auto hierarchy_procs(const std::filesystem::path& dir)
      -> std::vector<pid_t>;
  static auto add_process(const std::filesystem::path& dir, pid_t pid)
      -> Result<void>;
  static auto wait_drained(const std::filesystem::path& dir,
                           std::chrono::milliseconds timeout) -> bool;
  static auto delete_group(const std::filesystem::path& dir, bool recursive)
      -> bool;

  std::filesystem::path mount_;
  std::string root_;
};

}  // namespace rdaemon
