#pragma once

#include "rdaemon/bookkeeping/bookkeeping.hpp"

#include <filesystem>

namespace rdaemon {

// One "<root>/<sub_path>/<name>.pid" file per daemon holding its PID.
class FileBookkeeping final : public Bookkeeping {
public:
  explicit FileBookkeeping(
      std::filesystem::path root = std::filesystem::path(paths::kDefaultPidRoot));

  [[nodiscard]] auto root() const noexcept -> const std::filesystem::path& {
    return root_;
  }

  [[nodiscard]] auto pid_file(const DaemonKey& key) const
      -> std::filesystem::path;

  [[nodiscard]] auto get_pid(const DaemonKey& key) -> Result<pid_t>;

  [[nodiscard]] static auto read_pid_file(const std::filesystem::path& path)
      -> Result<pid_t>;
  [[nodiscard]] static auto write_pid_file(const std::filesystem::path& path,
                                           pid_t pid) -> Result<void>;

  [[nodiscard]] auto method() const noexcept -> BookkeepingMethod override {
    return BookkeepingMethod::File;
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
  auto kill_pid_file(const std::filesystem::path& path, int sig) -> bool;

  std::filesystem::path root_;
};

}  // namespace rdaemon
