#pragma once

#include "rdaemon/bookkeeping/bookkeeping.hpp"
#include "rdaemon/daemon/periodic_task.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace rdaemon {

// Runs an external command as a child of the daemon and reaps it on every
// wakeup. The task finishes when the command exits; teardown stops a
// command that is still running (SIGTERM, then SIGKILL after the grace
// period).
class CommandTask final : public IPeriodicTask {
public:
  explicit CommandTask(std::vector<std::string> argv,
                       std::chrono::milliseconds stop_grace =
                           timing::kChildStopGrace);
  ~CommandTask() override;

  CommandTask(const CommandTask&) = delete;
  auto operator=(const CommandTask&) -> CommandTask& = delete;

  auto setup() -> void override;
  auto teardown() -> void override;
  auto periodic_task(bool is_scheduled_wakeup) -> void override;
  [[nodiscard]] auto is_finished() -> bool override { return finished_; }

  [[nodiscard]] auto pid() const noexcept -> pid_t { return pid_; }

  // Exit code, or 128 + signal number when the command was killed.
  [[nodiscard]] auto exit_status() const noexcept -> std::optional<int> {
    return exit_status_;
  }

private:
  // Non-blocking reap. True once the child is gone.
  auto reap(int flags) -> bool;
  auto stop_child() -> void;

  std::vector<std::string> argv_;
  std::chrono::milliseconds stop_grace_;
  pid_t pid_{-1};
  bool finished_{false};
  std::optional<int> exit_status_;
};

// Watches another daemon, either by PID or through its bookkeeping record,
// and finishes once it is gone. on_dead fires from teardown only when the
// death was observed, not when the checker itself was terminated.
class IsAliveChecker final : public IPeriodicTask {
public:
  using DeadCallback = std::function<void()>;

  explicit IsAliveChecker(pid_t pid, DeadCallback on_dead = {});
  IsAliveChecker(Bookkeeping& bookkeeping, DaemonKey key,
                 DeadCallback on_dead = {});

  auto setup() -> void override;
  auto teardown() -> void override;
  auto periodic_task(bool is_scheduled_wakeup) -> void override;
  [[nodiscard]] auto is_finished() -> bool override { return finished_; }

  [[nodiscard]] auto is_alive() -> bool;
  [[nodiscard]] auto pid() const noexcept -> std::optional<pid_t> {
    return pid_;
  }

private:
  Bookkeeping* bookkeeping_{nullptr};
  std::optional<DaemonKey> key_;
  std::optional<pid_t> pid_;
  DeadCallback on_dead_;
  bool finished_{false};
};

}  // namespace rdaemon
