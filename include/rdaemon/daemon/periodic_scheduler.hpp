#pragma once

#include "rdaemon/core/constants.hpp"
#include "rdaemon/daemon/daemon.hpp"
#include "rdaemon/daemon/periodic_task.hpp"
#include "rdaemon/sync/wake_event.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace rdaemon {

enum class SchedulerState : std::uint8_t {
  Created,
  Setup,
  Running,
  Teardown,
  Terminated
};

[[nodiscard]] constexpr auto to_string_view(SchedulerState state) noexcept
    -> std::string_view {
  switch (state) {
    case SchedulerState::Created: return "created";
    case SchedulerState::Setup: return "setup";
    case SchedulerState::Running: return "running";
    case SchedulerState::Teardown: return "teardown";
    case SchedulerState::Terminated: return "terminated";
  }
  return "unknown";
}

// Per-run bookkeeping of the loop. Reset at the start of every run().
struct PeriodicTaskState {
  std::chrono::steady_clock::time_point last_wakeup{};
  bool is_scheduled_wakeup{false};
  bool finished{false};
  std::uint64_t wakeups{0};
};

// Drives an IPeriodicTask through setup -> {periodic_task}* -> teardown.
// The loop wakes every wakeup_period or on notify(), and stops on
// terminate() or when the task reports is_finished(). Task exceptions are
// logged and never leave run().
class PeriodicScheduler final : public IDaemon {
public:
  using Duration = std::chrono::nanoseconds;

  PeriodicScheduler(std::string name, std::unique_ptr<IPeriodicTask> task,
                    Duration wakeup_period = timing::kMinWakeupPeriod,
                    WakeEventKind event_kind = WakeEventKind::Thread);

  PeriodicScheduler(std::string name, std::unique_ptr<IPeriodicTask> task,
                    Duration wakeup_period, std::unique_ptr<WakeEvent> event);

  PeriodicScheduler(const PeriodicScheduler&) = delete;
  auto operator=(const PeriodicScheduler&) -> PeriodicScheduler& = delete;

  auto run() -> void override;
  auto notify() -> void override;
  auto terminate() -> void override;
  [[nodiscard]] auto is_terminated() const -> bool override;

  // Applies from the next wait. Clamped to timing::kMinWakeupPeriod.
  auto set_wakeup_period(Duration period) -> void;
  [[nodiscard]] auto wakeup_period() const noexcept -> Duration;

  [[nodiscard]] auto name() const noexcept -> const std::string& {
    return name_;
  }
  [[nodiscard]] auto state() const noexcept -> SchedulerState {
    return state_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto task_state() const -> PeriodicTaskState;

  [[nodiscard]] auto task() noexcept -> IPeriodicTask& { return *task_; }

private:
  [[nodiscard]] auto clamp_period(Duration period) const -> Duration;
  [[nodiscard]] auto guard(std::string_view callback,
                           const std::function<void()>& fn) -> bool;
  [[nodiscard]] auto check_finished() -> bool;
  auto run_teardown() -> void;

  std::string name_;
  std::unique_ptr<IPeriodicTask> task_;
  std::unique_ptr<WakeEvent> event_;
  std::atomic<Duration::rep> period_ns_;
  std::atomic<SchedulerState> state_{SchedulerState::Created};

  mutable std::mutex state_mutex_;
  PeriodicTaskState task_state_;
};

}  // namespace rdaemon
