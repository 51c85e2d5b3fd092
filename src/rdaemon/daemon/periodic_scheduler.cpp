#include "rdaemon/daemon/periodic_scheduler.hpp"

#include "rdaemon/core/constants.hpp"
#include "rdaemon/util/log.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace rdaemon {

PeriodicScheduler::PeriodicScheduler(std::string name,
                                     std::unique_ptr<IPeriodicTask> task,
                                     Duration wakeup_period,
                                     WakeEventKind event_kind)
    : PeriodicScheduler(std::move(name), std::move(task), wakeup_period,
                        make_wake_event(event_kind)) {}

PeriodicScheduler::PeriodicScheduler(std::string name,
                                     std::unique_ptr<IPeriodicTask> task,
                                     Duration wakeup_period,
                                     std::unique_ptr<WakeEvent> event)
    : name_(std::move(name)),
      task_(std::move(task)),
      event_(std::move(event)),
      period_ns_(0) {
  if (!task_) {
    throw std::invalid_argument("PeriodicScheduler requires a task");
  }
  if (!event_) {
    throw std::invalid_argument("PeriodicScheduler requires a wake event");
  }
  period_ns_.store(clamp_period(wakeup_period).count(),
                   std::memory_order_relaxed);
}

auto PeriodicScheduler::clamp_period(Duration period) const -> Duration {
  if (period < timing::kMinWakeupPeriod) {
    log::warn("Daemon {}: wakeup period {}ms is below the minimum, using {}s",
              name_,
              std::chrono::duration_cast<std::chrono::milliseconds>(period).count(),
              timing::kMinWakeupPeriod.count());
    return timing::kMinWakeupPeriod;
  }
  return period;
}

auto PeriodicScheduler::set_wakeup_period(Duration period) -> void {
  period_ns_.store(clamp_period(period).count(), std::memory_order_release);
}

auto PeriodicScheduler::wakeup_period() const noexcept -> Duration {
  return Duration{period_ns_.load(std::memory_order_acquire)};
}

auto PeriodicScheduler::task_state() const -> PeriodicTaskState {
  std::lock_guard lock(state_mutex_);
  return task_state_;
}

auto PeriodicScheduler::guard(std::string_view callback,
                              const std::function<void()>& fn) -> bool {
  try {
    fn();
    return true;
  } catch (const std::exception& e) {
    log::error("Daemon {}: {} failed: {}", name_, callback, e.what());
  } catch (...) {
    log::error("Daemon {}: {} failed with a non-standard exception", name_,
               callback);
  }
  return false;
}

auto PeriodicScheduler::check_finished() -> bool {
  bool finished = false;
  if (!guard("is_finished", [&] { finished = task_->is_finished(); })) {
    return false;
  }
  if (finished) {
    std::lock_guard lock(state_mutex_);
    task_state_.finished = true;
  }
  return finished;
}

auto PeriodicScheduler::run_teardown() -> void {
  state_.store(SchedulerState::Teardown, std::memory_order_release);
  if (!guard("teardown", [&] { task_->teardown(); })) {
    log::warn("Daemon {}: teardown did not complete", name_);
  }
  state_.store(SchedulerState::Terminated, std::memory_order_release);
  log::debug("Daemon {} stopped", name_);
}

auto PeriodicScheduler::run() -> void {
  {
    std::lock_guard lock(state_mutex_);
    task_state_ = PeriodicTaskState{};
  }

  if (event_->is_terminated()) {
    log::debug("Daemon {} terminated before start, skipping setup", name_);
    run_teardown();
    return;
  }

  state_.store(SchedulerState::Setup, std::memory_order_release);
  if (!guard("setup", [&] { task_->setup(); })) {
    log::error("Daemon {}: setup failed, not entering the loop", name_);
    run_teardown();
    return;
  }

  // Drop a stale notify but keep a termination requested before run().
  event_->clear();
  auto last_wakeup = std::chrono::steady_clock::now();
  {
    std::lock_guard lock(state_mutex_);
    task_state_.last_wakeup = last_wakeup;
  }

  state_.store(SchedulerState::Running, std::memory_order_release);
  log::debug("Daemon {} running, period {}ms", name_,
             std::chrono::duration_cast<std::chrono::milliseconds>(
                 wakeup_period())
                 .count());

  while (!event_->is_terminated() && !check_finished()) {
    auto elapsed = std::chrono::steady_clock::now() - last_wakeup;
    auto wait_time = std::max(
        Duration::zero(),
        wakeup_period() - std::chrono::duration_cast<Duration>(elapsed));

    bool notified = event_->wait_and_clear(wait_time);
    if (event_->is_terminated()) {
      break;
    }

    last_wakeup = std::chrono::steady_clock::now();
    bool scheduled = !notified;
    {
      std::lock_guard lock(state_mutex_);
      task_state_.last_wakeup = last_wakeup;
      task_state_.is_scheduled_wakeup = scheduled;
      ++task_state_.wakeups;
    }

    log::trace("Daemon {}: {} wakeup", name_,
               scheduled ? "scheduled" : "notified");
    static_cast<void>(
        guard("periodic_task", [&] { task_->periodic_task(scheduled); }));
  }

  run_teardown();
}

auto PeriodicScheduler::notify() -> void {
  event_->set();
}

auto PeriodicScheduler::terminate() -> void {
  event_->terminate();
}

auto PeriodicScheduler::is_terminated() const -> bool {
  return event_->is_terminated();
}

}  // namespace rdaemon
