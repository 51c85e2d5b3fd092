#pragma once

#include <concepts>
#include <utility>

namespace rdaemon {

// Work driven by a PeriodicScheduler. Callbacks report failure by throwing.
class IPeriodicTask {
public:
  virtual ~IPeriodicTask() = default;

  virtual auto setup() -> void {}
  virtual auto teardown() -> void {}

  // is_scheduled_wakeup is false when the wakeup came from notify().
  virtual auto periodic_task(bool is_scheduled_wakeup) -> void = 0;

  [[nodiscard]] virtual auto is_finished() -> bool { return false; }
};

namespace detail {

template <typename T>
concept HasSetup = requires(T& t) { t.setup(); };

template <typename T>
concept HasTeardown = requires(T& t) { t.teardown(); };

template <typename T>
concept HasPeriodicTask = requires(T& t, bool scheduled) {
  t.periodic_task(scheduled);
};

template <typename T>
concept HasIsFinished = requires(T& t) {
  { t.is_finished() } -> std::convertible_to<bool>;
};

}  // namespace detail

template <typename T>
concept PeriodicWork = detail::HasPeriodicTask<T> ||
                       std::invocable<T&, bool> || std::invocable<T&>;

// Wraps an object (or a callable taking the scheduled flag, or nothing)
// as an IPeriodicTask. Missing lifecycle hooks default to no-ops.
template <PeriodicWork T>
class PeriodicTaskAdapter final : public IPeriodicTask {
public:
  template <typename... Args>
  explicit PeriodicTaskAdapter(Args&&... args)
      : target_(std::forward<Args>(args)...) {}

  auto setup() -> void override {
    if constexpr (detail::HasSetup<T>) {
      target_.setup();
    }
  }

  auto teardown() -> void override {
    if constexpr (detail::HasTeardown<T>) {
      target_.teardown();
    }
  }

  auto periodic_task(bool is_scheduled_wakeup) -> void override {
    if constexpr (detail::HasPeriodicTask<T>) {
      target_.periodic_task(is_scheduled_wakeup);
    } else if constexpr (std::invocable<T&, bool>) {
      target_(is_scheduled_wakeup);
    } else {
      target_();
    }
  }

  [[nodiscard]] auto is_finished() -> bool override {
    if constexpr (detail::HasIsFinished<T>) {
      return static_cast<bool>(target_.is_finished());
    } else {
      return false;
    }
  }

  [[nodiscard]] auto target() noexcept -> T& { return target_; }

private:
  T target_;
};

}  // namespace rdaemon
