#pragma once

#include "rdaemon/sync/wake_event.hpp"

#include <concepts>
#include <memory>
#include <utility>

namespace rdaemon {

// Anything that can be supervised: a blocking run loop plus the cooperative
// wake/stop protocol. notify() and terminate() may be called from any thread
// (or, for a shared event, any process) while run() executes.
class IDaemon {
public:
  virtual ~IDaemon() = default;

  virtual auto run() -> void = 0;
  virtual auto notify() -> void = 0;
  virtual auto terminate() -> void = 0;
  [[nodiscard]] virtual auto is_terminated() const -> bool = 0;
};

// Default daemon: run() blocks until terminate(). notify() only wakes it.
class BaseDaemon : public IDaemon {
public:
  explicit BaseDaemon(WakeEventKind kind = WakeEventKind::Thread)
      : event_(make_wake_event(kind)) {}

  explicit BaseDaemon(std::unique_ptr<WakeEvent> event)
      : event_(std::move(event)) {}

  auto run() -> void override {
    while (!event_->is_terminated()) {
      event_->wait_and_clear();
    }
  }

  auto notify() -> void override { event_->set(); }

  auto terminate() -> void override { event_->terminate(); }

  [[nodiscard]] auto is_terminated() const -> bool override {
    return event_->is_terminated();
  }

protected:
  [[nodiscard]] auto event() noexcept -> WakeEvent& { return *event_; }

private:
  std::unique_ptr<WakeEvent> event_;
};

template <typename T>
concept Runnable = requires(T& t) { t.run(); };

template <typename T>
concept Notifiable = requires(T& t) { t.notify(); };

template <typename T>
concept Terminable = requires(T& t) { t.terminate(); };

template <typename T>
concept TerminationAware = requires(const T& t) {
  { t.is_terminated() } -> std::convertible_to<bool>;
};

// Turns any object into an IDaemon. Operations T provides are forwarded;
// the rest fall back to BaseDaemon. terminate() always stops the fallback
// loop as well, so a T without run() still ends on terminate.
template <typename T>
class DaemonAdapter final : public BaseDaemon {
public:
  template <typename... Args>
  explicit DaemonAdapter(Args&&... args)
      : target_(std::forward<Args>(args)...) {}

  auto run() -> void override {
    if constexpr (Runnable<T>) {
      target_.run();
    } else {
      BaseDaemon::run();
    }
  }

  auto notify() -> void override {
    if constexpr (Notifiable<T>) {
      target_.notify();
    } else {
      BaseDaemon::notify();
    }
  }

  auto terminate() -> void override {
    if constexpr (Terminable<T>) {
      target_.terminate();
    }
    BaseDaemon::terminate();
  }

  [[nodiscard]] auto is_terminated() const -> bool override {
    if constexpr (TerminationAware<T>) {
      return target_.is_terminated();
    } else {
      return BaseDaemon::is_terminated();
    }
  }

  [[nodiscard]] auto target() noexcept -> T& { return target_; }
  [[nodiscard]] auto target() const noexcept -> const T& { return target_; }

private:
  T target_;
};

}  // namespace rdaemon
