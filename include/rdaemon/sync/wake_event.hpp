#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

#include <sys/types.h>

namespace rdaemon {

enum class WakeEventKind { Thread, Shared };

[[nodiscard]] constexpr auto to_string_view(WakeEventKind kind) noexcept
    -> std::string_view {
  switch (kind) {
    case WakeEventKind::Thread: return "thread";
    case WakeEventKind::Shared: return "shared";
  }
  return "thread";
}

[[nodiscard]] constexpr auto parse_wake_event_kind(std::string_view str) noexcept
    -> std::optional<WakeEventKind> {
  if (str == "thread") return WakeEventKind::Thread;
  if (str == "shared") return WakeEventKind::Shared;
  return std::nullopt;
}

// A termination-aware event. `signaled` wakes waiters once and is consumed
// by wait_and_clear(); `terminated` is sticky until reset() and makes every
// wait return false without blocking.
class WakeEvent {
public:
  using Timeout = std::optional<std::chrono::nanoseconds>;

  virtual ~WakeEvent() = default;

  virtual auto set() -> void = 0;

  // Returns the previous signaled value. Signaled stays set once terminated.
  virtual auto clear() -> bool = 0;

  // Only valid while nobody waits.
  virtual auto reset() -> void = 0;

  // Returns true only if woken by set() before the timeout and not
  // terminated.
  virtual auto wait_and_clear(Timeout timeout = std::nullopt) -> bool = 0;

  // Returns the previous signaled value.
  virtual auto terminate() -> bool = 0;

  [[nodiscard]] virtual auto is_terminated() const -> bool = 0;
  [[nodiscard]] virtual auto is_set() const -> bool = 0;
};

class ThreadWakeEvent final : public WakeEvent {
public:
  ThreadWakeEvent() = default;

  ThreadWakeEvent(const ThreadWakeEvent&) = delete;
  auto operator=(const ThreadWakeEvent&) -> ThreadWakeEvent& = delete;

  auto set() -> void override;
  auto clear() -> bool override;
  auto reset() -> void override;
  auto wait_and_clear(Timeout timeout = std::nullopt) -> bool override;
  auto terminate() -> bool override;
  [[nodiscard]] auto is_terminated() const -> bool override;
  [[nodiscard]] auto is_set() const -> bool override;

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool signaled_{false};
  bool terminated_{false};
};

// Lives in an anonymous MAP_SHARED mapping, so an event created before
// fork() is shared by parent and child. The creating process must outlive
// the others.
class SharedWakeEvent final : public WakeEvent {
public:
  SharedWakeEvent();
  ~SharedWakeEvent() override;

  SharedWakeEvent(const SharedWakeEvent&) = delete;
  auto operator=(const SharedWakeEvent&) -> SharedWakeEvent& = delete;

  auto set() -> void override;
  auto clear() -> bool override;
  auto reset() -> void override;
  auto wait_and_clear(Timeout timeout = std::nullopt) -> bool override;
  auto terminate() -> bool override;
  [[nodiscard]] auto is_terminated() const -> bool override;
  [[nodiscard]] auto is_set() const -> bool override;

private:
  struct State;
  class Lock;

  State* state_{nullptr};
  pid_t owner_{-1};
};

[[nodiscard]] auto make_wake_event(WakeEventKind kind)
    -> std::unique_ptr<WakeEvent>;

}  // namespace rdaemon
