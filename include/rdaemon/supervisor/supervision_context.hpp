#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <sys/types.h>

namespace rdaemon {

// Process-wide exit-time cleanup stack of one daemon process. Cleanups run
// once, newest first, and only in the process that owns the context, so a
// forked child unwinding through the same scope leaves them alone.
class SupervisionContext {
public:
  using Cleanup = std::function<void()>;

  SupervisionContext();
  ~SupervisionContext();

  SupervisionContext(const SupervisionContext&) = delete;
  auto operator=(const SupervisionContext&) -> SupervisionContext& = delete;

  auto add_cleanup(std::string name, Cleanup cleanup) -> void;

  // Exceptions from a cleanup are logged and the next one still runs.
  auto run_cleanups() -> void;

  // Call in the detached daemon: detaching changes the PID.
  auto adopt_current_process() -> void;

  [[nodiscard]] auto owner() const noexcept -> pid_t { return owner_; }
  [[nodiscard]] auto pending() const -> std::size_t;

private:
  struct Entry {
    std::string name;
    Cleanup cleanup;
  };

  mutable std::mutex mutex_;
  std::vector<Entry> cleanups_;
  pid_t owner_;
};

}  // namespace rdaemon
