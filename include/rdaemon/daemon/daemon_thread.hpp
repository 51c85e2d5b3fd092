#pragma once

#include "rdaemon/daemon/daemon.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace rdaemon {

// Runs an IDaemon on a dedicated thread inside the current process.
// stop() (and the destructor) terminates the daemon and joins.
class DaemonThread {
public:
  DaemonThread(std::string name, std::unique_ptr<IDaemon> daemon);
  ~DaemonThread();

  DaemonThread(const DaemonThread&) = delete;
  auto operator=(const DaemonThread&) -> DaemonThread& = delete;

  auto start() -> void;
  auto stop() -> void;

  // True while run() has not returned.
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  auto notify() -> void { daemon_->notify(); }

  [[nodiscard]] auto daemon() noexcept -> IDaemon& { return *daemon_; }
  [[nodiscard]] auto name() const noexcept -> const std::string& {
    return name_;
  }

private:
  std::string name_;
  std::unique_ptr<IDaemon> daemon_;
  std::atomic<bool> started_{false};
  std::atomic<bool> running_{false};
  std::jthread thread_;
};

}  // namespace rdaemon
