#include "rdaemon/daemon/daemon_thread.hpp"

#include "rdaemon/util/log.hpp"

#include <exception>
#include <stdexcept>

namespace rdaemon {

DaemonThread::DaemonThread(std::string name, std::unique_ptr<IDaemon> daemon)
    : name_(std::move(name)), daemon_(std::move(daemon)) {
  if (!daemon_) {
    throw std::invalid_argument("DaemonThread requires a daemon");
  }
}

DaemonThread::~DaemonThread() {
  stop();
}

auto DaemonThread::start() -> void {
  if (started_.exchange(true)) {
    return;
  }

  running_.store(true, std::memory_order_release);
  thread_ = std::jthread([this] {
    try {
      daemon_->run();
    } catch (const std::exception& e) {
      log::error("Daemon thread {} terminated by exception: {}", name_,
                 e.what());
    } catch (...) {
      log::error("Daemon thread {} terminated by a non-standard exception",
                 name_);
    }
    running_.store(false, std::memory_order_release);
  });
  log::debug("Daemon thread {} started", name_);
}

auto DaemonThread::stop() -> void {
  if (!started_.load(std::memory_order_acquire)) {
    return;
  }

  daemon_->terminate();
  if (thread_.joinable()) {
    thread_.join();
    log::debug("Daemon thread {} stopped", name_);
  }
}

}  // namespace rdaemon
