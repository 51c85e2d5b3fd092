#include "rdaemon/supervisor/supervision_context.hpp"

#include "rdaemon/util/log.hpp"

#include <exception>

#include <unistd.h>

namespace rdaemon {

SupervisionContext::SupervisionContext() : owner_(::getpid()) {}

SupervisionContext::~SupervisionContext() {
  run_cleanups();
}

auto SupervisionContext::add_cleanup(std::string name, Cleanup cleanup) -> void {
  std::lock_guard lock(mutex_);
  cleanups_.push_back(Entry{std::move(name), std::move(cleanup)});
}

auto SupervisionContext::adopt_current_process() -> void {
  std::lock_guard lock(mutex_);
  owner_ = ::getpid();
}

auto SupervisionContext::pending() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return cleanups_.size();
}

auto SupervisionContext::run_cleanups() -> void {
  std::vector<Entry> entries;
  {
    std::lock_guard lock(mutex_);
    if (owner_ != ::getpid()) {
      return;
    }
    entries.swap(cleanups_);
  }

  for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
    log::debug("Running exit cleanup: {}", it->name);
    try {
      it->cleanup();
    } catch (const std::exception& e) {
      log::error("Exit cleanup {} failed: {}", it->name, e.what());
    }
  }
}

}  // namespace rdaemon
