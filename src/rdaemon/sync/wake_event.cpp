#include "rdaemon/sync/wake_event.hpp"

#include <cerrno>
#include <ctime>
#include <system_error>

#include <pthread.h>
#include <sys/mman.h>
#include <unistd.h>

namespace rdaemon {

auto ThreadWakeEvent::set() -> void {
  std::lock_guard lock(mutex_);
  signaled_ = true;
  cv_.notify_all();
}

auto ThreadWakeEvent::clear() -> bool {
  std::lock_guard lock(mutex_);
  bool previous = signaled_;
  if (!terminated_) {
    signaled_ = false;
  }
  return previous;
}

auto ThreadWakeEvent::reset() -> void {
  std::lock_guard lock(mutex_);
  signaled_ = false;
  terminated_ = false;
}

auto ThreadWakeEvent::wait_and_clear(Timeout timeout) -> bool {
  std::unique_lock lock(mutex_);
  if (terminated_) {
    return false;
  }

  auto ready = [this] { return signaled_ || terminated_; };
  if (!timeout) {
    cv_.wait(lock, ready);
  } else if (timeout->count() > 0) {
    cv_.wait_for(lock, *timeout, ready);
  }

  if (terminated_) {
    return false;
  }
  bool previous = signaled_;
  signaled_ = false;
  return previous;
}

auto ThreadWakeEvent::terminate() -> bool {
  std::lock_guard lock(mutex_);
  terminated_ = true;
  bool previous = signaled_;
  signaled_ = true;
  cv_.notify_all();
  return previous;
}

auto ThreadWakeEvent::is_terminated() const -> bool {
  std::lock_guard lock(mutex_);
  return terminated_;
}

auto ThreadWakeEvent::is_set() const -> bool {
  std::lock_guard lock(mutex_);
  return signaled_;
}

struct SharedWakeEvent::State {
  pthread_mutex_t mutex;
  pthread_cond_t cond;
  bool signaled;
  bool terminated;
};

// Robust mutex guard: a peer that died while holding the lock only ever
// left the two flags behind, so the state is always consistent.
class SharedWakeEvent::Lock {
public:
  explicit Lock(State* state) : state_(state) {
    if (pthread_mutex_lock(&state_->mutex) == EOWNERDEAD) {
      pthread_mutex_consistent(&state_->mutex);
    }
  }
  ~Lock() { pthread_mutex_unlock(&state_->mutex); }

  Lock(const Lock&) = delete;
  auto operator=(const Lock&) -> Lock& = delete;

private:
  State* state_;
};

namespace {

auto deadline_after(std::chrono::nanoseconds timeout) -> timespec {
  timespec now{};
  clock_gettime(CLOCK_MONOTONIC, &now);
  auto total = std::chrono::seconds(now.tv_sec) +
               std::chrono::nanoseconds(now.tv_nsec) + timeout;
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(total);
  timespec deadline{};
  deadline.tv_sec = static_cast<time_t>(secs.count());
  deadline.tv_nsec = static_cast<long>((total - secs).count());
  return deadline;
}

}  // namespace

SharedWakeEvent::SharedWakeEvent() : owner_(::getpid()) {
  void* mem = ::mmap(nullptr, sizeof(State), PROT_READ | PROT_WRITE,
                     MAP_SHARED | MAP_ANONYMOUS, -1, 0);
  if (mem == MAP_FAILED) {
    throw std::system_error(errno, std::generic_category(),
                            "mmap shared wake event");
  }
  state_ = static_cast<State*>(mem);
  state_->signaled = false;
  state_->terminated = false;

  pthread_mutexattr_t mattr;
  pthread_mutexattr_init(&mattr);
  pthread_mutexattr_setpshared(&mattr, PTHREAD_PROCESS_SHARED);
  pthread_mutexattr_setrobust(&mattr, PTHREAD_MUTEX_ROBUST);
  int rc = pthread_mutex_init(&state_->mutex, &mattr);
  pthread_mutexattr_destroy(&mattr);
  if (rc != 0) {
    ::munmap(state_, sizeof(State));
    throw std::system_error(rc, std::generic_category(),
                            "pthread_mutex_init");
  }

  pthread_condattr_t cattr;
  pthread_condattr_init(&cattr);
  pthread_condattr_setpshared(&cattr, PTHREAD_PROCESS_SHARED);
  pthread_condattr_setclock(&cattr, CLOCK_MONOTONIC);
  rc = pthread_cond_init(&state_->cond, &cattr);
  pthread_condattr_destroy(&cattr);
  if (rc != 0) {
    pthread_mutex_destroy(&state_->mutex);
    ::munmap(state_, sizeof(State));
    throw std::system_error(rc, std::generic_category(), "pthread_cond_init");
  }
}

SharedWakeEvent::~SharedWakeEvent() {
  if (state_ == nullptr) {
    return;
  }
  if (::getpid() == owner_) {
    pthread_cond_destroy(&state_->cond);
    pthread_mutex_destroy(&state_->mutex);
  }
  ::munmap(state_, sizeof(State));
}

auto SharedWakeEvent::set() -> void {
  Lock lock(state_);
  state_->signaled = true;
  pthread_cond_broadcast(&state_->cond);
}

auto SharedWakeEvent::clear() -> bool {
  Lock lock(state_);
  bool previous = state_->signaled;
  if (!state_->terminated) {
    state_->signaled = false;
  }
  return previous;
}

auto SharedWakeEvent::reset() -> void {
  Lock lock(state_);
  state_->signaled = false;
  state_->terminated = false;
}

auto SharedWakeEvent::wait_and_clear(Timeout timeout) -> bool {
  Lock lock(state_);
  if (state_->terminated) {
    return false;
  }

  if (!timeout) {
    while (!state_->signaled && !state_->terminated) {
      if (pthread_cond_wait(&state_->cond, &state_->mutex) == EOWNERDEAD) {
        pthread_mutex_consistent(&state_->mutex);
      }
    }
  } else if (timeout->count() > 0) {
    auto deadline = deadline_after(*timeout);
    while (!state_->signaled && !state_->terminated) {
      int rc = pthread_cond_timedwait(&state_->cond, &state_->mutex, &deadline);
      if (rc == EOWNERDEAD) {
        pthread_mutex_consistent(&state_->mutex);
      } else if (rc == ETIMEDOUT) {
        break;
      }
    }
  }

  if (state_->terminated) {
    return false;
  }
  bool previous = state_->signaled;
  state_->signaled = false;
  return previous;
}

auto SharedWakeEvent::terminate() -> bool {
  Lock lock(state_);
  state_->terminated = true;
  bool previous = state_->signaled;
  state_->signaled = true;
  pthread_cond_broadcast(&state_->cond);
  return previous;
}

auto SharedWakeEvent::is_terminated() const -> bool {
  Lock lock(state_);
  return state_->terminated;
}

auto SharedWakeEvent::is_set() const -> bool {
  Lock lock(state_);
  return state_->signaled;
}

auto make_wake_event(WakeEventKind kind) -> std::unique_ptr<WakeEvent> {
  switch (kind) {
    case WakeEventKind::Shared:
      return std::make_unique<SharedWakeEvent>();
    case WakeEventKind::Thread:
      break;
  }
  return std::make_unique<ThreadWakeEvent>();
}

}  // namespace rdaemon
