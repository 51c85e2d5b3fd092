#include "rdaemon/daemon/tasks.hpp"

#include "rdaemon/process/process.hpp"
#include "rdaemon/util/log.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <sys/wait.h>
#include <unistd.h>

namespace rdaemon {

namespace {

[[nodiscard]] auto decode_status(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

}  // namespace

CommandTask::CommandTask(std::vector<std::string> argv,
                         std::chrono::milliseconds stop_grace)
    : argv_(std::move(argv)), stop_grace_(stop_grace) {
  if (argv_.empty()) {
    throw std::invalid_argument("CommandTask requires a command");
  }
}

CommandTask::~CommandTask() {
  stop_child();
}

auto CommandTask::setup() -> void {
  finished_ = false;
  exit_status_.reset();

  std::vector<char*> args;
  args.reserve(argv_.size() + 1);
  for (auto& arg : argv_) {
    args.push_back(arg.data());
  }
  args.push_back(nullptr);

  std::fflush(nullptr);
  pid_t pid = ::fork();
  if (pid < 0) {
    throw std::system_error(errno, std::generic_category(),
                            "fork failed for " + argv_.front());
  }
  if (pid == 0) {
    ::execvp(args[0], args.data());
    std::fprintf(stderr, "exec %s failed: %s\n", args[0], std::strerror(errno));
    ::_exit(127);
  }

  pid_ = pid;
  log::info("Started command {} (pid {})", argv_.front(), pid_);
}

auto CommandTask::reap(int flags) -> bool {
  if (pid_ <= 0) {
    return true;
  }

  int status = 0;
  pid_t r = ::waitpid(pid_, &status, flags);
  if (r == 0) {
    return false;
  }
  if (r < 0) {
    if (errno == EINTR) {
      return false;
    }
    log::warn("waitpid({}) failed: {}", pid_, std::strerror(errno));
  } else {
    exit_status_ = decode_status(status);
    log::info("Command {} (pid {}) exited with status {}", argv_.front(), pid_,
              *exit_status_);
  }
  pid_ = -1;
  return true;
}

auto CommandTask::periodic_task(bool is_scheduled_wakeup) -> void {
  static_cast<void>(is_scheduled_wakeup);
  if (reap(WNOHANG)) {
    finished_ = true;
  }
}

auto CommandTask::stop_child() -> void {
  if (pid_ <= 0 || reap(WNOHANG)) {
    return;
  }

  log::info("Stopping command {} (pid {})", argv_.front(), pid_);
  if (!process::kill_process(pid_, SIGTERM)) {
    log::warn("Unable to signal pid {}: {}", pid_, std::strerror(errno));
  }

  auto deadline = std::chrono::steady_clock::now() + stop_grace_;
  while (std::chrono::steady_clock::now() < deadline) {
    if (reap(WNOHANG)) {
      return;
    }
    std::this_thread::sleep_for(timing::kShutdownPollInterval);
  }

  log::warn("Command {} (pid {}) ignored SIGTERM, killing", argv_.front(),
            pid_);
  static_cast<void>(process::kill_process(pid_, SIGKILL));
  while (!reap(0)) {
  }
}

auto CommandTask::teardown() -> void {
  stop_child();
  finished_ = true;
}

IsAliveChecker::IsAliveChecker(pid_t pid, DeadCallback on_dead)
    : pid_(pid), on_dead_(std::move(on_dead)) {}

IsAliveChecker::IsAliveChecker(Bookkeeping& bookkeeping, DaemonKey key,
                               DeadCallback on_dead)
    : bookkeeping_(&bookkeeping),
      key_(std::move(key)),
      on_dead_(std::move(on_dead)) {}

auto IsAliveChecker::setup() -> void {
  finished_ = false;
  if (bookkeeping_ == nullptr || pid_) {
    finished_ = !is_alive();
    return;
  }

  auto pids = bookkeeping_->get_pids(*key_);
  if (!pids || pids->empty()) {
    log::warn("Daemon {} is not running", key_->name());
    finished_ = true;
    return;
  }
  pid_ = pids->front();
  log::info("Watching daemon {} (pid {})", key_->name(), *pid_);
}

auto IsAliveChecker::is_alive() -> bool {
  if (bookkeeping_ != nullptr) {
    return bookkeeping_->is_running(*key_);
  }
  auto exists = process::pid_exists(*pid_);
  return exists && *exists;
}

auto IsAliveChecker::periodic_task(bool is_scheduled_wakeup) -> void {
  static_cast<void>(is_scheduled_wakeup);
  finished_ = !is_alive();
}

auto IsAliveChecker::teardown() -> void {
  if (!finished_) {
    return;
  }
  if (key_) {
    log::info("Daemon {} is dead", key_->name());
  } else {
    log::info("Process {} is dead", pid_.value_or(-1));
  }
  if (on_dead_) {
    on_dead_();
  }
}

}  // namespace rdaemon
