#include "rdaemon/supervisor/launch.hpp"

#include "rdaemon/supervisor/supervision_context.hpp"
#include "rdaemon/supervisor/supervisor.hpp"
#include "rdaemon/util/log.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <exception>
#include <filesystem>
#include <format>
#include <thread>

#include <sys/wait.h>
#include <unistd.h>

namespace rdaemon {

namespace {

[[nodiscard]] auto supervise_detached(const LaunchOptions& options,
                                      const DaemonKey& key,
                                      const DaemonTarget& target) -> int {
  auto bookkeeping = make_bookkeeping(options.bookkeeping);
  SupervisionContext context;

  if (auto r = DaemonSupervisor::daemonize(context, *bookkeeping, key,
                                           options.detach);
      !r) {
    std::fprintf(stderr, "Failed to daemonize %s: %s\n", key.name().c_str(),
                 r.error().message().c_str());
    return 1;
  }

  if (!init_daemon_logging(options.log, key.name())) {
    std::fprintf(stderr, "Failed to initiate logger for daemon %s\n",
                 key.name().c_str());
    return 1;
  }
  log::info("Daemon {} started (pid {})", key.name(), ::getpid());

  auto daemon = target();
  if (!daemon) {
    log::error("Daemon {}: target built no daemon", key.name());
    return 1;
  }

  DaemonSupervisor supervisor(context, key.name(), std::move(daemon));
  return supervisor.supervise();
}

}  // namespace

auto init_daemon_logging(const LogOptions& options, std::string_view name)
    -> bool {
  log::set_level(options.level);
  auto path = std::filesystem::path(options.output_path) /
              std::format("{}.log", name);
  if (!log::set_output_file(path, options.max_bytes, options.backups)) {
    return false;
  }
  log::start();
  return true;
}

auto run_as_daemon(const LaunchOptions& options, const DaemonKey& key,
                   const DaemonTarget& target) -> void {
  int exit_code = 1;
  try {
    exit_code = supervise_detached(options, key, target);
  } catch (const std::exception& e) {
    log::error("Daemon {} exited with an error: {}", key.name(), e.what());
  }

  log::stop();
  log::close_output();
  std::fflush(nullptr);
  ::_exit(exit_code);
}

auto launch_daemon(const LaunchOptions& options, DaemonTarget target)
    -> Result<void> {
  auto key = DaemonKey::make(options.name, options.group);
  if (!key) {
    log::error("Invalid daemon name {} or group {}", options.name,
               options.group);
    return fail(key.error());
  }
  if (!target) {
    return fail(Error::InvalidArgument);
  }

  std::fflush(nullptr);
  pid_t launcher = ::fork();
  if (launcher < 0) {
    log::error("Failed to fork daemon launcher for {}: {}", options.name,
               std::strerror(errno));
    return fail_errno();
  }
  if (launcher == 0) {
    run_as_daemon(options, *key, target);
  }

  log::debug("Daemon launcher for {} is pid {}", options.name, launcher);
  auto deadline = std::chrono::steady_clock::now() + options.launcher_timeout;
  while (true) {
    int status = 0;
    pid_t r = ::waitpid(launcher, &status, WNOHANG);
    if (r == launcher) {
      if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        return ok();
      }
      log::error("Daemon launcher for {} failed (status {})", options.name,
                 status);
      return fail(Error::LaunchFailed);
    }
    if (r < 0 && errno != EINTR) {
      log::error("waitpid on daemon launcher failed: {}", std::strerror(errno));
      return fail_errno();
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      break;
    }
    std::this_thread::sleep_for(timing::kShutdownPollInterval);
  }

  log::error("Daemon launcher for {} did not finish within {}ms", options.name,
             options.launcher_timeout.count());
  static_cast<void>(process::kill_process(launcher, SIGKILL));
  ::waitpid(launcher, nullptr, 0);
  return fail(Error::Timeout);
}

}  // namespace rdaemon
