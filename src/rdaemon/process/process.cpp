#include "rdaemon/process/process.hpp"

#include "rdaemon/util/log.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <limits>
#include <format>
#include <print>
#include <sstream>
#include <unordered_set>
#include <vector>

#include <fcntl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <unistd.h>

namespace rdaemon::process {

namespace {

[[noreturn]] void die(std::string_view what) {
  std::println(stderr, "Daemon {} failed: {} ({})", what, errno,
               std::strerror(errno));
  _exit(1);
}

void fork_to_child() {
  std::fflush(nullptr);
  pid_t pid = ::fork();
  if (pid < 0) {
    die("fork");
  }
  if (pid > 0) {
    _exit(0);
  }
}

void close_all_file_descriptors() {
  // The descriptor of the log file is about to disappear.
  log::close_output();

  // Close what /proc/self/fd lists; the rlimit sweep is the fallback.
  std::vector<int> open_fds;
  std::error_code ec;
  for (auto it = std::filesystem::directory_iterator("/proc/self/fd", ec);
       !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    int fd = -1;
    auto name = it->path().filename().string();
    if (std::from_chars(name.data(), name.data() + name.size(), fd).ec ==
        std::errc{}) {
      open_fds.push_back(fd);
    }
  }

  if (ec || open_fds.empty()) {
    int limit = max_fd();
    for (int fd = 0; fd < limit; ++fd) {
      ::close(fd);
    }
  } else {
    for (int fd : open_fds) {
      ::close(fd);
    }
  }

  int null_fd = ::open(std::string(paths::kDevNull).c_str(), O_RDWR);
  if (null_fd < 0) {
    _exit(1);
  }
  if (null_fd != STDIN_FILENO) {
    ::dup2(null_fd, STDIN_FILENO);
    ::close(null_fd);
  }
  ::dup2(STDIN_FILENO, STDOUT_FILENO);
  ::dup2(STDIN_FILENO, STDERR_FILENO);
}

}  // namespace

auto pid_exists(pid_t pid) -> Result<bool> {
  if (pid <= 0) {
    return fail(Error::InvalidArgument);
  }
  if (::kill(pid, 0) == 0) {
    return ok(true);
  }
  if (errno == ESRCH) {
    return ok(false);
  }
  if (errno == EPERM) {
    return ok(true);
  }
  return fail_errno();
}

auto kill_process(pid_t pid, int sig) -> bool {
  if (pid <= 0) {
    return false;
  }
  if (::kill(pid, sig) != 0) {
    log::debug("kill({}, {}) failed: {}", pid, sig, std::strerror(errno));
    return false;
  }
  return true;
}

auto parse_tgid(std::string_view status) -> std::optional<pid_t> {
  std::size_t pos = 0;
  while (pos < status.size()) {
    auto eol = status.find('\n', pos);
    auto line = status.substr(pos, eol == std::string_view::npos
                                       ? std::string_view::npos
                                       : eol - pos);
    pos = eol == std::string_view::npos ? status.size() : eol + 1;

    auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      continue;
    }
    auto key = line.substr(0, colon);
    while (!key.empty() && (key.back() == ' ' || key.back() == '\t')) {
      key.remove_suffix(1);
    }
    if (key.size() != 4 ||
        !std::equal(key.begin(), key.end(), "tgid", [](char a, char b) {
          return std::tolower(static_cast<unsigned char>(a)) == b;
        })) {
      continue;
    }

    auto value = line.substr(colon + 1);
    auto first = value.find_first_not_of(" \t\f\v");
    if (first == std::string_view::npos) {
      return std::nullopt;
    }
    value.remove_prefix(first);

    pid_t tgid = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), tgid);
    if (ec != std::errc{} || tgid <= 0) {
      return std::nullopt;
    }
    return tgid;
  }
  return std::nullopt;
}

auto thread_group_leader(pid_t pid) -> pid_t {
  std::ifstream file(std::format("/proc/{}/status", pid));
  if (!file.is_open()) {
    return pid;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse_tgid(buffer.str()).value_or(pid);
}

auto kill_multiple_process(std::span<const pid_t> pids, int sig)
    -> std::size_t {
  std::unordered_set<pid_t> leaders;
  for (auto pid : pids) {
    if (pid > 0) {
      leaders.insert(thread_group_leader(pid));
    }
  }

  std::size_t signaled = 0;
  for (auto leader : leaders) {
    if (kill_process(leader, sig)) {
      ++signaled;
    }
  }
  return signaled;
}

auto max_fd() -> int {
  rlimit limit{};
  if (::getrlimit(RLIMIT_NOFILE, &limit) != 0 ||
      limit.rlim_max == RLIM_INFINITY) {
    return detach::kMaxFdFallback;
  }
  return static_cast<int>(
      std::min<rlim_t>(limit.rlim_max, std::numeric_limits<int>::max()));
}

auto convert_to_daemon(const DetachOptions& opts) -> void {
  fork_to_child();

  if (::chdir(opts.work_dir.c_str()) < 0) {
    die("chdir");
  }
  if (::setsid() < 0) {
    die("setsid");
  }
  ::umask(opts.umask);

  fork_to_child();
  close_all_file_descriptors();
}

}  // namespace rdaemon::process
