#include "rdaemon/bookkeeping/file_bookkeeping.hpp"

#include "rdaemon/util/log.hpp"

#include <charconv>
#include <fstream>
#include <sstream>

#include <unistd.h>

namespace rdaemon {

namespace fs = std::filesystem;

namespace {

auto remove_pid_file(const fs::path& path) -> void {
  std::error_code ec;
  if (!fs::remove(path, ec) && ec) {
    log::warn("Unable to remove PID file {}: {}", path.string(), ec.message());
  }
}

}  // namespace

FileBookkeeping::FileBookkeeping(fs::path root) {
  // The daemon changes its working directory while detaching.
  std::error_code ec;
  root_ = fs::absolute(root, ec);
  if (ec) {
    root_ = std::move(root);
  }
}

auto FileBookkeeping::pid_file(const DaemonKey& key) const -> fs::path {
  return root_ / key.sub_path() / (key.name() + std::string(paths::kPidFileExtension));
}

auto FileBookkeeping::locator(const DaemonKey& key) const -> std::string {
  return pid_file(key).string();
}

auto FileBookkeeping::read_pid_file(const fs::path& path) -> Result<pid_t> {
  std::ifstream file(path);
  if (!file.is_open()) {
    return fail(Error::NotActive);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  std::string content = buffer.str();

  auto first = content.find_first_not_of(" \t\r\n");
  auto last = content.find_last_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return fail(Error::NotActive);
  }

  pid_t pid = 0;
  const char* begin = content.data() + first;
  const char* end = content.data() + last + 1;
  auto [ptr, ec] = std::from_chars(begin, end, pid);
  if (ec != std::errc{} || ptr != end || pid <= 0) {
    return fail(Error::NotActive);
  }
  return pid;
}

auto FileBookkeeping::write_pid_file(const fs::path& path, pid_t pid)
    -> Result<void> {
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec) {
    return fail(ec);
  }

  std::ofstream file(path, std::ios::trunc);
  if (!file.is_open()) {
    return fail(Error::FileOpenFailed);
  }
  file << pid << '\n';
  file.flush();
  if (!file) {
    return fail(Error::FileWriteFailed);
  }
  return ok();
}

auto FileBookkeeping::daemonize(const DaemonKey& key,
                                const process::DetachOptions& detach)
    -> Result<void> {
  auto path = pid_file(key);
  process::convert_to_daemon(detach);

  if (auto r = write_pid_file(path, ::getpid()); !r) {
    log::error("Daemon failed to write PID file {}: {}", path.string(),
               r.error().message());
    return r;
  }
  log::debug("Daemon {} recorded in {}", key.name(), path.string());
  return ok();
}

auto FileBookkeeping::release(const DaemonKey& key) -> void {
  remove_pid_file(pid_file(key));
}

auto FileBookkeeping::get_pid(const DaemonKey& key) -> Result<pid_t> {
  return read_pid_file(pid_file(key));
}

auto FileBookkeeping::get_pids(const DaemonKey& key)
    -> Result<std::vector<pid_t>> {
  auto pid = get_pid(key);
  if (!pid) {
    return fail(pid.error());
  }
  return std::vector<pid_t>{*pid};
}

auto FileBookkeeping::is_running(const DaemonKey& key) -> bool {
  auto path = pid_file(key);
  auto pid = read_pid_file(path);
  if (!pid) {
    return false;
  }

  auto exists = process::pid_exists(*pid);
  if (!exists) {
    log::warn("Liveness probe of {} failed: {}", *pid, exists.error().message());
    return false;
  }
  if (!*exists) {
    log::debug("Removing stale PID file {} (pid {})", path.string(), *pid);
    remove_pid_file(path);
  }
  return *exists;
}

auto FileBookkeeping::kill_pid_file(const fs::path& path, int sig) -> bool {
  auto pid = read_pid_file(path);
  if (!pid) {
    return false;
  }
  bool success = process::kill_process(*pid, sig);
  if (success && sig == kConfirmSignal) {
    remove_pid_file(path);
  }
  return success;
}

auto FileBookkeeping::kill(const DaemonKey& key, int sig) -> bool {
  return kill_pid_file(pid_file(key), sig);
}

auto FileBookkeeping::kill_all(std::string_view sub_path, int sig) -> void {
  if (!validate_sub_path(sub_path)) {
    log::error("Invalid daemon group: {}", sub_path);
    return;
  }

  std::error_code ec;
  auto folder = root_ / sub_path;
  std::vector<fs::path> files;
  for (auto it = fs::directory_iterator(folder, ec);
       !ec && it != fs::directory_iterator(); it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_regular_file(type_ec)) {
      files.push_back(it->path());
    }
  }

  for (const auto& file : files) {
    if (!kill_pid_file(file, sig)) {
      log::debug("Skipping {}: not signaled", file.string());
    }
  }
}

auto FileBookkeeping::clear_empty(std::string_view sub_path) -> void {
  if (!validate_sub_path(sub_path)) {
    return;
  }

  std::error_code ec;
  auto folder = (root_ / sub_path).lexically_normal();
  auto stop = root_.parent_path();
  while (!folder.empty() && folder != stop && folder != folder.root_path()) {
    if (!fs::is_directory(folder, ec) || !fs::is_empty(folder, ec) ||
        !fs::remove(folder, ec)) {
      return;
    }
    folder = folder.parent_path();
  }
}

auto FileBookkeeping::list(std::string_view sub_path) -> std::vector<DaemonKey> {
  std::vector<DaemonKey> keys;
  if (!validate_sub_path(sub_path)) {
    return keys;
  }

  std::error_code ec;
  auto folder = root_ / sub_path;
  for (auto it = fs::recursive_directory_iterator(folder, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec) ||
        it->path().extension().string() != paths::kPidFileExtension) {
      continue;
    }
    auto group = it->path().parent_path().lexically_relative(root_).string();
    if (group == ".") {
      group.clear();
    }
    if (auto key = DaemonKey::make(it->path().stem().string(), group)) {
      keys.push_back(std::move(*key));
    }
  }
  return keys;
}

}  // namespace rdaemon
