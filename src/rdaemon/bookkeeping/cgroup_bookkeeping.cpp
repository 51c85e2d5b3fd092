#include "rdaemon/bookkeeping/cgroup_bookkeeping.hpp"

#include "rdaemon/util/log.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <thread>

#include <linux/magic.h>
#include <sys/statfs.h>
#include <unistd.h>

namespace rdaemon {

namespace fs = std::filesystem;

CgroupBookkeeping::CgroupBookkeeping(fs::path mount, std::string root)
    : mount_(std::move(mount)), root_(std::move(root)) {}

auto CgroupBookkeeping::is_available(const fs::path& mount) -> bool {
  struct statfs info {};
  if (::statfs(mount.c_str(), &info) != 0) {
    return false;
  }
  if (info.f_type != CGROUP2_SUPER_MAGIC) {
    return false;
  }
  return ::access(mount.c_str(), W_OK) == 0;
}

auto CgroupBookkeeping::parse_pid_list(std::string_view text)
    -> std::vector<pid_t> {
  std::vector<pid_t> pids;
  const char* cur = text.data();
  const char* end = text.data() + text.size();
  while (cur < end) {
    while (cur < end && (*cur == '\n' || *cur == ' ' || *cur == '\t')) {
      ++cur;
    }
    if (cur == end) {
      break;
    }
    pid_t pid = 0;
    auto [ptr, ec] = std::from_chars(cur, end, pid);
    if (ec != std::errc{}) {
      // Skip an unparsable token.
      while (cur < end && *cur != '\n') {
        ++cur;
      }
      continue;
    }
    if (pid > 0) {
      pids.push_back(pid);
    }
    cur = ptr;
  }
  return pids;
}

auto CgroupBookkeeping::group_path(const DaemonKey& key) const -> std::string {
  return (fs::path(root_) / key.sub_path() / key.name())
      .lexically_normal()
      .string();
}

auto CgroupBookkeeping::group_dir(const DaemonKey& key) const -> fs::path {
  return mount_ / group_path(key);
}

auto CgroupBookkeeping::base_dir(std::string_view sub_path) const -> fs::path {
  return (mount_ / root_ / sub_path).lexically_normal();
}

auto CgroupBookkeeping::locator(const DaemonKey& key) const -> std::string {
  return group_path(key);
}

auto CgroupBookkeeping::read_procs(const fs::path& dir)
    -> Result<std::vector<pid_t>> {
  std::ifstream file(dir / paths::kCgroupProcs);
  if (!file.is_open()) {
    return fail(Error::NotActive);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse_pid_list(buffer.str());
}

auto CgroupBookkeeping::hierarchy_procs(const fs::path& dir)
    -> std::vector<pid_t> {
  std::vector<pid_t> pids;
  if (auto procs = read_procs(dir)) {
    pids = std::move(*procs);
  }

  std::error_code ec;
  for (auto it = fs::recursive_directory_iterator(dir, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    std::error_code type_ec;
    if (!it->is_directory(type_ec)) {
      continue;
    }
    if (auto procs = read_procs(it->path())) {
      pids.insert(pids.end(), procs->begin(), procs->end());
    }
  }
  return pids;
}

auto CgroupBookkeeping::add_process(const fs::path& dir, pid_t pid)
    -> Result<void> {
  std::ofstream file(dir / paths::kCgroupProcs);
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

auto CgroupBookkeeping::wait_drained(const fs::path& dir,
                                     std::chrono::milliseconds timeout)
    -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!hierarchy_procs(dir).empty()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(timing::kShutdownPollInterval);
  }
  return true;
}

// Interface files of a cgroup cannot be unlinked; rmdir removes the group
// once it has no members and no children.
auto CgroupBookkeeping::delete_group(const fs::path& dir, bool recursive)
    -> bool {
  if (recursive) {
    std::vector<fs::path> children;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(dir, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
      std::error_code type_ec;
      if (it->is_directory(type_ec)) {
        children.push_back(it->path());
      }
    }
    // Deepest first.
    std::ranges::sort(children, [](const fs::path& a, const fs::path& b) {
      return std::distance(a.begin(), a.end()) > std::distance(b.begin(), b.end());
    });
    for (const auto& child : children) {
      if (::rmdir(child.c_str()) != 0 && errno != ENOENT) {
        log::debug("Unable to remove cgroup {}: {}", child.string(),
                   std::strerror(errno));
      }
    }
  }

  if (::rmdir(dir.c_str()) != 0 && errno != ENOENT) {
    log::debug("Unable to remove cgroup {}: {}", dir.string(),
               std::strerror(errno));
    return false;
  }
  return true;
}

auto CgroupBookkeeping::daemonize(const DaemonKey& key,
                                  const process::DetachOptions& detach)
    -> Result<void> {
  auto dir = group_dir(key);
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    log::error("Unable to create cgroup {}: {}", dir.string(), ec.message());
    return fail(ec);
  }

  // Membership is inherited across fork, so the detached grandchild and
  // everything it spawns land in the same group.
  if (auto r = add_process(dir, ::getpid()); !r) {
    log::error("Unable to join cgroup {}: {}", dir.string(), r.error().message());
    delete_group(dir, false);
    return r;
  }

  process::convert_to_daemon(detach);
  log::debug("Daemon {} recorded in cgroup {}", key.name(), group_path(key));
  return ok();
}

auto CgroupBookkeeping::release(const DaemonKey& key) -> void {
  auto dir = group_dir(key);
  for (auto pid : hierarchy_procs(dir)) {
    if (!add_process(mount_, pid)) {
      log::warn("Unable to move pid {} out of cgroup {}", pid, dir.string());
    }
  }
  if (!delete_group(dir, true)) {
    log::warn("Unable to remove cgroup {}", dir.string());
  }
}

auto CgroupBookkeeping::get_pids(const DaemonKey& key)
    -> Result<std::vector<pid_t>> {
  auto dir = group_dir(key);
  auto procs = read_procs(dir);
  if (!procs) {
    return fail(procs.error());
  }
  if (procs->empty()) {
    delete_group(dir, true);
    return fail(Error::NotActive);
  }
  return procs;
}

auto CgroupBookkeeping::is_running(const DaemonKey& key) -> bool {
  auto pids = get_pids(key);
  return pids && !pids->empty();
}

auto CgroupBookkeeping::kill(const DaemonKey& key, int sig) -> bool {
  auto pids = get_pids(key);
  if (!pids) {
    return false;
  }

  auto signaled = process::kill_multiple_process(*pids, sig);
  if (sig == kConfirmSignal) {
    auto dir = group_dir(key);
    wait_drained(dir, timing::kGroupDrainTimeout);
    delete_group(dir, true);
  }
  return signaled > 0;
}

auto CgroupBookkeeping::kill_all(std::string_view sub_path, int sig) -> void {
  if (!validate_sub_path(sub_path)) {
    log::error("Invalid daemon group: {}", sub_path);
    return;
  }

  auto dir = base_dir(sub_path);
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return;
  }

  auto pids = hierarchy_procs(dir);
  process::kill_multiple_process(pids, sig);

  if (sig == kConfirmSignal) {
    wait_drained(dir, timing::kGroupDrainTimeout);
    delete_group(dir, true);
  }
}

auto CgroupBookkeeping::clear_empty(std::string_view sub_path) -> void {
  if (!validate_sub_path(sub_path)) {
    return;
  }
  delete_group(base_dir(sub_path), false);
}

auto CgroupBookkeeping::list(std::string_view sub_path)
    -> std::vector<DaemonKey> {
  std::vector<DaemonKey> keys;
  if (!validate_sub_path(sub_path)) {
    return keys;
  }

  auto base = base_dir(sub_path);
  auto root = (mount_ / root_).lexically_normal();
  std::error_code ec;
  for (auto it = fs::recursive_directory_iterator(base, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    std::error_code type_ec;
    if (!it->is_directory(type_ec)) {
      continue;
    }

    // A group with members is a daemon even when groups are nested under
    // it. An empty inner group only holds other groups.
    auto procs = read_procs(it->path());
    bool has_members = procs && !procs->empty();
    bool leaf = true;
    for (auto child = fs::directory_iterator(it->path(), type_ec);
         !has_members && !type_ec && child != fs::directory_iterator();
         child.increment(type_ec)) {
      std::error_code child_ec;
      if (child->is_directory(child_ec)) {
        leaf = false;
        break;
      }
    }
    if (!has_members && !leaf) {
      continue;
    }

    auto group = it->path().parent_path().lexically_relative(root).string();
    if (group == ".") {
      group.clear();
    }
    if (auto key = DaemonKey::make(it->path().filename().string(), group)) {
      keys.push_back(std::move(*key));
    }
  }
  return keys;
}

}  // namespace rdaemon
