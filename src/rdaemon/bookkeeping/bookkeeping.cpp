#include "rdaemon/bookkeeping/bookkeeping.hpp"

#include "rdaemon/bookkeeping/cgroup_bookkeeping.hpp"
#include "rdaemon/bookkeeping/file_bookkeeping.hpp"

#include <filesystem>
#include <thread>

namespace rdaemon {

auto validate_sub_path(std::string_view sub_path) -> Result<void> {
  std::filesystem::path path{sub_path};
  if (path.is_absolute()) {
    return fail(Error::InvalidArgument);
  }
  for (const auto& part : path) {
    if (part == "..") {
      return fail(Error::InvalidArgument);
    }
  }
  return ok();
}

auto DaemonKey::make(std::string name, std::string sub_path)
    -> Result<DaemonKey> {
  if (name.empty() || name == "." || name == ".." ||
      name.find('/') != std::string::npos) {
    return fail(Error::InvalidArgument);
  }
  if (auto r = validate_sub_path(sub_path); !r) {
    return fail(r.error());
  }
  return DaemonKey{std::move(name), std::move(sub_path)};
}

auto make_bookkeeping(const BookkeepingOptions& options)
    -> std::unique_ptr<Bookkeeping> {
  switch (options.method) {
    case BookkeepingMethod::Cgroup:
      return std::make_unique<CgroupBookkeeping>(options.cgroup_mount,
                                                 options.cgroup_root);
    case BookkeepingMethod::File:
      break;
  }
  return std::make_unique<FileBookkeeping>(options.pid_root);
}

auto wait_until_running(Bookkeeping& bookkeeping, const DaemonKey& key,
                        std::chrono::milliseconds timeout) -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    if (bookkeeping.is_running(key)) {
      return true;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(timing::kDaemonPollInterval);
  }
}

}  // namespace rdaemon
