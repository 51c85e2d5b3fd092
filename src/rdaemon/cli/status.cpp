#include "rdaemon/cli/commands.hpp"

#include <format>
#include <print>
#include <string>

namespace rdaemon::cli {

namespace {

auto join_pids(const std::vector<pid_t>& pids) -> std::string {
  std::string out;
  for (auto pid : pids) {
    if (!out.empty()) {
      out += ' ';
    }
    out += std::to_string(pid);
  }
  return out;
}

}  // namespace

auto cmd_status(const StatusOptions& opts) -> int {
  auto key = DaemonKey::make(opts.name, opts.scope.group);
  if (!key) {
    std::println(stderr, "Error: invalid daemon name '{}' or group '{}'",
                 opts.name, opts.scope.group);
    return 1;
  }

  auto bookkeeping = make_bookkeeping(opts.scope.bookkeeping);
  if (!bookkeeping->is_running(*key)) {
    std::println("{}: not running", opts.name);
    return kExitNotRunning;
  }

  auto pids = bookkeeping->get_pids(*key);
  std::println("{}: running", opts.name);
  std::println("Record:  {}", bookkeeping->locator(*key));
  if (pids) {
    std::println("PIDs:    {}", join_pids(*pids));
  }
  return 0;
}

auto cmd_list(const ListOptions& opts) -> int {
  if (!validate_sub_path(opts.scope.group)) {
    std::println(stderr, "Error: invalid group '{}'", opts.scope.group);
    return 1;
  }

  auto bookkeeping = make_bookkeeping(opts.scope.bookkeeping);
  auto keys = bookkeeping->list(opts.scope.group);
  if (keys.empty()) {
    std::println("No daemons found.");
    return 0;
  }

  std::println("{:<24} {:<20} {:<12} {:<20}", "NAME", "GROUP", "STATE", "PIDS");
  for (const auto& key : keys) {
    bool running = bookkeeping->is_running(key);
    std::string pids = "-";
    if (running) {
      if (auto r = bookkeeping->get_pids(key)) {
        pids = join_pids(*r);
      }
    }
    std::println("{:<24} {:<20} {:<12} {:<20}", key.name(),
                 key.sub_path().empty() ? "-" : key.sub_path(),
                 running ? "running" : "dead", pids);
  }
  return 0;
}

}  // namespace rdaemon::cli
