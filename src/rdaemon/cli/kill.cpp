#include "rdaemon/cli/commands.hpp"

#include <csignal>
#include <print>

namespace rdaemon::cli {

auto cmd_kill(const KillOptions& opts) -> int {
  auto key = DaemonKey::make(opts.name, opts.scope.group);
  if (!key) {
    std::println(stderr, "Error: invalid daemon name '{}' or group '{}'",
                 opts.name, opts.scope.group);
    return 1;
  }

  auto bookkeeping = make_bookkeeping(opts.scope.bookkeeping);
  int sig = opts.force ? kConfirmSignal : SIGTERM;
  if (!bookkeeping->kill(*key, sig)) {
    std::println(stderr, "{}: not running", opts.name);
    return 1;
  }
  std::println("{}: sent {}", opts.name, opts.force ? "SIGKILL" : "SIGTERM");
  return 0;
}

auto cmd_kill_all(const KillAllOptions& opts) -> int {
  if (!validate_sub_path(opts.scope.group)) {
    std::println(stderr, "Error: invalid group '{}'", opts.scope.group);
    return 1;
  }

  auto bookkeeping = make_bookkeeping(opts.scope.bookkeeping);
  auto count = bookkeeping->list(opts.scope.group).size();
  bookkeeping->kill_all(opts.scope.group, opts.force ? kConfirmSignal : SIGTERM);
  std::println("Signaled {} daemon(s) in group '{}'", count, opts.scope.group);
  return 0;
}

auto cmd_clear(const ClearOptions& opts) -> int {
  if (!validate_sub_path(opts.scope.group)) {
    std::println(stderr, "Error: invalid group '{}'", opts.scope.group);
    return 1;
  }

  auto bookkeeping = make_bookkeeping(opts.scope.bookkeeping);
  bookkeeping->clear_empty(opts.scope.group);
  return 0;
}

}  // namespace rdaemon::cli
