#include "rdaemon/cli/commands.hpp"
#include "rdaemon/config/config.hpp"
#include "rdaemon/util/log.hpp"

#include <cstdlib>
#include <format>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage(const char* prog) {
  std::println("rdaemonctl - launch and manage supervised daemons");
  std::println("Usage: {} [OPTIONS] <COMMAND> [ARGS]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  launch <name> -- <cmd> [args...]  Daemonize a command");
  std::println("  status <name>                     Show whether a daemon runs");
  std::println("  kill <name> [--force]             Stop a daemon");
  std::println("  kill-all [--force]                Stop every daemon in the group");
  std::println("  list                              List tracked daemons");
  std::println("  clear                             Remove the group if empty");
  std::println("  watch <name> [--period <sec>]     Wait until a daemon dies");
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>       Config file (YAML)");
  std::println("  --bookkeeping <method>    file or cgroup (default: file)");
  std::println("  --root <dir>              PID file root or cgroup root");
  std::println("  -g, --group <path>        Daemon group (sub path)");
  std::println("  -v, --version             Show version and exit");
  std::println("  -h, --help                Show this help message");
  std::println("");
  std::println("Examples:");
  std::println("  {} launch worker-1 -- sleep 100", prog);
  std::println("  {} -g batch kill-all --force", prog);
}

void print_version() {
  std::println("rdaemonctl v0.1.0");
}

[[noreturn]] void usage_error(const char* prog, std::string_view message) {
  std::println(stderr, "Error: {}", message);
  print_usage(prog);
  std::exit(1);
}

struct Options {
  std::string config_file;
  std::optional<rdaemon::BookkeepingMethod> method;
  std::optional<std::string> root;
  std::optional<std::string> group;
  std::string command;
  std::string name;
  std::vector<std::string> argv;
  std::optional<double> period_sec;
  bool force{false};
};

auto require_value(int& i, int argc, char* argv[], std::string_view flag)
    -> std::string {
  if (++i >= argc) {
    std::println(stderr, "Error: {} requires an argument", flag);
    std::exit(1);
  }
  return argv[i];
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (!opts.command.empty() && arg == "--") {
      for (++i; i < argc; ++i) {
        opts.argv.emplace_back(argv[i]);
      }
      break;
    }

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      opts.config_file = require_value(i, argc, argv, arg);
    } else if (arg == "--bookkeeping") {
      auto value = require_value(i, argc, argv, arg);
      opts.method = rdaemon::parse_bookkeeping_method(value);
      if (!opts.method) {
        usage_error(argv[0], "--bookkeeping must be 'file' or 'cgroup'");
      }
    } else if (arg == "--root") {
      opts.root = require_value(i, argc, argv, arg);
    } else if (arg == "-g" || arg == "--group") {
      opts.group = require_value(i, argc, argv, arg);
    } else if (arg == "--force" || arg == "-f") {
      opts.force = true;
    } else if (arg == "--period") {
      auto value = require_value(i, argc, argv, arg);
      char* end = nullptr;
      double period = std::strtod(value.c_str(), &end);
      if (end == value.c_str() || *end != '\0' || period <= 0) {
        usage_error(argv[0], "--period must be a positive number of seconds");
      }
      opts.period_sec = period;
    } else if (arg.starts_with("-")) {
      usage_error(argv[0], std::format("unknown option: {}", arg));
    } else if (opts.command.empty()) {
      opts.command = arg;
    } else if (opts.name.empty()) {
      opts.name = arg;
    } else {
      usage_error(argv[0], std::format("unexpected argument: {}", arg));
    }
  }

  if (opts.command.empty()) {
    usage_error(argv[0], "missing command");
  }
  return opts;
}

auto load_config(const Options& opts) -> std::optional<rdaemon::SystemConfig> {
  rdaemon::SystemConfig config;
  if (!opts.config_file.empty()) {
    auto result = rdaemon::ConfigLoader::load_from_file(opts.config_file);
    if (!result) {
      std::println(stderr, "Error: Failed to load config: {}",
                   result.error().message());
      return std::nullopt;
    }
    config = std::move(*result);
  }

  auto& bookkeeping = config.bookkeeping;
  if (opts.method) {
    bookkeeping.method = *opts.method;
  }
  if (opts.root) {
    if (bookkeeping.method == rdaemon::BookkeepingMethod::Cgroup) {
      bookkeeping.cgroup_root = *opts.root;
    } else {
      bookkeeping.pid_root = *opts.root;
    }
  }
  if (opts.group) {
    config.daemon.group = *opts.group;
  }
  if (!opts.name.empty()) {
    config.daemon.name = opts.name;
  }
  return config;
}

auto require_name(const Options& opts, const char* prog) -> void {
  if (opts.name.empty()) {
    usage_error(prog, std::format("{} requires a daemon name", opts.command));
  }
}

auto dispatch(const Options& opts, const rdaemon::SystemConfig& config,
              const char* prog) -> int {
  namespace cli = rdaemon::cli;
  cli::Scope scope{config.bookkeeping, config.daemon.group};

  if (opts.command == "launch") {
    if (config.daemon.name.empty()) {
      usage_error(prog, "launch requires a daemon name");
    }
    return cli::cmd_launch(cli::LaunchOptions{config, opts.argv});
  }
  if (opts.command == "status") {
    require_name(opts, prog);
    return cli::cmd_status(cli::StatusOptions{scope, opts.name});
  }
  if (opts.command == "kill") {
    require_name(opts, prog);
    return cli::cmd_kill(cli::KillOptions{scope, opts.name, opts.force});
  }
  if (opts.command == "kill-all") {
    return cli::cmd_kill_all(cli::KillAllOptions{scope, opts.force});
  }
  if (opts.command == "list") {
    return cli::cmd_list(cli::ListOptions{scope});
  }
  if (opts.command == "clear") {
    return cli::cmd_clear(cli::ClearOptions{scope});
  }
  if (opts.command == "watch") {
    require_name(opts, prog);
    return cli::cmd_watch(cli::WatchOptions{
        scope, opts.name,
        opts.period_sec.value_or(config.daemon.wakeup_period_sec)});
  }

  usage_error(prog, std::format("unknown command: {}", opts.command));
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);

  auto config = load_config(opts);
  if (!config) {
    return 1;
  }

  rdaemon::log::set_level(config->logging.level);
  rdaemon::log::start();
  int code = dispatch(opts, *config, argv[0]);
  rdaemon::log::stop();
  return code;
}
