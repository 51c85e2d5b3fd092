#include "rdaemon/config/config.hpp"

#include "rdaemon/config/yaml_utils.hpp"
#include "rdaemon/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdint>
#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<rdaemon::LogOptions> {
  static bool decode(const Node& node, rdaemon::LogOptions& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = rdaemon::yaml_get_or<std::string>(node, "level", "info");
    l.output_path = rdaemon::yaml_get_or<std::string>(
        node, "output_path", std::string(rdaemon::paths::kDefaultLogPath));
    l.max_bytes = rdaemon::yaml_get_or<std::uintmax_t>(node, "max_bytes", 0);
    l.backups = rdaemon::yaml_get_or(node, "backups", 0);
    if (l.backups < 0) {
      throw rdaemon::ConfigValueError("'backups' must not be negative");
    }
    return true;
  }
};

template <>
struct convert<rdaemon::BookkeepingOptions> {
  static bool decode(const Node& node, rdaemon::BookkeepingOptions& b) {
    if (!node.IsMap()) {
      return false;
    }
    b.method = rdaemon::yaml_get_enum_or(node, "method",
                                         rdaemon::BookkeepingMethod::File,
                                         rdaemon::parse_bookkeeping_method);
    b.pid_root = rdaemon::yaml_get_or<std::string>(
        node, "pid_root", std::string(rdaemon::paths::kDefaultPidRoot));
    b.cgroup_mount = rdaemon::yaml_get_or<std::string>(
        node, "cgroup_mount", std::string(rdaemon::paths::kDefaultCgroupMount));
    b.cgroup_root = rdaemon::yaml_get_or<std::string>(
        node, "cgroup_root", std::string(rdaemon::paths::kDefaultCgroupRoot));
    return true;
  }
};

template <>
struct convert<rdaemon::DaemonConfig> {
  static bool decode(const Node& node, rdaemon::DaemonConfig& d) {
    if (!node.IsMap()) {
      return false;
    }
    d.name = rdaemon::yaml_get_or<std::string>(node, "name", "");
    d.group = rdaemon::yaml_get_or<std::string>(node, "group", "");
    d.wakeup_period_sec = rdaemon::yaml_get_or(node, "wakeup_period_sec", 1.0);
    d.event = rdaemon::yaml_get_enum_or(node, "event",
                                        rdaemon::WakeEventKind::Thread,
                                        rdaemon::parse_wake_event_kind);
    d.launcher_timeout_sec = rdaemon::yaml_get_or(
        node, "launcher_timeout_sec",
        static_cast<int>(rdaemon::timing::kDefaultLauncherTimeout.count()));
    d.command = rdaemon::yaml_get_or<std::vector<std::string>>(node, "command", {});
    if (!std::isfinite(d.wakeup_period_sec) || d.wakeup_period_sec < 0 ||
        d.wakeup_period_sec >
            static_cast<double>(rdaemon::timing::kMaxWakeupPeriod.count())) {
      throw rdaemon::ConfigValueError(
          "'wakeup_period_sec' must be between 0 and 1e9 seconds");
    }
    if (d.launcher_timeout_sec <= 0) {
      throw rdaemon::ConfigValueError("'launcher_timeout_sec' must be positive");
    }
    return true;
  }
};

template <>
struct convert<rdaemon::SystemConfig> {
  static bool decode(const Node& node, rdaemon::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto logging = node["logging"]) {
      c.logging = logging.as<rdaemon::LogOptions>();
    }
    if (auto bookkeeping = node["bookkeeping"]) {
      c.bookkeeping = bookkeeping.as<rdaemon::BookkeepingOptions>();
    }
    if (auto daemon = node["daemon"]) {
      c.daemon = daemon.as<rdaemon::DaemonConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace rdaemon {

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    SystemConfig config = root.as<SystemConfig>();
    return ok(std::move(config));
  } catch (const ConfigValueError& e) {
    log::error("Invalid configuration: {}", e.what());
    return fail(Error::InvalidArgument);
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

}  // namespace rdaemon
