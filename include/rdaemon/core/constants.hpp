#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

namespace rdaemon {

namespace paths {
inline constexpr std::string_view kDefaultPidRoot = "/tmp/rdaemons";
inline constexpr std::string_view kDefaultCgroupMount = "/sys/fs/cgroup";
inline constexpr std::string_view kDefaultCgroupRoot = "rdaemons";
inline constexpr std::string_view kDefaultLogPath = "/tmp";
inline constexpr std::string_view kPidFileExtension = ".pid";
inline constexpr std::string_view kCgroupProcs = "cgroup.procs";
inline constexpr std::string_view kDevNull = "/dev/null";
inline constexpr std::string_view kWorkDir = "/";
}

namespace detach {
// Used when RLIMIT_NOFILE is unbounded.
inline constexpr int kMaxFdFallback = 1024;
}

namespace timing {
inline constexpr auto kMinWakeupPeriod = std::chrono::seconds(1);
inline constexpr auto kMaxWakeupPeriod = std::chrono::seconds(1'000'000'000);
inline constexpr auto kDefaultLauncherTimeout = std::chrono::seconds(60);
inline constexpr auto kShutdownPollInterval = std::chrono::milliseconds(50);
inline constexpr auto kDaemonPollInterval = std::chrono::milliseconds(100);
inline constexpr auto kGroupDrainTimeout = std::chrono::seconds(1);
inline constexpr auto kChildStopGrace = std::chrono::seconds(5);
inline constexpr auto kDaemonStartTimeout = std::chrono::seconds(5);
}

}  // namespace rdaemon
