#include "rdaemon/config/config.hpp"

#include <chrono>
#include <fstream>
#include <string>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace rdaemon;
using namespace std::chrono_literals;

TEST(ConfigTest, SystemConfigDefaults) {
  SystemConfig config;
  EXPECT_EQ(config.logging.level, "info");
  EXPECT_EQ(config.logging.output_path, paths::kDefaultLogPath);
  EXPECT_EQ(config.bookkeeping.method, BookkeepingMethod::File);
  EXPECT_EQ(config.bookkeeping.pid_root, paths::kDefaultPidRoot);
  EXPECT_EQ(config.bookkeeping.cgroup_root, paths::kDefaultCgroupRoot);
  EXPECT_DOUBLE_EQ(config.daemon.wakeup_period_sec, 1.0);
  EXPECT_EQ(config.daemon.event, WakeEventKind::Thread);
  EXPECT_EQ(config.daemon.launcher_timeout_sec, 60);
  EXPECT_TRUE(config.daemon.command.empty());
}

TEST(ConfigTest, LoadFromYamlString) {
  std::string yaml = R"(
logging:
  level: debug
  output_path: /var/log/rdaemon
  max_bytes: 1048576
  backups: 3

bookkeeping:
  method: cgroup
  cgroup_mount: /sys/fs/cgroup
  cgroup_root: workers

daemon:
  name: worker-1
  group: test
  wakeup_period_sec: 2.5
  event: shared
  launcher_timeout_sec: 30
  command: [sleep, "100"]
)";

  auto result = ConfigLoader::load_from_string(yaml);
  ASSERT_TRUE(result.has_value()) << "Failed to parse YAML: " << result.error().message();

  auto& config = *result;
  EXPECT_EQ(config.logging.level, "debug");
  EXPECT_EQ(config.logging.output_path, "/var/log/rdaemon");
  EXPECT_EQ(config.logging.max_bytes, 1048576u);
  EXPECT_EQ(config.logging.backups, 3);
  EXPECT_EQ(config.bookkeeping.method, BookkeepingMethod::Cgroup);
  EXPECT_EQ(config.bookkeeping.cgroup_root, "workers");
  EXPECT_EQ(config.bookkeeping.pid_root, paths::kDefaultPidRoot);
  EXPECT_EQ(config.daemon.name, "worker-1");
  EXPECT_EQ(config.daemon.group, "test");
  EXPECT_DOUBLE_EQ(config.daemon.wakeup_period_sec, 2.5);
  EXPECT_EQ(config.daemon.event, WakeEventKind::Shared);
  EXPECT_EQ(config.daemon.command, (std::vector<std::string>{"sleep", "100"}));
}

TEST(ConfigTest, PartialSectionsKeepDefaults) {
  auto result = ConfigLoader::load_from_string("daemon:\n  name: solo\n");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->daemon.name, "solo");
  EXPECT_EQ(result->logging.level, "info");
  EXPECT_EQ(result->bookkeeping.method, BookkeepingMethod::File);
}

TEST(ConfigTest, ToLaunchOptions) {
  auto result = ConfigLoader::load_from_string(R"(
daemon:
  name: worker-1
  group: test
  launcher_timeout_sec: 5
bookkeeping:
  pid_root: /tmp/pids
)");
  ASSERT_TRUE(result.has_value());

  auto options = to_launch_options(*result);
  EXPECT_EQ(options.name, "worker-1");
  EXPECT_EQ(options.group, "test");
  EXPECT_EQ(options.bookkeeping.pid_root, "/tmp/pids");
  EXPECT_EQ(options.launcher_timeout, 5s);
  EXPECT_EQ(wakeup_period(result->daemon), 1s);
}

TEST(ConfigTest, UnknownEnumValueIsInvalidArgument) {
  auto method = ConfigLoader::load_from_string("bookkeeping:\n  method: pidfile\n");
  ASSERT_FALSE(method.has_value());
  EXPECT_EQ(method.error(), make_error_code(Error::InvalidArgument));

  auto event = ConfigLoader::load_from_string("daemon:\n  event: process\n");
  ASSERT_FALSE(event.has_value());
  EXPECT_EQ(event.error(), make_error_code(Error::InvalidArgument));
}

TEST(ConfigTest, OutOfRangeValuesAreInvalidArgument) {
  auto timeout =
      ConfigLoader::load_from_string("daemon:\n  launcher_timeout_sec: 0\n");
  ASSERT_FALSE(timeout.has_value());
  EXPECT_EQ(timeout.error(), make_error_code(Error::InvalidArgument));

  auto backups = ConfigLoader::load_from_string("logging:\n  backups: -1\n");
  ASSERT_FALSE(backups.has_value());
  EXPECT_EQ(backups.error(), make_error_code(Error::InvalidArgument));
}

TEST(ConfigTest, WakeupPeriodMustBeFiniteAndBounded) {
  for (const char* value : {".nan", ".inf", "1e12", "-5"}) {
    auto result = ConfigLoader::load_from_string(
        std::string("daemon:\n  wakeup_period_sec: ") + value + "\n");
    ASSERT_FALSE(result.has_value()) << value;
    EXPECT_EQ(result.error(), make_error_code(Error::InvalidArgument)) << value;
  }

  auto largest = ConfigLoader::load_from_string(
      "daemon:\n  wakeup_period_sec: 1e9\n");
  ASSERT_TRUE(largest.has_value());
  EXPECT_EQ(wakeup_period(largest->daemon), std::chrono::seconds(1'000'000'000));
}

TEST(ConfigTest, MalformedYamlIsParseError) {
  auto broken = ConfigLoader::load_from_string("daemon: [unclosed\n");
  ASSERT_FALSE(broken.has_value());
  EXPECT_EQ(broken.error(), make_error_code(Error::ParseError));

  auto empty = ConfigLoader::load_from_string("");
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error(), make_error_code(Error::ParseError));

  auto wrong_type =
      ConfigLoader::load_from_string("daemon:\n  wakeup_period_sec: soon\n");
  ASSERT_FALSE(wrong_type.has_value());
  EXPECT_EQ(wrong_type.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, LoadFromYamlFile) {
  test::TempDir tmp;
  auto path = tmp.path() / "rdaemon.yaml";
  std::ofstream(path) << "logging:\n  level: warn\ndaemon:\n  name: from-file\n";

  auto result = ConfigLoader::load_from_file(path.string());
  ASSERT_TRUE(result.has_value()) << "Failed to load file: " << result.error().message();
  EXPECT_EQ(result->logging.level, "warn");
  EXPECT_EQ(result->daemon.name, "from-file");
}

TEST(ConfigTest, LoadFromYamlMissingFile) {
  auto result = ConfigLoader::load_from_file("/nonexistent/path/rdaemon.yaml");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::FileNotFound));
}
