#include "rdaemon/bookkeeping/file_bookkeeping.hpp"

#include <algorithm>
#include <csignal>
#include <fstream>
#include <sstream>

#include "gtest/gtest.h"
#include "test_utils.hpp"

#include <sys/wait.h>
#include <unistd.h>

using namespace rdaemon;

namespace {

auto key(std::string name, std::string group = {}) -> DaemonKey {
  return DaemonKey::make(std::move(name), std::move(group)).value();
}

auto read_file(const std::filesystem::path& path) -> std::string {
  std::ifstream file(path);
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

// A child blocked in pause() until signaled.
auto spawn_sleeper() -> pid_t {
  pid_t pid = ::fork();
  if (pid == 0) {
    ::pause();
    ::_exit(0);
  }
  return pid;
}

}  // namespace

class FileBookkeepingTest : public ::testing::Test {
protected:
  void SetUp() override { root_ = tmp_.path() / "pids"; }

  auto write(const DaemonKey& k, pid_t pid) -> void {
    FileBookkeeping bk(root_);
    ASSERT_TRUE(FileBookkeeping::write_pid_file(bk.pid_file(k), pid));
  }

  test::TempDir tmp_;
  std::filesystem::path root_;
};

TEST_F(FileBookkeepingTest, PidFileLayout) {
  FileBookkeeping bk(root_);
  EXPECT_EQ(bk.pid_file(key("worker-1")), root_ / "worker-1.pid");
  EXPECT_EQ(bk.pid_file(key("worker-1", "test")), root_ / "test" / "worker-1.pid");
  EXPECT_EQ(bk.locator(key("w", "a/b")), (root_ / "a/b/w.pid").string());
  EXPECT_EQ(bk.method(), BookkeepingMethod::File);
}

TEST_F(FileBookkeepingTest, RelativeRootIsMadeAbsolute) {
  FileBookkeeping bk("relative/pids");
  EXPECT_TRUE(bk.root().is_absolute());
}

TEST_F(FileBookkeepingTest, WriteThenGetPid) {
  FileBookkeeping bk(root_);
  auto k = key("worker-1", "test");
  write(k, 4321);

  EXPECT_EQ(read_file(bk.pid_file(k)), "4321\n");
  auto pid = bk.get_pid(k);
  ASSERT_TRUE(pid.has_value());
  EXPECT_EQ(*pid, 4321);

  auto pids = bk.get_pids(k);
  ASSERT_TRUE(pids.has_value());
  EXPECT_EQ(*pids, std::vector<pid_t>{4321});
}

TEST_F(FileBookkeepingTest, MissingRecordIsNotActive) {
  FileBookkeeping bk(root_);
  auto pid = bk.get_pid(key("nobody"));
  ASSERT_FALSE(pid.has_value());
  EXPECT_EQ(pid.error(), make_error_code(Error::NotActive));
  EXPECT_FALSE(bk.is_running(key("nobody")));
}

TEST_F(FileBookkeepingTest, MalformedRecordIsNotActive) {
  FileBookkeeping bk(root_);
  auto k = key("broken");
  std::filesystem::create_directories(root_);

  for (const char* content : {"", "abc\n", "-4\n", "0\n", "12abc\n"}) {
    std::ofstream(bk.pid_file(k), std::ios::trunc) << content;
    auto pid = bk.get_pid(k);
    ASSERT_FALSE(pid.has_value()) << "content: " << content;
    EXPECT_EQ(pid.error(), make_error_code(Error::NotActive));
  }
}

TEST_F(FileBookkeepingTest, LiveProcessIsRunning) {
  FileBookkeeping bk(root_);
  auto k = key("self");
  write(k, ::getpid());

  EXPECT_TRUE(bk.is_running(k));
  EXPECT_TRUE(std::filesystem::exists(bk.pid_file(k)));
}

TEST_F(FileBookkeepingTest, StaleRecordSelfHeals) {
  FileBookkeeping bk(root_);
  auto k = key("ghost", "test");
  write(k, test::dead_pid());

  EXPECT_FALSE(bk.is_running(k));
  EXPECT_FALSE(std::filesystem::exists(bk.pid_file(k)));
  EXPECT_FALSE(bk.is_running(k));
}

TEST_F(FileBookkeepingTest, KillKeepsRecordOnGracefulSignal) {
  FileBookkeeping bk(root_);
  auto k = key("sleeper");
  pid_t pid = spawn_sleeper();
  ASSERT_GT(pid, 0);
  write(k, pid);

  EXPECT_TRUE(bk.kill(k, SIGTERM));
  EXPECT_TRUE(std::filesystem::exists(bk.pid_file(k)));

  int status = 0;
  ASSERT_EQ(::waitpid(pid, &status, 0), pid);
  EXPECT_TRUE(WIFSIGNALED(status));
}

TEST_F(FileBookkeepingTest, KillWithConfirmSignalRemovesRecord) {
  FileBookkeeping bk(root_);
  auto k = key("sleeper");
  pid_t pid = spawn_sleeper();
  ASSERT_GT(pid, 0);
  write(k, pid);

  EXPECT_TRUE(bk.kill(k, kConfirmSignal));
  EXPECT_FALSE(std::filesystem::exists(bk.pid_file(k)));
  ::waitpid(pid, nullptr, 0);
}

TEST_F(FileBookkeepingTest, KillWithoutRecordFails) {
  FileBookkeeping bk(root_);
  EXPECT_FALSE(bk.kill(key("nobody")));
}

TEST_F(FileBookkeepingTest, KillAllSignalsEveryRecordInGroup) {
  FileBookkeeping bk(root_);
  pid_t first = spawn_sleeper();
  pid_t second = spawn_sleeper();
  ASSERT_GT(first, 0);
  ASSERT_GT(second, 0);
  write(key("a", "grp"), first);
  write(key("b", "grp"), second);
  write(key("other"), ::getpid());

  bk.kill_all("grp", kConfirmSignal);

  int status = 0;
  ASSERT_EQ(::waitpid(first, &status, 0), first);
  EXPECT_TRUE(WIFSIGNALED(status));
  ASSERT_EQ(::waitpid(second, &status, 0), second);
  EXPECT_TRUE(WIFSIGNALED(status));

  EXPECT_FALSE(std::filesystem::exists(bk.pid_file(key("a", "grp"))));
  EXPECT_FALSE(std::filesystem::exists(bk.pid_file(key("b", "grp"))));
  EXPECT_TRUE(bk.is_running(key("other")));

  // Nothing left to signal: the second pass is a no-op.
  bk.kill_all("grp", kConfirmSignal);
  EXPECT_TRUE(bk.list("grp").empty());
}

TEST_F(FileBookkeepingTest, KillAllOnMissingGroupIsNoop) {
  FileBookkeeping bk(root_);
  bk.kill_all("does/not/exist");
  bk.kill_all("../escape");
  EXPECT_FALSE(std::filesystem::exists(root_));
}

TEST_F(FileBookkeepingTest, ClearEmptyRemovesEmptyGroupChain) {
  FileBookkeeping bk(root_);
  std::filesystem::create_directories(root_ / "a" / "b");

  bk.clear_empty("a/b");
  EXPECT_FALSE(std::filesystem::exists(root_ / "a"));
  EXPECT_TRUE(std::filesystem::exists(tmp_.path()));
}

TEST_F(FileBookkeepingTest, ClearEmptyKeepsPopulatedGroup) {
  FileBookkeeping bk(root_);
  write(key("self", "a"), ::getpid());
  std::filesystem::create_directories(root_ / "a" / "b");

  bk.clear_empty("a/b");
  EXPECT_FALSE(std::filesystem::exists(root_ / "a" / "b"));
  EXPECT_TRUE(std::filesystem::exists(root_ / "a"));
  EXPECT_TRUE(bk.is_running(key("self", "a")));
}

TEST_F(FileBookkeepingTest, ListFindsRecordsRecursively) {
  FileBookkeeping bk(root_);
  write(key("top"), ::getpid());
  write(key("nested", "x/y"), ::getpid());
  std::filesystem::create_directories(root_ / "x");
  std::ofstream(root_ / "x" / "notes.txt") << "not a record";

  auto keys = bk.list();
  ASSERT_EQ(keys.size(), 2u);
  EXPECT_NE(std::ranges::find(keys, key("top")), keys.end());
  EXPECT_NE(std::ranges::find(keys, key("nested", "x/y")), keys.end());

  auto scoped = bk.list("x");
  ASSERT_EQ(scoped.size(), 1u);
  EXPECT_EQ(scoped.front(), key("nested", "x/y"));
}

TEST_F(FileBookkeepingTest, ReleaseRemovesRecord) {
  FileBookkeeping bk(root_);
  auto k = key("self");
  write(k, ::getpid());

  bk.release(k);
  EXPECT_FALSE(std::filesystem::exists(bk.pid_file(k)));
  bk.release(k);
}
