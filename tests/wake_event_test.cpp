#include "rdaemon/sync/wake_event.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

#include "gtest/gtest.h"
#include "test_utils.hpp"

#include <sys/wait.h>
#include <unistd.h>

using namespace rdaemon;
using namespace std::chrono_literals;

class WakeEventTest : public ::testing::TestWithParam<WakeEventKind> {
protected:
  void SetUp() override { event_ = make_wake_event(GetParam()); }

  std::unique_ptr<WakeEvent> event_;
};

TEST_P(WakeEventTest, StartsClear) {
  EXPECT_FALSE(event_->is_set());
  EXPECT_FALSE(event_->is_terminated());
}

TEST_P(WakeEventTest, SetThenWaitReturnsTrueAndClears) {
  event_->set();
  EXPECT_TRUE(event_->is_set());

  EXPECT_TRUE(event_->wait_and_clear(0ns));
  EXPECT_FALSE(event_->is_set());
  EXPECT_FALSE(event_->wait_and_clear(0ns));
}

TEST_P(WakeEventTest, ClearReturnsPreviousValue) {
  EXPECT_FALSE(event_->clear());
  event_->set();
  EXPECT_TRUE(event_->clear());
  EXPECT_FALSE(event_->is_set());
}

TEST_P(WakeEventTest, WaitTimesOutWithinBound) {
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(event_->wait_and_clear(100ms));
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_GE(elapsed, 100ms);
  EXPECT_LT(elapsed, 1s);
}

TEST_P(WakeEventTest, TerminateIsStickyAndNeverBlocks) {
  EXPECT_FALSE(event_->terminate());
  EXPECT_TRUE(event_->is_terminated());
  EXPECT_TRUE(event_->is_set());

  auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < 100; ++i) {
    EXPECT_FALSE(event_->wait_and_clear(10s));
  }
  EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);

  // Signaled cannot be cleared once terminated.
  EXPECT_TRUE(event_->clear());
  EXPECT_TRUE(event_->is_set());
  EXPECT_TRUE(event_->is_terminated());
}

TEST_P(WakeEventTest, TerminateIsIdempotent) {
  EXPECT_FALSE(event_->terminate());
  EXPECT_TRUE(event_->terminate());
  EXPECT_TRUE(event_->is_terminated());
}

TEST_P(WakeEventTest, TerminateReturnsPriorSignal) {
  event_->set();
  EXPECT_TRUE(event_->terminate());
}

TEST_P(WakeEventTest, SetWakesBlockedWaiter) {
  auto waiter = std::async(std::launch::async,
                           [this] { return event_->wait_and_clear(); });
  test::sleep_ms(50ms);
  event_->set();

  ASSERT_EQ(waiter.wait_for(2s), std::future_status::ready);
  EXPECT_TRUE(waiter.get());
  EXPECT_FALSE(event_->is_set());
}

TEST_P(WakeEventTest, TerminateWakesAllWaiters) {
  std::vector<std::future<bool>> waiters;
  for (int i = 0; i < 4; ++i) {
    waiters.push_back(std::async(std::launch::async,
                                 [this] { return event_->wait_and_clear(); }));
  }
  test::sleep_ms(50ms);
  event_->terminate();

  for (auto& waiter : waiters) {
    ASSERT_EQ(waiter.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(waiter.get());
  }
}

TEST_P(WakeEventTest, ResetClearsBothFlags) {
  event_->terminate();
  event_->reset();

  EXPECT_FALSE(event_->is_terminated());
  EXPECT_FALSE(event_->is_set());
  EXPECT_FALSE(event_->wait_and_clear(10ms));
}

INSTANTIATE_TEST_SUITE_P(
    Kinds, WakeEventTest,
    ::testing::Values(WakeEventKind::Thread, WakeEventKind::Shared),
    [](const ::testing::TestParamInfo<WakeEventKind>& info) {
      return std::string(to_string_view(info.param));
    });

TEST(WakeEventKindTest, ParsesNames) {
  EXPECT_EQ(parse_wake_event_kind("thread"), WakeEventKind::Thread);
  EXPECT_EQ(parse_wake_event_kind("shared"), WakeEventKind::Shared);
  EXPECT_FALSE(parse_wake_event_kind("process").has_value());
}

TEST(SharedWakeEventTest, TerminationObservedAcrossFork) {
  SharedWakeEvent event;

  pid_t pid = ::fork();
  ASSERT_GE(pid, 0);
  if (pid == 0) {
    bool woken = event.wait_and_clear(10s);
    ::_exit(!woken && event.is_terminated() ? 0 : 1);
  }

  test::sleep_ms(100ms);
  event.terminate();

  int status = 0;
  ASSERT_EQ(::waitpid(pid, &status, 0), pid);
  ASSERT_TRUE(WIFEXITED(status));
  EXPECT_EQ(WEXITSTATUS(status), 0);
}

TEST(SharedWakeEventTest, SetFromChildWakesParent) {
  SharedWakeEvent event;

  pid_t pid = ::fork();
  ASSERT_GE(pid, 0);
  if (pid == 0) {
    std::this_thread::sleep_for(50ms);
    event.set();
    ::_exit(0);
  }

  EXPECT_TRUE(event.wait_and_clear(5s));
  EXPECT_FALSE(event.is_set());
  ::waitpid(pid, nullptr, 0);
}
