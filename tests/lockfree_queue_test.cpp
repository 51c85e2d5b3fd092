#include "rdaemon/core/lockfree_queue.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace rdaemon;

TEST(BoundedMPSCQueueTest, BasicPushPop) {
  BoundedMPSCQueue<int> queue(64);
  EXPECT_FALSE(queue.try_pop().has_value());

  EXPECT_TRUE(queue.push(42));
  std::optional<int> value = queue.try_pop();
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(value.value(), 42);
  EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(BoundedMPSCQueueTest, CapacityRoundsUpToPowerOfTwo) {
  EXPECT_EQ(BoundedMPSCQueue<int>(5).capacity(), 8u);
  EXPECT_EQ(BoundedMPSCQueue<int>(8).capacity(), 8u);
  EXPECT_EQ(BoundedMPSCQueue<int>(0).capacity(), 2u);
}

TEST(BoundedMPSCQueueTest, PushFailsWhenFull) {
  BoundedMPSCQueue<int> queue(8);

  for (int i = 0; i < 8; ++i) {
    EXPECT_TRUE(queue.push(i));
  }
  EXPECT_FALSE(queue.push(8));

  std::optional<int> value = queue.try_pop();
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(value.value(), 0);
  EXPECT_TRUE(queue.push(8));
}

TEST(BoundedMPSCQueueTest, PreservesFifoOrderAcrossWrap) {
  BoundedMPSCQueue<std::string> queue(4);
  for (int round = 0; round < 3; ++round) {
    for (int i = 0; i < 4; ++i) {
      ASSERT_TRUE(queue.push(std::to_string(round * 4 + i)));
    }
    for (int i = 0; i < 4; ++i) {
      auto value = queue.try_pop();
      ASSERT_TRUE(value.has_value());
      EXPECT_EQ(*value, std::to_string(round * 4 + i));
    }
  }
}

TEST(BoundedMPSCQueueTest, PopBatchStopsAtMax) {
  BoundedMPSCQueue<int> queue(16);
  for (int i = 0; i < 10; ++i) {
    ASSERT_TRUE(queue.push(i));
  }

  std::vector<int> batch;
  EXPECT_EQ(queue.pop_batch(batch, 4), 4u);
  EXPECT_EQ(batch, (std::vector<int>{0, 1, 2, 3}));
  EXPECT_EQ(queue.pop_batch(batch, 64), 6u);
  EXPECT_EQ(batch.size(), 10u);
  EXPECT_EQ(batch.back(), 9);
  EXPECT_EQ(queue.pop_batch(batch, 64), 0u);
}

TEST(BoundedMPSCQueueTest, DrainDiscardsEverything) {
  BoundedMPSCQueue<std::string> queue(8);
  ASSERT_TRUE(queue.push("a"));
  ASSERT_TRUE(queue.push("b"));
  ASSERT_TRUE(queue.push("c"));

  EXPECT_EQ(queue.drain(), 3u);
  EXPECT_FALSE(queue.try_pop().has_value());
  EXPECT_TRUE(queue.push("d"));
  EXPECT_EQ(*queue.try_pop(), "d");
}

TEST(BoundedMPSCQueueTest, DestroysUnpoppedElements) {
  auto tracker = std::make_shared<int>(0);
  {
    BoundedMPSCQueue<std::shared_ptr<int>> queue(8);
    ASSERT_TRUE(queue.push(tracker));
    ASSERT_TRUE(queue.push(tracker));
    EXPECT_EQ(tracker.use_count(), 3);
  }
  EXPECT_EQ(tracker.use_count(), 1);
}

TEST(BoundedMPSCQueueTest, ConcurrentProducers) {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 1000;
  BoundedMPSCQueue<int> queue(256);
  std::atomic<long> sum{0};
  std::atomic<int> finished{0};

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&] {
      for (int i = 1; i <= kPerProducer; ++i) {
        while (!queue.push(i)) {
          std::this_thread::yield();
        }
      }
      finished++;
    });
  }

  int popped = 0;
  while (popped < kProducers * kPerProducer) {
    if (auto value = queue.try_pop()) {
      sum += *value;
      ++popped;
    } else {
      std::this_thread::yield();
    }
  }

  for (auto& t : producers) {
    t.join();
  }
  EXPECT_EQ(finished.load(), kProducers);
  EXPECT_EQ(sum.load(), static_cast<long>(kProducers) * kPerProducer *
                            (kPerProducer + 1) / 2);
  EXPECT_FALSE(queue.try_pop().has_value());
}
