// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for pdt::ThreadSafeQueue<T>.
//
// Validates:
//   - FIFO order and size() bookkeeping
//   - try_pop() and pop_for() on an empty queue
//   - pop() / pop_for() wake up for a later push
//   - Move-only payloads
//   - No loss or duplication under several producers and consumers
//
// Every spawned thread is joined before the assertions run.
// =============================================================================

#include "pdt/concurrent/thread_safe_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  pdt::ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. Items come back in the order they were pushed.
// Why: The analysis loop and the publisher both rely on arrival order.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PreservesFifoOrder) {
  EXPECT_TRUE(queue.empty());
  for (int i = 0; i < 50; ++i) {
    queue.push(i);
  }
  EXPECT_EQ(queue.size(), 50u);

  for (int i = 0; i < 50; ++i) {
    ASSERT_EQ(queue.pop(), i);
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 2. try_pop() on an empty queue returns immediately with nothing.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPopOnEmptyQueue) {
  EXPECT_FALSE(queue.try_pop().has_value());

  queue.push(7);
  std::optional<int> v = queue.try_pop();
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(*v, 7);
  EXPECT_FALSE(queue.try_pop().has_value());
}

// -----------------------------------------------------------------------------
// 3. pop_for() times out on an empty queue and does not wait much longer
//    than asked.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopForTimesOut) {
  const auto begin = std::chrono::steady_clock::now();
  std::optional<int> v = queue.pop_for(std::chrono::milliseconds(20));
  const auto waited = std::chrono::steady_clock::now() - begin;

  EXPECT_FALSE(v.has_value());
  EXPECT_GE(waited, std::chrono::milliseconds(20));
  EXPECT_LT(waited, std::chrono::seconds(2));
}

// -----------------------------------------------------------------------------
// 4. A blocked pop_for() returns the item a producer pushes later.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopForWakesOnPush) {
  std::thread producer([this] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.push(99);
  });

  std::optional<int> v = queue.pop_for(std::chrono::seconds(5));
  producer.join();

  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(*v, 99);
}

// -----------------------------------------------------------------------------
// 5. Blocking pop() waits for the producer.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, BlockingPopWaitsForProducer) {
  std::atomic<bool> popped{false};
  int value = 0;

  std::thread consumer([&] {
    value = queue.pop();
    popped.store(true);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_FALSE(popped.load());

  queue.push(5);
  consumer.join();

  EXPECT_TRUE(popped.load());
  EXPECT_EQ(value, 5);
}

// -----------------------------------------------------------------------------
// 6. Move-only payloads are supported.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueMoveOnlyTest, AcceptsMoveOnlyTypes) {
  pdt::ThreadSafeQueue<std::unique_ptr<std::string>> q;
  q.push(std::make_unique<std::string>("position.opened"));

  std::optional<std::unique_ptr<std::string>> item = q.try_pop();
  ASSERT_TRUE(item.has_value());
  ASSERT_NE(*item, nullptr);
  EXPECT_EQ(**item, "position.opened");
}

// -----------------------------------------------------------------------------
// 7. Four producers, four consumers: every value is delivered exactly once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentProducersAndConsumers) {
  constexpr int kProducers = 4;
  constexpr int kConsumers = 4;
  constexpr int kPerProducer = 500;
  constexpr int kTotal = kProducers * kPerProducer;

  std::atomic<int> consumed{0};
  std::vector<std::vector<int>> seen(kConsumers);

  std::vector<std::thread> threads;
  for (int c = 0; c < kConsumers; ++c) {
    threads.emplace_back([&, c] {
      while (consumed.load() < kTotal) {
        if (std::optional<int> v = queue.pop_for(std::chrono::milliseconds(5))) {
          seen[c].push_back(*v);
          consumed.fetch_add(1);
        }
      }
    });
  }
  for (int p = 0; p < kProducers; ++p) {
    threads.emplace_back([&, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        queue.push(p * kPerProducer + i);
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  std::set<int> unique;
  std::size_t count = 0;
  for (const auto& bucket : seen) {
    count += bucket.size();
    unique.insert(bucket.begin(), bucket.end());
  }
  EXPECT_EQ(count, static_cast<std::size_t>(kTotal));
  EXPECT_EQ(unique.size(), static_cast<std::size_t>(kTotal));
  EXPECT_TRUE(queue.empty());
}
