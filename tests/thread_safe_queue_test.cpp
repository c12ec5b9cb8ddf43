// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for stratexec::ThreadSafeQueue<T>.
//
// Validates:
//   - FIFO semantics of push / pop
//   - try_pop() on empty and non-empty queues
//   - Blocking pop() waits for a producer
//   - close(): pushes rejected, queued items still delivered, blocked
//     consumers released
//   - Worker-pool usage: many producers, consumers draining with pop()
//     until close()
//
// Threading model:
//   Every spawned thread is joined before assertions run.
// =============================================================================

#include "stratexec/concurrent/thread_safe_queue.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  stratexec::ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. A newly constructed queue is empty and open.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, EmptyAndOpenOnConstruction) {
  EXPECT_TRUE(queue.empty());
  EXPECT_FALSE(queue.closed());
}

// -----------------------------------------------------------------------------
// 2. Items come back in the order they were pushed.
// Why: RpcServer sends replies in the order workers produced them.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FIFOOrder) {
  constexpr int kCount = 100;
  for (int i = 0; i < kCount; ++i) {
    ASSERT_TRUE(queue.push(i));
  }

  for (int i = 0; i < kCount; ++i) {
    std::optional<int> item = queue.pop();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(*item, i) << "FIFO violated at index " << i;
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 3. try_pop() returns nullopt immediately when empty and the front item
//    otherwise.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPop) {
  EXPECT_FALSE(queue.try_pop().has_value());

  queue.push(99);
  std::optional<int> result = queue.try_pop();
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, 99);
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 4. Blocking pop() waits until another thread pushes.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, BlockingPopWaitsForPush) {
  std::atomic<int> received{-1};

  std::thread consumer([this, &received] {
    std::optional<int> item = queue.pop();
    received.store(item ? *item : -2);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(received.load(), -1);  // still blocked

  queue.push(77);
  consumer.join();

  EXPECT_EQ(received.load(), 77);
}

// -----------------------------------------------------------------------------
// 5. After close(), push() is rejected but items queued earlier are still
//    delivered; pop() then returns nullopt.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, CloseDrainsThenEnds) {
  queue.push(1);
  queue.push(2);
  queue.close();

  EXPECT_TRUE(queue.closed());
  EXPECT_FALSE(queue.push(3));

  EXPECT_EQ(queue.pop(), std::optional<int>(1));
  EXPECT_EQ(queue.pop(), std::optional<int>(2));
  EXPECT_FALSE(queue.pop().has_value());
}

// -----------------------------------------------------------------------------
// 6. close() releases every consumer blocked in pop().
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, CloseWakesBlockedConsumers) {
  constexpr int kConsumers = 3;
  std::atomic<int> released{0};

  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([this, &released] {
      if (!queue.pop().has_value()) {
        released.fetch_add(1);
      }
    });
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue.close();
  for (auto& t : consumers) t.join();

  EXPECT_EQ(released.load(), kConsumers);
}

// -----------------------------------------------------------------------------
// 7. Worker-pool pattern: producers push, consumers loop on pop() until the
//    queue is closed. Every item is consumed exactly once.
//
// How: 4 producers push disjoint ranges. After they are joined the queue is
//      closed; each consumer exits when pop() returns nullopt. The merged,
//      sorted result must be exactly [0, total).
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentProducersAndWorkers) {
  constexpr int kProducers = 4;
  constexpr int kConsumers = 4;
  constexpr int kItemsPerProducer = 1000;
  constexpr int kTotalItems = kProducers * kItemsPerProducer;

  std::vector<std::vector<int>> per_consumer(kConsumers);
  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([this, c, &per_consumer] {
      while (auto item = queue.pop()) {
        per_consumer[c].push_back(*item);
      }
    });
  }

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      int start = p * kItemsPerProducer;
      for (int i = start; i < start + kItemsPerProducer; ++i) {
        queue.push(i);
      }
    });
  }

  for (auto& t : producers) t.join();
  queue.close();
  for (auto& t : consumers) t.join();

  std::vector<int> all;
  for (auto& v : per_consumer) {
    all.insert(all.end(), v.begin(), v.end());
  }
  std::sort(all.begin(), all.end());

  ASSERT_EQ(static_cast<int>(all.size()), kTotalItems);
  for (int i = 0; i < kTotalItems; ++i) {
    EXPECT_EQ(all[i], i) << "Missing or duplicate item at index " << i;
  }
}

// -----------------------------------------------------------------------------
// 8. Move-only payloads are supported (RpcServer queues std::string frames).
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueMoveTest, MoveOnlyPayload) {
  stratexec::ThreadSafeQueue<std::unique_ptr<std::string>> queue;
  queue.push(std::make_unique<std::string>("payload"));

  auto item = queue.pop();
  ASSERT_TRUE(item.has_value());
  ASSERT_NE(*item, nullptr);
  EXPECT_EQ(**item, "payload");
}
