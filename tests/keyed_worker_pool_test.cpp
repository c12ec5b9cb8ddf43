// =============================================================================
// keyed_worker_pool_test.cpp
// =============================================================================
// Unit tests for stratexec::KeyedWorkerPool.
//
// Validates:
//   - Jobs of one key run in submission order, never two at once
//   - A backlog on one key occupies a single worker; other keys still start
//   - Jobs without a key run independently
//   - stop() runs every accepted job and rejects later submissions
//   - A throwing job does not take its worker down
//
// Threading model:
//   Blocking jobs wait on futures the test releases; every wait is bounded.
// =============================================================================

#include "stratexec/concurrent/keyed_worker_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

// Thread-safe append-only log of job labels.
class Journal {
 public:
  void add(const std::string& entry) {
    std::lock_guard lock(mutex_);
    entries_.push_back(entry);
  }
  std::vector<std::string> entries() const {
    std::lock_guard lock(mutex_);
    return entries_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<std::string> entries_;
};

}  // namespace

// -----------------------------------------------------------------------------
// 1. One key: submission order, one job at a time.
// -----------------------------------------------------------------------------
TEST(KeyedWorkerPoolTest, SameKeyRunsInOrderOneAtATime) {
  stratexec::KeyedWorkerPool pool(4);
  pool.start();

  Journal journal;
  std::atomic<int> running{0};
  std::atomic<int> peak{0};

  for (int i = 0; i < 20; ++i) {
    ASSERT_TRUE(pool.submit("pair:acc-1", [&, i] {
      int now = running.fetch_add(1) + 1;
      int seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
      journal.add(std::to_string(i));
      running.fetch_sub(1);
    }));
  }
  pool.stop();

  std::vector<std::string> expected;
  for (int i = 0; i < 20; ++i) {
    expected.push_back(std::to_string(i));
  }
  EXPECT_EQ(journal.entries(), expected);
  EXPECT_EQ(peak.load(), 1);
  EXPECT_EQ(pool.activeKeys(), 0u);
}

// -----------------------------------------------------------------------------
// 2. A blocked key with a backlog larger than the pool does not hold up a
//    different key.
// How: 2 workers. Five jobs of key A, the first blocked on a future; then
//      one job of key B. B must finish while A is still blocked.
// -----------------------------------------------------------------------------
TEST(KeyedWorkerPoolTest, BacklogOnOneKeyDoesNotStarveOthers) {
  stratexec::KeyedWorkerPool pool(2);
  pool.start();

  std::promise<void> release;
  std::shared_future<void> released = release.get_future().share();
  std::promise<void> b_done;
  std::future<void> b_finished = b_done.get_future();
  Journal journal;

  for (int i = 0; i < 5; ++i) {
    pool.submit("pair:A", [&journal, released, i] {
      if (i == 0) {
        released.wait_for(std::chrono::seconds(5));
      }
      journal.add("A" + std::to_string(i));
    });
  }
  pool.submit("pair:B", [&journal, &b_done] {
    journal.add("B");
    b_done.set_value();
  });

  ASSERT_EQ(b_finished.wait_for(std::chrono::seconds(2)),
            std::future_status::ready);
  EXPECT_EQ(journal.entries(), (std::vector<std::string>{"B"}));

  release.set_value();
  pool.stop();
  EXPECT_EQ(journal.entries(),
            (std::vector<std::string>{"B", "A0", "A1", "A2", "A3", "A4"}));
}

// -----------------------------------------------------------------------------
// 3. Jobs without a key are not ordered against each other.
// -----------------------------------------------------------------------------
TEST(KeyedWorkerPoolTest, EmptyKeyJobsRunIndependently) {
  stratexec::KeyedWorkerPool pool(2);
  pool.start();

  std::promise<void> release;
  std::shared_future<void> released = release.get_future().share();
  std::promise<void> second_done;
  std::future<void> second_finished = second_done.get_future();

  pool.submit("", [released] { released.wait_for(std::chrono::seconds(5)); });
  pool.submit("", [&second_done] { second_done.set_value(); });

  EXPECT_EQ(second_finished.wait_for(std::chrono::seconds(2)),
            std::future_status::ready);
  release.set_value();
  pool.stop();
}

// -----------------------------------------------------------------------------
// 4. stop() drains accepted work, then rejects new submissions.
// -----------------------------------------------------------------------------
TEST(KeyedWorkerPoolTest, StopDrainsThenRejects) {
  stratexec::KeyedWorkerPool pool(1);
  pool.start();

  std::atomic<int> done{0};
  for (int i = 0; i < 10; ++i) {
    pool.submit(i % 2 == 0 ? "pair:even" : "pair:odd", [&done] {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
      done.fetch_add(1);
    });
  }
  pool.stop();

  EXPECT_EQ(done.load(), 10);
  EXPECT_FALSE(pool.submit("pair:even", [&done] { done.fetch_add(1); }));
  EXPECT_EQ(done.load(), 10);

  pool.stop();  // idempotent
}

// -----------------------------------------------------------------------------
// 5. An exception escaping a job, of any type, is logged; the lane and
//    worker carry on.
// -----------------------------------------------------------------------------
TEST(KeyedWorkerPoolTest, ThrowingJobDoesNotStopLane) {
  stratexec::KeyedWorkerPool pool(1);
  pool.start();

  Journal journal;
  pool.submit("pair:A", [] { throw std::runtime_error("boom"); });
  pool.submit("pair:A", [] { throw 7; });
  pool.submit("pair:A", [&journal] { journal.add("after"); });
  pool.stop();

  EXPECT_EQ(journal.entries(), (std::vector<std::string>{"after"}));
}
