// =============================================================================
// dedup_cache_test.cpp
// =============================================================================
// Unit tests for stratexec::DedupCache.
//
// Validates:
//   - The first acquire() of an id owns it; later ones wait for its response
//   - Concurrent callers of one id observe exactly one owner and the same
//     response
//   - Records expire after the retention window (strictly greater than)
//   - The record count stays bounded; in-flight records are never evicted
//   - An owner that gives up releases its waiters with StrategyError and
//     frees the id
//   - Claim misuse raises std::logic_error
//
// Time is driven by SimulationTimeProvider so expiry is deterministic.
// =============================================================================

#include "stratexec/engine/dedup_cache.hpp"
#include "stratexec/errors/errors.hpp"
#include "stratexec/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using stratexec::domain::ExecStatus;
using stratexec::domain::ExecutionResponse;

namespace {

ExecutionResponse responseWithError(const std::string& message) {
  ExecutionResponse response;
  response.status = ExecStatus::Failed;
  response.error_message = message;
  return response;
}

}  // namespace

class DedupCacheTest : public ::testing::Test {
 protected:
  stratexec::SimulationTimeProvider clock{1'000'000};
  stratexec::DedupCache cache{clock, std::chrono::milliseconds(1000), 1000};
};

// -----------------------------------------------------------------------------
// 1. First caller owns the id; a later caller receives the stored response.
// -----------------------------------------------------------------------------
TEST_F(DedupCacheTest, OwnerThenWaiter) {
  auto owner = cache.acquire("exec-1");
  ASSERT_TRUE(owner.isOwner());
  EXPECT_FALSE(cache.find("exec-1").has_value());

  owner.complete(responseWithError("boom"));

  auto waiter = cache.acquire("exec-1");
  ASSERT_FALSE(waiter.isOwner());
  auto response = waiter.wait();
  EXPECT_EQ(response.status, ExecStatus::Failed);
  EXPECT_EQ(response.error_message, "boom");

  auto found = cache.find("exec-1");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->error_message, "boom");
  EXPECT_EQ(cache.size(), 1u);
}

// -----------------------------------------------------------------------------
// 2. Concurrent acquires of one id: one owner, every waiter gets its answer.
// Why: A redelivered request racing the original must not run the strategy
//      a second time.
// -----------------------------------------------------------------------------
TEST_F(DedupCacheTest, ConcurrentCallersShareOneExecution) {
  constexpr int kCallers = 8;
  std::atomic<int> owners{0};
  std::vector<std::string> results(kCallers);
  std::vector<std::thread> threads;

  for (int i = 0; i < kCallers; ++i) {
    threads.emplace_back([&, i] {
      auto claim = cache.acquire("exec-shared");
      if (claim.isOwner()) {
        owners.fetch_add(1);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        claim.complete(responseWithError("from-owner"));
        results[i] = "from-owner";
      } else {
        results[i] = claim.wait().error_message;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(owners.load(), 1);
  for (const auto& result : results) {
    EXPECT_EQ(result, "from-owner");
  }
}

// -----------------------------------------------------------------------------
// 3. A record survives exactly the retention window, then the id is new.
// -----------------------------------------------------------------------------
TEST_F(DedupCacheTest, RetentionExpiry) {
  cache.acquire("exec-1").complete(ExecutionResponse{});

  clock.advance(1000);
  EXPECT_TRUE(cache.find("exec-1").has_value());
  EXPECT_FALSE(cache.acquire("exec-1").isOwner());

  clock.set_time(1'000'000 + 1001);
  EXPECT_FALSE(cache.find("exec-1").has_value());
  auto again = cache.acquire("exec-1");
  EXPECT_TRUE(again.isOwner());
  again.complete(ExecutionResponse{});
}

// -----------------------------------------------------------------------------
// 4. The record count stays bounded, but in-flight records are kept.
// -----------------------------------------------------------------------------
TEST(DedupCacheBoundTest, BoundedAndInFlightKept) {
  stratexec::SimulationTimeProvider clock{0};
  stratexec::DedupCache cache(clock, std::chrono::hours(1), 16);

  auto pending = cache.acquire("in-flight");
  ASSERT_TRUE(pending.isOwner());

  for (int i = 0; i < 200; ++i) {
    clock.advance(1);
    cache.acquire("exec-" + std::to_string(i)).complete(ExecutionResponse{});
  }

  // One completed record per shard plus the pending one.
  EXPECT_LE(cache.size(), stratexec::DedupCache::kShardCount + 1);

  auto second = cache.acquire("in-flight");
  EXPECT_FALSE(second.isOwner());

  pending.complete(responseWithError("late"));
  EXPECT_EQ(second.wait().error_message, "late");
}

// -----------------------------------------------------------------------------
// 5. An owner destroyed without completing releases waiters with an error
//    and frees the id for a fresh owner.
// -----------------------------------------------------------------------------
TEST_F(DedupCacheTest, AbandonedOwnerReleasesWaiters) {
  auto owner = std::make_unique<stratexec::DedupCache::Claim>(
      cache.acquire("exec-1"));
  auto waiter = cache.acquire("exec-1");
  ASSERT_FALSE(waiter.isOwner());

  owner.reset();

  EXPECT_THROW(waiter.wait(), stratexec::StrategyError);
  EXPECT_EQ(cache.size(), 0u);

  auto next = cache.acquire("exec-1");
  EXPECT_TRUE(next.isOwner());
  next.complete(ExecutionResponse{});
}

// -----------------------------------------------------------------------------
// 6. Claim misuse.
// -----------------------------------------------------------------------------
TEST_F(DedupCacheTest, ClaimMisuseThrowsLogicError) {
  auto owner = cache.acquire("exec-1");
  EXPECT_THROW(owner.wait(), std::logic_error);
  owner.complete(ExecutionResponse{});
  EXPECT_THROW(owner.complete(ExecutionResponse{}), std::logic_error);

  auto waiter = cache.acquire("exec-1");
  EXPECT_THROW(waiter.complete(ExecutionResponse{}), std::logic_error);
}
