// =============================================================================
// scope_manager_test.cpp
// =============================================================================
// Unit tests for stratexec::ExecutionScopeManager.
//
// Validates:
//   - open() binds request, instance and a fresh context to the pair
//   - A second open() for the same pair throws ScopeConflict
//   - Different pairs may be open at the same time
//   - Closing (explicitly or by destruction) closes the context and frees
//     the pair, including on exception paths
//   - A moved guard closes exactly once
// =============================================================================

#include "stratexec/config/config_lookup_service.hpp"
#include "stratexec/errors/errors.hpp"
#include "stratexec/scope/execution_scope_manager.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

using stratexec::testing_support::makeMarketDataRequest;

namespace {

class NoopStrategy final : public stratexec::IStrategy {
 public:
  void handleBar(stratexec::StrategyContext&,
                 const stratexec::domain::Bar&) override {}
};

std::shared_ptr<stratexec::StrategyInstance> makeInstance(
    const std::string& account, const std::string& strategy) {
  return std::make_shared<stratexec::StrategyInstance>(
      account, strategy, std::make_unique<NoopStrategy>());
}

std::shared_ptr<const stratexec::domain::ExecutionRequest> makeRequest(
    const std::string& exec_id, const std::string& account = "acc-1") {
  return std::make_shared<const stratexec::domain::ExecutionRequest>(
      makeMarketDataRequest(exec_id, account));
}

}  // namespace

class ExecutionScopeManagerTest : public ::testing::Test {
 protected:
  ExecutionScopeManagerTest()
      : lookup(std::vector<std::filesystem::path>{}), manager(lookup, log) {}

  std::ostringstream log;
  stratexec::ConfigLookupService lookup;
  stratexec::ExecutionScopeManager manager;
};

// -----------------------------------------------------------------------------
// 1. open() binds every part of the scope to the pair.
// -----------------------------------------------------------------------------
TEST_F(ExecutionScopeManagerTest, OpenBindsScope) {
  auto instance = makeInstance("acc-1", "test");
  auto guard = manager.open(makeRequest("exec-1"), instance);

  const auto& scope = guard.scope();
  ASSERT_TRUE(scope);
  EXPECT_EQ(scope->account_id, "acc-1");
  EXPECT_EQ(scope->strategy_id, "test");
  EXPECT_EQ(scope->instance, instance);
  EXPECT_EQ(scope->request->exec_id, "exec-1");
  EXPECT_EQ(guard.context().execId(), "exec-1");
  EXPECT_FALSE(guard.context().closed());

  EXPECT_TRUE(manager.isOpen("acc-1", "test"));
  EXPECT_EQ(manager.openCount(), 1u);
}

// -----------------------------------------------------------------------------
// 2. Only one scope per pair; other pairs are independent.
// -----------------------------------------------------------------------------
TEST_F(ExecutionScopeManagerTest, OneScopePerPair) {
  auto guard = manager.open(makeRequest("exec-1"), makeInstance("acc-1", "test"));

  EXPECT_THROW(manager.open(makeRequest("exec-2"), makeInstance("acc-1", "test")),
               stratexec::ScopeConflict);

  auto other_account =
      manager.open(makeRequest("exec-3", "acc-2"), makeInstance("acc-2", "test"));
  auto other_strategy =
      manager.open(makeRequest("exec-4"), makeInstance("acc-1", "grid"));
  EXPECT_EQ(manager.openCount(), 3u);
}

// -----------------------------------------------------------------------------
// 3. close() closes the context and frees the pair; it is idempotent.
// Why: An abandoned runner may still hold the context after the scope is
//      gone; every later submission must be refused.
// -----------------------------------------------------------------------------
TEST_F(ExecutionScopeManagerTest, CloseReleasesPair) {
  auto guard = manager.open(makeRequest("exec-1"), makeInstance("acc-1", "test"));
  auto context = guard.scope()->context;

  guard.close();
  guard.close();

  EXPECT_TRUE(context->closed());
  EXPECT_THROW(context->orderBuy("BTCUSDT", 1.0), stratexec::StrategyError);
  EXPECT_FALSE(manager.isOpen("acc-1", "test"));
  EXPECT_EQ(manager.openCount(), 0u);

  EXPECT_NO_THROW(
      manager.open(makeRequest("exec-2"), makeInstance("acc-1", "test")));
}

// -----------------------------------------------------------------------------
// 4. The guard releases the pair when an exception unwinds through it.
// -----------------------------------------------------------------------------
TEST_F(ExecutionScopeManagerTest, ExceptionPathReleasesPair) {
  try {
    auto guard =
        manager.open(makeRequest("exec-1"), makeInstance("acc-1", "test"));
    throw std::runtime_error("strategy blew up");
  } catch (const std::runtime_error&) {
  }

  EXPECT_FALSE(manager.isOpen("acc-1", "test"));
  EXPECT_EQ(manager.openCount(), 0u);
}

// -----------------------------------------------------------------------------
// 5. A moved-from guard does nothing; the new owner closes the scope.
// -----------------------------------------------------------------------------
TEST_F(ExecutionScopeManagerTest, MovedGuardClosesOnce) {
  std::vector<stratexec::ExecutionScopeManager::ScopeGuard> guards;
  {
    auto guard =
        manager.open(makeRequest("exec-1"), makeInstance("acc-1", "test"));
    guards.push_back(std::move(guard));
  }
  EXPECT_TRUE(manager.isOpen("acc-1", "test"));

  guards.clear();
  EXPECT_FALSE(manager.isOpen("acc-1", "test"));
}
