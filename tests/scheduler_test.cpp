// =============================================================================
// scheduler_test.cpp
// =============================================================================
// Unit tests for stratexec::Scheduler.
//
// Validates:
//   - Callbacks fire only when their phase matches, in registration order
//   - Per-callback reference instruments are resolved independently
//   - The first failing callback stops the dispatch and becomes a warning,
//     whatever it throws
//   - A cancelled context stops the dispatch
//   - Default callback names
// =============================================================================

#include "stratexec/config/config_lookup_service.hpp"
#include "stratexec/scheduler/scheduler.hpp"
#include "stratexec/strategy/strategy_context.hpp"
#include "stratexec/strategy/strategy_instance.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using stratexec::domain::MarketPhase;
using stratexec::testing_support::makeMarketDataRequest;

namespace {

class NoopStrategy final : public stratexec::IStrategy {
 public:
  void handleBar(stratexec::StrategyContext&,
                 const stratexec::domain::Bar&) override {}
};

}  // namespace

class SchedulerTest : public ::testing::Test {
 protected:
  SchedulerTest()
      : lookup(std::vector<std::filesystem::path>{}),
        instance(std::make_shared<stratexec::StrategyInstance>(
            "acc-1", "test", std::make_unique<NoopStrategy>())),
        ctx(std::make_shared<const stratexec::domain::ExecutionRequest>(
                makeMarketDataRequest("exec-1")),
            instance, lookup, log) {}

  stratexec::Scheduler scheduler;
  std::ostringstream log;
  stratexec::ConfigLookupService lookup;
  std::shared_ptr<stratexec::StrategyInstance> instance;
  stratexec::StrategyContext ctx;
  std::vector<std::string> fired;

  stratexec::ScheduledCallback record(const std::string& name) {
    return [this, name](stratexec::StrategyContext&) { fired.push_back(name); };
  }
};

// -----------------------------------------------------------------------------
// 1. Only callbacks of the current phase fire, in registration order.
// -----------------------------------------------------------------------------
TEST_F(SchedulerTest, FiresMatchingPhaseInOrder) {
  scheduler.registerCallback(record("a"), MarketPhase::Open);
  scheduler.registerCallback(record("b"), MarketPhase::BeforeOpen);
  scheduler.registerCallback(record("c"), MarketPhase::Open);

  auto result = scheduler.dispatch(MarketPhase::Open, ctx);

  EXPECT_EQ(result.fired, 2u);
  EXPECT_FALSE(result.aborted);
  EXPECT_TRUE(result.warnings.empty());
  EXPECT_EQ(fired, (std::vector<std::string>{"a", "c"}));
}

// -----------------------------------------------------------------------------
// 2. Each callback's phase is computed for its own reference instrument.
// -----------------------------------------------------------------------------
TEST_F(SchedulerTest, ResolvesPerReferenceInstrument) {
  scheduler.registerCallback(record("stock"), MarketPhase::BeforeOpen,
                             "600000.XSHG");
  scheduler.registerCallback(record("crypto"), MarketPhase::Open, "BTCUSDT");

  std::vector<std::string> asked;
  auto result = scheduler.dispatch(
      [&asked](const std::string& reference) {
        asked.push_back(reference);
        return reference == "BTCUSDT" ? MarketPhase::Open
                                      : MarketPhase::BeforeOpen;
      },
      ctx);

  EXPECT_EQ(result.fired, 2u);
  EXPECT_EQ(asked, (std::vector<std::string>{"600000.XSHG", "BTCUSDT"}));
}

// -----------------------------------------------------------------------------
// 3. The first failure stops the dispatch and is reported as a warning,
//    together with how many callbacks were skipped.
// Why: A broken callback must degrade the invocation (PartialSuccess), not
//      fail it, and must not leave later callbacks half-applied.
// -----------------------------------------------------------------------------
TEST_F(SchedulerTest, FailureStopsDispatch) {
  scheduler.registerCallback(record("first"), MarketPhase::Open);
  scheduler.registerCallback(
      [](stratexec::StrategyContext&) { throw std::runtime_error("boom"); },
      MarketPhase::Open, {}, "exploder");
  scheduler.registerCallback(record("never"), MarketPhase::Open);

  auto result = scheduler.dispatch(MarketPhase::Open, ctx);

  EXPECT_TRUE(result.aborted);
  EXPECT_EQ(result.fired, 1u);
  EXPECT_EQ(fired, (std::vector<std::string>{"first"}));
  ASSERT_EQ(result.warnings.size(), 2u);
  EXPECT_NE(result.warnings[0].find("'exploder' failed: boom"),
            std::string::npos);
  EXPECT_NE(result.warnings[1].find("1 later scheduled callback"),
            std::string::npos);
}

// -----------------------------------------------------------------------------
// 4. A cancelled context stops the dispatch before the next callback.
// -----------------------------------------------------------------------------
TEST_F(SchedulerTest, CancelledContextStopsDispatch) {
  scheduler.registerCallback(
      [this](stratexec::StrategyContext& c) {
        fired.push_back("cancel");
        c.requestCancel();
      },
      MarketPhase::Open);
  scheduler.registerCallback(record("after"), MarketPhase::Open);

  auto result = scheduler.dispatch(MarketPhase::Open, ctx);

  EXPECT_TRUE(result.aborted);
  EXPECT_EQ(fired, (std::vector<std::string>{"cancel"}));
  ASSERT_EQ(result.warnings.size(), 1u);
  EXPECT_NE(result.warnings[0].find("cancelled"), std::string::npos);
}

// -----------------------------------------------------------------------------
// 5. Unnamed callbacks are labelled by position.
// -----------------------------------------------------------------------------
TEST_F(SchedulerTest, DefaultNames) {
  scheduler.registerCallback(record("x"), MarketPhase::Open);
  scheduler.registerCallback(record("y"), MarketPhase::AfterClose, {}, "eod");

  ASSERT_EQ(scheduler.size(), 2u);
  EXPECT_EQ(scheduler.callbacks()[0].name, "callback#1");
  EXPECT_EQ(scheduler.callbacks()[1].name, "eod");
}

// -----------------------------------------------------------------------------
// 6. A callback throwing something that is not a std::exception is still
//    contained and reported.
// -----------------------------------------------------------------------------
TEST_F(SchedulerTest, NonStandardExceptionStopsDispatch) {
  scheduler.registerCallback(
      [](stratexec::StrategyContext&) { throw 42; }, MarketPhase::Open, {},
      "raw_throw");
  scheduler.registerCallback(record("never"), MarketPhase::Open);

  stratexec::DispatchResult result;
  ASSERT_NO_THROW(result = scheduler.dispatch(MarketPhase::Open, ctx));

  EXPECT_TRUE(result.aborted);
  EXPECT_EQ(result.fired, 0u);
  EXPECT_TRUE(fired.empty());
  ASSERT_EQ(result.warnings.size(), 2u);
  EXPECT_EQ(result.warnings[0],
            "scheduled callback 'raw_throw' failed: unknown exception");
}
