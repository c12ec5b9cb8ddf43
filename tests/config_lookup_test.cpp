// =============================================================================
// config_lookup_test.cpp
// =============================================================================
// Unit tests for stratexec::ConfigLookupService.
//
// Validates:
//   - tradingRule / commissionRate parse descriptor records
//   - Layered search: the first location listing the instrument wins, with
//     no merging across locations
//   - NotFound for unknown instruments, MalformedDescriptor for bad entries
//   - Caching: a warm lookup does not re-parse; a changed file does;
//     NotFound is cached the same way
//   - Concurrent cold lookups of one key parse once
//   - isKnownVenue / supportedSymbols
//
// Each test builds its own descriptor tree in a TempDir.
// =============================================================================

#include "stratexec/config/config_lookup_service.hpp"
#include "stratexec/errors/errors.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>
#include <vector>

using stratexec::testing_support::TempDir;
using stratexec::testing_support::writeDescriptors;
using stratexec::testing_support::writeFile;

namespace fs = std::filesystem;

class ConfigLookupTest : public ::testing::Test {
 protected:
  TempDir override_dir;
  TempDir project_dir;
  std::atomic<int> parses{0};

  stratexec::ConfigLookupService::ParseObserver counter() {
    return [this](const fs::path&) { parses.fetch_add(1); };
  }
};

// -----------------------------------------------------------------------------
// 1. A record in the only location is parsed into a TradingRule.
// -----------------------------------------------------------------------------
TEST_F(ConfigLookupTest, ReadsTradingRule) {
  writeDescriptors(project_dir.path());
  stratexec::ConfigLookupService lookup({project_dir.path()});

  auto rule = lookup.tradingRule("binance", "BTCUSDT");
  EXPECT_DOUBLE_EQ(rule.min_quantity, 0.00001);
  EXPECT_DOUBLE_EQ(rule.price_tick, 0.01);
  EXPECT_EQ(rule.price_precision, 2);
  EXPECT_EQ(rule.quantity_precision, 5);
  EXPECT_DOUBLE_EQ(rule.max_leverage, 125.0);

  // max_leverage defaults to 1 when absent.
  EXPECT_DOUBLE_EQ(lookup.tradingRule("binance", "ETHUSDT").max_leverage, 1.0);
}

// -----------------------------------------------------------------------------
// 2. Commission rates; venue names are case-insensitive.
// -----------------------------------------------------------------------------
TEST_F(ConfigLookupTest, ReadsCommissionRateCaseInsensitiveVenue) {
  writeDescriptors(project_dir.path());
  stratexec::ConfigLookupService lookup({project_dir.path()});

  auto rate = lookup.commissionRate("BINANCE", "BTCUSDT");
  EXPECT_DOUBLE_EQ(rate.maker_fee_rate, 0.0002);
  EXPECT_DOUBLE_EQ(rate.taker_fee_rate, 0.0004);
}

// -----------------------------------------------------------------------------
// 3. The higher-priority location wins when both list the instrument.
// -----------------------------------------------------------------------------
TEST_F(ConfigLookupTest, OverrideLocationWins) {
  writeDescriptors(project_dir.path(), "binance", 0.01);
  writeDescriptors(override_dir.path(), "binance", 0.5);
  stratexec::ConfigLookupService lookup(
      {override_dir.path(), project_dir.path()});

  EXPECT_DOUBLE_EQ(lookup.tradingRule("binance", "BTCUSDT").price_tick, 0.5);
}

// -----------------------------------------------------------------------------
// 4. A location whose file lacks the instrument is skipped; fields are never
//    merged from two locations.
// -----------------------------------------------------------------------------
TEST_F(ConfigLookupTest, FallsThroughWithoutMerging) {
  writeDescriptors(project_dir.path());
  writeFile(override_dir.path() / "binance" / "trading_rules.json",
            R"({"SOLUSDT": {"min_quantity": 0.01, "quantity_step": 0.01,
                "min_price": 0.001, "price_tick": 0.001,
                "price_precision": 3, "quantity_precision": 2}})");
  stratexec::ConfigLookupService lookup(
      {override_dir.path(), project_dir.path()});

  EXPECT_DOUBLE_EQ(lookup.tradingRule("binance", "BTCUSDT").price_tick, 0.01);
  EXPECT_DOUBLE_EQ(lookup.tradingRule("binance", "SOLUSDT").price_tick, 0.001);
}

// -----------------------------------------------------------------------------
// 5. Unknown instrument → NotFound.
// -----------------------------------------------------------------------------
TEST_F(ConfigLookupTest, UnknownInstrumentIsNotFound) {
  writeDescriptors(project_dir.path());
  stratexec::ConfigLookupService lookup({project_dir.path()});

  EXPECT_THROW(lookup.tradingRule("binance", "DOGEUSDT"), stratexec::NotFound);
  EXPECT_THROW(lookup.commissionRate("okx", "BTCUSDT"), stratexec::NotFound);
}

// -----------------------------------------------------------------------------
// 6. Structurally invalid entries → MalformedDescriptor, and a malformed
//    match does not fall through to a lower-priority location.
// -----------------------------------------------------------------------------
TEST_F(ConfigLookupTest, MalformedEntryIsReported) {
  writeDescriptors(project_dir.path());
  writeFile(override_dir.path() / "binance" / "trading_rules.json",
            R"({"BTCUSDT": {"min_quantity": 0.1, "quantity_step": 0,
                "min_price": 0.01, "price_tick": 0.01,
                "price_precision": 2, "quantity_precision": 5}})");
  stratexec::ConfigLookupService lookup(
      {override_dir.path(), project_dir.path()});

  EXPECT_THROW(lookup.tradingRule("binance", "BTCUSDT"),
               stratexec::MalformedDescriptor);
}

// -----------------------------------------------------------------------------
// 7. Invalid JSON and a missing required field are both malformed.
// -----------------------------------------------------------------------------
TEST_F(ConfigLookupTest, InvalidJsonAndMissingField) {
  writeFile(project_dir.path() / "binance" / "trading_rules.json", "{not json");
  writeFile(project_dir.path() / "binance" / "commission_rates.json",
            R"({"BTCUSDT": {"maker_fee_rate": 0.001}})");
  stratexec::ConfigLookupService lookup({project_dir.path()});

  EXPECT_THROW(lookup.tradingRule("binance", "BTCUSDT"),
               stratexec::MalformedDescriptor);
  EXPECT_THROW(lookup.commissionRate("binance", "BTCUSDT"),
               stratexec::MalformedDescriptor);
}

// -----------------------------------------------------------------------------
// 8. A warm lookup is served from the cache without re-parsing.
// -----------------------------------------------------------------------------
TEST_F(ConfigLookupTest, WarmLookupDoesNotReparse) {
  writeDescriptors(project_dir.path());
  stratexec::ConfigLookupService lookup({project_dir.path()}, counter());

  lookup.tradingRule("binance", "BTCUSDT");
  ASSERT_EQ(parses.load(), 1);
  for (int i = 0; i < 10; ++i) {
    lookup.tradingRule("binance", "BTCUSDT");
  }
  EXPECT_EQ(parses.load(), 1);
}

// -----------------------------------------------------------------------------
// 9. Changing the file invalidates the cached entry.
// Why: Descriptors are edited in place; a stale rule would size orders with
//      the wrong tick.
// -----------------------------------------------------------------------------
TEST_F(ConfigLookupTest, ChangedFileIsReloaded) {
  writeDescriptors(project_dir.path(), "binance", 0.01);
  stratexec::ConfigLookupService lookup({project_dir.path()}, counter());
  ASSERT_DOUBLE_EQ(lookup.tradingRule("binance", "BTCUSDT").price_tick, 0.01);

  // Different content length guarantees a different stamp even on
  // filesystems with coarse mtime resolution.
  writeDescriptors(project_dir.path(), "binance", 12.5);
  EXPECT_DOUBLE_EQ(lookup.tradingRule("binance", "BTCUSDT").price_tick, 12.5);
  EXPECT_EQ(parses.load(), 2);
}

// -----------------------------------------------------------------------------
// 10. A higher-priority file appearing after the first lookup takes over.
// -----------------------------------------------------------------------------
TEST_F(ConfigLookupTest, NewOverrideFileTakesOver) {
  writeDescriptors(project_dir.path(), "binance", 0.01);
  stratexec::ConfigLookupService lookup(
      {override_dir.path(), project_dir.path()});
  ASSERT_DOUBLE_EQ(lookup.tradingRule("binance", "BTCUSDT").price_tick, 0.01);

  writeDescriptors(override_dir.path(), "binance", 0.5);
  EXPECT_DOUBLE_EQ(lookup.tradingRule("binance", "BTCUSDT").price_tick, 0.5);
}

// -----------------------------------------------------------------------------
// 11. Concurrent cold lookups of the same key parse the file exactly once.
// -----------------------------------------------------------------------------
TEST_F(ConfigLookupTest, ConcurrentColdLookupParsesOnce) {
  writeDescriptors(project_dir.path());
  stratexec::ConfigLookupService lookup({project_dir.path()}, counter());

  constexpr int kThreads = 8;
  std::atomic<int> ok{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      if (lookup.tradingRule("binance", "BTCUSDT").price_precision == 2) {
        ok.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(ok.load(), kThreads);
  EXPECT_EQ(parses.load(), 1);
}

// -----------------------------------------------------------------------------
// 12. Venue discovery and symbol listing across locations.
// -----------------------------------------------------------------------------
TEST_F(ConfigLookupTest, KnownVenuesAndSymbols) {
  writeDescriptors(project_dir.path());
  writeFile(override_dir.path() / "binance" / "trading_rules.json",
            R"({"SOLUSDT": {"min_quantity": 0.01, "quantity_step": 0.01,
                "min_price": 0.001, "price_tick": 0.001,
                "price_precision": 3, "quantity_precision": 2}})");
  stratexec::ConfigLookupService lookup(
      {override_dir.path(), project_dir.path()});

  EXPECT_TRUE(lookup.isKnownVenue("binance"));
  EXPECT_TRUE(lookup.isKnownVenue("Binance"));
  EXPECT_FALSE(lookup.isKnownVenue("okx"));
  EXPECT_FALSE(lookup.isKnownVenue(""));

  std::vector<std::string> expected{"BTCUSDT", "ETHUSDT", "SOLUSDT"};
  EXPECT_EQ(lookup.supportedSymbols("binance"), expected);
}

// -----------------------------------------------------------------------------
// 13. NotFound is cached: repeated misses do not re-parse, and a file that
//     starts listing the instrument is picked up.
// -----------------------------------------------------------------------------
TEST_F(ConfigLookupTest, NotFoundIsCachedUntilFilesChange) {
  writeDescriptors(project_dir.path());
  stratexec::ConfigLookupService lookup(
      {override_dir.path(), project_dir.path()}, counter());

  EXPECT_THROW(lookup.tradingRule("binance", "SOLUSDT"), stratexec::NotFound);
  ASSERT_EQ(parses.load(), 1);
  for (int i = 0; i < 5; ++i) {
    EXPECT_THROW(lookup.tradingRule("binance", "SOLUSDT"),
                 stratexec::NotFound);
  }
  EXPECT_EQ(parses.load(), 1);

  writeFile(override_dir.path() / "binance" / "trading_rules.json",
            R"({"SOLUSDT": {"min_quantity": 0.01, "quantity_step": 0.01,
                "min_price": 0.001, "price_tick": 0.001,
                "price_precision": 3, "quantity_precision": 2}})");
  EXPECT_EQ(lookup.tradingRule("binance", "SOLUSDT").price_precision, 3);
  EXPECT_EQ(parses.load(), 2);
}
