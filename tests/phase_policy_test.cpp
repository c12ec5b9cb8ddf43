// =============================================================================
// phase_policy_test.cpp
// =============================================================================
// Unit tests for stratexec::SessionPhasePolicy and the time helpers it uses.
//
// Validates:
//   - Default sessions per market type (A-share, US, HK, crypto)
//   - Crypto closes at 23:59 UTC; US hours follow daylight saving time
//   - Phase boundaries: open is inclusive, close is exclusive
//   - Session day follows the local calendar of the market
//   - strategy_param overrides and their validation
//   - parse_hhmm / local_minute_of_day edge cases
//   - Civil date helpers and the US Eastern offset rule
// =============================================================================

#include "stratexec/errors/errors.hpp"
#include "stratexec/scheduler/phase_policy.hpp"
#include "stratexec/time/time_utils.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>

using stratexec::domain::MarketPhase;
using stratexec::testing_support::kDayStartMs;

namespace {

constexpr std::int64_t kHourMs = 60 * 60 * 1000;

// 2024-01-02 at hh:mm UTC.
std::int64_t utc(int hours, int minutes = 0) {
  return kDayStartMs + hours * kHourMs + minutes * 60 * 1000;
}

}  // namespace

class SessionPhasePolicyTest : public ::testing::Test {
 protected:
  stratexec::SessionPhasePolicy policy;
  std::map<std::string, std::string> no_params;
};

// -----------------------------------------------------------------------------
// 1. Crypto is open from 00:00 to 23:59 UTC, after close for the last
//    minute of the day.
// -----------------------------------------------------------------------------
TEST_F(SessionPhasePolicyTest, CryptoOpenUntil2359) {
  for (int h = 0; h < 24; ++h) {
    EXPECT_EQ(policy.phaseAt(utc(h), "BTCUSDT", no_params), MarketPhase::Open)
        << "hour " << h;
  }
  EXPECT_EQ(policy.phaseAt(utc(23, 58), "BTCUSDT", no_params),
            MarketPhase::Open);
  EXPECT_EQ(policy.phaseAt(utc(23, 59), "BTCUSDT", no_params),
            MarketPhase::AfterClose);
  EXPECT_EQ(policy.phaseAt(utc(24), "BTCUSDT", no_params), MarketPhase::Open);
}

// -----------------------------------------------------------------------------
// 2. A-share session 09:30-15:00 at UTC+8.
// -----------------------------------------------------------------------------
TEST_F(SessionPhasePolicyTest, AShareSession) {
  const std::string symbol = "600000.XSHG";
  EXPECT_EQ(policy.phaseAt(utc(0), symbol, no_params), MarketPhase::BeforeOpen);
  EXPECT_EQ(policy.phaseAt(utc(1, 29), symbol, no_params),
            MarketPhase::BeforeOpen);
  EXPECT_EQ(policy.phaseAt(utc(1, 30), symbol, no_params), MarketPhase::Open);
  EXPECT_EQ(policy.phaseAt(utc(6, 59), symbol, no_params), MarketPhase::Open);
  EXPECT_EQ(policy.phaseAt(utc(7), symbol, no_params), MarketPhase::AfterClose);
}

// -----------------------------------------------------------------------------
// 3. US session 09:30-16:00 New York time (UTC-5 in January), HK
//    09:30-16:00 at UTC+8.
// -----------------------------------------------------------------------------
TEST_F(SessionPhasePolicyTest, UsAndHkSessions) {
  EXPECT_EQ(policy.phaseAt(utc(14), "AAPL.US", no_params),
            MarketPhase::BeforeOpen);
  EXPECT_EQ(policy.phaseAt(utc(15), "AAPL.US", no_params), MarketPhase::Open);
  EXPECT_EQ(policy.phaseAt(utc(21), "AAPL.US", no_params),
            MarketPhase::AfterClose);

  EXPECT_EQ(policy.phaseAt(utc(2), "00700.HK", no_params), MarketPhase::Open);
  EXPECT_EQ(policy.phaseAt(utc(8, 30), "00700.HK", no_params),
            MarketPhase::AfterClose);
}

// -----------------------------------------------------------------------------
// 3b. US hours move with daylight saving time: 09:30 New York is 14:30 UTC
//     in winter and 13:30 UTC in summer.
// -----------------------------------------------------------------------------
TEST_F(SessionPhasePolicyTest, UsSessionFollowsDaylightSaving) {
  const std::int64_t july_10 =
      stratexec::days_from_civil(2023, 7, 10) * stratexec::kMsPerDay;
  EXPECT_EQ(policy.phaseAt(july_10 + 13 * kHourMs + 29 * 60 * 1000, "AAPL.US",
                           no_params),
            MarketPhase::BeforeOpen);
  EXPECT_EQ(policy.phaseAt(july_10 + 13 * kHourMs + 30 * 60 * 1000, "AAPL.US",
                           no_params),
            MarketPhase::Open);
  EXPECT_EQ(policy.phaseAt(july_10 + 20 * kHourMs, "AAPL.US", no_params),
            MarketPhase::AfterClose);

  // January: standard time.
  EXPECT_EQ(policy.phaseAt(utc(14), "AAPL.US", no_params),
            MarketPhase::BeforeOpen);
  EXPECT_EQ(policy.phaseAt(utc(14, 30), "AAPL.US", no_params),
            MarketPhase::Open);

  // An explicit offset pins the session to that offset all year.
  std::map<std::string, std::string> fixed{
      {"session.utc_offset_minutes", "-300"}};
  EXPECT_EQ(policy.phaseAt(july_10 + 13 * kHourMs + 30 * 60 * 1000, "AAPL.US",
                           fixed),
            MarketPhase::BeforeOpen);
  EXPECT_FALSE(
      stratexec::SessionPhasePolicy::resolve("AAPL.US", fixed).us_eastern_dst);
}

// -----------------------------------------------------------------------------
// 4. The session day is the local calendar day of the market.
// Why: beforeTrading must fire once per local trading day, not per UTC day.
// -----------------------------------------------------------------------------
TEST_F(SessionPhasePolicyTest, SessionDayUsesLocalCalendar) {
  const std::int64_t utc_day = kDayStartMs / stratexec::kMsPerDay;

  EXPECT_EQ(policy.sessionDay(utc(12), "BTCUSDT", no_params), utc_day);
  // 20:00 UTC is already 04:00 the next day in Shanghai.
  EXPECT_EQ(policy.sessionDay(utc(20), "600000.XSHG", no_params), utc_day + 1);
  // 03:00 UTC is still the previous evening in New York.
  EXPECT_EQ(policy.sessionDay(utc(3), "AAPL.US", no_params), utc_day - 1);
}

// -----------------------------------------------------------------------------
// 5. strategy_param overrides the market default.
// -----------------------------------------------------------------------------
TEST_F(SessionPhasePolicyTest, ParamOverrides) {
  std::map<std::string, std::string> params{
      {"session.open", "10:00"},
      {"session.close", "11:00"},
      {"session.utc_offset_minutes", "0"}};
  ASSERT_NO_THROW(policy.validate(params));

  EXPECT_EQ(policy.phaseAt(utc(9, 59), "BTCUSDT", params),
            MarketPhase::BeforeOpen);
  EXPECT_EQ(policy.phaseAt(utc(10, 30), "BTCUSDT", params), MarketPhase::Open);
  EXPECT_EQ(policy.phaseAt(utc(11), "BTCUSDT", params),
            MarketPhase::AfterClose);

  // market_type wins over the symbol suffix.
  std::map<std::string, std::string> typed{{"market_type", "a_stock"}};
  EXPECT_EQ(policy.phaseAt(utc(0), "BTCUSDT", typed), MarketPhase::BeforeOpen);
  EXPECT_EQ(stratexec::SessionPhasePolicy::marketTypeFor("BTCUSDT", typed),
            stratexec::domain::MarketType::AStock);
}

// -----------------------------------------------------------------------------
// 6. validate() rejects params that cannot describe a session.
// -----------------------------------------------------------------------------
TEST_F(SessionPhasePolicyTest, ValidateRejectsBadParams) {
  using Params = std::map<std::string, std::string>;
  EXPECT_THROW(policy.validate(Params{{"session.open", "25:00"}}),
               stratexec::InvalidRequest);
  EXPECT_THROW(policy.validate(Params{{"session.close", "9am"}}),
               stratexec::InvalidRequest);
  EXPECT_THROW(policy.validate(Params{{"session.utc_offset_minutes", "900"}}),
               stratexec::InvalidRequest);
  EXPECT_THROW(policy.validate(Params{{"market_type", "forex"}}),
               stratexec::InvalidRequest);
  EXPECT_THROW(policy.validate(Params{{"session.open", "12:00"},
                                      {"session.close", "11:00"}}),
               stratexec::InvalidRequest);
  EXPECT_NO_THROW(policy.validate(Params{{"session.close", "24:00"}}));
}

// -----------------------------------------------------------------------------
// 7. Time helpers.
// -----------------------------------------------------------------------------
TEST(TimeUtilsTest, ParseHhmmAndMinuteOfDay) {
  EXPECT_EQ(stratexec::parse_hhmm("09:30"), std::optional<int>(570));
  EXPECT_EQ(stratexec::parse_hhmm("24:00"), std::optional<int>(1440));
  EXPECT_FALSE(stratexec::parse_hhmm("24:01").has_value());
  EXPECT_FALSE(stratexec::parse_hhmm("9:3").has_value());
  EXPECT_FALSE(stratexec::parse_hhmm("").has_value());

  EXPECT_EQ(stratexec::local_minute_of_day(utc(1, 30), 8 * 60), 9 * 60 + 30);
  // Negative epoch values still land inside [0, 1440).
  EXPECT_EQ(stratexec::local_minute_of_day(-60 * 1000, 0), 1439);
  EXPECT_EQ(stratexec::local_day_index(-1, 0), -1);
}

// -----------------------------------------------------------------------------
// 8. Civil dates and the US Eastern switch instants.
// How: 2024 DST ran from 2024-03-10 07:00 UTC to 2024-11-03 06:00 UTC.
// -----------------------------------------------------------------------------
TEST(TimeUtilsTest, CivilDatesAndEasternOffset) {
  using stratexec::days_from_civil;
  using stratexec::kMsPerDay;

  EXPECT_EQ(days_from_civil(1970, 1, 1), 0);
  EXPECT_EQ(days_from_civil(2024, 1, 2), kDayStartMs / kMsPerDay);
  EXPECT_EQ(stratexec::format_date(days_from_civil(2024, 2, 29)),
            "2024-02-29");
  EXPECT_EQ(stratexec::parse_date("2024-02-29"),
            std::optional<std::int64_t>(days_from_civil(2024, 2, 29)));
  EXPECT_FALSE(stratexec::parse_date("2023-02-29").has_value());
  EXPECT_FALSE(stratexec::parse_date("2024-13-01").has_value());
  EXPECT_FALSE(stratexec::parse_date("2024/01/01").has_value());

  // 1970-01-01 was a Thursday, 2024-01-06 a Saturday.
  EXPECT_EQ(stratexec::weekday_from_days(0), 3);
  EXPECT_EQ(stratexec::weekday_from_days(days_from_civil(2024, 1, 6)), 5);
  EXPECT_EQ(stratexec::weekday_from_days(-1), 2);

  const std::int64_t start =
      days_from_civil(2024, 3, 10) * kMsPerDay + 7 * kHourMs;
  const std::int64_t end =
      days_from_civil(2024, 11, 3) * kMsPerDay + 6 * kHourMs;
  EXPECT_EQ(stratexec::us_eastern_offset_minutes(start - 1), -300);
  EXPECT_EQ(stratexec::us_eastern_offset_minutes(start), -240);
  EXPECT_EQ(stratexec::us_eastern_offset_minutes(end - 1), -240);
  EXPECT_EQ(stratexec::us_eastern_offset_minutes(end), -300);
}
