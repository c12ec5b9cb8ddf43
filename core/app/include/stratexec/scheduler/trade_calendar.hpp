#pragma once

#include "stratexec/domain/market_type.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace stratexec {

// -----------------------------------------------------------------------------
// TradeCalendar — which local calendar days a market trades on
// -----------------------------------------------------------------------------
//
// @brief  Weekend and holiday rules per market type.
//
// @details
// Crypto trades every day. Stock markets skip their weekend days
// (Saturday and Sunday unless configured) and the listed holidays. Days are
// local calendar day numbers (see time_utils.hpp: days since 1970-01-01).
//
// JSON form, one optional entry per stock market:
//
//   {
//     "A_STOCK":  {"holidays": ["2024-02-12", ...], "weekends": [5, 6]},
//     "US_STOCK": {"holidays": ["2024-07-04"]},
//     "HK_STOCK": {...}
//   }
//
// weekends use 0 = Monday ... 6 = Sunday. A market absent from the file
// keeps the Saturday/Sunday default with no holidays.
//
// Thread model:
//   Immutable after construction; shared read-only by every scope.
// -----------------------------------------------------------------------------
class TradeCalendar {
 public:
  struct MarketRules {
    std::set<int> weekends{5, 6};
    std::set<std::int64_t> holidays;
  };

  // Saturday/Sunday weekends for every stock market, no holidays.
  TradeCalendar() = default;

  // @throws ConfigError on a malformed document.
  static TradeCalendar fromJson(const nlohmann::json& doc);

  // @throws ConfigError if the file cannot be read or is malformed.
  static TradeCalendar load(const std::filesystem::path& path);

  bool isTradeDay(domain::MarketType type, std::int64_t day) const;

  // -------------------------------------------------------------------------
  // tradeDays(type, first_day, last_day)
  // -------------------------------------------------------------------------
  // @return "YYYY-MM-DD" of every trade day in [first_day, last_day],
  //         ascending. Empty when first_day > last_day.
  // -------------------------------------------------------------------------
  std::vector<std::string> tradeDays(domain::MarketType type,
                                     std::int64_t first_day,
                                     std::int64_t last_day) const;

  const MarketRules& rules(domain::MarketType type) const;

 private:
  std::map<domain::MarketType, MarketRules> rules_;
};

}  // namespace stratexec
