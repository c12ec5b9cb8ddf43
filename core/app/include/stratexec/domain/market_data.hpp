#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace stratexec {
namespace domain {

// -----------------------------------------------------------------------------
// Bar — one OHLCV candle
// -----------------------------------------------------------------------------
// open_time / close_time are epoch milliseconds (UTC).
// -----------------------------------------------------------------------------
struct Bar {
  std::int64_t open_time{0};
  std::int64_t close_time{0};
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  double volume{0.0};
};

// -----------------------------------------------------------------------------
// MarketDataContext — bars of one (symbol, timeframe) pair
// -----------------------------------------------------------------------------
//
// @brief  One entry of the request's market_data_context list.
//
// @details
// bars are ordered oldest first; the last element is the most recent bar.
// timeframe is an opaque resolution label such as "1m", "15m", "1d" and is
// compared verbatim by the data adapter.
// -----------------------------------------------------------------------------
struct MarketDataContext {
  std::string symbol;
  std::string timeframe;
  std::vector<Bar> bars;
};

}  // namespace domain
}  // namespace stratexec
