#pragma once

#include "stratexec/domain/execution_request.hpp"
#include "stratexec/domain/market_data.hpp"
#include "stratexec/domain/order.hpp"
#include "stratexec/scheduler/trade_calendar.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stratexec {

// -----------------------------------------------------------------------------
// InstrumentMetadata — what the request's snapshots say about one symbol
// -----------------------------------------------------------------------------
struct InstrumentMetadata {
  std::string symbol;
  std::string market_type;              // "a_stock", "us_stock", "hk_stock", "crypto"
  std::vector<std::string> resolutions; // timeframes present, in request order
  std::size_t bar_count{0};             // across all resolutions
  std::int64_t first_open_time{0};
  std::int64_t last_close_time{0};
};

// -----------------------------------------------------------------------------
// FillRecord — execution summary of one order with fills
// -----------------------------------------------------------------------------
struct FillRecord {
  std::string order_id;
  std::string unique_id;
  std::string symbol;
  domain::Side side{domain::Side::Invalid};
  double executed_size{0.0};
  double avg_fill_price{0.0};
  double commission{0.0};
  domain::OrderStatus status{domain::OrderStatus::Invalid};
};

// -----------------------------------------------------------------------------
// PriceFrame — columns of price() in bar order, oldest first
// -----------------------------------------------------------------------------
struct PriceFrame {
  std::vector<std::int64_t> close_time;
  std::map<std::string, std::vector<double>> columns;  // field → values
};

// -----------------------------------------------------------------------------
// ContextDataAdapter — read-only data queries over one request's snapshots
// -----------------------------------------------------------------------------
//
// @brief  Answers history / metadata / trade queries strictly from the
//         market-data and order snapshots carried by one ExecutionRequest.
//
// @details
// Constructed fresh for every scope from a shared_ptr to the request; it
// performs no I/O and holds no state shared with other scopes. A query the
// snapshots cannot answer raises InsufficientData; the adapter never pads
// with synthetic bars. Trade-day queries use the shared TradeCalendar, or
// Saturday/Sunday weekends with no holidays when none is given.
//
// Thread model:
//   Immutable after construction; all methods are const and safe to call
//   from any thread.
//
// Ownership:
//   Shares ownership of the request so it stays valid even if the runner
//   thread outlives the gateway call that created it.
// -----------------------------------------------------------------------------
class ContextDataAdapter {
 public:
  explicit ContextDataAdapter(
      std::shared_ptr<const domain::ExecutionRequest> request,
      std::shared_ptr<const TradeCalendar> calendar = nullptr);

  // -------------------------------------------------------------------------
  // history(instrument, count, resolution)
  // -------------------------------------------------------------------------
  //
  // @brief  The most recent `count` bars of (instrument, resolution).
  //
  // @return Bars ordered oldest first. count == 0 yields an empty vector.
  //
  // @throws InsufficientData if no snapshot matches (instrument,
  //         resolution), if count exceeds the bars supplied, or if count is
  //         negative.
  //
  // Thread-safety: Safe from any thread.
  // -------------------------------------------------------------------------
  std::vector<domain::Bar> history(const std::string& instrument, int count,
                                   const std::string& resolution) const;

  // -------------------------------------------------------------------------
  // instrumentMetadata(instrument)
  // -------------------------------------------------------------------------
  //
  // @throws InsufficientData if the request carries no snapshot for it.
  // -------------------------------------------------------------------------
  InstrumentMetadata instrumentMetadata(const std::string& instrument) const;

  // -------------------------------------------------------------------------
  // trades()
  // -------------------------------------------------------------------------
  //
  // @return order_id → FillRecord for every incomplete or completed order
  //         with executed_size > 0. Orders without an order_id are keyed
  //         by unique_id.
  // -------------------------------------------------------------------------
  std::map<std::string, FillRecord> trades() const;

  // Sorted, unique symbols of all market-data snapshots.
  std::vector<std::string> allSymbols() const;

  // Latest bar of the first snapshot, if that snapshot has bars.
  std::optional<domain::Bar> currentBar() const;

  // Latest bar of (instrument, any resolution), preferring the first
  // matching snapshot.
  std::optional<domain::Bar> latestBar(const std::string& instrument) const;

  const std::vector<domain::Order>& incompleteOrders() const;
  const std::vector<domain::Order>& completedOrders() const;

  // -------------------------------------------------------------------------
  // price(instrument, count, resolution, fields)
  // -------------------------------------------------------------------------
  //
  // @brief  history() laid out as columns.
  //
  // @param  fields  Subset of open, high, low, close, volume. Unknown names
  //                 are ignored; when none is known, or fields is empty,
  //                 every column is returned.
  //
  // @throws InsufficientData as history().
  // -------------------------------------------------------------------------
  PriceFrame price(const std::string& instrument, int count = 20,
                   const std::string& resolution = "1h",
                   const std::vector<std::string>& fields = {}) const;

  // -------------------------------------------------------------------------
  // tradeDays(start_date, end_date, count)
  // -------------------------------------------------------------------------
  //
  // @brief  Trade days ("YYYY-MM-DD", ascending) of the market of the first
  //         snapshot's symbol ("market_type" param first).
  //
  // @details
  // The data range is the UTC calendar days spanned by the bar close times
  // in the request.
  //   start and end   [start, end]
  //   start only      [start, last data day]
  //   count only      the `count` calendar days ending on the last data day
  //   nothing         the data range
  // Empty when the request carries no bars.
  //
  // @throws StrategyError on a malformed date or a count <= 0.
  // -------------------------------------------------------------------------
  std::vector<std::string> tradeDays(
      const std::optional<std::string>& start_date = std::nullopt,
      const std::optional<std::string>& end_date = std::nullopt,
      std::optional<int> count = std::nullopt) const;

  // @throws StrategyError on a malformed date.
  bool isTradeDay(const std::string& date) const;

 private:
  const domain::MarketDataContext* find(const std::string& instrument,
                                        const std::string& resolution) const;

  domain::MarketType primaryMarketType() const;
  const TradeCalendar& calendar() const;

  std::shared_ptr<const domain::ExecutionRequest> request_;
  std::shared_ptr<const TradeCalendar> calendar_;
};

}  // namespace stratexec
