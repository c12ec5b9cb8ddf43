#pragma once

#include <string>
#include <vector>

namespace stratexec {
namespace domain {

// -----------------------------------------------------------------------------
// Balance — free/locked amount of one asset
// -----------------------------------------------------------------------------
struct Balance {
  std::string asset;
  double free{0.0};
  double locked{0.0};
};

// -----------------------------------------------------------------------------
// Position — per-symbol holding as reported by the trade server
// -----------------------------------------------------------------------------
//
// @brief  Snapshot of one instrument's holding at the time the trigger was
//         produced.
//
// @details
// Sign convention for quantity:
//   positive → long
//   negative → short
//   zero     → flat
//
// average_cost_price is the weighted entry cost reported by the venue; the
// service never recomputes it. It is also the price used when a strategy
// asks for the portfolio's positions value.
//
// Thread model:
//   Value type. Lives inside the immutable ExecutionRequest.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;
  double quantity{0.0};
  double average_cost_price{0.0};
  double unrealized_pnl{0.0};
  int side{0};
};

// -----------------------------------------------------------------------------
// Account — account snapshot carried by every ExecutionRequest
// -----------------------------------------------------------------------------
//
// @brief  Identity, margin figures, balances, and positions of the account
//         the trigger belongs to.
//
// @details
// account_id is half of the (account, strategy) pair that keys scope,
// serialization lane, and strategy instance. An empty account_id is
// rejected by the gateway.
// -----------------------------------------------------------------------------
struct Account {
  std::string account_id;
  int account_type{0};
  double total_net_value{0.0};
  double available_margin{0.0};
  double margin_ratio{0.0};
  double risk_level{0.0};
  double leverage{0.0};
  std::vector<Balance> balances;
  std::vector<Position> positions;
};

}  // namespace domain
}  // namespace stratexec
