#pragma once

#include "stratexec/domain/account.hpp"
#include "stratexec/domain/market_data.hpp"
#include "stratexec/domain/order.hpp"
#include "stratexec/domain/trigger.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stratexec {
namespace domain {

// -----------------------------------------------------------------------------
// ExecutionRequest — everything one Exec call is allowed to see
// -----------------------------------------------------------------------------
//
// @brief  Trigger plus the account, order, and market-data snapshots that
//         came with it, and the caller's opaque strategy parameters.
//
// @details
// Fields:
//   max_timeout          seconds the strategy call may run (> 0)
//   trigger              absent when the caller sent trigger_type 0 or none;
//                        such requests are rejected
//   market_data_context  one entry per (symbol, timeframe)
//   exchange             venue id; selects the descriptor directory
//   exec_id              idempotency key
//   strategy_id          which registered strategy to run; empty selects the
//                        gateway's default strategy
//   strategy_param       passed to the strategy unmodified
//
// Ownership:
//   Owned by exactly one gateway invocation. The scope that runs the
//   strategy holds it through a shared_ptr<const ExecutionRequest> so an
//   abandoned runner thread never reads freed memory.
// -----------------------------------------------------------------------------
struct ExecutionRequest {
  double max_timeout{0.0};
  std::optional<Trigger> trigger;
  std::vector<MarketDataContext> market_data_context;
  Account account;
  std::vector<Order> incomplete_orders;
  std::vector<Order> completed_orders;
  std::string exchange;
  std::string exec_id;
  std::string strategy_id;
  std::map<std::string, std::string> strategy_param;
};

}  // namespace domain
}  // namespace stratexec
