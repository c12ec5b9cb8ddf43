#pragma once

#include "stratexec/domain/market_data.hpp"
#include "stratexec/domain/order.hpp"
#include "stratexec/domain/trigger.hpp"

namespace stratexec {

class StrategyContext;

// -----------------------------------------------------------------------------
// IStrategy — the fixed interface user strategies implement
// -----------------------------------------------------------------------------
//
// @brief  Entry points the gateway invokes on a strategy instance.
//
// @details
// Call order within one Exec invocation (all on the same runner thread):
//
//   1. initialize(ctx)     once per instance, on its first trigger. The only
//                          place ctx.runDaily() is accepted.
//   2. beforeTrading(ctx)  once per session day, on the first trigger of a
//                          new day.
//   3. scheduled callbacks registered with runDaily() whose phase matches.
//   4. exactly one of handleBar / onOrder / onRiskEvent, selected by the
//      trigger kind.
//
// Orders are declared through ctx (orderBuy, cancelOrder, ...); the
// declared operations form the response. Per-strategy state that must
// survive between triggers goes into ctx.g(), or into members of the
// implementing class: one object is created per (account, strategy) pair.
//
// Exceptions thrown from initialize() or the entry point fail the
// invocation; those thrown from beforeTrading() or scheduled callbacks
// become warnings.
//
// Thread model:
//   Never called concurrently for the same instance.
// -----------------------------------------------------------------------------
class IStrategy {
 public:
  virtual ~IStrategy() = default;

  virtual void initialize(StrategyContext& /*ctx*/) {}
  virtual void beforeTrading(StrategyContext& /*ctx*/) {}

  virtual void handleBar(StrategyContext& ctx, const domain::Bar& bar) = 0;

  virtual void onOrder(StrategyContext& /*ctx*/,
                       const domain::Order& /*order*/) {}
  virtual void onRiskEvent(StrategyContext& /*ctx*/,
                           const domain::RiskManageTrigger& /*event*/) {}
};

}  // namespace stratexec
