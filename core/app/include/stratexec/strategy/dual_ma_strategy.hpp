#pragma once

#include "stratexec/strategy/i_strategy.hpp"

#include <string>

namespace stratexec {

// -----------------------------------------------------------------------------
// DualMaStrategy — dual moving-average crossover
// -----------------------------------------------------------------------------
//
// @brief  Built-in sample strategy registered by the server as "dual_ma".
//
// @details
// On every bar it averages the close of the last short_window and
// long_window bars of (symbol, timeframe), for the current and the
// previous bar:
//
//   golden cross (short crosses above long) and flat/short → buy quantity
//   death cross  (short crosses below long) and long       → sell quantity
//
// strategy_param keys (defaults in parentheses):
//   symbol        (first market_data_context symbol)
//   timeframe     (first market_data_context timeframe)
//   short_window  (5)
//   long_window   (10)
//   quantity      (0.01)
//
// A before-open callback resets g["signals_today"]; handleBar increments it
// and stores the last signal in g["last_signal"].
//
// Thread model: Called by the gateway only; never concurrently.
// -----------------------------------------------------------------------------
class DualMaStrategy final : public IStrategy {
 public:
  void initialize(StrategyContext& ctx) override;
  void beforeTrading(StrategyContext& ctx) override;
  void handleBar(StrategyContext& ctx, const domain::Bar& bar) override;
  void onOrder(StrategyContext& ctx, const domain::Order& order) override;
  void onRiskEvent(StrategyContext& ctx,
                   const domain::RiskManageTrigger& event) override;

 private:
  std::string symbol_;
  std::string timeframe_;
  int short_window_{5};
  int long_window_{10};
  double quantity_{0.01};
};

}  // namespace stratexec
