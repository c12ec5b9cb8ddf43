#pragma once

#include "stratexec/scheduler/scheduler.hpp"
#include "stratexec/strategy/i_strategy.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace stratexec {

// -----------------------------------------------------------------------------
// StrategyInstance — persistent state of one (account, strategy) pair
// -----------------------------------------------------------------------------
//
// @brief  Bundles everything that survives from one trigger to the next for
//         a pair: the strategy object, its `g` namespace, its Scheduler
//         registrations, the settings it stored (benchmark, options, order
//         costs), and lifecycle bookkeeping.
//
// @details
// Created lazily by the gateway on the pair's first trigger and reused by
// every later trigger of the same pair. When a call on the instance is
// abandoned after a timeout, the gateway evicts the instance; the runner
// that still holds it keeps it alive through its shared_ptr, and the next
// trigger gets a fresh instance that re-runs initialize().
//
// Thread model:
//   Not internally synchronized. The gateway's per-pair serialization
//   ensures one invocation at a time; eviction ensures an abandoned runner
//   never shares the instance with a later invocation.
//
// Ownership:
//   shared_ptr, held by the gateway's instance table and by each scope that
//   uses it.
// -----------------------------------------------------------------------------
class StrategyInstance {
 public:
  StrategyInstance(std::string account_id, std::string strategy_id,
                   std::unique_ptr<IStrategy> strategy);

  StrategyInstance(const StrategyInstance&) = delete;
  StrategyInstance& operator=(const StrategyInstance&) = delete;
  StrategyInstance(StrategyInstance&&) = delete;
  StrategyInstance& operator=(StrategyInstance&&) = delete;

  const std::string& accountId() const { return account_id_; }
  const std::string& strategyId() const { return strategy_id_; }

  IStrategy& strategy() { return *strategy_; }
  Scheduler& scheduler() { return scheduler_; }
  const Scheduler& scheduler() const { return scheduler_; }

  // The strategy's global namespace (`g`). Starts as an empty JSON object.
  nlohmann::json& globals() { return globals_; }

  // {"benchmark": ..., "options": {...}, "order_costs": {...}}
  nlohmann::json& settings() { return settings_; }

  bool initialized() const { return initialized_; }
  void markInitialized() { initialized_ = true; }

  // Session day of the last beforeTrading() call, if any.
  std::optional<std::int64_t> lastBeforeTradingDay() const {
    return last_before_trading_day_;
  }
  void setLastBeforeTradingDay(std::int64_t day) {
    last_before_trading_day_ = day;
  }

 private:
  std::string account_id_;
  std::string strategy_id_;
  std::unique_ptr<IStrategy> strategy_;
  Scheduler scheduler_;
  nlohmann::json globals_ = nlohmann::json::object();
  nlohmann::json settings_;
  bool initialized_{false};
  std::optional<std::int64_t> last_before_trading_day_;
};

}  // namespace stratexec
