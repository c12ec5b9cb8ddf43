#pragma once

#include "stratexec/strategy/i_strategy.hpp"

#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace stratexec {

// -----------------------------------------------------------------------------
// StrategyRegistry — strategy id → factory
// -----------------------------------------------------------------------------
//
// @brief  The set of strategy implementations the service can run.
//
// @details
// The host registers factories at startup (main() registers the built-in
// strategies). The gateway calls create() when a pair's first trigger
// arrives, and again after a quarantine eviction.
//
// Thread model:
//   add() takes a unique lock, lookups a shared lock; safe from any thread.
// -----------------------------------------------------------------------------
class StrategyRegistry {
 public:
  using Factory = std::function<std::unique_ptr<IStrategy>()>;

  StrategyRegistry() = default;

  StrategyRegistry(const StrategyRegistry&) = delete;
  StrategyRegistry& operator=(const StrategyRegistry&) = delete;

  // @throws std::invalid_argument for an empty id, a null factory, or an
  //         id that is already registered.
  void add(const std::string& strategy_id, Factory factory);

  bool contains(const std::string& strategy_id) const;
  bool empty() const;
  std::vector<std::string> ids() const;

  // -------------------------------------------------------------------------
  // create(strategy_id)
  // -------------------------------------------------------------------------
  // @return A new strategy object.
  // @throws InvalidRequest for an unknown id, StrategyError if the factory
  //         returns null.
  // -------------------------------------------------------------------------
  std::unique_ptr<IStrategy> create(const std::string& strategy_id) const;

 private:
  mutable std::shared_mutex mutex_;
  std::map<std::string, Factory> factories_;
};

}  // namespace stratexec
