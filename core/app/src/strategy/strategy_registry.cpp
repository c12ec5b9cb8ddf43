#include "stratexec/strategy/strategy_registry.hpp"

#include "stratexec/errors/errors.hpp"

#include <iostream>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace stratexec {

void StrategyRegistry::add(const std::string& strategy_id, Factory factory) {
  if (strategy_id.empty()) {
    throw std::invalid_argument("strategy id must not be empty");
  }
  if (!factory) {
    throw std::invalid_argument("strategy factory must not be null");
  }
  std::unique_lock lock(mutex_);
  auto [it, inserted] = factories_.emplace(strategy_id, std::move(factory));
  if (!inserted) {
    throw std::invalid_argument("strategy '" + strategy_id +
                                "' is already registered");
  }
  std::cout << "[StrategyRegistry] registered '" << it->first << "'\n";
}

bool StrategyRegistry::contains(const std::string& strategy_id) const {
  std::shared_lock lock(mutex_);
  return factories_.count(strategy_id) != 0;
}

bool StrategyRegistry::empty() const {
  std::shared_lock lock(mutex_);
  return factories_.empty();
}

std::vector<std::string> StrategyRegistry::ids() const {
  std::shared_lock lock(mutex_);
  std::vector<std::string> out;
  out.reserve(factories_.size());
  for (const auto& [id, factory] : factories_) {
    out.push_back(id);
  }
  return out;
}

std::unique_ptr<IStrategy> StrategyRegistry::create(
    const std::string& strategy_id) const {
  Factory factory;
  {
    std::shared_lock lock(mutex_);
    auto it = factories_.find(strategy_id);
    if (it == factories_.end()) {
      throw InvalidRequest("unknown strategy '" + strategy_id + "'");
    }
    factory = it->second;
  }
  auto strategy = factory();
  if (!strategy) {
    throw StrategyError("factory for '" + strategy_id + "' returned null");
  }
  return strategy;
}

}  // namespace stratexec
