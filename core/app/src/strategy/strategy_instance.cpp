#include "stratexec/strategy/strategy_instance.hpp"

#include <stdexcept>
#include <utility>

namespace stratexec {

StrategyInstance::StrategyInstance(std::string account_id,
                                   std::string strategy_id,
                                   std::unique_ptr<IStrategy> strategy)
    : account_id_(std::move(account_id)),
      strategy_id_(std::move(strategy_id)),
      strategy_(std::move(strategy)),
      settings_(nlohmann::json::object(
          {{"benchmark", nullptr},
           {"options", nlohmann::json::object()},
           {"order_costs", nlohmann::json::object()}})) {
  if (!strategy_) {
    throw std::invalid_argument("StrategyInstance requires a strategy");
  }
}

}  // namespace stratexec
