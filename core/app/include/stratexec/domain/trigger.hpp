#pragma once

#include "stratexec/domain/order.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace stratexec {
namespace domain {

// -----------------------------------------------------------------------------
// TriggerType — wire codes of the event that caused an Exec call
// -----------------------------------------------------------------------------
enum class TriggerType {
  Invalid = 0,
  MarketData = 1,
  RiskManage = 2,
  OrderStatus = 3,
};

// A new bar closed for (symbol, timeframe). Empty fields mean "the first
// market_data_context entry".
struct MarketDataTrigger {
  std::string symbol;
  std::string timeframe;
};

// The risk system raised an event for the account.
struct RiskManageTrigger {
  int risk_event_type{0};
  std::string remark;
};

// One of the account's orders changed state.
struct OrderStatusTrigger {
  Order order;
};

// -----------------------------------------------------------------------------
// Trigger — tagged union of the three trigger kinds
// -----------------------------------------------------------------------------
//
// @brief  The event a single Exec invocation reacts to.
//
// @details
// The active alternative of `detail` is the kind; type() derives the wire
// code from it so the two can never disagree. timestamp_ms is the event
// time in epoch milliseconds (UTC) and drives market-phase computation.
// When the caller does not supply one, the codec falls back to the close
// time of the latest bar.
//
// Thread model:
//   Immutable once decoded. Value type.
// -----------------------------------------------------------------------------
struct Trigger {
  std::variant<MarketDataTrigger, RiskManageTrigger, OrderStatusTrigger>
      detail;
  std::int64_t timestamp_ms{0};

  TriggerType type() const {
    switch (detail.index()) {
      case 0: return TriggerType::MarketData;
      case 1: return TriggerType::RiskManage;
      case 2: return TriggerType::OrderStatus;
    }
    return TriggerType::Invalid;
  }
};

inline const char* triggerTypeName(TriggerType type) {
  switch (type) {
    case TriggerType::Invalid:     return "INVALID";
    case TriggerType::MarketData:  return "MARKET_DATA";
    case TriggerType::RiskManage:  return "RISK_MANAGE";
    case TriggerType::OrderStatus: return "ORDER_STATUS";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace stratexec
