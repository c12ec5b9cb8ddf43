#pragma once

#include "stratexec/domain/order_status.hpp"

#include <optional>
#include <string>

namespace stratexec {
namespace domain {

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Responsibility: Encodes the trading direction of an order. Values are the
// caller's direction_type wire codes (0 is reserved for "unset").
// -----------------------------------------------------------------------------
enum class Side {
  Invalid = 0,
  Buy = 1,
  Sell = 2,
};

// -----------------------------------------------------------------------------
// OrderType
// -----------------------------------------------------------------------------
// Responsibility: Execution style of an order. The strategy helpers only
// create Market (no price given) and Limit (price given) orders; the stop
// variants are decoded so that order snapshots round-trip unchanged.
// -----------------------------------------------------------------------------
enum class OrderType {
  Invalid = 0,
  Market = 1,
  Limit = 2,
  StopMarket = 3,
  StopLimit = 4,
};

// -----------------------------------------------------------------------------
// TimeInForce
// -----------------------------------------------------------------------------
// Responsibility: Lifetime policy of a created order. Every order declared
// by a strategy is good-till-cancelled (wire code 2).
// -----------------------------------------------------------------------------
enum class TimeInForce {
  Invalid = 0,
  Gtc = 2,
};

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
// Responsibility: One order as seen by a strategy: either a snapshot passed
// in with the request (incomplete/completed orders, ORDER_STATUS trigger)
// or the payload of an operation the strategy declares.
//
// @details
// order_id is assigned by the trade server and is empty for orders the
// strategy has just declared. unique_id is the client id; for declared
// orders it is "<exec_id>_<n>" with n counting from 1 within one
// invocation, so a redelivered request declares the same ids.
//
// Value semantics: copied into responses and contexts, never shared by
// reference across threads.
// -----------------------------------------------------------------------------
struct Order {
  std::string order_id;
  std::string unique_id;
  std::string symbol;
  Side side{Side::Invalid};
  OrderType type{OrderType::Invalid};
  double qty{0.0};
  std::optional<double> limit_price;
  OrderStatus status{OrderStatus::Invalid};
  double executed_size{0.0};
  std::optional<double> avg_fill_price;
  std::optional<double> commission;
  std::string cancel_reason;
  TimeInForce time_in_force{TimeInForce::Invalid};
};

}  // namespace domain
}  // namespace stratexec
