#pragma once

#include "stratexec/domain/order.hpp"

#include <string>
#include <vector>

namespace stratexec {
namespace domain {

enum class ExecStatus {
  Success = 0,
  PartialSuccess = 1,
  Failed = 2,
};

// Create declares a new order, Withdraw cancels one by order_id (or
// unique_id), Modify replaces price/quantity of an open order.
enum class OrderOpType {
  Invalid = 0,
  Create = 1,
  Withdraw = 2,
  Modify = 3,
};

struct OrderOperation {
  OrderOpType op_type{OrderOpType::Invalid};
  Order order;
};

// -----------------------------------------------------------------------------
// ExecutionResponse — the single answer to one accepted ExecutionRequest
// -----------------------------------------------------------------------------
//
// @details
// order_op_event keeps the order in which the strategy declared operations.
// error_message is non-empty iff status is Failed. warnings collect
// recoverable problems (failed scheduled callbacks, failed before-trading
// hook); any warning downgrades Success to PartialSuccess.
//
// Responses are stored verbatim in the dedup cache, so a repeated exec_id
// receives a value equal to the first one.
// -----------------------------------------------------------------------------
struct ExecutionResponse {
  ExecStatus status{ExecStatus::Success};
  std::vector<OrderOperation> order_op_event;
  std::string error_message;
  std::vector<std::string> warnings;
};

inline const char* execStatusName(ExecStatus status) {
  switch (status) {
    case ExecStatus::Success:        return "SUCCESS";
    case ExecStatus::PartialSuccess: return "PARTIAL_SUCCESS";
    case ExecStatus::Failed:         return "FAILED";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace stratexec
