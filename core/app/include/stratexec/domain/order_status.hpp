#pragma once

namespace stratexec {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus — order lifecycle state as reported by the trade server
// -----------------------------------------------------------------------------
//
// @brief  Enumerates the states an order snapshot can be in when it arrives
//         with an ExecutionRequest (incomplete_orders / completed_orders, or
//         the order attached to an ORDER_STATUS trigger).
//
// @details
// The numeric values are the wire codes used by the caller and are encoded
// verbatim by the JSON codec:
//
//   Open ──> PartiallyFilled ──> Filled
//    │              │
//    ├──> PendingCancel ──> Canceled
//    └──> Rejected / Expired
//
// Terminal states: Filled, Canceled, Rejected, Expired. Orders in terminal
// states arrive in completed_orders; everything else in incomplete_orders.
// The service never advances these states itself: it only reads them and
// declares new operations.
//
// Thread model:
//   OrderStatus is a plain enum — a value type with no mutable state.
//   Thread-safe to copy and compare from any thread.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Invalid = 0,
  Open = 1,             // Accepted by the venue, nothing filled yet
  PartiallyFilled = 2,  // Some quantity filled, remainder still open
  Filled = 3,           // Fully filled — terminal state
  Canceled = 4,         // Canceled by request — terminal state
  PendingCancel = 5,    // Cancel requested, not yet confirmed
  Rejected = 6,         // Rejected by the venue — terminal state
  Expired = 7,          // Expired due to time-in-force — terminal state
};

// -----------------------------------------------------------------------------
// isTerminal(status)
// -----------------------------------------------------------------------------
// @brief  True for states from which no further fills can arrive.
// -----------------------------------------------------------------------------
inline bool isTerminal(OrderStatus status) {
  return status == OrderStatus::Filled || status == OrderStatus::Canceled ||
         status == OrderStatus::Rejected || status == OrderStatus::Expired;
}

}  // namespace domain
}  // namespace stratexec
