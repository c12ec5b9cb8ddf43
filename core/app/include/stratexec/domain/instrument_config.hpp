#pragma once

namespace stratexec {
namespace domain {

// -----------------------------------------------------------------------------
// TradingRule — venue constraints for one instrument
// -----------------------------------------------------------------------------
//
// @brief  Immutable order-shaping constraints loaded from a venue's
//         trading_rules.json descriptor.
//
// @details
// Structural constraints enforced by ConfigLookupService on load:
//   quantity_step, price_tick   > 0
//   min_quantity, min_price     >= 0
//   *_precision                 non-negative integers
//   max_leverage                > 0, defaults to 1.0 when absent
//
// A changed descriptor produces a whole new TradingRule; cached instances
// are never patched in place.
//
// Thread model:
//   Plain data struct with value semantics. Safe to copy between threads.
// -----------------------------------------------------------------------------
struct TradingRule {
  double min_quantity{0.0};
  double quantity_step{0.0};
  double min_price{0.0};
  double price_tick{0.0};
  int price_precision{0};
  int quantity_precision{0};
  double max_leverage{1.0};
};

// -----------------------------------------------------------------------------
// CommissionRate — maker/taker fee rates for one instrument
// -----------------------------------------------------------------------------
// maker_fee_rate may be negative (rebate); taker_fee_rate must be >= 0.
// -----------------------------------------------------------------------------
struct CommissionRate {
  double maker_fee_rate{0.0};
  double taker_fee_rate{0.0};
};

}  // namespace domain
}  // namespace stratexec
