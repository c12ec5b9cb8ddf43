#pragma once

#include <optional>
#include <string>

namespace stratexec {
namespace domain {

// -----------------------------------------------------------------------------
// MarketPhase — session bucket used to time periodic callbacks
// -----------------------------------------------------------------------------
enum class MarketPhase {
  BeforeOpen,
  Open,
  AfterClose,
};

inline const char* marketPhaseName(MarketPhase phase) {
  switch (phase) {
    case MarketPhase::BeforeOpen: return "before_open";
    case MarketPhase::Open:       return "open";
    case MarketPhase::AfterClose: return "after_close";
  }
  return "unknown";
}

// Accepts the names above plus the aliases used by run_daily-style
// schedules ("before_trading", "close", "after_trading").
inline std::optional<MarketPhase> parseMarketPhase(const std::string& name) {
  if (name == "before_open" || name == "before_trading") {
    return MarketPhase::BeforeOpen;
  }
  if (name == "open") {
    return MarketPhase::Open;
  }
  if (name == "after_close" || name == "close" || name == "after_trading") {
    return MarketPhase::AfterClose;
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace stratexec
