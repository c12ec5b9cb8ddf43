#pragma once

#include "stratexec/domain/market_phase.hpp"
#include "stratexec/domain/market_type.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace stratexec {

// -----------------------------------------------------------------------------
// SessionWindow — one trading day's boundaries in local time
// -----------------------------------------------------------------------------
// open_minute / close_minute are minutes after local midnight; local time
// is UTC shifted by utc_offset_minutes, or by the US Eastern rule
// (EST/EDT) when us_eastern_dst is set.
// -----------------------------------------------------------------------------
struct SessionWindow {
  int open_minute{0};
  int close_minute{24 * 60};
  int utc_offset_minutes{0};
  bool us_eastern_dst{false};

  int offsetAt(std::int64_t epoch_ms) const;
};

// -----------------------------------------------------------------------------
// IPhasePolicy — maps a timestamp to a market phase
// -----------------------------------------------------------------------------
//
// @brief  Pluggable session-boundary policy used by the gateway to compute
//         the phase of a trigger for each scheduled callback's reference
//         instrument.
//
// @details
// `params` is the request's strategy_param map; implementations may read
// their boundaries from it. validate() is called by the gateway before any
// scope is opened, so phaseAt() / sessionDay() can assume valid params.
//
// Thread model:
//   Implementations must be stateless or internally synchronized; one
//   policy instance is shared by every gateway call.
// -----------------------------------------------------------------------------
class IPhasePolicy {
 public:
  virtual ~IPhasePolicy() = default;

  // @throws InvalidRequest when params describe an unusable session.
  virtual void validate(
      const std::map<std::string, std::string>& params) const = 0;

  virtual domain::MarketPhase phaseAt(
      std::int64_t epoch_ms, const std::string& reference_instrument,
      const std::map<std::string, std::string>& params) const = 0;

  // Local trading day number of epoch_ms for the reference instrument.
  // Two triggers on the same session day return the same value.
  virtual std::int64_t sessionDay(
      std::int64_t epoch_ms, const std::string& reference_instrument,
      const std::map<std::string, std::string>& params) const = 0;
};

// -----------------------------------------------------------------------------
// SessionPhasePolicy — session calendar per market type
// -----------------------------------------------------------------------------
//
// @brief  Default IPhasePolicy.
//
// @details
// Market type comes from strategy_param "market_type" when present,
// otherwise from the reference instrument's suffix (detectMarketType).
// Default sessions:
//
//   a_stock   09:30 - 15:00  UTC+8
//   us_stock  09:30 - 16:00  America/New_York (UTC-5, UTC-4 under DST)
//   hk_stock  09:30 - 16:00  UTC+8
//   crypto    00:00 - 23:59  UTC
//
// Crypto is AfterClose during the last minute of the UTC day, so
// after_close callbacks have a window; before_open needs a session.open
// override.
//
// strategy_param overrides, applied on top of the market default:
//   "session.open"                "HH:MM"
//   "session.close"               "HH:MM" ("24:00" allowed)
//   "session.utc_offset_minutes"  integer in [-840, 840]; a fixed offset,
//                                 replaces the US daylight-saving rule
//
// Phase rule on local minute-of-day t:
//   t <  open          → BeforeOpen
//   open <= t < close  → Open
//   t >= close         → AfterClose
// -----------------------------------------------------------------------------
class SessionPhasePolicy final : public IPhasePolicy {
 public:
  void validate(
      const std::map<std::string, std::string>& params) const override;

  domain::MarketPhase phaseAt(
      std::int64_t epoch_ms, const std::string& reference_instrument,
      const std::map<std::string, std::string>& params) const override;

  std::int64_t sessionDay(
      std::int64_t epoch_ms, const std::string& reference_instrument,
      const std::map<std::string, std::string>& params) const override;

  // Session for the instrument after applying params overrides.
  static SessionWindow resolve(
      const std::string& reference_instrument,
      const std::map<std::string, std::string>& params);

  static SessionWindow defaultSession(domain::MarketType type);

  static domain::MarketType marketTypeFor(
      const std::string& instrument,
      const std::map<std::string, std::string>& params);
};

}  // namespace stratexec
