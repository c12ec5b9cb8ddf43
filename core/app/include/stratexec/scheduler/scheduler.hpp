#pragma once

#include "stratexec/domain/market_phase.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace stratexec {

class StrategyContext;

// A periodic callback receives the context of the invocation it fires in.
using ScheduledCallback = std::function<void(StrategyContext&)>;

// -----------------------------------------------------------------------------
// PeriodicCallback — one run_daily-style registration
// -----------------------------------------------------------------------------
// reference_instrument selects the session calendar used to compute the
// phase; empty means "the trigger's own instrument".
// -----------------------------------------------------------------------------
struct PeriodicCallback {
  std::string name;
  ScheduledCallback fn;
  domain::MarketPhase phase{domain::MarketPhase::Open};
  std::string reference_instrument;
};

// -----------------------------------------------------------------------------
// DispatchResult — what one dispatch() did
// -----------------------------------------------------------------------------
struct DispatchResult {
  std::size_t fired{0};               // callbacks that returned normally
  std::vector<std::string> warnings;  // one entry per failure / skip notice
  bool aborted{false};                // a callback threw; later ones skipped
};

// -----------------------------------------------------------------------------
// Scheduler — ordered registry of periodic callbacks for one strategy
// -----------------------------------------------------------------------------
//
// @brief  Stores callbacks registered during strategy initialization and
//         fires those whose phase matches the current trigger.
//
// @details
// Matching: a callback fires when the phase computed for its reference
// instrument equals its registered phase. Matching callbacks fire in
// registration order, all with the same StrategyContext.
//
// Failure isolation: the first callback that throws stops the dispatch.
// The error becomes a warning in DispatchResult (the gateway turns it into
// PartialSuccess) and the strategy's entry point still runs. A cancelled
// context also stops the dispatch before the next callback.
//
// Thread model:
//   Not internally synchronized. Each Scheduler belongs to one
//   StrategyInstance, and the gateway's per-pair serialization guarantees
//   only one invocation touches it at a time.
//
// Ownership:
//   Owned by value inside StrategyInstance; lives as long as the instance.
// -----------------------------------------------------------------------------
class Scheduler {
 public:
  using PhaseResolver =
      std::function<domain::MarketPhase(const std::string& reference)>;

  Scheduler() = default;

  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  // -------------------------------------------------------------------------
  // registerCallback(fn, phase, reference_instrument, name)
  // -------------------------------------------------------------------------
  //
  // @brief  Appends a callback. Registration order is firing order.
  //
  // @param  name  Label used in warnings; defaults to "callback#<n>".
  //
  // Side-effects:  Grows the registry; registrations are never removed.
  // -------------------------------------------------------------------------
  void registerCallback(ScheduledCallback fn, domain::MarketPhase phase,
                        std::string reference_instrument = {},
                        std::string name = {});

  // -------------------------------------------------------------------------
  // dispatch(resolve, ctx)
  // -------------------------------------------------------------------------
  //
  // @brief  Fires every callback whose registered phase equals
  //         resolve(reference_instrument).
  //
  // @details
  // resolve is called once per callback. An exception thrown by resolve
  // is treated like one thrown by the callback itself.
  // -------------------------------------------------------------------------
  DispatchResult dispatch(const PhaseResolver& resolve,
                          StrategyContext& ctx) const;

  // Convenience overload: the same phase for every reference instrument.
  DispatchResult dispatch(domain::MarketPhase phase,
                          StrategyContext& ctx) const;

  std::size_t size() const { return callbacks_.size(); }
  const std::vector<PeriodicCallback>& callbacks() const { return callbacks_; }

 private:
  std::vector<PeriodicCallback> callbacks_;
};

}  // namespace stratexec
