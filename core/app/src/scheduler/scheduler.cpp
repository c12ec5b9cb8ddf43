#include "stratexec/scheduler/scheduler.hpp"

#include "stratexec/strategy/strategy_context.hpp"

#include <exception>
#include <utility>

namespace stratexec {

void Scheduler::registerCallback(ScheduledCallback fn,
                                 domain::MarketPhase phase,
                                 std::string reference_instrument,
                                 std::string name) {
  if (name.empty()) {
    name = "callback#" + std::to_string(callbacks_.size() + 1);
  }
  callbacks_.push_back(PeriodicCallback{std::move(name), std::move(fn), phase,
                                        std::move(reference_instrument)});
}

// -----------------------------------------------------------------------------
// dispatch(): fire matching callbacks in registration order, stop at the
// first failure
// -----------------------------------------------------------------------------
DispatchResult Scheduler::dispatch(const PhaseResolver& resolve,
                                   StrategyContext& ctx) const {
  DispatchResult result;

  for (std::size_t i = 0; i < callbacks_.size(); ++i) {
    const PeriodicCallback& cb = callbacks_[i];

    if (ctx.cancelled()) {
      result.aborted = true;
      result.warnings.push_back("scheduled callbacks skipped from '" +
                                cb.name + "': execution cancelled");
      break;
    }

    try {
      if (resolve(cb.reference_instrument) != cb.phase) {
        continue;
      }
      cb.fn(ctx);
      ++result.fired;
    } catch (const std::exception& e) {
      result.aborted = true;
      result.warnings.push_back("scheduled callback '" + cb.name +
                                "' failed: " + e.what());
      std::size_t skipped = callbacks_.size() - i - 1;
      if (skipped > 0) {
        result.warnings.push_back(std::to_string(skipped) +
                                  " later scheduled callback(s) not run");
      }
      break;
    } catch (...) {
      result.aborted = true;
      result.warnings.push_back("scheduled callback '" + cb.name +
                                "' failed: unknown exception");
      std::size_t skipped = callbacks_.size() - i - 1;
      if (skipped > 0) {
        result.warnings.push_back(std::to_string(skipped) +
                                  " later scheduled callback(s) not run");
      }
      break;
    }
  }

  return result;
}

DispatchResult Scheduler::dispatch(domain::MarketPhase phase,
                                   StrategyContext& ctx) const {
  return dispatch([phase](const std::string&) { return phase; }, ctx);
}

}  // namespace stratexec
