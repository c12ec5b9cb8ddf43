#pragma once

#include "stratexec/domain/execution_request.hpp"
#include "stratexec/domain/execution_response.hpp"
#include "stratexec/engine/dedup_cache.hpp"
#include "stratexec/engine/pair_sequencer.hpp"
#include "stratexec/scheduler/phase_policy.hpp"
#include "stratexec/scheduler/trade_calendar.hpp"
#include "stratexec/scope/execution_scope_manager.hpp"
#include "stratexec/strategy/strategy_instance.hpp"
#include "stratexec/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace stratexec {

class ConfigLookupService;
class StrategyRegistry;

// -----------------------------------------------------------------------------
// GatewayOptions
// -----------------------------------------------------------------------------
// default_strategy   strategy run when a request names none
// timeout_grace      how long a timed-out runner may take to notice the
//                    cancellation before it is abandoned
// dedup_retention    minimum time a response stays replayable by exec_id
// dedup_max_entries  upper bound on remembered responses
// trade_calendar     holidays and weekends behind ctx.tradeDays(); null
//                    means Saturday/Sunday weekends with no holidays
// -----------------------------------------------------------------------------
struct GatewayOptions {
  std::string default_strategy{"dual_ma"};
  std::chrono::milliseconds timeout_grace{200};
  std::chrono::milliseconds dedup_retention{std::chrono::minutes(10)};
  std::size_t dedup_max_entries{10000};
  std::shared_ptr<const TradeCalendar> trade_calendar;
};

enum class HealthStatus { Healthy, Degraded, Unhealthy };

inline const char* healthStatusName(HealthStatus status) {
  switch (status) {
    case HealthStatus::Healthy:   return "HEALTHY";
    case HealthStatus::Degraded:  return "DEGRADED";
    case HealthStatus::Unhealthy: return "UNHEALTHY";
  }
  return "UNKNOWN";
}

struct HealthReport {
  HealthStatus status{HealthStatus::Healthy};
  std::string message;
  std::vector<std::string> details;  // "key=value" lines
};

// -----------------------------------------------------------------------------
// ExecutionGateway
// -----------------------------------------------------------------------------
//
// @brief  Entry point of the service. Turns one ExecutionRequest into one
//         ExecutionResponse by running the pair's strategy in an isolated
//         scope, under a time limit, exactly once per exec_id.
//
// @details
// exec(request):
//   1. Validate the request (InvalidRequest escapes to the caller).
//   2. Take the pair token: calls for one (account_id, strategy_id) run one
//      at a time in arrival order; other pairs run in parallel.
//   3. Claim exec_id in the DedupCache. A known id returns the stored
//      response; the strategy is not invoked again.
//   4. Get or create the pair's StrategyInstance and open a scope.
//   5. Run the strategy on a runner thread:
//        initialize (first call only)
//        → beforeTrading (first call of each session day)
//        → scheduled callbacks for the current phase
//        → the entry point selected by the trigger kind.
//   6. Wait up to max_timeout seconds. On timeout, cancel the context and
//      wait timeout_grace more; a runner still busy after that is detached
//      ("abandoned") and the pair's instance is discarded so its state is
//      never shared with a later call.
//   7. Close the scope, build the response, store it under exec_id, then
//      release the pair token.
//
// Response status:
//   Success         entry point returned, no warnings
//   PartialSuccess  entry point returned, beforeTrading or a scheduled
//                   callback failed (details in warnings)
//   Failed          initialize / entry point threw, timeout, or an
//                   internal error; order operations are dropped and
//                   error_message says why
//
// Thread model:
//   exec() and health() are safe from any number of threads. Each exec()
//   call blocks its caller until the response is ready.
//
// Ownership:
//   ExecutionGateway
//    ├── sequencer_     (PairSequencer — value member)
//    ├── dedup_         (DedupCache — value member)
//    ├── scopes_        (ExecutionScopeManager — value member)
//    ├── instances_     (shared_ptr<StrategyInstance> per pair)
//    ├── phase_policy_  (shared_ptr<const IPhasePolicy>)
//    ├── registry_      (StrategyRegistry& — non-owning)
//    └── config_        (ConfigLookupService& — non-owning)
//
// The registry, the ConfigLookupService, the clock and the log sink must
// outlive the gateway and any runner it abandoned.
// -----------------------------------------------------------------------------
class ExecutionGateway {
 public:
  ExecutionGateway(StrategyRegistry& registry, ConfigLookupService& config,
                   const ITimeProvider& clock, GatewayOptions options = {},
                   std::shared_ptr<const IPhasePolicy> phase_policy = nullptr,
                   std::ostream& strategy_log_sink = std::cout);

  ExecutionGateway(const ExecutionGateway&) = delete;
  ExecutionGateway& operator=(const ExecutionGateway&) = delete;
  ExecutionGateway(ExecutionGateway&&) = delete;
  ExecutionGateway& operator=(ExecutionGateway&&) = delete;

  // -------------------------------------------------------------------------
  // exec(request)
  // -------------------------------------------------------------------------
  //
  // @brief  Runs one invocation; see the class comment for the sequence.
  //
  // @throws InvalidRequest if the request is malformed: no trigger, empty
  //         exec_id or account_id, max_timeout <= 0, unknown venue,
  //         unknown strategy, or invalid session params. Every other
  //         failure is reported in the returned response.
  //
  // Thread-safety: Safe from any thread.
  // Side-effects:  May create / replace the pair's StrategyInstance;
  //                records the response under exec_id.
  // -------------------------------------------------------------------------
  domain::ExecutionResponse exec(domain::ExecutionRequest request);

  // -------------------------------------------------------------------------
  // health()
  // -------------------------------------------------------------------------
  // UNHEALTHY  no strategy registered
  // DEGRADED   at least one abandoned runner is still running
  // HEALTHY    otherwise
  // -------------------------------------------------------------------------
  HealthReport health() const;

  // Abandoned runner threads that have not finished yet.
  std::size_t abandonedRunners() const { return abandoned_->load(); }

  // -------------------------------------------------------------------------
  // waitForAbandonedRunners(limit)
  // -------------------------------------------------------------------------
  // @brief  Blocks until every abandoned runner has finished or `limit`
  //         has passed.
  //
  // @return true if none is left. On false, the registry, the lookup and
  //         the log sink are still in use and must not be destroyed.
  // -------------------------------------------------------------------------
  bool waitForAbandonedRunners(std::chrono::milliseconds limit) const;

  // The strategy a request naming `requested` runs: the default strategy
  // when `requested` is empty.
  std::string resolveStrategyId(const std::string& requested) const;

  bool hasInstance(const std::string& account_id,
                   const std::string& strategy_id) const;
  std::size_t instanceCount() const;

  const ExecutionScopeManager& scopes() const { return scopes_; }
  const GatewayOptions& options() const { return options_; }

 private:
  using PairKey = std::pair<std::string, std::string>;

  // Returns the resolved strategy id.
  std::string validate(const domain::ExecutionRequest& request) const;

  std::shared_ptr<StrategyInstance> instanceFor(const std::string& account_id,
                                                const std::string& strategy_id);
  void evictInstance(const std::shared_ptr<StrategyInstance>& instance);

  domain::ExecutionResponse invoke(
      std::shared_ptr<const domain::ExecutionRequest> request);

  StrategyRegistry& registry_;
  ConfigLookupService& config_;
  GatewayOptions options_;
  std::shared_ptr<const IPhasePolicy> phase_policy_;

  PairSequencer sequencer_;
  DedupCache dedup_;
  ExecutionScopeManager scopes_;

  mutable std::mutex instances_mutex_;
  std::map<PairKey, std::shared_ptr<StrategyInstance>> instances_;

  std::shared_ptr<std::atomic<std::size_t>> abandoned_;
};

}  // namespace stratexec
