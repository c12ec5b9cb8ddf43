#include "stratexec/engine/execution_gateway.hpp"

#include "stratexec/config/config_lookup_service.hpp"
#include "stratexec/errors/errors.hpp"
#include "stratexec/strategy/strategy_context.hpp"
#include "stratexec/strategy/strategy_registry.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <future>
#include <optional>
#include <sstream>
#include <thread>
#include <variant>

namespace stratexec {

namespace {

// Upper bound on a single wait; larger max_timeout values are clamped.
constexpr double kMaxWaitSeconds = 24.0 * 60.0 * 60.0;

struct RunOutcome {
  bool failed{false};
  bool init_failed{false};
  std::string error;
  std::vector<std::string> warnings;
};

// Shared between the gateway and one runner thread.
struct RunState {
  std::promise<RunOutcome> promise;
  std::mutex mutex;
  bool finished{false};   // guarded by mutex
  bool abandoned{false};  // guarded by mutex
};

std::string triggerInstrument(const domain::ExecutionRequest& request) {
  const auto& detail = request.trigger->detail;
  if (const auto* md = std::get_if<domain::MarketDataTrigger>(&detail)) {
    if (!md->symbol.empty()) {
      return md->symbol;
    }
  } else if (const auto* os = std::get_if<domain::OrderStatusTrigger>(&detail)) {
    if (!os->order.symbol.empty()) {
      return os->order.symbol;
    }
  }
  return request.market_data_context.empty()
             ? std::string()
             : request.market_data_context.front().symbol;
}

std::optional<domain::Bar> triggerBar(const domain::ExecutionRequest& request,
                                      const domain::MarketDataTrigger& md) {
  for (const auto& context : request.market_data_context) {
    if (!md.symbol.empty() && context.symbol != md.symbol) {
      continue;
    }
    if (!md.timeframe.empty() && context.timeframe != md.timeframe) {
      continue;
    }
    if (!context.bars.empty()) {
      return context.bars.back();
    }
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// runStrategy(): the runner thread body
// -----------------------------------------------------------------------------
//
// Order of calls on the instance:
//   1) initialize            once per instance, runDaily() open meanwhile
//   2) beforeTrading         once per session day
//   3) scheduled callbacks   those whose phase matches
//   4) entry point           by trigger kind
//
// Failures of 2) and 3) become warnings; failures of 1) and 4) fail the
// call.
// -----------------------------------------------------------------------------
RunOutcome runStrategy(const ExecutionScope& scope, const IPhasePolicy& policy) {
  RunOutcome out;
  StrategyInstance& instance = *scope.instance;
  StrategyContext& ctx = *scope.context;
  const domain::ExecutionRequest& request = *scope.request;
  const domain::Trigger& trigger = *request.trigger;
  const std::int64_t now = ctx.currentTime();
  const std::string instrument = triggerInstrument(request);

  // ---  1) initialize ---------------------------------------------------------
  if (!instance.initialized()) {
    ctx.setRegistrationOpen(true);
    try {
      instance.strategy().initialize(ctx);
    } catch (const std::exception& e) {
      ctx.setRegistrationOpen(false);
      out.failed = true;
      out.init_failed = true;
      out.error = std::string("initialize failed: ") + e.what();
      return out;
    }
    ctx.setRegistrationOpen(false);
    instance.markInitialized();
  }

  // ---  2) beforeTrading ------------------------------------------------------
  const std::int64_t day =
      policy.sessionDay(now, instrument, request.strategy_param);
  if (instance.lastBeforeTradingDay() != day) {
    instance.setLastBeforeTradingDay(day);
    try {
      instance.strategy().beforeTrading(ctx);
    } catch (const std::exception& e) {
      out.warnings.push_back(std::string("before_trading failed: ") +
                             e.what());
    }
  }

  // ---  3) scheduled callbacks ------------------------------------------------
  DispatchResult dispatched = instance.scheduler().dispatch(
      [&](const std::string& reference) {
        return policy.phaseAt(now, reference.empty() ? instrument : reference,
                              request.strategy_param);
      },
      ctx);
  out.warnings.insert(out.warnings.end(), dispatched.warnings.begin(),
                      dispatched.warnings.end());

  // ---  4) entry point --------------------------------------------------------
  try {
    if (const auto* md =
            std::get_if<domain::MarketDataTrigger>(&trigger.detail)) {
      std::optional<domain::Bar> bar = triggerBar(request, *md);
      if (bar) {
        instance.strategy().handleBar(ctx, *bar);
      } else {
        std::cout << "[ExecutionGateway] exec_id=" << request.exec_id
                  << ": no bars for market-data trigger, handleBar skipped.\n";
      }
    } else if (const auto* os =
                   std::get_if<domain::OrderStatusTrigger>(&trigger.detail)) {
      domain::Order order = os->order;
      if (order.order_id.empty() && order.unique_id.empty() &&
          !request.incomplete_orders.empty()) {
        order = request.incomplete_orders.front();
      }
      instance.strategy().onOrder(ctx, order);
    } else if (const auto* risk =
                   std::get_if<domain::RiskManageTrigger>(&trigger.detail)) {
      instance.strategy().onRiskEvent(ctx, *risk);
    }
  } catch (const std::exception& e) {
    out.failed = true;
    out.error = std::string("strategy error: ") + e.what();
  }
  return out;
}

std::string pairLabel(const domain::ExecutionRequest& request) {
  return "account=" + request.account.account_id +
         " strategy=" + request.strategy_id;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
ExecutionGateway::ExecutionGateway(StrategyRegistry& registry,
                                   ConfigLookupService& config,
                                   const ITimeProvider& clock,
                                   GatewayOptions options,
                                   std::shared_ptr<const IPhasePolicy> phase_policy,
                                   std::ostream& strategy_log_sink)
    : registry_(registry),
      config_(config),
      options_(std::move(options)),
      phase_policy_(phase_policy
                        ? std::move(phase_policy)
                        : std::shared_ptr<const IPhasePolicy>(
                              std::make_shared<SessionPhasePolicy>())),
      dedup_(clock, options_.dedup_retention, options_.dedup_max_entries),
      scopes_(config, strategy_log_sink, options_.trade_calendar),
      abandoned_(std::make_shared<std::atomic<std::size_t>>(0)) {}

// -----------------------------------------------------------------------------
// exec()
// -----------------------------------------------------------------------------
domain::ExecutionResponse ExecutionGateway::exec(
    domain::ExecutionRequest request) {
  // ---  1) Validate (throws InvalidRequest) -----------------------------------
  request.strategy_id = validate(request);
  auto shared =
      std::make_shared<const domain::ExecutionRequest>(std::move(request));

  // ---  2) Serialize per pair -------------------------------------------------
  PairSequencer::Token token =
      sequencer_.acquire(shared->account.account_id, shared->strategy_id);

  // ---  3) Replay a known exec_id ---------------------------------------------
  DedupCache::Claim claim = dedup_.acquire(shared->exec_id);
  if (!claim.isOwner()) {
    std::cout << "[ExecutionGateway] exec_id=" << shared->exec_id
              << " already processed, replaying stored response.\n";
    return claim.wait();
  }

  // ---  4) Run and record before the pair token is released -------------------
  domain::ExecutionResponse response = invoke(shared);
  claim.complete(response);
  return response;
}

// -----------------------------------------------------------------------------
// invoke(): one strategy call inside a scope, under the time limit
// -----------------------------------------------------------------------------
domain::ExecutionResponse ExecutionGateway::invoke(
    std::shared_ptr<const domain::ExecutionRequest> request) {
  domain::ExecutionResponse response;
  response.status = domain::ExecStatus::Failed;

  try {
    std::shared_ptr<StrategyInstance> instance =
        instanceFor(request->account.account_id, request->strategy_id);
    ExecutionScopeManager::ScopeGuard guard = scopes_.open(request, instance);
    std::shared_ptr<ExecutionScope> scope = guard.scope();

    auto state = std::make_shared<RunState>();
    std::future<RunOutcome> done = state->promise.get_future();

    std::thread runner([scope, state, policy = phase_policy_,
                        abandoned = abandoned_] {
      RunOutcome outcome;
      try {
        outcome = runStrategy(*scope, *policy);
      } catch (const std::exception& e) {
        outcome.failed = true;
        outcome.error = std::string("strategy error: ") + e.what();
      } catch (...) {
        outcome.failed = true;
        outcome.error = "strategy error: unknown exception";
      }
      state->promise.set_value(std::move(outcome));

      std::lock_guard lock(state->mutex);
      state->finished = true;
      if (state->abandoned) {
        abandoned->fetch_sub(1);
        std::cerr << "[ExecutionGateway] abandoned runner for exec_id="
                  << scope->request->exec_id << " finished.\n";
      }
    });

    const auto limit = std::chrono::milliseconds(static_cast<std::int64_t>(
        std::ceil(std::min(request->max_timeout, kMaxWaitSeconds) * 1000.0)));

    if (done.wait_for(limit) != std::future_status::ready) {
      // ---  Timeout: cancel, grant the grace period, then abandon -----------
      guard.context().requestCancel();
      done.wait_for(options_.timeout_grace);

      bool abandon = false;
      {
        std::lock_guard lock(state->mutex);
        if (!state->finished) {
          state->abandoned = true;
          abandoned_->fetch_add(1);
          abandon = true;
        }
      }
      if (abandon) {
        runner.detach();
        evictInstance(instance);
        std::cerr << "[ExecutionGateway] WARNING: exec_id=" << request->exec_id
                  << " ignored cancellation; runner abandoned, instance for "
                  << pairLabel(*request) << " discarded.\n";
      } else {
        runner.join();
      }

      std::ostringstream msg;
      msg << "timeout: strategy did not finish within " << request->max_timeout
          << "s";
      throw Timeout(msg.str());
    }

    runner.join();
    RunOutcome outcome = done.get();

    if (outcome.init_failed) {
      // The next trigger starts over with a fresh instance.
      evictInstance(instance);
    }
    if (outcome.failed) {
      response.error_message = std::move(outcome.error);
      response.warnings = std::move(outcome.warnings);
      std::cerr << "[ExecutionGateway] exec_id=" << request->exec_id
                << " failed: " << response.error_message << "\n";
      return response;
    }

    response.order_op_event = guard.context().operations();
    response.warnings = std::move(outcome.warnings);
    response.status = response.warnings.empty()
                          ? domain::ExecStatus::Success
                          : domain::ExecStatus::PartialSuccess;
    return response;
  } catch (const Timeout& e) {
    response.error_message = e.what();
    std::cerr << "[ExecutionGateway] WARNING: exec_id=" << request->exec_id
              << " " << response.error_message << "\n";
    return response;
  } catch (const std::exception& e) {
    response.status = domain::ExecStatus::Failed;
    response.order_op_event.clear();
    response.error_message = std::string("internal error: ") + e.what();
    std::cerr << "[ExecutionGateway] exec_id=" << request->exec_id << " "
              << response.error_message << "\n";
    return response;
  }
}

// -----------------------------------------------------------------------------
// validate()
// -----------------------------------------------------------------------------
std::string ExecutionGateway::validate(
    const domain::ExecutionRequest& request) const {
  if (!request.trigger) {
    throw InvalidRequest("trigger is missing or has type INVALID");
  }
  if (request.exec_id.empty()) {
    throw InvalidRequest("exec_id is empty");
  }
  if (request.account.account_id.empty()) {
    throw InvalidRequest("account.account_id is empty");
  }
  if (!std::isfinite(request.max_timeout) || request.max_timeout <= 0.0) {
    throw InvalidRequest("max_timeout must be a positive number of seconds");
  }
  if (request.exchange.empty()) {
    throw InvalidRequest("exchange is empty");
  }
  if (!config_.isKnownVenue(request.exchange)) {
    throw InvalidRequest("unknown exchange: " + request.exchange);
  }

  std::string strategy_id = resolveStrategyId(request.strategy_id);
  if (strategy_id.empty() || !registry_.contains(strategy_id)) {
    throw InvalidRequest("unknown strategy: '" + strategy_id + "'");
  }

  phase_policy_->validate(request.strategy_param);
  return strategy_id;
}

bool ExecutionGateway::waitForAbandonedRunners(
    std::chrono::milliseconds limit) const {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (abandoned_->load() > 0) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return true;
}

std::string ExecutionGateway::resolveStrategyId(
    const std::string& requested) const {
  return requested.empty() ? options_.default_strategy : requested;
}

// -----------------------------------------------------------------------------
// Instance table
// -----------------------------------------------------------------------------
std::shared_ptr<StrategyInstance> ExecutionGateway::instanceFor(
    const std::string& account_id, const std::string& strategy_id) {
  PairKey key{account_id, strategy_id};
  std::lock_guard lock(instances_mutex_);
  auto it = instances_.find(key);
  if (it != instances_.end()) {
    return it->second;
  }

  auto instance = std::make_shared<StrategyInstance>(
      account_id, strategy_id, registry_.create(strategy_id));
  instances_.emplace(std::move(key), instance);
  std::cout << "[ExecutionGateway] new strategy instance account="
            << account_id << " strategy=" << strategy_id << "\n";
  return instance;
}

void ExecutionGateway::evictInstance(
    const std::shared_ptr<StrategyInstance>& instance) {
  std::lock_guard lock(instances_mutex_);
  auto it = instances_.find(
      PairKey{instance->accountId(), instance->strategyId()});
  if (it != instances_.end() && it->second == instance) {
    instances_.erase(it);
  }
}

bool ExecutionGateway::hasInstance(const std::string& account_id,
                                   const std::string& strategy_id) const {
  std::lock_guard lock(instances_mutex_);
  return instances_.count(PairKey{account_id, strategy_id}) != 0;
}

std::size_t ExecutionGateway::instanceCount() const {
  std::lock_guard lock(instances_mutex_);
  return instances_.size();
}

// -----------------------------------------------------------------------------
// health()
// -----------------------------------------------------------------------------
HealthReport ExecutionGateway::health() const {
  HealthReport report;
  const std::size_t abandoned = abandoned_->load();

  std::string strategies;
  for (const auto& id : registry_.ids()) {
    strategies += strategies.empty() ? id : "," + id;
  }
  report.details.push_back("strategies=" + strategies);
  report.details.push_back("instances=" + std::to_string(instanceCount()));
  report.details.push_back("open_scopes=" +
                           std::to_string(scopes_.openCount()));
  report.details.push_back("abandoned_runners=" + std::to_string(abandoned));
  report.details.push_back("dedup_entries=" + std::to_string(dedup_.size()));

  if (registry_.empty()) {
    report.status = HealthStatus::Unhealthy;
    report.message = "no strategy registered";
  } else if (abandoned > 0) {
    report.status = HealthStatus::Degraded;
    report.message =
        std::to_string(abandoned) + " abandoned strategy runner(s) still running";
  } else {
    report.status = HealthStatus::Healthy;
    report.message = "strategy service is healthy";
  }
  return report;
}

}  // namespace stratexec
