#pragma once

#include "stratexec/concurrent/sequence_generator.hpp"
#include "stratexec/data/context_data_adapter.hpp"
#include "stratexec/domain/execution_request.hpp"
#include "stratexec/domain/execution_response.hpp"
#include "stratexec/domain/instrument_config.hpp"
#include "stratexec/domain/market_phase.hpp"
#include "stratexec/domain/market_type.hpp"
#include "stratexec/scheduler/scheduler.hpp"
#include "stratexec/strategy/strategy_log.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace stratexec {

class ConfigLookupService;
class StrategyInstance;

// -----------------------------------------------------------------------------
// StrategyContext — the capability set handed to strategy code
// -----------------------------------------------------------------------------
//
// @brief  Everything a strategy may read or do during one invocation:
//         request data, portfolio figures, history queries, descriptor
//         lookups, logging, the `g` namespace, order declaration, and
//         periodic-callback registration.
//
// @details
// One context is built per invocation by ExecutionScopeManager and passed
// explicitly to every IStrategy entry point and scheduled callback. Strategy
// code never discovers its context through globals, so two invocations for
// different pairs running at the same time cannot see each other's data.
//
// Order declaration:
//   orderBuy/orderSell/cancelOrder/modifyOrder/orderValue/orderTarget
//   append OrderOperations in call order; the gateway copies them into the
//   response when the entry point returns. Created orders get
//   unique_id "<exec_id>_<n>", n = 1, 2, ... per invocation.
//
// Lifecycle:
//   requestCancel() — set by the gateway on timeout; cancelled() lets
//                     long-running strategy code stop early. Submissions
//                     after cancellation throw StrategyError.
//   close()         — set when the scope closes; every later submission
//                     throws StrategyError and is never seen by anyone.
//   runDaily() is accepted only while the gateway runs initialize().
//
// Thread model:
//   Strategy-facing methods run on the invocation's runner thread.
//   requestCancel(), close(), cancelled(), closed(), and operations() may be
//   called from the gateway thread concurrently; the operation list is
//   guarded by a mutex and the flags are atomic.
//
// Ownership:
//   Shares ownership of the request, the StrategyInstance and the trade
//   calendar. Borrows the
//   ConfigLookupService and the log sink; both outlive the gateway.
// -----------------------------------------------------------------------------
class StrategyContext {
 public:
  StrategyContext(std::shared_ptr<const domain::ExecutionRequest> request,
                  std::shared_ptr<StrategyInstance> instance,
                  ConfigLookupService& config,
                  std::ostream& log_sink = std::cout,
                  std::shared_ptr<const TradeCalendar> calendar = nullptr);

  StrategyContext(const StrategyContext&) = delete;
  StrategyContext& operator=(const StrategyContext&) = delete;
  StrategyContext(StrategyContext&&) = delete;
  StrategyContext& operator=(StrategyContext&&) = delete;

  // --- request -------------------------------------------------------------
  const domain::ExecutionRequest& request() const { return *request_; }
  const domain::Account& account() const { return request_->account; }
  const std::string& accountId() const { return request_->account.account_id; }
  const std::string& strategyId() const;
  const std::string& execId() const { return request_->exec_id; }
  const std::string& exchange() const { return request_->exchange; }
  const std::map<std::string, std::string>& params() const {
    return request_->strategy_param;
  }
  std::string param(const std::string& key,
                    const std::string& fallback = {}) const;

  // Trigger timestamp in epoch ms; the invocation's notion of "now".
  std::int64_t currentTime() const;
  std::optional<domain::Bar> currentBar() const { return data_.currentBar(); }

  // Market type of a symbol, honouring the "market_type" param.
  domain::MarketType marketTypeFor(const std::string& symbol) const;

  // --- portfolio -----------------------------------------------------------
  double positionQuantity(const std::string& symbol) const;

  // -------------------------------------------------------------------------
  // availableCash()
  // -------------------------------------------------------------------------
  // @return account.available_margin when positive, otherwise the sum of
  //         free balances.
  // -------------------------------------------------------------------------
  double availableCash() const;

  // Sum of quantity * average_cost_price over all positions.
  double positionsValue() const;

  // --- data ----------------------------------------------------------------
  const ContextDataAdapter& data() const { return data_; }

  // Shorthand for data().history(); throws InsufficientData.
  std::vector<domain::Bar> history(const std::string& instrument, int count,
                                   const std::string& resolution) const;

  // Shorthands for data().tradeDays() / data().isTradeDay().
  std::vector<std::string> tradeDays(
      const std::optional<std::string>& start_date = std::nullopt,
      const std::optional<std::string>& end_date = std::nullopt,
      std::optional<int> count = std::nullopt) const {
    return data_.tradeDays(start_date, end_date, count);
  }
  bool isTradeDay(const std::string& date) const {
    return data_.isTradeDay(date);
  }

  // --- descriptors ---------------------------------------------------------
  // Venue is the request's exchange. Throw NotFound / MalformedDescriptor.
  domain::TradingRule tradingRule(const std::string& instrument) const;
  domain::CommissionRate commissionRate(const std::string& instrument) const;

  // --- state and settings --------------------------------------------------
  nlohmann::json& g();
  StrategyLog& log() { return log_; }

  void setBenchmark(const std::string& symbol);
  void setOption(const std::string& key, nlohmann::json value);
  void setOrderCost(const std::string& type, nlohmann::json cost);
  const nlohmann::json& settings() const;

  // --- orders --------------------------------------------------------------

  // -------------------------------------------------------------------------
  // orderBuy / orderSell
  // -------------------------------------------------------------------------
  //
  // @brief  Declares a Create operation: a limit order when price is given,
  //         a market order otherwise; time in force GTC.
  //
  // @return The declared order (order_id empty, unique_id assigned).
  //
  // @throws StrategyError for qty <= 0, price <= 0, or a cancelled/closed
  //         context.
  // -------------------------------------------------------------------------
  domain::Order orderBuy(const std::string& symbol, double qty,
                         std::optional<double> price = std::nullopt);
  domain::Order orderSell(const std::string& symbol, double qty,
                          std::optional<double> price = std::nullopt);

  // -------------------------------------------------------------------------
  // cancelOrder(id)
  // -------------------------------------------------------------------------
  //
  // @brief  Declares a Withdraw operation for an incomplete order matched
  //         by order_id or unique_id.
  //
  // @return false (and declares nothing) if no incomplete order matches.
  // -------------------------------------------------------------------------
  bool cancelOrder(const std::string& id);

  // Declares a Modify operation with the new quantity / limit price for an
  // incomplete order. Returns false if no incomplete order matches.
  bool modifyOrder(const std::string& id, double qty,
                   std::optional<double> price = std::nullopt);

  // -------------------------------------------------------------------------
  // orderValue(symbol, value, price)
  // -------------------------------------------------------------------------
  //
  // @brief  Buys `value` worth of the symbol.
  //
  // @details
  // Without a price the latest bar close of the symbol (or the current bar)
  // is used. quantity = value / price, truncated to whole units on stock
  // markets. The order is placed as a limit order at that price.
  //
  // @throws StrategyError if no price can be determined or the quantity is
  //         not positive.
  // -------------------------------------------------------------------------
  domain::Order orderValue(const std::string& symbol, double value,
                           std::optional<double> price = std::nullopt);

  // -------------------------------------------------------------------------
  // orderTarget(symbol, target_qty, price)
  // -------------------------------------------------------------------------
  //
  // @brief  Buys or sells the difference between the current position and
  //         target_qty (whole units on stock markets).
  //
  // @return The declared order, or std::nullopt when already at target.
  // -------------------------------------------------------------------------
  std::optional<domain::Order> orderTarget(
      const std::string& symbol, double target_qty,
      std::optional<double> price = std::nullopt);

  // Snapshot of declared operations, in declaration order.
  std::vector<domain::OrderOperation> operations() const;

  // --- scheduling ----------------------------------------------------------

  // -------------------------------------------------------------------------
  // runDaily(fn, phase, reference_instrument, name)
  // -------------------------------------------------------------------------
  //
  // @brief  Registers a periodic callback with the instance's Scheduler.
  //
  // @throws StrategyError outside initialize().
  // -------------------------------------------------------------------------
  void runDaily(ScheduledCallback fn, domain::MarketPhase phase,
                std::string reference_instrument = {}, std::string name = {});

  // Same, with the phase given by name ("before_open", "open", "close", ...).
  void runDaily(ScheduledCallback fn, const std::string& time,
                std::string reference_instrument = {}, std::string name = {});

  // --- lifecycle (gateway side) --------------------------------------------
  bool cancelled() const { return cancelled_.load(); }
  void requestCancel() { cancelled_.store(true); }
  bool closed() const { return closed_.load(); }
  void close() { closed_.store(true); }
  void setRegistrationOpen(bool open) { registration_open_ = open; }

 private:
  domain::Order createOrder(const std::string& symbol, domain::Side side,
                            double qty, std::optional<double> price);
  const domain::Order* findIncomplete(const std::string& id) const;
  void submit(domain::OrderOperation op);
  void ensureActive() const;

  std::shared_ptr<const domain::ExecutionRequest> request_;
  std::shared_ptr<StrategyInstance> instance_;
  ConfigLookupService& config_;
  ContextDataAdapter data_;
  StrategyLog log_;
  SequenceGenerator order_seq_;

  mutable std::mutex ops_mutex_;
  std::vector<domain::OrderOperation> operations_;

  std::atomic<bool> cancelled_{false};
  std::atomic<bool> closed_{false};
  bool registration_open_{false};
};

}  // namespace stratexec
