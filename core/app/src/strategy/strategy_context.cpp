#include "stratexec/strategy/strategy_context.hpp"

#include "stratexec/config/config_lookup_service.hpp"
#include "stratexec/errors/errors.hpp"
#include "stratexec/strategy/strategy_instance.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace stratexec {

namespace {

const char* sideName(domain::Side side) {
  return side == domain::Side::Buy ? "BUY" : "SELL";
}

std::string describe(const domain::Order& order) {
  std::ostringstream out;
  out << sideName(order.side) << " " << order.qty << " " << order.symbol;
  if (order.limit_price) {
    out << " @ " << *order.limit_price;
  } else {
    out << " @ market";
  }
  out << " (" << order.unique_id << ")";
  return out.str();
}

}  // namespace

StrategyContext::StrategyContext(
    std::shared_ptr<const domain::ExecutionRequest> request,
    std::shared_ptr<StrategyInstance> instance, ConfigLookupService& config,
    std::ostream& log_sink, std::shared_ptr<const TradeCalendar> calendar)
    : request_(std::move(request)),
      instance_(std::move(instance)),
      config_(config),
      data_(request_, std::move(calendar)),
      log_(instance_->strategyId() + "/" + request_->account.account_id,
           log_sink) {}

const std::string& StrategyContext::strategyId() const {
  return instance_->strategyId();
}

std::string StrategyContext::param(const std::string& key,
                                   const std::string& fallback) const {
  auto it = request_->strategy_param.find(key);
  return it == request_->strategy_param.end() ? fallback : it->second;
}

std::int64_t StrategyContext::currentTime() const {
  if (request_->trigger) {
    return request_->trigger->timestamp_ms;
  }
  auto bar = data_.currentBar();
  return bar ? bar->close_time : 0;
}

domain::MarketType StrategyContext::marketTypeFor(
    const std::string& symbol) const {
  auto it = request_->strategy_param.find("market_type");
  if (it != request_->strategy_param.end()) {
    if (auto parsed = domain::parseMarketType(it->second)) {
      return *parsed;
    }
  }
  return domain::detectMarketType(symbol);
}

// -----------------------------------------------------------------------------
// Portfolio figures
// -----------------------------------------------------------------------------
double StrategyContext::positionQuantity(const std::string& symbol) const {
  for (const auto& position : request_->account.positions) {
    if (position.symbol == symbol) {
      return position.quantity;
    }
  }
  return 0.0;
}

double StrategyContext::availableCash() const {
  const auto& account = request_->account;
  if (account.available_margin > 0.0) {
    return account.available_margin;
  }
  double cash = 0.0;
  for (const auto& balance : account.balances) {
    cash += balance.free;
  }
  return cash;
}

double StrategyContext::positionsValue() const {
  double value = 0.0;
  for (const auto& position : request_->account.positions) {
    value += position.quantity * position.average_cost_price;
  }
  return value;
}

std::vector<domain::Bar> StrategyContext::history(
    const std::string& instrument, int count,
    const std::string& resolution) const {
  return data_.history(instrument, count, resolution);
}

domain::TradingRule StrategyContext::tradingRule(
    const std::string& instrument) const {
  return config_.tradingRule(request_->exchange, instrument);
}

domain::CommissionRate StrategyContext::commissionRate(
    const std::string& instrument) const {
  return config_.commissionRate(request_->exchange, instrument);
}

// -----------------------------------------------------------------------------
// State and settings
// -----------------------------------------------------------------------------
nlohmann::json& StrategyContext::g() { return instance_->globals(); }

void StrategyContext::setBenchmark(const std::string& symbol) {
  instance_->settings()["benchmark"] = symbol;
}

void StrategyContext::setOption(const std::string& key, nlohmann::json value) {
  instance_->settings()["options"][key] = std::move(value);
}

void StrategyContext::setOrderCost(const std::string& type,
                                   nlohmann::json cost) {
  instance_->settings()["order_costs"][type] = std::move(cost);
}

const nlohmann::json& StrategyContext::settings() const {
  return instance_->settings();
}

// -----------------------------------------------------------------------------
// Orders
// -----------------------------------------------------------------------------
domain::Order StrategyContext::orderBuy(const std::string& symbol, double qty,
                                        std::optional<double> price) {
  return createOrder(symbol, domain::Side::Buy, qty, price);
}

domain::Order StrategyContext::orderSell(const std::string& symbol, double qty,
                                         std::optional<double> price) {
  return createOrder(symbol, domain::Side::Sell, qty, price);
}

bool StrategyContext::cancelOrder(const std::string& id) {
  ensureActive();
  const domain::Order* target = findIncomplete(id);
  if (target == nullptr) {
    log_.write(LogLevel::Warn, "order",
               "cancel ignored, no incomplete order " + id);
    return false;
  }
  domain::OrderOperation op;
  op.op_type = domain::OrderOpType::Withdraw;
  op.order.order_id = target->order_id.empty() ? id : target->order_id;
  op.order.unique_id = target->unique_id;
  op.order.symbol = target->symbol;
  submit(std::move(op));
  log_.write(LogLevel::Debug, "order", "cancel " + id);
  return true;
}

bool StrategyContext::modifyOrder(const std::string& id, double qty,
                                  std::optional<double> price) {
  ensureActive();
  if (!(qty > 0.0)) {
    throw StrategyError("modify quantity must be positive");
  }
  if (price && !(*price > 0.0)) {
    throw StrategyError("modify price must be positive");
  }
  const domain::Order* target = findIncomplete(id);
  if (target == nullptr) {
    return false;
  }
  domain::OrderOperation op;
  op.op_type = domain::OrderOpType::Modify;
  op.order = *target;
  op.order.qty = qty;
  if (price) {
    op.order.limit_price = price;
  }
  submit(std::move(op));
  log_.write(LogLevel::Debug, "order", "modify " + id);
  return true;
}

domain::Order StrategyContext::orderValue(const std::string& symbol,
                                          double value,
                                          std::optional<double> price) {
  if (!price) {
    auto bar = data_.latestBar(symbol);
    if (!bar) {
      bar = data_.currentBar();
    }
    if (!bar) {
      throw StrategyError("cannot determine price for " + symbol +
                          ": no bar available");
    }
    price = bar->close;
  }
  if (!(*price > 0.0)) {
    throw StrategyError("cannot size order for " + symbol +
                        ": price must be positive");
  }

  double quantity = value / *price;
  if (domain::isStockMarket(marketTypeFor(symbol))) {
    quantity = std::trunc(quantity);
  }
  if (!(quantity > 0.0)) {
    std::ostringstream msg;
    msg << "calculated quantity (" << quantity << ") for " << symbol
        << " is not positive. value=" << value << " price=" << *price;
    throw StrategyError(msg.str());
  }
  return createOrder(symbol, domain::Side::Buy, quantity, price);
}

std::optional<domain::Order> StrategyContext::orderTarget(
    const std::string& symbol, double target_qty,
    std::optional<double> price) {
  double diff = target_qty - positionQuantity(symbol);
  if (domain::isStockMarket(marketTypeFor(symbol))) {
    diff = std::trunc(diff);
  }
  if (std::fabs(diff) < 1e-8) {
    return std::nullopt;
  }
  if (diff > 0.0) {
    return createOrder(symbol, domain::Side::Buy, diff, price);
  }
  return createOrder(symbol, domain::Side::Sell, -diff, price);
}

std::vector<domain::OrderOperation> StrategyContext::operations() const {
  std::lock_guard lock(ops_mutex_);
  return operations_;
}

// -----------------------------------------------------------------------------
// Scheduling
// -----------------------------------------------------------------------------
void StrategyContext::runDaily(ScheduledCallback fn, domain::MarketPhase phase,
                               std::string reference_instrument,
                               std::string name) {
  if (!registration_open_) {
    throw StrategyError("runDaily is only allowed during initialize");
  }
  if (!fn) {
    throw StrategyError("runDaily requires a callback");
  }
  instance_->scheduler().registerCallback(std::move(fn), phase,
                                          std::move(reference_instrument),
                                          std::move(name));
}

void StrategyContext::runDaily(ScheduledCallback fn, const std::string& time,
                               std::string reference_instrument,
                               std::string name) {
  auto phase = domain::parseMarketPhase(time);
  if (!phase) {
    throw StrategyError("unknown runDaily time '" + time + "'");
  }
  runDaily(std::move(fn), *phase, std::move(reference_instrument),
           std::move(name));
}

// -----------------------------------------------------------------------------
// Internals
// -----------------------------------------------------------------------------
domain::Order StrategyContext::createOrder(const std::string& symbol,
                                           domain::Side side, double qty,
                                           std::optional<double> price) {
  ensureActive();
  if (symbol.empty()) {
    throw StrategyError("order symbol must not be empty");
  }
  if (!(qty > 0.0)) {
    throw StrategyError("order quantity must be positive");
  }
  if (price && !(*price > 0.0)) {
    throw StrategyError("limit price must be positive");
  }

  domain::Order order;
  order.unique_id =
      request_->exec_id + "_" + std::to_string(order_seq_.next_id());
  order.symbol = symbol;
  order.side = side;
  order.type = price ? domain::OrderType::Limit : domain::OrderType::Market;
  order.qty = qty;
  order.limit_price = price;
  order.status = domain::OrderStatus::Open;
  order.time_in_force = domain::TimeInForce::Gtc;

  domain::OrderOperation op;
  op.op_type = domain::OrderOpType::Create;
  op.order = order;
  submit(std::move(op));

  log_.write(LogLevel::Debug, "order", "create " + describe(order));
  return order;
}

const domain::Order* StrategyContext::findIncomplete(
    const std::string& id) const {
  if (id.empty()) {
    return nullptr;
  }
  for (const auto& order : request_->incomplete_orders) {
    if (order.order_id == id || order.unique_id == id) {
      return &order;
    }
  }
  return nullptr;
}

void StrategyContext::submit(domain::OrderOperation op) {
  std::lock_guard lock(ops_mutex_);
  ensureActive();
  operations_.push_back(std::move(op));
}

void StrategyContext::ensureActive() const {
  if (closed_.load()) {
    throw StrategyError("execution scope closed; order operation dropped");
  }
  if (cancelled_.load()) {
    throw StrategyError("execution cancelled; order operation dropped");
  }
}

}  // namespace stratexec
