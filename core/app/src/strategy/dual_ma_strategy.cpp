#include "stratexec/strategy/dual_ma_strategy.hpp"

#include "stratexec/errors/errors.hpp"
#include "stratexec/strategy/strategy_context.hpp"

#include <sstream>
#include <stdexcept>
#include <vector>

namespace stratexec {

namespace {

int intParam(const StrategyContext& ctx, const char* key, int fallback) {
  std::string text = ctx.param(key);
  if (text.empty()) {
    return fallback;
  }
  try {
    int value = std::stoi(text);
    if (value <= 0) {
      throw StrategyError(std::string(key) + " must be positive");
    }
    return value;
  } catch (const std::logic_error&) {
    throw StrategyError(std::string(key) + " is not an integer: " + text);
  }
}

double doubleParam(const StrategyContext& ctx, const char* key,
                   double fallback) {
  std::string text = ctx.param(key);
  if (text.empty()) {
    return fallback;
  }
  try {
    double value = std::stod(text);
    if (!(value > 0.0)) {
      throw StrategyError(std::string(key) + " must be positive");
    }
    return value;
  } catch (const std::logic_error&) {
    throw StrategyError(std::string(key) + " is not a number: " + text);
  }
}

double meanClose(const std::vector<domain::Bar>& bars, std::size_t end,
                 int window) {
  double sum = 0.0;
  for (std::size_t i = end - static_cast<std::size_t>(window); i < end; ++i) {
    sum += bars[i].close;
  }
  return sum / window;
}

}  // namespace

void DualMaStrategy::initialize(StrategyContext& ctx) {
  const auto& contexts = ctx.request().market_data_context;
  symbol_ = ctx.param("symbol", contexts.empty() ? "" : contexts.front().symbol);
  timeframe_ =
      ctx.param("timeframe", contexts.empty() ? "" : contexts.front().timeframe);
  short_window_ = intParam(ctx, "short_window", 5);
  long_window_ = intParam(ctx, "long_window", 10);
  quantity_ = doubleParam(ctx, "quantity", 0.01);
  if (short_window_ >= long_window_) {
    throw StrategyError("short_window must be smaller than long_window");
  }

  ctx.g()["signals_today"] = 0;
  ctx.runDaily(
      [](StrategyContext& c) { c.g()["signals_today"] = 0; }, "before_open",
      symbol_, "reset_daily_signals");

  std::ostringstream msg;
  msg << "initialized " << symbol_ << " " << timeframe_ << " windows="
      << short_window_ << "/" << long_window_ << " qty=" << quantity_;
  ctx.log().info(msg.str());
}

void DualMaStrategy::beforeTrading(StrategyContext& ctx) {
  ctx.log().info("before trading, position " + symbol_ + "=" +
                 std::to_string(ctx.positionQuantity(symbol_)));
}

void DualMaStrategy::handleBar(StrategyContext& ctx, const domain::Bar& bar) {
  std::vector<domain::Bar> bars;
  try {
    bars = ctx.history(symbol_, long_window_ + 1, timeframe_);
  } catch (const InsufficientData& e) {
    ctx.log().warn(std::string("skipping bar: ") + e.what());
    return;
  }

  const std::size_t n = bars.size();
  double short_now = meanClose(bars, n, short_window_);
  double long_now = meanClose(bars, n, long_window_);
  double short_prev = meanClose(bars, n - 1, short_window_);
  double long_prev = meanClose(bars, n - 1, long_window_);

  bool golden = short_prev <= long_prev && short_now > long_now;
  bool death = short_prev >= long_prev && short_now < long_now;
  double position = ctx.positionQuantity(symbol_);

  if (golden && position <= 0.0) {
    ctx.orderBuy(symbol_, quantity_);
    ctx.g()["last_signal"] = "golden_cross";
  } else if (death && position > 0.0) {
    ctx.orderSell(symbol_, quantity_);
    ctx.g()["last_signal"] = "death_cross";
  } else {
    return;
  }

  ctx.g()["signals_today"] = ctx.g().value("signals_today", 0) + 1;
  std::ostringstream msg;
  msg << ctx.g()["last_signal"].get<std::string>() << " at close "
      << bar.close;
  ctx.log().info(msg.str());
}

void DualMaStrategy::onOrder(StrategyContext& ctx, const domain::Order& order) {
  std::ostringstream msg;
  msg << "order update id=" << order.order_id
      << " status=" << static_cast<int>(order.status)
      << " filled=" << order.executed_size;
  ctx.log().info(msg.str());
}

void DualMaStrategy::onRiskEvent(StrategyContext& ctx,
                                 const domain::RiskManageTrigger& event) {
  ctx.log().warn("risk event " + std::to_string(event.risk_event_type) +
                 ": " + event.remark);
}

}  // namespace stratexec
