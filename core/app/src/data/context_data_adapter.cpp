#include "stratexec/data/context_data_adapter.hpp"

#include "stratexec/domain/market_type.hpp"
#include "stratexec/errors/errors.hpp"
#include "stratexec/time/time_utils.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <set>
#include <utility>

namespace stratexec {

namespace {

constexpr std::array<const char*, 5> kPriceFields = {"open", "high", "low",
                                                     "close", "volume"};

double fieldOf(const domain::Bar& bar, const std::string& field) {
  if (field == "open") return bar.open;
  if (field == "high") return bar.high;
  if (field == "low") return bar.low;
  if (field == "close") return bar.close;
  return bar.volume;
}

std::int64_t requireDate(const std::string& text) {
  std::optional<std::int64_t> day = parse_date(text);
  if (!day) {
    throw StrategyError("date must be YYYY-MM-DD, got '" + text + "'");
  }
  return *day;
}

}  // namespace

ContextDataAdapter::ContextDataAdapter(
    std::shared_ptr<const domain::ExecutionRequest> request,
    std::shared_ptr<const TradeCalendar> calendar)
    : request_(std::move(request)), calendar_(std::move(calendar)) {}

// -----------------------------------------------------------------------------
// history(): tail of the matching snapshot, oldest first
// -----------------------------------------------------------------------------
std::vector<domain::Bar> ContextDataAdapter::history(
    const std::string& instrument, int count,
    const std::string& resolution) const {
  if (count < 0) {
    throw InsufficientData("history count must not be negative, got " +
                           std::to_string(count));
  }
  const domain::MarketDataContext* ctx = find(instrument, resolution);
  if (ctx == nullptr) {
    throw InsufficientData("no market data for " + instrument + " at " +
                           resolution);
  }
  const auto wanted = static_cast<std::size_t>(count);
  if (wanted > ctx->bars.size()) {
    throw InsufficientData("requested " + std::to_string(count) +
                           " bars of " + instrument + " " + resolution +
                           ", only " + std::to_string(ctx->bars.size()) +
                           " supplied");
  }
  auto first = ctx->bars.end() - static_cast<std::ptrdiff_t>(wanted);
  return std::vector<domain::Bar>(first, ctx->bars.end());
}

// -----------------------------------------------------------------------------
// instrumentMetadata()
// -----------------------------------------------------------------------------
InstrumentMetadata ContextDataAdapter::instrumentMetadata(
    const std::string& instrument) const {
  InstrumentMetadata meta;
  meta.symbol = instrument;
  meta.market_type = domain::marketTypeName(domain::detectMarketType(instrument));

  bool found = false;
  for (const auto& ctx : request_->market_data_context) {
    if (ctx.symbol != instrument) {
      continue;
    }
    found = true;
    meta.resolutions.push_back(ctx.timeframe);
    meta.bar_count += ctx.bars.size();
    if (ctx.bars.empty()) {
      continue;
    }
    if (meta.first_open_time == 0 ||
        ctx.bars.front().open_time < meta.first_open_time) {
      meta.first_open_time = ctx.bars.front().open_time;
    }
    meta.last_close_time =
        std::max(meta.last_close_time, ctx.bars.back().close_time);
  }
  if (!found) {
    throw InsufficientData("no market data for " + instrument);
  }
  return meta;
}

// -----------------------------------------------------------------------------
// trades(): orders with fills, keyed by order id
// -----------------------------------------------------------------------------
std::map<std::string, FillRecord> ContextDataAdapter::trades() const {
  std::map<std::string, FillRecord> out;
  auto collect = [&out](const std::vector<domain::Order>& orders) {
    for (const auto& order : orders) {
      if (order.executed_size <= 0.0) {
        continue;
      }
      FillRecord record;
      record.order_id = order.order_id;
      record.unique_id = order.unique_id;
      record.symbol = order.symbol;
      record.side = order.side;
      record.executed_size = order.executed_size;
      record.avg_fill_price = order.avg_fill_price.value_or(0.0);
      record.commission = order.commission.value_or(0.0);
      record.status = order.status;
      const std::string& key =
          order.order_id.empty() ? order.unique_id : order.order_id;
      out[key] = std::move(record);
    }
  };
  collect(request_->completed_orders);
  collect(request_->incomplete_orders);
  return out;
}

std::vector<std::string> ContextDataAdapter::allSymbols() const {
  std::set<std::string> symbols;
  for (const auto& ctx : request_->market_data_context) {
    if (!ctx.symbol.empty()) {
      symbols.insert(ctx.symbol);
    }
  }
  return {symbols.begin(), symbols.end()};
}

std::optional<domain::Bar> ContextDataAdapter::currentBar() const {
  const auto& contexts = request_->market_data_context;
  if (contexts.empty() || contexts.front().bars.empty()) {
    return std::nullopt;
  }
  return contexts.front().bars.back();
}

std::optional<domain::Bar> ContextDataAdapter::latestBar(
    const std::string& instrument) const {
  for (const auto& ctx : request_->market_data_context) {
    if (ctx.symbol == instrument && !ctx.bars.empty()) {
      return ctx.bars.back();
    }
  }
  return std::nullopt;
}

const std::vector<domain::Order>& ContextDataAdapter::incompleteOrders() const {
  return request_->incomplete_orders;
}

const std::vector<domain::Order>& ContextDataAdapter::completedOrders() const {
  return request_->completed_orders;
}

// -----------------------------------------------------------------------------
// price(): history() as columns
// -----------------------------------------------------------------------------
PriceFrame ContextDataAdapter::price(
    const std::string& instrument, int count, const std::string& resolution,
    const std::vector<std::string>& fields) const {
  std::vector<domain::Bar> bars = history(instrument, count, resolution);

  std::vector<std::string> selected;
  for (const auto& field : fields) {
    bool known = std::find(kPriceFields.begin(), kPriceFields.end(), field) !=
                 kPriceFields.end();
    if (known && std::find(selected.begin(), selected.end(), field) ==
                     selected.end()) {
      selected.push_back(field);
    }
  }
  if (selected.empty()) {
    selected.assign(kPriceFields.begin(), kPriceFields.end());
  }

  PriceFrame frame;
  for (const auto& bar : bars) {
    frame.close_time.push_back(bar.close_time);
  }
  for (const auto& field : selected) {
    auto& column = frame.columns[field];
    for (const auto& bar : bars) {
      column.push_back(fieldOf(bar, field));
    }
  }
  return frame;
}

// -----------------------------------------------------------------------------
// tradeDays() / isTradeDay()
// -----------------------------------------------------------------------------
std::vector<std::string> ContextDataAdapter::tradeDays(
    const std::optional<std::string>& start_date,
    const std::optional<std::string>& end_date,
    std::optional<int> count) const {
  if (count && *count <= 0) {
    throw StrategyError("trade day count must be positive, got " +
                        std::to_string(*count));
  }

  std::optional<std::int64_t> first_data_day;
  std::optional<std::int64_t> last_data_day;
  for (const auto& ctx : request_->market_data_context) {
    for (const auto& bar : ctx.bars) {
      if (bar.close_time <= 0) {
        continue;
      }
      std::int64_t day = local_day_index(bar.close_time, 0);
      if (!first_data_day || day < *first_data_day) first_data_day = day;
      if (!last_data_day || day > *last_data_day) last_data_day = day;
    }
  }
  if (!last_data_day) {
    return {};
  }

  std::int64_t first = *first_data_day;
  std::int64_t last = *last_data_day;
  if (start_date) {
    first = requireDate(*start_date);
    if (end_date) {
      last = requireDate(*end_date);
    }
  } else if (count) {
    first = last - (*count - 1);
  }
  return calendar().tradeDays(primaryMarketType(), first, last);
}

bool ContextDataAdapter::isTradeDay(const std::string& date) const {
  return calendar().isTradeDay(primaryMarketType(), requireDate(date));
}

domain::MarketType ContextDataAdapter::primaryMarketType() const {
  auto it = request_->strategy_param.find("market_type");
  if (it != request_->strategy_param.end()) {
    if (auto parsed = domain::parseMarketType(it->second)) {
      return *parsed;
    }
  }
  for (const auto& ctx : request_->market_data_context) {
    if (!ctx.symbol.empty()) {
      return domain::detectMarketType(ctx.symbol);
    }
  }
  return domain::MarketType::Crypto;
}

const TradeCalendar& ContextDataAdapter::calendar() const {
  static const TradeCalendar kDefault;
  return calendar_ ? *calendar_ : kDefault;
}

const domain::MarketDataContext* ContextDataAdapter::find(
    const std::string& instrument, const std::string& resolution) const {
  for (const auto& ctx : request_->market_data_context) {
    if (ctx.symbol == instrument && ctx.timeframe == resolution) {
      return &ctx;
    }
  }
  return nullptr;
}

}  // namespace stratexec
