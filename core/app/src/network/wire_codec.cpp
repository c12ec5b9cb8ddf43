#include "stratexec/network/wire_codec.hpp"

#include "stratexec/errors/errors.hpp"

#include <cctype>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <variant>
#include <vector>

namespace stratexec {

namespace {

using nlohmann::json;

const json* field(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

void requireObject(const json& j, const std::string& what) {
  if (!j.is_object()) {
    throw InvalidRequest(what + " must be a JSON object");
  }
}

InvalidRequest badField(const char* key, const char* expected) {
  return InvalidRequest(std::string("field '") + key + "' must be " +
                        expected);
}

// Whole-string numeric parse; trailing whitespace allowed.
template <typename T, typename Parse>
T parseText(const std::string& text, const char* key, const char* expected,
            Parse parse) {
  std::size_t pos = 0;
  T value{};
  try {
    value = parse(text, &pos);
  } catch (const std::logic_error&) {
    throw badField(key, expected);
  }
  while (pos < text.size() &&
         std::isspace(static_cast<unsigned char>(text[pos]))) {
    ++pos;
  }
  if (pos != text.size()) {
    throw badField(key, expected);
  }
  return value;
}

double numberField(const json& j, const char* key, double fallback = 0.0) {
  const json* v = field(j, key);
  if (v == nullptr) {
    return fallback;
  }
  if (v->is_number()) {
    return v->get<double>();
  }
  if (v->is_string()) {
    const auto& text = v->get_ref<const std::string&>();
    if (text.empty()) {
      return fallback;
    }
    return parseText<double>(text, key, "a number",
                             [](const std::string& s, std::size_t* pos) {
                               return std::stod(s, pos);
                             });
  }
  throw badField(key, "a number");
}

std::int64_t integerField(const json& j, const char* key,
                          std::int64_t fallback = 0) {
  const json* v = field(j, key);
  if (v == nullptr) {
    return fallback;
  }
  if (v->is_number_integer()) {
    return v->get<std::int64_t>();
  }
  if (v->is_number_float()) {
    return static_cast<std::int64_t>(v->get<double>());
  }
  if (v->is_string()) {
    const auto& text = v->get_ref<const std::string&>();
    if (text.empty()) {
      return fallback;
    }
    return parseText<std::int64_t>(
        text, key, "an integer", [](const std::string& s, std::size_t* pos) {
          return static_cast<std::int64_t>(std::stoll(s, pos));
        });
  }
  throw badField(key, "an integer");
}

int intField(const json& j, const char* key, int fallback = 0) {
  return static_cast<int>(integerField(j, key, fallback));
}

std::string stringField(const json& j, const char* key) {
  const json* v = field(j, key);
  if (v == nullptr) {
    return {};
  }
  if (v->is_string()) {
    return v->get<std::string>();
  }
  if (v->is_number()) {
    return v->dump();
  }
  throw badField(key, "a string");
}

std::optional<double> optionalNumber(const json& j, const char* key) {
  const json* v = field(j, key);
  if (v == nullptr) {
    return std::nullopt;
  }
  if (v->is_string() && v->get_ref<const std::string&>().empty()) {
    return std::nullopt;
  }
  return numberField(j, key);
}

template <typename E>
E enumField(const json& j, const char* key, int min_code, int max_code) {
  const int code = intField(j, key, 0);
  if (code < min_code || code > max_code) {
    throw InvalidRequest(std::string("field '") + key + "' has unknown code " +
                         std::to_string(code));
  }
  return static_cast<E>(code);
}

template <typename T>
std::vector<T> listField(const json& j, const char* key) {
  std::vector<T> out;
  const json* v = field(j, key);
  if (v == nullptr) {
    return out;
  }
  if (!v->is_array()) {
    throw badField(key, "an array");
  }
  out.reserve(v->size());
  for (const auto& item : *v) {
    requireObject(item, std::string("element of '") + key + "'");
    T value;
    from_json(item, value);
    out.push_back(std::move(value));
  }
  return out;
}

json optionalJson(const std::optional<double>& value) {
  return value ? json(*value) : json(nullptr);
}

std::map<std::string, std::string> paramsField(const json& j) {
  std::map<std::string, std::string> params;
  const json* v = field(j, "strategy_param");
  if (v == nullptr) {
    return params;
  }
  if (!v->is_object()) {
    throw badField("strategy_param", "an object");
  }
  for (auto it = v->begin(); it != v->end(); ++it) {
    params[it.key()] =
        it->is_string() ? it->get<std::string>() : it->dump();
  }
  return params;
}

std::int64_t latestCloseTime(
    const std::vector<domain::MarketDataContext>& contexts) {
  std::int64_t latest = 0;
  for (const auto& context : contexts) {
    if (!context.bars.empty() && context.bars.back().close_time > latest) {
      latest = context.bars.back().close_time;
    }
  }
  return latest;
}

std::optional<domain::Trigger> decodeTrigger(
    const json& j, const std::vector<domain::MarketDataContext>& contexts) {
  const int code = intField(j, "trigger_type", 0);

  static const json kEmpty = json::object();
  const json* d = field(j, "trigger_detail");
  if (d != nullptr && !d->is_object()) {
    throw badField("trigger_detail", "an object");
  }
  const json& detail = d != nullptr ? *d : kEmpty;

  domain::Trigger trigger;
  switch (code) {
    case 0:
      return std::nullopt;
    case 1:
      trigger.detail = domain::MarketDataTrigger{
          stringField(detail, "symbol"), stringField(detail, "timeframe")};
      break;
    case 2:
      trigger.detail = domain::RiskManageTrigger{
          intField(detail, "risk_event_type"), stringField(detail, "remark")};
      break;
    case 3: {
      domain::OrderStatusTrigger status;
      if (const json* order = field(detail, "order")) {
        requireObject(*order, "trigger_detail.order");
        from_json(*order, status.order);
      }
      trigger.detail = std::move(status);
      break;
    }
    default:
      throw InvalidRequest("unknown trigger_type " + std::to_string(code));
  }

  trigger.timestamp_ms = integerField(
      j, "trigger_timestamp",
      integerField(detail, "timestamp", latestCloseTime(contexts)));
  return trigger;
}

json encodeTriggerDetail(const domain::Trigger& trigger) {
  json detail = json::object();
  if (const auto* md = std::get_if<domain::MarketDataTrigger>(&trigger.detail)) {
    detail["symbol"] = md->symbol;
    detail["timeframe"] = md->timeframe;
  } else if (const auto* risk =
                 std::get_if<domain::RiskManageTrigger>(&trigger.detail)) {
    detail["risk_event_type"] = risk->risk_event_type;
    detail["remark"] = risk->remark;
  } else if (const auto* os =
                 std::get_if<domain::OrderStatusTrigger>(&trigger.detail)) {
    detail["order"] = os->order;
  }
  return detail;
}

}  // namespace

namespace domain {

// -----------------------------------------------------------------------------
// Market data
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Bar& bar) {
  j = nlohmann::json{{"open_time", bar.open_time}, {"close_time", bar.close_time},
                     {"open", bar.open},           {"high", bar.high},
                     {"low", bar.low},             {"close", bar.close},
                     {"volume", bar.volume}};
}

void from_json(const nlohmann::json& j, Bar& bar) {
  bar.open_time = integerField(j, "open_time");
  bar.close_time = integerField(j, "close_time");
  bar.open = numberField(j, "open");
  bar.high = numberField(j, "high");
  bar.low = numberField(j, "low");
  bar.close = numberField(j, "close");
  bar.volume = numberField(j, "volume");
}

void to_json(nlohmann::json& j, const MarketDataContext& context) {
  j = nlohmann::json{{"symbol", context.symbol},
                     {"timeframe", context.timeframe},
                     {"bars", context.bars}};
}

void from_json(const nlohmann::json& j, MarketDataContext& context) {
  context.symbol = stringField(j, "symbol");
  context.timeframe = stringField(j, "timeframe");
  context.bars = listField<Bar>(j, "bars");
}

// -----------------------------------------------------------------------------
// Orders
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Order& order) {
  j = nlohmann::json{
      {"order_id", order.order_id},
      {"unique_id", order.unique_id},
      {"symbol", order.symbol},
      {"direction_type", static_cast<int>(order.side)},
      {"order_type", static_cast<int>(order.type)},
      {"qty", order.qty},
      {"limit_price", optionalJson(order.limit_price)},
      {"status", static_cast<int>(order.status)},
      {"executed_size", order.executed_size},
      {"avg_fill_price", optionalJson(order.avg_fill_price)},
      {"commission", optionalJson(order.commission)},
      {"cancel_reason", order.cancel_reason},
      {"time_in_force", static_cast<int>(order.time_in_force)}};
}

void from_json(const nlohmann::json& j, Order& order) {
  order.order_id = stringField(j, "order_id");
  order.unique_id = stringField(j, "unique_id");
  order.symbol = stringField(j, "symbol");
  order.side = enumField<Side>(j, "direction_type", 0, 2);
  order.type = enumField<OrderType>(j, "order_type", 0, 4);
  order.qty = numberField(j, "qty");
  order.limit_price = optionalNumber(j, "limit_price");
  if (order.limit_price && !(*order.limit_price > 0.0)) {
    order.limit_price.reset();
  }
  order.status = enumField<OrderStatus>(j, "status", 0, 7);
  order.executed_size = numberField(j, "executed_size");
  order.avg_fill_price = optionalNumber(j, "avg_fill_price");
  order.commission = optionalNumber(j, "commission");
  order.cancel_reason = stringField(j, "cancel_reason");
  order.time_in_force = enumField<TimeInForce>(j, "time_in_force", 0, 4);
}

void to_json(nlohmann::json& j, const OrderOperation& op) {
  j = nlohmann::json{{"order_op_type", static_cast<int>(op.op_type)},
                     {"order", op.order}};
}

void from_json(const nlohmann::json& j, OrderOperation& op) {
  op.op_type = enumField<OrderOpType>(j, "order_op_type", 0, 3);
  if (const nlohmann::json* order = field(j, "order")) {
    requireObject(*order, "order_op_event.order");
    from_json(*order, op.order);
  }
}

// -----------------------------------------------------------------------------
// Account
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Balance& balance) {
  j = nlohmann::json{{"asset", balance.asset},
                     {"free", balance.free},
                     {"locked", balance.locked}};
}

void from_json(const nlohmann::json& j, Balance& balance) {
  balance.asset = stringField(j, "asset");
  balance.free = numberField(j, "free");
  balance.locked = numberField(j, "locked");
}

void to_json(nlohmann::json& j, const Position& position) {
  j = nlohmann::json{{"symbol", position.symbol},
                     {"quantity", position.quantity},
                     {"average_cost_price", position.average_cost_price},
                     {"unrealized_pnl", position.unrealized_pnl},
                     {"side", position.side}};
}

void from_json(const nlohmann::json& j, Position& position) {
  position.symbol = stringField(j, "symbol");
  position.quantity = numberField(j, "quantity");
  position.average_cost_price = numberField(j, "average_cost_price");
  position.unrealized_pnl = numberField(j, "unrealized_pnl");
  position.side = intField(j, "side");
}

void to_json(nlohmann::json& j, const Account& account) {
  j = nlohmann::json{{"account_id", account.account_id},
                     {"account_type", account.account_type},
                     {"total_net_value", account.total_net_value},
                     {"available_margin", account.available_margin},
                     {"margin_ratio", account.margin_ratio},
                     {"risk_level", account.risk_level},
                     {"leverage", account.leverage},
                     {"balances", account.balances},
                     {"positions", account.positions}};
}

void from_json(const nlohmann::json& j, Account& account) {
  account.account_id = stringField(j, "account_id");
  account.account_type = intField(j, "account_type");
  account.total_net_value = numberField(j, "total_net_value");
  account.available_margin = numberField(j, "available_margin");
  account.margin_ratio = numberField(j, "margin_ratio");
  account.risk_level = numberField(j, "risk_level");
  account.leverage = numberField(j, "leverage");
  account.balances = listField<Balance>(j, "balances");
  account.positions = listField<Position>(j, "positions");
}

// -----------------------------------------------------------------------------
// Request / response
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const ExecutionRequest& request) {
  j = nlohmann::json::object();
  j["max_timeout"] = request.max_timeout;
  if (request.trigger) {
    j["trigger_type"] = static_cast<int>(request.trigger->type());
    j["trigger_detail"] = encodeTriggerDetail(*request.trigger);
    j["trigger_timestamp"] = request.trigger->timestamp_ms;
  } else {
    j["trigger_type"] = static_cast<int>(TriggerType::Invalid);
    j["trigger_detail"] = nlohmann::json::object();
  }
  j["market_data_context"] = request.market_data_context;
  j["account"] = request.account;
  j["incomplete_orders"] = request.incomplete_orders;
  j["completed_orders"] = request.completed_orders;
  j["exchange"] = request.exchange;
  j["exec_id"] = request.exec_id;
  j["strategy_id"] = request.strategy_id;
  j["strategy_param"] = request.strategy_param;
}

void from_json(const nlohmann::json& j, ExecutionRequest& request) {
  requireObject(j, "request");
  request.max_timeout = numberField(j, "max_timeout");
  request.exchange = stringField(j, "exchange");
  request.exec_id = stringField(j, "exec_id");
  request.strategy_id = stringField(j, "strategy_id");
  request.strategy_param = paramsField(j);
  if (const nlohmann::json* account = field(j, "account")) {
    requireObject(*account, "account");
    from_json(*account, request.account);
  }
  request.market_data_context =
      listField<MarketDataContext>(j, "market_data_context");
  request.incomplete_orders = listField<Order>(j, "incomplete_orders");
  request.completed_orders = listField<Order>(j, "completed_orders");
  request.trigger = decodeTrigger(j, request.market_data_context);
}

void to_json(nlohmann::json& j, const ExecutionResponse& response) {
  j = nlohmann::json{{"order_op_event", response.order_op_event},
                     {"status", static_cast<int>(response.status)},
                     {"error_message", response.error_message},
                     {"warnings", response.warnings}};
}

void from_json(const nlohmann::json& j, ExecutionResponse& response) {
  requireObject(j, "response");
  response.status = enumField<ExecStatus>(j, "status", 0, 2);
  response.order_op_event = listField<OrderOperation>(j, "order_op_event");
  response.error_message = stringField(j, "error_message");
  response.warnings.clear();
  if (const nlohmann::json* warnings = field(j, "warnings")) {
    if (!warnings->is_array()) {
      throw badField("warnings", "an array");
    }
    for (const auto& w : *warnings) {
      response.warnings.push_back(w.is_string() ? w.get<std::string>()
                                                : w.dump());
    }
  }
}

}  // namespace domain

namespace wire {

domain::ExecutionRequest decodeRequest(const nlohmann::json& j) {
  domain::ExecutionRequest request;
  try {
    from_json(j, request);
  } catch (const nlohmann::json::exception& e) {
    throw InvalidRequest(std::string("malformed request: ") + e.what());
  }
  return request;
}

domain::ExecutionRequest decodeRequest(const std::string& text) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    throw InvalidRequest(std::string("malformed JSON: ") + e.what());
  }
  return decodeRequest(j);
}

nlohmann::json encodeRequest(const domain::ExecutionRequest& request) {
  nlohmann::json j = request;
  return j;
}

nlohmann::json encodeResponse(const domain::ExecutionResponse& response) {
  nlohmann::json j = response;
  return j;
}

domain::ExecutionResponse decodeResponse(const nlohmann::json& j) {
  domain::ExecutionResponse response;
  try {
    from_json(j, response);
  } catch (const nlohmann::json::exception& e) {
    throw InvalidRequest(std::string("malformed response: ") + e.what());
  }
  return response;
}

}  // namespace wire
}  // namespace stratexec
