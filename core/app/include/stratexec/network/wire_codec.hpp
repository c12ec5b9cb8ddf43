#pragma once

#include "stratexec/domain/account.hpp"
#include "stratexec/domain/execution_request.hpp"
#include "stratexec/domain/execution_response.hpp"
#include "stratexec/domain/market_data.hpp"
#include "stratexec/domain/order.hpp"

#include <nlohmann/json.hpp>

#include <string>

// -----------------------------------------------------------------------------
// Wire codec — JSON <-> domain types
// -----------------------------------------------------------------------------
//
// @brief  nlohmann::json adapters for every type that crosses the RPC
//         boundary, plus whole-request / whole-response helpers.
//
// @details
// Field names and integer codes follow the trade server's message layout:
//   trigger_type      0 invalid, 1 market data, 2 risk manage, 3 order status
//   status            0 success, 1 partial success, 2 failed
//   order_op_type     1 create, 2 withdraw, 3 modify
//   direction_type    1 buy, 2 sell
//   order_type        1 market, 2 limit, 3 stop market, 4 stop limit
//   time_in_force     2 GTC
//
// Decoding is lenient where the upstream is: missing fields take their
// defaults, and numeric fields accept either JSON numbers or numeric
// strings ("101.5"). A limit_price that is absent, empty, or not positive
// decodes to "no limit price". Anything else that does not fit raises
// InvalidRequest naming the offending field.
//
// Thread model: Stateless free functions; safe from any thread.
// -----------------------------------------------------------------------------

namespace stratexec {
namespace domain {

void to_json(nlohmann::json& j, const Bar& bar);
void from_json(const nlohmann::json& j, Bar& bar);

void to_json(nlohmann::json& j, const MarketDataContext& context);
void from_json(const nlohmann::json& j, MarketDataContext& context);

void to_json(nlohmann::json& j, const Order& order);
void from_json(const nlohmann::json& j, Order& order);

void to_json(nlohmann::json& j, const Balance& balance);
void from_json(const nlohmann::json& j, Balance& balance);

void to_json(nlohmann::json& j, const Position& position);
void from_json(const nlohmann::json& j, Position& position);

void to_json(nlohmann::json& j, const Account& account);
void from_json(const nlohmann::json& j, Account& account);

void to_json(nlohmann::json& j, const OrderOperation& op);
void from_json(const nlohmann::json& j, OrderOperation& op);

void to_json(nlohmann::json& j, const ExecutionRequest& request);
void from_json(const nlohmann::json& j, ExecutionRequest& request);

void to_json(nlohmann::json& j, const ExecutionResponse& response);
void from_json(const nlohmann::json& j, ExecutionResponse& response);

}  // namespace domain

namespace wire {

// -----------------------------------------------------------------------------
// decodeRequest(j)
// -----------------------------------------------------------------------------
//
// @brief  Builds an ExecutionRequest from its JSON form.
//
// @details
// trigger_type 0 (or absent) leaves request.trigger empty; the gateway
// rejects such requests. The trigger timestamp is taken from
// "trigger_timestamp" or trigger_detail.timestamp (epoch ms); without
// either it is the latest close_time across market_data_context.
//
// @throws InvalidRequest on a non-object payload, an unknown trigger_type,
//         or a field of the wrong type.
// -----------------------------------------------------------------------------
domain::ExecutionRequest decodeRequest(const nlohmann::json& j);

// Parses text first; JSON syntax errors become InvalidRequest.
domain::ExecutionRequest decodeRequest(const std::string& text);

nlohmann::json encodeRequest(const domain::ExecutionRequest& request);

nlohmann::json encodeResponse(const domain::ExecutionResponse& response);

// @throws InvalidRequest on malformed input.
domain::ExecutionResponse decodeResponse(const nlohmann::json& j);

}  // namespace wire
}  // namespace stratexec
