#include "stratexec/engine/command_handler.hpp"

#include "stratexec/engine/execution_gateway.hpp"
#include "stratexec/errors/errors.hpp"
#include "stratexec/network/wire_codec.hpp"

#include <iostream>

namespace stratexec {

namespace {

// Invalid UTF-8 in strategy-provided text is replaced, never fatal.
std::string dumpReply(const nlohmann::json& reply) {
  return reply.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

// -----------------------------------------------------------------------------
// execute(payload): parse, dispatch, dump
// -----------------------------------------------------------------------------
std::string CommandHandler::execute(const std::string& payload) const {
  nlohmann::json envelope;
  try {
    envelope = nlohmann::json::parse(payload);
  } catch (const nlohmann::json::parse_error& e) {
    return dumpReply(errorReply(errorCodeName(ErrorCode::InvalidRequest),
                                std::string("malformed JSON: ") + e.what()));
  }
  return dumpReply(executeJson(envelope));
}

nlohmann::json CommandHandler::executeJson(
    const nlohmann::json& envelope) const {
  if (!envelope.is_object()) {
    return errorReply(errorCodeName(ErrorCode::InvalidRequest),
                      "envelope must be a JSON object");
  }

  std::string method;
  auto m = envelope.find("method");
  if (m != envelope.end() && m->is_string()) {
    method = m->get<std::string>();
  }
  try {
    if (method == "Exec") {
      return exec(envelope);
    }
    if (method == "Health") {
      return health();
    }
    return errorReply(errorCodeName(ErrorCode::InvalidRequest),
                      "unknown method: '" + method + "'");
  } catch (const ExecError& e) {
    std::cerr << "[CommandHandler] " << method << " rejected: " << e.what()
              << "\n";
    return errorReply(errorCodeName(e.code()), e.what());
  } catch (const std::exception& e) {
    std::cerr << "[CommandHandler] " << method << " failed: " << e.what()
              << "\n";
    return errorReply("INTERNAL", e.what());
  }
}

// -----------------------------------------------------------------------------
// routingKey(): (account, strategy) of an Exec envelope
// -----------------------------------------------------------------------------
std::string CommandHandler::routingKey(const std::string& payload) const {
  const nlohmann::json envelope =
      nlohmann::json::parse(payload, nullptr, /*allow_exceptions=*/false);
  if (!envelope.is_object()) {
    return {};
  }
  auto m = envelope.find("method");
  if (m == envelope.end() || !m->is_string() || *m != "Exec") {
    return {};
  }
  auto r = envelope.find("request");
  if (r == envelope.end() || !r->is_object()) {
    return {};
  }

  std::string account_id;
  auto a = r->find("account");
  if (a != r->end() && a->is_object()) {
    auto id = a->find("account_id");
    if (id != a->end() && id->is_string()) {
      account_id = id->get<std::string>();
    }
  }
  if (account_id.empty()) {
    return {};
  }

  std::string strategy_id;
  auto s = r->find("strategy_id");
  if (s != r->end() && s->is_string()) {
    strategy_id = s->get<std::string>();
  }
  return "pair:" + account_id + "\x1f" +
         gateway_.resolveStrategyId(strategy_id);
}

nlohmann::json CommandHandler::errorReply(const std::string& code,
                                          const std::string& message) {
  nlohmann::json reply;
  reply["ok"] = false;
  reply["error"] = {{"code", code}, {"message", message}};
  return reply;
}

// -----------------------------------------------------------------------------
// Exec
// -----------------------------------------------------------------------------
nlohmann::json CommandHandler::exec(const nlohmann::json& envelope) const {
  auto it = envelope.find("request");
  if (it == envelope.end()) {
    throw InvalidRequest("Exec envelope has no 'request'");
  }
  domain::ExecutionResponse response =
      gateway_.exec(wire::decodeRequest(*it));

  nlohmann::json reply;
  reply["ok"] = true;
  reply["response"] = wire::encodeResponse(response);
  return reply;
}

// -----------------------------------------------------------------------------
// Health
// -----------------------------------------------------------------------------
nlohmann::json CommandHandler::health() const {
  HealthReport report = gateway_.health();

  nlohmann::json reply;
  reply["ok"] = true;
  reply["health"] = {{"status", healthStatusName(report.status)},
                     {"message", report.message},
                     {"details", report.details}};
  return reply;
}

}  // namespace stratexec
