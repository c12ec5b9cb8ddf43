#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace stratexec {

class ExecutionGateway;

// -----------------------------------------------------------------------------
// CommandHandler — JSON envelope in, JSON envelope out
// -----------------------------------------------------------------------------
//
// @brief  Maps one RPC payload to one ExecutionGateway call and formats the
//         reply.
//
// @details
// Requests:
//   {"method": "Exec",   "request": {...ExecutionRequest...}}
//   {"method": "Health"}
//
// Replies:
//   {"ok": true,  "response": {...ExecutionResponse...}}
//   {"ok": true,  "health": {"status": "HEALTHY", "message": "...",
//                            "details": ["key=value", ...]}}
//   {"ok": false, "error": {"code": "INVALID_REQUEST", "message": "..."}}
//
// Malformed JSON, unknown methods and requests the gateway rejects produce
// the error envelope; execute() itself never throws for bad input.
//
// Thread model:
//   execute() is safe from any number of RPC worker threads at once; it
//   holds no state besides the gateway reference.
// -----------------------------------------------------------------------------
class CommandHandler {
 public:
  explicit CommandHandler(ExecutionGateway& gateway) : gateway_(gateway) {}

  std::string execute(const std::string& payload) const;

  // Same, on an already-parsed envelope.
  nlohmann::json executeJson(const nlohmann::json& envelope) const;

  // -------------------------------------------------------------------------
  // routingKey(payload)
  // -------------------------------------------------------------------------
  // @brief  The ordering key of a payload for KeyedWorkerPool.
  //
  // @return "pair:<account_id>\x1f<strategy_id>" for an Exec envelope,
  //         with the strategy resolved the way the gateway resolves it;
  //         empty (no ordering) for anything else, including payloads
  //         execute() will reject.
  // -------------------------------------------------------------------------
  std::string routingKey(const std::string& payload) const;

  static nlohmann::json errorReply(const std::string& code,
                                   const std::string& message);

 private:
  nlohmann::json exec(const nlohmann::json& envelope) const;
  nlohmann::json health() const;

  ExecutionGateway& gateway_;
};

}  // namespace stratexec
