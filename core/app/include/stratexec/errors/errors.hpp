#pragma once

#include <stdexcept>
#include <string>

namespace stratexec {

// -----------------------------------------------------------------------------
// ErrorCode — classification carried by every ExecError
// -----------------------------------------------------------------------------
//
// @brief  Stable identifiers for the failure classes raised inside the
//         service. The RPC layer reports them by name in error envelopes.
//
// @details
//   InvalidRequest       request rejected before any scope is opened
//   ScopeConflict        a second scope was opened for a busy pair
//   NotFound             no descriptor location knows the instrument
//   MalformedDescriptor  a descriptor entry failed structural validation
//   InsufficientData     a history query reaches outside the supplied bars
//   Timeout              the strategy call exceeded max_timeout
//   StrategyError        strategy code failed or misused its context
//   ConfigError          service configuration could not be loaded
// -----------------------------------------------------------------------------
enum class ErrorCode {
  InvalidRequest,
  ScopeConflict,
  NotFound,
  MalformedDescriptor,
  InsufficientData,
  Timeout,
  StrategyError,
  ConfigError,
};

inline const char* errorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::InvalidRequest:      return "INVALID_REQUEST";
    case ErrorCode::ScopeConflict:       return "SCOPE_CONFLICT";
    case ErrorCode::NotFound:            return "NOT_FOUND";
    case ErrorCode::MalformedDescriptor: return "MALFORMED_DESCRIPTOR";
    case ErrorCode::InsufficientData:    return "INSUFFICIENT_DATA";
    case ErrorCode::Timeout:             return "TIMEOUT";
    case ErrorCode::StrategyError:       return "STRATEGY_ERROR";
    case ErrorCode::ConfigError:         return "CONFIG_ERROR";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// ExecError — base class of the service's exception taxonomy
// -----------------------------------------------------------------------------
//
// @brief  std::runtime_error carrying an ErrorCode.
//
// @details
// Components throw the concrete subclasses below. Callers that only need
// the category catch ExecError and switch on code(). Strategy code may
// catch the recoverable ones (NotFound, MalformedDescriptor,
// InsufficientData) and continue.
//
// Thread model: Value type, safe to copy across threads (e.g. through a
// std::promise).
// -----------------------------------------------------------------------------
class ExecError : public std::runtime_error {
 public:
  ExecError(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

class InvalidRequest : public ExecError {
 public:
  explicit InvalidRequest(const std::string& message)
      : ExecError(ErrorCode::InvalidRequest, message) {}
};

class ScopeConflict : public ExecError {
 public:
  explicit ScopeConflict(const std::string& message)
      : ExecError(ErrorCode::ScopeConflict, message) {}
};

class NotFound : public ExecError {
 public:
  explicit NotFound(const std::string& message)
      : ExecError(ErrorCode::NotFound, message) {}
};

class MalformedDescriptor : public ExecError {
 public:
  explicit MalformedDescriptor(const std::string& message)
      : ExecError(ErrorCode::MalformedDescriptor, message) {}
};

class InsufficientData : public ExecError {
 public:
  explicit InsufficientData(const std::string& message)
      : ExecError(ErrorCode::InsufficientData, message) {}
};

class Timeout : public ExecError {
 public:
  explicit Timeout(const std::string& message)
      : ExecError(ErrorCode::Timeout, message) {}
};

class StrategyError : public ExecError {
 public:
  explicit StrategyError(const std::string& message)
      : ExecError(ErrorCode::StrategyError, message) {}
};

class ConfigError : public ExecError {
 public:
  explicit ConfigError(const std::string& message)
      : ExecError(ErrorCode::ConfigError, message) {}
};

}  // namespace stratexec
