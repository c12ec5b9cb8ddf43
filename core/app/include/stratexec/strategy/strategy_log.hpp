#pragma once

#include <map>
#include <mutex>
#include <ostream>
#include <string>

namespace stratexec {

// -----------------------------------------------------------------------------
// LogLevel
// -----------------------------------------------------------------------------
enum class LogLevel {
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3,
};

const char* logLevelName(LogLevel level);

// -----------------------------------------------------------------------------
// StrategyLog — the logger handed to strategy code
// -----------------------------------------------------------------------------
//
// @brief  Writes "[LEVEL] [strategy/account] message" lines to a sink.
//
// @details
// Every StrategyContext owns one. Lines below the minimum level of their
// category are dropped; the default category is "strategy" and order
// helpers log under "order". setLevel() accepts "debug", "info", "warn"
// ("warning"), and "error"; unknown names are ignored.
//
// Thread model:
//   Writes to the sink are serialized by a process-wide mutex so lines from
//   concurrent invocations never interleave. Level changes are guarded by
//   the instance mutex.
//
// Ownership:
//   Borrows the sink; the sink must outlive the logger. std::cout by
//   default.
// -----------------------------------------------------------------------------
class StrategyLog {
 public:
  StrategyLog(std::string tag, std::ostream& sink);

  StrategyLog(const StrategyLog&) = delete;
  StrategyLog& operator=(const StrategyLog&) = delete;

  void debug(const std::string& message) { write(LogLevel::Debug, kDefault, message); }
  void info(const std::string& message) { write(LogLevel::Info, kDefault, message); }
  void warn(const std::string& message) { write(LogLevel::Warn, kDefault, message); }
  void error(const std::string& message) { write(LogLevel::Error, kDefault, message); }

  // -------------------------------------------------------------------------
  // write(level, category, message)
  // -------------------------------------------------------------------------
  // @brief  Emits one line if level passes the category's threshold.
  // -------------------------------------------------------------------------
  void write(LogLevel level, const std::string& category,
             const std::string& message);

  // -------------------------------------------------------------------------
  // setLevel(category, level)
  // -------------------------------------------------------------------------
  // @brief  Sets the minimum level for one category, e.g.
  //         setLevel("order", "error") silences order debug lines.
  // -------------------------------------------------------------------------
  void setLevel(const std::string& category, const std::string& level);

  LogLevel level(const std::string& category) const;

 private:
  static constexpr const char* kDefault = "strategy";

  std::string tag_;
  std::ostream& sink_;
  mutable std::mutex mutex_;
  std::map<std::string, LogLevel> levels_;
};

}  // namespace stratexec
