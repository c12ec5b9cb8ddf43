#include "stratexec/strategy/strategy_log.hpp"

#include <utility>

namespace stratexec {

namespace {

// Serializes writes from every StrategyLog so concurrent invocations
// produce whole lines.
std::mutex& sinkMutex() {
  static std::mutex mutex;
  return mutex;
}

}  // namespace

const char* logLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "INFO";
}

StrategyLog::StrategyLog(std::string tag, std::ostream& sink)
    : tag_(std::move(tag)), sink_(sink) {}

void StrategyLog::write(LogLevel level, const std::string& category,
                        const std::string& message) {
  if (level < this->level(category)) {
    return;
  }
  std::string line;
  line.reserve(message.size() + tag_.size() + 16);
  line += '[';
  line += logLevelName(level);
  line += "] [";
  line += tag_;
  line += "] ";
  line += message;
  line += '\n';

  std::lock_guard lock(sinkMutex());
  sink_ << line;
  sink_.flush();
}

void StrategyLog::setLevel(const std::string& category,
                           const std::string& level) {
  LogLevel parsed;
  if (level == "debug") {
    parsed = LogLevel::Debug;
  } else if (level == "info") {
    parsed = LogLevel::Info;
  } else if (level == "warn" || level == "warning") {
    parsed = LogLevel::Warn;
  } else if (level == "error") {
    parsed = LogLevel::Error;
  } else {
    return;
  }
  std::lock_guard lock(mutex_);
  levels_[category] = parsed;
}

LogLevel StrategyLog::level(const std::string& category) const {
  std::lock_guard lock(mutex_);
  auto it = levels_.find(category);
  return it == levels_.end() ? LogLevel::Debug : it->second;
}

}  // namespace stratexec
