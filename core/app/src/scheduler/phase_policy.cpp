#include "stratexec/scheduler/phase_policy.hpp"

#include "stratexec/errors/errors.hpp"
#include "stratexec/time/time_utils.hpp"

#include <optional>
#include <stdexcept>

namespace stratexec {

namespace {

constexpr const char* kMarketTypeKey = "market_type";
constexpr const char* kOpenKey = "session.open";
constexpr const char* kCloseKey = "session.close";
constexpr const char* kOffsetKey = "session.utc_offset_minutes";

const std::string* findParam(const std::map<std::string, std::string>& params,
                             const char* key) {
  auto it = params.find(key);
  return it == params.end() ? nullptr : &it->second;
}

std::optional<int> parseOffset(const std::string& text) {
  try {
    std::size_t consumed = 0;
    int value = std::stoi(text, &consumed);
    if (consumed != text.size() || value < -14 * 60 || value > 14 * 60) {
      return std::nullopt;
    }
    return value;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

}  // namespace

int SessionWindow::offsetAt(std::int64_t epoch_ms) const {
  return us_eastern_dst ? us_eastern_offset_minutes(epoch_ms)
                        : utc_offset_minutes;
}

// -----------------------------------------------------------------------------
// validate(): reject overrides that cannot describe a session
// -----------------------------------------------------------------------------
void SessionPhasePolicy::validate(
    const std::map<std::string, std::string>& params) const {
  if (const auto* type = findParam(params, kMarketTypeKey)) {
    if (!domain::parseMarketType(*type)) {
      throw InvalidRequest("unknown market_type '" + *type + "'");
    }
  }
  if (const auto* open = findParam(params, kOpenKey)) {
    if (!parse_hhmm(*open)) {
      throw InvalidRequest("session.open must be HH:MM, got '" + *open + "'");
    }
  }
  if (const auto* close = findParam(params, kCloseKey)) {
    if (!parse_hhmm(*close)) {
      throw InvalidRequest("session.close must be HH:MM, got '" + *close +
                           "'");
    }
  }
  if (const auto* offset = findParam(params, kOffsetKey)) {
    if (!parseOffset(*offset)) {
      throw InvalidRequest("session.utc_offset_minutes out of range: '" +
                           *offset + "'");
    }
  }
  SessionWindow window = resolve("", params);
  if (window.open_minute > window.close_minute) {
    throw InvalidRequest("session.open is after session.close");
  }
}

// -----------------------------------------------------------------------------
// phaseAt()
// -----------------------------------------------------------------------------
domain::MarketPhase SessionPhasePolicy::phaseAt(
    std::int64_t epoch_ms, const std::string& reference_instrument,
    const std::map<std::string, std::string>& params) const {
  SessionWindow window = resolve(reference_instrument, params);
  int minute = local_minute_of_day(epoch_ms, window.offsetAt(epoch_ms));
  if (minute < window.open_minute) {
    return domain::MarketPhase::BeforeOpen;
  }
  if (minute < window.close_minute) {
    return domain::MarketPhase::Open;
  }
  return domain::MarketPhase::AfterClose;
}

std::int64_t SessionPhasePolicy::sessionDay(
    std::int64_t epoch_ms, const std::string& reference_instrument,
    const std::map<std::string, std::string>& params) const {
  SessionWindow window = resolve(reference_instrument, params);
  return local_day_index(epoch_ms, window.offsetAt(epoch_ms));
}

// -----------------------------------------------------------------------------
// resolve(): market default, then param overrides
// -----------------------------------------------------------------------------
SessionWindow SessionPhasePolicy::resolve(
    const std::string& reference_instrument,
    const std::map<std::string, std::string>& params) {
  SessionWindow window =
      defaultSession(marketTypeFor(reference_instrument, params));

  if (const auto* open = findParam(params, kOpenKey)) {
    if (auto minutes = parse_hhmm(*open)) {
      window.open_minute = *minutes;
    }
  }
  if (const auto* close = findParam(params, kCloseKey)) {
    if (auto minutes = parse_hhmm(*close)) {
      window.close_minute = *minutes;
    }
  }
  if (const auto* offset = findParam(params, kOffsetKey)) {
    if (auto minutes = parseOffset(*offset)) {
      window.utc_offset_minutes = *minutes;
      window.us_eastern_dst = false;
    }
  }
  return window;
}

SessionWindow SessionPhasePolicy::defaultSession(domain::MarketType type) {
  switch (type) {
    case domain::MarketType::AStock:
      return SessionWindow{9 * 60 + 30, 15 * 60, 8 * 60};
    case domain::MarketType::UsStock:
      return SessionWindow{9 * 60 + 30, 16 * 60, -5 * 60, true};
    case domain::MarketType::HkStock:
      return SessionWindow{9 * 60 + 30, 16 * 60, 8 * 60};
    case domain::MarketType::Crypto:
      return SessionWindow{0, 23 * 60 + 59, 0};
  }
  return SessionWindow{};
}

domain::MarketType SessionPhasePolicy::marketTypeFor(
    const std::string& instrument,
    const std::map<std::string, std::string>& params) {
  if (const auto* type = findParam(params, kMarketTypeKey)) {
    if (auto parsed = domain::parseMarketType(*type)) {
      return *parsed;
    }
  }
  return domain::detectMarketType(instrument);
}

}  // namespace stratexec
