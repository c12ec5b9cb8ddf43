#include "stratexec/scheduler/trade_calendar.hpp"

#include "stratexec/errors/errors.hpp"
#include "stratexec/time/time_utils.hpp"

#include <fstream>
#include <iostream>

namespace stratexec {

namespace {

const TradeCalendar::MarketRules& defaultRules() {
  static const TradeCalendar::MarketRules rules;
  return rules;
}

std::optional<domain::MarketType> marketKey(const std::string& key) {
  if (key == "A_STOCK") return domain::MarketType::AStock;
  if (key == "US_STOCK") return domain::MarketType::UsStock;
  if (key == "HK_STOCK") return domain::MarketType::HkStock;
  if (key == "CRYPTO") return domain::MarketType::Crypto;
  return std::nullopt;
}

TradeCalendar::MarketRules parseRules(const std::string& market,
                                      const nlohmann::json& entry) {
  if (!entry.is_object()) {
    throw ConfigError("trade calendar entry " + market +
                      " must be an object");
  }
  TradeCalendar::MarketRules rules;

  if (auto it = entry.find("weekends"); it != entry.end()) {
    if (!it->is_array()) {
      throw ConfigError(market + ".weekends must be an array");
    }
    rules.weekends.clear();
    for (const auto& day : *it) {
      if (!day.is_number_integer() || day.get<int>() < 0 ||
          day.get<int>() > 6) {
        throw ConfigError(market + ".weekends holds " + day.dump() +
                          ", expected 0..6");
      }
      rules.weekends.insert(day.get<int>());
    }
  }

  if (auto it = entry.find("holidays"); it != entry.end()) {
    if (!it->is_array()) {
      throw ConfigError(market + ".holidays must be an array");
    }
    for (const auto& date : *it) {
      std::optional<std::int64_t> day =
          date.is_string() ? parse_date(date.get<std::string>())
                           : std::nullopt;
      if (!day) {
        throw ConfigError(market + ".holidays holds " + date.dump() +
                          ", expected \"YYYY-MM-DD\"");
      }
      rules.holidays.insert(*day);
    }
  }
  return rules;
}

}  // namespace

// -----------------------------------------------------------------------------
// fromJson() / load()
// -----------------------------------------------------------------------------
TradeCalendar TradeCalendar::fromJson(const nlohmann::json& doc) {
  if (!doc.is_object()) {
    throw ConfigError("trade calendar must be a JSON object");
  }
  TradeCalendar calendar;
  for (const auto& [key, entry] : doc.items()) {
    std::optional<domain::MarketType> type = marketKey(key);
    if (!type) {
      throw ConfigError("trade calendar: unknown market '" + key + "'");
    }
    if (*type == domain::MarketType::Crypto) {
      continue;
    }
    calendar.rules_[*type] = parseRules(key, entry);
  }
  return calendar;
}

TradeCalendar TradeCalendar::load(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open trade calendar " + path.string());
  }
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("invalid JSON in " + path.string() + ": " + e.what());
  }
  TradeCalendar calendar = fromJson(doc);
  std::cout << "[TradeCalendar] loaded " << path << "\n";
  return calendar;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
const TradeCalendar::MarketRules& TradeCalendar::rules(
    domain::MarketType type) const {
  auto it = rules_.find(type);
  return it == rules_.end() ? defaultRules() : it->second;
}

bool TradeCalendar::isTradeDay(domain::MarketType type,
                               std::int64_t day) const {
  if (type == domain::MarketType::Crypto) {
    return true;
  }
  const MarketRules& market = rules(type);
  return market.weekends.count(weekday_from_days(day)) == 0 &&
         market.holidays.count(day) == 0;
}

std::vector<std::string> TradeCalendar::tradeDays(domain::MarketType type,
                                                  std::int64_t first_day,
                                                  std::int64_t last_day) const {
  std::vector<std::string> days;
  for (std::int64_t day = first_day; day <= last_day; ++day) {
    if (isTradeDay(type, day)) {
      days.push_back(format_date(day));
    }
  }
  return days;
}

}  // namespace stratexec
