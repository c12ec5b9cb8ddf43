#include "stratexec/config/config_lookup_service.hpp"

#include "stratexec/errors/errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <mutex>
#include <set>
#include <system_error>
#include <utility>

namespace stratexec {

namespace fs = std::filesystem;

namespace {

// -----------------------------------------------------------------------------
// parseFile(): read one descriptor file into a JSON document
// -----------------------------------------------------------------------------
nlohmann::json parseFile(const fs::path& file,
                         const ConfigLookupService::ParseObserver& observer) {
  std::ifstream in(file);
  if (!in) {
    throw MalformedDescriptor("cannot open descriptor " + file.string());
  }
  if (observer) {
    observer(file);
  }
  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    std::cerr << "[ConfigLookupService] WARNING: parse error in " << file
              << ": " << e.what() << "\n";
    throw MalformedDescriptor("invalid JSON in " + file.string() + ": " +
                              e.what());
  }
}

double requireNumber(const nlohmann::json& record, const char* field,
                     const std::string& where) {
  auto it = record.find(field);
  if (it == record.end()) {
    throw MalformedDescriptor(where + ": missing required field '" + field +
                              "'");
  }
  if (!it->is_number()) {
    throw MalformedDescriptor(where + ": field '" + field +
                              "' must be a number");
  }
  return it->get<double>();
}

double requirePositive(const nlohmann::json& record, const char* field,
                       const std::string& where) {
  double value = requireNumber(record, field, where);
  if (!(value > 0.0)) {
    throw MalformedDescriptor(where + ": field '" + field +
                              "' must be positive");
  }
  return value;
}

double requireNonNegative(const nlohmann::json& record, const char* field,
                          const std::string& where) {
  double value = requireNumber(record, field, where);
  if (value < 0.0) {
    throw MalformedDescriptor(where + ": field '" + field +
                              "' must not be negative");
  }
  return value;
}

int requirePrecision(const nlohmann::json& record, const char* field,
                     const std::string& where) {
  auto it = record.find(field);
  if (it == record.end()) {
    throw MalformedDescriptor(where + ": missing required field '" + field +
                              "'");
  }
  if (!it->is_number_integer()) {
    throw MalformedDescriptor(where + ": field '" + field +
                              "' must be an integer");
  }
  auto value = it->get<std::int64_t>();
  if (value < 0 || value > 18) {
    throw MalformedDescriptor(where + ": field '" + field +
                              "' out of range");
  }
  return static_cast<int>(value);
}

domain::TradingRule parseTradingRule(const nlohmann::json& record,
                                     const std::string& where) {
  domain::TradingRule rule;
  rule.min_quantity = requireNonNegative(record, "min_quantity", where);
  rule.quantity_step = requirePositive(record, "quantity_step", where);
  rule.min_price = requireNonNegative(record, "min_price", where);
  rule.price_tick = requirePositive(record, "price_tick", where);
  rule.price_precision = requirePrecision(record, "price_precision", where);
  rule.quantity_precision =
      requirePrecision(record, "quantity_precision", where);
  if (record.contains("max_leverage")) {
    rule.max_leverage = requirePositive(record, "max_leverage", where);
  }
  return rule;
}

domain::CommissionRate parseCommissionRate(const nlohmann::json& record,
                                           const std::string& where) {
  domain::CommissionRate rate;
  // Negative maker rates are rebates and are accepted.
  rate.maker_fee_rate = requireNumber(record, "maker_fee_rate", where);
  rate.taker_fee_rate = requireNonNegative(record, "taker_fee_rate", where);
  return rate;
}

}  // namespace

// -----------------------------------------------------------------------------
// normalizeVenue()
// -----------------------------------------------------------------------------
std::string normalizeVenue(const std::string& venue) {
  std::string out = venue;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
ConfigLookupService::ConfigLookupService(std::vector<fs::path> search_path,
                                         ParseObserver observer)
    : observer_(std::move(observer)) {
  for (auto& location : search_path) {
    if (!location.empty()) {
      search_path_.push_back(std::move(location));
    }
  }
}

// -----------------------------------------------------------------------------
// tradingRule() / commissionRate()
// -----------------------------------------------------------------------------
domain::TradingRule ConfigLookupService::tradingRule(
    const std::string& venue, const std::string& instrument) {
  return std::get<domain::TradingRule>(
      lookup(DescriptorKind::TradingRules, venue, instrument));
}

domain::CommissionRate ConfigLookupService::commissionRate(
    const std::string& venue, const std::string& instrument) {
  return std::get<domain::CommissionRate>(
      lookup(DescriptorKind::CommissionRates, venue, instrument));
}

// -----------------------------------------------------------------------------
// isKnownVenue()
// -----------------------------------------------------------------------------
bool ConfigLookupService::isKnownVenue(const std::string& venue) const {
  if (venue.empty()) {
    return false;
  }
  const std::string dir = normalizeVenue(venue);
  for (const auto& location : search_path_) {
    std::error_code ec;
    if (fs::is_directory(location / dir, ec)) {
      return true;
    }
  }
  return false;
}

// -----------------------------------------------------------------------------
// supportedSymbols()
// -----------------------------------------------------------------------------
std::vector<std::string> ConfigLookupService::supportedSymbols(
    const std::string& venue) const {
  std::set<std::string> symbols;
  const std::string dir = normalizeVenue(venue);
  for (const auto& location : search_path_) {
    fs::path file =
        location / dir / fileNameFor(DescriptorKind::TradingRules);
    if (!stampOf(file)) {
      continue;
    }
    nlohmann::json doc = parseFile(file, observer_);
    if (!doc.is_object()) {
      throw MalformedDescriptor(file.string() + ": top level must be an object");
    }
    for (const auto& item : doc.items()) {
      symbols.insert(item.key());
    }
  }
  return {symbols.begin(), symbols.end()};
}

// -----------------------------------------------------------------------------
// lookup(): validate cached slot under shared lock, reload under unique lock
// -----------------------------------------------------------------------------
ConfigLookupService::Value ConfigLookupService::lookup(
    DescriptorKind kind, const std::string& venue,
    const std::string& instrument) {
  const std::string key =
      std::string(kind == DescriptorKind::TradingRules ? "rule" : "fee") +
      '\x1f' + normalizeVenue(venue) + '\x1f' + instrument;
  std::shared_ptr<Slot> slot = slotFor(key);

  {
    std::shared_lock lock(slot->mutex);
    if (slot->loaded && isFresh(*slot)) {
      return cachedValue(*slot);
    }
  }

  std::unique_lock lock(slot->mutex);
  // Another caller may have loaded the slot while we waited.
  if (slot->loaded && isFresh(*slot)) {
    return cachedValue(*slot);
  }
  slot->loaded = false;
  slot->not_found.reset();
  load(kind, venue, instrument, *slot);
  return slot->value;
}

ConfigLookupService::Value ConfigLookupService::cachedValue(const Slot& slot) {
  if (slot.not_found) {
    throw NotFound(*slot.not_found);
  }
  return slot.value;
}

// -----------------------------------------------------------------------------
// load(): walk the search path in priority order
// -----------------------------------------------------------------------------
void ConfigLookupService::load(DescriptorKind kind, const std::string& venue,
                               const std::string& instrument, Slot& slot) {
  const std::string dir = normalizeVenue(venue);
  std::vector<Candidate> candidates;

  for (const auto& location : search_path_) {
    fs::path file = location / dir / fileNameFor(kind);
    std::optional<FileStamp> stamp = stampOf(file);
    candidates.push_back(Candidate{file, stamp});
    if (!stamp) {
      continue;
    }

    nlohmann::json doc = parseFile(file, observer_);
    if (!doc.is_object()) {
      throw MalformedDescriptor(file.string() +
                                ": top level must be an object");
    }
    auto it = doc.find(instrument);
    if (it == doc.end()) {
      continue;
    }

    const std::string where = file.string() + " [" + instrument + "]";
    if (!it->is_object()) {
      throw MalformedDescriptor(where + ": entry must be an object");
    }
    if (kind == DescriptorKind::TradingRules) {
      slot.value = parseTradingRule(*it, where);
    } else {
      slot.value = parseCommissionRate(*it, where);
    }
    slot.candidates = std::move(candidates);
    slot.loaded = true;
    return;
  }

  std::string message = std::string(kind == DescriptorKind::TradingRules
                                        ? "trading rule"
                                        : "commission rate") +
                        " not found for " + instrument + " on " + venue;
  slot.candidates = std::move(candidates);
  slot.not_found = message;
  slot.loaded = true;
  throw NotFound(message);
}

// -----------------------------------------------------------------------------
// isFresh(): every consulted file still has the stamp it had at load time
// -----------------------------------------------------------------------------
bool ConfigLookupService::isFresh(const Slot& slot) const {
  for (const auto& candidate : slot.candidates) {
    std::optional<FileStamp> now = stampOf(candidate.file);
    if (now.has_value() != candidate.stamp.has_value()) {
      return false;
    }
    if (now && *now != *candidate.stamp) {
      return false;
    }
  }
  return true;
}

// -----------------------------------------------------------------------------
// slotFor(): find or create the slot of one cache key
// -----------------------------------------------------------------------------
std::shared_ptr<ConfigLookupService::Slot> ConfigLookupService::slotFor(
    const std::string& key) {
  Shard& shard = shards_[std::hash<std::string>{}(key) % kShardCount];
  {
    std::shared_lock lock(shard.mutex);
    auto it = shard.slots.find(key);
    if (it != shard.slots.end()) {
      return it->second;
    }
  }
  std::unique_lock lock(shard.mutex);
  auto& slot = shard.slots[key];
  if (!slot) {
    slot = std::make_shared<Slot>();
  }
  return slot;
}

// -----------------------------------------------------------------------------
// stampOf(): (mtime, size) of a regular file, or nullopt if absent
// -----------------------------------------------------------------------------
std::optional<ConfigLookupService::FileStamp> ConfigLookupService::stampOf(
    const fs::path& file) {
  std::error_code ec;
  if (!fs::is_regular_file(file, ec)) {
    return std::nullopt;
  }
  FileStamp stamp;
  stamp.mtime = fs::last_write_time(file, ec);
  if (ec) {
    return std::nullopt;
  }
  stamp.size = fs::file_size(file, ec);
  if (ec) {
    return std::nullopt;
  }
  return stamp;
}

const char* ConfigLookupService::fileNameFor(DescriptorKind kind) {
  return kind == DescriptorKind::TradingRules ? "trading_rules.json"
                                              : "commission_rates.json";
}

}  // namespace stratexec
