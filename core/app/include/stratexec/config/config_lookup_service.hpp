#pragma once

#include "stratexec/domain/instrument_config.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace stratexec {

// -----------------------------------------------------------------------------
// ConfigLookupService — cached trading-rule / commission-rate descriptors
// -----------------------------------------------------------------------------
//
// @brief  Answers tradingRule(venue, instrument) and
//         commissionRate(venue, instrument) from JSON descriptors found on a
//         layered search path, caching each (venue, instrument) result.
//
// @details
// Descriptor layout, per search location:
//
//   <location>/<venue>/trading_rules.json
//   <location>/<venue>/commission_rates.json
//
// Each file is a JSON object mapping instrument symbol → flat record of
// numeric fields. Venue names are lower-cased before use; instruments are
// matched exactly.
//
// Search order is the order of the locations passed to the constructor
// (override → project-local → user home, see ServiceConfig). The first
// location whose file contains the instrument wins; nothing is merged
// across locations. A location whose file is missing, or present but
// without the instrument, is skipped. A matching entry that fails
// validation raises MalformedDescriptor immediately; lower-priority
// locations are not consulted for it.
//
// Cache and invalidation:
//   A cached entry remembers the (mtime, size) stamp of every candidate
//   file it looked at, from the first location down to the winning one.
//   On each lookup those stamps are compared with the filesystem (one stat
//   per location). Any difference, including a higher-priority file
//   appearing, disappearing, or changing, invalidates the entry and the
//   next lookup re-parses. There is no background watcher.
//   A NotFound result is cached the same way, keyed on the stamps of every
//   location: repeated lookups of an unknown instrument stat the files but
//   do not re-parse them until one changes.
//
// Thread model:
//   Cache keys are spread over kShardCount shards; each shard maps key →
//   Slot under its own shared_mutex, held only to find or create the slot.
//   Each Slot carries its own shared_mutex: lookups validate under a shared
//   lock, and a stale or cold slot is (re)loaded under the unique lock with
//   a re-check, so concurrent cold lookups of the same key perform exactly
//   one parse while different keys never wait on each other.
//
// Ownership:
//   Owned by main() (or a test) and shared by reference with
//   ExecutionGateway and every StrategyContext. Must outlive them.
// -----------------------------------------------------------------------------
class ConfigLookupService {
 public:
  // Called once per descriptor file parse with the file's path.
  using ParseObserver = std::function<void(const std::filesystem::path&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  search_path  Locations in priority order. Empty entries are
  //                      ignored. Locations need not exist.
  // @param  observer     Optional parse hook (tests count parses with it).
  //
  // Thread-safety: Construct before sharing.
  // Side-effects:  None; no file is read until the first lookup.
  // -------------------------------------------------------------------------
  explicit ConfigLookupService(std::vector<std::filesystem::path> search_path,
                               ParseObserver observer = {});

  ConfigLookupService(const ConfigLookupService&) = delete;
  ConfigLookupService& operator=(const ConfigLookupService&) = delete;
  ConfigLookupService(ConfigLookupService&&) = delete;
  ConfigLookupService& operator=(ConfigLookupService&&) = delete;

  // -------------------------------------------------------------------------
  // tradingRule(venue, instrument)
  // -------------------------------------------------------------------------
  //
  // @return The TradingRule of the first location that lists the instrument.
  //
  // @throws NotFound            no location lists the instrument
  // @throws MalformedDescriptor the matching entry (or its file) is invalid
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  May read and parse descriptor files; updates the cache.
  // -------------------------------------------------------------------------
  domain::TradingRule tradingRule(const std::string& venue,
                                  const std::string& instrument);

  // -------------------------------------------------------------------------
  // commissionRate(venue, instrument)
  // -------------------------------------------------------------------------
  //
  // Same contract as tradingRule(), reading commission_rates.json.
  // -------------------------------------------------------------------------
  domain::CommissionRate commissionRate(const std::string& venue,
                                        const std::string& instrument);

  // -------------------------------------------------------------------------
  // isKnownVenue(venue)
  // -------------------------------------------------------------------------
  //
  // @return true if a directory named after the (lower-cased) venue exists
  //         in any search location.
  //
  // Thread-safety: Safe to call from any thread. Not cached.
  // -------------------------------------------------------------------------
  bool isKnownVenue(const std::string& venue) const;

  // -------------------------------------------------------------------------
  // supportedSymbols(venue)
  // -------------------------------------------------------------------------
  //
  // @return Sorted, de-duplicated instrument symbols listed in any
  //         location's trading_rules.json for the venue.
  //
  // @throws MalformedDescriptor if a file is not a JSON object.
  // -------------------------------------------------------------------------
  std::vector<std::string> supportedSymbols(const std::string& venue) const;

  const std::vector<std::filesystem::path>& searchPath() const {
    return search_path_;
  }

 private:
  static constexpr std::size_t kShardCount = 16;

  enum class DescriptorKind { TradingRules, CommissionRates };

  struct FileStamp {
    std::filesystem::file_time_type mtime;
    std::uintmax_t size{0};

    bool operator==(const FileStamp& other) const {
      return mtime == other.mtime && size == other.size;
    }
    bool operator!=(const FileStamp& other) const { return !(*this == other); }
  };

  // One candidate file consulted during a load; stamp is empty when the
  // file did not exist.
  struct Candidate {
    std::filesystem::path file;
    std::optional<FileStamp> stamp;
  };

  using Value = std::variant<domain::TradingRule, domain::CommissionRate>;

  struct Slot {
    std::shared_mutex mutex;
    bool loaded{false};
    Value value;
    std::optional<std::string> not_found;  // set for a cached NotFound
    std::vector<Candidate> candidates;
  };

  struct Shard {
    std::shared_mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots;
  };

  // -------------------------------------------------------------------------
  // lookup(kind, venue, instrument)
  // -------------------------------------------------------------------------
  //
  // @brief  Cache-aware lookup shared by tradingRule() and commissionRate().
  //
  // @details
  // 1. Find or create the slot (shard shared lock, then unique lock only if
  //    the slot is missing).
  // 2. Under the slot's shared lock: if loaded and every candidate stamp is
  //    unchanged, return the cached value.
  // 3. Otherwise take the slot's unique lock, re-check (another thread may
  //    have just loaded it), and load from disk.
  // -------------------------------------------------------------------------
  Value lookup(DescriptorKind kind, const std::string& venue,
               const std::string& instrument);

  // -------------------------------------------------------------------------
  // load(kind, venue, instrument, slot)
  // -------------------------------------------------------------------------
  //
  // @brief  Walks the search path, parses candidate files, and fills the
  //         slot. Caller holds the slot's unique lock.
  //
  // @throws NotFound           after recording it in the slot, together
  //                            with the stamps of every location
  // @throws MalformedDescriptor the slot is left unloaded so the next lookup
  //                            retries
  // -------------------------------------------------------------------------
  void load(DescriptorKind kind, const std::string& venue,
            const std::string& instrument, Slot& slot);

  bool isFresh(const Slot& slot) const;

  // Cached value of a loaded slot; throws the cached NotFound.
  static Value cachedValue(const Slot& slot);

  std::shared_ptr<Slot> slotFor(const std::string& key);

  static std::optional<FileStamp> stampOf(const std::filesystem::path& file);
  static const char* fileNameFor(DescriptorKind kind);

  std::vector<std::filesystem::path> search_path_;
  ParseObserver observer_;
  std::array<Shard, kShardCount> shards_;
};

// Lower-cases ASCII letters; venue ids are case-insensitive.
std::string normalizeVenue(const std::string& venue);

}  // namespace stratexec
