#include "stratexec/engine/dedup_cache.hpp"

#include "stratexec/errors/errors.hpp"

#include <algorithm>
#include <functional>
#include <stdexcept>
#include <utility>

namespace stratexec {

// -----------------------------------------------------------------------------
// Claim
// -----------------------------------------------------------------------------

DedupCache::Claim::Claim(DedupCache* cache, std::string exec_id,
                         std::shared_ptr<Entry> entry, bool owner)
    : cache_(cache),
      exec_id_(std::move(exec_id)),
      entry_(std::move(entry)),
      owner_(owner) {}

DedupCache::Claim::Claim(Claim&& other) noexcept
    : cache_(std::exchange(other.cache_, nullptr)),
      exec_id_(std::move(other.exec_id_)),
      entry_(std::move(other.entry_)),
      owner_(other.owner_),
      completed_(other.completed_) {}

DedupCache::Claim::~Claim() {
  if (cache_ != nullptr && owner_ && !completed_) {
    cache_->abandon(exec_id_, entry_);
  }
}

void DedupCache::Claim::complete(const domain::ExecutionResponse& response) {
  if (!owner_ || completed_ || cache_ == nullptr) {
    throw std::logic_error("DedupCache::Claim::complete: not the pending owner");
  }
  entry_->promise.set_value(response);
  completed_ = true;
  cache_->markCompleted(exec_id_, entry_);
}

domain::ExecutionResponse DedupCache::Claim::wait() const {
  if (owner_) {
    throw std::logic_error("DedupCache::Claim::wait: owner cannot wait");
  }
  return entry_->future.get();
}

// -----------------------------------------------------------------------------
// DedupCache
// -----------------------------------------------------------------------------

DedupCache::DedupCache(const ITimeProvider& clock,
                       std::chrono::milliseconds retention,
                       std::size_t max_entries)
    : clock_(clock),
      retention_ms_(retention.count()),
      per_shard_limit_(std::max<std::size_t>(
          1, (max_entries + kShardCount - 1) / kShardCount)) {}

DedupCache::Shard& DedupCache::shardFor(const std::string& exec_id) {
  return shards_[std::hash<std::string>{}(exec_id) % kShardCount];
}

const DedupCache::Shard& DedupCache::shardFor(const std::string& exec_id) const {
  return shards_[std::hash<std::string>{}(exec_id) % kShardCount];
}

bool DedupCache::expired(const Entry& entry, std::int64_t now_ms) const {
  return entry.completed && now_ms - entry.completed_at_ms > retention_ms_;
}

void DedupCache::evictLocked(Shard& shard, std::int64_t now_ms) {
  while (!shard.completions.empty()) {
    const Completion& oldest = shard.completions.front();
    const bool too_many = shard.completions.size() > per_shard_limit_;
    const bool too_old = now_ms - oldest.completed_at_ms > retention_ms_;
    if (!too_many && !too_old) {
      break;
    }
    auto it = shard.entries.find(oldest.exec_id);
    if (it != shard.entries.end() &&
        it->second->generation == oldest.generation) {
      shard.entries.erase(it);
    }
    shard.completions.pop_front();
  }
}

DedupCache::Claim DedupCache::acquire(const std::string& exec_id) {
  Shard& shard = shardFor(exec_id);
  const std::int64_t now = clock_.now_ms();

  std::lock_guard lock(shard.mutex);
  evictLocked(shard, now);

  auto it = shard.entries.find(exec_id);
  if (it != shard.entries.end() && !expired(*it->second, now)) {
    return Claim(this, exec_id, it->second, false);
  }

  auto entry = std::make_shared<Entry>();
  entry->future = entry->promise.get_future().share();
  entry->generation = shard.next_generation++;
  shard.entries[exec_id] = entry;
  return Claim(this, exec_id, std::move(entry), true);
}

std::optional<domain::ExecutionResponse> DedupCache::find(
    const std::string& exec_id) {
  Shard& shard = shardFor(exec_id);
  const std::int64_t now = clock_.now_ms();

  std::lock_guard lock(shard.mutex);
  evictLocked(shard, now);
  auto it = shard.entries.find(exec_id);
  if (it == shard.entries.end() || !it->second->completed ||
      expired(*it->second, now)) {
    return std::nullopt;
  }
  return it->second->future.get();
}

std::size_t DedupCache::size() const {
  std::size_t total = 0;
  for (const Shard& shard : shards_) {
    std::lock_guard lock(shard.mutex);
    total += shard.entries.size();
  }
  return total;
}

void DedupCache::markCompleted(const std::string& exec_id,
                               const std::shared_ptr<Entry>& entry) {
  Shard& shard = shardFor(exec_id);
  const std::int64_t now = clock_.now_ms();

  std::lock_guard lock(shard.mutex);
  entry->completed = true;
  entry->completed_at_ms = now;
  shard.completions.push_back(Completion{exec_id, entry->generation, now});
  evictLocked(shard, now);
}

void DedupCache::abandon(const std::string& exec_id,
                         const std::shared_ptr<Entry>& entry) {
  {
    Shard& shard = shardFor(exec_id);
    std::lock_guard lock(shard.mutex);
    auto it = shard.entries.find(exec_id);
    if (it != shard.entries.end() && it->second == entry) {
      shard.entries.erase(it);
    }
  }
  entry->promise.set_exception(std::make_exception_ptr(StrategyError(
      "execution " + exec_id + " ended without a response")));
}

}  // namespace stratexec
