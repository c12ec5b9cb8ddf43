#pragma once

#include "stratexec/domain/execution_response.hpp"
#include "stratexec/time/i_time_provider.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace stratexec {

// -----------------------------------------------------------------------------
// DedupCache — exec_id → response, with single-flight computation
// -----------------------------------------------------------------------------
//
// @brief  Remembers the response of every execution id for a bounded time
//         and makes concurrent deliveries of the same id share one
//         computation.
//
// @details
// acquire(exec_id) returns a Claim:
//   - Owner:  the id is new (or its record expired). The caller computes
//             the response and calls complete(); until then the id is
//             in flight.
//   - Waiter: the id is in flight or completed. wait() returns the stored
//             response, blocking until the owner completes if needed.
//
// Every response is stored, Failed ones included. If an owner Claim is
// destroyed without complete(), the entry is removed and its waiters get a
// StrategyError, so a later redelivery computes afresh.
//
// Retention:
//   Completed records older than `retention` (by the injected clock) are
//   evicted lazily on the next acquire() in the same shard. Each shard also
//   keeps at most ceil(max_entries / kShardCount) completed records,
//   evicting the oldest first. In-flight records are never evicted.
//
// Thread model:
//   Keys are spread over kShardCount shards, each with its own mutex held
//   only for map operations. Waiting happens on a std::shared_future
//   outside any lock.
//
// Ownership:
//   Owned by ExecutionGateway. Borrows the clock.
// -----------------------------------------------------------------------------
class DedupCache {
 private:
  struct Entry;

 public:
  static constexpr std::size_t kShardCount = 16;

  // ---------------------------------------------------------------------------
  // Claim — result of acquire()
  // ---------------------------------------------------------------------------
  class Claim {
   public:
    ~Claim();
    Claim(Claim&& other) noexcept;
    Claim& operator=(Claim&&) = delete;
    Claim(const Claim&) = delete;
    Claim& operator=(const Claim&) = delete;

    bool isOwner() const { return owner_; }

    // Owner only: stores the response and releases every waiter.
    void complete(const domain::ExecutionResponse& response);

    // Waiter only: the stored response (blocks while in flight).
    // @throws StrategyError if the owner gave up without completing.
    domain::ExecutionResponse wait() const;

   private:
    friend class DedupCache;

    Claim(DedupCache* cache, std::string exec_id,
          std::shared_ptr<Entry> entry, bool owner);

    DedupCache* cache_;
    std::string exec_id_;
    std::shared_ptr<Entry> entry_;
    bool owner_;
    bool completed_{false};
  };

  DedupCache(const ITimeProvider& clock, std::chrono::milliseconds retention,
             std::size_t max_entries);

  DedupCache(const DedupCache&) = delete;
  DedupCache& operator=(const DedupCache&) = delete;
  DedupCache(DedupCache&&) = delete;
  DedupCache& operator=(DedupCache&&) = delete;

  // -------------------------------------------------------------------------
  // acquire(exec_id)
  // -------------------------------------------------------------------------
  //
  // @brief  Becomes owner of a new id or waiter on an existing one.
  //
  // Thread-safety: Safe from any thread. Exactly one concurrent caller per
  //                id becomes owner.
  // Side-effects:  Evicts expired / surplus records of the id's shard.
  // -------------------------------------------------------------------------
  Claim acquire(const std::string& exec_id);

  // Completed, unexpired response for exec_id, if any. Never blocks.
  std::optional<domain::ExecutionResponse> find(const std::string& exec_id);

  // Records currently held (in flight + completed).
  std::size_t size() const;

 private:
  struct Entry {
    std::promise<domain::ExecutionResponse> promise;
    std::shared_future<domain::ExecutionResponse> future;
    std::uint64_t generation{0};
    bool completed{false};
    std::int64_t completed_at_ms{0};
  };

  struct Completion {
    std::string exec_id;
    std::uint64_t generation;
    std::int64_t completed_at_ms;
  };

  struct Shard {
    mutable std::mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries;
    std::deque<Completion> completions;  // completion order, oldest first
    std::uint64_t next_generation{1};
  };

  Shard& shardFor(const std::string& exec_id);
  const Shard& shardFor(const std::string& exec_id) const;

  // Caller holds shard.mutex.
  void evictLocked(Shard& shard, std::int64_t now_ms);
  bool expired(const Entry& entry, std::int64_t now_ms) const;

  void markCompleted(const std::string& exec_id,
                     const std::shared_ptr<Entry>& entry);
  void abandon(const std::string& exec_id, const std::shared_ptr<Entry>& entry);

  const ITimeProvider& clock_;
  std::int64_t retention_ms_;
  std::size_t per_shard_limit_;
  std::array<Shard, kShardCount> shards_;
};

}  // namespace stratexec
