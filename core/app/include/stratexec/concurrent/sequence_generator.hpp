#pragma once

#include <atomic>
#include <cstdint>

namespace stratexec {

// -----------------------------------------------------------------------------
// SequenceGenerator — thread-safe, monotonically increasing counter
// -----------------------------------------------------------------------------
//
// @brief  Produces 1, 2, 3, ... via an atomic counter.
//
// @details
// StrategyContext owns one per invocation and appends the value to the
// exec_id to build client order ids ("<exec_id>_1", "<exec_id>_2", ...).
// Because the counter restarts with every context, a redelivered request
// that reaches the strategy again declares the same unique ids, which the
// trade server can use for its own deduplication.
//
// Thread model:
//   next_id() is safe to call concurrently from any number of threads.
//   memory_order_relaxed is sufficient: only uniqueness and monotonicity
//   are required.
//
// Ownership:
//   Held by value. Non-copyable so two owners can never emit duplicates.
// -----------------------------------------------------------------------------
class SequenceGenerator {
 public:
  SequenceGenerator() = default;

  SequenceGenerator(const SequenceGenerator&) = delete;
  SequenceGenerator& operator=(const SequenceGenerator&) = delete;
  SequenceGenerator(SequenceGenerator&&) = delete;
  SequenceGenerator& operator=(SequenceGenerator&&) = delete;

  // -------------------------------------------------------------------------
  // next_id()
  // -------------------------------------------------------------------------
  // @return A value unique for this generator. Starts at 1.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  Atomically increments the internal counter.
  // -------------------------------------------------------------------------
  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace stratexec
