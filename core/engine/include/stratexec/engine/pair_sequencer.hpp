#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace stratexec {

// -----------------------------------------------------------------------------
// PairSequencer — FIFO mutual exclusion per (account_id, strategy_id)
// -----------------------------------------------------------------------------
//
// @brief  Serializes gateway calls that target the same pair, in the order
//         they arrived, while calls for different pairs proceed in parallel.
//
// @details
// Each pair has a lane: a ticket counter plus a "now serving" counter, a
// mutex, and a condition variable. acquire() draws the next ticket and
// waits until it is served; the returned Token serves the next ticket when
// destroyed. Lanes are reference-counted and removed once no caller holds
// or waits on them, so the table only ever contains active pairs.
//
// The lane table mutex is held only to find / create / drop a lane. All
// waiting happens on the lane's own mutex.
//
// Ownership:
//   Owned by ExecutionGateway. Tokens must not outlive the sequencer.
// -----------------------------------------------------------------------------
class PairSequencer {
 private:
  struct Lane;
  using PairKey = std::pair<std::string, std::string>;

 public:
  // Move-only RAII handle; holding it means owning the pair.
  class Token {
   public:
    ~Token() { release(); }

    Token(Token&& other) noexcept
        : sequencer_(std::exchange(other.sequencer_, nullptr)),
          key_(std::move(other.key_)),
          lane_(std::move(other.lane_)) {}
    Token& operator=(Token&&) = delete;
    Token(const Token&) = delete;
    Token& operator=(const Token&) = delete;

    // Idempotent; the destructor calls it.
    void release() noexcept;

   private:
    friend class PairSequencer;

    Token(PairSequencer* sequencer, PairKey key, std::shared_ptr<Lane> lane)
        : sequencer_(sequencer), key_(std::move(key)), lane_(std::move(lane)) {}

    PairSequencer* sequencer_;
    PairKey key_;
    std::shared_ptr<Lane> lane_;
  };

  PairSequencer() = default;

  PairSequencer(const PairSequencer&) = delete;
  PairSequencer& operator=(const PairSequencer&) = delete;
  PairSequencer(PairSequencer&&) = delete;
  PairSequencer& operator=(PairSequencer&&) = delete;

  // Blocks until every earlier caller for the same pair released its token.
  Token acquire(const std::string& account_id, const std::string& strategy_id);

  // Pairs with a holder or a waiter.
  std::size_t activePairs() const;

 private:
  struct Lane {
    std::mutex mutex;
    std::condition_variable cv;
    std::uint64_t next_ticket{0};
    std::uint64_t serving{0};
    std::size_t users{0};  // guarded by PairSequencer::mutex_
  };

  void release(const PairKey& key, const std::shared_ptr<Lane>& lane) noexcept;

  mutable std::mutex mutex_;
  std::map<PairKey, std::shared_ptr<Lane>> lanes_;
};

}  // namespace stratexec
