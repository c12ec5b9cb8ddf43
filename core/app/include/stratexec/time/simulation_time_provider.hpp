#pragma once

#include "stratexec/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace stratexec {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — manually driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is whatever the owner last set.
//
// @details
// Used by tests that need dedup retention to expire: the test sets the
// clock, stores a response, advances past the retention window, and
// observes the eviction, all without sleeping.
//
// Internal storage is a std::atomic<int64_t>, so set_time()/advance() on one
// thread and now_ms() on others need no further synchronization.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  explicit SimulationTimeProvider(std::int64_t start_ms = 0)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // set_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to an absolute epoch-millisecond value.
  //
  // Monotonicity is not enforced; tests may move the clock backwards.
  // Thread-safety: Safe to call from any thread.
  // -------------------------------------------------------------------------
  void set_time(std::int64_t new_time_ms);

  // @brief  Moves the clock forward by delta_ms and returns the new value.
  std::int64_t advance(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_;
};

}  // namespace stratexec
