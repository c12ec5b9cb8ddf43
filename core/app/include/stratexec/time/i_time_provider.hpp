#pragma once

#include <cstdint>

namespace stratexec {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface for "current time" in epoch milliseconds.
//
// @details
// Only components whose behavior depends on wall-clock time take one:
// DedupCache uses it to age out stored responses. Tests inject a
// SimulationTimeProvider to move the clock forward without sleeping.
//
// Market-phase decisions never use this clock: they use the trigger's own
// timestamp, so a replayed trigger is phased the same way as the original.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @return Milliseconds since 1970-01-01 00:00:00 UTC.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace stratexec
