#pragma once

#include "stratexec/time/i_time_provider.hpp"

namespace stratexec {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns std::chrono::system_clock::now() in epoch milliseconds.
//
// @details
// The production clock handed to ExecutionGateway by main(). Stateless, so
// no internal synchronization is needed.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace stratexec
