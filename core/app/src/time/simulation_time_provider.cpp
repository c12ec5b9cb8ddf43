#include "stratexec/time/simulation_time_provider.hpp"

namespace stratexec {

std::int64_t SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

void SimulationTimeProvider::set_time(std::int64_t new_time_ms) {
  current_time_ms_.store(new_time_ms);
}

std::int64_t SimulationTimeProvider::advance(std::int64_t delta_ms) {
  return current_time_ms_.fetch_add(delta_ms) + delta_ms;
}

}  // namespace stratexec
