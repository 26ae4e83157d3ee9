#include "sigexec/time/simulation_time_provider.hpp"

namespace sigexec {

SimulationTimeProvider::SimulationTimeProvider(std::int64_t start_ms)
    : current_time_ms_(start_ms) {}

std::int64_t SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

void SimulationTimeProvider::advance_time(std::int64_t new_time_ms) {
  current_time_ms_.store(new_time_ms);
}

void SimulationTimeProvider::advance_by(std::int64_t delta_ms) {
  current_time_ms_.fetch_add(delta_ms);
}

}  // namespace sigexec
