#include "backtest/time/simulation_time_provider.hpp"

namespace backtest {

std::int64_t SimulationTimeProvider::now_ms() const {
  return now_ms_.load(std::memory_order_acquire);
}

void SimulationTimeProvider::advance_time(std::int64_t epoch_ms) {
  now_ms_.store(epoch_ms, std::memory_order_release);
}

}  // namespace backtest
