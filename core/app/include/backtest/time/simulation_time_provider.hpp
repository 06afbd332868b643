#pragma once

#include <atomic>
#include <cstdint>

namespace backtest {

// -----------------------------------------------------------------------------
// SimulationTimeProvider - replay clock
// -----------------------------------------------------------------------------
//
// @brief  Holds the epoch-ms timestamp of the bar currently being replayed.
//
// @details
// Nothing in the engine reads the system clock. The Runner moves this clock
// to each tick before marking positions, and fills unfilled orders at
// now_ms(); the CandleFeedGateway moves it as candles arrive. Replaying the
// same data therefore reproduces every fill and close time.
//
// The value is atomic so that a thread other than the writer (e.g. main
// while the gateway ingests) can read it. Writers are expected to move it
// forward; going backwards is allowed for tests and not checked.
// -----------------------------------------------------------------------------
class SimulationTimeProvider {
 public:
  SimulationTimeProvider() = default;

  SimulationTimeProvider(const SimulationTimeProvider&) = delete;
  SimulationTimeProvider& operator=(const SimulationTimeProvider&) = delete;

  // 0 until the first advance_time().
  std::int64_t now_ms() const;

  void advance_time(std::int64_t epoch_ms);

 private:
  std::atomic<std::int64_t> now_ms_{0};
};

}  // namespace backtest
