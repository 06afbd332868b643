#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace backtest {

// Point in simulated time: candle timestamps, fills, position open/close and
// equity snapshots. Candle files, the ZMQ feed and the simulation clock
// carry epoch milliseconds; convert at those edges only.
using Timestamp = std::chrono::system_clock::time_point;

inline Timestamp ms_to_timestamp(std::int64_t epoch_ms) {
  return Timestamp{std::chrono::milliseconds{epoch_ms}};
}

// Sub-millisecond precision is truncated.
inline std::int64_t timestamp_to_ms(Timestamp time) {
  using std::chrono::duration_cast;
  using std::chrono::milliseconds;
  return duration_cast<milliseconds>(time.time_since_epoch()).count();
}

// Rendering used in log lines and error prefixes, e.g. "1700000000000ms".
inline std::string format_timestamp(Timestamp time) {
  return std::to_string(timestamp_to_ms(time)) + "ms";
}

}  // namespace backtest
