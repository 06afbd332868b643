#pragma once

#include "backtest/domain/candle.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace backtest {

// A decoded candle message / file entry.
struct CandleRecord {
  std::int64_t timestamp_ms{0};
  std::string symbol;
  domain::Candle candle;
};

// -----------------------------------------------------------------------------
// candleFromJson(json)
// -----------------------------------------------------------------------------
// @brief  Decodes one candle object shared by the file format and the ZMQ
//         feed:
//
//   {
//     "timestamp_ms": 1700000000000,   // int64 epoch milliseconds
//     "symbol":       "BTCUSDT",
//     "open": 100.0, "high": 101.5, "low": 99.0, "close": 100.5,
//     "volume":       1200             // optional, defaults to 0
//   }
//
// @throws nlohmann::json::exception on missing keys or wrong types; callers
//         translate it at their boundary.
// @throws BacktestError(DataError) for an empty symbol or a non-positive
//         close price.
// -----------------------------------------------------------------------------
CandleRecord candleFromJson(const nlohmann::json& json);

}  // namespace backtest
