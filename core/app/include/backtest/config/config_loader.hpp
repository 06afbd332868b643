#pragma once

#include "backtest/data/candle_table.hpp"
#include "backtest/domain/portfolio_settings.hpp"
#include "backtest/domain/risk_settings.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace backtest {

// Parameters of the example SMA crossover strategy.
struct StrategyConfig {
  std::string instrument{"BTCUSDT"};
  int fast_period{10};
  int slow_period{30};
  int quantity{1};
  double leverage{1.0};
};

// -----------------------------------------------------------------------------
// RunConfig - everything backtest_runner needs for one run
// -----------------------------------------------------------------------------
//
// JSON layout (every key optional; missing keys keep the defaults below):
//
//   {
//     "portfolio": { "initial_capital": 10000, "enable_shorts": false,
//                    "default_leverage": 1 },
//     "risk":      { "max_leverage": 0, "max_position_allocation_rate": 0,
//                    "use_stop_loss": false, "stop_loss_rate": 0,
//                    "use_take_profit": false, "take_profit_rate": 0,
//                    "use_trailing_stop": false, "trailing_stop_rate": 0 },
//     "data":      { "file": "candles.json",
//                    "feed_endpoint": "tcp://127.0.0.1:5555" },
//     "strategy":  { "instrument": "BTCUSDT", "fast_period": 10,
//                    "slow_period": 30, "quantity": 1, "leverage": 1 }
//   }
//
// data.file and data.feed_endpoint are alternatives; the file wins when
// both are set.
// -----------------------------------------------------------------------------
struct RunConfig {
  domain::PortfolioSettings portfolio;
  domain::RiskSettings risk;
  std::string data_file;
  std::string feed_endpoint;
  StrategyConfig strategy;
};

// @throws BacktestError(ConfigError) on wrong types or invalid values
//         (initial_capital <= 0, negative rates or leverage).
RunConfig parseRunConfig(const nlohmann::json& json);

// Reads and parses a config file.
// @throws BacktestError(ConfigError) if the file is unreadable or invalid.
RunConfig loadRunConfig(const std::string& path);

// -----------------------------------------------------------------------------
// loadCandleFile(path)
// -----------------------------------------------------------------------------
// @brief  Reads a JSON array of candle objects (format of candleFromJson)
//         into a new CandleTable.
//
// @throws BacktestError(DataError) if the file is unreadable, is not an
//         array, or contains a malformed or duplicate candle. The message
//         carries the array index of the offending entry.
// -----------------------------------------------------------------------------
CandleTable loadCandleFile(const std::string& path);

// Same as loadCandleFile, from an already parsed document.
CandleTable candleTableFromJson(const nlohmann::json& json);

}  // namespace backtest
