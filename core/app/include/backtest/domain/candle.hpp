#pragma once

#include "backtest/time/time_utils.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace backtest {
namespace domain {

// -----------------------------------------------------------------------------
// Candle - one OHLCV bar for one instrument, plus attached indicator values
// -----------------------------------------------------------------------------
//
// @details
// Indicator values are keyed by Indicator::name(). A present key holding
// std::nullopt means the indicator was computed but had insufficient
// history at this bar; an absent key means it was never computed.
// -----------------------------------------------------------------------------
struct Candle {
  Timestamp time{};
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  std::int64_t volume{0};

  std::map<std::string, std::optional<double>> indicators;

  void setIndicator(const std::string& name, std::optional<double> value) {
    indicators[name] = value;
  }

  bool hasIndicator(const std::string& name) const {
    return indicators.count(name) != 0;
  }

  // @throws BacktestError(DataError) if the indicator was never computed.
  std::optional<double> indicator(const std::string& name) const;
};

}  // namespace domain
}  // namespace backtest
