#pragma once

#include "backtest/indicators/indicator.hpp"

namespace backtest {

// -----------------------------------------------------------------------------
// Ema - exponential moving average of close prices
// -----------------------------------------------------------------------------
//
// @details
// Seeded at index period-1 with the SMA of the first `period` closes, then
// ema[i] = (close[i] - ema[i-1]) * k + ema[i-1] with k = 2 / (period + 1).
// Name: "EMA_<period>".
// -----------------------------------------------------------------------------
class Ema final : public Indicator {
 public:
  // @throws BacktestError(ConfigError) if period <= 0.
  explicit Ema(int period);

  IndicatorValues calculate(
      const std::vector<domain::Candle>& candles) const override;
  std::string name() const override;

  int period() const { return period_; }
  double multiplier() const { return 2.0 / (period_ + 1.0); }

 private:
  int period_;
};

}  // namespace backtest
