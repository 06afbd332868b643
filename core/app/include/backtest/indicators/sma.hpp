#pragma once

#include "backtest/indicators/indicator.hpp"

namespace backtest {

// Simple moving average of close prices over `period` candles.
// Name: "SMA_<period>". The first period-1 values are std::nullopt.
class Sma final : public Indicator {
 public:
  // @throws BacktestError(ConfigError) if period <= 0.
  explicit Sma(int period);

  IndicatorValues calculate(
      const std::vector<domain::Candle>& candles) const override;
  std::string name() const override;

  int period() const { return period_; }

 private:
  int period_;
};

}  // namespace backtest
