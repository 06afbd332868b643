#include "backtest/indicators/sma.hpp"
#include "backtest/domain/errors.hpp"

namespace backtest {

Sma::Sma(int period) : period_(period) {
  if (period_ <= 0) {
    throw BacktestError(ErrorCode::ConfigError,
                        "SMA period must be positive, got " +
                            std::to_string(period));
  }
}

IndicatorValues Sma::calculate(
    const std::vector<domain::Candle>& candles) const {
  IndicatorValues values(candles.size());
  double window_sum = 0.0;

  for (std::size_t i = 0; i < candles.size(); ++i) {
    window_sum += candles[i].close;
    if (i >= static_cast<std::size_t>(period_)) {
      window_sum -= candles[i - period_].close;
    }
    if (i + 1 >= static_cast<std::size_t>(period_)) {
      values[i] = window_sum / period_;
    }
  }
  return values;
}

std::string Sma::name() const { return "SMA_" + std::to_string(period_); }

}  // namespace backtest
