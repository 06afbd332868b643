#include "backtest/indicators/ema.hpp"
#include "backtest/domain/errors.hpp"

namespace backtest {

Ema::Ema(int period) : period_(period) {
  if (period_ <= 0) {
    throw BacktestError(ErrorCode::ConfigError,
                        "EMA period must be positive, got " +
                            std::to_string(period));
  }
}

IndicatorValues Ema::calculate(
    const std::vector<domain::Candle>& candles) const {
  IndicatorValues values(candles.size());
  const auto period = static_cast<std::size_t>(period_);
  if (candles.size() < period) {
    return values;
  }

  double seed = 0.0;
  for (std::size_t i = 0; i < period; ++i) {
    seed += candles[i].close;
  }
  double ema = seed / period_;
  values[period - 1] = ema;

  const double k = multiplier();
  for (std::size_t i = period; i < candles.size(); ++i) {
    ema = (candles[i].close - ema) * k + ema;
    values[i] = ema;
  }
  return values;
}

std::string Ema::name() const { return "EMA_" + std::to_string(period_); }

}  // namespace backtest
