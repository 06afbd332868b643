#pragma once

#include "backtest/indicators/indicator.hpp"
#include "backtest/strategy/base_strategy.hpp"

#include <optional>
#include <string>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// SmaCrossStrategy - single-instrument moving-average crossover
// -----------------------------------------------------------------------------
//
// @brief  Goes Long when the fast SMA crosses above the slow SMA and exits
//         the whole position when it crosses back below.
//
// @details
// Reads "SMA_<fast>" and "SMA_<slow>" from the instrument's candle, so the
// Runner must apply indicators() before the first tick. A cross needs a
// previous bar where both averages were defined; ticks without the
// instrument or with undefined averages are ignored.
//
// Entries are skipped while a position is open and exits while none is, so
// the strategy never submits an order the Portfolio would reject for
// position state (cash can still be insufficient).
// -----------------------------------------------------------------------------
class SmaCrossStrategy final : public BaseStrategy {
 public:
  // @throws BacktestError(ConfigError) if fast_period >= slow_period,
  //         a period <= 0, quantity <= 0 or instrument is empty.
  SmaCrossStrategy(std::string instrument, int fast_period, int slow_period,
                   int quantity, double leverage = 1.0);

  std::vector<domain::Order> onTick(Timestamp time,
                                    const CandleMap& candles) override;

  void onPositionClosed(const domain::Position& position) override;

  // Indicators this strategy reads; hand them to Runner::withIndicators.
  std::vector<IndicatorPtr> indicators() const { return indicators_; }

  int completedTrades() const { return completed_trades_; }

 private:
  std::string instrument_;
  int quantity_;
  double leverage_;
  std::string fast_name_;
  std::string slow_name_;
  std::vector<IndicatorPtr> indicators_;

  std::optional<double> prev_fast_;
  std::optional<double> prev_slow_;
  int completed_trades_{0};
};

}  // namespace backtest
