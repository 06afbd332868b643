#pragma once

#include "backtest/domain/errors.hpp"
#include "backtest/indicators/indicator.hpp"

#include <functional>
#include <utility>

namespace backtest {

// -----------------------------------------------------------------------------
// CustomIndicator - indicator assembled from a callable
// -----------------------------------------------------------------------------
//
// @brief  User-defined indicator without subclassing: a name, a calculation
//         function and the indicators it reads.
//
// @details
//   auto fast = std::make_shared<Sma>(5);
//   auto slope = std::make_shared<CustomIndicator>(
//       "SLOPE_5",
//       [](const std::vector<domain::Candle>& candles) { ... },
//       std::vector<IndicatorPtr>{fast});
//
// The function follows the Indicator::calculate contract: one value per
// candle, dependency values already attached to each candle.
// -----------------------------------------------------------------------------
class CustomIndicator final : public Indicator {
 public:
  using CalculateFn =
      std::function<IndicatorValues(const std::vector<domain::Candle>&)>;

  // @throws BacktestError(ConfigError) if name is empty or fn is unset.
  CustomIndicator(std::string name, CalculateFn fn,
                  std::vector<IndicatorPtr> dependencies = {})
      : name_(std::move(name)),
        fn_(std::move(fn)),
        dependencies_(std::move(dependencies)) {
    if (name_.empty()) {
      throw BacktestError(ErrorCode::ConfigError,
                          "custom indicator needs a name");
    }
    if (!fn_) {
      throw BacktestError(ErrorCode::ConfigError,
                          "custom indicator " + name_ +
                              " has no calculation function");
    }
  }

  IndicatorValues calculate(
      const std::vector<domain::Candle>& candles) const override {
    return fn_(candles);
  }

  std::string name() const override { return name_; }

  std::vector<IndicatorPtr> dependencies() const override {
    return dependencies_;
  }

 private:
  std::string name_;
  CalculateFn fn_;
  std::vector<IndicatorPtr> dependencies_;
};

}  // namespace backtest
