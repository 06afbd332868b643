#pragma once

#include "backtest/domain/candle.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace backtest {

class Indicator;

using IndicatorPtr = std::shared_ptr<const Indicator>;

// One value per input candle; std::nullopt = insufficient history.
using IndicatorValues = std::vector<std::optional<double>>;

// -----------------------------------------------------------------------------
// Indicator - technical indicator contract
// -----------------------------------------------------------------------------
//
// @brief  Computes one value per candle of a single instrument's series.
//
// @details
// calculate() receives the instrument's candles in time order. Values of
// every indicator listed in dependencies() are already attached to those
// candles (CandleTable::applyIndicators applies dependencies first), so a
// derived indicator reads them with Candle::indicator(dep->name()).
//
// name() is the storage key on each candle and must be stable and unique
// among the indicators of a run.
//
// Indicators are immutable after construction and shared through
// IndicatorPtr so that several indicators can depend on the same one.
// -----------------------------------------------------------------------------
class Indicator {
 public:
  virtual ~Indicator() = default;

  virtual IndicatorValues calculate(
      const std::vector<domain::Candle>& candles) const = 0;

  virtual std::string name() const = 0;

  virtual std::vector<IndicatorPtr> dependencies() const { return {}; }
};

}  // namespace backtest
