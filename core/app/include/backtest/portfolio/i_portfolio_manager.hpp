#pragma once

#include "backtest/domain/order.hpp"
#include "backtest/domain/position.hpp"

#include <map>
#include <string>
#include <vector>

namespace backtest {

// Close price per instrument for the current tick.
using PriceMap = std::map<std::string, double>;

// Open positions keyed by instrument. std::map keeps iteration order
// deterministic, which fixes the order of risk-forced exits within a tick.
using PositionMap = std::map<std::string, domain::Position>;

// -----------------------------------------------------------------------------
// IPortfolioManager - accounting contract the Runner depends on
// -----------------------------------------------------------------------------
//
// @brief  Minimal surface through which the Runner, RiskManager and
//         strategies interact with account state.
//
// @details
// The Runner is the only caller of the mutating methods (processOrder,
// updatePositions, setRiskLevels). Strategies and the RiskManager receive a
// const reference and can only read.
//
// processOrder must be all-or-nothing: on failure it throws BacktestError
// and leaves cash, positions and history untouched.
// -----------------------------------------------------------------------------
class IPortfolioManager {
 public:
  virtual ~IPortfolioManager() = default;

  // Validates and applies a filled order. Throws BacktestError on rejection.
  virtual void processOrder(const domain::Order& order) = 0;

  // Marks every open position whose instrument appears in prices.
  virtual void updatePositions(const PriceMap& prices) = 0;

  // Records the current stop-loss / take-profit price levels on an open
  // position. Unknown instruments are ignored.
  virtual void setRiskLevels(const std::string& instrument, double stop_loss,
                             double take_profit) = 0;

  // Leverage an Entry is applied at: the order's own leverage, or the
  // account default when the order carries none. The Runner stamps it on
  // entries before risk validation.
  virtual double effectiveLeverage(const domain::Order& order) const = 0;

  virtual double value() const = 0;
  virtual double cash() const = 0;
  virtual const PositionMap& positions() const = 0;

  // Positions that reached Closed, in closing order.
  virtual const std::vector<domain::Position>& closedPositions() const = 0;
};

}  // namespace backtest
