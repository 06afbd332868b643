#pragma once

#include "backtest/domain/order.hpp"
#include "backtest/domain/position.hpp"
#include "backtest/portfolio/i_portfolio_manager.hpp"

#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// PositionRisk - price levels and exposure for one open position
// -----------------------------------------------------------------------------
struct PositionRisk {
  double stop_loss_price{0.0};
  double take_profit_price{0.0};
  double trailing_stop_price{0.0};
  double max_loss{0.0};           // Loss if the stop-loss level is hit now
  double risk_reward_ratio{0.0};  // 0 unless stop-loss and take-profit are on
};

// -----------------------------------------------------------------------------
// IRiskManager - risk policy contract the Runner depends on
// -----------------------------------------------------------------------------
//
// @brief  Pre-trade validation and forced-exit scanning.
//
// @details
// Implementations read the portfolio through a const reference and never
// mutate it: forced exits are returned as orders and go through the same
// validate → commit → notify path as strategy orders.
// -----------------------------------------------------------------------------
class IRiskManager {
 public:
  virtual ~IRiskManager() = default;

  // Throws BacktestError(RiskValidationFailed) when the order breaches a
  // configured limit.
  virtual void validateOrder(const IPortfolioManager& portfolio,
                             const domain::Order& order) const = 0;

  // Full-size exit orders, at most one per open position, for every
  // position whose exit rule triggers at the supplied price.
  virtual std::vector<domain::Order> checkPositionExits(
      const IPortfolioManager& portfolio, const PriceMap& prices) const = 0;

  virtual PositionRisk positionRisk(const domain::Position& position,
                                    double current_price) const = 0;
};

}  // namespace backtest
