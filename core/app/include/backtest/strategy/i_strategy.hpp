#pragma once

#include "backtest/data/candle_table.hpp"
#include "backtest/domain/order.hpp"
#include "backtest/domain/position.hpp"
#include "backtest/portfolio/i_portfolio_manager.hpp"
#include "backtest/time/time_utils.hpp"

#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// IStrategy - trading logic driven by the Runner
// -----------------------------------------------------------------------------
//
// @brief  Receives one call per tick and returns the orders it wants placed.
//
// @details
// The Runner calls, per tick and in this order:
//   1. onTick(time, candles) once. The returned orders may be unfilled and
//      may carry id 0; the Runner assigns ids and fills them at the tick's
//      close before validation.
//   2. For each committed order: onOrderFilled(order), then
//      onPositionOpened(position) if the order created a position, or
//      onPositionClosed(position) if it closed one.
//
// Rejected orders produce no callback; the rejection ends the run.
// Callbacks fire for risk-forced exits too.
//
// setPortfolio() is called once before the first tick. The handle is
// read-only; all mutations go through the Runner.
// -----------------------------------------------------------------------------
class IStrategy {
 public:
  virtual ~IStrategy() = default;

  virtual std::vector<domain::Order> onTick(Timestamp time,
                                            const CandleMap& candles) = 0;

  virtual void setPortfolio(const IPortfolioManager* portfolio) = 0;

  virtual void onOrderFilled(const domain::Order& order) = 0;
  virtual void onPositionOpened(const domain::Position& position) = 0;
  virtual void onPositionClosed(const domain::Position& position) = 0;
};

}  // namespace backtest
