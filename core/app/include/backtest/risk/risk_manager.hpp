#pragma once

#include "backtest/domain/risk_settings.hpp"
#include "backtest/risk/i_risk_manager.hpp"

#include <string>

namespace backtest {

// -----------------------------------------------------------------------------
// RiskManager
// -----------------------------------------------------------------------------
//
// @brief  Default risk policy: leverage and allocation caps before a trade,
//         stop-loss / take-profit / trailing-stop exits after marks.
//
// @details
// Pre-trade checks (validateOrder), Entry orders only. Exits reduce
// exposure and are never capped.
//
//   1. Allocation cap (when max_position_allocation_rate > 0):
//        quantity * price > rate * portfolio.value()  → reject
//
//   2. Leverage cap (when max_leverage > 0):
//        order.leverage > max_leverage                → reject
//      order.leverage is the effective leverage: the Runner stamps the
//      portfolio's default onto unlevered entries before this check.
//
// Exit scan (checkPositionExits), per open position with a price:
//
//   rule           Long triggers when          Short triggers when
//   stop-loss      p <= open * (1 - sl)        p >= open * (1 + sl)
//   take-profit    p >= open * (1 + tp)        p <= open * (1 - tp)
//   trailing-stop  p <= anchor * (1 - ts)      p >= anchor * (1 + ts)
//
// Rules are tried in that order; the first match yields one full-size Exit
// order on the opposite side at p. The trailing anchor is the position's
// trailingStopHigh(), which Position::updatePrice ratchets; the RiskManager
// only reads it.
//
// Thread model:
//   Stateless between calls apart from the immutable settings. All methods
//   are const.
// -----------------------------------------------------------------------------
class RiskManager final : public IRiskManager {
 public:
  explicit RiskManager(const domain::RiskSettings& settings);

  void validateOrder(const IPortfolioManager& portfolio,
                     const domain::Order& order) const override;

  std::vector<domain::Order> checkPositionExits(
      const IPortfolioManager& portfolio,
      const PriceMap& prices) const override;

  PositionRisk positionRisk(const domain::Position& position,
                            double current_price) const override;

  const domain::RiskSettings& settings() const { return settings_; }

 private:
  // Returns the name of the triggered rule ("stop_loss", "take_profit",
  // "trailing_stop") or an empty string.
  std::string exitReason(const domain::Position& position,
                         double current_price) const;

  double stopLossPrice(const domain::Position& position) const;
  double takeProfitPrice(const domain::Position& position) const;
  double trailingStopPrice(const domain::Position& position) const;

  const domain::RiskSettings settings_;
};

}  // namespace backtest
