#include "backtest/risk/risk_manager.hpp"
#include "backtest/domain/errors.hpp"

#include <cmath>
#include <cstdio>
#include <iostream>

namespace backtest {

RiskManager::RiskManager(const domain::RiskSettings& settings)
    : settings_(settings) {}

// -----------------------------------------------------------------------------
// validateOrder: allocation cap, then leverage cap. Entries only.
// -----------------------------------------------------------------------------
void RiskManager::validateOrder(const IPortfolioManager& portfolio,
                                const domain::Order& order) const {
  if (order.type != domain::OrderType::Entry) {
    return;
  }

  if (settings_.max_position_allocation_rate > 0.0) {
    const double position_value = order.notional();
    const double portfolio_value = portfolio.value();
    const double max_allowed =
        portfolio_value * settings_.max_position_allocation_rate;

    if (position_value > max_allowed) {
      char buf[192];
      std::snprintf(buf, sizeof(buf),
                    "position size %.2f exceeds maximum allowed %.2f "
                    "(%.2f%% of portfolio value %.2f)",
                    position_value, max_allowed,
                    settings_.max_position_allocation_rate * 100.0,
                    portfolio_value);
      throw BacktestError(ErrorCode::RiskValidationFailed,
                          order.instrument + ": " + buf);
    }
  }

  if (settings_.max_leverage > 0.0 && order.leverage > settings_.max_leverage) {
    char buf[128];
    std::snprintf(buf, sizeof(buf),
                  "order leverage %.2fx exceeds maximum %.2fx", order.leverage,
                  settings_.max_leverage);
    throw BacktestError(ErrorCode::RiskValidationFailed,
                        order.instrument + ": " + buf);
  }
}

// -----------------------------------------------------------------------------
// checkPositionExits: one exit order per triggered position
// -----------------------------------------------------------------------------
std::vector<domain::Order> RiskManager::checkPositionExits(
    const IPortfolioManager& portfolio, const PriceMap& prices) const {
  std::vector<domain::Order> exits;

  for (const auto& [instrument, pos] : portfolio.positions()) {
    auto price_it = prices.find(instrument);
    if (price_it == prices.end()) {
      continue;
    }
    const double current_price = price_it->second;

    const std::string reason = exitReason(pos, current_price);
    if (reason.empty()) {
      continue;
    }

    domain::Order exit =
        domain::makeOrder(instrument, domain::opposite(pos.side()),
                          domain::OrderType::Exit, pos.quantity(),
                          pos.leverage());
    exit.price = current_price;
    exits.push_back(std::move(exit));

    std::cout << "[RiskManager] Exit condition met for " << instrument << ": "
              << reason << " at price " << current_price << "\n";
  }

  return exits;
}

// -----------------------------------------------------------------------------
// positionRisk: price levels and exposure for reporting
// -----------------------------------------------------------------------------
PositionRisk RiskManager::positionRisk(const domain::Position& position,
                                       double current_price) const {
  PositionRisk risk;
  risk.stop_loss_price = stopLossPrice(position);
  risk.take_profit_price = takeProfitPrice(position);
  risk.trailing_stop_price = trailingStopPrice(position);
  risk.max_loss = position.quantity() *
                  std::abs(current_price - risk.stop_loss_price) *
                  position.leverage();

  if (settings_.use_stop_loss && settings_.use_take_profit) {
    const double downside = std::abs(current_price - risk.stop_loss_price);
    const double upside = std::abs(risk.take_profit_price - current_price);
    risk.risk_reward_ratio = downside == 0.0 ? 0.0 : upside / downside;
  }

  return risk;
}

std::string RiskManager::exitReason(const domain::Position& position,
                                    double current_price) const {
  const bool is_long = position.side() == domain::Side::Long;

  if (settings_.use_stop_loss) {
    const double stop = stopLossPrice(position);
    if (is_long ? current_price <= stop : current_price >= stop) {
      return "stop_loss";
    }
  }

  if (settings_.use_take_profit) {
    const double target = takeProfitPrice(position);
    if (is_long ? current_price >= target : current_price <= target) {
      return "take_profit";
    }
  }

  if (settings_.use_trailing_stop) {
    const double trail = trailingStopPrice(position);
    if (is_long ? current_price <= trail : current_price >= trail) {
      return "trailing_stop";
    }
  }

  return {};
}

double RiskManager::stopLossPrice(const domain::Position& position) const {
  return position.side() == domain::Side::Long
             ? position.openPrice() * (1.0 - settings_.stop_loss_rate)
             : position.openPrice() * (1.0 + settings_.stop_loss_rate);
}

double RiskManager::takeProfitPrice(const domain::Position& position) const {
  return position.side() == domain::Side::Long
             ? position.openPrice() * (1.0 + settings_.take_profit_rate)
             : position.openPrice() * (1.0 - settings_.take_profit_rate);
}

double RiskManager::trailingStopPrice(const domain::Position& position) const {
  return position.side() == domain::Side::Long
             ? position.trailingStopHigh() * (1.0 - settings_.trailing_stop_rate)
             : position.trailingStopHigh() *
                   (1.0 + settings_.trailing_stop_rate);
}

}  // namespace backtest
