#include "backtest/portfolio/portfolio.hpp"
#include "backtest/domain/errors.hpp"

#include <cmath>
#include <cstdio>
#include <utility>

namespace backtest {

namespace {

constexpr double kLeverageEpsilon = 1e-9;

std::string formatAmount(double amount) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f", amount);
  return buf;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
Portfolio::Portfolio(const domain::PortfolioSettings& settings)
    : settings_(settings), cash_(settings.initial_capital) {}

// -----------------------------------------------------------------------------
// processOrder: validate, then dispatch on order type
// -----------------------------------------------------------------------------
void Portfolio::processOrder(const domain::Order& order) {
  validateOrder(order);

  switch (order.type) {
    case domain::OrderType::Entry:
      handleEntryOrder(order);
      return;
    case domain::OrderType::Exit:
      handleExitOrder(order);
      return;
  }

  throw BacktestError(ErrorCode::InvalidOrder, "invalid order type");
}

// -----------------------------------------------------------------------------
// updatePositions: mark open positions that have a price this tick
// -----------------------------------------------------------------------------
void Portfolio::updatePositions(const PriceMap& prices) {
  for (auto& [instrument, pos] : open_positions_) {
    auto it = prices.find(instrument);
    if (it != prices.end()) {
      pos.updatePrice(it->second);
    }
  }
}

void Portfolio::setRiskLevels(const std::string& instrument, double stop_loss,
                              double take_profit) {
  auto it = open_positions_.find(instrument);
  if (it != open_positions_.end()) {
    it->second.setRiskLevels(stop_loss, take_profit);
  }
}

// -----------------------------------------------------------------------------
// value: cash + unrealized PnL (not a full mark-to-market of notional)
// -----------------------------------------------------------------------------
double Portfolio::value() const {
  double total = cash_;
  for (const auto& [instrument, pos] : open_positions_) {
    total += pos.unrealizedPnl();
  }
  return total;
}

const domain::Position* Portfolio::position(
    const std::string& instrument) const {
  auto it = open_positions_.find(instrument);
  return (it != open_positions_.end()) ? &it->second : nullptr;
}

PositionMetrics Portfolio::positionMetrics(const std::string& instrument,
                                           Timestamp now) const {
  const domain::Position* pos = position(instrument);
  if (pos == nullptr) {
    throw BacktestError(ErrorCode::NoPositionFound,
                        "no position found for " + instrument);
  }

  PositionMetrics metrics;
  metrics.roi = pos->roi();
  metrics.duration = pos->duration(now);
  metrics.max_drawdown = pos->maxDrawdown();
  metrics.realized_pnl = pos->realizedPnl();
  metrics.unrealized_pnl = pos->unrealizedPnl();
  return metrics;
}

PortfolioStats Portfolio::portfolioStats() const {
  PortfolioStats stats;
  stats.total_value = value();
  stats.cash = cash_;
  stats.open_positions = static_cast<int>(open_positions_.size());
  stats.closed_positions = static_cast<int>(closed_positions_.size());

  for (const auto& [instrument, pos] : open_positions_) {
    if (pos.unrealizedPnl() > 0.0) {
      ++stats.winning_positions;
    } else if (pos.unrealizedPnl() < 0.0) {
      ++stats.losing_positions;
    }
    stats.total_unrealized_pnl += pos.unrealizedPnl();
  }

  for (const auto& pos : closed_positions_) {
    if (pos.realizedPnl() > 0.0) {
      ++stats.winning_trades;
    } else if (pos.realizedPnl() < 0.0) {
      ++stats.losing_trades;
    }
    stats.total_realized_pnl += pos.realizedPnl();
  }

  return stats;
}

// -----------------------------------------------------------------------------
// validateOrder: every rejection happens here, before any mutation
// -----------------------------------------------------------------------------
void Portfolio::validateOrder(const domain::Order& order) const {
  if (order.instrument.empty()) {
    throw BacktestError(ErrorCode::InvalidOrder, "order has no instrument");
  }
  if (order.quantity <= 0) {
    throw BacktestError(ErrorCode::InvalidOrder,
                        "invalid order quantity " +
                            std::to_string(order.quantity) + " for " +
                            order.instrument);
  }
  if (order.price <= 0.0) {
    throw BacktestError(ErrorCode::InvalidOrder,
                        "order for " + order.instrument +
                            " has no execution price");
  }

  switch (order.type) {
    case domain::OrderType::Entry: {
      if (order.side == domain::Side::Short && !settings_.enable_shorts) {
        throw BacktestError(ErrorCode::ShortsDisabled,
                            "short positions not allowed (" +
                                order.instrument + ")");
      }

      const double leverage = effectiveLeverage(order);
      const double required = order.notional() / leverage;
      if (required > cash_) {
        throw BacktestError(ErrorCode::InsufficientCash,
                            "insufficient cash: have " + formatAmount(cash_) +
                                ", need " + formatAmount(required));
      }

      // An entry on the opposite side of an open position would be averaged
      // into it with the wrong PnL sign.
      const domain::Position* existing = position(order.instrument);
      if (existing != nullptr && existing->side() != order.side) {
        throw BacktestError(ErrorCode::InvalidOrder,
                            "entry side " +
                                std::string(domain::toString(order.side)) +
                                " conflicts with open " +
                                domain::toString(existing->side()) +
                                " position in " + order.instrument);
      }

      // Margin is debited per leg but PnL uses the position's single
      // leverage, so every leg must share it.
      if (existing != nullptr &&
          std::abs(existing->leverage() - leverage) > kLeverageEpsilon) {
        char buf[160];
        std::snprintf(buf, sizeof(buf),
                      "entry leverage %.2fx differs from open position "
                      "leverage %.2fx in ",
                      leverage, existing->leverage());
        throw BacktestError(ErrorCode::InvalidOrder, buf + order.instrument);
      }
      return;
    }

    case domain::OrderType::Exit: {
      const domain::Position* pos = position(order.instrument);
      if (pos == nullptr) {
        throw BacktestError(ErrorCode::NoOpenPosition,
                            "no open position for " + order.instrument);
      }
      if (order.quantity > pos->quantity()) {
        throw BacktestError(ErrorCode::ExitExceedsSize,
                            "exit quantity " + std::to_string(order.quantity) +
                                " exceeds position size " +
                                std::to_string(pos->quantity()) + " for " +
                                order.instrument);
      }
      return;
    }
  }
}

double Portfolio::effectiveLeverage(const domain::Order& order) const {
  if (order.leverage > 1.0) {
    return order.leverage;
  }
  if (settings_.default_leverage > 1.0) {
    return settings_.default_leverage;
  }
  return 1.0;
}

// -----------------------------------------------------------------------------
// handleEntryOrder: open or average into a position, debit cash
// -----------------------------------------------------------------------------
void Portfolio::handleEntryOrder(const domain::Order& order) {
  domain::Order applied = order;
  applied.leverage = effectiveLeverage(order);

  auto it = open_positions_.find(applied.instrument);
  if (it == open_positions_.end()) {
    // Position::open throws before anything is inserted.
    open_positions_.emplace(
        applied.instrument,
        domain::Position::open(position_ids_.next_id(), applied,
                               applied.filled_at));
  } else {
    it->second.addOrder(applied, applied.filled_at);
  }

  cash_ -= applied.notional() / applied.leverage;
  order_history_.push_back(applied);
}

// -----------------------------------------------------------------------------
// handleExitOrder: reduce the position, credit proceeds, archive if closed
// -----------------------------------------------------------------------------
void Portfolio::handleExitOrder(const domain::Order& order) {
  auto it = open_positions_.find(order.instrument);
  if (it == open_positions_.end()) {
    throw BacktestError(ErrorCode::NoPositionFound,
                        "no position found for " + order.instrument);
  }

  domain::Position& pos = it->second;
  pos.addOrder(order, order.filled_at);

  cash_ += order.notional();

  if (pos.status() == domain::PositionStatus::Closed) {
    closed_positions_.push_back(std::move(pos));
    open_positions_.erase(it);
  }

  order_history_.push_back(order);
}

}  // namespace backtest
