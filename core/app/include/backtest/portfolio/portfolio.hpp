#pragma once

#include "backtest/common/id_generator.hpp"
#include "backtest/domain/portfolio_settings.hpp"
#include "backtest/portfolio/i_portfolio_manager.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace backtest {

// Per-position read-side metrics.
struct PositionMetrics {
  double roi{0.0};
  std::chrono::milliseconds duration{0};
  double max_drawdown{0.0};
  double realized_pnl{0.0};
  double unrealized_pnl{0.0};
};

// -----------------------------------------------------------------------------
// PortfolioStats
// -----------------------------------------------------------------------------
// Open positions count as "winning" when unrealized PnL > 0 and "losing"
// when it is < 0; closed trades likewise on realized PnL. Exactly zero is
// neither, matching Runner::results().
// -----------------------------------------------------------------------------
struct PortfolioStats {
  double total_value{0.0};
  double cash{0.0};
  int open_positions{0};
  int closed_positions{0};
  int winning_positions{0};
  int losing_positions{0};
  int winning_trades{0};
  int losing_trades{0};
  double total_unrealized_pnl{0.0};
  double total_realized_pnl{0.0};
};

// -----------------------------------------------------------------------------
// Portfolio - cash, open positions, and trade history
// -----------------------------------------------------------------------------
//
// @brief  Aggregate root of the account. Turns validated orders into
//         position mutations and cash movements.
//
// @details
// State:
//   cash_              Starts at settings.initial_capital.
//   open_positions_    instrument → Position, every entry has quantity > 0.
//   closed_positions_  Positions moved out the instant they reach zero.
//   order_history_     Every applied order, in application order.
//
// Cash model:
//   Entry  cash -= quantity * price / effective_leverage
//   Exit   cash += quantity * price
//
// No brokerage, slippage, margin or borrow accounting. value() is cash
// plus unrealized PnL of open positions, not a full mark-to-market of
// notional.
//
// Effective leverage is the order's leverage, or settings.default_leverage
// when the order carries none (1.0) and the default is above 1. The
// position is opened with the same effective leverage, and averaging in at
// a different leverage is rejected, so margin and PnL use one multiplier.
//
// Thread model:
//   Single writer (the Runner loop). Not safe for concurrent mutation.
// -----------------------------------------------------------------------------
class Portfolio final : public IPortfolioManager {
 public:
  explicit Portfolio(const domain::PortfolioSettings& settings);

  Portfolio(const Portfolio&) = delete;
  Portfolio& operator=(const Portfolio&) = delete;

  // -------------------------------------------------------------------------
  // processOrder(order)
  // -------------------------------------------------------------------------
  // @brief  Validates the order, then applies it as an entry or an exit.
  //
  // @throws BacktestError with one of:
  //   InvalidOrder      quantity <= 0, empty instrument, price <= 0, or an
  //                     entry whose side or effective leverage differs from
  //                     the open position's
  //   ShortsDisabled    Short entry while enable_shorts is false
  //   InsufficientCash  entry notional / leverage > cash
  //   NoOpenPosition    exit for an instrument with no open position
  //   ExitExceedsSize   exit quantity > open quantity
  //
  // Side-effects: none when it throws.
  // -------------------------------------------------------------------------
  void processOrder(const domain::Order& order) override;

  void updatePositions(const PriceMap& prices) override;

  void setRiskLevels(const std::string& instrument, double stop_loss,
                     double take_profit) override;

  double effectiveLeverage(const domain::Order& order) const override;
  double value() const override;
  double cash() const override { return cash_; }
  const PositionMap& positions() const override { return open_positions_; }

  // Open position for instrument, or nullptr.
  const domain::Position* position(const std::string& instrument) const;

  const std::vector<domain::Position>& closedPositions() const override {
    return closed_positions_;
  }
  const std::vector<domain::Order>& orderHistory() const {
    return order_history_;
  }
  const domain::PortfolioSettings& settings() const { return settings_; }

  // @throws BacktestError(NoPositionFound) if instrument has no open
  //         position.
  PositionMetrics positionMetrics(const std::string& instrument,
                                  Timestamp now) const;

  // Read-only projection over open and closed positions.
  PortfolioStats portfolioStats() const;

 private:
  void validateOrder(const domain::Order& order) const;
  void handleEntryOrder(const domain::Order& order);
  void handleExitOrder(const domain::Order& order);

  const domain::PortfolioSettings settings_;
  double cash_{0.0};
  PositionMap open_positions_;
  std::vector<domain::Position> closed_positions_;
  std::vector<domain::Order> order_history_;
  IdGenerator position_ids_;
};

}  // namespace backtest
