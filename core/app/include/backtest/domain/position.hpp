#pragma once

#include "backtest/domain/order.hpp"
#include "backtest/time/time_utils.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace backtest {
namespace domain {

using PositionId = std::uint64_t;

// -----------------------------------------------------------------------------
// PositionStatus
// -----------------------------------------------------------------------------
// Invariant maintained by Position:
//   quantity == 0            ⇔ Closed
//   partially exited, qty > 0 ⇒ PartiallyOpen
// Entry orders never change the status.
// -----------------------------------------------------------------------------
enum class PositionStatus {
  Open,
  PartiallyOpen,
  Closed,
};

const char* toString(PositionStatus status);

// -----------------------------------------------------------------------------
// Position - per-instrument aggregate of quantity, cost basis, and PnL
// -----------------------------------------------------------------------------
//
// @brief  Tracks one directional position: volume-weighted open price,
//         leverage, realized and unrealized PnL, and the price markers used
//         by the RiskManager (highest/lowest price, trailing-stop anchor).
//
// @details
// A Position is created from its first Entry order by open() and then
// mutated only through addOrder() and updatePrice(). The Portfolio owns
// every Position; other components see const references.
//
// PnL math (sign = +1 for Long, -1 for Short):
//
//   Entry (average in):
//     open_price = (open_price * qty + fill_price * fill_qty)
//                  / (qty + fill_qty)
//     qty += fill_qty
//
//   Exit (reduce / close):
//     realized_pnl += fill_qty * (fill_price - open_price) * leverage * sign
//     qty -= fill_qty
//     open_price unchanged
//
//   Mark (updatePrice):
//     unrealized_pnl = qty * (price - open_price) * leverage * sign
//
// The trailing-stop anchor starts at the entry price and only ratchets in
// the position's favour: up for Long, down for Short.
//
// Exceptions:
//   open() and addOrder() throw BacktestError before touching any field, so
//   a rejected order leaves the position unchanged.
// -----------------------------------------------------------------------------
class Position {
 public:
  // -------------------------------------------------------------------------
  // open(id, entry, open_time)
  // -------------------------------------------------------------------------
  // @brief  Creates a position from its first Entry order.
  //
  // @param  id         Position identifier (assigned by the Portfolio).
  // @param  entry      A filled Entry order with quantity > 0.
  // @param  open_time  Simulation time at which the position opens.
  //
  // @throws BacktestError(InvalidOrderType) if entry is not an Entry order.
  // @throws BacktestError(InvalidOrder) if entry.quantity <= 0.
  //
  // @details
  // Leverage below 1 is raised to 1. Highest/lowest price and the
  // trailing-stop anchor are initialised to the entry price.
  // -------------------------------------------------------------------------
  static Position open(PositionId id, const Order& entry, Timestamp open_time);

  // -------------------------------------------------------------------------
  // addOrder(order, when)
  // -------------------------------------------------------------------------
  // @brief  Applies an Entry (average in) or Exit (reduce and realize PnL).
  //
  // @throws BacktestError(InvalidOrder) on instrument mismatch or
  //         quantity <= 0.
  // @throws BacktestError(QuantityExceedsPosition) if an Exit asks for more
  //         than the open quantity.
  //
  // @details
  // Every accepted order is appended to orders(). When an Exit brings the
  // quantity to zero the status becomes Closed and close price/time are
  // stamped; a smaller Exit makes it PartiallyOpen. After an Exit the
  // unrealized PnL is re-marked at the exit price for the remaining
  // quantity.
  // -------------------------------------------------------------------------
  void addOrder(const Order& order, Timestamp when);

  // -------------------------------------------------------------------------
  // updatePrice(current_price)
  // -------------------------------------------------------------------------
  // @brief  Marks the position to current_price.
  //
  // @details
  // Updates highest/lowest price, the trailing-stop anchor, unrealized PnL
  // and max drawdown. Max drawdown is the largest fractional retracement
  // from the highest price (Long) or rally from the lowest price (Short)
  // seen so far and never decreases.
  // -------------------------------------------------------------------------
  void updatePrice(double current_price);

  // (realized + unrealized) / (open_price * quantity); 0 when the
  // denominator is 0 (closed position).
  double roi() const;

  // Open → close for closed positions, open → now otherwise.
  std::chrono::milliseconds duration(Timestamp now) const;

  // quantity * price * leverage
  double value(double current_price) const;

  void setRiskLevels(double stop_loss, double take_profit) {
    stop_loss_ = stop_loss;
    take_profit_ = take_profit;
  }

  PositionId id() const { return id_; }
  const std::string& instrument() const { return instrument_; }
  Side side() const { return side_; }
  int quantity() const { return quantity_; }
  double openPrice() const { return open_price_; }
  double closePrice() const { return close_price_; }
  Timestamp openTime() const { return open_time_; }
  Timestamp closeTime() const { return close_time_; }
  PositionStatus status() const { return status_; }
  double leverage() const { return leverage_; }
  const std::vector<Order>& orders() const { return orders_; }
  double stopLoss() const { return stop_loss_; }
  double takeProfit() const { return take_profit_; }
  double highestPrice() const { return highest_price_; }
  double lowestPrice() const { return lowest_price_; }
  double maxDrawdown() const { return max_drawdown_; }
  double unrealizedPnl() const { return unrealized_pnl_; }
  double realizedPnl() const { return realized_pnl_; }
  double trailingStopHigh() const { return trailing_stop_high_; }
  bool isOpen() const { return status_ != PositionStatus::Closed; }

 private:
  Position() = default;

  // +1 for Long, -1 for Short.
  double directionSign() const { return side_ == Side::Long ? 1.0 : -1.0; }

  PositionId id_{};
  std::string instrument_;
  Side side_{Side::Long};
  int quantity_{0};
  double open_price_{0.0};
  double close_price_{0.0};
  Timestamp open_time_{};
  Timestamp close_time_{};
  PositionStatus status_{PositionStatus::Open};
  double leverage_{1.0};
  std::vector<Order> orders_;

  double stop_loss_{0.0};
  double take_profit_{0.0};
  double highest_price_{0.0};
  double lowest_price_{0.0};
  double max_drawdown_{0.0};
  double unrealized_pnl_{0.0};
  double realized_pnl_{0.0};
  double trailing_stop_high_{0.0};
};

}  // namespace domain
}  // namespace backtest
