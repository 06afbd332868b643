#include "backtest/domain/position.hpp"
#include "backtest/domain/errors.hpp"

#include <algorithm>

namespace backtest {
namespace domain {

const char* toString(PositionStatus status) {
  switch (status) {
    case PositionStatus::Open:
      return "Open";
    case PositionStatus::PartiallyOpen:
      return "PartiallyOpen";
    case PositionStatus::Closed:
      return "Closed";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// open: build a position from its first Entry order
// -----------------------------------------------------------------------------
Position Position::open(PositionId id, const Order& entry,
                        Timestamp open_time) {
  if (entry.type != OrderType::Entry) {
    throw BacktestError(ErrorCode::InvalidOrderType,
                        "cannot create position from non-entry order for " +
                            entry.instrument);
  }
  if (entry.quantity <= 0) {
    throw BacktestError(ErrorCode::InvalidOrder,
                        "invalid order quantity: " +
                            std::to_string(entry.quantity));
  }

  Position pos;
  pos.id_ = id;
  pos.instrument_ = entry.instrument;
  pos.side_ = entry.side;
  pos.quantity_ = entry.quantity;
  pos.open_price_ = entry.price;
  pos.open_time_ = open_time;
  pos.status_ = PositionStatus::Open;
  pos.leverage_ = std::max(entry.leverage, 1.0);
  pos.highest_price_ = entry.price;
  pos.lowest_price_ = entry.price;
  pos.trailing_stop_high_ = entry.price;
  pos.orders_.push_back(entry);
  return pos;
}

// -----------------------------------------------------------------------------
// addOrder: average in on Entry, reduce and realize on Exit
// -----------------------------------------------------------------------------
void Position::addOrder(const Order& order, Timestamp when) {
  if (order.instrument != instrument_) {
    throw BacktestError(ErrorCode::InvalidOrder,
                        "order instrument " + order.instrument +
                            " does not match position instrument " +
                            instrument_);
  }
  if (order.quantity <= 0) {
    throw BacktestError(ErrorCode::InvalidOrder,
                        "invalid order quantity: " +
                            std::to_string(order.quantity));
  }

  switch (order.type) {
    case OrderType::Entry: {
      // Running volume-weighted average cost. quantity_ + order.quantity is
      // strictly positive here, so the division is safe.
      const int new_quantity = quantity_ + order.quantity;
      open_price_ = (open_price_ * quantity_ + order.price * order.quantity) /
                    static_cast<double>(new_quantity);
      quantity_ = new_quantity;
      break;
    }

    case OrderType::Exit: {
      if (order.quantity > quantity_) {
        throw BacktestError(ErrorCode::QuantityExceedsPosition,
                            "exit quantity " + std::to_string(order.quantity) +
                                " exceeds position size " +
                                std::to_string(quantity_));
      }

      realized_pnl_ += order.quantity * (order.price - open_price_) *
                       leverage_ * directionSign();
      quantity_ -= order.quantity;

      if (quantity_ == 0) {
        status_ = PositionStatus::Closed;
        close_price_ = order.price;
        close_time_ = when;
        unrealized_pnl_ = 0.0;
      } else {
        status_ = PositionStatus::PartiallyOpen;
        unrealized_pnl_ = quantity_ * (order.price - open_price_) *
                          leverage_ * directionSign();
      }
      break;
    }
  }

  orders_.push_back(order);
}

// -----------------------------------------------------------------------------
// updatePrice: mark to market and refresh risk markers
// -----------------------------------------------------------------------------
void Position::updatePrice(double current_price) {
  highest_price_ = std::max(highest_price_, current_price);
  if (lowest_price_ == 0.0 || current_price < lowest_price_) {
    lowest_price_ = current_price;
  }

  if (side_ == Side::Long) {
    trailing_stop_high_ = std::max(trailing_stop_high_, current_price);
  } else {
    trailing_stop_high_ = std::min(trailing_stop_high_, current_price);
  }

  unrealized_pnl_ =
      quantity_ * (current_price - open_price_) * leverage_ * directionSign();

  double drawdown = 0.0;
  if (side_ == Side::Long) {
    if (highest_price_ > 0.0) {
      drawdown = (highest_price_ - current_price) / highest_price_;
    }
  } else if (lowest_price_ > 0.0) {
    drawdown = (current_price - lowest_price_) / lowest_price_;
  }
  max_drawdown_ = std::max(max_drawdown_, drawdown);
}

double Position::roi() const {
  const double investment = open_price_ * quantity_;
  if (investment == 0.0) {
    return 0.0;
  }
  return (realized_pnl_ + unrealized_pnl_) / investment;
}

std::chrono::milliseconds Position::duration(Timestamp now) const {
  const Timestamp end =
      status_ == PositionStatus::Closed ? close_time_ : now;
  return std::chrono::duration_cast<std::chrono::milliseconds>(end -
                                                               open_time_);
}

double Position::value(double current_price) const {
  return quantity_ * current_price * leverage_;
}

}  // namespace domain
}  // namespace backtest
