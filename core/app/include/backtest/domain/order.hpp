#pragma once

#include "backtest/time/time_utils.hpp"

#include <cstdint>
#include <string>

namespace backtest {
namespace domain {

// Unique identifier for an order. 0 means "not yet assigned"; the Runner
// stamps ids on strategy and risk orders before they are validated.
using OrderId = std::uint64_t;

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Direction of an order or position. An Exit order for a Long position is
// normally expressed on the opposite side (Short), but the Portfolio keys
// exits by instrument only.
// -----------------------------------------------------------------------------
enum class Side {
  Long,
  Short,
};

// -----------------------------------------------------------------------------
// OrderType
// -----------------------------------------------------------------------------
// Entry opens or averages into a position; Exit reduces or closes it.
// -----------------------------------------------------------------------------
enum class OrderType {
  Entry,
  Exit,
};

const char* toString(Side side);
const char* toString(OrderType type);

// Returns the opposing side (Long ↔ Short).
Side opposite(Side side);

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
//
// @brief  Intent record for a single trade: instrument, side, type,
//         quantity, leverage, and (once filled) execution price and time.
//
// @details
// Orders are plain values. A strategy builds one with makeOrder(), the
// Runner assigns an id and fills it at the tick's close when the strategy
// has not filled it already, and the Portfolio copies it into the position
// and order histories.
//
// fill() is expected to be called at most once per order. That is caller
// discipline, not a guard: the Runner only fills orders for which
// isFilled() is false.
//
// quantity is an int so that "quantity <= 0" can be rejected explicitly by
// Position and Portfolio validation rather than being unrepresentable.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id{};                      // 0 until assigned by the Runner
  std::string instrument;            // e.g. "AAPL"
  Side side{Side::Long};
  OrderType type{OrderType::Entry};
  int quantity{0};                   // Units; must be > 0 to be accepted
  double price{0.0};                 // Execution price, set by fill()
  double leverage{1.0};              // >= 1; 1.0 means unlevered
  Timestamp filled_at{};             // Execution time, set by fill()
  bool filled{false};

  // Stamps execution price and time.
  void fill(double fill_price, Timestamp when) {
    price = fill_price;
    filled_at = when;
    filled = true;
  }

  bool isFilled() const { return filled; }

  // Quantity times price, ignoring leverage.
  double notional() const { return static_cast<double>(quantity) * price; }
};

// -----------------------------------------------------------------------------
// makeOrder
// -----------------------------------------------------------------------------
// @brief  Builds an unfilled order. Leverage <= 0 defaults to 1.0.
//
// @details
// Does not validate quantity: a non-positive quantity is representable and
// is rejected with ErrorCode::InvalidOrder when the order is processed.
// -----------------------------------------------------------------------------
Order makeOrder(const std::string& instrument, Side side, OrderType type,
                int quantity, double leverage = 1.0);

}  // namespace domain
}  // namespace backtest
