#include "backtest/domain/order.hpp"

namespace backtest {
namespace domain {

const char* toString(Side side) {
  switch (side) {
    case Side::Long:
      return "Long";
    case Side::Short:
      return "Short";
  }
  return "Unknown";
}

const char* toString(OrderType type) {
  switch (type) {
    case OrderType::Entry:
      return "Entry";
    case OrderType::Exit:
      return "Exit";
  }
  return "Unknown";
}

Side opposite(Side side) {
  return side == Side::Long ? Side::Short : Side::Long;
}

Order makeOrder(const std::string& instrument, Side side, OrderType type,
                int quantity, double leverage) {
  Order order;
  order.instrument = instrument;
  order.side = side;
  order.type = type;
  order.quantity = quantity;
  order.leverage = leverage <= 0.0 ? 1.0 : leverage;
  return order;
}

}  // namespace domain
}  // namespace backtest
