#pragma once

#include "backtest/strategy/base_strategy.hpp"

#include <functional>
#include <utility>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// CallbackStrategy - strategy assembled from callables
// -----------------------------------------------------------------------------
//
// @brief  Each hook is an optional std::function set through a chained
//         setter; unset hooks do nothing.
//
// @details
//   CallbackStrategy strategy;
//   strategy.withTick([](Timestamp, const CandleMap& candles) { ... })
//           .withPositionClosed([&](const domain::Position& p) { ... });
//
// The tick callback also receives the portfolio handle so it can inspect
// open positions without capturing the Runner.
// -----------------------------------------------------------------------------
class CallbackStrategy final : public BaseStrategy {
 public:
  using TickFn = std::function<std::vector<domain::Order>(
      Timestamp, const CandleMap&, const IPortfolioManager*)>;
  using OrderFn = std::function<void(const domain::Order&)>;
  using PositionFn = std::function<void(const domain::Position&)>;

  CallbackStrategy& withTick(TickFn fn) {
    on_tick_ = std::move(fn);
    return *this;
  }
  CallbackStrategy& withOrderFilled(OrderFn fn) {
    on_order_filled_ = std::move(fn);
    return *this;
  }
  CallbackStrategy& withPositionOpened(PositionFn fn) {
    on_position_opened_ = std::move(fn);
    return *this;
  }
  CallbackStrategy& withPositionClosed(PositionFn fn) {
    on_position_closed_ = std::move(fn);
    return *this;
  }

  std::vector<domain::Order> onTick(Timestamp time,
                                    const CandleMap& candles) override {
    if (!on_tick_) {
      return {};
    }
    return on_tick_(time, candles, portfolio());
  }

  void onOrderFilled(const domain::Order& order) override {
    if (on_order_filled_) on_order_filled_(order);
  }
  void onPositionOpened(const domain::Position& position) override {
    if (on_position_opened_) on_position_opened_(position);
  }
  void onPositionClosed(const domain::Position& position) override {
    if (on_position_closed_) on_position_closed_(position);
  }

 private:
  TickFn on_tick_;
  OrderFn on_order_filled_;
  PositionFn on_position_opened_;
  PositionFn on_position_closed_;
};

}  // namespace backtest
