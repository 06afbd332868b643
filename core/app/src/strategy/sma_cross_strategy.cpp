#include "backtest/strategy/sma_cross_strategy.hpp"
#include "backtest/domain/errors.hpp"
#include "backtest/indicators/sma.hpp"

#include <iostream>
#include <memory>
#include <utility>

namespace backtest {

SmaCrossStrategy::SmaCrossStrategy(std::string instrument, int fast_period,
                                   int slow_period, int quantity,
                                   double leverage)
    : instrument_(std::move(instrument)),
      quantity_(quantity),
      leverage_(leverage) {
  if (instrument_.empty()) {
    throw BacktestError(ErrorCode::ConfigError,
                        "SMA cross strategy needs an instrument");
  }
  if (fast_period <= 0 || fast_period >= slow_period) {
    throw BacktestError(ErrorCode::ConfigError,
                        "SMA cross strategy needs 0 < fast_period < "
                        "slow_period, got " +
                            std::to_string(fast_period) + "/" +
                            std::to_string(slow_period));
  }
  if (quantity_ <= 0) {
    throw BacktestError(ErrorCode::ConfigError,
                        "SMA cross strategy quantity must be positive");
  }

  auto fast = std::make_shared<Sma>(fast_period);
  auto slow = std::make_shared<Sma>(slow_period);
  fast_name_ = fast->name();
  slow_name_ = slow->name();
  indicators_ = {fast, slow};
}

std::vector<domain::Order> SmaCrossStrategy::onTick(Timestamp /*time*/,
                                                    const CandleMap& candles) {
  auto it = candles.find(instrument_);
  if (it == candles.end()) {
    return {};
  }

  const std::optional<double> fast = it->second.indicator(fast_name_);
  const std::optional<double> slow = it->second.indicator(slow_name_);

  std::vector<domain::Order> orders;
  if (fast && slow && prev_fast_ && prev_slow_ && portfolio() != nullptr) {
    const auto& open = portfolio()->positions();
    auto pos = open.find(instrument_);
    const bool has_position = pos != open.end();

    const bool crossed_up = *prev_fast_ <= *prev_slow_ && *fast > *slow;
    const bool crossed_down = *prev_fast_ >= *prev_slow_ && *fast < *slow;

    if (crossed_up && !has_position) {
      orders.push_back(domain::makeOrder(instrument_, domain::Side::Long,
                                         domain::OrderType::Entry, quantity_,
                                         leverage_));
    } else if (crossed_down && has_position) {
      orders.push_back(domain::makeOrder(
          instrument_, domain::opposite(pos->second.side()),
          domain::OrderType::Exit, pos->second.quantity(), leverage_));
    }
  }

  prev_fast_ = fast;
  prev_slow_ = slow;
  return orders;
}

void SmaCrossStrategy::onPositionClosed(const domain::Position& position) {
  ++completed_trades_;
  std::cout << "[SmaCrossStrategy] Closed " << position.instrument()
            << " realized PnL " << position.realizedPnl() << "\n";
}

}  // namespace backtest
