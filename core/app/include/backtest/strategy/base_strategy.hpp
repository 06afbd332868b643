#pragma once

#include "backtest/strategy/i_strategy.hpp"

namespace backtest {

// No-op callbacks and a stored portfolio handle. Concrete strategies derive
// from this and override onTick() plus whatever hooks they need.
class BaseStrategy : public IStrategy {
 public:
  void setPortfolio(const IPortfolioManager* portfolio) override {
    portfolio_ = portfolio;
  }

  void onOrderFilled(const domain::Order&) override {}
  void onPositionOpened(const domain::Position&) override {}
  void onPositionClosed(const domain::Position&) override {}

 protected:
  // nullptr until the Runner wires it.
  const IPortfolioManager* portfolio() const { return portfolio_; }

 private:
  const IPortfolioManager* portfolio_{nullptr};
};

}  // namespace backtest
