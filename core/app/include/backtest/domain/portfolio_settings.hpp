#pragma once

namespace backtest {
namespace domain {

// -----------------------------------------------------------------------------
// PortfolioSettings - account setup for a run
// -----------------------------------------------------------------------------
//
// @brief  Starting cash, short-selling permission, and fallback leverage.
//
// @details
// default_leverage applies to entry orders that carry no leverage of their
// own (leverage == 1) when it is greater than 1. It is still subject to the
// RiskManager's max_leverage: the Runner resolves the effective leverage
// onto each entry before risk validation.
//
// Brokerage, slippage, tax, and interest are not modelled: cash moves by
// the leverage-adjusted notional on entry and by raw proceeds on exit.
// -----------------------------------------------------------------------------
struct PortfolioSettings {
  double initial_capital{10000.0};
  bool enable_shorts{false};
  double default_leverage{1.0};
};

}  // namespace domain
}  // namespace backtest
