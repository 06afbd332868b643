#pragma once

namespace backtest {
namespace domain {

// -----------------------------------------------------------------------------
// RiskSettings - position-level risk limits and exit rules
// -----------------------------------------------------------------------------
//
// @brief  Immutable configuration consumed by RiskManager on every call.
//
// @details
// All rates are positive decimals relative to the position's open price
// (e.g. 0.05 = 5%). Pre-trade limits use 0 to mean "not enforced":
//
//   max_leverage                  0 → any leverage accepted
//   max_position_allocation_rate  0 → no cap on entry notional
//
// Exit rules are evaluated in the order stop-loss → take-profit →
// trailing-stop and the first one that triggers produces the exit.
//
// Loaded from the "risk" object of the run configuration (see
// config_loader.hpp) or constructed directly in tests. Copied by value
// into RiskManager; no state is carried between calls.
// -----------------------------------------------------------------------------
struct RiskSettings {
  /// Maximum leverage accepted on any order. 0 disables the check.
  double max_leverage{0.0};

  /// Maximum entry notional as a fraction of portfolio value. 0 disables.
  double max_position_allocation_rate{0.0};

  bool use_stop_loss{false};
  double stop_loss_rate{0.0};

  bool use_take_profit{false};
  double take_profit_rate{0.0};

  bool use_trailing_stop{false};
  double trailing_stop_rate{0.0};
};

}  // namespace domain
}  // namespace backtest
