#pragma once

#include "backtest/time/time_utils.hpp"

namespace backtest {
namespace domain {

// -----------------------------------------------------------------------------
// AccountValue - one equity-curve snapshot
// -----------------------------------------------------------------------------
// Appended by the Runner after every tick using the post-tick portfolio
// state. Never mutated after creation.
// -----------------------------------------------------------------------------
struct AccountValue {
  Timestamp time{};
  double total_value{0.0};     // Portfolio value(): cash + unrealized PnL
  double cash{0.0};
  int open_positions{0};
  double unrealized_pnl{0.0};
};

// -----------------------------------------------------------------------------
// Results - run summary derived from the equity curve
// -----------------------------------------------------------------------------
// max_drawdown is the largest peak-to-trough fraction of total_value along
// the curve; returns is final / initial - 1.
// -----------------------------------------------------------------------------
struct Results {
  Timestamp start_time{};
  Timestamp end_time{};
  double initial_capital{0.0};
  double final_capital{0.0};
  int total_trades{0};
  int winning_trades{0};
  int losing_trades{0};
  double max_drawdown{0.0};
  double returns{0.0};
};

}  // namespace domain
}  // namespace backtest
