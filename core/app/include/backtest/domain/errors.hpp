#pragma once

#include <stdexcept>
#include <string>

namespace backtest {

// -----------------------------------------------------------------------------
// ErrorCode - taxonomy of every failure the engine can report
// -----------------------------------------------------------------------------
//
// @brief  Classifies a BacktestError so callers (and tests) can branch on the
//         kind of failure without parsing message text.
//
// @details
// Order and accounting failures:
//   InvalidOrder            bad quantity, instrument, or unfilled price
//   InvalidOrderType        a Position was built from a non-Entry order
//   InsufficientCash        leverage-adjusted notional exceeds cash
//   ShortsDisabled          Short entry while shorting is not enabled
//   ExitExceedsSize         exit quantity above the open quantity (Portfolio)
//   QuantityExceedsPosition exit quantity above the open quantity (Position)
//   NoOpenPosition          exit for an instrument with no open position
//   NoPositionFound         lookup or exit handling found no position
//
// Risk and orchestration failures:
//   RiskValidationFailed    leverage or allocation limit breached
//   MissingComponent        Runner preflight found an unset collaborator
//
// Collaborator failures:
//   DataError               candle storage or indicator application failed
//   ConfigError             configuration document is missing or malformed
// -----------------------------------------------------------------------------
enum class ErrorCode {
  InvalidOrder,
  InvalidOrderType,
  InsufficientCash,
  ShortsDisabled,
  ExitExceedsSize,
  QuantityExceedsPosition,
  NoOpenPosition,
  NoPositionFound,
  RiskValidationFailed,
  MissingComponent,
  DataError,
  ConfigError,
};

// Stable, human-readable name for an ErrorCode (e.g. "InsufficientCash").
const char* toString(ErrorCode code);

// -----------------------------------------------------------------------------
// BacktestError
// -----------------------------------------------------------------------------
//
// @brief  The single exception type thrown by the engine.
//
// @details
// Every throwing operation in Position, Portfolio, RiskManager and Runner
// throws before mutating any state, so a caught BacktestError means the
// rejected order was not applied at all.
//
// The Runner re-throws errors raised during a tick as a new BacktestError
// with the same code and the tick timestamp prefixed to the message.
// -----------------------------------------------------------------------------
class BacktestError : public std::runtime_error {
 public:
  BacktestError(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

}  // namespace backtest
