#include "backtest/domain/errors.hpp"

namespace backtest {

const char* toString(ErrorCode code) {
  switch (code) {
    case ErrorCode::InvalidOrder:
      return "InvalidOrder";
    case ErrorCode::InvalidOrderType:
      return "InvalidOrderType";
    case ErrorCode::InsufficientCash:
      return "InsufficientCash";
    case ErrorCode::ShortsDisabled:
      return "ShortsDisabled";
    case ErrorCode::ExitExceedsSize:
      return "ExitExceedsSize";
    case ErrorCode::QuantityExceedsPosition:
      return "QuantityExceedsPosition";
    case ErrorCode::NoOpenPosition:
      return "NoOpenPosition";
    case ErrorCode::NoPositionFound:
      return "NoPositionFound";
    case ErrorCode::RiskValidationFailed:
      return "RiskValidationFailed";
    case ErrorCode::MissingComponent:
      return "MissingComponent";
    case ErrorCode::DataError:
      return "DataError";
    case ErrorCode::ConfigError:
      return "ConfigError";
  }
  return "Unknown";
}

}  // namespace backtest
