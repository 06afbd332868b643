#include "backtest/domain/candle.hpp"
#include "backtest/domain/errors.hpp"

namespace backtest {
namespace domain {

std::optional<double> Candle::indicator(const std::string& name) const {
  auto it = indicators.find(name);
  if (it == indicators.end()) {
    throw BacktestError(ErrorCode::DataError,
                        "indicator " + name + " not found");
  }
  return it->second;
}

}  // namespace domain
}  // namespace backtest
