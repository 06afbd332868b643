#include "backtest/data/candle_json.hpp"
#include "backtest/domain/errors.hpp"
#include "backtest/time/time_utils.hpp"

namespace backtest {

CandleRecord candleFromJson(const nlohmann::json& json) {
  CandleRecord record;
  record.timestamp_ms = json.at("timestamp_ms").get<std::int64_t>();
  record.symbol = json.at("symbol").get<std::string>();

  domain::Candle& candle = record.candle;
  candle.time = ms_to_timestamp(record.timestamp_ms);
  candle.open = json.at("open").get<double>();
  candle.high = json.at("high").get<double>();
  candle.low = json.at("low").get<double>();
  candle.close = json.at("close").get<double>();
  candle.volume = json.value("volume", std::int64_t{0});

  if (record.symbol.empty()) {
    throw BacktestError(ErrorCode::DataError,
                        "candle at " + std::to_string(record.timestamp_ms) +
                            "ms has an empty symbol");
  }
  if (candle.close <= 0.0) {
    throw BacktestError(ErrorCode::DataError,
                        "candle " + record.symbol + " at " +
                            std::to_string(record.timestamp_ms) +
                            "ms has non-positive close");
  }
  return record;
}

}  // namespace backtest
