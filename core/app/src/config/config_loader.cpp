#include "backtest/config/config_loader.hpp"
#include "backtest/data/candle_json.hpp"
#include "backtest/domain/errors.hpp"
#include "backtest/time/time_utils.hpp"

#include <fstream>
#include <utility>

namespace backtest {

namespace {

nlohmann::json readJsonFile(const std::string& path, ErrorCode code) {
  std::ifstream in(path);
  if (!in) {
    throw BacktestError(code, "cannot open " + path);
  }
  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::exception& e) {
    throw BacktestError(code, path + ": " + e.what());
  }
}

void requireNonNegative(double value, const char* key) {
  if (value < 0.0) {
    throw BacktestError(ErrorCode::ConfigError,
                        std::string(key) + " must not be negative");
  }
}

domain::PortfolioSettings parsePortfolio(const nlohmann::json& j) {
  domain::PortfolioSettings s;
  s.initial_capital = j.value("initial_capital", s.initial_capital);
  s.enable_shorts = j.value("enable_shorts", s.enable_shorts);
  s.default_leverage = j.value("default_leverage", s.default_leverage);

  if (s.initial_capital <= 0.0) {
    throw BacktestError(ErrorCode::ConfigError,
                        "portfolio.initial_capital must be positive");
  }
  requireNonNegative(s.default_leverage, "portfolio.default_leverage");
  return s;
}

domain::RiskSettings parseRisk(const nlohmann::json& j) {
  domain::RiskSettings s;
  s.max_leverage = j.value("max_leverage", s.max_leverage);
  s.max_position_allocation_rate =
      j.value("max_position_allocation_rate", s.max_position_allocation_rate);
  s.use_stop_loss = j.value("use_stop_loss", s.use_stop_loss);
  s.stop_loss_rate = j.value("stop_loss_rate", s.stop_loss_rate);
  s.use_take_profit = j.value("use_take_profit", s.use_take_profit);
  s.take_profit_rate = j.value("take_profit_rate", s.take_profit_rate);
  s.use_trailing_stop = j.value("use_trailing_stop", s.use_trailing_stop);
  s.trailing_stop_rate = j.value("trailing_stop_rate", s.trailing_stop_rate);

  requireNonNegative(s.max_leverage, "risk.max_leverage");
  requireNonNegative(s.max_position_allocation_rate,
                     "risk.max_position_allocation_rate");
  requireNonNegative(s.stop_loss_rate, "risk.stop_loss_rate");
  requireNonNegative(s.take_profit_rate, "risk.take_profit_rate");
  requireNonNegative(s.trailing_stop_rate, "risk.trailing_stop_rate");
  return s;
}

StrategyConfig parseStrategy(const nlohmann::json& j) {
  StrategyConfig s;
  s.instrument = j.value("instrument", s.instrument);
  s.fast_period = j.value("fast_period", s.fast_period);
  s.slow_period = j.value("slow_period", s.slow_period);
  s.quantity = j.value("quantity", s.quantity);
  s.leverage = j.value("leverage", s.leverage);
  return s;
}

}  // namespace

RunConfig parseRunConfig(const nlohmann::json& json) {
  if (!json.is_object()) {
    throw BacktestError(ErrorCode::ConfigError,
                        "config root must be a JSON object");
  }

  RunConfig config;
  try {
    const nlohmann::json empty = nlohmann::json::object();
    config.portfolio = parsePortfolio(json.value("portfolio", empty));
    config.risk = parseRisk(json.value("risk", empty));
    config.strategy = parseStrategy(json.value("strategy", empty));

    const nlohmann::json data = json.value("data", empty);
    config.data_file = data.value("file", std::string{});
    config.feed_endpoint = data.value("feed_endpoint", std::string{});
  } catch (const nlohmann::json::exception& e) {
    throw BacktestError(ErrorCode::ConfigError, e.what());
  }
  return config;
}

RunConfig loadRunConfig(const std::string& path) {
  return parseRunConfig(readJsonFile(path, ErrorCode::ConfigError));
}

CandleTable candleTableFromJson(const nlohmann::json& json) {
  if (!json.is_array()) {
    throw BacktestError(ErrorCode::DataError,
                        "candle document must be a JSON array");
  }

  CandleTable table;
  std::size_t index = 0;
  for (const auto& entry : json) {
    try {
      CandleRecord record = candleFromJson(entry);
      table.addCandle(ms_to_timestamp(record.timestamp_ms), record.symbol,
                      std::move(record.candle));
    } catch (const nlohmann::json::exception& e) {
      throw BacktestError(ErrorCode::DataError,
                          "candle #" + std::to_string(index) + ": " +
                              e.what());
    } catch (const BacktestError& e) {
      throw BacktestError(e.code(),
                          "candle #" + std::to_string(index) + ": " +
                              e.what());
    }
    ++index;
  }
  return table;
}

CandleTable loadCandleFile(const std::string& path) {
  return candleTableFromJson(readJsonFile(path, ErrorCode::DataError));
}

}  // namespace backtest
