// =============================================================================
// config_loader_test.cpp
// =============================================================================
// Unit tests for JSON configuration and candle file loading.
//
// Validates:
//   - Defaults for an empty document, overrides per section
//   - Invalid values and wrong types → ConfigError
//   - Candle arrays load into a CandleTable; malformed or duplicate
//     entries → DataError naming the entry
//   - File helpers report unreadable paths
// =============================================================================

#include "backtest/config/config_loader.hpp"
#include "backtest/domain/errors.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

using backtest::BacktestError;
using backtest::ErrorCode;
using nlohmann::json;

namespace {

ErrorCode configCode(const json& doc) {
  try {
    backtest::parseRunConfig(doc);
  } catch (const BacktestError& e) {
    return e.code();
  }
  ADD_FAILURE() << "config accepted: " << doc.dump();
  return ErrorCode::InvalidOrder;
}

}  // namespace

class ConfigLoaderTest : public ::testing::Test {
 protected:
  std::string writeTemp(const std::string& name, const std::string& body) {
    const std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << body;
    paths_.push_back(path);
    return path;
  }

  void TearDown() override {
    for (const auto& p : paths_) {
      std::remove(p.c_str());
    }
  }

 private:
  std::vector<std::string> paths_;
};

// -----------------------------------------------------------------------------
// 1. Run configuration.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, EmptyDocumentKeepsDefaults) {
  const auto config = backtest::parseRunConfig(json::object());

  EXPECT_DOUBLE_EQ(config.portfolio.initial_capital, 10000.0);
  EXPECT_FALSE(config.portfolio.enable_shorts);
  EXPECT_DOUBLE_EQ(config.portfolio.default_leverage, 1.0);
  EXPECT_DOUBLE_EQ(config.risk.max_leverage, 0.0);
  EXPECT_FALSE(config.risk.use_stop_loss);
  EXPECT_TRUE(config.data_file.empty());
  EXPECT_EQ(config.strategy.fast_period, 10);
  EXPECT_EQ(config.strategy.slow_period, 30);
}

TEST_F(ConfigLoaderTest, SectionsOverrideDefaults) {
  const json doc = json::parse(R"({
    "portfolio": {"initial_capital": 50000, "enable_shorts": true,
                  "default_leverage": 2},
    "risk": {"max_leverage": 5, "use_stop_loss": true, "stop_loss_rate": 0.05,
             "use_trailing_stop": true, "trailing_stop_rate": 0.1},
    "data": {"file": "candles.json", "feed_endpoint": "tcp://127.0.0.1:6000"},
    "strategy": {"instrument": "ETHUSDT", "fast_period": 5,
                 "slow_period": 20, "quantity": 2, "leverage": 3}
  })");

  const auto config = backtest::parseRunConfig(doc);
  EXPECT_DOUBLE_EQ(config.portfolio.initial_capital, 50000.0);
  EXPECT_TRUE(config.portfolio.enable_shorts);
  EXPECT_DOUBLE_EQ(config.portfolio.default_leverage, 2.0);
  EXPECT_DOUBLE_EQ(config.risk.max_leverage, 5.0);
  EXPECT_TRUE(config.risk.use_stop_loss);
  EXPECT_DOUBLE_EQ(config.risk.stop_loss_rate, 0.05);
  EXPECT_TRUE(config.risk.use_trailing_stop);
  EXPECT_FALSE(config.risk.use_take_profit);
  EXPECT_EQ(config.data_file, "candles.json");
  EXPECT_EQ(config.feed_endpoint, "tcp://127.0.0.1:6000");
  EXPECT_EQ(config.strategy.instrument, "ETHUSDT");
  EXPECT_EQ(config.strategy.quantity, 2);
  EXPECT_DOUBLE_EQ(config.strategy.leverage, 3.0);
}

TEST_F(ConfigLoaderTest, InvalidValuesAreConfigErrors) {
  EXPECT_EQ(configCode(json::array()), ErrorCode::ConfigError);
  EXPECT_EQ(configCode({{"portfolio", {{"initial_capital", 0}}}}),
            ErrorCode::ConfigError);
  EXPECT_EQ(configCode({{"risk", {{"stop_loss_rate", -0.1}}}}),
            ErrorCode::ConfigError);
  EXPECT_EQ(configCode({{"portfolio", {{"enable_shorts", "yes"}}}}),
            ErrorCode::ConfigError);
}

TEST_F(ConfigLoaderTest, LoadRunConfigFromFile) {
  const auto path =
      writeTemp("backtest_config.json", R"({"portfolio": {"initial_capital": 123}})");
  EXPECT_DOUBLE_EQ(backtest::loadRunConfig(path).portfolio.initial_capital,
                   123.0);

  const auto broken = writeTemp("backtest_broken.json", "{ not json");
  EXPECT_THROW(backtest::loadRunConfig(broken), BacktestError);
  EXPECT_THROW(backtest::loadRunConfig("/nonexistent/backtest.json"),
               BacktestError);
}

// -----------------------------------------------------------------------------
// 2. Candle files.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, CandleArrayLoads) {
  const json doc = json::parse(R"([
    {"timestamp_ms": 2000, "symbol": "BTC", "open": 2, "high": 3, "low": 1,
     "close": 2.5, "volume": 10},
    {"timestamp_ms": 1000, "symbol": "BTC", "open": 1, "high": 2, "low": 1,
     "close": 1.5},
    {"timestamp_ms": 1000, "symbol": "ETH", "open": 1, "high": 1, "low": 1,
     "close": 1}
  ])");

  auto table = backtest::candleTableFromJson(doc);
  EXPECT_EQ(table.size(), 2u);

  const auto rows = table.rows();
  EXPECT_EQ(backtest::timestamp_to_ms(rows[0].time), 1000);
  EXPECT_EQ(rows[0].candles.size(), 2u);
  EXPECT_DOUBLE_EQ(rows[1].candles.at("BTC").close, 2.5);
  EXPECT_EQ(rows[1].candles.at("BTC").volume, 10);
  EXPECT_EQ(rows[0].candles.at("BTC").volume, 0);
}

TEST_F(ConfigLoaderTest, MalformedCandleNamesEntry) {
  const json doc = json::parse(R"([
    {"timestamp_ms": 1000, "symbol": "BTC", "open": 1, "high": 1, "low": 1,
     "close": 1},
    {"timestamp_ms": 2000, "symbol": "BTC", "open": 1}
  ])");

  try {
    backtest::candleTableFromJson(doc);
    FAIL() << "malformed candle accepted";
  } catch (const BacktestError& e) {
    EXPECT_EQ(e.code(), ErrorCode::DataError);
    EXPECT_NE(std::string(e.what()).find("#1"), std::string::npos) << e.what();
  }
}

TEST_F(ConfigLoaderTest, DuplicateCandleIsDataError) {
  const json doc = json::parse(R"([
    {"timestamp_ms": 1000, "symbol": "BTC", "open": 1, "high": 1, "low": 1,
     "close": 1},
    {"timestamp_ms": 1000, "symbol": "BTC", "open": 2, "high": 2, "low": 2,
     "close": 2}
  ])");
  EXPECT_THROW(backtest::candleTableFromJson(doc), BacktestError);
  EXPECT_THROW(backtest::candleTableFromJson(json::object()), BacktestError);
}

TEST_F(ConfigLoaderTest, LoadCandleFile) {
  const auto path = writeTemp(
      "backtest_candles.json",
      R"([{"timestamp_ms": 1000, "symbol": "BTC", "open": 1, "high": 1,
           "low": 1, "close": 1}])");
  EXPECT_EQ(backtest::loadCandleFile(path).size(), 1u);

  try {
    backtest::loadCandleFile("/nonexistent/candles.json");
    FAIL() << "missing file accepted";
  } catch (const BacktestError& e) {
    EXPECT_EQ(e.code(), ErrorCode::DataError);
  }
}
