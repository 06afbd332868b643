// =============================================================================
// risk_manager_test.cpp
// =============================================================================
// Unit tests for backtest::RiskManager.
//
// Validates:
//   - Leverage cap and allocation cap (entries only), zero = disabled
//   - Stop-loss, take-profit and trailing-stop exits for Long and Short
//   - Exactly one full-size exit per triggered position, none after close
//   - positionRisk() price levels and reward/risk ratio
// =============================================================================

#include "backtest/domain/errors.hpp"
#include "backtest/portfolio/portfolio.hpp"
#include "backtest/risk/risk_manager.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

using backtest::BacktestError;
using backtest::ErrorCode;
using backtest::Portfolio;
using backtest::RiskManager;
using backtest::domain::Order;
using backtest::domain::OrderType;
using backtest::domain::PortfolioSettings;
using backtest::domain::RiskSettings;
using backtest::domain::Side;

namespace {

Order filled(const std::string& instrument, Side side, OrderType type,
             int quantity, double price, double leverage = 1.0) {
  Order order =
      backtest::domain::makeOrder(instrument, side, type, quantity, leverage);
  order.fill(price, backtest::ms_to_timestamp(1000));
  return order;
}

}  // namespace

class RiskManagerTest : public ::testing::Test {
 protected:
  RiskManagerTest() {
    PortfolioSettings ps;
    ps.enable_shorts = true;
    portfolio = std::make_unique<Portfolio>(ps);
  }

  std::unique_ptr<Portfolio> portfolio;
  RiskSettings settings;
};

// -----------------------------------------------------------------------------
// 1. Order validation.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, NoLimitsAcceptEverything) {
  RiskManager risk(settings);
  EXPECT_NO_THROW(risk.validateOrder(
      *portfolio, filled("AAPL", Side::Long, OrderType::Entry, 1000, 100, 50)));
}

TEST_F(RiskManagerTest, LeverageCap) {
  settings.max_leverage = 3.0;
  RiskManager risk(settings);

  EXPECT_NO_THROW(risk.validateOrder(
      *portfolio, filled("AAPL", Side::Long, OrderType::Entry, 1, 100, 3.0)));
  try {
    risk.validateOrder(
        *portfolio, filled("AAPL", Side::Long, OrderType::Entry, 1, 100, 4.0));
    FAIL() << "leverage above the cap was accepted";
  } catch (const BacktestError& e) {
    EXPECT_EQ(e.code(), ErrorCode::RiskValidationFailed);
    EXPECT_NE(std::string(e.what()).find("AAPL"), std::string::npos);
  }
}

TEST_F(RiskManagerTest, LeverageCapIgnoresExits) {
  settings.max_leverage = 2.0;
  RiskManager risk(settings);

  // Closing a 3x position must never be blocked by the entry cap.
  EXPECT_NO_THROW(risk.validateOrder(
      *portfolio, filled("AAPL", Side::Short, OrderType::Exit, 10, 94, 3.0)));
}

TEST_F(RiskManagerTest, AllocationCapAppliesToEntriesOnly) {
  settings.max_position_allocation_rate = 0.2;  // 2000 of 10000
  RiskManager risk(settings);

  EXPECT_NO_THROW(risk.validateOrder(
      *portfolio, filled("AAPL", Side::Long, OrderType::Entry, 19, 100)));
  EXPECT_THROW(risk.validateOrder(*portfolio, filled("AAPL", Side::Long,
                                                     OrderType::Entry, 21, 100)),
               BacktestError);

  // Exits reduce exposure and are never capped.
  EXPECT_NO_THROW(risk.validateOrder(
      *portfolio, filled("AAPL", Side::Short, OrderType::Exit, 500, 100)));
}

// -----------------------------------------------------------------------------
// 2. Stop-loss: 5% on a Long opened at 100, price 94.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, StopLossProducesSingleExitThenNothing) {
  settings.use_stop_loss = true;
  settings.stop_loss_rate = 0.05;
  RiskManager risk(settings);

  portfolio->processOrder(
      filled("AAPL", Side::Long, OrderType::Entry, 10, 100));
  portfolio->updatePositions({{"AAPL", 94.0}});

  auto exits = risk.checkPositionExits(*portfolio, {{"AAPL", 94.0}});
  ASSERT_EQ(exits.size(), 1u);
  EXPECT_EQ(exits[0].instrument, "AAPL");
  EXPECT_EQ(exits[0].type, OrderType::Exit);
  EXPECT_EQ(exits[0].side, Side::Short);
  EXPECT_EQ(exits[0].quantity, 10);
  EXPECT_DOUBLE_EQ(exits[0].price, 94.0);

  portfolio->processOrder(exits[0]);
  EXPECT_TRUE(portfolio->positions().empty());

  EXPECT_TRUE(risk.checkPositionExits(*portfolio, {{"AAPL", 94.0}}).empty());
}

TEST_F(RiskManagerTest, StopLossNotHitAboveLevel) {
  settings.use_stop_loss = true;
  settings.stop_loss_rate = 0.05;
  RiskManager risk(settings);

  portfolio->processOrder(
      filled("AAPL", Side::Long, OrderType::Entry, 10, 100));
  EXPECT_TRUE(risk.checkPositionExits(*portfolio, {{"AAPL", 95.5}}).empty());
  // Positions without a price this tick are skipped.
  EXPECT_TRUE(risk.checkPositionExits(*portfolio, {{"MSFT", 1.0}}).empty());
}

TEST_F(RiskManagerTest, ShortStopAndTarget) {
  settings.use_stop_loss = true;
  settings.stop_loss_rate = 0.05;
  settings.use_take_profit = true;
  settings.take_profit_rate = 0.10;
  RiskManager risk(settings);

  portfolio->processOrder(filled("ES", Side::Short, OrderType::Entry, 2, 100));

  auto stop = risk.checkPositionExits(*portfolio, {{"ES", 106.0}});
  ASSERT_EQ(stop.size(), 1u);
  EXPECT_EQ(stop[0].side, Side::Long);

  auto target = risk.checkPositionExits(*portfolio, {{"ES", 89.0}});
  ASSERT_EQ(target.size(), 1u);
  EXPECT_EQ(target[0].quantity, 2);

  EXPECT_TRUE(risk.checkPositionExits(*portfolio, {{"ES", 97.0}}).empty());
}

// -----------------------------------------------------------------------------
// 3. Trailing stop follows the best price seen.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, TrailingStopFollowsHigh) {
  settings.use_trailing_stop = true;
  settings.trailing_stop_rate = 0.10;
  RiskManager risk(settings);

  portfolio->processOrder(
      filled("AAPL", Side::Long, OrderType::Entry, 1, 100));

  portfolio->updatePositions({{"AAPL", 150.0}});
  portfolio->updatePositions({{"AAPL", 140.0}});
  EXPECT_TRUE(risk.checkPositionExits(*portfolio, {{"AAPL", 140.0}}).empty());

  // More than 10% below the 150 high.
  portfolio->updatePositions({{"AAPL", 134.0}});
  EXPECT_EQ(risk.checkPositionExits(*portfolio, {{"AAPL", 134.0}}).size(), 1u);
}

TEST_F(RiskManagerTest, ExitsFollowInstrumentOrder) {
  settings.use_stop_loss = true;
  settings.stop_loss_rate = 0.01;
  RiskManager risk(settings);

  portfolio->processOrder(filled("MSFT", Side::Long, OrderType::Entry, 1, 100));
  portfolio->processOrder(filled("AAPL", Side::Long, OrderType::Entry, 1, 100));

  auto exits =
      risk.checkPositionExits(*portfolio, {{"AAPL", 50.0}, {"MSFT", 50.0}});
  ASSERT_EQ(exits.size(), 2u);
  EXPECT_EQ(exits[0].instrument, "AAPL");
  EXPECT_EQ(exits[1].instrument, "MSFT");
}

// -----------------------------------------------------------------------------
// 4. positionRisk().
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, PositionRiskLevels) {
  settings.use_stop_loss = true;
  settings.stop_loss_rate = 0.05;
  settings.use_take_profit = true;
  settings.take_profit_rate = 0.10;
  settings.trailing_stop_rate = 0.02;
  RiskManager risk(settings);

  portfolio->processOrder(
      filled("AAPL", Side::Long, OrderType::Entry, 10, 100, 2.0));
  const auto& pos = portfolio->positions().at("AAPL");

  const auto levels = risk.positionRisk(pos, 100.0);
  EXPECT_DOUBLE_EQ(levels.stop_loss_price, 95.0);
  EXPECT_NEAR(levels.take_profit_price, 110.0, 1e-9);
  EXPECT_DOUBLE_EQ(levels.trailing_stop_price, 98.0);
  EXPECT_DOUBLE_EQ(levels.max_loss, 10 * 5.0 * 2.0);
  EXPECT_NEAR(levels.risk_reward_ratio, 2.0, 1e-9);
}

TEST_F(RiskManagerTest, RiskRewardZeroWithoutBothLevels) {
  settings.use_stop_loss = true;
  settings.stop_loss_rate = 0.05;
  RiskManager risk(settings);

  portfolio->processOrder(
      filled("AAPL", Side::Long, OrderType::Entry, 1, 100));
  EXPECT_DOUBLE_EQ(
      risk.positionRisk(portfolio->positions().at("AAPL"), 100.0)
          .risk_reward_ratio,
      0.0);
}
