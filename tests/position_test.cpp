// =============================================================================
// position_test.cpp
// =============================================================================
// Unit tests for backtest::domain::Position.
//
// Validates:
//   - open(): rejects non-entry and non-positive orders
//   - Volume-weighted average open price across entries
//   - Realized PnL sign convention for Long and Short under leverage
//   - Open → PartiallyOpen → Closed transitions
//   - Trailing-stop anchor monotonicity (Long up only, Short down only)
//   - Drawdown, ROI and duration
//   - Rejections leave the position untouched
// =============================================================================

#include "backtest/domain/errors.hpp"
#include "backtest/domain/position.hpp"

#include <gtest/gtest.h>

#include <functional>
#include <string>
#include <vector>

using backtest::BacktestError;
using backtest::ErrorCode;
using backtest::domain::Order;
using backtest::domain::OrderType;
using backtest::domain::Position;
using backtest::domain::PositionStatus;
using backtest::domain::Side;

namespace {

Order filled(const std::string& instrument, Side side, OrderType type,
             int quantity, double price, double leverage = 1.0,
             std::int64_t ms = 1000) {
  Order order =
      backtest::domain::makeOrder(instrument, side, type, quantity, leverage);
  order.fill(price, backtest::ms_to_timestamp(ms));
  return order;
}

ErrorCode codeOf(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const BacktestError& e) {
    return e.code();
  }
  ADD_FAILURE() << "expected BacktestError";
  return ErrorCode::ConfigError;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. open() copies the entry and seeds the price markers.
// -----------------------------------------------------------------------------
TEST(PositionTest, OpenFromEntry) {
  const auto t0 = backtest::ms_to_timestamp(5000);
  Position pos = Position::open(
      7, filled("AAPL", Side::Long, OrderType::Entry, 10, 100.0, 2.0), t0);

  EXPECT_EQ(pos.id(), 7u);
  EXPECT_EQ(pos.instrument(), "AAPL");
  EXPECT_EQ(pos.side(), Side::Long);
  EXPECT_EQ(pos.quantity(), 10);
  EXPECT_DOUBLE_EQ(pos.openPrice(), 100.0);
  EXPECT_DOUBLE_EQ(pos.leverage(), 2.0);
  EXPECT_EQ(pos.status(), PositionStatus::Open);
  EXPECT_EQ(pos.openTime(), t0);
  EXPECT_DOUBLE_EQ(pos.highestPrice(), 100.0);
  EXPECT_DOUBLE_EQ(pos.lowestPrice(), 100.0);
  EXPECT_DOUBLE_EQ(pos.trailingStopHigh(), 100.0);
  ASSERT_EQ(pos.orders().size(), 1u);
  EXPECT_TRUE(pos.isOpen());
}

TEST(PositionTest, OpenRejectsExitAndEmptyOrders) {
  EXPECT_EQ(codeOf([] {
              Position::open(1,
                             filled("AAPL", Side::Long, OrderType::Exit, 1,
                                    100.0),
                             {});
            }),
            ErrorCode::InvalidOrderType);
  EXPECT_EQ(codeOf([] {
              Position::open(1,
                             filled("AAPL", Side::Long, OrderType::Entry, 0,
                                    100.0),
                             {});
            }),
            ErrorCode::InvalidOrder);
}

// -----------------------------------------------------------------------------
// 2. VWAP: open price is the quantity-weighted mean of all entries.
// -----------------------------------------------------------------------------
TEST(PositionTest, EntriesAverageOpenPrice) {
  Position pos = Position::open(
      1, filled("AAPL", Side::Long, OrderType::Entry, 10, 100.0), {});
  pos.addOrder(filled("AAPL", Side::Long, OrderType::Entry, 30, 120.0), {});
  pos.addOrder(filled("AAPL", Side::Long, OrderType::Entry, 10, 90.0), {});

  const double expected = (10 * 100.0 + 30 * 120.0 + 10 * 90.0) / 50.0;
  EXPECT_EQ(pos.quantity(), 50);
  EXPECT_DOUBLE_EQ(pos.openPrice(), expected);
  EXPECT_EQ(pos.orders().size(), 3u);
}

// -----------------------------------------------------------------------------
// 3. PnL sign convention.
// -----------------------------------------------------------------------------
TEST(PositionTest, LongLeveragedExitRealizesPnl) {
  Position pos = Position::open(
      1, filled("AAPL", Side::Long, OrderType::Entry, 10, 100.0, 2.0), {});
  pos.addOrder(filled("AAPL", Side::Short, OrderType::Exit, 10, 110.0, 2.0),
               {});

  EXPECT_DOUBLE_EQ(pos.realizedPnl(), 200.0);
  EXPECT_EQ(pos.status(), PositionStatus::Closed);
}

TEST(PositionTest, ShortExitRealizesPnl) {
  Position pos = Position::open(
      1, filled("AAPL", Side::Short, OrderType::Entry, 10, 100.0), {});
  pos.addOrder(filled("AAPL", Side::Long, OrderType::Exit, 10, 90.0), {});

  EXPECT_DOUBLE_EQ(pos.realizedPnl(), 100.0);
}

TEST(PositionTest, UpdatePriceMarksUnrealizedPnl) {
  Position lng = Position::open(
      1, filled("AAPL", Side::Long, OrderType::Entry, 10, 100.0), {});
  lng.updatePrice(120.0);
  EXPECT_DOUBLE_EQ(lng.unrealizedPnl(), 200.0);

  Position sht = Position::open(
      2, filled("AAPL", Side::Short, OrderType::Entry, 10, 100.0, 3.0), {});
  sht.updatePrice(105.0);
  EXPECT_DOUBLE_EQ(sht.unrealizedPnl(), -150.0);
}

// -----------------------------------------------------------------------------
// 4. Status transitions.
// -----------------------------------------------------------------------------
TEST(PositionTest, PartialThenFullExit) {
  const auto t_close = backtest::ms_to_timestamp(9000);
  Position pos = Position::open(
      1, filled("AAPL", Side::Long, OrderType::Entry, 10, 100.0), {});

  pos.addOrder(filled("AAPL", Side::Short, OrderType::Exit, 4, 110.0), {});
  EXPECT_EQ(pos.status(), PositionStatus::PartiallyOpen);
  EXPECT_EQ(pos.quantity(), 6);
  EXPECT_DOUBLE_EQ(pos.realizedPnl(), 40.0);
  EXPECT_DOUBLE_EQ(pos.unrealizedPnl(), 60.0);
  EXPECT_TRUE(pos.isOpen());

  pos.addOrder(filled("AAPL", Side::Short, OrderType::Exit, 6, 105.0),
               t_close);
  EXPECT_EQ(pos.status(), PositionStatus::Closed);
  EXPECT_EQ(pos.quantity(), 0);
  EXPECT_DOUBLE_EQ(pos.realizedPnl(), 70.0);
  EXPECT_DOUBLE_EQ(pos.unrealizedPnl(), 0.0);
  EXPECT_DOUBLE_EQ(pos.closePrice(), 105.0);
  EXPECT_EQ(pos.closeTime(), t_close);
  EXPECT_FALSE(pos.isOpen());
}

// -----------------------------------------------------------------------------
// 5. Rejected orders leave the position unchanged.
// -----------------------------------------------------------------------------
TEST(PositionTest, OversizedExitIsRejectedWithoutMutation) {
  Position pos = Position::open(
      1, filled("AAPL", Side::Long, OrderType::Entry, 5, 100.0), {});

  EXPECT_EQ(codeOf([&] {
              pos.addOrder(
                  filled("AAPL", Side::Short, OrderType::Exit, 6, 110.0), {});
            }),
            ErrorCode::QuantityExceedsPosition);
  EXPECT_EQ(pos.quantity(), 5);
  EXPECT_DOUBLE_EQ(pos.realizedPnl(), 0.0);
  EXPECT_EQ(pos.orders().size(), 1u);
}

TEST(PositionTest, InstrumentMismatchIsRejected) {
  Position pos = Position::open(
      1, filled("AAPL", Side::Long, OrderType::Entry, 5, 100.0), {});

  EXPECT_EQ(codeOf([&] {
              pos.addOrder(
                  filled("MSFT", Side::Long, OrderType::Entry, 1, 100.0), {});
            }),
            ErrorCode::InvalidOrder);
  EXPECT_EQ(pos.quantity(), 5);
}

// -----------------------------------------------------------------------------
// 6. Trailing anchor ratchets in the favourable direction only.
// -----------------------------------------------------------------------------
TEST(PositionTest, TrailingAnchorIsMonotonic) {
  const std::vector<double> path{101.0, 99.0, 107.0, 104.0, 92.0, 108.0};

  Position lng = Position::open(
      1, filled("AAPL", Side::Long, OrderType::Entry, 1, 100.0), {});
  Position sht = Position::open(
      2, filled("AAPL", Side::Short, OrderType::Entry, 1, 100.0), {});

  double prev_long = lng.trailingStopHigh();
  double prev_short = sht.trailingStopHigh();
  for (double price : path) {
    lng.updatePrice(price);
    sht.updatePrice(price);
    EXPECT_GE(lng.trailingStopHigh(), prev_long);
    EXPECT_LE(sht.trailingStopHigh(), prev_short);
    prev_long = lng.trailingStopHigh();
    prev_short = sht.trailingStopHigh();
  }

  EXPECT_DOUBLE_EQ(lng.trailingStopHigh(), 108.0);
  EXPECT_DOUBLE_EQ(sht.trailingStopHigh(), 92.0);
}

// -----------------------------------------------------------------------------
// 7. Drawdown, ROI and duration.
// -----------------------------------------------------------------------------
TEST(PositionTest, MaxDrawdownKeepsWorstDecline) {
  Position pos = Position::open(
      1, filled("AAPL", Side::Long, OrderType::Entry, 1, 100.0), {});
  pos.updatePrice(120.0);
  pos.updatePrice(90.0);   // 25% off the 120 high
  pos.updatePrice(115.0);

  EXPECT_DOUBLE_EQ(pos.maxDrawdown(), 0.25);
  EXPECT_DOUBLE_EQ(pos.highestPrice(), 120.0);
  EXPECT_DOUBLE_EQ(pos.lowestPrice(), 90.0);
}

TEST(PositionTest, RoiAndDuration) {
  Position pos = Position::open(
      1, filled("AAPL", Side::Long, OrderType::Entry, 10, 100.0),
      backtest::ms_to_timestamp(1000));
  pos.updatePrice(110.0);

  EXPECT_DOUBLE_EQ(pos.roi(), 0.1);
  EXPECT_EQ(pos.duration(backtest::ms_to_timestamp(61000)).count(), 60000);
  EXPECT_DOUBLE_EQ(pos.value(110.0), 1100.0);

  pos.addOrder(filled("AAPL", Side::Short, OrderType::Exit, 10, 110.0),
               backtest::ms_to_timestamp(31000));
  EXPECT_DOUBLE_EQ(pos.roi(), 0.0);
  EXPECT_EQ(pos.duration(backtest::ms_to_timestamp(99000)).count(), 30000);
}
