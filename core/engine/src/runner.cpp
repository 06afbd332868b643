#include "backtest/engine/runner.hpp"
#include "backtest/domain/errors.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>

namespace backtest {

// -----------------------------------------------------------------------------
// Constructor / builder
// -----------------------------------------------------------------------------
Runner::Runner(std::unique_ptr<IStrategy> strategy)
    : strategy_(std::move(strategy)) {}

Runner& Runner::withPortfolio(std::unique_ptr<IPortfolioManager> portfolio) {
  portfolio_ = std::move(portfolio);
  return *this;
}

Runner& Runner::withRiskManager(std::unique_ptr<IRiskManager> risk_manager) {
  risk_manager_ = std::move(risk_manager);
  return *this;
}

Runner& Runner::withData(CandleTable data) {
  data_ = std::make_unique<CandleTable>(std::move(data));
  return *this;
}

Runner& Runner::withIndicators(IndicatorConfig indicators) {
  indicators_ = std::move(indicators);
  return *this;
}

Runner& Runner::withClock(SimulationTimeProvider* clock) {
  clock_ = clock != nullptr ? clock : &own_clock_;
  return *this;
}

Runner& Runner::setVerbose(bool verbose) {
  verbose_ = verbose;
  return *this;
}

// -----------------------------------------------------------------------------
// preflight(): initialization guard, checked once before the loop
// -----------------------------------------------------------------------------
void Runner::preflight() const {
  const char* missing = nullptr;
  if (!strategy_) {
    missing = "strategy";
  } else if (!portfolio_) {
    missing = "portfolio";
  } else if (!risk_manager_) {
    missing = "risk manager";
  } else if (!data_) {
    missing = "data";
  }

  if (missing != nullptr) {
    throw BacktestError(ErrorCode::MissingComponent,
                        std::string("initialization failed: ") + missing +
                            " is not set");
  }
}

// -----------------------------------------------------------------------------
// run(): the tick loop
// -----------------------------------------------------------------------------
void Runner::run() {
  preflight();

  if (!indicators_.empty()) {
    try {
      data_->applyIndicators(indicators_);
    } catch (const BacktestError& e) {
      std::cerr << "[Runner] Indicator pre-pass failed: " << e.what() << "\n";
      throw BacktestError(e.code(),
                          std::string("initialization failed: ") + e.what());
    }
  }

  strategy_->setPortfolio(portfolio_.get());
  initial_capital_ = portfolio_->value();
  equity_curve_.clear();

  const std::vector<CandleRow> rows = data_->rows();
  equity_curve_.reserve(rows.size());
  std::cout << "[Runner] Starting backtest over " << rows.size()
            << " ticks\n";

  for (const CandleRow& row : rows) {
    try {
      processTick(row);
    } catch (const BacktestError& e) {
      const std::string message =
          "tick " + format_timestamp(row.time) + ": " + e.what();
      std::cerr << "[Runner] Backtest aborted at " << message << "\n";
      throw BacktestError(e.code(), message);
    }
  }

  std::cout << "[Runner] Backtest complete, final value "
            << portfolio_->value() << "\n";
}

// -----------------------------------------------------------------------------
// processTick(): marks → risk exits → strategy orders → snapshot
// -----------------------------------------------------------------------------
void Runner::processTick(const CandleRow& row) {
  // --- Step 1: Clock first so fills see this tick's time -------------------
  clock_->advance_time(timestamp_to_ms(row.time));
  current_time_ = row.time;

  // --- Step 2: Mark open positions ----------------------------------------
  PriceMap prices;
  for (const auto& [instrument, candle] : row.candles) {
    prices[instrument] = candle.close;
  }
  portfolio_->updatePositions(prices);

  // --- Step 3: Risk-forced exits ------------------------------------------
  for (auto& forced : risk_manager_->checkPositionExits(*portfolio_, prices)) {
    executeOrder(std::move(forced), prices);
  }

  // --- Step 4: Strategy orders --------------------------------------------
  for (auto& order : strategy_->onTick(row.time, row.candles)) {
    executeOrder(std::move(order), prices);
  }

  // --- Step 5: Publish risk levels for reporting --------------------------
  refreshRiskLevels(prices);

  // --- Step 6: Post-tick snapshot -----------------------------------------
  recordSnapshot(row.time);
}

// -----------------------------------------------------------------------------
// executeOrder(): prepare → validate → commit → notify
// -----------------------------------------------------------------------------
void Runner::executeOrder(domain::Order order, const PriceMap& prices) {
  prepareOrder(order, prices);

  risk_manager_->validateOrder(*portfolio_, order);

  const PositionMap& open = portfolio_->positions();
  const bool had_position = open.count(order.instrument) != 0;
  const std::size_t closed_before = portfolio_->closedPositions().size();

  portfolio_->processOrder(order);

  if (verbose_) {
    std::cout << "[Runner] " << format_timestamp(order.filled_at)
              << " order " << order.id << " " << domain::toString(order.type)
              << " " << domain::toString(order.side) << " "
              << order.quantity << " " << order.instrument << " @ "
              << order.price << "\n";
  }

  strategy_->onOrderFilled(order);

  auto it = open.find(order.instrument);
  if (!had_position && it != open.end()) {
    strategy_->onPositionOpened(it->second);
  } else if (portfolio_->closedPositions().size() > closed_before) {
    strategy_->onPositionClosed(portfolio_->closedPositions().back());
  }
}

void Runner::prepareOrder(domain::Order& order, const PriceMap& prices) {
  if (order.id == 0) {
    order.id = order_ids_.next_id();
  }
  // The risk leverage cap must see the leverage the portfolio will apply.
  if (order.type == domain::OrderType::Entry) {
    order.leverage = portfolio_->effectiveLeverage(order);
  }
  if (order.isFilled()) {
    return;
  }

  auto it = prices.find(order.instrument);
  if (it == prices.end()) {
    throw BacktestError(ErrorCode::InvalidOrder,
                        "no price for " + order.instrument +
                            " to fill order " + std::to_string(order.id));
  }
  order.fill(it->second, ms_to_timestamp(clock_->now_ms()));
}

// -----------------------------------------------------------------------------
// refreshRiskLevels(): copy stop / target prices onto open positions
// -----------------------------------------------------------------------------
void Runner::refreshRiskLevels(const PriceMap& prices) {
  std::vector<std::pair<std::string, PositionRisk>> levels;
  for (const auto& [instrument, pos] : portfolio_->positions()) {
    auto it = prices.find(instrument);
    if (it == prices.end()) {
      continue;
    }
    levels.emplace_back(instrument,
                        risk_manager_->positionRisk(pos, it->second));
  }

  for (const auto& [instrument, risk] : levels) {
    portfolio_->setRiskLevels(instrument, risk.stop_loss_price,
                              risk.take_profit_price);
  }
}

void Runner::recordSnapshot(Timestamp time) {
  domain::AccountValue snapshot;
  snapshot.time = time;
  snapshot.total_value = portfolio_->value();
  snapshot.cash = portfolio_->cash();

  const PositionMap& open = portfolio_->positions();
  snapshot.open_positions = static_cast<int>(open.size());
  for (const auto& entry : open) {
    snapshot.unrealized_pnl += entry.second.unrealizedPnl();
  }

  equity_curve_.push_back(snapshot);
}

// -----------------------------------------------------------------------------
// results(): summary of the equity curve and closed trades
// -----------------------------------------------------------------------------
domain::Results Runner::results() const {
  domain::Results results;
  results.initial_capital = initial_capital_;
  results.final_capital = initial_capital_;

  if (!equity_curve_.empty()) {
    results.start_time = equity_curve_.front().time;
    results.end_time = equity_curve_.back().time;
    results.final_capital = equity_curve_.back().total_value;

    double peak = equity_curve_.front().total_value;
    for (const auto& point : equity_curve_) {
      peak = std::max(peak, point.total_value);
      if (peak > 0.0) {
        results.max_drawdown =
            std::max(results.max_drawdown, (peak - point.total_value) / peak);
      }
    }
  }

  if (initial_capital_ != 0.0) {
    results.returns =
        (results.final_capital - initial_capital_) / initial_capital_;
  }

  if (portfolio_) {
    for (const auto& pos : portfolio_->closedPositions()) {
      ++results.total_trades;
      if (pos.realizedPnl() > 0.0) {
        ++results.winning_trades;
      } else if (pos.realizedPnl() < 0.0) {
        ++results.losing_trades;
      }
    }
  }
  return results;
}

}  // namespace backtest
