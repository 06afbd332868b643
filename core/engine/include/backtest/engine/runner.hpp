#pragma once

#include "backtest/common/id_generator.hpp"
#include "backtest/data/candle_table.hpp"
#include "backtest/domain/results.hpp"
#include "backtest/indicators/indicator.hpp"
#include "backtest/portfolio/i_portfolio_manager.hpp"
#include "backtest/risk/i_risk_manager.hpp"
#include "backtest/strategy/i_strategy.hpp"
#include "backtest/time/simulation_time_provider.hpp"

#include <memory>
#include <vector>

namespace backtest {

// Indicators to pre-compute over the whole table before the first tick.
using IndicatorConfig = std::vector<IndicatorPtr>;

// -----------------------------------------------------------------------------
// Runner
// -----------------------------------------------------------------------------
//
// @brief  Deterministic tick scheduler binding strategy, portfolio, risk
//         manager and candle data.
//
// @details
// Provides a single blocking run() so that main() and tests can drive a
// backtest without wiring the per-tick pipeline themselves.
//
// Per tick, in this order:
//   1. Advance the simulation clock to the tick's timestamp.
//   2. Build {instrument → close} and call Portfolio.updatePositions.
//   3. RiskManager.checkPositionExits; each exit goes through the order
//      pipeline below.
//   4. Strategy.onTick; each returned order goes through the pipeline.
//   5. Refresh stop-loss / take-profit levels on open positions.
//   6. Append one AccountValue snapshot of the post-tick state.
//
// Order pipeline (prepare → validate → commit → notify):
//   prepare   id 0 → next id; entries carry the portfolio's effective
//             leverage; unfilled → filled at the tick's close for its
//             instrument at the simulation time (InvalidOrder if the
//             instrument has no candle this tick).
//   validate  RiskManager.validateOrder.
//   commit    Portfolio.processOrder.
//   notify    Strategy.onOrderFilled, then onPositionOpened when the commit
//             created a position or onPositionClosed when it closed one.
//
// Failure model:
//   Any BacktestError in a tick aborts the run. run() rethrows it with the
//   same ErrorCode and the message prefixed by "tick <ms>ms: ". Ticks
//   already processed keep their snapshots, but an aborted run must be
//   treated as inconclusive. Missing components fail before the first tick
//   with MissingComponent ("initialization failed: ...").
//
// Thread model:
//   Single-threaded. run() is the only writer of the portfolio for its
//   whole duration.
//
// Ownership:
//   Runner
//    ├── strategy_      (unique_ptr<IStrategy>)
//    ├── portfolio_     (unique_ptr<IPortfolioManager>)
//    ├── risk_manager_  (unique_ptr<IRiskManager>)
//    ├── data_          (unique_ptr<CandleTable>)
//    ├── own_clock_     (SimulationTimeProvider - used unless withClock)
//    └── clock_         (SimulationTimeProvider* - non-owning)
// -----------------------------------------------------------------------------
class Runner {
 public:
  explicit Runner(std::unique_ptr<IStrategy> strategy);

  // Holds a pointer to its own clock member.
  Runner(const Runner&) = delete;
  Runner& operator=(const Runner&) = delete;
  Runner(Runner&&) = delete;
  Runner& operator=(Runner&&) = delete;

  Runner& withPortfolio(std::unique_ptr<IPortfolioManager> portfolio);
  Runner& withRiskManager(std::unique_ptr<IRiskManager> risk_manager);
  Runner& withData(CandleTable data);
  Runner& withIndicators(IndicatorConfig indicators);

  // Use an external clock (must outlive the Runner). nullptr restores the
  // internal one.
  Runner& withClock(SimulationTimeProvider* clock);

  // Logs every committed order.
  Runner& setVerbose(bool verbose);

  // -------------------------------------------------------------------------
  // run()
  // -------------------------------------------------------------------------
  //
  // @brief  Walks every row of the candle table in timestamp order.
  //
  // @throws BacktestError(MissingComponent) if strategy, portfolio, risk
  //         manager or data is unset.
  // @throws BacktestError with the failing tick's code and timestamp
  //         prefix on the first error inside a tick.
  // -------------------------------------------------------------------------
  void run();

  const std::vector<domain::AccountValue>& equityCurve() const {
    return equity_curve_;
  }

  // Timestamp of the last tick processed (epoch if none).
  Timestamp currentTime() const { return current_time_; }

  // -------------------------------------------------------------------------
  // results()
  // -------------------------------------------------------------------------
  // @brief  Summary of the equity curve and the closed positions.
  //
  // @details
  // max_drawdown is the largest peak-to-trough decline of total_value as a
  // fraction of the peak. returns = (final - initial) / initial. A closed
  // position counts as winning when its realized PnL is > 0 and as losing
  // when it is < 0.
  // -------------------------------------------------------------------------
  domain::Results results() const;

  // nullptr until the matching with*() call.
  const IPortfolioManager* portfolio() const { return portfolio_.get(); }
  const IStrategy* strategy() const { return strategy_.get(); }
  const CandleTable* data() const { return data_.get(); }

 private:
  void preflight() const;
  void processTick(const CandleRow& row);
  void executeOrder(domain::Order order, const PriceMap& prices);
  void prepareOrder(domain::Order& order, const PriceMap& prices);
  void refreshRiskLevels(const PriceMap& prices);
  void recordSnapshot(Timestamp time);

  std::unique_ptr<IStrategy> strategy_;
  std::unique_ptr<IPortfolioManager> portfolio_;
  std::unique_ptr<IRiskManager> risk_manager_;
  std::unique_ptr<CandleTable> data_;
  IndicatorConfig indicators_;

  SimulationTimeProvider own_clock_;
  SimulationTimeProvider* clock_{&own_clock_};

  IdGenerator order_ids_;
  bool verbose_{false};

  double initial_capital_{0.0};
  Timestamp current_time_{};
  std::vector<domain::AccountValue> equity_curve_;
};

}  // namespace backtest
