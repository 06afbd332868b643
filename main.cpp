// -----------------------------------------------------------------------------
// backtest_runner - single executable entry point.
//
//   1) Load the run configuration (--config) or use defaults.
//   2) Load candles, either from a JSON file (--data / config data.file) or
//      from a ZeroMQ feeder (--feed / config data.feed_endpoint) through
//      the CandleFeedGateway, which blocks until the feeder sends its end
//      marker or Ctrl-C.
//   3) Build the Runner: SMA crossover strategy, Portfolio, RiskManager,
//      the strategy's indicators as the pre-pass.
//   4) Run and print the summary.
//
// Exit codes: 0 success, 1 backtest or data error, 2 usage or config error.
// -----------------------------------------------------------------------------

#include "backtest/config/config_loader.hpp"
#include "backtest/domain/errors.hpp"
#include "backtest/engine/runner.hpp"
#include "backtest/gateway/candle_feed_gateway.hpp"
#include "backtest/portfolio/portfolio.hpp"
#include "backtest/risk/risk_manager.hpp"
#include "backtest/strategy/sma_cross_strategy.hpp"
#include "backtest/time/simulation_time_provider.hpp"

#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

// Only global: lets the SIGINT handler unblock the gateway's recv loop.
static backtest::CandleFeedGateway* g_gateway_ptr = nullptr;

static void sigint_handler(int /*signum*/) {
  if (g_gateway_ptr != nullptr) {
    g_gateway_ptr->stop();
  }
}

static void printUsage(const char* argv0) {
  std::cerr << "usage: " << argv0
            << " [--config FILE] [--data CANDLES.json] [--feed ENDPOINT]"
               " [--verbose]\n";
}

static void printResults(const backtest::Runner& runner) {
  const backtest::domain::Results r = runner.results();
  std::cout << "\n=== Backtest summary ===\n"
            << "Period:          " << backtest::format_timestamp(r.start_time)
            << " .. " << backtest::format_timestamp(r.end_time) << "\n"
            << "Initial capital: " << r.initial_capital << "\n"
            << "Final capital:   " << r.final_capital << "\n"
            << "Returns:         " << r.returns * 100.0 << "%\n"
            << "Max drawdown:    " << r.max_drawdown * 100.0 << "%\n"
            << "Trades:          " << r.total_trades << " (" << r.winning_trades
            << " winning, " << r.losing_trades << " losing)\n"
            << "Ticks:           " << runner.equityCurve().size() << "\n";
}

int main(int argc, char** argv) {
  std::string config_path;
  std::string data_override;
  std::string feed_override;
  bool verbose = false;

  for (int i = 1; i < argc; ++i) {
    const bool has_value = i + 1 < argc;
    if (std::strcmp(argv[i], "--config") == 0 && has_value) {
      config_path = argv[++i];
    } else if (std::strcmp(argv[i], "--data") == 0 && has_value) {
      data_override = argv[++i];
    } else if (std::strcmp(argv[i], "--feed") == 0 && has_value) {
      feed_override = argv[++i];
    } else if (std::strcmp(argv[i], "--verbose") == 0) {
      verbose = true;
    } else {
      printUsage(argv[0]);
      return 2;
    }
  }

  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  backtest::RunConfig config;
  try {
    if (!config_path.empty()) {
      config = backtest::loadRunConfig(config_path);
    }
  } catch (const backtest::BacktestError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 2;
  }
  if (!data_override.empty()) {
    config.data_file = data_override;
  }
  if (!feed_override.empty()) {
    config.feed_endpoint = feed_override;
  }
  if (config.data_file.empty() && config.feed_endpoint.empty()) {
    std::cerr << "[main] No data source: set --data or --feed\n";
    printUsage(argv[0]);
    return 2;
  }

  backtest::SimulationTimeProvider sim_clock;

  try {
    // -----------------------------------------------------------------------
    // 2) Candles
    // -----------------------------------------------------------------------
    backtest::CandleTable candles;
    if (!config.data_file.empty()) {
      std::cout << "[main] Loading candles from " << config.data_file << "\n";
      candles = backtest::loadCandleFile(config.data_file);
    } else {
      backtest::CandleFeedGateway gateway(sim_clock, candles,
                                          config.feed_endpoint);
      g_gateway_ptr = &gateway;
      std::signal(SIGINT, sigint_handler);

      std::cout << "[main] CandleFeedGateway listening on "
                << config.feed_endpoint << "\n"
                << "[main] Press Ctrl-C to stop receiving.\n";
      gateway.run();

      g_gateway_ptr = nullptr;
      std::signal(SIGINT, SIG_DFL);
    }
    std::cout << "[main] " << candles.size() << " ticks loaded\n";

    // -----------------------------------------------------------------------
    // 3) Wiring
    // -----------------------------------------------------------------------
    const backtest::StrategyConfig& sc = config.strategy;
    auto strategy = std::make_unique<backtest::SmaCrossStrategy>(
        sc.instrument, sc.fast_period, sc.slow_period, sc.quantity,
        sc.leverage);
    backtest::IndicatorConfig indicators = strategy->indicators();

    backtest::Runner runner(std::move(strategy));
    runner.withPortfolio(
              std::make_unique<backtest::Portfolio>(config.portfolio))
        .withRiskManager(
            std::make_unique<backtest::RiskManager>(config.risk))
        .withData(std::move(candles))
        .withIndicators(std::move(indicators))
        .withClock(&sim_clock)
        .setVerbose(verbose);

    // -----------------------------------------------------------------------
    // 4) Run
    // -----------------------------------------------------------------------
    runner.run();
    printResults(runner);

  } catch (const backtest::BacktestError& e) {
    std::cerr << "[main] Backtest failed (" << backtest::toString(e.code())
              << "): " << e.what() << "\n";
    return e.code() == backtest::ErrorCode::ConfigError ? 2 : 1;
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] ZeroMQ error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
