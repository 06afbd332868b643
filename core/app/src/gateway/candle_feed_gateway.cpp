#include "backtest/gateway/candle_feed_gateway.hpp"
#include "backtest/data/candle_json.hpp"
#include "backtest/domain/errors.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace backtest {

// -----------------------------------------------------------------------------
// Constructor: create ZMQ SUB socket with receive timeout
// -----------------------------------------------------------------------------
CandleFeedGateway::CandleFeedGateway(SimulationTimeProvider& time_provider,
                                     CandleTable& table,
                                     const std::string& endpoint)
    : time_provider_(time_provider), table_(table) {
  // Empty filter: accept everything the publisher sends.
  socket_.set(zmq::sockopt::subscribe, "");

  // Without a receive timeout recv() blocks forever and stop() is never
  // observed.
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);

  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
std::size_t CandleFeedGateway::run() {
  running_.store(true);
  std::cout << "[CandleFeedGateway] Waiting for candles\n";

  while (running_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);

    if (!result.has_value()) {
      // Timeout; re-check the stop flag.
      continue;
    }

    if (!handleMessage(msg.to_string())) {
      std::cout << "[CandleFeedGateway] End of feed after " << received_
                << " candles\n";
      running_.store(false);
    }
  }
  return received_;
}

// -----------------------------------------------------------------------------
// handleMessage(): decode one payload
// -----------------------------------------------------------------------------
bool CandleFeedGateway::handleMessage(const std::string& payload) {
  try {
    auto json = nlohmann::json::parse(payload);

    if (json.is_object() && json.value("type", std::string{}) == "end") {
      return false;
    }

    CandleRecord record = candleFromJson(json);

    // --- Step 1: Advance the simulation clock ------------------------------
    time_provider_.advance_time(record.timestamp_ms);

    // --- Step 2: Store the candle ------------------------------------------
    table_.addCandle(ms_to_timestamp(record.timestamp_ms), record.symbol,
                     std::move(record.candle));
    ++received_;

  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[CandleFeedGateway] JSON parse error: " << e.what()
              << " - payload: " << payload << "\n";
  } catch (const BacktestError& e) {
    std::cerr << "[CandleFeedGateway] Skipping candle: " << e.what() << "\n";
  }
  return true;
}

// -----------------------------------------------------------------------------
// stop(): signal the recv loop to exit
// -----------------------------------------------------------------------------
void CandleFeedGateway::stop() { running_.store(false); }

}  // namespace backtest
