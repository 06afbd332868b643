#pragma once

#include "backtest/data/candle_table.hpp"
#include "backtest/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <string>

namespace backtest {

// -----------------------------------------------------------------------------
// CandleFeedGateway - ZeroMQ bridge for loading historical candles
// -----------------------------------------------------------------------------
//
// @brief  Listens on a ZeroMQ SUB socket for JSON-encoded candles, advances
//         the simulation clock, and inserts each candle into a CandleTable.
//
// @details
// An external feeder (typically a Python script replaying CSV/Parquet
// history) publishes one JSON object per candle over ZMQ PUB. The format is
// the one decoded by candleFromJson() (see candle_json.hpp). A control
// message {"type": "end"} marks the end of the replay and makes run()
// return.
//
// On each candle message the gateway performs two actions IN ORDER:
//   1. advance_time(timestamp_ms) on the simulation clock.
//   2. table_.addCandle(...).
//
// Malformed messages and duplicate candles are logged to stderr and
// skipped; the feed keeps going.
//
// Thread model:
//   run() blocks the calling thread. stop() can be called from any thread;
//   it sets an atomic flag that the recv loop checks after every receive
//   timeout (ZMQ_RCVTIMEO), so shutdown is bounded by kRecvTimeoutMs.
//   The CandleTable is not thread-safe: do not read it until run() returns.
//
// Ownership:
//   - Owns the zmq::context_t and zmq::socket_t (RAII).
//   - Holds references to the SimulationTimeProvider and the CandleTable;
//     both must outlive the gateway.
// -----------------------------------------------------------------------------
class CandleFeedGateway {
 public:
  // Subscribes to all messages on `endpoint` with a receive timeout of
  // kRecvTimeoutMs. connect() is non-blocking.
  CandleFeedGateway(SimulationTimeProvider& time_provider, CandleTable& table,
                    const std::string& endpoint = "tcp://127.0.0.1:5555");

  ~CandleFeedGateway() = default;

  CandleFeedGateway(const CandleFeedGateway&) = delete;
  CandleFeedGateway& operator=(const CandleFeedGateway&) = delete;
  CandleFeedGateway(CandleFeedGateway&&) = delete;
  CandleFeedGateway& operator=(CandleFeedGateway&&) = delete;

  // -------------------------------------------------------------------------
  // run()
  // -------------------------------------------------------------------------
  // @brief  Blocking recv loop; returns after an end message or stop().
  //
  // @return Number of candles inserted into the table.
  // -------------------------------------------------------------------------
  std::size_t run();

  // Requests the recv loop to exit. Safe to call from any thread.
  void stop();

  // -------------------------------------------------------------------------
  // handleMessage(payload)
  // -------------------------------------------------------------------------
  // @brief  Decodes one raw message and applies it.
  //
  // @return false if the message was an end marker, true otherwise
  //         (including when it was malformed and skipped).
  //
  // @details
  // Exposed so the decoding path can be driven without a socket.
  // -------------------------------------------------------------------------
  bool handleMessage(const std::string& payload);

  std::size_t received() const { return received_; }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  SimulationTimeProvider& time_provider_;
  CandleTable& table_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
  std::size_t received_{0};
};

}  // namespace backtest
