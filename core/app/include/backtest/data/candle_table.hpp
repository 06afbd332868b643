#pragma once

#include "backtest/domain/candle.hpp"
#include "backtest/indicators/indicator.hpp"
#include "backtest/time/time_utils.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace backtest {

// instrument → candle for one timestamp.
using CandleMap = std::map<std::string, domain::Candle>;

// One row of the table as handed to the Runner.
struct CandleRow {
  Timestamp time;
  const CandleMap& candles;
};

// -----------------------------------------------------------------------------
// CandleTable - timestamp-keyed storage of per-instrument candles
// -----------------------------------------------------------------------------
//
// @brief  Rows indexed by timestamp; each row maps instrument → Candle.
//
// @details
// Insertion may happen in any order. The timestamp index is sorted lazily:
// any mutation marks it dirty and the next rows() call sorts it once.
// Duplicate timestamps (addRow) and duplicate instruments within a
// timestamp (addCandle) are rejected with DataError.
//
// Not thread-safe. A single producer fills it (file loader or
// CandleFeedGateway), then a single consumer (the Runner) reads it.
// References returned by rows() and row() are invalidated by the next
// mutation.
// -----------------------------------------------------------------------------
class CandleTable {
 public:
  // @throws BacktestError(DataError) if the instrument already has a candle
  //         at this timestamp or the instrument is empty.
  void addCandle(Timestamp time, const std::string& instrument,
                 domain::Candle candle);

  // @throws BacktestError(DataError) if the timestamp already exists.
  void addRow(Timestamp time, CandleMap candles);

  // Rows in ascending timestamp order.
  std::vector<CandleRow> rows();

  // nullptr if no row exists at this timestamp.
  const CandleMap* row(Timestamp time) const;

  std::set<std::string> instruments() const;

  std::size_t size() const { return rows_.size(); }
  bool empty() const { return rows_.empty(); }

  // -------------------------------------------------------------------------
  // applyIndicators(indicators)
  // -------------------------------------------------------------------------
  // @brief  Computes every indicator (dependencies first) for every
  //         instrument column and stores the values on the candles.
  //
  // @details
  // Each column is the instrument's candles in time order; instruments
  // missing at a timestamp are simply absent from their column.
  //
  // @throws BacktestError(DataError) on a dependency cycle or when an
  //         indicator returns a value count different from the column size.
  // -------------------------------------------------------------------------
  void applyIndicators(const std::vector<IndicatorPtr>& indicators);

 private:
  void ensureSorted();

  std::unordered_map<std::int64_t, CandleMap> rows_;
  std::vector<std::int64_t> order_;
  bool dirty_{false};
};

}  // namespace backtest
