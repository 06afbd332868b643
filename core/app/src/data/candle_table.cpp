#include "backtest/data/candle_table.hpp"
#include "backtest/domain/errors.hpp"
#include "backtest/indicators/indicator_graph.hpp"

#include <algorithm>
#include <utility>

namespace backtest {

void CandleTable::addCandle(Timestamp time, const std::string& instrument,
                            domain::Candle candle) {
  if (instrument.empty()) {
    throw BacktestError(ErrorCode::DataError,
                        "candle at " + format_timestamp(time) +
                            " has no instrument");
  }

  const std::int64_t key = timestamp_to_ms(time);
  auto it = rows_.find(key);
  if (it != rows_.end() && it->second.count(instrument) != 0) {
    throw BacktestError(ErrorCode::DataError,
                        "duplicate candle for " + instrument + " at " +
                            format_timestamp(time));
  }

  if (it == rows_.end()) {
    it = rows_.emplace(key, CandleMap{}).first;
    order_.push_back(key);
    dirty_ = true;
  }

  candle.time = time;
  it->second.emplace(instrument, std::move(candle));
}

void CandleTable::addRow(Timestamp time, CandleMap candles) {
  const std::int64_t key = timestamp_to_ms(time);
  if (rows_.count(key) != 0) {
    throw BacktestError(ErrorCode::DataError,
                        "duplicate row at " + format_timestamp(time));
  }

  for (auto& entry : candles) {
    entry.second.time = time;
  }
  rows_.emplace(key, std::move(candles));
  order_.push_back(key);
  dirty_ = true;
}

void CandleTable::ensureSorted() {
  if (!dirty_) {
    return;
  }
  std::sort(order_.begin(), order_.end());
  dirty_ = false;
}

std::vector<CandleRow> CandleTable::rows() {
  ensureSorted();

  std::vector<CandleRow> out;
  out.reserve(order_.size());
  for (std::int64_t key : order_) {
    out.push_back(CandleRow{ms_to_timestamp(key), rows_.at(key)});
  }
  return out;
}

const CandleMap* CandleTable::row(Timestamp time) const {
  auto it = rows_.find(timestamp_to_ms(time));
  if (it == rows_.end()) {
    return nullptr;
  }
  return &it->second;
}

std::set<std::string> CandleTable::instruments() const {
  std::set<std::string> names;
  for (const auto& row : rows_) {
    for (const auto& column : row.second) {
      names.insert(column.first);
    }
  }
  return names;
}

void CandleTable::applyIndicators(const std::vector<IndicatorPtr>& indicators) {
  const std::vector<IndicatorPtr> ordered = applicationOrder(indicators);
  if (ordered.empty()) {
    return;
  }
  ensureSorted();

  for (const auto& instrument : instruments()) {
    for (const auto& indicator : ordered) {
      // Rebuilt per indicator so dependency values written by the previous
      // pass are visible.
      std::vector<domain::Candle> column;
      std::vector<domain::Candle*> slots;
      for (std::int64_t key : order_) {
        auto& candles = rows_.at(key);
        auto it = candles.find(instrument);
        if (it != candles.end()) {
          column.push_back(it->second);
          slots.push_back(&it->second);
        }
      }

      const IndicatorValues values = indicator->calculate(column);
      if (values.size() != column.size()) {
        throw BacktestError(
            ErrorCode::DataError,
            "indicator " + indicator->name() + " returned " +
                std::to_string(values.size()) + " values for " +
                std::to_string(column.size()) + " " + instrument +
                " candles");
      }

      const std::string name = indicator->name();
      for (std::size_t i = 0; i < slots.size(); ++i) {
        slots[i]->setIndicator(name, values[i]);
      }
    }
  }
}

}  // namespace backtest
