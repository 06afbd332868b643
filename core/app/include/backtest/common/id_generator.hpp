#pragma once

#include <atomic>
#include <cstdint>

namespace backtest {

// -----------------------------------------------------------------------------
// IdGenerator - monotonically increasing identifier source
// -----------------------------------------------------------------------------
//
// @brief  Produces unique, increasing ids for orders and positions.
//
// @details
// Starts at 1; id 0 is reserved as the "unassigned" sentinel, which is how
// the Runner recognises strategy or risk orders that still need an id.
//
// The Runner owns one generator for orders and the Portfolio owns one for
// positions. Both are value members, injected nowhere else, so ids are
// deterministic for a given input sequence.
//
// Thread model:
//   next_id() is safe to call from any thread (relaxed fetch_add); the run
//   loop itself is single-threaded.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  IdGenerator() = default;

  // Copying a generator would create two sources producing duplicate ids.
  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace backtest
