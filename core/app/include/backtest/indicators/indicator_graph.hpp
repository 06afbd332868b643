#pragma once

#include "backtest/indicators/indicator.hpp"

#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// validateIndicators(indicators)
// -----------------------------------------------------------------------------
// @brief  Depth-first walk over the dependency graph with a visited set and
//         a recursion stack.
//
// @throws BacktestError(DataError) naming the dependency chain
//         ("A -> B -> A") if a cycle is found.
// -----------------------------------------------------------------------------
void validateIndicators(const std::vector<IndicatorPtr>& indicators);

// -----------------------------------------------------------------------------
// applicationOrder(indicators)
// -----------------------------------------------------------------------------
// @brief  Returns every indicator reachable from the input (dependencies
//         included) in an order where each appears after all of its
//         dependencies. Duplicates by name are emitted once.
//
// @throws BacktestError(DataError) on a cycle.
// -----------------------------------------------------------------------------
std::vector<IndicatorPtr> applicationOrder(
    const std::vector<IndicatorPtr>& indicators);

}  // namespace backtest
