#include "backtest/indicators/indicator_graph.hpp"
#include "backtest/domain/errors.hpp"

#include <set>
#include <string>

namespace backtest {

namespace {

// Post-order DFS. `stack` holds the names on the current recursion path,
// `path` the same names in order for error messages.
void visit(const IndicatorPtr& indicator, std::set<std::string>& visited,
           std::set<std::string>& stack, std::vector<std::string>& path,
           std::vector<IndicatorPtr>* ordered) {
  if (!indicator) {
    throw BacktestError(ErrorCode::DataError, "null indicator");
  }
  const std::string name = indicator->name();

  if (stack.count(name) != 0) {
    std::string chain;
    for (const auto& step : path) {
      chain += step + " -> ";
    }
    throw BacktestError(ErrorCode::DataError,
                        "circular indicator dependency: " + chain + name);
  }
  if (visited.count(name) != 0) {
    return;
  }

  visited.insert(name);
  stack.insert(name);
  path.push_back(name);

  for (const auto& dep : indicator->dependencies()) {
    visit(dep, visited, stack, path, ordered);
  }

  path.pop_back();
  stack.erase(name);

  if (ordered != nullptr) {
    ordered->push_back(indicator);
  }
}

}  // namespace

void validateIndicators(const std::vector<IndicatorPtr>& indicators) {
  std::set<std::string> visited;
  std::set<std::string> stack;
  std::vector<std::string> path;
  for (const auto& indicator : indicators) {
    visit(indicator, visited, stack, path, nullptr);
  }
}

std::vector<IndicatorPtr> applicationOrder(
    const std::vector<IndicatorPtr>& indicators) {
  std::set<std::string> visited;
  std::set<std::string> stack;
  std::vector<std::string> path;
  std::vector<IndicatorPtr> ordered;
  for (const auto& indicator : indicators) {
    visit(indicator, visited, stack, path, &ordered);
  }
  return ordered;
}

}  // namespace backtest
