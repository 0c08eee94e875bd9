#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "common/Types.h"
#include "backtest/TradeEnumerator.h"

namespace swingfib {
namespace backtest {

struct SimulationResult {
    std::vector<int> position;                 // 1 while holding
    std::vector<double> log_returns;           // ln(close[t] / close[t-1]), 0 at bar 0
    std::vector<double> strategy_log_returns;  // log_returns[t] * position[t-1]
    std::vector<double> cumulative_strategy;
    std::vector<double> cumulative_benchmark;
    std::vector<std::string> diagnostics;
};

struct MaskEdges {
    std::vector<bool> entry;
    std::vector<bool> exit;
};

// Fills at the bar close, no fees or slippage. A position entered at bar e
// is held over (e, x]; the held flag of bar t-1 earns the return of bar t.
class PositionSimulator {
public:
    // Throws std::invalid_argument unless entries/exits have equal length,
    // entry < exit < n for every trade and each entry follows the previous exit.
    static void validate(const TradeIndices& trades, std::size_t n);

    static std::vector<int> buildPositionMask(std::size_t n, const TradeIndices& trades);

    static std::vector<Trade> buildTrades(const CandleSeries& candles, const TradeIndices& trades);

    static SimulationResult simulate(const CandleSeries& candles, const TradeIndices& trades);

    // Entry at the bar before each held run, exit at its last bar.
    static MaskEdges edgesFromMask(const std::vector<int>& mask);
};

} // namespace backtest
} // namespace swingfib
