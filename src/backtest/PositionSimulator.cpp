#include "backtest/PositionSimulator.h"
#include "common/Logger.h"

#include <cmath>
#include <stdexcept>

namespace swingfib {
namespace backtest {

void PositionSimulator::validate(const TradeIndices& trades, std::size_t n) {
    if (trades.entries.size() != trades.exits.size()) {
        throw std::invalid_argument(
            "position simulator: " + std::to_string(trades.entries.size()) + " entries but " +
            std::to_string(trades.exits.size()) + " exits");
    }
    for (std::size_t i = 0; i < trades.size(); ++i) {
        const std::size_t entry = trades.entries[i];
        const std::size_t exit = trades.exits[i];
        if (entry >= exit || exit >= n) {
            throw std::invalid_argument(
                "position simulator: invalid trade " + std::to_string(i) + " (entry " +
                std::to_string(entry) + ", exit " + std::to_string(exit) +
                ", bars " + std::to_string(n) + ")");
        }
        if (i > 0 && entry <= trades.exits[i - 1]) {
            throw std::invalid_argument(
                "position simulator: trade " + std::to_string(i) +
                " overlaps the previous trade");
        }
    }
}

std::vector<int> PositionSimulator::buildPositionMask(std::size_t n, const TradeIndices& trades) {
    validate(trades, n);
    std::vector<int> mask(n, 0);
    for (std::size_t i = 0; i < trades.size(); ++i) {
        for (std::size_t t = trades.entries[i] + 1; t <= trades.exits[i]; ++t) {
            mask[t] = 1;
        }
    }
    return mask;
}

std::vector<Trade> PositionSimulator::buildTrades(const CandleSeries& candles,
                                                  const TradeIndices& trades) {
    validate(trades, candles.size());
    std::vector<Trade> out;
    out.reserve(trades.size());
    for (std::size_t i = 0; i < trades.size(); ++i) {
        Trade trade;
        trade.entry_index = trades.entries[i];
        trade.exit_index = trades.exits[i];
        trade.entry_time = candles[trade.entry_index].timestamp;
        trade.exit_time = candles[trade.exit_index].timestamp;
        trade.entry_price = candles[trade.entry_index].close;
        trade.exit_price = candles[trade.exit_index].close;
        out.push_back(trade);
    }
    return out;
}

SimulationResult PositionSimulator::simulate(const CandleSeries& candles,
                                             const TradeIndices& trades) {
    const std::size_t n = candles.size();

    SimulationResult result;
    result.position = buildPositionMask(n, trades);
    result.log_returns.assign(n, 0.0);
    result.strategy_log_returns.assign(n, 0.0);
    result.cumulative_strategy.assign(n, 0.0);
    result.cumulative_benchmark.assign(n, 0.0);

    std::size_t undefined_bars = 0;
    for (std::size_t t = 1; t < n; ++t) {
        const double r = std::log(candles[t].close / candles[t - 1].close);
        if (std::isfinite(r)) {
            result.log_returns[t] = r;
        } else {
            undefined_bars++;
        }
        result.strategy_log_returns[t] = result.log_returns[t] * result.position[t - 1];
    }

    double strategy_sum = 0.0;
    double benchmark_sum = 0.0;
    for (std::size_t t = 0; t < n; ++t) {
        strategy_sum += result.strategy_log_returns[t];
        benchmark_sum += result.log_returns[t];
        result.cumulative_strategy[t] = strategy_sum;
        result.cumulative_benchmark[t] = benchmark_sum;
    }

    if (undefined_bars > 0) {
        const std::string msg = "position simulator: " + std::to_string(undefined_bars) +
                                " bars with undefined log return counted as zero";
        result.diagnostics.push_back(msg);
        LOG_WARN("{}", msg);
    }
    return result;
}

MaskEdges PositionSimulator::edgesFromMask(const std::vector<int>& mask) {
    const std::size_t n = mask.size();
    MaskEdges edges;
    edges.entry.assign(n, false);
    edges.exit.assign(n, false);
    for (std::size_t i = 0; i < n; ++i) {
        const bool held = mask[i] != 0;
        const bool next_held = (i + 1 < n) && mask[i + 1] != 0;
        if (!held && next_held) {
            edges.entry[i] = true;
        }
        if (held && !next_held) {
            edges.exit[i] = true;
        }
    }
    return edges;
}

} // namespace backtest
} // namespace swingfib
