#include "backtest/PositionSimulator.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <random>
#include <stdexcept>
#include <utility>

using namespace swingfib;
using namespace swingfib::backtest;

namespace {

bool near(double a, double b) {
    return std::abs(a - b) < 1e-12;
}

CandleSeries closesToCandles(const std::vector<double>& closes) {
    CandleSeries candles;
    for (std::size_t i = 0; i < closes.size(); ++i) {
        candles.emplace_back(closes[i], closes[i], closes[i], closes[i], 1.0,
                             1700000000000LL + static_cast<long long>(i) * 60000LL);
    }
    return candles;
}

TradeIndices trades(std::vector<std::size_t> entries, std::vector<std::size_t> exits) {
    TradeIndices t;
    t.entries = std::move(entries);
    t.exits = std::move(exits);
    return t;
}

} // namespace

int main() {
    const auto candles = closesToCandles({100, 110, 121, 110, 100, 105});

    // Held over (entry, exit]
    {
        const auto mask = PositionSimulator::buildPositionMask(6, trades({0, 3}, {2, 5}));
        assert((mask == std::vector<int>{0, 1, 1, 0, 1, 1}));
    }

    // Strategy return uses the previous bar's position
    {
        const auto sim = PositionSimulator::simulate(candles, trades({0}, {2}));
        assert(near(sim.log_returns[0], 0.0));
        assert(near(sim.log_returns[1], std::log(1.1)));
        assert(near(sim.strategy_log_returns[1], 0.0));
        assert(near(sim.strategy_log_returns[2], std::log(1.1)));
        assert(near(sim.strategy_log_returns[3], std::log(110.0 / 121.0)));
        assert(near(sim.strategy_log_returns[4], 0.0));
        // held flags on bars 1..2 earn the moves into bars 2..3
        assert(near(sim.cumulative_strategy.back(), 0.0));
        assert(near(sim.cumulative_benchmark.back(), std::log(105.0 / 100.0)));
        assert(sim.diagnostics.empty());
    }

    // No trades: flat strategy curve, benchmark unaffected
    {
        const auto sim = PositionSimulator::simulate(candles, TradeIndices());
        for (std::size_t t = 0; t < candles.size(); ++t) {
            assert(sim.position[t] == 0);
            assert(sim.strategy_log_returns[t] == 0.0);
            assert(sim.cumulative_strategy[t] == 0.0);
        }
        assert(near(sim.cumulative_benchmark.back(), std::log(1.05)));
    }

    // Zero close: undefined returns counted as zero with a diagnostic
    {
        const auto broken = closesToCandles({100, 0, 50, 55});
        const auto sim = PositionSimulator::simulate(broken, trades({0}, {3}));
        assert(sim.log_returns[1] == 0.0);
        assert(sim.log_returns[2] == 0.0);
        assert(near(sim.log_returns[3], std::log(1.1)));
        assert(!sim.diagnostics.empty());
        for (double v : sim.cumulative_strategy) assert(std::isfinite(v));
    }

    // Trade records carry close prices and timestamps
    {
        const auto list = PositionSimulator::buildTrades(candles, trades({1}, {4}));
        assert(list.size() == 1);
        assert(list[0].entry_price == 110.0 && list[0].exit_price == 100.0);
        assert(list[0].entry_time == candles[1].timestamp);
        assert(list[0].exit_time == candles[4].timestamp);
        assert(list[0].holdingBars() == 3);
        assert(near(list[0].logReturn(), std::log(100.0 / 110.0)));
    }

    // Rejected trade lists
    {
        const TradeIndices bad_lists[] = {
            trades({0, 2}, {1}),        // length mismatch
            trades({2}, {2}),           // entry == exit
            trades({1}, {6}),           // exit past the series
            trades({0, 2}, {3, 4}),     // overlap
            trades({0, 2}, {2, 4}),     // entry on the previous exit bar
        };
        for (const auto& t : bad_lists) {
            bool threw = false;
            try {
                PositionSimulator::simulate(candles, t);
            } catch (const std::invalid_argument&) {
                threw = true;
            }
            assert(threw);
        }
    }

    // Mask edges fed back through the enumerator rebuild the same trades
    {
        std::mt19937 rng(99);
        const StateMachineTradeEnumerator machine;
        for (int trial = 0; trial < 200; ++trial) {
            const std::size_t n = 2 + rng() % 200;
            TradeIndices listed;
            std::size_t cursor = rng() % 3;
            while (cursor + 1 < n) {
                const std::size_t entry = cursor;
                const std::size_t exit = std::min<std::size_t>(n - 1, entry + 1 + rng() % 6);
                listed.entries.push_back(entry);
                listed.exits.push_back(exit);
                cursor = exit + 1 + rng() % 4;
            }

            const auto mask = PositionSimulator::buildPositionMask(n, listed);
            const auto edges = PositionSimulator::edgesFromMask(mask);
            const auto rebuilt = machine.enumerate(edges.entry, edges.exit, 0, OpenPositionPolicy::DROP);
            assert(rebuilt.entries == listed.entries);
            assert(rebuilt.exits == listed.exits);
        }
    }

    std::cout << "[TEST] PositionSimulator PASSED\n";
    return 0;
}
