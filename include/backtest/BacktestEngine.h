#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "common/Types.h"
#include "backtest/PositionSimulator.h"
#include "backtest/TradeEnumerator.h"
#include "engine/PerformanceMetrics.h"
#include "strategy/SignalSynthesizer.h"
#include "strategy/StrategyConfig.h"

namespace swingfib {
namespace backtest {

struct BacktestConfig {
    strategy::SwingFibStrategyConfig strategy;
    engine::MetricsConfig metrics;
    OpenPositionPolicy open_position_policy = OpenPositionPolicy::CLOSE_AT_LAST_BAR;
    TradeEnumeratorKind trade_enumerator = TradeEnumeratorKind::STATE_MACHINE;
    std::size_t skip_first = 0;
    std::string timeframe;  // empty: infer from the median bar spacing
};

// Signals -> trades -> position -> metrics over one candle series.
// run() does not touch member state, so one engine (or many with different
// configs) can be shared across threads over the same read-only series.
class BacktestEngine {
public:
    explicit BacktestEngine(BacktestConfig config);

    struct Result {
        engine::PerformanceSummary strategy;
        engine::PerformanceSummary benchmark;
        engine::TradeStatistics trade_statistics;
        std::vector<Trade> trades;
        TradeIndices trade_indices;

        strategy::SignalResult signals;
        SimulationResult simulation;

        double periods_per_year = engine::sentinel::DEFAULT_PERIODS_PER_YEAR;
        std::size_t bar_count = 0;
        bool degraded = false;
        std::vector<std::string> diagnostics;
    };

    // Throws std::invalid_argument when timestamps are not strictly
    // increasing or skip_first is outside the series.
    Result run(const CandleSeries& candles) const;

    const BacktestConfig& config() const { return config_; }

    static void validateCandles(const CandleSeries& candles);

    // Report for a run with nothing to evaluate.
    static Result emptyResult(const std::string& reason);

private:
    double resolvePeriodsPerYear(const CandleSeries& candles) const;

    BacktestConfig config_;
    strategy::SignalSynthesizer synthesizer_;
    std::shared_ptr<const ITradeEnumerator> enumerator_;
};

} // namespace backtest
} // namespace swingfib
