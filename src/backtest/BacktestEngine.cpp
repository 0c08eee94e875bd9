#include "backtest/BacktestEngine.h"
#include "common/Logger.h"

#include <initializer_list>
#include <stdexcept>
#include <utility>

namespace swingfib {
namespace backtest {

BacktestEngine::BacktestEngine(BacktestConfig config)
    : config_(std::move(config))
    , synthesizer_(config_.strategy)
    , enumerator_(makeTradeEnumerator(config_.trade_enumerator)) {
    if (config_.metrics.min_trades_for_stats < 0) {
        throw std::invalid_argument(
            "backtest engine: min_trades_for_stats must be non-negative, got " +
            std::to_string(config_.metrics.min_trades_for_stats));
    }
}

void BacktestEngine::validateCandles(const CandleSeries& candles) {
    for (std::size_t i = 1; i < candles.size(); ++i) {
        if (candles[i].timestamp <= candles[i - 1].timestamp) {
            throw std::invalid_argument(
                "backtest engine: candle timestamps must be strictly increasing (bar " +
                std::to_string(i) + ": " + std::to_string(candles[i - 1].timestamp) +
                " -> " + std::to_string(candles[i].timestamp) + ")");
        }
    }
}

BacktestEngine::Result BacktestEngine::emptyResult(const std::string& reason) {
    Result result;
    for (engine::PerformanceSummary* s : {&result.strategy, &result.benchmark}) {
        s->total_return = engine::sentinel::DEGRADED_TOTAL_RETURN;
        s->sharpe_ratio = engine::sentinel::INSUFFICIENT_DATA_RATIO;
        s->sortino_ratio = engine::sentinel::INSUFFICIENT_DATA_RATIO;
        s->max_drawdown = engine::sentinel::TOTAL_LOSS_DRAWDOWN;
        s->statistics_reliable = false;
    }
    result.degraded = true;
    result.diagnostics.push_back(reason);
    return result;
}

BacktestEngine::Result BacktestEngine::run(const CandleSeries& candles) const {
    validateCandles(candles);

    if (candles.empty()) {
        LOG_WARN("Backtest: empty candle series, returning degraded report");
        return emptyResult("backtest engine: empty candle series");
    }

    LOG_INFO("Starting backtest over {} candles (epsilon={}, exit={})",
             candles.size(), config_.strategy.epsilon, strategy::toString(config_.strategy.exit_mode));

    Result result;
    result.bar_count = candles.size();

    // 1. Signals
    result.signals = synthesizer_.generate(candles);
    result.degraded = result.signals.degraded;

    // 2. Trades
    result.trade_indices = enumerator_->enumerate(result.signals.entry, result.signals.exit,
                                                  config_.skip_first, config_.open_position_policy);

    // 3. Position and returns
    result.simulation = PositionSimulator::simulate(candles, result.trade_indices);
    result.trades = PositionSimulator::buildTrades(candles, result.trade_indices);

    // 4. Metrics
    result.periods_per_year = resolvePeriodsPerYear(candles);
    result.strategy = engine::PerformanceMetrics::summarizeStrategy(
        result.simulation.strategy_log_returns,
        static_cast<int>(result.trades.size()),
        result.periods_per_year,
        config_.metrics);
    result.benchmark = engine::PerformanceMetrics::summarizeBenchmark(
        result.simulation.log_returns, result.periods_per_year, config_.metrics);
    result.trade_statistics = engine::PerformanceMetrics::tradeStatistics(result.trades);

    result.diagnostics = result.signals.diagnostics;
    result.diagnostics.insert(result.diagnostics.end(),
                              result.simulation.diagnostics.begin(),
                              result.simulation.diagnostics.end());
    if (!result.strategy.statistics_reliable) {
        result.diagnostics.push_back(
            "metrics: " + std::to_string(result.trades.size()) +
            " trades below min_trades_for_stats (" +
            std::to_string(config_.metrics.min_trades_for_stats) + "), ratios are sentinels");
    }

    LOG_INFO("Backtest completed: {} pivots, {} trades, win rate {:.2f}%",
             result.signals.pivots.size(), result.trades.size(),
             result.trade_statistics.win_rate * 100.0);
    LOG_INFO("Strategy: total {:.4f}, sharpe {:.3f}, sortino {:.3f}, mdd {:.4f}",
             result.strategy.total_return, result.strategy.sharpe_ratio,
             result.strategy.sortino_ratio, result.strategy.max_drawdown);
    LOG_INFO("Benchmark: total {:.4f}, sharpe {:.3f}, sortino {:.3f}, mdd {:.4f}",
             result.benchmark.total_return, result.benchmark.sharpe_ratio,
             result.benchmark.sortino_ratio, result.benchmark.max_drawdown);
    return result;
}

double BacktestEngine::resolvePeriodsPerYear(const CandleSeries& candles) const {
    if (!config_.timeframe.empty()) {
        return engine::PerformanceMetrics::periodsPerYear(config_.timeframe);
    }
    return engine::PerformanceMetrics::periodsPerYear(extractTimestamps(candles));
}

} // namespace backtest
} // namespace swingfib
