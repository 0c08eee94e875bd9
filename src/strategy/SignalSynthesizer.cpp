#include "strategy/SignalSynthesizer.h"
#include "analytics/PivotExtractor.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace swingfib {
namespace strategy {

namespace {
SwingFibStrategyConfig validated(SwingFibStrategyConfig config) {
    if (config.wick_lookback < 1) {
        throw std::invalid_argument(
            "signal synthesizer: wick_lookback must be at least 1, got " +
            std::to_string(config.wick_lookback));
    }
    if (config.pattern_window < 1) {
        throw std::invalid_argument(
            "signal synthesizer: pattern_window must be at least 1, got " +
            std::to_string(config.pattern_window));
    }
    return config;
}

std::size_t countTrue(const std::vector<bool>& flags) {
    return static_cast<std::size_t>(std::count(flags.begin(), flags.end(), true));
}
}

std::size_t SignalResult::entryCount() const {
    return countTrue(entry);
}

std::size_t SignalResult::exitCount() const {
    return countTrue(exit);
}

SignalSynthesizer::SignalSynthesizer(SwingFibStrategyConfig config)
    : SignalSynthesizer(config, analytics::makeSwingDetector(config.swing_detector)) {}

SignalSynthesizer::SignalSynthesizer(SwingFibStrategyConfig config,
                                     std::shared_ptr<const analytics::ISwingDetector> detector)
    : config_(validated(std::move(config)))
    , detector_(std::move(detector))
    , projector_(config_.ratios) {
    if (!detector_) {
        throw std::invalid_argument("signal synthesizer: swing detector is null");
    }
}

SignalResult SignalSynthesizer::generate(const CandleSeries& candles) const {
    const auto highs = extractHighs(candles);
    const auto lows = extractLows(candles);

    analytics::SwingResult swing = detector_->detect(highs, lows, config_.epsilon);
    std::vector<Pivot> pivots = analytics::PivotExtractor::extract(swing.markers, candles);
    analytics::RetracementProjection projection = projector_.project(candles, pivots);

    analytics::ExitPatterns patterns;
    if (config_.exit_mode == ExitMode::PATTERN) {
        patterns = analytics::ExitPatternDetector::detect(highs, lows, config_.pattern_window);
    } else {
        patterns.high_exit.assign(candles.size(), false);
        patterns.low_exit.assign(candles.size(), false);
    }

    SignalResult result = synthesize(candles, pivots, std::move(projection), patterns);
    result.diagnostics.insert(result.diagnostics.begin(),
                              swing.diagnostics.begin(), swing.diagnostics.end());
    result.swing = std::move(swing);
    return result;
}

SignalResult SignalSynthesizer::synthesize(const CandleSeries& candles,
                                           const std::vector<Pivot>& pivots,
                                           analytics::RetracementProjection projection,
                                           const analytics::ExitPatterns& patterns) const {
    const std::size_t n = candles.size();
    if (projection.size() != n || patterns.low_exit.size() != n || patterns.high_exit.size() != n) {
        throw std::invalid_argument("signal synthesizer: stage outputs do not match candle count");
    }

    SignalResult result;
    result.entry.assign(n, false);
    result.exit.assign(n, false);
    result.pivots = pivots;

    if (pivots.size() < 2) {
        degrade(result, n, "signal synthesizer: fewer than 2 pivots (" +
                               std::to_string(pivots.size()) + "), no signals");
        result.projection = std::move(projection);
        return result;
    }

    const int entry_idx = projection.ratioIndex(config_.entry_ratio);
    const int stop_idx = projection.ratioIndex(config_.stop_ratio);
    if (entry_idx < 0 || stop_idx < 0) {
        degrade(result, n, "signal synthesizer: missing required retracement level (entry " +
                               std::to_string(config_.entry_ratio) + ", stop " +
                               std::to_string(config_.stop_ratio) + "), no signals");
        result.projection = std::move(projection);
        return result;
    }

    if (config_.backfill_lead_in) {
        projection.backfillLeadIn();
    }
    if (!projection.hasResolvedBars()) {
        degrade(result, n, "signal synthesizer: retracement levels unresolved after fill, no signals");
        result.projection = std::move(projection);
        return result;
    }

    const auto& entry_levels = projection.levels[static_cast<std::size_t>(entry_idx)];
    const auto& stop_levels = projection.levels[static_cast<std::size_t>(stop_idx)];

    for (std::size_t t = 0; t < n; ++t) {
        if (!projection.isResolved(t)) {
            continue;
        }
        const Candle& bar = candles[t];

        bool exit_flag = false;
        if (config_.exit_mode == ExitMode::PATTERN) {
            exit_flag = patterns.low_exit[t];
        } else {
            const double take_profit = projection.levelAt(t, config_.take_profit_ratio);
            const double stop_loss = projection.levelAt(t, config_.stop_loss_ratio);
            exit_flag = bar.high >= take_profit || bar.low <= stop_loss;
        }

        const bool entry_flag = projection.segment_direction[t] == 1 &&
                                bar.low <= entry_levels[t] &&
                                wickRejected(candles, t, entry_levels[t], stop_levels[t]);

        result.exit[t] = exit_flag;
        result.entry[t] = entry_flag && !exit_flag;
    }

    result.projection = std::move(projection);
    LOG_DEBUG("Signal synthesizer: {} pivots, {} entries, {} exits over {} bars",
              pivots.size(), result.entryCount(), result.exitCount(), n);
    return result;
}

// Over the wick_lookback bars before `bar`: the lowest low reached the stop
// level and the highest close held the entry level.
bool SignalSynthesizer::wickRejected(const CandleSeries& candles, std::size_t bar,
                                     double entry_level, double stop_level) const {
    const std::size_t lookback = static_cast<std::size_t>(config_.wick_lookback);
    if (bar < lookback) {
        return false;
    }
    double lowest_low = candles[bar - lookback].low;
    double highest_close = candles[bar - lookback].close;
    for (std::size_t k = bar - lookback + 1; k < bar; ++k) {
        lowest_low = std::min(lowest_low, candles[k].low);
        highest_close = std::max(highest_close, candles[k].close);
    }
    return lowest_low <= stop_level && highest_close >= entry_level;
}

void SignalSynthesizer::degrade(SignalResult& result, std::size_t size, const std::string& reason) {
    result.entry.assign(size, false);
    result.exit.assign(size, false);
    result.degraded = true;
    result.diagnostics.push_back(reason);
    LOG_WARN("{}", reason);
}

ExitMode exitModeFromString(const std::string& value) {
    if (value == "pattern" || value == "fractal") {
        return ExitMode::PATTERN;
    }
    if (value == "ratio_target" || value == "fib") {
        return ExitMode::RATIO_TARGET;
    }
    throw std::invalid_argument("unknown exit mode: " + value);
}

std::string toString(ExitMode mode) {
    return mode == ExitMode::RATIO_TARGET ? "ratio_target" : "pattern";
}

} // namespace strategy
} // namespace swingfib
