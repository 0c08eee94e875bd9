#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "common/Types.h"
#include "analytics/ExitPatternDetector.h"
#include "analytics/RetracementProjector.h"
#include "analytics/SwingDetector.h"
#include "strategy/StrategyConfig.h"

namespace swingfib {
namespace strategy {

struct SignalResult {
    std::vector<bool> entry;
    std::vector<bool> exit;
    bool degraded = false;              // neutral all-false output
    std::vector<std::string> diagnostics;

    // Intermediate stages, kept for reporting
    analytics::SwingResult swing;
    std::vector<Pivot> pivots;
    analytics::RetracementProjection projection;

    std::size_t entryCount() const;
    std::size_t exitCount() const;
};

// Long-only retracement entries with wick rejection, and pattern or
// ratio-target exits. A bar flagged for both entry and exit keeps only the
// exit.
class SignalSynthesizer {
public:
    // Throws std::invalid_argument when wick_lookback or pattern_window < 1.
    explicit SignalSynthesizer(SwingFibStrategyConfig config);
    SignalSynthesizer(SwingFibStrategyConfig config,
                      std::shared_ptr<const analytics::ISwingDetector> detector);

    // Full chain: swings, pivots, projection, exit patterns, synthesis.
    SignalResult generate(const CandleSeries& candles) const;

    // Synthesis over precomputed stages. Fewer than 2 pivots, an entry or
    // stop ratio outside the projected set, or no resolved bar give an
    // all-false degraded result.
    SignalResult synthesize(const CandleSeries& candles,
                            const std::vector<Pivot>& pivots,
                            analytics::RetracementProjection projection,
                            const analytics::ExitPatterns& patterns) const;

    const SwingFibStrategyConfig& config() const { return config_; }

private:
    bool wickRejected(const CandleSeries& candles, std::size_t bar,
                      double entry_level, double stop_level) const;
    static void degrade(SignalResult& result, std::size_t size, const std::string& reason);

    SwingFibStrategyConfig config_;
    std::shared_ptr<const analytics::ISwingDetector> detector_;
    analytics::RetracementProjector projector_;
};

ExitMode exitModeFromString(const std::string& value);
std::string toString(ExitMode mode);

} // namespace strategy
} // namespace swingfib
