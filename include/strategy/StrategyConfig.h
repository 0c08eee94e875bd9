#pragma once

#include <vector>
#include "analytics/RetracementProjector.h"
#include "analytics/SwingDetector.h"

namespace swingfib {
namespace strategy {

enum class ExitMode {
    PATTERN,        // low exit pattern of the symmetric window
    RATIO_TARGET    // take-profit / stop-loss retracement prices
};

struct SwingFibStrategyConfig {
    // Swing detection
    double epsilon = 0.03;              // 3% relative move
    analytics::SwingDetectorKind swing_detector = analytics::SwingDetectorKind::REFERENCE;
    std::vector<double> ratios = analytics::RetracementProjector::defaultRatios();

    // Entry
    double entry_ratio = 0.618;
    double stop_ratio = 0.786;          // wick rejection depth
    int wick_lookback = 5;
    bool backfill_lead_in = true;

    // Exit
    ExitMode exit_mode = ExitMode::PATTERN;
    double take_profit_ratio = 1.618;
    double stop_loss_ratio = 0.0;
    int pattern_window = 2;
};

} // namespace strategy
} // namespace swingfib
