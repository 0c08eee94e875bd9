#pragma once

#include <cstddef>
#include <vector>

namespace swingfib {
namespace analytics {

struct ExitPatterns {
    std::vector<bool> high_exit;   // local high of the window
    std::vector<bool> low_exit;    // local low of the window
};

// Symmetric window extremum (fractal) flags.
//
// Bar i is a high exit when high[i] is the maximum of high[i-n .. i+n] and
// strictly above high[i-1]; a low exit mirrors this with the minimum and
// strictly below low[i-1]. Bars without a full window are never flagged.
// On a plateau only its first bar (the one stepping onto it) can be flagged.
class ExitPatternDetector {
public:
    // Throws std::invalid_argument on mismatched lengths or half_width < 1.
    static ExitPatterns detect(const std::vector<double>& highs,
                               const std::vector<double>& lows,
                               int half_width);

private:
    static bool isWindowMaximum(const std::vector<double>& values, std::size_t index, std::size_t n);
    static bool isWindowMinimum(const std::vector<double>& values, std::size_t index, std::size_t n);
};

} // namespace analytics
} // namespace swingfib
