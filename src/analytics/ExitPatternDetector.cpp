#include "analytics/ExitPatternDetector.h"

#include <stdexcept>
#include <string>

namespace swingfib {
namespace analytics {

ExitPatterns ExitPatternDetector::detect(const std::vector<double>& highs,
                                         const std::vector<double>& lows,
                                         int half_width) {
    if (highs.size() != lows.size()) {
        throw std::invalid_argument(
            "exit pattern detector: highs (" + std::to_string(highs.size()) +
            ") and lows (" + std::to_string(lows.size()) + ") differ in length");
    }
    if (half_width < 1) {
        throw std::invalid_argument(
            "exit pattern detector: window half-width must be at least 1, got " +
            std::to_string(half_width));
    }

    const std::size_t size = highs.size();
    const std::size_t n = static_cast<std::size_t>(half_width);

    ExitPatterns out;
    out.high_exit.assign(size, false);
    out.low_exit.assign(size, false);

    if (size < 2 * n + 1) {
        return out;
    }

    for (std::size_t i = n; i + n < size; ++i) {
        out.high_exit[i] = isWindowMaximum(highs, i, n) && highs[i] > highs[i - 1];
        out.low_exit[i] = isWindowMinimum(lows, i, n) && lows[i] < lows[i - 1];
    }
    return out;
}

bool ExitPatternDetector::isWindowMaximum(const std::vector<double>& values,
                                          std::size_t index, std::size_t n) {
    const double value = values[index];
    for (std::size_t k = index - n; k <= index + n; ++k) {
        // NaN 비교는 false -> 플래그 없음
        if (!(values[k] <= value)) return false;
    }
    return true;
}

bool ExitPatternDetector::isWindowMinimum(const std::vector<double>& values,
                                          std::size_t index, std::size_t n) {
    const double value = values[index];
    for (std::size_t k = index - n; k <= index + n; ++k) {
        if (!(values[k] >= value)) return false;
    }
    return true;
}

} // namespace analytics
} // namespace swingfib
