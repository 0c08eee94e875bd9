#include "analytics/SwingDetector.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace swingfib {
namespace analytics {

namespace {

struct Extreme {
    double value;
    std::size_t index;
};

// to / from - 1 >= epsilon
bool risesBy(double from, double to, double epsilon) {
    return to / from - 1.0 >= epsilon;
}

// Strict comparison keeps the earlier bar on ties.
Extreme higherOf(const Extreme& a, const Extreme& b) {
    return b.value > a.value ? b : a;
}

Extreme lowerOf(const Extreme& a, const Extreme& b) {
    return b.value < a.value ? b : a;
}

bool reversalAt(int direction, double extreme, double high, double low, double epsilon) {
    if (direction == 1) {
        return risesBy(low, extreme, epsilon);
    }
    return risesBy(extreme, high, epsilon);
}

bool allFinite(const std::vector<double>& values) {
    return std::all_of(values.begin(), values.end(),
                       [](double v) { return std::isfinite(v); });
}

} // namespace

std::size_t SwingResult::pivotCount() const {
    return static_cast<std::size_t>(
        std::count_if(markers.begin(), markers.end(), [](int m) { return m != 0; }));
}

SwingResult ISwingDetector::detect(const std::vector<double>& highs,
                                   const std::vector<double>& lows,
                                   double epsilon) const {
    if (highs.size() != lows.size()) {
        throw std::invalid_argument(
            "swing detector: highs (" + std::to_string(highs.size()) +
            ") and lows (" + std::to_string(lows.size()) + ") differ in length");
    }

    const std::size_t n = highs.size();
    SwingResult out;
    out.markers.assign(n, 0);
    out.turning_points.assign(n, 0);

    if (n < 2) {
        out.diagnostics.push_back("swing detector: fewer than 2 bars, no pivots");
        return out;
    }
    if (!(epsilon > 0.0) || !std::isfinite(epsilon)) {
        out.diagnostics.push_back("swing detector: epsilon must be a positive finite value, no pivots");
        LOG_WARN("Swing detector: invalid epsilon {}, returning no pivots", epsilon);
        return out;
    }
    if (!allFinite(highs) || !allFinite(lows)) {
        out.diagnostics.push_back("swing detector: non-finite prices in input, no pivots");
        LOG_WARN("Swing detector: NaN or Inf found in highs/lows, returning no pivots");
        return out;
    }

    scan(highs, lows, epsilon, out);

    LOG_DEBUG("Swing detector '{}' confirmed {} pivots over {} bars (epsilon={})",
              name(), out.pivotCount(), n, epsilon);
    return out;
}

void IterativeSwingDetector::scan(const std::vector<double>& highs,
                                  const std::vector<double>& lows,
                                  double epsilon,
                                  SwingResult& out) const {
    const std::size_t n = highs.size();

    // Seed: first bar that moves epsilon away from the running low or high
    // of the bars before it.
    std::size_t low_index = 0;
    std::size_t high_index = 0;
    double running_low = lows[0];
    double running_high = highs[0];
    int direction = 0;
    std::size_t i = 1;
    for (; i < n; ++i) {
        if (risesBy(running_low, highs[i], epsilon)) {
            direction = 1;
            break;
        }
        if (risesBy(lows[i], running_high, epsilon)) {
            direction = -1;
            break;
        }
        if (lows[i] < running_low) {
            running_low = lows[i];
            low_index = i;
        }
        if (highs[i] > running_high) {
            running_high = highs[i];
            high_index = i;
        }
    }

    if (direction == 0) {
        return;
    }

    std::size_t extreme_index = 0;
    double extreme = 0.0;
    if (direction == 1) {
        out.markers[low_index] = -1;
        out.turning_points[i] = 1;
        extreme_index = low_index + 1;
        extreme = highs[extreme_index];
        for (std::size_t k = low_index + 2; k <= i; ++k) {
            if (highs[k] > extreme) {
                extreme = highs[k];
                extreme_index = k;
            }
        }
    } else {
        out.markers[high_index] = 1;
        out.turning_points[i] = -1;
        extreme_index = high_index + 1;
        extreme = lows[extreme_index];
        for (std::size_t k = high_index + 2; k <= i; ++k) {
            if (lows[k] < extreme) {
                extreme = lows[k];
                extreme_index = k;
            }
        }
    }

    for (++i; i < n; ++i) {
        if (reversalAt(direction, extreme, highs[i], lows[i], epsilon)) {
            out.markers[extreme_index] = direction;
            out.turning_points[i] = -direction;
            direction = -direction;
            extreme_index = i;
            extreme = (direction == 1) ? highs[i] : lows[i];
            continue;
        }
        if (direction == 1 && highs[i] > extreme) {
            extreme = highs[i];
            extreme_index = i;
        } else if (direction == -1 && lows[i] < extreme) {
            extreme = lows[i];
            extreme_index = i;
        }
    }
}

LegScanSwingDetector::LegScanSwingDetector(std::size_t initial_block)
    : initial_block_(std::max<std::size_t>(1, initial_block)) {}

void LegScanSwingDetector::scan(const std::vector<double>& highs,
                                const std::vector<double>& lows,
                                double epsilon,
                                SwingResult& out) const {
    const std::size_t n = highs.size();

    std::vector<Extreme> prefix_low(n);
    std::vector<Extreme> prefix_high(n);
    for (std::size_t k = 0; k < n; ++k) {
        prefix_low[k] = {lows[k], k};
        prefix_high[k] = {highs[k], k};
    }
    std::partial_sum(prefix_low.begin(), prefix_low.end(), prefix_low.begin(), lowerOf);
    std::partial_sum(prefix_high.begin(), prefix_high.end(), prefix_high.begin(), higherOf);

    std::size_t seed = 0;
    int direction = 0;
    for (std::size_t i = 1; i < n && direction == 0; ++i) {
        if (risesBy(prefix_low[i - 1].value, highs[i], epsilon)) {
            direction = 1;
            seed = i;
        } else if (risesBy(lows[i], prefix_high[i - 1].value, epsilon)) {
            direction = -1;
            seed = i;
        }
    }
    if (direction == 0) {
        return;
    }

    Extreme extreme{};
    if (direction == 1) {
        const std::size_t pivot = prefix_low[seed - 1].index;
        out.markers[pivot] = -1;
        out.turning_points[seed] = 1;
        const auto it = std::max_element(highs.begin() + static_cast<std::ptrdiff_t>(pivot + 1),
                                         highs.begin() + static_cast<std::ptrdiff_t>(seed + 1));
        extreme = {*it, static_cast<std::size_t>(it - highs.begin())};
    } else {
        const std::size_t pivot = prefix_high[seed - 1].index;
        out.markers[pivot] = 1;
        out.turning_points[seed] = -1;
        const auto it = std::min_element(lows.begin() + static_cast<std::ptrdiff_t>(pivot + 1),
                                         lows.begin() + static_cast<std::ptrdiff_t>(seed + 1));
        extreme = {*it, static_cast<std::size_t>(it - lows.begin())};
    }

    std::vector<Extreme> running;
    std::size_t from = seed + 1;
    while (from < n) {
        std::size_t block = initial_block_;
        std::size_t begin = from;
        Extreme carry = extreme;  // leg extreme before bar `begin`
        bool reversed = false;

        while (begin < n && !reversed) {
            const std::size_t end = std::min(n, begin + block);
            const std::vector<double>& source = (direction == 1) ? highs : lows;

            running.resize(end - begin);
            for (std::size_t k = begin; k < end; ++k) {
                running[k - begin] = {source[k], k};
            }
            if (direction == 1) {
                running[0] = higherOf(carry, running[0]);
                std::partial_sum(running.begin(), running.end(), running.begin(), higherOf);
            } else {
                running[0] = lowerOf(carry, running[0]);
                std::partial_sum(running.begin(), running.end(), running.begin(), lowerOf);
            }

            for (std::size_t j = begin; j < end; ++j) {
                const Extreme& before = (j == begin) ? carry : running[j - begin - 1];
                if (reversalAt(direction, before.value, highs[j], lows[j], epsilon)) {
                    out.markers[before.index] = direction;
                    out.turning_points[j] = -direction;
                    direction = -direction;
                    extreme = {(direction == 1) ? highs[j] : lows[j], j};
                    from = j + 1;
                    reversed = true;
                    break;
                }
            }

            if (!reversed) {
                carry = running.back();
                begin = end;
                block *= 2;
            }
        }

        if (!reversed) {
            break;
        }
    }
}

std::unique_ptr<ISwingDetector> makeSwingDetector(SwingDetectorKind kind) {
    switch (kind) {
        case SwingDetectorKind::LEG_SCAN:
            return std::make_unique<LegScanSwingDetector>();
        case SwingDetectorKind::REFERENCE:
        default:
            return std::make_unique<IterativeSwingDetector>();
    }
}

SwingDetectorKind swingDetectorKindFromString(const std::string& value) {
    if (value == "reference" || value == "iterative") {
        return SwingDetectorKind::REFERENCE;
    }
    if (value == "leg_scan") {
        return SwingDetectorKind::LEG_SCAN;
    }
    throw std::invalid_argument("unknown swing detector: " + value);
}

std::string toString(SwingDetectorKind kind) {
    return kind == SwingDetectorKind::LEG_SCAN ? "leg_scan" : "reference";
}

} // namespace analytics
} // namespace swingfib
