#include "analytics/RetracementProjector.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace swingfib {
namespace analytics {

namespace {
constexpr double RATIO_TOLERANCE = 1e-9;
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

bool sameRatio(double a, double b) {
    return std::abs(a - b) <= RATIO_TOLERANCE;
}

void copyRow(RetracementProjection& p, std::size_t from, std::size_t to) {
    for (auto& series : p.levels) {
        series[to] = series[from];
    }
    p.segment_start_price[to] = p.segment_start_price[from];
    p.segment_end_price[to] = p.segment_end_price[from];
    p.segment_direction[to] = p.segment_direction[from];
    p.last_pivot_location[to] = p.last_pivot_location[from];
    p.last_pivot_type[to] = p.last_pivot_type[from];
    p.last_pivot_price[to] = p.last_pivot_price[from];
}
}

std::size_t RetracementProjection::firstResolvedBar() const {
    const auto it = std::find_if(segment_direction.begin(), segment_direction.end(),
                                 [](int d) { return d != 0; });
    return static_cast<std::size_t>(it - segment_direction.begin());
}

int RetracementProjection::ratioIndex(double ratio) const {
    for (std::size_t i = 0; i < ratios.size(); ++i) {
        if (sameRatio(ratios[i], ratio)) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

const std::vector<double>& RetracementProjection::levelSeries(double ratio) const {
    const int idx = ratioIndex(ratio);
    if (idx < 0) {
        throw std::out_of_range("retracement ratio not projected: " + std::to_string(ratio));
    }
    return levels[static_cast<std::size_t>(idx)];
}

double RetracementProjection::levelAt(std::size_t bar, double ratio) const {
    if (bar >= size() || !isResolved(bar)) {
        return NaN;
    }
    return RetracementProjector::levelFor(segment_start_price[bar], segment_end_price[bar], ratio);
}

void RetracementProjection::backfillLeadIn() {
    const std::size_t first = firstResolvedBar();
    if (first >= size()) {
        return;
    }
    for (std::size_t bar = 0; bar < first; ++bar) {
        copyRow(*this, first, bar);
    }
}

const std::vector<double>& RetracementProjector::defaultRatios() {
    static const std::vector<double> ratios{0.0, 0.236, 0.382, 0.5, 0.618, 0.786, 1.0};
    return ratios;
}

RetracementProjector::RetracementProjector(std::vector<double> ratios)
    : ratios_(std::move(ratios)) {
    if (ratios_.empty()) {
        throw std::invalid_argument("retracement projector: ratio set is empty");
    }
    for (double r : ratios_) {
        if (!std::isfinite(r)) {
            throw std::invalid_argument("retracement projector: non-finite ratio");
        }
    }
    std::sort(ratios_.begin(), ratios_.end());
    ratios_.erase(std::unique(ratios_.begin(), ratios_.end(), sameRatio), ratios_.end());
}

RetracementProjection RetracementProjector::project(const CandleSeries& candles,
                                                    const std::vector<Pivot>& pivots) const {
    const std::size_t n = candles.size();

    RetracementProjection out;
    out.ratios = ratios_;
    out.levels.assign(ratios_.size(), std::vector<double>(n, NaN));
    out.segment_start_price.assign(n, NaN);
    out.segment_end_price.assign(n, NaN);
    out.segment_direction.assign(n, 0);
    out.last_pivot_location.assign(n, -1);
    out.last_pivot_type.assign(n, 0);
    out.last_pivot_price.assign(n, NaN);

    for (const auto& p : pivots) {
        if (p.location >= n) {
            throw std::invalid_argument(
                "retracement projector: pivot location " + std::to_string(p.location) +
                " outside series of " + std::to_string(n) + " bars");
        }
    }

    if (pivots.size() < 2) {
        return out;
    }

    for (std::size_t i = 0; i + 1 < pivots.size(); ++i) {
        const Pivot& start = pivots[i];
        const Pivot& end = pivots[i + 1];

        if (start.location >= end.location || end.price - start.price == 0.0) {
            out.skipped_segments++;
            continue;
        }
        out.valid_segments++;

        const std::size_t fill_begin = end.location + 1;
        // (end_loc, next_end_loc], next segment starts after its own end pivot
        const std::size_t fill_end = (i + 2 < pivots.size()) ? std::min(n, pivots[i + 2].location + 1) : n;
        const int direction = (end.type == PivotType::PEAK) ? 1 : -1;

        for (std::size_t bar = fill_begin; bar < fill_end; ++bar) {
            for (std::size_t r = 0; r < ratios_.size(); ++r) {
                out.levels[r][bar] = levelFor(start.price, end.price, ratios_[r]);
            }
            out.segment_start_price[bar] = start.price;
            out.segment_end_price[bar] = end.price;
            out.segment_direction[bar] = direction;
            out.last_pivot_location[bar] = static_cast<long long>(end.location);
            out.last_pivot_type[bar] = static_cast<int>(end.type);
            out.last_pivot_price[bar] = end.price;
        }
    }

    // 건너뛴 세그먼트 구간을 직전 값으로 채움
    for (std::size_t bar = 1; bar < n; ++bar) {
        if (!out.isResolved(bar) && out.isResolved(bar - 1)) {
            copyRow(out, bar - 1, bar);
        }
    }

    if (out.skipped_segments > 0) {
        LOG_DEBUG("Retracement projector skipped {} degenerate segments", out.skipped_segments);
    }
    return out;
}

} // namespace analytics
} // namespace swingfib
