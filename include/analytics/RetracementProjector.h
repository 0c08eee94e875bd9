#pragma once

#include <cstddef>
#include <vector>
#include "common/Types.h"

namespace swingfib {
namespace analytics {

// Per-bar retracement levels of the most recently completed segment.
// Bars before the first completed segment stay unresolved (NaN levels,
// direction 0, pivot location -1).
struct RetracementProjection {
    std::vector<double> ratios;
    std::vector<std::vector<double>> levels;   // levels[ratio_index][bar]
    std::vector<double> segment_start_price;
    std::vector<double> segment_end_price;
    std::vector<int> segment_direction;        // +1 up, -1 down, 0 unresolved
    std::vector<long long> last_pivot_location;
    std::vector<int> last_pivot_type;          // +1 peak, -1 trough, 0 unresolved
    std::vector<double> last_pivot_price;
    std::size_t valid_segments = 0;
    std::size_t skipped_segments = 0;

    std::size_t size() const { return segment_direction.size(); }
    bool isResolved(std::size_t bar) const { return segment_direction[bar] != 0; }
    std::size_t firstResolvedBar() const;
    bool hasResolvedBars() const { return firstResolvedBar() < size(); }

    // -1 when the ratio is not part of the projected set.
    int ratioIndex(double ratio) const;

    // Throws std::out_of_range when the ratio is not projected.
    const std::vector<double>& levelSeries(double ratio) const;

    // Level for any ratio (extensions included) from the segment active at
    // `bar`; NaN when the bar is unresolved.
    double levelAt(std::size_t bar, double ratio) const;

    // Copies the first resolved bar into the unresolved lead-in.
    void backfillLeadIn();
};

class RetracementProjector {
public:
    static const std::vector<double>& defaultRatios();

    // Ratios are sorted and de-duplicated. Throws std::invalid_argument on an
    // empty set or a non-finite ratio.
    explicit RetracementProjector(std::vector<double> ratios = defaultRatios());

    // Each consecutive pivot pair with increasing location and a nonzero
    // price delta is projected onto (end_loc, next_end_loc]; the remaining
    // gaps are forward filled from the most recent valid segment.
    RetracementProjection project(const CandleSeries& candles,
                                  const std::vector<Pivot>& pivots) const;

    const std::vector<double>& ratios() const { return ratios_; }

    static double levelFor(double start_price, double end_price, double ratio) {
        return start_price + (end_price - start_price) * ratio;
    }

private:
    std::vector<double> ratios_;
};

} // namespace analytics
} // namespace swingfib
