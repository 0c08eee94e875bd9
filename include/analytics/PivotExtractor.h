#pragma once

#include <vector>
#include "common/Types.h"

namespace swingfib {
namespace analytics {

class PivotExtractor {
public:
    // Collects every nonzero marker, in bar order, with its timestamp and
    // the high (peak) or low (trough) of that bar.
    // Throws std::invalid_argument when markers and candles differ in length.
    static std::vector<Pivot> extract(const std::vector<int>& markers,
                                      const CandleSeries& candles);

    // True when no two consecutive pivots share a type and locations increase.
    static bool alternates(const std::vector<Pivot>& pivots);
};

} // namespace analytics
} // namespace swingfib
