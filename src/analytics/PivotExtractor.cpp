#include "analytics/PivotExtractor.h"

#include <stdexcept>
#include <string>

namespace swingfib {
namespace analytics {

std::vector<Pivot> PivotExtractor::extract(const std::vector<int>& markers,
                                           const CandleSeries& candles) {
    if (markers.size() != candles.size()) {
        throw std::invalid_argument(
            "pivot extractor: markers (" + std::to_string(markers.size()) +
            ") and candles (" + std::to_string(candles.size()) + ") differ in length");
    }

    std::vector<Pivot> pivots;
    for (std::size_t i = 0; i < markers.size(); ++i) {
        if (markers[i] == 0) {
            continue;
        }
        Pivot p;
        p.location = i;
        p.timestamp = candles[i].timestamp;
        p.type = markers[i] > 0 ? PivotType::PEAK : PivotType::TROUGH;
        p.price = (p.type == PivotType::PEAK) ? candles[i].high : candles[i].low;
        pivots.push_back(p);
    }
    return pivots;
}

bool PivotExtractor::alternates(const std::vector<Pivot>& pivots) {
    for (std::size_t i = 1; i < pivots.size(); ++i) {
        if (pivots[i].type == pivots[i - 1].type) {
            return false;
        }
        if (pivots[i].location <= pivots[i - 1].location) {
            return false;
        }
    }
    return true;
}

} // namespace analytics
} // namespace swingfib
