#include "analytics/RetracementProjector.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace swingfib;
using namespace swingfib::analytics;

namespace {

bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}

CandleSeries flatCandles(std::size_t n) {
    CandleSeries candles;
    for (std::size_t i = 0; i < n; ++i) {
        candles.emplace_back(15.0, 15.0, 15.0, 15.0, 1.0, 1000LL * static_cast<long long>(i + 1));
    }
    return candles;
}

Pivot pivot(std::size_t loc, PivotType type, double price) {
    Pivot p;
    p.location = loc;
    p.timestamp = 1000LL * static_cast<long long>(loc + 1);
    p.type = type;
    p.price = price;
    return p;
}

} // namespace

int main() {
    const RetracementProjector projector;

    // Each segment covers (end_loc, next_end_loc]; lead-in stays unresolved
    {
        const auto candles = flatCandles(10);
        const std::vector<Pivot> pivots{
            pivot(1, PivotType::TROUGH, 10.0),
            pivot(3, PivotType::PEAK, 20.0),
            pivot(6, PivotType::TROUGH, 15.0),
        };
        const auto p = projector.project(candles, pivots);

        assert(p.size() == 10);
        assert(p.valid_segments == 2 && p.skipped_segments == 0);
        for (std::size_t bar = 0; bar <= 3; ++bar) {
            assert(!p.isResolved(bar));
            assert(std::isnan(p.levelSeries(0.618)[bar]));
            assert(p.last_pivot_location[bar] == -1);
        }
        assert(p.firstResolvedBar() == 4);

        for (std::size_t bar = 4; bar <= 6; ++bar) {
            assert(p.segment_direction[bar] == 1);
            assert(near(p.levelSeries(0.618)[bar], 16.18));
            assert(p.last_pivot_location[bar] == 3);
            assert(p.last_pivot_type[bar] == 1);
            assert(near(p.last_pivot_price[bar], 20.0));
        }
        for (std::size_t bar = 7; bar < 10; ++bar) {
            assert(p.segment_direction[bar] == -1);
            assert(near(p.levelSeries(0.618)[bar], 20.0 - 5.0 * 0.618));
            assert(near(p.segment_start_price[bar], 20.0));
            assert(near(p.segment_end_price[bar], 15.0));
        }

        // Extension ratios come from the active segment
        assert(near(p.levelAt(4, 1.618), 26.18));
        assert(std::isnan(p.levelAt(2, 1.618)));

        bool threw = false;
        try {
            p.levelSeries(0.7);
        } catch (const std::out_of_range&) {
            threw = true;
        }
        assert(threw);
        assert(p.ratioIndex(0.7) == -1);
        assert(p.ratioIndex(0.618) == 4);
    }

    // Adjacent pivots: the next end pivot bar still belongs to the earlier segment
    {
        const auto candles = flatCandles(6);
        const std::vector<Pivot> pivots{
            pivot(1, PivotType::TROUGH, 10.0),
            pivot(2, PivotType::PEAK, 20.0),
            pivot(3, PivotType::TROUGH, 15.0),
        };
        const auto p = projector.project(candles, pivots);
        assert(p.segment_direction[3] == 1);
        assert(p.segment_direction[4] == -1);
        assert(p.segment_direction[5] == -1);
    }

    // Degenerate segment is skipped and its span forward filled
    {
        const auto candles = flatCandles(10);
        const std::vector<Pivot> pivots{
            pivot(0, PivotType::TROUGH, 10.0),
            pivot(2, PivotType::PEAK, 20.0),
            pivot(4, PivotType::TROUGH, 20.0),
            pivot(6, PivotType::PEAK, 30.0),
        };
        const auto p = projector.project(candles, pivots);
        assert(p.valid_segments == 2);
        assert(p.skipped_segments == 1);
        for (std::size_t bar = 3; bar <= 6; ++bar) {
            assert(near(p.segment_start_price[bar], 10.0));
            assert(near(p.segment_end_price[bar], 20.0));
        }
        for (std::size_t bar = 7; bar < 10; ++bar) {
            assert(near(p.segment_start_price[bar], 20.0));
            assert(near(p.segment_end_price[bar], 30.0));
        }
    }

    // Fewer than 2 pivots: nothing resolves
    {
        const auto candles = flatCandles(5);
        const auto none = projector.project(candles, {});
        assert(!none.hasResolvedBars());
        const auto single = projector.project(candles, {pivot(1, PivotType::PEAK, 15.0)});
        assert(!single.hasResolvedBars());
        assert(single.levels.size() == projector.ratios().size());
    }

    // Lead-in backfill copies the first resolved bar
    {
        const auto candles = flatCandles(8);
        const std::vector<Pivot> pivots{
            pivot(1, PivotType::TROUGH, 10.0),
            pivot(3, PivotType::PEAK, 20.0),
        };
        auto p = projector.project(candles, pivots);
        p.backfillLeadIn();
        for (std::size_t bar = 0; bar < 8; ++bar) {
            assert(p.isResolved(bar));
            assert(near(p.levelSeries(0.5)[bar], 15.0));
        }
    }

    // Ratio set handling
    {
        const RetracementProjector custom({0.5, 0.0, 0.5, 1.0});
        assert((custom.ratios() == std::vector<double>{0.0, 0.5, 1.0}));

        bool threw_empty = false;
        try {
            RetracementProjector bad(std::vector<double>{});
        } catch (const std::invalid_argument&) {
            threw_empty = true;
        }
        assert(threw_empty);

        bool threw_nan = false;
        try {
            RetracementProjector bad({0.5, std::nan("")});
        } catch (const std::invalid_argument&) {
            threw_nan = true;
        }
        assert(threw_nan);
    }

    // Pivot outside the series
    {
        bool threw = false;
        try {
            projector.project(flatCandles(3), {pivot(0, PivotType::TROUGH, 1.0), pivot(5, PivotType::PEAK, 2.0)});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] RetracementProjector PASSED\n";
    return 0;
}
