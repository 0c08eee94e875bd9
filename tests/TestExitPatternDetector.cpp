#include "analytics/ExitPatternDetector.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

using swingfib::analytics::ExitPatternDetector;

int main() {
    {
        const std::vector<double> prices{1, 2, 5, 2, 1, 2, 3};
        const auto r = ExitPatternDetector::detect(prices, prices, 1);
        assert((r.high_exit == std::vector<bool>{false, false, true, false, false, false, false}));
        assert((r.low_exit == std::vector<bool>{false, false, false, false, true, false, false}));
    }

    // Wider window drops the shallow low at bar 4
    {
        const std::vector<double> highs{3, 4, 6, 4, 3, 2.5, 4, 5, 6};
        const std::vector<double> lows{2, 3, 5, 3, 2, 2.5, 3, 1.5, 5};
        const auto r1 = ExitPatternDetector::detect(highs, lows, 1);
        assert(r1.low_exit[4]);
        const auto r2 = ExitPatternDetector::detect(highs, lows, 2);
        assert(r2.high_exit[2]);
        assert(r2.low_exit[4]);
        const auto r3 = ExitPatternDetector::detect(highs, lows, 3);
        assert(!r3.low_exit[4]);
    }

    // Plateau: only the bar that steps up onto it passes the strict rule
    {
        const std::vector<double> highs{1, 3, 3, 1, 0};
        const std::vector<double> lows{1, 1, 1, 1, 0};
        const auto r = ExitPatternDetector::detect(highs, lows, 1);
        assert(r.high_exit[1]);
        assert(!r.high_exit[2]);
        // equal lows never beat the previous bar
        assert(!r.low_exit[1] && !r.low_exit[2]);
    }

    // Edge bars without a full window are never flagged
    {
        const std::vector<double> highs{9, 1, 2, 3, 9};
        const std::vector<double> lows{0, 5, 6, 7, 0};
        const auto r = ExitPatternDetector::detect(highs, lows, 1);
        assert(!r.high_exit.front() && !r.high_exit.back());
        assert(!r.low_exit.front() && !r.low_exit.back());

        const auto short_series = ExitPatternDetector::detect({1, 2, 1, 2}, {1, 2, 1, 2}, 2);
        for (bool f : short_series.high_exit) assert(!f);
        for (bool f : short_series.low_exit) assert(!f);
    }

    // NaN in the window suppresses the flag
    {
        std::vector<double> highs{1, 2, 5, 2, 1};
        highs[3] = std::nan("");
        const auto r = ExitPatternDetector::detect(highs, highs, 1);
        assert(!r.high_exit[2]);
    }

    // Input-shape errors
    {
        bool threw_width = false;
        try {
            ExitPatternDetector::detect({1, 2, 3}, {1, 2, 3}, 0);
        } catch (const std::invalid_argument&) {
            threw_width = true;
        }
        assert(threw_width);

        bool threw_len = false;
        try {
            ExitPatternDetector::detect({1, 2, 3}, {1, 2}, 1);
        } catch (const std::invalid_argument&) {
            threw_len = true;
        }
        assert(threw_len);
    }

    std::cout << "[TEST] ExitPatternDetector PASSED\n";
    return 0;
}
