#include "backtest/DataHistory.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace swingfib;
using namespace swingfib::backtest;

int main() {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "swingfib_data_test";
    fs::create_directories(dir);

    // CSV: BOM + header, quoted cells, seconds timestamps, unsorted with a duplicate
    {
        const fs::path csv = dir / "bars.csv";
        {
            std::ofstream out(csv, std::ios::binary);
            out << "\xEF\xBB\xBFtimestamp,open,high,low,close,volume\n";
            out << "1700000120,12,13,11,12.5,30\n";
            out << "\"1700000000\",\"10\",\"11\",\"9\",\"10.5\",\"10\"\r\n";
            out << "1700000060,11,12,10,11.5,20\n";
            out << "1700000060,99,99,99,99,99\n";
            out << "1700000180,1,2\n";
            out << "1700000240,x,1,1,1,1\n";
            out << "\n";
        }
        const auto candles = DataHistory::load(csv.string());
        assert(candles.size() == 3);
        assert(candles[0].timestamp == 1700000000000LL);
        assert(candles[0].close == 10.5);
        assert(candles[1].timestamp == 1700000060000LL);
        // first row wins on a duplicate timestamp
        assert(candles[1].open == 11.0);
        assert(candles[2].timestamp == 1700000120000LL);
        assert(candles[2].volume == 30.0);
    }

    // JSON: array rows and object rows with long or short keys
    {
        const fs::path json = dir / "bars.JSON";
        {
            std::ofstream out(json);
            out << R"([
                [1700000060000, 2, 3, 1, 2.5, 5],
                {"timestamp": 1700000000000, "open": 1, "high": 2, "low": 0.5, "close": 1.5, "volume": 4},
                {"t": 1700000120, "o": 3, "h": 4, "l": 2, "c": 3.5},
                {"t": 1700000180000, "o": 3}
            ])";
        }
        const auto candles = DataHistory::load(json.string());
        assert(candles.size() == 3);
        assert(candles[0].close == 1.5 && candles[0].volume == 4.0);
        assert(candles[1].timestamp == 1700000060000LL);
        assert(candles[2].timestamp == 1700000120000LL);
        assert(candles[2].volume == 0.0);

        const auto window = DataHistory::filterByTime(candles, 1700000060000LL, 1700000120000LL);
        assert(window.size() == 2);
        assert(window.front().timestamp == 1700000060000LL);
    }

    // Unreadable inputs give an empty series
    {
        assert(DataHistory::load((dir / "missing.csv").string()).empty());
        assert(DataHistory::load((dir / "missing.json").string()).empty());

        const fs::path bad = dir / "bad.json";
        {
            std::ofstream out(bad);
            out << R"({"candles": []})";
        }
        assert(DataHistory::loadJSON(bad.string()).empty());
    }

    {
        assert(DataHistory::toMsTimestamp(1700000000LL) == 1700000000000LL);
        assert(DataHistory::toMsTimestamp(1700000000000LL) == 1700000000000LL);
        assert(DataHistory::toMsTimestamp(0) == 0);
    }

    fs::remove_all(dir);

    std::cout << "[TEST] DataHistory PASSED\n";
    return 0;
}
