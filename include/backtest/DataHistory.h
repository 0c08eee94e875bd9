#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/Types.h"

namespace swingfib {
namespace backtest {

// Edge loader. Unreadable files give an empty series (logged); malformed rows
// are skipped with a warning. Output is normalized (see normalize()).
class DataHistory {
public:
    // timestamp,open,high,low,close,volume (header optional)
    static CandleSeries loadCSV(const std::string& file_path);

    // Array of [ts, o, h, l, c, v] rows or of objects keyed
    // timestamp/open/high/low/close/volume (or t/o/h/l/c/v)
    static CandleSeries loadJSON(const std::string& file_path);

    // Picks the loader by extension (.json, otherwise CSV).
    static CandleSeries load(const std::string& file_path);

    static CandleSeries parseJSON(const nlohmann::json& rows);

    // Seconds -> milliseconds, ascending sort, first row kept per timestamp.
    static void normalize(CandleSeries& candles);

    // Bars with start_ms <= timestamp <= end_ms.
    static CandleSeries filterByTime(const CandleSeries& candles, long long start_ms, long long end_ms);

    static long long toMsTimestamp(long long ts);
};

} // namespace backtest
} // namespace swingfib
