#include "backtest/DataHistory.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace swingfib {
namespace backtest {

namespace {
std::string trim(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // UTF-8 BOM on the first cell
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

double field(const nlohmann::json& item, const char* long_key, const char* short_key) {
    if (item.contains(long_key)) return item.at(long_key).get<double>();
    if (item.contains(short_key)) return item.at(short_key).get<double>();
    throw std::runtime_error(std::string("missing field '") + long_key + "'");
}
}

CandleSeries DataHistory::loadCSV(const std::string& file_path) {
    CandleSeries candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return candles;
    }

    std::string line;
    std::size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;
        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.empty() || row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
            // header
            continue;
        }
        if (row.size() < 6) {
            LOG_WARN("Skipping CSV line {}: expected 6 columns, got {}", line_no, row.size());
            continue;
        }

        try {
            candles.emplace_back(std::stod(row[1]), std::stod(row[2]), std::stod(row[3]),
                                 std::stod(row[4]), std::stod(row[5]), std::stoll(row[0]));
        } catch (const std::exception& e) {
            LOG_WARN("Skipping CSV line {}: {} - {}", line_no, line, e.what());
        }
    }

    normalize(candles);
    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

CandleSeries DataHistory::loadJSON(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return {};
    }

    CandleSeries candles;
    try {
        nlohmann::json j;
        file >> j;
        candles = parseJSON(j);
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        return {};
    }

    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

CandleSeries DataHistory::load(const std::string& file_path) {
    std::string lower = file_path;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower.size() >= 5 && lower.compare(lower.size() - 5, 5, ".json") == 0) {
        return loadJSON(file_path);
    }
    return loadCSV(file_path);
}

CandleSeries DataHistory::parseJSON(const nlohmann::json& rows) {
    if (!rows.is_array()) {
        throw std::runtime_error("candle JSON must be an array");
    }

    CandleSeries candles;
    candles.reserve(rows.size());
    std::size_t index = 0;
    for (const auto& item : rows) {
        try {
            if (item.is_array()) {
                if (item.size() < 6) {
                    throw std::runtime_error("expected 6 values, got " + std::to_string(item.size()));
                }
                candles.emplace_back(item[1].get<double>(), item[2].get<double>(),
                                     item[3].get<double>(), item[4].get<double>(),
                                     item[5].get<double>(), item[0].get<long long>());
            } else if (item.is_object()) {
                const long long ts = item.contains("timestamp")
                    ? item.at("timestamp").get<long long>()
                    : item.at("t").get<long long>();
                candles.emplace_back(field(item, "open", "o"), field(item, "high", "h"),
                                     field(item, "low", "l"), field(item, "close", "c"),
                                     item.contains("volume") || item.contains("v")
                                         ? field(item, "volume", "v") : 0.0,
                                     ts);
            } else {
                throw std::runtime_error("row is neither array nor object");
            }
        } catch (const std::exception& e) {
            LOG_WARN("Skipping JSON row {}: {}", index, e.what());
        }
        ++index;
    }

    normalize(candles);
    return candles;
}

void DataHistory::normalize(CandleSeries& candles) {
    for (auto& c : candles) {
        c.timestamp = toMsTimestamp(c.timestamp);
    }

    std::stable_sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp < b.timestamp;
    });

    const auto before = candles.size();
    candles.erase(std::unique(candles.begin(), candles.end(),
                              [](const Candle& a, const Candle& b) {
                                  return a.timestamp == b.timestamp;
                              }),
                  candles.end());
    if (candles.size() != before) {
        LOG_WARN("Dropped {} candles with duplicate timestamps", before - candles.size());
    }
}

CandleSeries DataHistory::filterByTime(const CandleSeries& candles, long long start_ms, long long end_ms) {
    CandleSeries out;
    std::copy_if(candles.begin(), candles.end(), std::back_inserter(out),
                 [start_ms, end_ms](const Candle& c) {
                     return c.timestamp >= start_ms && c.timestamp <= end_ms;
                 });
    return out;
}

long long DataHistory::toMsTimestamp(long long ts) {
    // 1e12 ms is 2001-09; anything smaller is taken as seconds
    if (ts > 0 && ts < 1000000000000LL) {
        return ts * 1000LL;
    }
    return ts;
}

} // namespace backtest
} // namespace swingfib
