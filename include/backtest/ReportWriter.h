#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "backtest/BacktestEngine.h"

namespace swingfib {
namespace backtest {

// {strategy, benchmark, trade_statistics, trades, series, diagnostics}
class ReportWriter {
public:
    static nlohmann::json toJson(const BacktestEngine::Result& result);

    // Throws std::runtime_error when the file cannot be opened or written.
    static void writeJson(const BacktestEngine::Result& result, const std::string& file_path);

    // One line per trade on the trade logger.
    static void logTrades(const BacktestEngine::Result& result);

    // Side-by-side strategy/benchmark table for the console.
    static std::string formatSummaryTable(const BacktestEngine::Result& result);
};

} // namespace backtest
} // namespace swingfib
