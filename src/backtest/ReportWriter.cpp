#include "backtest/ReportWriter.h"
#include "common/Logger.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace swingfib {
namespace backtest {

namespace {
nlohmann::json summaryToJson(const engine::PerformanceSummary& s) {
    nlohmann::json j;
    j["total_log_return"] = s.total_log_return;
    j["total_return"] = s.total_return;
    j["annualized_return"] = s.annualized_return;
    j["sharpe_ratio"] = s.sharpe_ratio;
    j["sortino_ratio"] = s.sortino_ratio;
    j["max_drawdown"] = s.max_drawdown;
    j["statistics_reliable"] = s.statistics_reliable;
    return j;
}

nlohmann::json statsToJson(const engine::TradeStatistics& s) {
    nlohmann::json j;
    j["total_trades"] = s.total_trades;
    j["winning_trades"] = s.winning_trades;
    j["losing_trades"] = s.losing_trades;
    j["win_rate"] = s.win_rate;
    j["gross_profit"] = s.gross_profit;
    j["gross_loss_abs"] = s.gross_loss_abs;
    j["profit_factor"] = s.profit_factor;
    j["avg_win_return"] = s.avg_win_return;
    j["avg_loss_return"] = s.avg_loss_return;
    j["expectancy"] = s.expectancy;
    j["avg_holding_bars"] = s.avg_holding_bars;
    return j;
}

// JSON has no NaN; unresolved levels become null.
nlohmann::json numberOrNull(double v) {
    if (!std::isfinite(v)) {
        return nullptr;
    }
    return v;
}

std::vector<int> toInts(const std::vector<bool>& flags) {
    std::vector<int> out;
    out.reserve(flags.size());
    for (bool f : flags) {
        out.push_back(f ? 1 : 0);
    }
    return out;
}
}

nlohmann::json ReportWriter::toJson(const BacktestEngine::Result& result) {
    nlohmann::json report;

    report["strategy"] = summaryToJson(result.strategy);
    report["strategy"]["trade_count"] = result.strategy.trade_count;
    report["benchmark"] = summaryToJson(result.benchmark);
    report["trade_statistics"] = statsToJson(result.trade_statistics);

    report["trades"] = nlohmann::json::array();
    for (const auto& trade : result.trades) {
        nlohmann::json t;
        t["entry_index"] = trade.entry_index;
        t["exit_index"] = trade.exit_index;
        t["entry_time"] = trade.entry_time;
        t["exit_time"] = trade.exit_time;
        t["entry_price"] = trade.entry_price;
        t["exit_price"] = trade.exit_price;
        t["log_return"] = trade.logReturn();
        t["holding_bars"] = trade.holdingBars();
        report["trades"].push_back(t);
    }

    report["pivots"] = nlohmann::json::array();
    for (const auto& pivot : result.signals.pivots) {
        nlohmann::json p;
        p["location"] = pivot.location;
        p["timestamp"] = pivot.timestamp;
        p["type"] = pivot.type == PivotType::PEAK ? "peak" : "trough";
        p["price"] = pivot.price;
        report["pivots"].push_back(p);
    }

    const auto& sim = result.simulation;
    nlohmann::json series;
    series["entry"] = toInts(result.signals.entry);
    series["exit"] = toInts(result.signals.exit);
    series["position"] = sim.position;
    series["log_return"] = sim.log_returns;
    series["strategy_log_return"] = sim.strategy_log_returns;
    series["cumulative_strategy"] = sim.cumulative_strategy;
    series["cumulative_benchmark"] = sim.cumulative_benchmark;
    series["swing_marker"] = result.signals.swing.markers;
    series["turning_point"] = result.signals.swing.turning_points;

    const auto& projection = result.signals.projection;
    nlohmann::json levels = nlohmann::json::object();
    for (std::size_t r = 0; r < projection.ratios.size(); ++r) {
        nlohmann::json column = nlohmann::json::array();
        for (double v : projection.levels[r]) {
            column.push_back(numberOrNull(v));
        }
        std::ostringstream key;
        key << projection.ratios[r];
        levels[key.str()] = column;
    }
    series["retracement_levels"] = levels;
    report["series"] = series;

    report["periods_per_year"] = result.periods_per_year;
    report["bar_count"] = result.bar_count;
    report["degraded"] = result.degraded;
    report["diagnostics"] = result.diagnostics;
    return report;
}

void ReportWriter::writeJson(const BacktestEngine::Result& result, const std::string& file_path) {
    const std::filesystem::path path(file_path);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open report file: " + file_path);
    }
    out << toJson(result).dump(2) << "\n";
    if (!out) {
        throw std::runtime_error("Failed to write report file: " + file_path);
    }
    LOG_INFO("Report written: {}", file_path);
}

void ReportWriter::logTrades(const BacktestEngine::Result& result) {
    for (const auto& trade : result.trades) {
        Logger::getInstance().logTrade(trade.entry_time, trade.exit_time,
                                       trade.entry_price, trade.exit_price, trade.logReturn());
    }
}

std::string ReportWriter::formatSummaryTable(const BacktestEngine::Result& result) {
    std::ostringstream oss;
    auto row = [&oss](const std::string& label, double strategy, double benchmark) {
        oss << std::left << std::setw(20) << label
            << std::right << std::fixed << std::setprecision(4)
            << std::setw(14) << strategy << std::setw(14) << benchmark << "\n";
    };

    oss << std::left << std::setw(20) << "metric"
        << std::right << std::setw(14) << "strategy" << std::setw(14) << "benchmark" << "\n";
    row("total_log_return", result.strategy.total_log_return, result.benchmark.total_log_return);
    row("total_return", result.strategy.total_return, result.benchmark.total_return);
    row("annualized_return", result.strategy.annualized_return, result.benchmark.annualized_return);
    row("sharpe_ratio", result.strategy.sharpe_ratio, result.benchmark.sharpe_ratio);
    row("sortino_ratio", result.strategy.sortino_ratio, result.benchmark.sortino_ratio);
    row("max_drawdown", result.strategy.max_drawdown, result.benchmark.max_drawdown);
    oss << std::left << std::setw(20) << "trades" << std::right << std::setw(14)
        << result.strategy.trade_count << "\n";
    oss << std::left << std::setw(20) << "win_rate" << std::right << std::setw(14)
        << std::setprecision(4) << result.trade_statistics.win_rate << "\n";
    return oss.str();
}

} // namespace backtest
} // namespace swingfib
