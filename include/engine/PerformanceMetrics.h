#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "common/Types.h"

namespace swingfib {
namespace engine {

// Fixed values reported instead of undefined or unreliable statistics.
namespace sentinel {
constexpr double INSUFFICIENT_DATA_RATIO = -5.0;
constexpr double DEGENERATE_POSITIVE_RATIO = 10.0;
constexpr double DEGENERATE_NEGATIVE_RATIO = -10.0;
constexpr double TOTAL_LOSS_DRAWDOWN = 1.0;
constexpr double UNRELIABLE_RATIO = -5.0;
constexpr double UNRELIABLE_DRAWDOWN = 1.0;
constexpr double DEGRADED_TOTAL_RETURN = -1.0;
constexpr double DEFAULT_PERIODS_PER_YEAR = 252.0;
} // namespace sentinel

struct MetricsConfig {
    double risk_free_rate = 0.0;    // per period
    double target_return = 0.0;     // per period, Sortino threshold
    int min_trades_for_stats = 5;
};

struct PerformanceSummary {
    double total_log_return = 0.0;
    double total_return = 0.0;          // compounded, exp(total_log_return) - 1
    double annualized_return = 0.0;
    double sharpe_ratio = 0.0;
    double sortino_ratio = 0.0;
    double max_drawdown = 0.0;
    int trade_count = 0;
    bool statistics_reliable = true;
};

struct TradeStatistics {
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;
    double gross_profit = 0.0;      // sum of winning trade returns
    double gross_loss_abs = 0.0;    // sum of |losing trade returns|
    double profit_factor = 0.0;
    double avg_win_return = 0.0;
    double avg_loss_return = 0.0;
    double expectancy = 0.0;        // mean trade return
    double avg_holding_bars = 0.0;
};

class PerformanceMetrics {
public:
    // 365 days over the median bar spacing; 252 when undetermined.
    static double periodsPerYear(const std::vector<long long>& timestamps_ms);

    // "15m", "8h", "1d", "1w", "1mo"; 252 when the format is not recognized.
    static double periodsPerYear(const std::string& timeframe);

    // false for an unknown unit, a zero count or a count that overflows
    static bool parseTimeframe(const std::string& timeframe, double& periods_per_year);

    // Zero returns (flat bars) are excluded. Fewer than two remaining
    // observations give INSUFFICIENT_DATA_RATIO; a zero or non-finite
    // deviation gives +/-10 depending on the mean versus the threshold.
    static double sharpeRatio(const std::vector<double>& returns,
                              double periods_per_year,
                              double risk_free_rate = 0.0);

    static double sortinoRatio(const std::vector<double>& returns,
                               double periods_per_year,
                               double target_return = 0.0);

    // Largest (peak - equity) / peak of 1 + cumulative_return, with a unit
    // equity before the first bar. NaN gaps are forward filled.
    static double maxDrawdown(const std::vector<double>& cumulative_returns);

    // exp(running sum of log returns) - 1
    static std::vector<double> compoundedReturns(const std::vector<double>& log_returns);

    static double annualizedReturn(double cumulative_return,
                                   std::size_t periods,
                                   double periods_per_year);

    // Below min_trades_for_stats the ratios and drawdown are replaced by the
    // UNRELIABLE sentinels.
    static PerformanceSummary summarizeStrategy(const std::vector<double>& log_returns,
                                                int trade_count,
                                                double periods_per_year,
                                                const MetricsConfig& config);

    static PerformanceSummary summarizeBenchmark(const std::vector<double>& log_returns,
                                                 double periods_per_year,
                                                 const MetricsConfig& config);

    static TradeStatistics tradeStatistics(const std::vector<Trade>& trades);

private:
    static std::vector<double> activeReturns(const std::vector<double>& returns);
    static double calculateMean(const std::vector<double>& values);
    static double calculateSampleStdDev(const std::vector<double>& values, double mean);
    static void fillReturns(PerformanceSummary& summary,
                            const std::vector<double>& log_returns,
                            double periods_per_year);
};

} // namespace engine
} // namespace swingfib
