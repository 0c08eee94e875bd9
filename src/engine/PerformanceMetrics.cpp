#include "engine/PerformanceMetrics.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cmath>
#include <limits>
#include <numeric>

namespace swingfib {
namespace engine {

namespace {
constexpr double MS_PER_YEAR = 365.0 * 24.0 * 60.0 * 60.0 * 1000.0;
constexpr double DAYS_PER_YEAR = 365.25;

double ratioOrSentinel(double ratio) {
    if (!std::isfinite(ratio)) {
        return sentinel::INSUFFICIENT_DATA_RATIO;
    }
    return ratio;
}

double degenerateRatio(double mean, double threshold) {
    return mean > threshold ? sentinel::DEGENERATE_POSITIVE_RATIO
                            : sentinel::DEGENERATE_NEGATIVE_RATIO;
}
}

double PerformanceMetrics::periodsPerYear(const std::vector<long long>& timestamps_ms) {
    if (timestamps_ms.size() < 2) {
        return sentinel::DEFAULT_PERIODS_PER_YEAR;
    }

    std::vector<double> deltas;
    deltas.reserve(timestamps_ms.size() - 1);
    for (std::size_t i = 1; i < timestamps_ms.size(); ++i) {
        deltas.push_back(static_cast<double>(timestamps_ms[i] - timestamps_ms[i - 1]));
    }

    std::sort(deltas.begin(), deltas.end());
    const std::size_t mid = deltas.size() / 2;
    const double median = (deltas.size() % 2 == 1)
        ? deltas[mid]
        : (deltas[mid - 1] + deltas[mid]) / 2.0;

    if (!(median > 0.0)) {
        return sentinel::DEFAULT_PERIODS_PER_YEAR;
    }
    return MS_PER_YEAR / median;
}

bool PerformanceMetrics::parseTimeframe(const std::string& timeframe, double& periods_per_year) {
    std::string tf;
    for (char c : timeframe) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            tf.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }

    std::size_t digits = 0;
    while (digits < tf.size() && std::isdigit(static_cast<unsigned char>(tf[digits]))) {
        ++digits;
    }
    const std::string unit = tf.substr(digits);

    long count = 1;
    if (digits > 0) {
        const std::string number = tf.substr(0, digits);
        errno = 0;
        count = std::strtol(number.c_str(), nullptr, 10);
        if (errno == ERANGE || count > std::numeric_limits<int>::max()) {
            return false;
        }
    }
    if (count <= 0 || unit.empty()) {
        return false;
    }

    const double n = static_cast<double>(count);
    if (unit == "mo") {
        periods_per_year = 12.0 / n;
    } else if (unit == "m") {
        periods_per_year = (60.0 / n) * 24.0 * DAYS_PER_YEAR;
    } else if (unit == "h") {
        periods_per_year = (24.0 / n) * DAYS_PER_YEAR;
    } else if (unit == "d") {
        periods_per_year = DAYS_PER_YEAR / n;
    } else if (unit == "w") {
        periods_per_year = (DAYS_PER_YEAR / 7.0) / n;
    } else {
        return false;
    }
    return true;
}

double PerformanceMetrics::periodsPerYear(const std::string& timeframe) {
    double periods = 0.0;
    if (parseTimeframe(timeframe, periods)) {
        return periods;
    }
    LOG_WARN("Unrecognized timeframe '{}', defaulting to {} periods per year",
             timeframe, sentinel::DEFAULT_PERIODS_PER_YEAR);
    return sentinel::DEFAULT_PERIODS_PER_YEAR;
}

double PerformanceMetrics::sharpeRatio(const std::vector<double>& returns,
                                       double periods_per_year,
                                       double risk_free_rate) {
    if (returns.size() < 2) {
        return sentinel::INSUFFICIENT_DATA_RATIO;
    }
    const auto active = activeReturns(returns);
    if (active.size() < 2) {
        return sentinel::INSUFFICIENT_DATA_RATIO;
    }

    const double mean = calculateMean(active);
    const double std_dev = calculateSampleStdDev(active, mean);
    if (std_dev == 0.0 || !std::isfinite(std_dev)) {
        return degenerateRatio(mean, risk_free_rate);
    }

    const double annualized_mean = mean * periods_per_year;
    const double annualized_std = std_dev * std::sqrt(periods_per_year);
    return ratioOrSentinel((annualized_mean - risk_free_rate * periods_per_year) / annualized_std);
}

double PerformanceMetrics::sortinoRatio(const std::vector<double>& returns,
                                        double periods_per_year,
                                        double target_return) {
    if (returns.size() < 2) {
        return sentinel::INSUFFICIENT_DATA_RATIO;
    }
    const auto active = activeReturns(returns);
    if (active.size() < 2) {
        return sentinel::INSUFFICIENT_DATA_RATIO;
    }

    std::vector<double> downside;
    std::copy_if(active.begin(), active.end(), std::back_inserter(downside),
                 [target_return](double r) { return r < target_return; });

    const double mean = calculateMean(active);
    // 하방 표본이 2개 미만이면 편차가 정의되지 않음 (NaN)
    const double downside_dev = downside.size() < 2
        ? std::numeric_limits<double>::quiet_NaN()
        : calculateSampleStdDev(downside, calculateMean(downside));
    if (downside_dev == 0.0 || !std::isfinite(downside_dev)) {
        return degenerateRatio(mean, target_return);
    }

    const double annualized_mean = mean * periods_per_year;
    const double annualized_downside = downside_dev * std::sqrt(periods_per_year);
    return ratioOrSentinel((annualized_mean - target_return * periods_per_year) / annualized_downside);
}

double PerformanceMetrics::maxDrawdown(const std::vector<double>& cumulative_returns) {
    if (cumulative_returns.size() < 2) {
        return sentinel::TOTAL_LOSS_DRAWDOWN;
    }

    double equity = 1.0;
    double peak = 1.0;
    double max_dd = 0.0;
    for (double cum : cumulative_returns) {
        if (std::isfinite(cum)) {
            equity = 1.0 + cum;
        }
        peak = std::max(peak, equity);
        if (peak == 0.0) {
            continue;
        }
        const double dd = (peak - equity) / peak;
        if (std::isfinite(dd)) {
            max_dd = std::max(max_dd, dd);
        }
    }
    return max_dd;
}

std::vector<double> PerformanceMetrics::compoundedReturns(const std::vector<double>& log_returns) {
    std::vector<double> out;
    out.reserve(log_returns.size());
    double sum = 0.0;
    for (double r : log_returns) {
        if (std::isfinite(r)) {
            sum += r;
        }
        out.push_back(std::exp(sum) - 1.0);
    }
    return out;
}

double PerformanceMetrics::annualizedReturn(double cumulative_return,
                                            std::size_t periods,
                                            double periods_per_year) {
    if (periods == 0 || !(periods_per_year > 0.0)) {
        return 0.0;
    }
    const double years = static_cast<double>(periods) / periods_per_year;
    const double base = 1.0 + cumulative_return;
    const double sign = (base > 0.0) ? 1.0 : (base < 0.0 ? -1.0 : 0.0);
    const double annualized = sign * std::pow(std::abs(base), 1.0 / years) - 1.0;
    return std::isfinite(annualized) ? annualized : 0.0;
}

PerformanceSummary PerformanceMetrics::summarizeStrategy(const std::vector<double>& log_returns,
                                                         int trade_count,
                                                         double periods_per_year,
                                                         const MetricsConfig& config) {
    PerformanceSummary s;
    s.trade_count = trade_count;
    fillReturns(s, log_returns, periods_per_year);

    if (trade_count >= config.min_trades_for_stats) {
        s.sharpe_ratio = sharpeRatio(log_returns, periods_per_year, config.risk_free_rate);
        s.sortino_ratio = sortinoRatio(log_returns, periods_per_year, config.target_return);
        s.max_drawdown = maxDrawdown(compoundedReturns(log_returns));
        s.statistics_reliable = true;
    } else {
        s.sharpe_ratio = sentinel::UNRELIABLE_RATIO;
        s.sortino_ratio = sentinel::UNRELIABLE_RATIO;
        s.max_drawdown = sentinel::UNRELIABLE_DRAWDOWN;
        s.statistics_reliable = false;
        LOG_DEBUG("Only {} trades (< {}), strategy ratios replaced by sentinels",
                  trade_count, config.min_trades_for_stats);
    }
    return s;
}

PerformanceSummary PerformanceMetrics::summarizeBenchmark(const std::vector<double>& log_returns,
                                                          double periods_per_year,
                                                          const MetricsConfig& config) {
    PerformanceSummary s;
    fillReturns(s, log_returns, periods_per_year);
    s.sharpe_ratio = sharpeRatio(log_returns, periods_per_year, config.risk_free_rate);
    s.sortino_ratio = sortinoRatio(log_returns, periods_per_year, config.target_return);
    s.max_drawdown = maxDrawdown(compoundedReturns(log_returns));
    return s;
}

TradeStatistics PerformanceMetrics::tradeStatistics(const std::vector<Trade>& trades) {
    TradeStatistics stats;
    double net = 0.0;
    double holding = 0.0;
    for (const auto& trade : trades) {
        const double ret = std::exp(trade.logReturn()) - 1.0;
        stats.total_trades++;
        net += ret;
        holding += static_cast<double>(trade.holdingBars());
        if (ret > 0.0) {
            stats.winning_trades++;
            stats.gross_profit += ret;
        } else if (ret < 0.0) {
            stats.losing_trades++;
            stats.gross_loss_abs += std::abs(ret);
        }
    }

    if (stats.total_trades > 0) {
        const double count = static_cast<double>(stats.total_trades);
        stats.win_rate = static_cast<double>(stats.winning_trades) / count;
        stats.expectancy = net / count;
        stats.avg_holding_bars = holding / count;
    }
    if (stats.winning_trades > 0) {
        stats.avg_win_return = stats.gross_profit / stats.winning_trades;
    }
    if (stats.losing_trades > 0) {
        stats.avg_loss_return = -stats.gross_loss_abs / stats.losing_trades;
    }
    stats.profit_factor = (stats.gross_loss_abs > 1e-12) ? (stats.gross_profit / stats.gross_loss_abs) : 0.0;
    return stats;
}

std::vector<double> PerformanceMetrics::activeReturns(const std::vector<double>& returns) {
    std::vector<double> active;
    active.reserve(returns.size());
    for (double r : returns) {
        if (std::isfinite(r) && r != 0.0) {
            active.push_back(r);
        }
    }
    return active;
}

double PerformanceMetrics::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double PerformanceMetrics::calculateSampleStdDev(const std::vector<double>& values, double mean) {
    if (values.size() < 2) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - mean) * (v - mean);
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size() - 1));
}

void PerformanceMetrics::fillReturns(PerformanceSummary& summary,
                                     const std::vector<double>& log_returns,
                                     double periods_per_year) {
    double total = 0.0;
    for (double r : log_returns) {
        if (std::isfinite(r)) {
            total += r;
        }
    }
    summary.total_log_return = total;
    summary.total_return = std::exp(total) - 1.0;
    summary.annualized_return = annualizedReturn(summary.total_return, log_returns.size(), periods_per_year);
}

} // namespace engine
} // namespace swingfib
