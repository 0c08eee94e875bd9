#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <initializer_list>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace swingfib {

namespace {
std::string lowerTrim(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void applyStrategy(const nlohmann::json& s, strategy::SwingFibStrategyConfig& cfg) {
    cfg.epsilon = s.value("epsilon", cfg.epsilon);
    cfg.entry_ratio = s.value("entry_ratio", cfg.entry_ratio);
    cfg.stop_ratio = s.value("stop_ratio", cfg.stop_ratio);
    cfg.wick_lookback = s.value("wick_lookback", cfg.wick_lookback);
    cfg.take_profit_ratio = s.value("take_profit_ratio", cfg.take_profit_ratio);
    cfg.stop_loss_ratio = s.value("stop_loss_ratio", cfg.stop_loss_ratio);
    cfg.pattern_window = s.value("pattern_window", cfg.pattern_window);
    cfg.backfill_lead_in = s.value("backfill_lead_in", cfg.backfill_lead_in);

    if (s.contains("exit_mode")) {
        cfg.exit_mode = strategy::exitModeFromString(lowerTrim(s["exit_mode"].get<std::string>()));
    }
    if (s.contains("swing_detector")) {
        cfg.swing_detector = analytics::swingDetectorKindFromString(
            lowerTrim(s["swing_detector"].get<std::string>()));
    }
    if (s.contains("ratios")) {
        cfg.ratios = s["ratios"].get<std::vector<double>>();
        if (cfg.ratios.empty()) {
            throw std::invalid_argument("strategy.ratios must not be empty");
        }
    }

    for (const double v : {cfg.epsilon, cfg.entry_ratio, cfg.stop_ratio,
                           cfg.take_profit_ratio, cfg.stop_loss_ratio}) {
        if (!std::isfinite(v)) {
            throw std::invalid_argument("strategy ratios and epsilon must be finite");
        }
    }
    if (cfg.wick_lookback < 1) {
        throw std::invalid_argument("strategy.wick_lookback must be >= 1, got " +
                                    std::to_string(cfg.wick_lookback));
    }
    if (cfg.pattern_window < 1) {
        throw std::invalid_argument("strategy.pattern_window must be >= 1, got " +
                                    std::to_string(cfg.pattern_window));
    }
}

void applyBacktest(const nlohmann::json& b, backtest::BacktestConfig& cfg) {
    cfg.metrics.min_trades_for_stats = b.value("min_trades_for_stats", cfg.metrics.min_trades_for_stats);
    cfg.metrics.risk_free_rate = b.value("risk_free_rate", cfg.metrics.risk_free_rate);
    cfg.metrics.target_return = b.value("target_return", cfg.metrics.target_return);
    cfg.timeframe = b.value("timeframe", cfg.timeframe);

    if (cfg.metrics.min_trades_for_stats < 0) {
        throw std::invalid_argument("backtest.min_trades_for_stats must be non-negative");
    }
    if (!std::isfinite(cfg.metrics.risk_free_rate) || !std::isfinite(cfg.metrics.target_return)) {
        throw std::invalid_argument("backtest.risk_free_rate and target_return must be finite");
    }
    double periods = 0.0;
    if (!cfg.timeframe.empty() && !engine::PerformanceMetrics::parseTimeframe(cfg.timeframe, periods)) {
        throw std::invalid_argument("backtest.timeframe not recognized: " + cfg.timeframe);
    }

    if (b.contains("skip_first")) {
        const long long skip = b["skip_first"].get<long long>();
        if (skip < 0) {
            throw std::invalid_argument("backtest.skip_first must be non-negative");
        }
        cfg.skip_first = static_cast<std::size_t>(skip);
    }
    if (b.contains("open_position_policy")) {
        cfg.open_position_policy = backtest::openPositionPolicyFromString(
            lowerTrim(b["open_position_policy"].get<std::string>()));
    }
    if (b.contains("trade_enumerator")) {
        cfg.trade_enumerator = backtest::tradeEnumeratorKindFromString(
            lowerTrim(b["trade_enumerator"].get<std::string>()));
    }
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    backtest_config_ = backtest::BacktestConfig{};
    log_level_ = "info";
    log_dir_ = "logs";
    loaded_ = false;
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    std::cout << "설정 파일 경로: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cout << "경고: 설정 파일을 찾을 수 없습니다. 기본값을 사용합니다." << std::endl;
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed config file " + config_path.string() + ": " + e.what());
    }

    applyJson(j);
    std::cout << "설정 파일 로드 완료" << std::endl;
}

void Config::applyJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Config root must be a JSON object");
    }

    // 전부 파싱에 성공한 경우에만 반영
    backtest::BacktestConfig next = backtest_config_;
    std::string level = log_level_;
    std::string dir = log_dir_;

    try {
        if (j.contains("logging")) {
            const auto& l = j["logging"];
            level = lowerTrim(l.value("level", level));
            dir = l.value("dir", dir);
        }
        if (j.contains("strategy")) {
            applyStrategy(j["strategy"], next.strategy);
        }
        if (j.contains("backtest")) {
            applyBacktest(j["backtest"], next);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    backtest_config_ = std::move(next);
    log_level_ = level;
    log_dir_ = dir;
    loaded_ = true;
}

} // namespace swingfib
