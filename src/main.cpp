#include "common/Logger.h"
#include "common/Config.h"
#include "backtest/BacktestEngine.h"
#include "backtest/DataHistory.h"
#include "backtest/ReportWriter.h"

#include <filesystem>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>

using namespace swingfib;

namespace {

void printUsage() {
    std::cout
        << "usage: swingfib --data <candles.csv|.json> [options]\n"
        << "  --config <file>         config JSON (default config/config.json)\n"
        << "  --report <file>         write the JSON report\n"
        << "  --json                  print the JSON report to stdout\n"
        << "  --epsilon <x>           swing reversal threshold\n"
        << "  --entry-ratio <x>       retracement entry level\n"
        << "  --stop-ratio <x>        wick rejection level\n"
        << "  --wick-lookback <n>\n"
        << "  --exit-mode <pattern|ratio_target>\n"
        << "  --pattern-window <n>\n"
        << "  --min-trades <n>\n"
        << "  --open-policy <close_at_last_bar|drop>\n"
        << "  --timeframe <e.g. 8h>\n"
        << "  --log-level <trace|debug|info|warn|error|off>\n";
}

struct CliOptions {
    std::string data_path;
    std::string config_path = "config/config.json";
    std::string report_path;
    bool json_mode = false;
    std::map<std::string, std::string> overrides;
};

// Flags taking a value; everything except --json does.
bool parseArgs(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            return false;
        }
        if (arg == "--json") {
            opts.json_mode = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0 || i + 1 >= argc) {
            std::cerr << "잘못된 인자: " << arg << "\n";
            return false;
        }
        const std::string value = argv[++i];
        if (arg == "--data") {
            opts.data_path = value;
        } else if (arg == "--config") {
            opts.config_path = value;
        } else if (arg == "--report") {
            opts.report_path = value;
        } else {
            opts.overrides[arg.substr(2)] = value;
        }
    }
    return !opts.data_path.empty();
}

// CLI 값이 설정 파일보다 우선
void applyOverrides(const std::map<std::string, std::string>& overrides,
                    backtest::BacktestConfig& cfg, std::string& log_level) {
    for (const auto& [key, value] : overrides) {
        if (key == "epsilon") {
            cfg.strategy.epsilon = std::stod(value);
        } else if (key == "entry-ratio") {
            cfg.strategy.entry_ratio = std::stod(value);
        } else if (key == "stop-ratio") {
            cfg.strategy.stop_ratio = std::stod(value);
        } else if (key == "wick-lookback") {
            cfg.strategy.wick_lookback = std::stoi(value);
        } else if (key == "exit-mode") {
            cfg.strategy.exit_mode = strategy::exitModeFromString(value);
        } else if (key == "pattern-window") {
            cfg.strategy.pattern_window = std::stoi(value);
        } else if (key == "min-trades") {
            cfg.metrics.min_trades_for_stats = std::stoi(value);
        } else if (key == "open-policy") {
            cfg.open_position_policy = backtest::openPositionPolicyFromString(value);
        } else if (key == "timeframe") {
            cfg.timeframe = value;
        } else if (key == "log-level") {
            log_level = value;
        } else {
            throw std::invalid_argument("unknown option --" + key);
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage();
        return 2;
    }

    try {
        auto& config = Config::getInstance();
        config.load(opts.config_path);

        backtest::BacktestConfig bt_config = config.getBacktestConfig();
        std::string log_level = config.getLogLevel();
        applyOverrides(opts.overrides, bt_config, log_level);

        Logger::getInstance().initialize(config.getLogDir(), log_level);

        if (!std::filesystem::exists(opts.data_path)) {
            std::cerr << "데이터 파일을 찾을 수 없습니다: " << opts.data_path << "\n";
            return 1;
        }
        LOG_INFO("Loading candles from {}", opts.data_path);
        const CandleSeries candles = backtest::DataHistory::load(opts.data_path);

        const backtest::BacktestEngine engine(bt_config);
        const auto result = engine.run(candles);
        backtest::ReportWriter::logTrades(result);

        if (!opts.report_path.empty()) {
            backtest::ReportWriter::writeJson(result, opts.report_path);
        }

        if (opts.json_mode) {
            std::cout << backtest::ReportWriter::toJson(result).dump() << "\n";
            return 0;
        }

        std::cout << "\n백테스트 결과 (" << result.bar_count << " bars, "
                  << result.signals.pivots.size() << " pivots)\n";
        std::cout << "---------------------------------------------\n";
        std::cout << backtest::ReportWriter::formatSummaryTable(result);
        std::cout << "---------------------------------------------\n";
        for (const auto& d : result.diagnostics) {
            std::cout << "  ! " << d << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "오류가 발생했습니다: " << e.what() << std::endl;
        return 1;
    }
}
