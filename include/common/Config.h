#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "backtest/BacktestEngine.h"

namespace swingfib {

// Process-wide settings read once at startup. Only the CLI reads the
// singleton; the engine receives a BacktestConfig copy.
class Config {
public:
    static Config& getInstance();

    // Missing file: defaults are kept. Unparsable file or invalid option
    // value: std::runtime_error, previous settings untouched.
    void load(const std::string& config_path);
    void applyJson(const nlohmann::json& j);
    void reset();

    backtest::BacktestConfig getBacktestConfig() const { return backtest_config_; }
    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }
    bool isLoaded() const { return loaded_; }

private:
    Config() = default;

    backtest::BacktestConfig backtest_config_;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    bool loaded_ = false;
};

} // namespace swingfib
