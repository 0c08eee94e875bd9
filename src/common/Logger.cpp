#include "common/Logger.h"
#include "common/PathUtils.h"
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace swingfib {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level) {
    if (initialized_) return;

    std::filesystem::path logs_path;
    if (std::filesystem::path(log_dir).is_absolute()) {
        logs_path = log_dir;
    } else {
        logs_path = utils::PathUtils::resolveRelativePath(log_dir);
    }

    std::filesystem::create_directories(logs_path);

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (logs_path / "swingfib.log").string(), 1024 * 1024 * 10, 3
        );

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        trade_logger_ = spdlog::daily_logger_mt("trade", (logs_path / "trades.log").string());
        trade_logger_->set_pattern("%v");

        initialized_ = true;
        setLevel(level);
        main_logger_->info("Logger initialized");
        main_logger_->info("Log directory: {}", logs_path.string());

    } catch (const spdlog::spdlog_ex& ex) {
        main_logger_.reset();
        trade_logger_.reset();
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::setLevel(const std::string& level) {
    if (!main_logger_) {
        return;
    }
    const auto parsed = spdlog::level::from_str(level);
    // from_str() maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        main_logger_->set_level(spdlog::level::info);
        main_logger_->warn("Unknown log level '{}', using info", level);
        return;
    }
    main_logger_->set_level(parsed);
}

void Logger::logTrade(long long entry_time, long long exit_time,
                      double entry_price, double exit_price, double log_return) {
    if (trade_logger_) {
        std::ostringstream oss;
        oss << entry_time << "," << exit_time << ","
            << std::fixed << std::setprecision(8) << entry_price << ","
            << std::fixed << std::setprecision(8) << exit_price << ","
            << std::fixed << std::setprecision(6) << log_return;
        trade_logger_->info(oss.str());
    }
}

} // namespace swingfib
