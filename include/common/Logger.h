#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace swingfib {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");
    void setLevel(const std::string& level);
    bool isInitialized() const { return initialized_; }

    // 초기화 전에는 모든 호출이 무시된다 (라이브러리/테스트에서 안전)
    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    void logTrade(long long entry_time, long long exit_time,
                  double entry_price, double exit_price, double log_return);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) swingfib::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) swingfib::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) swingfib::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) swingfib::Logger::getInstance().error(__VA_ARGS__)

} // namespace swingfib
