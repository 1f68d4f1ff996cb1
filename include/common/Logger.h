#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace cyclebt {

class Logger {
public:
    static Logger& getInstance();
    // console_to_stderr keeps stdout free for machine-readable output.
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info",
                    bool console_to_stderr = false);

    // Calls before initialize() are dropped.
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

    // instrument,entry,exit,quantity,pnl,reason
    void logTrade(const std::string& instrument, double entry_price, double exit_price,
                  double quantity, double pnl, const std::string& exit_reason);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) cyclebt::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) cyclebt::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) cyclebt::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) cyclebt::Logger::getInstance().error(__VA_ARGS__)

} // namespace cyclebt
