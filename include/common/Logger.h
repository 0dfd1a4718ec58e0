#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace tradeagent {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs");
    
    // initialize() 이전 호출은 무시됨 (테스트는 콘솔 출력 없이 실행)
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
    
    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    void setLevel(const std::string& level);

    // trades.log 에 CSV 한 줄 기록: symbol,side,price,quantity,pnl,strategy
    void logTrade(const std::string& symbol, const std::string& side,
                  double price, double quantity, double pnl,
                  const std::string& strategy = "");
    
private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_INFO(...) tradeagent::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) tradeagent::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) tradeagent::Logger::getInstance().error(__VA_ARGS__)
#define LOG_DEBUG(...) tradeagent::Logger::getInstance().debug(__VA_ARGS__)

} // namespace tradeagent
