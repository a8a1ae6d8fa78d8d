#include "utils/logger.hpp"
#include <filesystem>
#include <iostream>
#include <sstream>
#include <vector>

namespace arbguard {
namespace utils {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;
LogLevel Logger::current_level_ = LogLevel::INFO;

LogLevel parse_log_level(const std::string& level_name, LogLevel fallback) {
    if (level_name == "TRACE") return LogLevel::TRACE;
    if (level_name == "DEBUG") return LogLevel::DEBUG;
    if (level_name == "INFO") return LogLevel::INFO;
    if (level_name == "WARN" || level_name == "WARNING") return LogLevel::WARN;
    if (level_name == "ERROR") return LogLevel::ERROR;
    if (level_name == "CRITICAL") return LogLevel::CRITICAL;
    return fallback;
}

void Logger::initialize(const std::string& log_file_path, LogLevel level,
                       size_t max_file_size, size_t max_files,
                       bool console_output, bool file_output) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (console_output) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(to_spdlog_level(level));
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
            sinks.push_back(console_sink);
        }

        if (file_output) {
            // Create logs directory if it doesn't exist
            std::filesystem::path log_path(log_file_path);
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file_path, max_file_size, max_files);
            file_sink->set_level(to_spdlog_level(level));
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            sinks.push_back(file_sink);
        }

        if (logger_) {
            spdlog::drop(logger_->name());
        }
        logger_ = std::make_shared<spdlog::logger>("arbguard", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(level));
        current_level_ = level;

        spdlog::register_logger(logger_);
        logger_->flush_on(spdlog::level::warn);

        Logger::info("Logger initialized");

    } catch (const std::exception& e) {
        std::cerr << "Logger initialization failed: " << e.what() << std::endl;
        throw;
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(logger_->name());
        logger_ = nullptr;
    }
}

void Logger::trace(const std::string& msg) {
    if (logger_) logger_->trace(msg);
}

void Logger::debug(const std::string& msg) {
    if (logger_) logger_->debug(msg);
}

void Logger::info(const std::string& msg) {
    if (logger_) logger_->info(msg);
}

void Logger::warn(const std::string& msg) {
    if (logger_) logger_->warn(msg);
}

void Logger::error(const std::string& msg) {
    if (logger_) logger_->error(msg);
}

void Logger::critical(const std::string& msg) {
    if (logger_) logger_->critical(msg);
}

void Logger::set_level(LogLevel level) {
    current_level_ = level;
    if (logger_) {
        logger_->set_level(to_spdlog_level(level));
    }
}

LogLevel Logger::get_level() {
    return current_level_;
}

bool Logger::is_enabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(current_level_);
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        default: return spdlog::level::info;
    }
}

// ValidationLogger implementation
void ValidationLogger::log_condition_rejected(std::uint64_t height, const std::string& condition,
                                              const std::string& detail) {
    std::stringstream ss;
    ss << "CONDITION_REJECTED | Height: " << height << " | Condition: " << condition
       << " | Detail: " << detail;
    Logger::debug(ss.str());
}

void ValidationLogger::log_opportunity_accepted(std::uint64_t height,
                                                const std::string& buy_source,
                                                const std::string& sell_source,
                                                std::uint64_t price_difference_bps,
                                                const std::string& profit_potential) {
    std::stringstream ss;
    ss << "OPPORTUNITY_ACCEPTED | Height: " << height
       << " | Buy: " << buy_source << " | Sell: " << sell_source
       << " | Gap: " << price_difference_bps << "bps | Profit: " << profit_potential;
    Logger::info(ss.str());
}

void ValidationLogger::log_opportunity_recorded(std::uint64_t id, std::uint64_t height,
                                                const std::string& detector,
                                                const std::string& total_profit_potential) {
    std::stringstream ss;
    ss << "OPPORTUNITY_RECORDED | ID: " << id << " | Height: " << height
       << " | Detector: " << detector << " | TotalProfit: " << total_profit_potential;
    Logger::info(ss.str());
}

void ValidationLogger::log_opportunity_executed(std::uint64_t id, const std::string& actual_profit) {
    std::stringstream ss;
    ss << "OPPORTUNITY_EXECUTED | ID: " << id << " | ActualProfit: " << actual_profit;
    Logger::info(ss.str());
}

void ValidationLogger::log_system_event(const std::string& event_type, const std::string& description) {
    std::stringstream ss;
    ss << "SYSTEM_EVENT | Type: " << event_type << " | Description: " << description;
    Logger::info(ss.str());
}

// ScopedTimer implementation
ScopedTimer::ScopedTimer(const std::string& operation_name)
    : operation_name_(operation_name), start_time_(std::chrono::steady_clock::now()) {
}

ScopedTimer::~ScopedTimer() {
    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time_);
    std::stringstream ss;
    ss << "TIMER | Operation: " << operation_name_ << " | Duration: " << duration.count() << " us";
    Logger::debug(ss.str());
}

} // namespace utils
} // namespace arbguard
