#include "logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <filesystem>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace arbgate {
namespace utils {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;

LogLevel parse_log_level(const std::string& name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::TRACE;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "INFO";
}

void Logger::initialize(const std::string& log_file_path, LogLevel level,
                        size_t max_file_size, size_t max_files, bool console_output) {
    std::vector<spdlog::sink_ptr> sinks;

    if (console_output) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        sinks.push_back(console_sink);
    }

    if (!log_file_path.empty()) {
        std::filesystem::path log_path(log_file_path);
        if (log_path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(log_path.parent_path(), ec);
            if (ec) {
                spdlog::warn("Could not create log directory {}: {}",
                             log_path.parent_path().string(), ec.message());
            }
        }

        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file_path, max_file_size, max_files);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::error("Failed to open log file {}: {}", log_file_path, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("arbgate", sinks.begin(), sinks.end());
    logger->set_level(to_spdlog_level(level));
    logger->flush_on(spdlog::level::warn);

    spdlog::drop("arbgate");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
    spdlog::flush_every(std::chrono::seconds(3));

    std::atomic_store(&logger_, logger);

    logger->info("Logger initialized (level {})", to_string(level));
}

void Logger::shutdown() {
    auto logger = std::atomic_exchange(&logger_, std::shared_ptr<spdlog::logger>());
    if (logger) {
        logger->flush();
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    auto logger = std::atomic_load(&logger_);
    if (logger) {
        return logger;
    }
    return spdlog::default_logger();
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

ScopedTimer::ScopedTimer(const std::string& operation_name)
    : operation_name_(operation_name), start_time_(std::chrono::steady_clock::now()) {}

ScopedTimer::~ScopedTimer() {
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_time_);
    ARBGATE_LOG_DEBUG("{} took {} us", operation_name_, elapsed.count());
}

} // namespace utils
} // namespace arbgate
