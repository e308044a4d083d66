#pragma once

#include <string>
#include <memory>
#include <chrono>
#include <cstddef>

#include <spdlog/spdlog.h>

namespace arbgate {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

LogLevel parse_log_level(const std::string& name);
std::string to_string(LogLevel level);

class Logger {
public:
    static void initialize(const std::string& log_file_path = "logs/arbgate.log",
                           LogLevel level = LogLevel::INFO,
                           size_t max_file_size = 1024 * 1024 * 10,  // 10MB
                           size_t max_files = 3,
                           bool console_output = true);

    static void shutdown();

    // Logger used by the ARBGATE_LOG_* macros. Falls back to spdlog's default
    // logger until initialize() has been called.
    static std::shared_ptr<spdlog::logger> get();

private:
    static spdlog::level::level_enum to_spdlog_level(LogLevel level);

    static std::shared_ptr<spdlog::logger> logger_;
};

// RAII logging scope for performance measurement
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& operation_name);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string operation_name_;
    std::chrono::steady_clock::time_point start_time_;
};

#define ARBGATE_LOG_TRACE(...) ::arbgate::utils::Logger::get()->trace(__VA_ARGS__)
#define ARBGATE_LOG_DEBUG(...) ::arbgate::utils::Logger::get()->debug(__VA_ARGS__)
#define ARBGATE_LOG_INFO(...) ::arbgate::utils::Logger::get()->info(__VA_ARGS__)
#define ARBGATE_LOG_WARN(...) ::arbgate::utils::Logger::get()->warn(__VA_ARGS__)
#define ARBGATE_LOG_ERROR(...) ::arbgate::utils::Logger::get()->error(__VA_ARGS__)
#define ARBGATE_LOG_CRITICAL(...) ::arbgate::utils::Logger::get()->critical(__VA_ARGS__)

#define ARBGATE_SCOPED_TIMER(name) ::arbgate::utils::ScopedTimer scoped_timer_(name)

} // namespace utils
} // namespace arbgate
