#pragma once

#include "bgd/error_handling.hpp"
#include "bgd/security_utils.hpp"
#include <string>
#include <chrono>
#include <atomic>
#include <fstream>
#include <mutex>

namespace bgd {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4
};

bool parse_log_level(const std::string& text, LogLevel& out);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const { return level_.load(); }
    bool enabled(LogLevel level) const { return level >= level_.load(); }

    // Zero disables rate limiting. ERROR and FATAL are never rate limited.
    void set_rate_limit(std::chrono::milliseconds limit);
    void enable_structured(bool enabled);

    // Tee every line into a file (the deployment audit log). An empty path
    // closes the current file.
    Result<void> set_output_file(const std::string& path);
    std::string output_file() const;

    // Keeps stdout quiet, used by tests.
    void enable_console(bool enabled);

    void log(LogLevel level, const std::string& message);

    // Convenience methods with sanitization
    void debug(const std::string& msg) { log(LogLevel::DEBUG, SecurityUtils::sanitize_log_input(msg)); }
    void info(const std::string& msg) { log(LogLevel::INFO, SecurityUtils::sanitize_log_input(msg)); }
    void warn(const std::string& msg) { log(LogLevel::WARN, SecurityUtils::sanitize_log_input(msg)); }
    void error(const std::string& msg) { log(LogLevel::ERROR, SecurityUtils::sanitize_log_input(msg)); }
    void fatal(const std::string& msg) { log(LogLevel::FATAL, SecurityUtils::sanitize_log_input(msg)); }

    std::string format_message(LogLevel level, const std::string& message) const;

private:
    Logger() = default;

    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::atomic<bool> structured_{false};
    std::atomic<bool> console_{true};
    std::atomic<std::chrono::milliseconds::rep> rate_limit_ms_{0};
    std::atomic<std::chrono::steady_clock::time_point> last_log_{};

    mutable std::mutex output_mutex_;
    std::ofstream file_;
    std::string file_path_;

    bool should_rate_limit(LogLevel level);
};

// Secure logging macros
#define LOG_DEBUG(msg) do { if (bgd::Logger::instance().enabled(bgd::LogLevel::DEBUG)) bgd::Logger::instance().debug(msg); } while (0)
#define LOG_INFO(msg) do { if (bgd::Logger::instance().enabled(bgd::LogLevel::INFO)) bgd::Logger::instance().info(msg); } while (0)
#define LOG_WARN(msg) do { if (bgd::Logger::instance().enabled(bgd::LogLevel::WARN)) bgd::Logger::instance().warn(msg); } while (0)
#define LOG_ERROR(msg) do { if (bgd::Logger::instance().enabled(bgd::LogLevel::ERROR)) bgd::Logger::instance().error(msg); } while (0)
#define LOG_FATAL(msg) bgd::Logger::instance().fatal(msg)

} // namespace bgd
