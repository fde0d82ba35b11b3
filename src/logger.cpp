/**
 * @file logger.cpp
 * @brief Thread-safe logging for the release audit trail
 *
 * Features:
 * - Singleton pattern for global access
 * - Optional rate limiting (off by default, a release log must be complete)
 * - Structured logging (JSON format) for log aggregation
 * - Tee into a per-deployment log file
 * - Timestamp with millisecond precision (UTC)
 */

#include "bgd/logger.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <ctime>

namespace bgd {

bool parse_log_level(const std::string& text, LogLevel& out) {
    if (text == "DEBUG") out = LogLevel::DEBUG;
    else if (text == "INFO") out = LogLevel::INFO;
    else if (text == "WARN") out = LogLevel::WARN;
    else if (text == "ERROR") out = LogLevel::ERROR;
    else if (text == "FATAL") out = LogLevel::FATAL;
    else return false;
    return true;
}

/**
 * @brief Get logger singleton instance
 * @return Reference to global logger
 */
Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) {
    level_.store(level);
}

void Logger::set_rate_limit(std::chrono::milliseconds limit) {
    rate_limit_ms_.store(limit.count());
}

void Logger::enable_structured(bool enabled) {
    structured_.store(enabled);
}

void Logger::enable_console(bool enabled) {
    console_.store(enabled);
}

Result<void> Logger::set_output_file(const std::string& path) {
    std::lock_guard lock(output_mutex_);

    if (file_.is_open()) {
        file_.close();
    }
    file_path_.clear();

    if (path.empty()) {
        return Result<void>();
    }

    file_.open(path, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        return Result<void>(ErrorCode::CONFIG_VALIDATION_FAILED, "cannot open log file " + path);
    }
    file_path_ = path;
    return Result<void>();
}

std::string Logger::output_file() const {
    std::lock_guard lock(output_mutex_);
    return file_path_;
}

/**
 * @brief Log message at specified level
 * @param level Log level (DEBUG, INFO, WARN, ERROR, FATAL)
 * @param message Message to log (already sanitized)
 *
 * WARN and above go to stderr, the rest to stdout. Every line is also
 * appended to the audit log file when one is configured.
 */
void Logger::log(LogLevel level, const std::string& message) {
    if (level < level_.load()) return;

    if (should_rate_limit(level)) return;

    auto line = format_message(level, message);

    std::lock_guard lock(output_mutex_);
    if (console_.load()) {
        auto& stream = level >= LogLevel::WARN ? std::cerr : std::cout;
        stream << line << std::endl;
    }
    if (file_.is_open()) {
        file_ << line << std::endl;
    }
}

/**
 * @brief Format log message with timestamp and level
 *
 * Formats:
 * - Structured (JSON): {"timestamp":"...","level":"...","message":"..."}
 * - Plain: [2024-01-01 12:00:00.123] INFO  message
 */
std::string Logger::format_message(LogLevel level, const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t, &utc);

    std::stringstream ss;

    if (structured_.load()) {
        ss << "{\"timestamp\":\"" << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
           << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z\""
           << ",\"level\":\"";

        switch (level) {
            case LogLevel::DEBUG: ss << "DEBUG"; break;
            case LogLevel::INFO:  ss << "INFO"; break;
            case LogLevel::WARN:  ss << "WARN"; break;
            case LogLevel::ERROR: ss << "ERROR"; break;
            case LogLevel::FATAL: ss << "FATAL"; break;
        }

        ss << "\",\"message\":\"" << message << "\"}";
    } else {
        ss << "[" << std::put_time(&utc, "%Y-%m-%d %H:%M:%S")
           << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";

        switch (level) {
            case LogLevel::DEBUG: ss << "DEBUG"; break;
            case LogLevel::INFO:  ss << "INFO "; break;
            case LogLevel::WARN:  ss << "WARN "; break;
            case LogLevel::ERROR: ss << "ERROR"; break;
            case LogLevel::FATAL: ss << "FATAL"; break;
        }

        ss << " " << message;
    }

    return ss.str();
}

bool Logger::should_rate_limit(LogLevel level) {
    auto limit = std::chrono::milliseconds(rate_limit_ms_.load());
    if (limit.count() == 0 || level >= LogLevel::ERROR) {
        return false;
    }

    auto now = std::chrono::steady_clock::now();
    auto last = last_log_.load();

    if (now - last < limit) {
        return true;
    }

    last_log_.store(now);
    return false;
}

} // namespace bgd
