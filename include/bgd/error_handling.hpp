#pragma once

#include <system_error>
#include <string>
#include <stdexcept>
#include <utility>

namespace bgd {

// Unified error codes. The numeric ranges group codes by the point in the
// release at which they can occur.
enum class ErrorCode {
    SUCCESS = 0,

    // Prerequisite errors (nothing mutated yet)
    PREREQUISITE_FAILED = 1000,
    INVALID_ARGUMENT,
    TOOL_NOT_FOUND,
    PLATFORM_UNREACHABLE,
    TARGET_QUERY_FAILED,

    // Pre-switch errors (active environment untouched)
    DEPLOY_FAILED = 2000,
    READINESS_TIMEOUT,
    HEALTH_CHECK_EXHAUSTED,
    SMOKE_TEST_FAILED,
    SMOKE_TEST_TIMEOUT,

    // Point of no return
    TRAFFIC_SWITCH_FAILED = 3000,

    // Post-switch errors
    POST_SWITCH_VALIDATION_FAILED = 4000,

    // Rollback errors (human escalation)
    ROLLBACK_FAILED = 5000,

    // Run infrastructure
    DEPLOYMENT_IN_PROGRESS = 6000,
    LOCK_FAILED,
    JOURNAL_WRITE_FAILED,
    JOURNAL_READ_FAILED,
    REPORT_WRITE_FAILED,
    DEPLOYMENT_CANCELLED,
    INVALID_STATE_TRANSITION,
    CLEANUP_NOT_INTERACTIVE,
    CLEANUP_DECLINED,
    CLEANUP_TARGET_ACTIVE,
    CLEANUP_FAILED,

    // Process and network errors
    PROCESS_SPAWN_FAILED = 7000,
    PROCESS_TIMEOUT,
    PROCESS_EXIT_NONZERO,
    NETWORK_CONNECTION_FAILED,
    NETWORK_TIMEOUT,
    HTTP_BAD_STATUS,
    HTTP_INVALID_RESPONSE,
    TLS_HANDSHAKE_FAILED,
    TLS_VERIFY_FAILED,
    INVALID_URL,

    // Configuration errors
    CONFIG_FILE_NOT_FOUND = 8000,
    CONFIG_PARSE_ERROR,
    CONFIG_VALIDATION_FAILED,
    CONFIG_KEY_NOT_FOUND,

    // Crypto
    CRYPTO_FAILED = 9000
};

// Where in the release an error sits, used for report attribution and
// for the severity of the operator-facing summary.
enum class ErrorClass {
    NONE,
    PREREQUISITE,
    PRE_SWITCH,
    TRAFFIC_SWITCH,
    POST_SWITCH,
    ROLLBACK,
    INFRASTRUCTURE
};

class ErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "bgd"; }
    std::string message(int ev) const override;
};

const ErrorCategory& error_category();
std::error_code make_error_code(ErrorCode ec);

ErrorClass classify(ErrorCode ec);
const char* to_string(ErrorClass error_class);

// Human name of the failure class named in the release taxonomy
// ("HealthCheckExhausted", "RollbackFailure", ...).
const char* taxonomy_name(ErrorCode ec);

// Result monad for error propagation. An error may carry a free-form detail
// string (command output, HTTP status, ...) for the deployment report.
template<typename T>
class Result {
public:
    Result(T&& value) : value_(std::move(value)), has_value_(true) {}
    Result(const T& value) : value_(value), has_value_(true) {}
    Result(ErrorCode error) : error_(make_error_code(error)), has_value_(false) {}
    Result(ErrorCode error, std::string detail)
        : error_(make_error_code(error)), detail_(std::move(detail)), has_value_(false) {}
    Result(std::error_code error) : error_(error), has_value_(false) {}
    Result(std::error_code error, std::string detail)
        : error_(error), detail_(std::move(detail)), has_value_(false) {}

    bool has_value() const noexcept { return has_value_; }
    bool has_error() const noexcept { return !has_value_; }

    const T& value() const& {
        if (!has_value_) throw std::runtime_error("Accessing value of error result");
        return value_;
    }

    T&& value() && {
        if (!has_value_) throw std::runtime_error("Accessing value of error result");
        return std::move(value_);
    }

    const std::error_code& error() const { return error_; }
    const std::string& detail() const { return detail_; }

    // error message followed by the detail, if any
    std::string describe() const {
        if (has_value_) return "ok";
        return detail_.empty() ? error_.message() : error_.message() + ": " + detail_;
    }

    template<typename F>
    auto map(F&& func) const -> Result<decltype(func(std::declval<const T&>()))> {
        using U = decltype(func(std::declval<const T&>()));
        if (has_value_) {
            return Result<U>(func(value_));
        }
        return Result<U>(error_, detail_);
    }

private:
    T value_{};
    std::error_code error_;
    std::string detail_;
    bool has_value_;
};

// Specialization for void
template<>
class Result<void> {
public:
    Result() : has_value_(true) {}
    Result(ErrorCode error) : error_(make_error_code(error)), has_value_(false) {}
    Result(ErrorCode error, std::string detail)
        : error_(make_error_code(error)), detail_(std::move(detail)), has_value_(false) {}
    Result(std::error_code error) : error_(error), has_value_(false) {}
    Result(std::error_code error, std::string detail)
        : error_(error), detail_(std::move(detail)), has_value_(false) {}

    bool has_value() const noexcept { return has_value_; }
    bool has_error() const noexcept { return !has_value_; }
    const std::error_code& error() const { return error_; }
    const std::string& detail() const { return detail_; }

    std::string describe() const {
        if (has_value_) return "ok";
        return detail_.empty() ? error_.message() : error_.message() + ": " + detail_;
    }

private:
    std::error_code error_;
    std::string detail_;
    bool has_value_;
};

// Recover the bgd code from a std::error_code produced by make_error_code.
inline ErrorCode to_error_code(const std::error_code& ec) {
    if (!ec) return ErrorCode::SUCCESS;
    if (&ec.category() != &error_category()) return ErrorCode::PREREQUISITE_FAILED;
    return static_cast<ErrorCode>(ec.value());
}

} // namespace bgd

// Make ErrorCode compatible with std::error_code
namespace std {
template<>
struct is_error_code_enum<bgd::ErrorCode> : true_type {};
}
