#include "bgd/retry_policy.hpp"
#include <cmath>

namespace bgd {

std::chrono::milliseconds RetryPolicy::delay_after(uint32_t attempt) const {
    if (attempt == 0 || backoff_multiplier <= 1.0) {
        return interval;
    }

    double scaled = static_cast<double>(interval.count()) *
                    std::pow(backoff_multiplier, static_cast<double>(attempt - 1));

    if (max_interval.count() > 0 && scaled > static_cast<double>(max_interval.count())) {
        return max_interval;
    }
    // guard the cast against overflow on long policies
    if (scaled > 1e15) {
        return std::chrono::milliseconds(static_cast<int64_t>(1e15));
    }
    return std::chrono::milliseconds(static_cast<int64_t>(scaled));
}

std::chrono::milliseconds RetryPolicy::worst_case_duration() const {
    std::chrono::milliseconds total{0};
    for (uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
        total += per_attempt_timeout;
        if (attempt < max_attempts) {
            total += delay_after(attempt);
        }
    }
    return total;
}

Result<void> RetryPolicy::validate() const {
    if (max_attempts == 0) {
        return Result<void>(ErrorCode::CONFIG_VALIDATION_FAILED, "max_attempts must be at least 1");
    }
    if (interval.count() < 0) {
        return Result<void>(ErrorCode::CONFIG_VALIDATION_FAILED, "interval must not be negative");
    }
    if (per_attempt_timeout.count() <= 0) {
        return Result<void>(ErrorCode::CONFIG_VALIDATION_FAILED, "per-attempt timeout must be positive");
    }
    if (backoff_multiplier < 1.0) {
        return Result<void>(ErrorCode::CONFIG_VALIDATION_FAILED, "backoff multiplier must be >= 1.0");
    }
    if (max_interval.count() < 0) {
        return Result<void>(ErrorCode::CONFIG_VALIDATION_FAILED, "max interval must not be negative");
    }
    return Result<void>();
}

} // namespace bgd
