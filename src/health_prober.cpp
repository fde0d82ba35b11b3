#include "bgd/health_prober.hpp"
#include "bgd/logger.hpp"

namespace bgd {

HealthProber::HealthProber(HttpClient& http, Clock& clock) : http_(http), clock_(clock) {}

StepVerdict HealthProber::classify_attempt(const Result<int>& status) {
    if (status.has_value()) {
        int code = status.value();
        return (code >= 200 && code < 300) ? StepVerdict::ADVANCE : StepVerdict::RETRY;
    }

    switch (to_error_code(status.error())) {
        case ErrorCode::INVALID_URL:
        case ErrorCode::TLS_VERIFY_FAILED:
            return StepVerdict::FAIL;
        default:
            return StepVerdict::RETRY;
    }
}

ProbeResult HealthProber::probe(const std::string& url, const RetryPolicy& policy,
                                std::vector<ProbeResult>* history) {
    ProbeResult last;

    for (uint32_t attempt = 1; attempt <= policy.max_attempts; ++attempt) {
        ProbeResult result;
        result.attempt = attempt;
        result.timestamp = clock_.wall_now();

        auto started = clock_.now();
        auto status = http_.get_status(url, policy.per_attempt_timeout);
        result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(clock_.now() - started);

        auto verdict = classify_attempt(status);
        result.success = verdict == StepVerdict::ADVANCE;
        result.detail = status.has_value() ? "HTTP " + std::to_string(status.value()) : status.describe();

        if (history) history->push_back(result);
        last = result;

        if (verdict == StepVerdict::ADVANCE) {
            LOG_INFO("Health check passed for " + url + " on attempt " + std::to_string(attempt) +
                     "/" + std::to_string(policy.max_attempts));
            return result;
        }

        if (verdict == StepVerdict::FAIL) {
            LOG_ERROR("Health check for " + url + " cannot succeed: " + result.detail);
            return result;
        }

        LOG_INFO("Health check attempt " + std::to_string(attempt) + "/" +
                 std::to_string(policy.max_attempts) + " failed: " + result.detail);

        if (attempt < policy.max_attempts) {
            clock_.sleep_for(policy.delay_after(attempt));
        }
    }

    LOG_ERROR("Health checks exhausted for " + url + " after " +
              std::to_string(policy.max_attempts) + " attempts");
    return last;
}

} // namespace bgd
