#pragma once

#include "bgd/error_handling.hpp"
#include <chrono>
#include <cstdint>

namespace bgd {

// Bounded retry declaration shared by pre-switch health checking and
// post-switch validation. Fixed interval unless backoff_multiplier > 1.
struct RetryPolicy {
    uint32_t max_attempts{30};
    std::chrono::milliseconds interval{std::chrono::seconds(10)};
    std::chrono::milliseconds per_attempt_timeout{std::chrono::seconds(5)};
    double backoff_multiplier{1.0};
    std::chrono::milliseconds max_interval{0};   // zero means uncapped

    // Delay to wait after the given failed attempt (1-based) before the next.
    std::chrono::milliseconds delay_after(uint32_t attempt) const;

    // Upper bound on wall time spent by a probe that exhausts the policy.
    std::chrono::milliseconds worst_case_duration() const;

    Result<void> validate() const;
};

} // namespace bgd
