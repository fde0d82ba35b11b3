#pragma once

#include "bgd/clock.hpp"
#include "bgd/http_client.hpp"
#include "bgd/retry_policy.hpp"
#include "bgd/types.hpp"
#include <string>
#include <vector>

namespace bgd {

// Polls a health URL under a RetryPolicy. Used against the internal
// endpoint before the switch and against the public endpoint after it.
class HealthProber {
public:
    HealthProber(HttpClient& http, Clock& clock);

    // Returns on the first 2xx, or with success=false once the policy is
    // exhausted or an attempt fails in a way retrying cannot fix. Every
    // attempt is appended to history when given.
    ProbeResult probe(const std::string& url, const RetryPolicy& policy,
                      std::vector<ProbeResult>* history = nullptr);

    // Verdict for a single attempt.
    static StepVerdict classify_attempt(const Result<int>& status);

private:
    HttpClient& http_;
    Clock& clock_;
};

} // namespace bgd
