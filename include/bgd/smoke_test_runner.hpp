#pragma once

#include "bgd/clock.hpp"
#include "bgd/config.hpp"
#include "bgd/http_client.hpp"
#include "bgd/process_runner.hpp"
#include "bgd/types.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace bgd {

struct CheckOutcome {
    bool passed{false};
    bool timed_out{false};
    std::string output;
};

// One independent smoke check. `budget` is what is left of the overall
// timeout when the check starts; a check must not run past it.
struct SmokeCheck {
    std::string name;
    std::function<CheckOutcome(const EnvironmentId& env, std::chrono::milliseconds budget)> run;
};

// Runs an ordered list of checks against the candidate environment.
// The first failure stops the run; running out of time is a failure.
// An empty check list never passes.
class SmokeTestRunner {
public:
    explicit SmokeTestRunner(Clock& clock);

    void add_check(SmokeCheck check);
    size_t check_count() const { return checks_.size(); }

    SmokeTestResult run(const EnvironmentId& env, std::chrono::milliseconds overall_timeout);

private:
    Clock& clock_;
    std::vector<SmokeCheck> checks_;
};

// GET <internal endpoint><path>, passes on 2xx.
SmokeCheck make_http_check(const std::string& name, HttpClient& http, const std::string& path);

// <harness> <environment name>, passes on exit status 0.
SmokeCheck make_harness_check(const std::string& harness, ProcessRunner& runner);

// The standard check list: /health, /metrics, then the harness when configured.
void add_default_checks(SmokeTestRunner& runner, const DeployConfig& config,
                        HttpClient& http, ProcessRunner& processes);

} // namespace bgd
