#include "bgd/smoke_test_runner.hpp"
#include "bgd/logger.hpp"

namespace bgd {

SmokeTestRunner::SmokeTestRunner(Clock& clock) : clock_(clock) {}

void SmokeTestRunner::add_check(SmokeCheck check) {
    checks_.push_back(std::move(check));
}

SmokeTestResult SmokeTestRunner::run(const EnvironmentId& env, std::chrono::milliseconds overall_timeout) {
    SmokeTestResult result;
    auto started = clock_.now();
    auto deadline = started + overall_timeout;

    auto elapsed = [&]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(clock_.now() - started);
    };

    if (checks_.empty()) {
        LOG_ERROR("No smoke checks configured for " + env.name);
        result.failed_check = "none";
        result.output = "no smoke checks configured\n";
        result.duration = elapsed();
        return result;
    }

    LOG_INFO("Running " + std::to_string(checks_.size()) + " smoke checks against " + env.name);

    for (const auto& check : checks_) {
        auto budget = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock_.now());
        if (budget.count() <= 0) {
            result.timed_out = true;
            result.failed_check = check.name;
            result.output += "[" + check.name + "] not started: smoke test budget exhausted\n";
            break;
        }

        CheckOutcome outcome = check.run(env, budget);
        result.output += "[" + check.name + "] " + outcome.output;
        if (result.output.empty() || result.output.back() != '\n') {
            result.output += '\n';
        }

        // A check that passes after the deadline still fails the run.
        if (outcome.timed_out || clock_.now() > deadline) {
            result.timed_out = true;
            result.failed_check = check.name;
            LOG_ERROR("Smoke check '" + check.name + "' exceeded the smoke test budget");
            break;
        }

        if (!outcome.passed) {
            result.failed_check = check.name;
            LOG_ERROR("Smoke check '" + check.name + "' failed");
            break;
        }

        LOG_INFO("Smoke check '" + check.name + "' passed");
    }

    result.passed = result.failed_check.empty();
    result.duration = elapsed();
    return result;
}

SmokeCheck make_http_check(const std::string& name, HttpClient& http, const std::string& path) {
    return SmokeCheck{name, [&http, path](const EnvironmentId& env, std::chrono::milliseconds budget) {
        CheckOutcome outcome;
        std::string url = env.internal_endpoint + path;
        auto status = http.get_status(url, budget);
        if (status.has_value()) {
            outcome.passed = status.value() >= 200 && status.value() < 300;
            outcome.output = "GET " + url + " -> HTTP " + std::to_string(status.value());
        } else {
            outcome.timed_out = to_error_code(status.error()) == ErrorCode::NETWORK_TIMEOUT;
            outcome.output = "GET " + url + " -> " + status.describe();
        }
        return outcome;
    }};
}

SmokeCheck make_harness_check(const std::string& harness, ProcessRunner& runner) {
    return SmokeCheck{"harness", [&runner, harness](const EnvironmentId& env, std::chrono::milliseconds budget) {
        CheckOutcome outcome;
        auto result = runner.run({harness, env.name}, budget);
        if (result.has_error()) {
            outcome.output = result.describe();
            return outcome;
        }
        const auto& process = result.value();
        outcome.passed = process.succeeded();
        outcome.timed_out = process.timed_out;
        outcome.output = process.output;
        if (!process.timed_out && process.exit_code != 0) {
            outcome.output += "\nexit status " + std::to_string(process.exit_code);
        }
        return outcome;
    }};
}

void add_default_checks(SmokeTestRunner& runner, const DeployConfig& config,
                        HttpClient& http, ProcessRunner& processes) {
    if (config.smoke.check_health) {
        runner.add_check(make_http_check("health", http, config.endpoints.health_path));
    }
    if (config.smoke.check_metrics) {
        runner.add_check(make_http_check("metrics", http, config.endpoints.metrics_path));
    }
    if (!config.smoke.harness.empty()) {
        runner.add_check(make_harness_check(config.smoke.harness, processes));
    }
}

} // namespace bgd
