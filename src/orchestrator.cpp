/**
 * @file orchestrator.cpp
 * @brief Blue/green release state machine
 *
 * One run, strictly sequential:
 * 1. Take the exclusive lock for the environment pair
 * 2. Validate prerequisites (read-only, resolves auto mode)
 * 3. Deploy the candidate, wait for readiness, warm-up grace
 * 4. Health checks and smoke tests against the internal endpoint
 * 5. Switch traffic (point of no return)
 * 6. Propagation delay, validate through the public endpoint
 * 7. Roll back on any failure from step 5 on, tear the candidate down on
 *    any failure before it
 * 8. Journal every transition, emit the report
 */

#include "bgd/orchestrator.hpp"
#include "bgd/deployment_lock.hpp"
#include "bgd/logger.hpp"
#include "bgd/process_runner.hpp"
#include "bgd/run_journal.hpp"
#include "bgd/security_utils.hpp"
#include <csignal>
#include <ctime>
#include <filesystem>
#include <memory>
#include <unistd.h>

namespace bgd {

namespace {

// Error code a stage fails with when it throws or reports a foreign code.
ErrorCode stage_error_code(DeploymentState stage) {
    switch (stage) {
        case DeploymentState::VALIDATING: return ErrorCode::PREREQUISITE_FAILED;
        case DeploymentState::DEPLOYING: return ErrorCode::DEPLOY_FAILED;
        case DeploymentState::AWAITING_READY: return ErrorCode::READINESS_TIMEOUT;
        case DeploymentState::HEALTH_CHECKING: return ErrorCode::HEALTH_CHECK_EXHAUSTED;
        case DeploymentState::SMOKE_TESTING: return ErrorCode::SMOKE_TEST_FAILED;
        case DeploymentState::SWITCHING: return ErrorCode::TRAFFIC_SWITCH_FAILED;
        case DeploymentState::VALIDATING_SWITCH: return ErrorCode::POST_SWITCH_VALIDATION_FAILED;
        default: return ErrorCode::INVALID_STATE_TRANSITION;
    }
}

// Keep the stage's own code when the component already reported one from
// the stage's class, otherwise wrap it.
Result<void> attribute(DeploymentState stage, const Result<void>& result) {
    if (result.has_value()) return result;

    ErrorCode code = to_error_code(result.error());
    ErrorCode expected = stage_error_code(stage);
    if (classify(code) == classify(expected)) {
        return result;
    }
    return Result<void>(expected, result.describe());
}

std::string compact_timestamp(TimePoint now) {
    auto time_t = WallClock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time_t, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y%m%d-%H%M%S", &utc);
    return buffer;
}

CancellationToken* signal_token = nullptr;

void cancel_on_signal(int) {
    if (signal_token) signal_token->cancel();
}

} // namespace

void install_signal_handlers(CancellationToken& token) {
    signal_token = &token;
    std::signal(SIGINT, cancel_on_signal);
    std::signal(SIGTERM, cancel_on_signal);
    std::signal(SIGPIPE, SIG_IGN);
}

Result<DeploymentRequest> make_request(const DeployConfig& config, const std::string& active,
                                       const std::string& inactive, const std::string& image_tag,
                                       const std::string& operator_name, bool auto_detect,
                                       TimePoint now) {
    auto suffix = SecurityUtils::random_hex(4);
    if (suffix.has_error()) {
        return Result<DeploymentRequest>(suffix.error(), suffix.detail());
    }

    DeploymentRequest request;
    request.deployment_id = compact_timestamp(now) + "-" + suffix.value();
    request.image_tag = image_tag;
    request.requested_at = now;
    request.operator_name = operator_name.empty() ? "unknown" : operator_name;
    request.auto_detect = auto_detect;

    if (!auto_detect) {
        request.active = config.environment(active);
        request.inactive = config.environment(inactive);
    }
    return request;
}

Orchestrator::Orchestrator(const DeployConfig& config, PlatformClient& platform, HealthProber& prober,
                           SmokeTestRunner& smoke, Clock& clock, const CancellationToken& cancel,
                           ReportSink* sink)
    : config_(config),
      platform_(platform),
      prober_(prober),
      smoke_(smoke),
      clock_(clock),
      cancel_(cancel),
      sink_(sink),
      switcher_(platform, prober),
      rollback_controller_(platform, clock) {}

bool Orchestrator::requires_rollback(const RunState& run, DeploymentState failed_stage) {
    return run.switch_occurred() ||
           failed_stage == DeploymentState::SWITCHING ||
           failed_stage == DeploymentState::VALIDATING_SWITCH;
}

std::vector<Orchestrator::Stage> Orchestrator::stages() {
    return {
        {DeploymentState::VALIDATING, [this](RunState& run) { return validate(run); }},
        {DeploymentState::DEPLOYING, [this](RunState& run) { return deploy(run); }},
        {DeploymentState::AWAITING_READY, [this](RunState& run) { return await_ready(run); }},
        {DeploymentState::HEALTH_CHECKING, [this](RunState& run) { return health_check(run); }},
        {DeploymentState::SMOKE_TESTING, [this](RunState& run) { return smoke_test(run); }},
        {DeploymentState::SWITCHING, [this](RunState& run) { return switch_traffic(run); }},
        {DeploymentState::VALIDATING_SWITCH, [this](RunState& run) { return validate_switch(run); }},
    };
}

DeploymentOutcome Orchestrator::run(const DeploymentRequest& request) {
    RunState run(request);

    LOG_INFO("Starting deployment " + request.deployment_id + " of " + request.image_tag +
             (request.auto_detect ? " (auto mode)"
                                  : " from " + request.active.name + " to " + request.inactive.name));

    // The pair shares one traffic target: lock and journal it as a whole,
    // whatever names the request carries.
    const std::string& env_a = config_.platform.environments.at(0);
    const std::string& env_b = config_.platform.environments.at(1);
    auto lock = DeploymentLock::acquire(config_.state.lock_dir, env_a, env_b);
    if (lock.has_error()) {
        // Another run owns the pair: touch neither its journal nor its reports.
        LOG_ERROR("Cannot start deployment: " + lock.describe());
        run.record_failure(DeploymentState::VALIDATING, to_error_code(lock.error()), lock.detail());
        run.state_ = DeploymentState::FAILED;
        return conclude(run, false);
    }

    RunJournal journal(config_.state.journal_dir, env_a, env_b);
    std::string started_at = format_timestamp(request.requested_at);
    int pid = static_cast<int>(::getpid());

    run.set_persist_hook([this, &journal, started_at, pid](const RunState& state) {
        JournalEntry entry;
        entry.deployment_id = state.request().deployment_id;
        entry.state = state.state();
        entry.switch_occurred = state.switch_occurred();
        entry.previous_target = state.request().active.name;
        entry.new_target = state.request().inactive.name;
        entry.image_tag = state.request().image_tag;
        entry.started_at = started_at;
        entry.updated_at = format_timestamp(clock_.wall_now());
        entry.pid = pid;
        return journal.write(entry);
    });

    bool failed = false;
    auto initial = run.persist();
    if (initial.has_error()) {
        LOG_ERROR("Cannot record run journal: " + initial.describe());
        run.record_failure(DeploymentState::VALIDATING, ErrorCode::JOURNAL_WRITE_FAILED, initial.detail());
        failed = true;
    }

    for (const auto& stage : stages()) {
        if (failed) break;

        if (stage.state != DeploymentState::VALIDATING) {
            if (cancel_.cancelled()) {
                LOG_WARN("Cancellation requested during " + std::string(to_string(run.state())));
                run.cancelled_ = true;
                run.record_failure(run.state(), ErrorCode::DEPLOYMENT_CANCELLED, "operator signal");
                failed = true;
                break;
            }

            auto moved = advance(run, stage.state);
            if (moved.has_error()) {
                run.record_failure(run.state(), to_error_code(moved.error()), moved.detail());
                failed = true;
                break;
            }
        }

        failed = !execute_stage(run, stage);
    }

    if (!failed) {
        auto completed = advance(run, DeploymentState::COMPLETED);
        if (completed.has_error()) {
            LOG_ERROR("Could not mark deployment completed: " + completed.describe());
        }
    } else {
        finish(run);
    }

    return conclude(run, true);
}

Result<void> Orchestrator::advance(RunState& run, DeploymentState to) {
    DeploymentState previous = run.state();
    auto moved = run.transition(to);
    if (moved.has_value()) return moved;

    if (to_error_code(moved.error()) == ErrorCode::INVALID_STATE_TRANSITION) {
        return moved;
    }

    // Until traffic moves, an unjournaled state is a reason to stop. After
    // that, stopping would only make things worse.
    if (!is_terminal(to) && !is_post_switch(previous) && !run.switch_occurred()) {
        run.state_ = previous;
        return Result<void>(ErrorCode::JOURNAL_WRITE_FAILED, moved.describe());
    }

    LOG_ERROR("Journal not updated for " + std::string(to_string(to)) + ": " + moved.describe());
    return Result<void>();
}

bool Orchestrator::execute_stage(RunState& run, const Stage& stage) {
    StageRecord record;
    record.stage = stage.state;
    record.started_at = clock_.wall_now();
    auto started = clock_.now();

    Result<void> outcome;
    try {
        outcome = attribute(stage.state, stage.action(run));
    } catch (const std::exception& e) {
        outcome = Result<void>(stage_error_code(stage.state), std::string("exception: ") + e.what());
    }

    record.duration = std::chrono::duration_cast<std::chrono::milliseconds>(clock_.now() - started);
    record.passed = outcome.has_value();
    record.detail = outcome.has_value() ? "ok" : outcome.describe();
    run.stages_.push_back(record);

    if (outcome.has_error()) {
        LOG_ERROR(std::string(to_string(stage.state)) + " failed: " + outcome.describe());
        run.record_failure(stage.state, to_error_code(outcome.error()), outcome.detail());
        return false;
    }
    return true;
}

void Orchestrator::finish(RunState& run) {
    DeploymentState failed_stage = run.failed_stage().value_or(run.state());

    if (requires_rollback(run, failed_stage)) {
        auto entered = advance(run, DeploymentState::ROLLING_BACK);
        if (entered.has_error()) {
            LOG_ERROR("Entering rollback: " + entered.describe());
        }

        std::string reason = make_error_code(run.error()).message();
        if (!run.error_detail().empty()) reason += ": " + run.error_detail();

        run.rollback_ = rollback_controller_.rollback(run.request().active, failed_stage, reason, run);
    } else if (run.candidate_deployed()) {
        teardown_candidate(run);
    }

    auto closed = advance(run, DeploymentState::FAILED);
    if (closed.has_error()) {
        LOG_ERROR("Could not mark deployment failed: " + closed.describe());
        run.state_ = DeploymentState::FAILED;
    }
}

DeploymentOutcome Orchestrator::conclude(RunState& run, bool write_report) {
    run.finished_at_ = clock_.wall_now();

    DeploymentOutcome outcome;
    outcome.report = Reporter::assemble(run, Logger::instance().output_file());
    outcome.exit_code = outcome.report.succeeded() ? 0 : 1;

    if (write_report && sink_ && config_.report.enabled) {
        auto written = sink_->write(outcome.report);
        if (written.has_error()) {
            LOG_ERROR("Deployment report not written: " + written.describe());
        }
    }

    if (outcome.report.succeeded()) {
        LOG_INFO(Reporter::summary(outcome.report));
    } else {
        LOG_ERROR(Reporter::summary(outcome.report));
    }
    return outcome;
}

void Orchestrator::teardown_candidate(RunState& run) {
    const auto& candidate = run.request().inactive;
    if (!config_.state.teardown_failed_candidate) {
        LOG_WARN("Leaving failed candidate " + candidate.name + " in place");
        return;
    }

    LOG_INFO("Tearing down failed candidate " + candidate.name);
    auto removed = platform_.decommission(candidate.name, config_.timeouts.deploy);
    if (removed.has_error()) {
        LOG_ERROR("Teardown of " + candidate.name + " failed: " + removed.describe());
    }
}

Result<void> Orchestrator::validate_prerequisites(DeploymentRequest& request) {
    LOG_INFO("Validating prerequisites");

    if (!SecurityUtils::is_valid_image_tag(request.image_tag)) {
        return Result<void>(ErrorCode::INVALID_ARGUMENT, "invalid image tag: " + request.image_tag);
    }

    for (const auto& tool : config_.platform.required_tools) {
        if (!find_executable(tool)) {
            return Result<void>(ErrorCode::TOOL_NOT_FOUND, tool);
        }
    }

    auto reachable = platform_.ping();
    if (reachable.has_error()) {
        return Result<void>(ErrorCode::PLATFORM_UNREACHABLE, reachable.describe());
    }

    if (request.auto_detect) {
        auto current = platform_.current_target();
        if (current.has_error()) {
            return Result<void>(ErrorCode::TARGET_QUERY_FAILED, current.describe());
        }
        std::string inactive = config_.counterpart(current.value());
        if (inactive.empty()) {
            return Result<void>(ErrorCode::TARGET_QUERY_FAILED,
                                "traffic target '" + current.value() + "' is not a configured environment");
        }
        request.active = config_.environment(current.value());
        request.inactive = config_.environment(inactive);
        LOG_INFO("Auto-detected active environment: " + request.active.name +
                 ", deploying to: " + request.inactive.name);
    }

    for (const auto* env : {&request.active, &request.inactive}) {
        if (!SecurityUtils::is_valid_environment_name(env->name)) {
            return Result<void>(ErrorCode::INVALID_ARGUMENT, "invalid environment name: " + env->name);
        }
        if (config_.counterpart(env->name).empty()) {
            return Result<void>(ErrorCode::INVALID_ARGUMENT,
                                "environment '" + env->name + "' is not part of the configured pair");
        }
    }
    if (request.active == request.inactive) {
        return Result<void>(ErrorCode::INVALID_ARGUMENT,
                            "active and inactive environment are both " + request.active.name);
    }

    if (!config_.platform.values_file.empty() &&
        !std::filesystem::exists(config_.platform.values_file)) {
        return Result<void>(ErrorCode::PREREQUISITE_FAILED,
                            "values file not found: " + config_.platform.values_file);
    }

    if (config_.smoke.harness.empty()) {
        LOG_WARN("No smoke test harness configured: data-layer connectivity will not be checked");
    } else if (!find_executable(config_.smoke.harness)) {
        return Result<void>(ErrorCode::PREREQUISITE_FAILED,
                            "smoke test harness not executable: " + config_.smoke.harness);
    }

    LOG_INFO("Prerequisites validated");
    return Result<void>();
}

Result<void> Orchestrator::validate(RunState& run) {
    DeploymentRequest request = run.request();
    auto valid = validate_prerequisites(request);
    if (valid.has_value() && request.auto_detect) {
        run.resolve_environments(request.active, request.inactive);
    }
    return valid;
}

Result<void> Orchestrator::deploy(RunState& run) {
    const auto& request = run.request();
    run.candidate_deployed_ = true;
    return platform_.deploy(request.inactive.name, request.image_tag, config_.timeouts.deploy);
}

Result<void> Orchestrator::await_ready(RunState& run) {
    const auto& candidate = run.request().inactive;
    auto ready = platform_.wait_ready(candidate.name, config_.timeouts.ready);
    if (ready.has_error()) return ready;

    if (config_.timeouts.warmup_grace.count() > 0) {
        LOG_INFO("Warm-up grace period of " + std::to_string(config_.timeouts.warmup_grace.count()) +
                 "s before health checks");
        clock_.sleep_for(config_.timeouts.warmup_grace);
    }
    return Result<void>();
}

Result<void> Orchestrator::health_check(RunState& run) {
    const auto& candidate = run.request().inactive;
    std::string url = candidate.internal_endpoint + config_.endpoints.health_path;

    auto result = prober_.probe(url, config_.health, &run.health_probes_);
    if (!result.success) {
        return Result<void>(ErrorCode::HEALTH_CHECK_EXHAUSTED,
                            "attempt " + std::to_string(result.attempt) + "/" +
                            std::to_string(config_.health.max_attempts) + ": " + result.detail);
    }
    return Result<void>();
}

Result<void> Orchestrator::smoke_test(RunState& run) {
    const auto& candidate = run.request().inactive;
    auto result = smoke_.run(candidate, config_.smoke.timeout);
    run.smoke_result_ = result;

    if (result.timed_out) {
        return Result<void>(ErrorCode::SMOKE_TEST_TIMEOUT,
                            "budget " + std::to_string(config_.smoke.timeout.count()) + "s exceeded in " +
                            result.failed_check);
    }
    if (!result.passed) {
        return Result<void>(ErrorCode::SMOKE_TEST_FAILED, "check " + result.failed_check);
    }
    return Result<void>();
}

Result<void> Orchestrator::switch_traffic(RunState& run) {
    return switcher_.switch_traffic(run.request().inactive, run);
}

Result<void> Orchestrator::validate_switch(RunState& run) {
    if (config_.timeouts.propagation_delay.count() > 0) {
        LOG_INFO("Waiting " + std::to_string(config_.timeouts.propagation_delay.count()) +
                 "s for traffic switch to propagate");
        clock_.sleep_for(config_.timeouts.propagation_delay);
    }

    const auto& candidate = run.request().inactive;
    auto result = switcher_.validate_switch(candidate, config_.endpoints.health_path,
                                            config_.switch_validation, &run.switch_probes_);
    if (!result.success) {
        return Result<void>(ErrorCode::POST_SWITCH_VALIDATION_FAILED,
                            "public endpoint: attempt " + std::to_string(result.attempt) + "/" +
                            std::to_string(config_.switch_validation.max_attempts) + ": " + result.detail);
    }
    return Result<void>();
}

} // namespace bgd
