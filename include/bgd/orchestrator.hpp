#pragma once

#include "bgd/clock.hpp"
#include "bgd/config.hpp"
#include "bgd/health_prober.hpp"
#include "bgd/platform_client.hpp"
#include "bgd/reporter.hpp"
#include "bgd/rollback_controller.hpp"
#include "bgd/run_state.hpp"
#include "bgd/smoke_test_runner.hpp"
#include "bgd/traffic_switcher.hpp"
#include <atomic>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace bgd {

// Set from a signal handler, polled by the orchestrator between stages.
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true); }
    bool cancelled() const noexcept { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// SIGINT/SIGTERM cancel `token`, which must outlive the process. SIGPIPE is
// ignored: a peer resetting a TLS probe connection must surface as a write
// error, not end the run after traffic has moved.
void install_signal_handlers(CancellationToken& token);

struct DeploymentOutcome {
    DeploymentReport report;
    int exit_code{1};
};

// Build an immutable request. In auto mode active/inactive are left empty
// and resolved from the platform during VALIDATING.
Result<DeploymentRequest> make_request(const DeployConfig& config, const std::string& active,
                                       const std::string& inactive, const std::string& image_tag,
                                       const std::string& operator_name, bool auto_detect,
                                       TimePoint now);

// Sole owner of the deployment state machine:
//   VALIDATING -> DEPLOYING -> AWAITING_READY -> HEALTH_CHECKING -> SMOKE_TESTING
//   -> SWITCHING -> VALIDATING_SWITCH -> COMPLETED
// Failure before SWITCHING ends in FAILED with the old environment untouched;
// failure at or after it goes through ROLLING_BACK first.
class Orchestrator {
public:
    Orchestrator(const DeployConfig& config, PlatformClient& platform, HealthProber& prober,
                 SmokeTestRunner& smoke, Clock& clock, const CancellationToken& cancel,
                 ReportSink* sink = nullptr);

    DeploymentOutcome run(const DeploymentRequest& request);

    // The read-only checks of VALIDATING. Resolves auto mode into request.
    Result<void> validate_prerequisites(DeploymentRequest& request);

    // The single abort-vs-rollback decision.
    static bool requires_rollback(const RunState& run, DeploymentState failed_stage);

private:
    struct Stage {
        DeploymentState state;
        std::function<Result<void>(RunState&)> action;
    };

    const DeployConfig& config_;
    PlatformClient& platform_;
    HealthProber& prober_;
    SmokeTestRunner& smoke_;
    Clock& clock_;
    const CancellationToken& cancel_;
    ReportSink* sink_;

    TrafficSwitcher switcher_;
    RollbackController rollback_controller_;

    std::vector<Stage> stages();

    Result<void> advance(RunState& run, DeploymentState to);
    bool execute_stage(RunState& run, const Stage& stage);
    void finish(RunState& run);
    DeploymentOutcome conclude(RunState& run, bool write_report);

    Result<void> validate(RunState& run);
    Result<void> deploy(RunState& run);
    Result<void> await_ready(RunState& run);
    Result<void> health_check(RunState& run);
    Result<void> smoke_test(RunState& run);
    Result<void> switch_traffic(RunState& run);
    Result<void> validate_switch(RunState& run);

    void teardown_candidate(RunState& run);
};

} // namespace bgd
