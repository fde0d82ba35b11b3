#pragma once

#include "bgd/error_handling.hpp"
#include "bgd/types.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace bgd {

class Orchestrator;

// Everything one release run knows about itself. The deployment state and
// the trace are written only by the Orchestrator; the "switch occurred"
// flag is set by the traffic switch and cleared by a successful rollback.
// Every change to state or flag is pushed through the persist hook.
class RunState {
public:
    using PersistHook = std::function<Result<void>(const RunState&)>;

    explicit RunState(DeploymentRequest request);

    const DeploymentRequest& request() const { return request_; }
    DeploymentState state() const { return state_; }
    bool switch_occurred() const { return switch_occurred_; }

    // Set before the switch call returns, whatever happens afterwards.
    Result<void> mark_switch_occurred();
    Result<void> clear_switch_occurred();

    void set_persist_hook(PersistHook hook) { persist_hook_ = std::move(hook); }

    // Trace for the report
    const std::vector<StageRecord>& stages() const { return stages_; }
    const std::vector<ProbeResult>& health_probes() const { return health_probes_; }
    const std::vector<ProbeResult>& switch_probes() const { return switch_probes_; }
    const std::optional<SmokeTestResult>& smoke_result() const { return smoke_result_; }
    const std::optional<RollbackRecord>& rollback() const { return rollback_; }

    // Stage the failure was attributed to, empty while nothing failed.
    const std::optional<DeploymentState>& failed_stage() const { return failed_stage_; }
    ErrorCode error() const { return error_; }
    const std::string& error_detail() const { return error_detail_; }

    bool cancelled() const { return cancelled_; }
    bool candidate_deployed() const { return candidate_deployed_; }
    TimePoint finished_at() const { return finished_at_; }

private:
    friend class Orchestrator;

    Result<void> transition(DeploymentState to);
    Result<void> persist() const;

    void record_failure(DeploymentState stage, ErrorCode error, std::string detail);
    void resolve_environments(EnvironmentId active, EnvironmentId inactive);

    DeploymentRequest request_;
    DeploymentState state_{DeploymentState::VALIDATING};
    bool switch_occurred_{false};

    std::vector<StageRecord> stages_;
    std::vector<ProbeResult> health_probes_;
    std::vector<ProbeResult> switch_probes_;
    std::optional<SmokeTestResult> smoke_result_;
    std::optional<RollbackRecord> rollback_;

    std::optional<DeploymentState> failed_stage_;
    ErrorCode error_{ErrorCode::SUCCESS};
    std::string error_detail_;

    bool cancelled_{false};
    bool candidate_deployed_{false};
    TimePoint finished_at_{};

    PersistHook persist_hook_;
};

} // namespace bgd
