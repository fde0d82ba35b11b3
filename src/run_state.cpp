#include "bgd/run_state.hpp"
#include "bgd/logger.hpp"

namespace bgd {

RunState::RunState(DeploymentRequest request) : request_(std::move(request)) {}

Result<void> RunState::persist() const {
    if (!persist_hook_) return Result<void>();
    return persist_hook_(*this);
}

Result<void> RunState::mark_switch_occurred() {
    switch_occurred_ = true;
    return persist();
}

Result<void> RunState::clear_switch_occurred() {
    switch_occurred_ = false;
    return persist();
}

Result<void> RunState::transition(DeploymentState to) {
    if (!is_valid_transition(state_, to)) {
        return Result<void>(ErrorCode::INVALID_STATE_TRANSITION,
                            std::string(to_string(state_)) + " -> " + to_string(to));
    }

    LOG_INFO("State " + std::string(to_string(state_)) + " -> " + to_string(to));
    state_ = to;
    return persist();
}

void RunState::record_failure(DeploymentState stage, ErrorCode error, std::string detail) {
    // First failure wins; rollback trouble is reported through the rollback record.
    if (failed_stage_) return;
    failed_stage_ = stage;
    error_ = error;
    error_detail_ = std::move(detail);
}

void RunState::resolve_environments(EnvironmentId active, EnvironmentId inactive) {
    request_.active = std::move(active);
    request_.inactive = std::move(inactive);
}

} // namespace bgd
