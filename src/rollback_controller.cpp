#include "bgd/rollback_controller.hpp"
#include "bgd/logger.hpp"

namespace bgd {

RollbackController::RollbackController(PlatformClient& platform, Clock& clock)
    : platform_(platform), clock_(clock) {}

RollbackRecord RollbackController::rollback(const EnvironmentId& previous, DeploymentState triggering_stage,
                                            const std::string& reason, RunState& run) {
    RollbackRecord record;
    record.triggering_stage = triggering_stage;
    record.reason = reason;
    record.started_at = clock_.wall_now();

    LOG_WARN("Rolling back traffic to " + previous.name + " (" + to_string(triggering_stage) +
             ": " + reason + ")");

    auto restored = platform_.set_target(previous.name);
    record.completed_at = clock_.wall_now();
    record.succeeded = restored.has_value();

    if (record.succeeded) {
        auto persisted = run.clear_switch_occurred();
        if (persisted.has_error()) {
            LOG_ERROR("Switch flag not persisted: " + persisted.describe());
        }
        LOG_INFO("Rollback to " + previous.name + " completed");
    } else {
        LOG_FATAL("ROLLBACK FAILED, traffic state unknown. " + restored.describe());
        LOG_FATAL("Restore manually: " + manual_instructions(previous));
    }

    return record;
}

std::string RollbackController::manual_instructions(const EnvironmentId& previous) {
    return "repoint the traffic switch at '" + previous.name +
           "' with the platform's switch command, then verify with 'bgd-deploy status'";
}

} // namespace bgd
