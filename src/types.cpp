#include "bgd/types.hpp"

namespace bgd {

namespace {

constexpr DeploymentState kAllStates[] = {
    DeploymentState::VALIDATING,
    DeploymentState::DEPLOYING,
    DeploymentState::AWAITING_READY,
    DeploymentState::HEALTH_CHECKING,
    DeploymentState::SMOKE_TESTING,
    DeploymentState::SWITCHING,
    DeploymentState::VALIDATING_SWITCH,
    DeploymentState::ROLLING_BACK,
    DeploymentState::COMPLETED,
    DeploymentState::FAILED
};

int ordinal(DeploymentState state) {
    return static_cast<int>(state);
}

} // namespace

const char* to_string(DeploymentState state) {
    switch (state) {
        case DeploymentState::VALIDATING: return "VALIDATING";
        case DeploymentState::DEPLOYING: return "DEPLOYING";
        case DeploymentState::AWAITING_READY: return "AWAITING_READY";
        case DeploymentState::HEALTH_CHECKING: return "HEALTH_CHECKING";
        case DeploymentState::SMOKE_TESTING: return "SMOKE_TESTING";
        case DeploymentState::SWITCHING: return "SWITCHING";
        case DeploymentState::VALIDATING_SWITCH: return "VALIDATING_SWITCH";
        case DeploymentState::ROLLING_BACK: return "ROLLING_BACK";
        case DeploymentState::COMPLETED: return "COMPLETED";
        case DeploymentState::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

bool parse_deployment_state(const std::string& text, DeploymentState& out) {
    for (auto state : kAllStates) {
        if (text == to_string(state)) {
            out = state;
            return true;
        }
    }
    return false;
}

bool is_terminal(DeploymentState state) {
    return state == DeploymentState::COMPLETED || state == DeploymentState::FAILED;
}

bool is_post_switch(DeploymentState state) {
    return state == DeploymentState::SWITCHING ||
           state == DeploymentState::VALIDATING_SWITCH ||
           state == DeploymentState::ROLLING_BACK;
}

bool is_valid_transition(DeploymentState from, DeploymentState to) {
    if (is_terminal(from)) return false;

    if (to == DeploymentState::FAILED) return true;

    if (to == DeploymentState::ROLLING_BACK) {
        return from == DeploymentState::SWITCHING || from == DeploymentState::VALIDATING_SWITCH;
    }

    if (to == DeploymentState::COMPLETED) {
        return from == DeploymentState::VALIDATING_SWITCH;
    }

    // Linear pipeline: exactly one step forward
    if (from == DeploymentState::ROLLING_BACK) return false;
    return ordinal(to) == ordinal(from) + 1 && ordinal(to) <= ordinal(DeploymentState::VALIDATING_SWITCH);
}

const char* to_string(StepVerdict verdict) {
    switch (verdict) {
        case StepVerdict::ADVANCE: return "advance";
        case StepVerdict::RETRY: return "retry";
        case StepVerdict::FAIL: return "fail";
    }
    return "unknown";
}

} // namespace bgd
