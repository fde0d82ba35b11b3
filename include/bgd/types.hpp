#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace bgd {

using WallClock = std::chrono::system_clock;
using TimePoint = WallClock::time_point;

// One of the two parallel deployment targets ("blue"/"green") with its
// resolved endpoints. Identity is the name only.
struct EnvironmentId {
    std::string name;
    std::string internal_endpoint;   // in-cluster base URL, used before the switch
    std::string public_endpoint;     // routed base URL, used after the switch

    bool operator==(const EnvironmentId& other) const { return name == other.name; }
    bool operator!=(const EnvironmentId& other) const { return name != other.name; }
};

struct DeploymentRequest {
    std::string deployment_id;
    std::string image_tag;
    EnvironmentId active;
    EnvironmentId inactive;
    TimePoint requested_at;
    std::string operator_name;
    bool auto_detect{false};   // resolve active/inactive from the platform at VALIDATING
};

enum class DeploymentState {
    VALIDATING,
    DEPLOYING,
    AWAITING_READY,
    HEALTH_CHECKING,
    SMOKE_TESTING,
    SWITCHING,
    VALIDATING_SWITCH,
    ROLLING_BACK,
    COMPLETED,
    FAILED
};

const char* to_string(DeploymentState state);
bool parse_deployment_state(const std::string& text, DeploymentState& out);

bool is_terminal(DeploymentState state);

// True for SWITCHING and every state after it in the forward order.
bool is_post_switch(DeploymentState state);

// Forward-only transitions, plus SWITCHING/VALIDATING_SWITCH -> ROLLING_BACK.
bool is_valid_transition(DeploymentState from, DeploymentState to);

// Tagged outcome of a stage or of a single probe attempt.
enum class StepVerdict {
    ADVANCE,
    RETRY,
    FAIL
};

const char* to_string(StepVerdict verdict);

struct ProbeResult {
    uint32_t attempt{0};
    TimePoint timestamp;
    bool success{false};
    std::chrono::milliseconds latency{0};
    std::string detail;
};

struct RollbackRecord {
    DeploymentState triggering_stage{DeploymentState::SWITCHING};
    std::string reason;
    TimePoint started_at;
    TimePoint completed_at;
    bool succeeded{false};
};

struct SmokeTestResult {
    bool passed{false};
    bool timed_out{false};
    std::string failed_check;
    std::string output;
    std::chrono::milliseconds duration{0};
};

// Per-stage trace kept by the orchestrator for the report.
struct StageRecord {
    DeploymentState stage{DeploymentState::VALIDATING};
    bool passed{false};
    std::string detail;
    TimePoint started_at;
    std::chrono::milliseconds duration{0};
};

} // namespace bgd
