#include "bgd/traffic_switcher.hpp"
#include "bgd/logger.hpp"

namespace bgd {

TrafficSwitcher::TrafficSwitcher(PlatformClient& platform, HealthProber& prober)
    : platform_(platform), prober_(prober) {}

Result<void> TrafficSwitcher::switch_traffic(const EnvironmentId& target, RunState& run) {
    LOG_INFO("Switching live traffic to " + target.name);

    auto accepted = platform_.set_target(target.name);

    auto persisted = run.mark_switch_occurred();
    if (persisted.has_error()) {
        LOG_ERROR("Switch flag not persisted: " + persisted.describe());
    }

    if (accepted.has_error()) {
        LOG_ERROR("Traffic switch to " + target.name + " rejected: " + accepted.describe());
        return Result<void>(ErrorCode::TRAFFIC_SWITCH_FAILED, accepted.describe());
    }

    // Read back what the router actually points at.
    auto current = platform_.current_target();
    if (current.has_error()) {
        return Result<void>(ErrorCode::TRAFFIC_SWITCH_FAILED,
                            "switch not confirmed: " + current.describe());
    }
    if (current.value() != target.name) {
        return Result<void>(ErrorCode::TRAFFIC_SWITCH_FAILED,
                            "traffic target is " + current.value() + ", expected " + target.name);
    }

    LOG_INFO("Traffic switched to " + target.name);
    return Result<void>();
}

ProbeResult TrafficSwitcher::validate_switch(const EnvironmentId& target, const std::string& health_path,
                                             const RetryPolicy& policy, std::vector<ProbeResult>* history) {
    LOG_INFO("Validating traffic switch to " + target.name + " through " + target.public_endpoint);
    return prober_.probe(target.public_endpoint + health_path, policy, history);
}

} // namespace bgd
