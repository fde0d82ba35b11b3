#pragma once

#include "bgd/health_prober.hpp"
#include "bgd/platform_client.hpp"
#include "bgd/run_state.hpp"
#include <string>
#include <vector>

namespace bgd {

// The point of no return: one repoint of live traffic, then validation of
// the whole routing path through the public endpoint.
class TrafficSwitcher {
public:
    TrafficSwitcher(PlatformClient& platform, HealthProber& prober);

    // Exactly one set_target call. The switch-occurred flag is set as soon
    // as the call has been issued, even when the platform reports failure:
    // a failed repoint may still have changed routing.
    Result<void> switch_traffic(const EnvironmentId& target, RunState& run);

    ProbeResult validate_switch(const EnvironmentId& target, const std::string& health_path,
                                const RetryPolicy& policy, std::vector<ProbeResult>* history = nullptr);

private:
    PlatformClient& platform_;
    HealthProber& prober_;
};

} // namespace bgd
