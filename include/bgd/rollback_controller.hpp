#pragma once

#include "bgd/clock.hpp"
#include "bgd/platform_client.hpp"
#include "bgd/run_state.hpp"
#include <string>

namespace bgd {

// Restores traffic to the previously active environment. One attempt only:
// a router that refuses a rollback needs a human, not a retry loop.
class RollbackController {
public:
    RollbackController(PlatformClient& platform, Clock& clock);

    RollbackRecord rollback(const EnvironmentId& previous, DeploymentState triggering_stage,
                            const std::string& reason, RunState& run);

    // The command an operator runs to restore traffic by hand.
    static std::string manual_instructions(const EnvironmentId& previous);

private:
    PlatformClient& platform_;
    Clock& clock_;
};

} // namespace bgd
