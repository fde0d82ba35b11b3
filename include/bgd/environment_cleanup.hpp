#pragma once

#include "bgd/config.hpp"
#include "bgd/error_handling.hpp"
#include "bgd/platform_client.hpp"
#include <functional>
#include <string>

namespace bgd {

// Operator-gated teardown of an idle environment. Lives outside the release
// state machine and refuses to run without a person at the terminal.
class EnvironmentCleanup {
public:
    // Shows the prompt, returns the operator's answer line.
    using Confirm = std::function<std::string(const std::string& prompt)>;

    EnvironmentCleanup(PlatformClient& platform, const DeployConfig& config, Confirm confirm,
                       bool interactive);

    // Holds the pair's deployment lock from the target check through the
    // teardown. CLEANUP_NOT_INTERACTIVE, DEPLOYMENT_IN_PROGRESS,
    // CLEANUP_TARGET_ACTIVE and CLEANUP_DECLINED leave the platform untouched.
    Result<void> decommission_previous(const std::string& env);

private:
    PlatformClient& platform_;
    const DeployConfig& config_;
    Confirm confirm_;
    bool interactive_;
};

} // namespace bgd
