#include "bgd/environment_cleanup.hpp"
#include "bgd/deployment_lock.hpp"
#include "bgd/logger.hpp"
#include "bgd/security_utils.hpp"

namespace bgd {

EnvironmentCleanup::EnvironmentCleanup(PlatformClient& platform, const DeployConfig& config,
                                       Confirm confirm, bool interactive)
    : platform_(platform), config_(config), confirm_(std::move(confirm)), interactive_(interactive) {}

Result<void> EnvironmentCleanup::decommission_previous(const std::string& env) {
    if (!interactive_ || !confirm_) {
        return Result<void>(ErrorCode::CLEANUP_NOT_INTERACTIVE, env);
    }
    if (!SecurityUtils::is_valid_environment_name(env)) {
        return Result<void>(ErrorCode::INVALID_ARGUMENT, "invalid environment name: " + env);
    }
    if (config_.counterpart(env).empty()) {
        return Result<void>(ErrorCode::INVALID_ARGUMENT, env + " is not part of the configured pair");
    }

    // No release may switch traffic between the target check and the teardown.
    auto lock = DeploymentLock::acquire(config_.state.lock_dir, config_.platform.environments.at(0),
                                        config_.platform.environments.at(1));
    if (lock.has_error()) {
        return Result<void>(lock.error(), lock.detail());
    }

    // Fail closed: without knowing the live target we cannot prove env is idle.
    auto current = platform_.current_target();
    if (current.has_error()) {
        return Result<void>(current.error(), current.detail());
    }
    if (current.value() == env) {
        return Result<void>(ErrorCode::CLEANUP_TARGET_ACTIVE, env + " is receiving traffic");
    }

    std::string answer = confirm_("Decommission the " + env + " environment? Live traffic is on " +
                                  current.value() + ". (y/N): ");
    if (answer != "y" && answer != "Y") {
        LOG_INFO("Cleanup of " + env + " declined by operator");
        return Result<void>(ErrorCode::CLEANUP_DECLINED, env);
    }

    LOG_INFO("Cleaning up " + env + " environment");
    auto removed = platform_.decommission(env, config_.timeouts.deploy);
    if (removed.has_error()) {
        return Result<void>(ErrorCode::CLEANUP_FAILED, removed.describe());
    }
    LOG_INFO("Environment " + env + " decommissioned");
    return Result<void>();
}

} // namespace bgd
