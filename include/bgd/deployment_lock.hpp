#pragma once

#include "bgd/error_handling.hpp"
#include <memory>
#include <string>

namespace bgd {

// Exclusive, non-queueing lock over one environment pair, held with
// flock(2) for as long as the object lives. The kernel drops the lock if
// the process dies, so a crash never leaves a stale lock behind.
class DeploymentLock {
public:
    ~DeploymentLock();

    DeploymentLock(const DeploymentLock&) = delete;
    DeploymentLock& operator=(const DeploymentLock&) = delete;

    // DEPLOYMENT_IN_PROGRESS when another holder exists.
    static Result<std::unique_ptr<DeploymentLock>> acquire(const std::string& dir,
                                                           const std::string& env_a,
                                                           const std::string& env_b);

    static std::string path_for(const std::string& dir, const std::string& env_a,
                                const std::string& env_b);

    const std::string& path() const { return path_; }

private:
    DeploymentLock(int fd, std::string path);

    int fd_;
    std::string path_;
};

// "<a>-<b>" with the names in sorted order, so both directions of a
// release share the same lock and journal.
std::string pair_key(const std::string& env_a, const std::string& env_b);

} // namespace bgd
