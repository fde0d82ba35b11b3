#include "bgd/deployment_lock.hpp"
#include "bgd/logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace bgd {

std::string pair_key(const std::string& env_a, const std::string& env_b) {
    return env_a < env_b ? env_a + "-" + env_b : env_b + "-" + env_a;
}

std::string DeploymentLock::path_for(const std::string& dir, const std::string& env_a,
                                     const std::string& env_b) {
    return dir + "/bgd-" + pair_key(env_a, env_b) + ".lock";
}

DeploymentLock::DeploymentLock(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}

DeploymentLock::~DeploymentLock() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        LOG_DEBUG("Released deployment lock " + path_);
    }
}

Result<std::unique_ptr<DeploymentLock>> DeploymentLock::acquire(const std::string& dir,
                                                                const std::string& env_a,
                                                                const std::string& env_b) {
    std::string path = path_for(dir, env_a, env_b);

    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Result<std::unique_ptr<DeploymentLock>>(ErrorCode::LOCK_FAILED,
                                                       path + ": " + std::strerror(errno));
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int saved = errno;
        ::close(fd);
        if (saved == EWOULDBLOCK) {
            return Result<std::unique_ptr<DeploymentLock>>(ErrorCode::DEPLOYMENT_IN_PROGRESS,
                                                           "environment pair " + pair_key(env_a, env_b));
        }
        return Result<std::unique_ptr<DeploymentLock>>(ErrorCode::LOCK_FAILED,
                                                       path + ": " + std::strerror(saved));
    }

    // Record the holder for operators inspecting the lock file.
    std::string holder = std::to_string(::getpid()) + "\n";
    if (::ftruncate(fd, 0) == 0) {
        ssize_t written = ::pwrite(fd, holder.data(), holder.size(), 0);
        if (written < 0) {
            LOG_WARN("Could not record lock holder in " + path);
        }
    }

    LOG_INFO("Acquired deployment lock " + path);
    return std::unique_ptr<DeploymentLock>(new DeploymentLock(fd, path));
}

} // namespace bgd
