#pragma once

#include "bgd/config.hpp"
#include "bgd/error_handling.hpp"
#include "bgd/process_runner.hpp"
#include <chrono>
#include <map>
#include <string>

namespace bgd {

// Capability interface over the orchestration platform. Implementations
// report tagged results; callers never see raw exit codes.
class PlatformClient {
public:
    virtual ~PlatformClient() = default;

    // Read-only reachability check used during prerequisite validation.
    virtual Result<void> ping() = 0;

    virtual Result<void> deploy(const std::string& env, const std::string& image_tag,
                                std::chrono::seconds timeout) = 0;
    virtual Result<void> wait_ready(const std::string& env, std::chrono::seconds timeout) = 0;

    // Name of the environment currently receiving traffic.
    virtual Result<std::string> current_target() = 0;

    // The single atomic traffic repoint.
    virtual Result<void> set_target(const std::string& env) = 0;

    // Remove a deployed environment. Never called on the traffic target.
    virtual Result<void> decommission(const std::string& env, std::chrono::seconds timeout) = 0;
};

// PlatformClient driven by configurable command templates (helm/kubectl by
// default), one external process per operation.
class CommandPlatformClient : public PlatformClient {
public:
    CommandPlatformClient(PlatformConfig config, ProcessRunner& runner);

    Result<void> ping() override;
    Result<void> deploy(const std::string& env, const std::string& image_tag,
                        std::chrono::seconds timeout) override;
    Result<void> wait_ready(const std::string& env, std::chrono::seconds timeout) override;
    Result<std::string> current_target() override;
    Result<void> set_target(const std::string& env) override;
    Result<void> decommission(const std::string& env, std::chrono::seconds timeout) override;

    // Placeholder values for one environment: env, namespace, release,
    // service, chart, values, host.
    std::map<std::string, std::string> variables(const std::string& env) const;

private:
    PlatformConfig config_;
    ProcessRunner& runner_;

    // Expand and run a template; failure, timeout or non-zero exit become
    // `failure` with the command output as detail.
    Result<ProcessResult> execute(const std::string& command_template,
                                  std::map<std::string, std::string> vars,
                                  std::chrono::seconds timeout, ErrorCode failure,
                                  ErrorCode timeout_code);
};

} // namespace bgd
