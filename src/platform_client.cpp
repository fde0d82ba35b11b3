#include "bgd/platform_client.hpp"
#include "bgd/logger.hpp"
#include "bgd/security_utils.hpp"

namespace bgd {

namespace {

// Extra time given to a tool on top of its own --timeout so that it can
// report the timeout itself before being killed.
constexpr std::chrono::seconds TOOL_GRACE{15};

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n'\"");
    if (begin == std::string::npos) return "";
    auto end = text.find_last_not_of(" \t\r\n'\"");
    return text.substr(begin, end - begin + 1);
}

std::string tail(const std::string& output, size_t max = 2048) {
    return output.size() <= max ? output : output.substr(output.size() - max);
}

Result<void> check_environment(const std::string& env) {
    if (!SecurityUtils::is_valid_environment_name(env)) {
        return Result<void>(ErrorCode::INVALID_ARGUMENT, "invalid environment name: " + env);
    }
    return Result<void>();
}

} // namespace

CommandPlatformClient::CommandPlatformClient(PlatformConfig config, ProcessRunner& runner)
    : config_(std::move(config)), runner_(runner) {}

std::map<std::string, std::string> CommandPlatformClient::variables(const std::string& env) const {
    std::map<std::string, std::string> vars{{"env", env}};
    vars["namespace"] = substitute(config_.namespace_template, vars);
    vars["release"] = substitute(config_.release_template, vars);
    vars["service"] = substitute(config_.service_template, vars);
    vars["chart"] = config_.chart_path;
    vars["values"] = config_.values_file;
    vars["host"] = config_.public_host;
    return vars;
}

Result<ProcessResult> CommandPlatformClient::execute(const std::string& command_template,
                                                     std::map<std::string, std::string> vars,
                                                     std::chrono::seconds timeout, ErrorCode failure,
                                                     ErrorCode timeout_code) {
    vars["timeout"] = std::to_string(timeout.count());

    auto argv = CommandTemplate(command_template).expand(vars);
    if (argv.has_error()) {
        return Result<ProcessResult>(argv.error(), argv.detail());
    }

    LOG_INFO("Running: " + join_command(argv.value()));

    auto result = runner_.run(argv.value(), timeout + TOOL_GRACE);
    if (result.has_error()) {
        return Result<ProcessResult>(failure, result.describe());
    }

    const auto& process = result.value();
    if (process.timed_out) {
        return Result<ProcessResult>(timeout_code, tail(process.output));
    }
    if (process.exit_code != 0) {
        return Result<ProcessResult>(failure, "exit " + std::to_string(process.exit_code) + ": " +
                                                  tail(process.output));
    }
    return result;
}

Result<void> CommandPlatformClient::ping() {
    auto result = execute(config_.ping_command, {}, config_.command_timeout,
                          ErrorCode::PLATFORM_UNREACHABLE, ErrorCode::PLATFORM_UNREACHABLE);
    if (result.has_error()) return Result<void>(result.error(), result.detail());
    return Result<void>();
}

Result<void> CommandPlatformClient::deploy(const std::string& env, const std::string& image_tag,
                                           std::chrono::seconds timeout) {
    auto valid = check_environment(env);
    if (valid.has_error()) return valid;
    if (!SecurityUtils::is_valid_image_tag(image_tag)) {
        return Result<void>(ErrorCode::INVALID_ARGUMENT, "invalid image tag: " + image_tag);
    }

    auto vars = variables(env);
    vars["tag"] = image_tag;

    LOG_INFO("Deploying " + image_tag + " to " + env + " environment");
    auto result = execute(config_.deploy_command, vars, timeout,
                          ErrorCode::DEPLOY_FAILED, ErrorCode::DEPLOY_FAILED);
    if (result.has_error()) return Result<void>(result.error(), result.detail());
    return Result<void>();
}

Result<void> CommandPlatformClient::wait_ready(const std::string& env, std::chrono::seconds timeout) {
    auto valid = check_environment(env);
    if (valid.has_error()) return valid;

    auto result = execute(config_.ready_command, variables(env), timeout,
                          ErrorCode::READINESS_TIMEOUT, ErrorCode::READINESS_TIMEOUT);
    if (result.has_error()) return Result<void>(result.error(), result.detail());
    return Result<void>();
}

Result<std::string> CommandPlatformClient::current_target() {
    auto result = execute(config_.target_command, {}, config_.command_timeout,
                          ErrorCode::TARGET_QUERY_FAILED, ErrorCode::TARGET_QUERY_FAILED);
    if (result.has_error()) return Result<std::string>(result.error(), result.detail());

    std::string reported = trim(result.value().output);
    for (const auto& env : config_.environments) {
        if (reported == env || reported == variables(env).at("service")) {
            return env;
        }
    }

    // Anything else is not a state this tool can reason about.
    return Result<std::string>(ErrorCode::TARGET_QUERY_FAILED,
                               "unrecognized traffic target '" + tail(reported, 128) + "'");
}

Result<void> CommandPlatformClient::set_target(const std::string& env) {
    auto valid = check_environment(env);
    if (valid.has_error()) return valid;

    LOG_INFO("Switching traffic to " + env + " environment");
    auto result = execute(config_.switch_command, variables(env), config_.command_timeout,
                          ErrorCode::TRAFFIC_SWITCH_FAILED, ErrorCode::TRAFFIC_SWITCH_FAILED);
    if (result.has_error()) return Result<void>(result.error(), result.detail());
    return Result<void>();
}

Result<void> CommandPlatformClient::decommission(const std::string& env, std::chrono::seconds timeout) {
    auto valid = check_environment(env);
    if (valid.has_error()) return valid;

    auto vars = variables(env);
    LOG_INFO("Decommissioning " + env + " environment");

    auto uninstall = execute(config_.decommission_command, vars, timeout,
                             ErrorCode::CLEANUP_FAILED, ErrorCode::CLEANUP_FAILED);
    if (uninstall.has_error()) return Result<void>(uninstall.error(), uninstall.detail());

    if (!config_.delete_namespace_command.empty()) {
        auto removed = execute(config_.delete_namespace_command, vars, timeout,
                               ErrorCode::CLEANUP_FAILED, ErrorCode::CLEANUP_FAILED);
        if (removed.has_error()) return Result<void>(removed.error(), removed.detail());
    }
    return Result<void>();
}

} // namespace bgd
