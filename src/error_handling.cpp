#include "bgd/error_handling.hpp"

namespace bgd {

std::string ErrorCategory::message(int ev) const {
    switch (static_cast<ErrorCode>(ev)) {
        case ErrorCode::SUCCESS: return "Success";

        case ErrorCode::PREREQUISITE_FAILED: return "Prerequisite validation failed";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::TOOL_NOT_FOUND: return "Required tool not found";
        case ErrorCode::PLATFORM_UNREACHABLE: return "Platform unreachable";
        case ErrorCode::TARGET_QUERY_FAILED: return "Current traffic target could not be determined";

        case ErrorCode::DEPLOY_FAILED: return "Deployment to inactive environment failed";
        case ErrorCode::READINESS_TIMEOUT: return "Instances did not become ready in time";
        case ErrorCode::HEALTH_CHECK_EXHAUSTED: return "Health checks exhausted";
        case ErrorCode::SMOKE_TEST_FAILED: return "Smoke test failed";
        case ErrorCode::SMOKE_TEST_TIMEOUT: return "Smoke tests exceeded their time budget";

        case ErrorCode::TRAFFIC_SWITCH_FAILED: return "Traffic switch failed";

        case ErrorCode::POST_SWITCH_VALIDATION_FAILED: return "Post-switch validation failed";

        case ErrorCode::ROLLBACK_FAILED: return "Rollback failed - manual intervention required";

        case ErrorCode::DEPLOYMENT_IN_PROGRESS: return "Deployment in progress";
        case ErrorCode::LOCK_FAILED: return "Deployment lock could not be taken";
        case ErrorCode::JOURNAL_WRITE_FAILED: return "Run journal could not be written";
        case ErrorCode::JOURNAL_READ_FAILED: return "Run journal could not be read";
        case ErrorCode::REPORT_WRITE_FAILED: return "Deployment report could not be written";
        case ErrorCode::DEPLOYMENT_CANCELLED: return "Deployment cancelled";
        case ErrorCode::INVALID_STATE_TRANSITION: return "Invalid deployment state transition";
        case ErrorCode::CLEANUP_NOT_INTERACTIVE: return "Cleanup requires an interactive operator";
        case ErrorCode::CLEANUP_DECLINED: return "Cleanup declined by operator";
        case ErrorCode::CLEANUP_TARGET_ACTIVE: return "Refusing to clean up the environment receiving traffic";
        case ErrorCode::CLEANUP_FAILED: return "Environment cleanup failed";

        case ErrorCode::PROCESS_SPAWN_FAILED: return "Process could not be started";
        case ErrorCode::PROCESS_TIMEOUT: return "Process timed out";
        case ErrorCode::PROCESS_EXIT_NONZERO: return "Process exited with non-zero status";
        case ErrorCode::NETWORK_CONNECTION_FAILED: return "Network connection failed";
        case ErrorCode::NETWORK_TIMEOUT: return "Network operation timed out";
        case ErrorCode::HTTP_BAD_STATUS: return "Unexpected HTTP status";
        case ErrorCode::HTTP_INVALID_RESPONSE: return "Invalid HTTP response";
        case ErrorCode::TLS_HANDSHAKE_FAILED: return "TLS handshake failed";
        case ErrorCode::TLS_VERIFY_FAILED: return "TLS peer verification failed";
        case ErrorCode::INVALID_URL: return "Invalid URL";

        case ErrorCode::CONFIG_FILE_NOT_FOUND: return "Configuration file not found";
        case ErrorCode::CONFIG_PARSE_ERROR: return "Configuration value could not be parsed";
        case ErrorCode::CONFIG_VALIDATION_FAILED: return "Configuration validation failed";
        case ErrorCode::CONFIG_KEY_NOT_FOUND: return "Configuration key not found";

        case ErrorCode::CRYPTO_FAILED: return "Cryptographic operation failed";

        default: return "Unknown error";
    }
}

const ErrorCategory& error_category() {
    static ErrorCategory instance;
    return instance;
}

std::error_code make_error_code(ErrorCode ec) {
    return {static_cast<int>(ec), error_category()};
}

ErrorClass classify(ErrorCode ec) {
    int value = static_cast<int>(ec);
    if (value == 0) return ErrorClass::NONE;
    if (value < 2000) return ErrorClass::PREREQUISITE;
    if (value < 3000) return ErrorClass::PRE_SWITCH;
    if (value < 4000) return ErrorClass::TRAFFIC_SWITCH;
    if (value < 5000) return ErrorClass::POST_SWITCH;
    if (value < 6000) return ErrorClass::ROLLBACK;
    return ErrorClass::INFRASTRUCTURE;
}

const char* to_string(ErrorClass error_class) {
    switch (error_class) {
        case ErrorClass::NONE: return "none";
        case ErrorClass::PREREQUISITE: return "prerequisite";
        case ErrorClass::PRE_SWITCH: return "pre-switch";
        case ErrorClass::TRAFFIC_SWITCH: return "traffic-switch";
        case ErrorClass::POST_SWITCH: return "post-switch";
        case ErrorClass::ROLLBACK: return "rollback";
        case ErrorClass::INFRASTRUCTURE: return "infrastructure";
    }
    return "unknown";
}

const char* taxonomy_name(ErrorCode ec) {
    switch (ec) {
        case ErrorCode::SUCCESS: return "None";
        case ErrorCode::DEPLOY_FAILED: return "DeployError";
        case ErrorCode::READINESS_TIMEOUT: return "ReadinessTimeout";
        case ErrorCode::HEALTH_CHECK_EXHAUSTED: return "HealthCheckExhausted";
        case ErrorCode::SMOKE_TEST_FAILED:
        case ErrorCode::SMOKE_TEST_TIMEOUT: return "SmokeTestFailure";
        case ErrorCode::TRAFFIC_SWITCH_FAILED: return "TrafficSwitchError";
        case ErrorCode::POST_SWITCH_VALIDATION_FAILED: return "PostSwitchValidationFailure";
        case ErrorCode::ROLLBACK_FAILED: return "RollbackFailure";
        default: break;
    }
    switch (classify(ec)) {
        case ErrorClass::PREREQUISITE: return "PrerequisiteError";
        case ErrorClass::INFRASTRUCTURE: return "InfrastructureError";
        default: return "UnclassifiedError";
    }
}

} // namespace bgd
