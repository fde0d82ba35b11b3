/**
 * @file main.cpp
 * @brief Entry point for the bgd-deploy release orchestrator
 *
 * Commands:
 * - bgd-deploy [ACTIVE] [INACTIVE] [IMAGE_TAG]   explicit release
 * - bgd-deploy auto [IMAGE_TAG]                  resolve environments from live traffic
 * - bgd-deploy cleanup ENV                       interactive teardown of an idle environment
 * - bgd-deploy status                            journal of the last run for the pair
 */

#include "bgd/config.hpp"
#include "bgd/environment_cleanup.hpp"
#include "bgd/http_client.hpp"
#include "bgd/logger.hpp"
#include "bgd/orchestrator.hpp"
#include "bgd/platform_client.hpp"
#include "bgd/process_runner.hpp"
#include "bgd/run_journal.hpp"
#include "bgd/smoke_test_runner.hpp"
#include <cstdlib>
#include <iostream>
#include <string>
#include <signal.h>
#include <unistd.h>
#include <vector>

namespace bgd {

// Global cancellation flag, set on SIGINT/SIGTERM
CancellationToken cancellation;

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [--config FILE] [ACTIVE_ENV] [INACTIVE_ENV] [IMAGE_TAG]\n"
              << "       " << program << " [--config FILE] auto [IMAGE_TAG]\n"
              << "       " << program << " [--config FILE] cleanup ENV\n"
              << "       " << program << " [--config FILE] status\n"
              << "\n"
              << "Blue/green release of IMAGE_TAG (default: latest) to INACTIVE_ENV, then\n"
              << "switch live traffic away from ACTIVE_ENV (defaults: blue, green).\n"
              << "\n"
              << "Environment:\n"
              << "  BGD_CONFIG             configuration file (same as --config)\n"
              << "  TIMEOUT                deploy and readiness timeout in seconds (default 600)\n"
              << "  HEALTH_CHECK_RETRIES   health check attempts (default 30)\n"
              << "  SMOKE_TEST_TIMEOUT     smoke test budget in seconds (default 300)\n"
              << "  BGD_<SECTION>_<KEY>    override any configuration key\n"
              << "\n"
              << "Exit status: 0 when the release completed, 1 otherwise.\n";
}

void configure_logging(const LoggingConfig& config) {
    auto& logger = Logger::instance();

    LogLevel level = LogLevel::INFO;
    if (parse_log_level(config.level, level)) {
        logger.set_level(level);
    }
    logger.enable_structured(config.enable_structured);
    logger.set_rate_limit(std::chrono::milliseconds(config.rate_limit_ms));
}

// Audit trail of one release, next to the report.
Result<void> open_deployment_log(const LoggingConfig& config, const std::string& deployment_id) {
    auto& logger = Logger::instance();
    std::string path = config.file.empty()
                           ? config.dir + "/bgd_deploy_" + deployment_id + ".log"
                           : config.file;
    return logger.set_output_file(path);
}

std::string trim_answer(const std::string& line) {
    auto begin = line.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = line.find_last_not_of(" \t\r\n");
    return line.substr(begin, end - begin + 1);
}

int run_deployment(const DeployConfig& config, const std::string& active, const std::string& inactive,
                   const std::string& image_tag, bool auto_detect) {
    SystemClock clock;
    const char* user = std::getenv("USER");

    auto request = make_request(config, active, inactive, image_tag, user ? user : "", auto_detect,
                                clock.wall_now());
    if (request.has_error()) {
        LOG_ERROR("Cannot create deployment request: " + request.describe());
        return 1;
    }

    auto logging = open_deployment_log(config.logging, request.value().deployment_id);
    if (logging.has_error()) {
        LOG_WARN("Deployment log file unavailable: " + logging.describe());
    }

    ProcessRunner processes;
    CommandPlatformClient platform(config.platform, processes);
    SocketHttpClient http(config.endpoints.tls_verify);
    HealthProber prober(http, clock);

    SmokeTestRunner smoke(clock);
    add_default_checks(smoke, config, http, processes);

    const char* signing_key = std::getenv(config.report.signing_key_env.c_str());
    FileReportSink sink(config.report.dir, signing_key ? signing_key : "");

    Orchestrator orchestrator(config, platform, prober, smoke, clock, cancellation, &sink);
    auto outcome = orchestrator.run(request.value());

    std::cout << Reporter::summary(outcome.report) << std::endl;
    return outcome.exit_code;
}

int run_cleanup(const DeployConfig& config, const std::string& env) {
    bool interactive = ::isatty(STDIN_FILENO) && ::isatty(STDOUT_FILENO);

    ProcessRunner processes;
    CommandPlatformClient platform(config.platform, processes);
    EnvironmentCleanup cleanup(platform, config, [](const std::string& prompt) {
        std::cout << prompt << std::flush;
        std::string line;
        std::getline(std::cin, line);
        return trim_answer(line);
    }, interactive);

    auto result = cleanup.decommission_previous(env);
    if (result.has_error()) {
        if (to_error_code(result.error()) == ErrorCode::CLEANUP_DECLINED) {
            std::cout << "Cleanup skipped" << std::endl;
            return 0;
        }
        LOG_ERROR("Cleanup failed: " + result.describe());
        return 1;
    }
    std::cout << "Environment " << env << " decommissioned" << std::endl;
    return 0;
}

int run_status(const DeployConfig& config) {
    RunJournal journal(config.state.journal_dir, config.platform.environments.at(0),
                       config.platform.environments.at(1));
    auto entry = journal.read();
    if (entry.has_error()) {
        if (entry.detail() == "missing") {
            std::cout << "No deployment recorded for this environment pair" << std::endl;
            return 0;
        }
        LOG_ERROR("Cannot read " + journal.path() + ": " + entry.describe());
        return 1;
    }

    const auto& e = entry.value();
    bool running = !is_terminal(e.state) && e.pid > 0 && ::kill(e.pid, 0) == 0;

    std::cout << "Deployment:      " << e.deployment_id << "\n"
              << "Image tag:       " << e.image_tag << "\n"
              << "State:           " << to_string(e.state) << (running ? " (in progress)" : "") << "\n"
              << "Previous target: " << e.previous_target << "\n"
              << "New target:      " << e.new_target << "\n"
              << "Switch occurred: " << (e.switch_occurred ? "yes" : "no") << "\n"
              << "Started:         " << e.started_at << "\n"
              << "Updated:         " << e.updated_at << "\n";

    if (e.rollback_required() && !running) {
        std::cout << "ROLLBACK REQUIRED: traffic may still point at " << e.new_target
                  << "; repoint it at " << e.previous_target << std::endl;
        return 1;
    }
    std::cout << "No rollback required" << std::endl;
    return 0;
}

} // namespace bgd

int main(int argc, char* argv[]) {
    std::vector<std::string> args;
    std::string config_path;
    if (const char* env_config = std::getenv("BGD_CONFIG")) {
        config_path = env_config;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            bgd::print_usage(argv[0]);
            return 0;
        }
        if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "--config requires a file" << std::endl;
                return 1;
            }
            config_path = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(9);
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            bgd::print_usage(argv[0]);
            return 1;
        } else {
            args.push_back(arg);
        }
    }

    bgd::install_signal_handlers(bgd::cancellation);

    try {
        auto config = bgd::DeployConfig::load(config_path);
        if (config.has_error()) {
            std::cerr << "Configuration error: " << config.describe() << std::endl;
            return 1;
        }
        const auto& cfg = config.value();
        bgd::configure_logging(cfg.logging);

        if (!args.empty() && args[0] == "status") {
            if (args.size() != 1) {
                bgd::print_usage(argv[0]);
                return 1;
            }
            return bgd::run_status(cfg);
        }

        if (!args.empty() && args[0] == "cleanup") {
            if (args.size() != 2) {
                bgd::print_usage(argv[0]);
                return 1;
            }
            return bgd::run_cleanup(cfg, args[1]);
        }

        if (!args.empty() && args[0] == "auto") {
            if (args.size() > 2) {
                bgd::print_usage(argv[0]);
                return 1;
            }
            return bgd::run_deployment(cfg, "", "", args.size() == 2 ? args[1] : "latest", true);
        }

        if (args.size() > 3) {
            bgd::print_usage(argv[0]);
            return 1;
        }
        std::string active = args.size() > 0 ? args[0] : cfg.platform.environments.at(0);
        std::string inactive = args.size() > 1 ? args[1] : cfg.platform.environments.at(1);
        std::string tag = args.size() > 2 ? args[2] : "latest";
        return bgd::run_deployment(cfg, active, inactive, tag, false);

    } catch (const std::exception& e) {
        LOG_FATAL("Fatal error: " + std::string(e.what()));
        return 1;
    }
}
