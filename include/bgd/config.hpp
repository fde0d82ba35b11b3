#pragma once

#include "bgd/error_handling.hpp"
#include "bgd/retry_policy.hpp"
#include "bgd/types.hpp"
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace bgd {

// Flat "section.key" -> value store. Sources are applied in order, later
// sources win: defaults, config file, BGD_* environment, legacy environment.
class ConfigStore {
public:
    Result<void> load_file(const std::string& path);
    Result<void> load_string(const std::string& content);

    // BGD_<SECTION>_<KEY> overrides for every key already present
    void apply_environment_overrides();

    // TIMEOUT, HEALTH_CHECK_RETRIES, SMOKE_TEST_TIMEOUT
    void apply_legacy_environment();

    template<typename T>
    Result<T> get_value(const std::string& key) const;

    void set_value(const std::string& key, const std::string& value);
    bool has_key(const std::string& key) const;

    const std::map<std::string, std::string>& values() const { return values_; }

    static std::string environment_key(const std::string& key);

private:
    std::map<std::string, std::string> values_;
};

struct PlatformConfig {
    std::vector<std::string> environments{"blue", "green"};
    std::vector<std::string> required_tools{"kubectl", "helm"};
    std::string namespace_template{"bgd-{env}"};
    std::string release_template{"bgd-{env}"};
    std::string service_template{"bgd-{env}"};
    std::string chart_path{"./deploy/helm/app"};
    std::string values_file;
    std::string public_host{"api.example.com"};
    std::chrono::seconds command_timeout{60};

    std::string ping_command;
    std::string deploy_command;
    std::string ready_command;
    std::string target_command;
    std::string switch_command;
    std::string decommission_command;
    std::string delete_namespace_command;
};

struct EndpointConfig {
    std::string internal_template{"http://bgd-backend.{namespace}.svc.cluster.local:8000"};
    std::string public_url{"https://api.example.com"};
    std::string health_path{"/health"};
    std::string metrics_path{"/metrics"};
    bool tls_verify{true};
};

struct TimeoutConfig {
    std::chrono::seconds deploy{600};
    std::chrono::seconds ready{600};
    std::chrono::seconds warmup_grace{30};
    std::chrono::seconds propagation_delay{30};
};

struct SmokeConfig {
    std::chrono::seconds timeout{300};
    std::string harness;
    bool check_health{true};
    bool check_metrics{true};
};

struct StateConfig {
    std::string lock_dir{"/tmp"};
    std::string journal_dir{"/tmp"};
    bool teardown_failed_candidate{true};
};

struct ReportConfig {
    bool enabled{true};
    std::string dir{"/tmp"};
    std::string signing_key_env{"BGD_REPORT_SIGNING_KEY"};
};

struct LoggingConfig {
    std::string level{"INFO"};
    uint32_t rate_limit_ms{0};
    bool enable_structured{false};
    std::string file;   // empty: <dir>/bgd_deploy_<deployment id>.log
    std::string dir{"/tmp"};
};

struct DeployConfig {
    PlatformConfig platform;
    EndpointConfig endpoints;
    TimeoutConfig timeouts;
    RetryPolicy health{30, std::chrono::seconds(10), std::chrono::seconds(5)};
    RetryPolicy switch_validation{10, std::chrono::seconds(5), std::chrono::seconds(5)};
    SmokeConfig smoke;
    StateConfig state;
    ReportConfig report;
    LoggingConfig logging;

    // Built-in defaults as a store, the base layer for every load.
    static ConfigStore default_store();

    static Result<DeployConfig> from_store(const ConfigStore& store);

    // defaults <- file (optional) <- environment
    static Result<DeployConfig> load(const std::string& path);

    Result<void> validate() const;

    // Resolve the endpoints of a named environment from the templates.
    EnvironmentId environment(const std::string& name) const;

    // The other environment of the configured pair, empty if name is not in it.
    std::string counterpart(const std::string& name) const;
};

// Replace {name} placeholders that appear in vars; unknown braces stay literal.
std::string substitute(const std::string& text, const std::map<std::string, std::string>& vars);

} // namespace bgd
