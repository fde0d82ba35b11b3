#include "bgd/config.hpp"
#include "bgd/logger.hpp"
#include "bgd/security_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <type_traits>

namespace bgd {

namespace {

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r");
    if (begin == std::string::npos) return "";
    auto end = text.find_last_not_of(" \t\r");
    return text.substr(begin, end - begin + 1);
}

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

const std::pair<const char*, const char*> kDefaults[] = {
    {"platform.environments", "blue,green"},
    {"platform.required_tools", "kubectl,helm"},
    {"platform.namespace_template", "bgd-{env}"},
    {"platform.release_template", "bgd-{env}"},
    {"platform.service_template", "bgd-{env}"},
    {"platform.chart_path", "./deploy/helm/app"},
    {"platform.values_file", ""},
    {"platform.public_host", "api.example.com"},
    {"platform.command_timeout_seconds", "60"},
    {"platform.ping_command", "kubectl cluster-info"},
    {"platform.deploy_command",
     "helm upgrade --install {release} {chart} --namespace {namespace} --create-namespace "
     "--values={values} --set image.tag={tag} --set environment={env} --wait --timeout={timeout}s"},
    {"platform.ready_command",
     "kubectl wait --for=condition=ready pod -l app.kubernetes.io/name=bgd-app "
     "-n {namespace} --timeout={timeout}s"},
    {"platform.target_command",
     "kubectl get ingress bgd-traffic-switch "
     "-o jsonpath={.spec.rules[0].http.paths[0].backend.service.name}"},
    {"platform.switch_command",
     "kubectl patch ingress bgd-traffic-switch --type=merge "
     "-p={\"spec\":{\"rules\":[{\"host\":\"{host}\",\"http\":{\"paths\":[{\"path\":\"/\","
     "\"pathType\":\"Prefix\",\"backend\":{\"service\":{\"name\":\"{service}\","
     "\"port\":{\"number\":8000}}}}]}}]}}"},
    {"platform.decommission_command", "helm uninstall {release} -n {namespace}"},
    {"platform.delete_namespace_command", "kubectl delete namespace {namespace}"},

    {"endpoints.internal_template", "http://bgd-backend.{namespace}.svc.cluster.local:8000"},
    {"endpoints.public_url", "https://api.example.com"},
    {"endpoints.health_path", "/health"},
    {"endpoints.metrics_path", "/metrics"},
    {"endpoints.tls_verify", "true"},

    {"timeouts.deploy_seconds", "600"},
    {"timeouts.ready_seconds", "600"},
    {"timeouts.warmup_grace_seconds", "30"},
    {"timeouts.propagation_delay_seconds", "30"},

    {"health.max_attempts", "30"},
    {"health.interval_seconds", "10"},
    {"health.attempt_timeout_seconds", "5"},
    {"health.backoff_multiplier", "1.0"},
    {"health.max_interval_seconds", "0"},

    {"switch_validation.max_attempts", "10"},
    {"switch_validation.interval_seconds", "5"},
    {"switch_validation.attempt_timeout_seconds", "5"},
    {"switch_validation.backoff_multiplier", "1.0"},
    {"switch_validation.max_interval_seconds", "0"},

    {"smoke.timeout_seconds", "300"},
    {"smoke.harness", ""},
    {"smoke.check_health", "true"},
    {"smoke.check_metrics", "true"},

    {"state.lock_dir", "/tmp"},
    {"state.journal_dir", "/tmp"},
    {"state.teardown_failed_candidate", "true"},

    {"report.enabled", "true"},
    {"report.dir", "/tmp"},
    {"report.signing_key_env", "BGD_REPORT_SIGNING_KEY"},

    {"logging.level", "INFO"},
    {"logging.rate_limit_ms", "0"},
    {"logging.enable_structured", "false"},
    {"logging.file", ""},
    {"logging.dir", "/tmp"},
};

} // namespace

std::string substitute(const std::string& text, const std::map<std::string, std::string>& vars) {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        auto open = text.find('{', pos);
        if (open == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        auto close = text.find('}', open + 1);
        if (close == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }

        auto it = vars.find(text.substr(open + 1, close - open - 1));
        if (it == vars.end()) {
            // not a placeholder, keep the brace and move on
            out.append(text, pos, open - pos + 1);
            pos = open + 1;
            continue;
        }

        out.append(text, pos, open - pos);
        out += it->second;
        pos = close + 1;
    }

    return out;
}

Result<void> ConfigStore::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return Result<void>(ErrorCode::CONFIG_FILE_NOT_FOUND, SecurityUtils::sanitize_log_input(path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_string(buffer.str());
}

Result<void> ConfigStore::load_string(const std::string& content) {
    std::istringstream iss(content);
    std::string line;
    int line_number = 0;

    while (std::getline(iss, line)) {
        ++line_number;
        line = trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }

        size_t pos = line.find('=');
        if (pos == std::string::npos) {
            return Result<void>(ErrorCode::CONFIG_PARSE_ERROR,
                                "line " + std::to_string(line_number) + ": expected key=value");
        }

        std::string key = trim(line.substr(0, pos));
        if (key.empty()) {
            return Result<void>(ErrorCode::CONFIG_PARSE_ERROR,
                                "line " + std::to_string(line_number) + ": empty key");
        }
        values_[key] = trim(line.substr(pos + 1));
    }

    return Result<void>();
}

std::string ConfigStore::environment_key(const std::string& key) {
    std::string env_key = "BGD_" + key;
    std::transform(env_key.begin(), env_key.end(), env_key.begin(), [](unsigned char c) {
        return c == '.' ? '_' : static_cast<char>(std::toupper(c));
    });
    return env_key;
}

void ConfigStore::apply_environment_overrides() {
    for (auto& [key, value] : values_) {
        const char* env_value = std::getenv(environment_key(key).c_str());
        if (env_value) {
            value = env_value;
            LOG_DEBUG("Override from environment: " + key);
        }
    }
}

void ConfigStore::apply_legacy_environment() {
    if (const char* timeout = std::getenv("TIMEOUT")) {
        values_["timeouts.deploy_seconds"] = timeout;
        values_["timeouts.ready_seconds"] = timeout;
    }
    if (const char* retries = std::getenv("HEALTH_CHECK_RETRIES")) {
        values_["health.max_attempts"] = retries;
    }
    if (const char* smoke_timeout = std::getenv("SMOKE_TEST_TIMEOUT")) {
        values_["smoke.timeout_seconds"] = smoke_timeout;
    }
}

template<typename T>
Result<T> ConfigStore::get_value(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return Result<T>(ErrorCode::CONFIG_KEY_NOT_FOUND, key);
    }

    const std::string& raw = it->second;
    try {
        size_t consumed = 0;
        if constexpr (std::is_same_v<T, std::string>) {
            return raw;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            int64_t value = std::stoll(raw, &consumed);
            if (consumed == raw.size()) return value;
        } else if constexpr (std::is_same_v<T, double>) {
            double value = std::stod(raw, &consumed);
            if (consumed == raw.size()) return value;
        } else if constexpr (std::is_same_v<T, bool>) {
            if (raw == "true" || raw == "1" || raw == "yes") return true;
            if (raw == "false" || raw == "0" || raw == "no") return false;
        }
    } catch (const std::exception&) {
        // fall through to the parse error below
    }

    return Result<T>(ErrorCode::CONFIG_PARSE_ERROR, key + "=" + raw);
}

void ConfigStore::set_value(const std::string& key, const std::string& value) {
    values_[key] = value;
}

bool ConfigStore::has_key(const std::string& key) const {
    return values_.find(key) != values_.end();
}

ConfigStore DeployConfig::default_store() {
    ConfigStore store;
    for (const auto& [key, value] : kDefaults) {
        store.set_value(key, value);
    }
    return store;
}

Result<DeployConfig> DeployConfig::from_store(const ConfigStore& store) {
    DeployConfig config;
    Result<void> failure;

    auto text = [&](const std::string& key, std::string& out) {
        auto value = store.get_value<std::string>(key);
        if (value.has_error()) { if (failure.has_value()) failure = Result<void>(value.error(), value.detail()); return; }
        out = value.value();
    };
    auto flag = [&](const std::string& key, bool& out) {
        auto value = store.get_value<bool>(key);
        if (value.has_error()) { if (failure.has_value()) failure = Result<void>(value.error(), value.detail()); return; }
        out = value.value();
    };
    auto number = [&](const std::string& key) -> int64_t {
        auto value = store.get_value<int64_t>(key);
        if (value.has_error()) { if (failure.has_value()) failure = Result<void>(value.error(), value.detail()); return 0; }
        return value.value();
    };
    auto real = [&](const std::string& key) -> double {
        auto value = store.get_value<double>(key);
        if (value.has_error()) { if (failure.has_value()) failure = Result<void>(value.error(), value.detail()); return 0.0; }
        return value.value();
    };
    auto policy = [&](const std::string& section, RetryPolicy& out) {
        int64_t attempts = number(section + ".max_attempts");
        out.max_attempts = attempts > 0 ? static_cast<uint32_t>(attempts) : 0;
        out.interval = seconds_to_ms(real(section + ".interval_seconds"));
        out.per_attempt_timeout = seconds_to_ms(real(section + ".attempt_timeout_seconds"));
        out.backoff_multiplier = real(section + ".backoff_multiplier");
        out.max_interval = seconds_to_ms(real(section + ".max_interval_seconds"));
    };

    std::string list;
    text("platform.environments", list);
    config.platform.environments = split_list(list);
    text("platform.required_tools", list);
    config.platform.required_tools = split_list(list);
    text("platform.namespace_template", config.platform.namespace_template);
    text("platform.release_template", config.platform.release_template);
    text("platform.service_template", config.platform.service_template);
    text("platform.chart_path", config.platform.chart_path);
    text("platform.values_file", config.platform.values_file);
    text("platform.public_host", config.platform.public_host);
    config.platform.command_timeout = std::chrono::seconds(number("platform.command_timeout_seconds"));
    text("platform.ping_command", config.platform.ping_command);
    text("platform.deploy_command", config.platform.deploy_command);
    text("platform.ready_command", config.platform.ready_command);
    text("platform.target_command", config.platform.target_command);
    text("platform.switch_command", config.platform.switch_command);
    text("platform.decommission_command", config.platform.decommission_command);
    text("platform.delete_namespace_command", config.platform.delete_namespace_command);

    text("endpoints.internal_template", config.endpoints.internal_template);
    text("endpoints.public_url", config.endpoints.public_url);
    text("endpoints.health_path", config.endpoints.health_path);
    text("endpoints.metrics_path", config.endpoints.metrics_path);
    flag("endpoints.tls_verify", config.endpoints.tls_verify);

    config.timeouts.deploy = std::chrono::seconds(number("timeouts.deploy_seconds"));
    config.timeouts.ready = std::chrono::seconds(number("timeouts.ready_seconds"));
    config.timeouts.warmup_grace = std::chrono::seconds(number("timeouts.warmup_grace_seconds"));
    config.timeouts.propagation_delay = std::chrono::seconds(number("timeouts.propagation_delay_seconds"));

    policy("health", config.health);
    policy("switch_validation", config.switch_validation);

    config.smoke.timeout = std::chrono::seconds(number("smoke.timeout_seconds"));
    text("smoke.harness", config.smoke.harness);
    flag("smoke.check_health", config.smoke.check_health);
    flag("smoke.check_metrics", config.smoke.check_metrics);

    text("state.lock_dir", config.state.lock_dir);
    text("state.journal_dir", config.state.journal_dir);
    flag("state.teardown_failed_candidate", config.state.teardown_failed_candidate);

    flag("report.enabled", config.report.enabled);
    text("report.dir", config.report.dir);
    text("report.signing_key_env", config.report.signing_key_env);

    text("logging.level", config.logging.level);
    config.logging.rate_limit_ms = static_cast<uint32_t>(std::max<int64_t>(0, number("logging.rate_limit_ms")));
    flag("logging.enable_structured", config.logging.enable_structured);
    text("logging.file", config.logging.file);
    text("logging.dir", config.logging.dir);

    if (failure.has_error()) {
        return Result<DeployConfig>(failure.error(), failure.detail());
    }
    return config;
}

Result<DeployConfig> DeployConfig::load(const std::string& path) {
    auto store = default_store();

    if (!path.empty()) {
        auto file_result = store.load_file(path);
        if (file_result.has_error()) {
            return Result<DeployConfig>(file_result.error(), file_result.detail());
        }
    }

    store.apply_environment_overrides();
    store.apply_legacy_environment();

    auto config = from_store(store);
    if (config.has_error()) return config;

    auto validation = config.value().validate();
    if (validation.has_error()) {
        return Result<DeployConfig>(validation.error(), validation.detail());
    }

    return config;
}

Result<void> DeployConfig::validate() const {
    auto invalid = [](const std::string& why) {
        return Result<void>(ErrorCode::CONFIG_VALIDATION_FAILED, why);
    };

    if (platform.environments.size() != 2) {
        return invalid("platform.environments must name exactly two environments");
    }
    if (platform.environments[0] == platform.environments[1]) {
        return invalid("platform.environments must be distinct");
    }
    for (const auto& name : platform.environments) {
        if (!SecurityUtils::is_valid_environment_name(name)) {
            return invalid("invalid environment name: " + name);
        }
    }

    if (!SecurityUtils::is_valid_hostname(platform.public_host)) {
        return invalid("invalid platform.public_host: " + platform.public_host);
    }

    const std::pair<const char*, const std::string*> commands[] = {
        {"platform.ping_command", &platform.ping_command},
        {"platform.deploy_command", &platform.deploy_command},
        {"platform.ready_command", &platform.ready_command},
        {"platform.target_command", &platform.target_command},
        {"platform.switch_command", &platform.switch_command},
        {"platform.decommission_command", &platform.decommission_command},
    };
    for (const auto& [key, command] : commands) {
        if (command->empty()) {
            return invalid(std::string(key) + " must not be empty");
        }
    }
    if (platform.command_timeout.count() <= 0) {
        return invalid("platform.command_timeout_seconds must be positive");
    }

    if (endpoints.internal_template.empty() || endpoints.public_url.empty()) {
        return invalid("endpoints must not be empty");
    }

    if (timeouts.deploy.count() <= 0 || timeouts.ready.count() <= 0) {
        return invalid("deploy and ready timeouts must be positive");
    }
    if (timeouts.warmup_grace.count() < 0 || timeouts.propagation_delay.count() < 0) {
        return invalid("grace periods must not be negative");
    }

    auto health_check = health.validate();
    if (health_check.has_error()) return invalid("health: " + health_check.detail());
    auto switch_check = switch_validation.validate();
    if (switch_check.has_error()) return invalid("switch_validation: " + switch_check.detail());

    if (smoke.timeout.count() <= 0) {
        return invalid("smoke.timeout_seconds must be positive");
    }
    if (!smoke.check_health && !smoke.check_metrics && smoke.harness.empty()) {
        return invalid("smoke tests would run no checks");
    }

    if (state.lock_dir.empty() || state.journal_dir.empty()) {
        return invalid("state directories must not be empty");
    }

    LogLevel level;
    if (!parse_log_level(logging.level, level)) {
        return invalid("unknown logging.level: " + logging.level);
    }

    return Result<void>();
}

EnvironmentId DeployConfig::environment(const std::string& name) const {
    std::map<std::string, std::string> vars{{"env", name}};
    vars["namespace"] = substitute(platform.namespace_template, vars);

    EnvironmentId env;
    env.name = name;
    env.internal_endpoint = substitute(endpoints.internal_template, vars);
    env.public_endpoint = endpoints.public_url;
    return env;
}

std::string DeployConfig::counterpart(const std::string& name) const {
    if (platform.environments.size() != 2) return "";
    if (platform.environments[0] == name) return platform.environments[1];
    if (platform.environments[1] == name) return platform.environments[0];
    return "";
}

// Explicit template instantiations
template Result<std::string> ConfigStore::get_value<std::string>(const std::string&) const;
template Result<int64_t> ConfigStore::get_value<int64_t>(const std::string&) const;
template Result<double> ConfigStore::get_value<double>(const std::string&) const;
template Result<bool> ConfigStore::get_value<bool>(const std::string&) const;

} // namespace bgd
