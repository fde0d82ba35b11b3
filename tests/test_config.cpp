#include <gtest/gtest.h>
#include "bgd/config.hpp"
#include "test_doubles.hpp"
#include <cstdlib>
#include <fstream>

using namespace bgd;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        clear_environment();
    }

    void TearDown() override {
        clear_environment();
    }

    static void clear_environment() {
        for (const char* name : {"TIMEOUT", "HEALTH_CHECK_RETRIES", "SMOKE_TEST_TIMEOUT",
                                 "BGD_HEALTH_MAX_ATTEMPTS", "BGD_SMOKE_TIMEOUT_SECONDS",
                                 "BGD_ENDPOINTS_PUBLIC_URL"}) {
            unsetenv(name);
        }
    }

    std::string write_config(const std::string& content) {
        std::string path = dir.file("bgd.conf");
        std::ofstream file(path);
        file << content;
        return path;
    }

    test::TempDir dir;
};

TEST_F(ConfigTest, DefaultsMatchReleaseProcedure) {
    auto config = DeployConfig::load("");
    ASSERT_TRUE(config.has_value()) << config.describe();

    const auto& c = config.value();
    EXPECT_EQ(c.platform.environments, (std::vector<std::string>{"blue", "green"}));
    EXPECT_EQ(c.timeouts.deploy, std::chrono::seconds(600));
    EXPECT_EQ(c.timeouts.warmup_grace, std::chrono::seconds(30));
    EXPECT_EQ(c.timeouts.propagation_delay, std::chrono::seconds(30));
    EXPECT_EQ(c.health.max_attempts, 30u);
    EXPECT_EQ(c.health.interval, std::chrono::seconds(10));
    EXPECT_EQ(c.switch_validation.max_attempts, 10u);
    EXPECT_EQ(c.switch_validation.interval, std::chrono::seconds(5));
    EXPECT_EQ(c.smoke.timeout, std::chrono::seconds(300));
    EXPECT_FALSE(c.platform.deploy_command.empty());
}

TEST_F(ConfigTest, FileValuesOverrideDefaults) {
    auto path = write_config(
        "# comment\n"
        "\n"
        "health.max_attempts = 5\n"
        "health.interval_seconds=0.5\n"
        "  endpoints.public_url =  https://api.example.org  \n"
        "platform.environments = alpha, beta\n");

    auto config = DeployConfig::load(path);
    ASSERT_TRUE(config.has_value()) << config.describe();
    EXPECT_EQ(config.value().health.max_attempts, 5u);
    EXPECT_EQ(config.value().health.interval, std::chrono::milliseconds(500));
    EXPECT_EQ(config.value().endpoints.public_url, "https://api.example.org");
    EXPECT_EQ(config.value().platform.environments, (std::vector<std::string>{"alpha", "beta"}));
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    auto path = write_config("health.max_attempts = 5\n");
    setenv("BGD_HEALTH_MAX_ATTEMPTS", "7", 1);

    auto config = DeployConfig::load(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config.value().health.max_attempts, 7u);
}

TEST_F(ConfigTest, LegacyVariablesApplyLast) {
    setenv("BGD_HEALTH_MAX_ATTEMPTS", "7", 1);
    setenv("HEALTH_CHECK_RETRIES", "12", 1);
    setenv("TIMEOUT", "120", 1);
    setenv("SMOKE_TEST_TIMEOUT", "45", 1);

    auto config = DeployConfig::load("");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config.value().health.max_attempts, 12u);
    EXPECT_EQ(config.value().timeouts.deploy, std::chrono::seconds(120));
    EXPECT_EQ(config.value().timeouts.ready, std::chrono::seconds(120));
    EXPECT_EQ(config.value().smoke.timeout, std::chrono::seconds(45));
}

TEST_F(ConfigTest, EnvironmentKeyNaming) {
    EXPECT_EQ(ConfigStore::environment_key("health.max_attempts"), "BGD_HEALTH_MAX_ATTEMPTS");
    EXPECT_EQ(ConfigStore::environment_key("smoke.timeout_seconds"), "BGD_SMOKE_TIMEOUT_SECONDS");
}

TEST_F(ConfigTest, MissingFileIsAnError) {
    auto config = DeployConfig::load(dir.file("absent.conf"));
    ASSERT_TRUE(config.has_error());
    EXPECT_EQ(to_error_code(config.error()), ErrorCode::CONFIG_FILE_NOT_FOUND);
}

TEST_F(ConfigTest, LineWithoutEqualsIsRejected) {
    ConfigStore store;
    auto result = store.load_string("health.max_attempts 5\n");
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(to_error_code(result.error()), ErrorCode::CONFIG_PARSE_ERROR);
    EXPECT_NE(result.detail().find("line 1"), std::string::npos);
}

TEST_F(ConfigTest, UnparsableNumberIsRejected) {
    auto path = write_config("health.max_attempts = thirty\n");
    auto config = DeployConfig::load(path);
    ASSERT_TRUE(config.has_error());
    EXPECT_EQ(to_error_code(config.error()), ErrorCode::CONFIG_PARSE_ERROR);

    setenv("TIMEOUT", "600s", 1);
    auto legacy = DeployConfig::load("");
    ASSERT_TRUE(legacy.has_error());
}

TEST_F(ConfigTest, ZeroAttemptsFailValidation) {
    setenv("HEALTH_CHECK_RETRIES", "0", 1);
    auto config = DeployConfig::load("");
    ASSERT_TRUE(config.has_error());
    EXPECT_EQ(to_error_code(config.error()), ErrorCode::CONFIG_VALIDATION_FAILED);
}

TEST_F(ConfigTest, EmptyCommandFailsValidation) {
    auto path = write_config("platform.switch_command =\n");
    auto config = DeployConfig::load(path);
    ASSERT_TRUE(config.has_error());
    EXPECT_EQ(to_error_code(config.error()), ErrorCode::CONFIG_VALIDATION_FAILED);
}

TEST_F(ConfigTest, EnvironmentPairMustBeTwoDistinctNames) {
    auto config = DeployConfig::from_store(DeployConfig::default_store()).value();
    config.platform.environments = {"blue", "blue"};
    EXPECT_TRUE(config.validate().has_error());
    config.platform.environments = {"blue"};
    EXPECT_TRUE(config.validate().has_error());
    config.platform.environments = {"blue", "Green"};
    EXPECT_TRUE(config.validate().has_error());
}

TEST_F(ConfigTest, SmokeTestsNeedAtLeastOneCheck) {
    auto config = DeployConfig::from_store(DeployConfig::default_store()).value();
    config.smoke.check_health = false;
    config.smoke.check_metrics = false;
    config.smoke.harness.clear();
    auto result = config.validate();
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(to_error_code(result.error()), ErrorCode::CONFIG_VALIDATION_FAILED);

    config.smoke.harness = "./scripts/smoke_db_check.sh";
    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(ConfigTest, PublicHostMustBeAHostname) {
    auto config = DeployConfig::from_store(DeployConfig::default_store()).value();
    EXPECT_TRUE(config.validate().has_value());
    config.platform.public_host = "api.example.com\"}]}";
    EXPECT_TRUE(config.validate().has_error());
}

TEST_F(ConfigTest, TypedLookup) {
    ConfigStore store;
    ASSERT_TRUE(store.load_string("a = 42\nb = 2.5\nc = yes\nd = text\n").has_value());

    EXPECT_EQ(store.get_value<int64_t>("a").value(), 42);
    EXPECT_DOUBLE_EQ(store.get_value<double>("b").value(), 2.5);
    EXPECT_TRUE(store.get_value<bool>("c").value());
    EXPECT_EQ(store.get_value<std::string>("d").value(), "text");
    EXPECT_TRUE(store.get_value<int64_t>("d").has_error());
    EXPECT_TRUE(store.get_value<bool>("d").has_error());

    auto missing = store.get_value<std::string>("zzz");
    ASSERT_TRUE(missing.has_error());
    EXPECT_EQ(to_error_code(missing.error()), ErrorCode::CONFIG_KEY_NOT_FOUND);
}

TEST_F(ConfigTest, EnvironmentResolution) {
    auto config = DeployConfig::from_store(DeployConfig::default_store()).value();
    auto green = config.environment("green");

    EXPECT_EQ(green.name, "green");
    EXPECT_EQ(green.internal_endpoint, "http://bgd-backend.bgd-green.svc.cluster.local:8000");
    EXPECT_EQ(green.public_endpoint, config.endpoints.public_url);

    EXPECT_EQ(config.counterpart("blue"), "green");
    EXPECT_EQ(config.counterpart("green"), "blue");
    EXPECT_EQ(config.counterpart("red"), "");
}

TEST_F(ConfigTest, SubstituteLeavesUnknownBracesAlone) {
    std::map<std::string, std::string> vars{{"env", "blue"}, {"service", "svc-blue"}};
    EXPECT_EQ(substitute("ns-{env}", vars), "ns-blue");
    EXPECT_EQ(substitute("{\"name\":\"{service}\"}", vars), "{\"name\":\"svc-blue\"}");
    EXPECT_EQ(substitute("{.spec.rules[0]}", vars), "{.spec.rules[0]}");
    EXPECT_EQ(substitute("{unterminated", vars), "{unterminated");
}
