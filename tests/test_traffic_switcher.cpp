#include <gtest/gtest.h>
#include "bgd/logger.hpp"
#include "bgd/traffic_switcher.hpp"
#include "test_doubles.hpp"

using namespace bgd;
using namespace std::chrono_literals;

class TrafficSwitcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().enable_console(false);
        auto config = test::make_test_config(dir.path());
        green = config.environment("green");

        DeploymentRequest request;
        request.deployment_id = "20261019-101500-0a1b2c3d";
        request.image_tag = "v2.0.0";
        request.active = config.environment("blue");
        request.inactive = green;
        run = std::make_unique<RunState>(request);
        run->set_persist_hook([this](const RunState& state) {
            persisted_flags.push_back(state.switch_occurred());
            return Result<void>();
        });
    }

    void TearDown() override {
        Logger::instance().enable_console(true);
    }

    test::TempDir dir;
    test::FakePlatform platform{"blue"};
    test::FakeClock clock;
    test::ScriptedHttpClient http;
    HealthProber prober{http, clock};
    TrafficSwitcher switcher{platform, prober};

    EnvironmentId green;
    std::unique_ptr<RunState> run;
    std::vector<bool> persisted_flags;
};

TEST_F(TrafficSwitcherTest, SwitchRepointsOnceAndConfirms) {
    auto result = switcher.switch_traffic(green, *run);
    ASSERT_TRUE(result.has_value()) << result.describe();

    EXPECT_EQ(platform.set_target_calls, (std::vector<std::string>{"green"}));
    EXPECT_EQ(platform.target, "green");
    EXPECT_EQ(platform.target_queries, 1);
    EXPECT_TRUE(run->switch_occurred());
    EXPECT_EQ(persisted_flags, (std::vector<bool>{true}));
}

TEST_F(TrafficSwitcherTest, RejectedSwitchStillMarksFlag) {
    platform.reject_targets.insert("green");

    auto result = switcher.switch_traffic(green, *run);
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(to_error_code(result.error()), ErrorCode::TRAFFIC_SWITCH_FAILED);
    EXPECT_EQ(platform.set_target_calls.size(), 1u);
    EXPECT_TRUE(run->switch_occurred());
    EXPECT_EQ(platform.target, "blue");
}

TEST_F(TrafficSwitcherTest, UnconfirmedSwitchFails) {
    platform.fail_target_query = true;

    auto result = switcher.switch_traffic(green, *run);
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(to_error_code(result.error()), ErrorCode::TRAFFIC_SWITCH_FAILED);
    EXPECT_NE(result.detail().find("not confirmed"), std::string::npos);
    EXPECT_TRUE(run->switch_occurred());
}

TEST_F(TrafficSwitcherTest, FlagPersistFailureDoesNotUndoSwitch) {
    run->set_persist_hook([](const RunState&) {
        return Result<void>(ErrorCode::JOURNAL_WRITE_FAILED, "disk full");
    });

    auto result = switcher.switch_traffic(green, *run);
    EXPECT_TRUE(result.has_value());
    EXPECT_TRUE(run->switch_occurred());
}

TEST_F(TrafficSwitcherTest, ValidationProbesPublicEndpoint) {
    http.set_handler([](const std::string&, int previous) {
        return Result<int>(previous < 2 ? 502 : 200);
    });
    RetryPolicy policy{10, 5s, 5s};
    std::vector<ProbeResult> history;

    auto result = switcher.validate_switch(green, "/health", policy, &history);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.attempt, 3u);
    EXPECT_EQ(history.size(), 3u);
    ASSERT_FALSE(http.calls.empty());
    EXPECT_EQ(http.calls.front(), "https://public.example.com/health");
    EXPECT_EQ(clock.total_slept(), 10s);
}

TEST_F(TrafficSwitcherTest, ValidationExhaustsPolicy) {
    http.set_handler([](const std::string&, int) { return Result<int>(503); });
    RetryPolicy policy{10, 5s, 5s};

    auto result = switcher.validate_switch(green, "/health", policy);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(http.calls.size(), 10u);
    EXPECT_EQ(clock.total_slept(), 45s);
}
