#include <gtest/gtest.h>
#include "bgd/error_handling.hpp"
#include "bgd/types.hpp"

using namespace bgd;

class ErrorHandlingTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(ErrorHandlingTest, ErrorCodeConversion) {
    auto ec = make_error_code(ErrorCode::HEALTH_CHECK_EXHAUSTED);
    EXPECT_EQ(ec.value(), static_cast<int>(ErrorCode::HEALTH_CHECK_EXHAUSTED));
    EXPECT_EQ(ec.category().name(), std::string("bgd"));
    EXPECT_FALSE(ec.message().empty());
    EXPECT_EQ(to_error_code(ec), ErrorCode::HEALTH_CHECK_EXHAUSTED);
}

TEST_F(ErrorHandlingTest, ImplicitErrorCodeFromEnum) {
    std::error_code ec = ErrorCode::ROLLBACK_FAILED;
    EXPECT_EQ(ec, make_error_code(ErrorCode::ROLLBACK_FAILED));
}

TEST_F(ErrorHandlingTest, ResultMonadSuccess) {
    Result<int> success_result(42);

    EXPECT_TRUE(success_result.has_value());
    EXPECT_FALSE(success_result.has_error());
    EXPECT_EQ(success_result.value(), 42);
    EXPECT_EQ(success_result.describe(), "ok");

    auto mapped = success_result.map([](int x) { return x * 2; });
    EXPECT_TRUE(mapped.has_value());
    EXPECT_EQ(mapped.value(), 84);
}

TEST_F(ErrorHandlingTest, ResultMonadErrorKeepsDetail) {
    Result<int> error_result(ErrorCode::NETWORK_TIMEOUT, "connect to api");

    EXPECT_TRUE(error_result.has_error());
    EXPECT_EQ(error_result.detail(), "connect to api");
    EXPECT_NE(error_result.describe().find("connect to api"), std::string::npos);
    EXPECT_THROW(error_result.value(), std::runtime_error);

    auto mapped = error_result.map([](int x) { return x * 2; });
    EXPECT_TRUE(mapped.has_error());
    EXPECT_EQ(mapped.error(), error_result.error());
    EXPECT_EQ(mapped.detail(), "connect to api");
}

TEST_F(ErrorHandlingTest, ResultVoidSpecialization) {
    Result<void> success_result;
    EXPECT_TRUE(success_result.has_value());

    Result<void> error_result(ErrorCode::JOURNAL_WRITE_FAILED);
    EXPECT_TRUE(error_result.has_error());
    EXPECT_EQ(error_result.describe(), error_result.error().message());
}

TEST_F(ErrorHandlingTest, ClassificationFollowsReleasePhase) {
    EXPECT_EQ(classify(ErrorCode::SUCCESS), ErrorClass::NONE);
    EXPECT_EQ(classify(ErrorCode::TOOL_NOT_FOUND), ErrorClass::PREREQUISITE);
    EXPECT_EQ(classify(ErrorCode::TARGET_QUERY_FAILED), ErrorClass::PREREQUISITE);
    EXPECT_EQ(classify(ErrorCode::DEPLOY_FAILED), ErrorClass::PRE_SWITCH);
    EXPECT_EQ(classify(ErrorCode::SMOKE_TEST_TIMEOUT), ErrorClass::PRE_SWITCH);
    EXPECT_EQ(classify(ErrorCode::TRAFFIC_SWITCH_FAILED), ErrorClass::TRAFFIC_SWITCH);
    EXPECT_EQ(classify(ErrorCode::POST_SWITCH_VALIDATION_FAILED), ErrorClass::POST_SWITCH);
    EXPECT_EQ(classify(ErrorCode::ROLLBACK_FAILED), ErrorClass::ROLLBACK);
    EXPECT_EQ(classify(ErrorCode::DEPLOYMENT_IN_PROGRESS), ErrorClass::INFRASTRUCTURE);
    EXPECT_EQ(classify(ErrorCode::CONFIG_PARSE_ERROR), ErrorClass::INFRASTRUCTURE);
}

TEST_F(ErrorHandlingTest, TaxonomyNames) {
    EXPECT_STREQ(taxonomy_name(ErrorCode::PLATFORM_UNREACHABLE), "PrerequisiteError");
    EXPECT_STREQ(taxonomy_name(ErrorCode::DEPLOY_FAILED), "DeployError");
    EXPECT_STREQ(taxonomy_name(ErrorCode::READINESS_TIMEOUT), "ReadinessTimeout");
    EXPECT_STREQ(taxonomy_name(ErrorCode::HEALTH_CHECK_EXHAUSTED), "HealthCheckExhausted");
    EXPECT_STREQ(taxonomy_name(ErrorCode::SMOKE_TEST_FAILED), "SmokeTestFailure");
    EXPECT_STREQ(taxonomy_name(ErrorCode::SMOKE_TEST_TIMEOUT), "SmokeTestFailure");
    EXPECT_STREQ(taxonomy_name(ErrorCode::TRAFFIC_SWITCH_FAILED), "TrafficSwitchError");
    EXPECT_STREQ(taxonomy_name(ErrorCode::POST_SWITCH_VALIDATION_FAILED), "PostSwitchValidationFailure");
    EXPECT_STREQ(taxonomy_name(ErrorCode::ROLLBACK_FAILED), "RollbackFailure");
    EXPECT_STREQ(taxonomy_name(ErrorCode::DEPLOYMENT_CANCELLED), "InfrastructureError");
}

TEST_F(ErrorHandlingTest, ForeignCategoryIsNotMistakenForBgdCode) {
    std::error_code foreign = std::make_error_code(std::errc::timed_out);
    EXPECT_NE(to_error_code(foreign), ErrorCode::SUCCESS);
    EXPECT_EQ(to_error_code(std::error_code()), ErrorCode::SUCCESS);
}

class DeploymentStateTest : public ::testing::Test {};

TEST_F(DeploymentStateTest, ForwardOnlyPipeline) {
    EXPECT_TRUE(is_valid_transition(DeploymentState::VALIDATING, DeploymentState::DEPLOYING));
    EXPECT_TRUE(is_valid_transition(DeploymentState::SMOKE_TESTING, DeploymentState::SWITCHING));
    EXPECT_TRUE(is_valid_transition(DeploymentState::VALIDATING_SWITCH, DeploymentState::COMPLETED));

    EXPECT_FALSE(is_valid_transition(DeploymentState::DEPLOYING, DeploymentState::VALIDATING));
    EXPECT_FALSE(is_valid_transition(DeploymentState::DEPLOYING, DeploymentState::HEALTH_CHECKING));
    EXPECT_FALSE(is_valid_transition(DeploymentState::SMOKE_TESTING, DeploymentState::COMPLETED));
}

TEST_F(DeploymentStateTest, RollbackOnlyFromSwitchStages) {
    EXPECT_TRUE(is_valid_transition(DeploymentState::SWITCHING, DeploymentState::ROLLING_BACK));
    EXPECT_TRUE(is_valid_transition(DeploymentState::VALIDATING_SWITCH, DeploymentState::ROLLING_BACK));
    EXPECT_FALSE(is_valid_transition(DeploymentState::SMOKE_TESTING, DeploymentState::ROLLING_BACK));
    EXPECT_FALSE(is_valid_transition(DeploymentState::ROLLING_BACK, DeploymentState::COMPLETED));
    EXPECT_TRUE(is_valid_transition(DeploymentState::ROLLING_BACK, DeploymentState::FAILED));
}

TEST_F(DeploymentStateTest, TerminalStatesAreFinal) {
    EXPECT_FALSE(is_valid_transition(DeploymentState::COMPLETED, DeploymentState::FAILED));
    EXPECT_FALSE(is_valid_transition(DeploymentState::FAILED, DeploymentState::ROLLING_BACK));
    EXPECT_TRUE(is_terminal(DeploymentState::FAILED));
    EXPECT_FALSE(is_terminal(DeploymentState::ROLLING_BACK));
}

TEST_F(DeploymentStateTest, NamesParseBack) {
    for (auto state : {DeploymentState::VALIDATING, DeploymentState::SWITCHING,
                       DeploymentState::ROLLING_BACK, DeploymentState::COMPLETED}) {
        DeploymentState parsed = DeploymentState::FAILED;
        ASSERT_TRUE(parse_deployment_state(to_string(state), parsed));
        EXPECT_EQ(parsed, state);
    }
    DeploymentState ignored;
    EXPECT_FALSE(parse_deployment_state("SWITCHED", ignored));
}
