#include <gtest/gtest.h>
#include "bgd/deployment_lock.hpp"
#include "bgd/logger.hpp"
#include "test_doubles.hpp"
#include <fstream>
#include <sys/wait.h>
#include <unistd.h>

using namespace bgd;

class DeploymentLockTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().enable_console(false);
    }

    void TearDown() override {
        Logger::instance().enable_console(true);
    }

    test::TempDir dir;
};

TEST_F(DeploymentLockTest, PairKeyIsOrderIndependent) {
    EXPECT_EQ(pair_key("blue", "green"), "blue-green");
    EXPECT_EQ(pair_key("green", "blue"), "blue-green");
    EXPECT_EQ(DeploymentLock::path_for("/var/lock", "green", "blue"), "/var/lock/bgd-blue-green.lock");
}

TEST_F(DeploymentLockTest, SecondHolderIsRefused) {
    auto first = DeploymentLock::acquire(dir.path(), "blue", "green");
    ASSERT_TRUE(first.has_value()) << first.describe();

    // Reverse direction of the same pair contends for the same lock.
    auto second = DeploymentLock::acquire(dir.path(), "green", "blue");
    ASSERT_TRUE(second.has_error());
    EXPECT_EQ(to_error_code(second.error()), ErrorCode::DEPLOYMENT_IN_PROGRESS);
}

TEST_F(DeploymentLockTest, ReleasedOnDestruction) {
    {
        auto held = DeploymentLock::acquire(dir.path(), "blue", "green");
        ASSERT_TRUE(held.has_value());
    }
    auto again = DeploymentLock::acquire(dir.path(), "blue", "green");
    EXPECT_TRUE(again.has_value());
}

TEST_F(DeploymentLockTest, DifferentPairsDoNotContend) {
    auto production = DeploymentLock::acquire(dir.path(), "blue", "green");
    auto staging = DeploymentLock::acquire(dir.path(), "stage-a", "stage-b");
    EXPECT_TRUE(production.has_value());
    EXPECT_TRUE(staging.has_value());
}

TEST_F(DeploymentLockTest, RecordsHolderPid) {
    auto held = DeploymentLock::acquire(dir.path(), "blue", "green");
    ASSERT_TRUE(held.has_value());

    std::ifstream file(held.value()->path());
    int pid = 0;
    file >> pid;
    EXPECT_EQ(pid, ::getpid());
}

TEST_F(DeploymentLockTest, OtherProcessIsRefused) {
    auto held = DeploymentLock::acquire(dir.path(), "blue", "green");
    ASSERT_TRUE(held.has_value());

    pid_t child = ::fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        auto contender = DeploymentLock::acquire(dir.path(), "blue", "green");
        bool refused = contender.has_error() &&
                       to_error_code(contender.error()) == ErrorCode::DEPLOYMENT_IN_PROGRESS;
        ::_exit(refused ? 0 : 1);
    }

    int status = 0;
    ASSERT_EQ(::waitpid(child, &status, 0), child);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}

TEST_F(DeploymentLockTest, UnwritableDirectory) {
    auto result = DeploymentLock::acquire(dir.file("missing/sub"), "blue", "green");
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(to_error_code(result.error()), ErrorCode::LOCK_FAILED);
}
