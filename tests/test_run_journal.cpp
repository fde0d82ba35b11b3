#include <gtest/gtest.h>
#include "bgd/run_journal.hpp"
#include "test_doubles.hpp"
#include <filesystem>
#include <fstream>

using namespace bgd;

class RunJournalTest : public ::testing::Test {
protected:
    JournalEntry sample() const {
        JournalEntry entry;
        entry.deployment_id = "20261019-101500-0a1b2c3d";
        entry.state = DeploymentState::VALIDATING_SWITCH;
        entry.switch_occurred = true;
        entry.previous_target = "blue";
        entry.new_target = "green";
        entry.image_tag = "v2.0.0";
        entry.started_at = "2026-10-19T10:15:00.000Z";
        entry.updated_at = "2026-10-19T10:21:42.118Z";
        entry.pid = 4242;
        return entry;
    }

    test::TempDir dir;
};

TEST_F(RunJournalTest, PathIsSharedByBothDirections) {
    EXPECT_EQ(RunJournal::path_for("/var/lib/bgd", "green", "blue"), "/var/lib/bgd/blue-green.journal");
    RunJournal a(dir.path(), "blue", "green");
    RunJournal b(dir.path(), "green", "blue");
    EXPECT_EQ(a.path(), b.path());
}

TEST_F(RunJournalTest, WriteThenReadBack) {
    RunJournal journal(dir.path(), "blue", "green");
    EXPECT_FALSE(journal.exists());

    ASSERT_TRUE(journal.write(sample()).has_value());
    EXPECT_TRUE(journal.exists());
    EXPECT_FALSE(std::filesystem::exists(journal.path() + ".tmp"));

    auto entry = journal.read();
    ASSERT_TRUE(entry.has_value()) << entry.describe();
    EXPECT_EQ(entry.value().deployment_id, "20261019-101500-0a1b2c3d");
    EXPECT_EQ(entry.value().state, DeploymentState::VALIDATING_SWITCH);
    EXPECT_TRUE(entry.value().switch_occurred);
    EXPECT_EQ(entry.value().previous_target, "blue");
    EXPECT_EQ(entry.value().new_target, "green");
    EXPECT_EQ(entry.value().pid, 4242);
}

TEST_F(RunJournalTest, LaterWriteReplacesEarlier) {
    RunJournal journal(dir.path(), "blue", "green");
    auto entry = sample();
    ASSERT_TRUE(journal.write(entry).has_value());

    entry.state = DeploymentState::COMPLETED;
    ASSERT_TRUE(journal.write(entry).has_value());

    auto read = journal.read();
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(read.value().state, DeploymentState::COMPLETED);
    EXPECT_FALSE(read.value().rollback_required());
}

TEST_F(RunJournalTest, MissingJournal) {
    RunJournal journal(dir.path(), "blue", "green");
    auto entry = journal.read();
    ASSERT_TRUE(entry.has_error());
    EXPECT_EQ(to_error_code(entry.error()), ErrorCode::JOURNAL_READ_FAILED);
    EXPECT_EQ(entry.detail(), "missing");
}

TEST_F(RunJournalTest, WriteIntoMissingDirectoryFails) {
    RunJournal journal(dir.file("gone"), "blue", "green");
    auto result = journal.write(sample());
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(to_error_code(result.error()), ErrorCode::JOURNAL_WRITE_FAILED);
}

TEST_F(RunJournalTest, RollbackRequired) {
    auto entry = sample();
    EXPECT_TRUE(entry.rollback_required());

    entry.state = DeploymentState::FAILED;
    EXPECT_TRUE(entry.rollback_required());

    entry.switch_occurred = false;
    EXPECT_FALSE(entry.rollback_required());
}

TEST_F(RunJournalTest, InterruptedSwitchRequiresRollback) {
    auto entry = sample();
    entry.switch_occurred = false;

    for (auto state : {DeploymentState::SWITCHING, DeploymentState::VALIDATING_SWITCH,
                       DeploymentState::ROLLING_BACK}) {
        entry.state = state;
        EXPECT_TRUE(entry.rollback_required()) << to_string(state);
    }
    for (auto state : {DeploymentState::SMOKE_TESTING, DeploymentState::FAILED,
                       DeploymentState::COMPLETED}) {
        entry.state = state;
        EXPECT_FALSE(entry.rollback_required()) << to_string(state);
    }
}

TEST_F(RunJournalTest, ParseRejectsDamagedContent) {
    EXPECT_TRUE(RunJournal::parse("deployment_id=x\nstate=DEPLOYING\n").has_error());
    EXPECT_TRUE(RunJournal::parse("deployment_id=x\nstate=SWITCHED\nswitch_occurred=false\n").has_error());
    EXPECT_TRUE(RunJournal::parse("deployment_id=x\nstate=DEPLOYING\nswitch_occurred=maybe\n").has_error());
    EXPECT_TRUE(RunJournal::parse("garbage\n").has_error());
    EXPECT_TRUE(RunJournal::parse("deployment_id=x\nstate=DEPLOYING\nswitch_occurred=false\npid=abc\n").has_error());
}

TEST_F(RunJournalTest, ParseIgnoresUnknownKeys) {
    auto entry = RunJournal::parse("deployment_id=x\nstate=SWITCHING\nswitch_occurred=true\nregion=eu-west-1\n");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry.value().state, DeploymentState::SWITCHING);
    EXPECT_TRUE(entry.value().rollback_required());
}
