#include <gtest/gtest.h>
#include "test_network.hpp"

class BackupSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        alfa_ = std::make_unique<TestPeer>(network_, "ALFA");
        base_ = std::make_unique<TestPeer>(network_, "BASE1", std::vector<PeerInfo>{PeerInfo{"ALFA", true}});

        ProviderSettings settings;
        settings.autoAcceptFromContacts = true;
        ASSERT_TRUE(base_->node->relationships().enableProvider(settings));
        ASSERT_TRUE(alfa_->node->relationships().sendInvite("BASE1", 3).has_value());
        alfa_->writeData("a.txt", "scheduled");
    }

    void TearDown() override {
        base_.reset();
        alfa_.reset();
    }

    RelationshipStore& store() { return alfa_->node->relationshipStore(); }
    BackupScheduler& scheduler() { return alfa_->node->scheduler(); }

    TestNetwork network_;
    std::unique_ptr<TestPeer> alfa_;
    std::unique_ptr<TestPeer> base_;
};

TEST_F(BackupSchedulerTest, NeverBackedUpProviderIsDue) {
    auto due = scheduler().dueProviders(utils::nowSeconds());
    ASSERT_EQ(due.size(), 1u);
    EXPECT_EQ(due[0], "BASE1");
}

TEST_F(BackupSchedulerTest, DueOnlyAfterNextScheduledBackup) {
    int64_t now = utils::nowSeconds();
    ASSERT_TRUE(store().updateProvider("BASE1", [now](ProviderRelationship& p) {
        p.nextScheduledBackup = now + 3600;
    }));
    EXPECT_TRUE(scheduler().dueProviders(now).empty());
    EXPECT_EQ(scheduler().dueProviders(now + 3600).size(), 1u);
}

TEST_F(BackupSchedulerTest, InactiveProvidersAreNeverDue) {
    ProviderRelationship pending;
    pending.providerCallsign = "BASE2";
    ASSERT_TRUE(store().saveProvider(pending));
    ASSERT_TRUE(alfa_->node->relationships().removeProvider("BASE1"));

    EXPECT_TRUE(scheduler().dueProviders(utils::nowSeconds()).empty());
    EXPECT_EQ(scheduler().runDueBackups(), "");
}

TEST_F(BackupSchedulerTest, RunDueBackupsSchedulesNextRun) {
    EXPECT_EQ(scheduler().runDueBackups(), "BASE1");
    ASSERT_TRUE(alfa_->node->backupExecutor().waitForCompletion(std::chrono::seconds(10)));
    EXPECT_EQ(alfa_->node->backupExecutor().getStatus().state, TransferState::Complete);

    auto provider = store().getProvider("BASE1");
    ASSERT_TRUE(provider->nextScheduledBackup.has_value());
    EXPECT_TRUE(scheduler().dueProviders(utils::nowSeconds()).empty());
    EXPECT_EQ(scheduler().runDueBackups(), "");
}

TEST_F(BackupSchedulerTest, NoBackupWhileRestoring) {
    network_.holdRequests();
    RestoreExecutor& restore = alfa_->node->restoreExecutor();
    ASSERT_EQ(restore.startRestore("BASE1", "2026-03-01").errorCode, BackupErrorCode::None);
    ASSERT_TRUE(network_.waitForBlockedRequest(std::chrono::seconds(5)));

    EXPECT_EQ(scheduler().dueProviders(utils::nowSeconds()).size(), 1u);
    EXPECT_EQ(scheduler().runDueBackups(), "");
    EXPECT_FALSE(alfa_->node->backupExecutor().isRunning());

    network_.release();
    ASSERT_TRUE(restore.waitForCompletion(std::chrono::seconds(10)));
    EXPECT_EQ(scheduler().runDueBackups(), "BASE1");
    ASSERT_TRUE(alfa_->node->backupExecutor().waitForCompletion(std::chrono::seconds(10)));
}

TEST_F(BackupSchedulerTest, BackgroundLoopStartsAndStops) {
    scheduler().start();
    EXPECT_TRUE(scheduler().isRunning());
    EXPECT_TRUE(waitUntil([this] {
        return alfa_->node->backupExecutor().getStatus().state == TransferState::Complete;
    }, std::chrono::seconds(10)));
    scheduler().stop();
    EXPECT_FALSE(scheduler().isRunning());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
