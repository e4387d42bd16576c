#include <gtest/gtest.h>
#include "test_network.hpp"
#include "protocol/control_message.hpp"

using json = nlohmann::json;

class DiscoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        identity_ = std::make_shared<OpenSslIdentity>(OpenSslIdentity::generate());
        std::vector<PeerInfo> contacts{PeerInfo{"ALFA", true}};
        base1_ = std::make_unique<TestPeer>(network_, "BASE1", contacts);
        base2_ = std::make_unique<TestPeer>(network_, "BASE2", contacts);
        base3_ = std::make_unique<TestPeer>(network_, "BASE3", contacts);

        // The lost device: backs up to BASE1, then disappears
        auto original = std::make_unique<TestPeer>(network_, "ALFA", std::vector<PeerInfo>{}, identity_);
        ProviderSettings settings;
        settings.autoAcceptFromContacts = true;
        ASSERT_TRUE(base1_->node->relationships().enableProvider(settings));
        ASSERT_TRUE(base2_->node->relationships().enableProvider(settings));
        ASSERT_TRUE(original->node->relationships().sendInvite("BASE1").has_value());

        original->writeData("a.txt", "first file");
        original->writeData("docs/b.txt", "second file");
        BackupExecutor& executor = original->node->backupExecutor();
        ASSERT_EQ(executor.startBackup("BASE1").errorCode, BackupErrorCode::None);
        ASSERT_TRUE(executor.waitForCompletion(std::chrono::seconds(10)));
        ASSERT_EQ(executor.getStatus().state, TransferState::Complete);
        snapshotId_ = executor.getStatus().snapshotId;
        original.reset();

        // Same identity on a fresh device that only knows who is online
        std::vector<PeerInfo> online{PeerInfo{"BASE1", true}, PeerInfo{"BASE2", true},
                                     PeerInfo{"BASE3", true}, PeerInfo{"BASE4", false}};
        alfa_ = std::make_unique<TestPeer>(network_, "ALFA", online, identity_);
    }

    void TearDown() override {
        alfa_.reset();
        base3_.reset();
        base2_.reset();
        base1_.reset();
    }

    DiscoveryStatus runDiscovery() {
        std::string id = alfa_->node->discovery().startDiscovery(1);
        EXPECT_TRUE(alfa_->node->discovery().waitForDiscovery(id, std::chrono::seconds(10)));
        auto status = alfa_->node->discovery().getDiscoveryStatus(id);
        EXPECT_TRUE(status.has_value());
        return status.value_or(DiscoveryStatus{});
    }

    TestNetwork network_;
    std::shared_ptr<OpenSslIdentity> identity_;
    std::unique_ptr<TestPeer> base1_;
    std::unique_ptr<TestPeer> base2_;
    std::unique_ptr<TestPeer> base3_;
    std::unique_ptr<TestPeer> alfa_;
    std::string snapshotId_;
};

TEST_F(DiscoveryTest, FindsTheOneProviderAmongThreePeers) {
    DiscoveryStatus status = runDiscovery();

    EXPECT_EQ(status.state, DiscoveryState::Complete);
    EXPECT_EQ(status.devicesToQuery, 3);
    EXPECT_EQ(status.devicesQueried, 3);
    EXPECT_EQ(status.devicesResponded, 3);
    ASSERT_EQ(status.providersFound.size(), 1u);

    const DiscoveredProvider& provider = status.providersFound[0];
    EXPECT_EQ(provider.callsign, "BASE1");
    EXPECT_EQ(provider.publicKey, base1_->identity->publicKey());
    EXPECT_EQ(provider.snapshotCount, 1);
    EXPECT_EQ(provider.latestSnapshotId.value_or(""), snapshotId_);
    EXPECT_EQ(provider.maxStorageBytes, kDefaultMaxClientStorageBytes);
}

TEST_F(DiscoveryTest, PeerWithoutBackupsStillAnswers) {
    DiscoveryStatus status = runDiscovery();
    ASSERT_EQ(status.devicesResponded, 3);

    auto responses = network_.messages("backup_discovery_response");
    ASSERT_EQ(responses.size(), 3u);
    for (const auto& recorded : responses) {
        EXPECT_EQ(recorded.target, "ALFA");
        auto inbound = parseControlMessage(recorded.message);
        ASSERT_TRUE(inbound.has_value());
        auto* response = std::get_if<DiscoveryResponse>(&inbound->message);
        ASSERT_NE(response, nullptr);
        EXPECT_TRUE(identity_->verify(response->event));
        EXPECT_EQ(response->discoveryId, status.discoveryId);

        if (recorded.from == "BASE1") {
            EXPECT_TRUE(response->hasBackups);
            EXPECT_EQ(response->snapshotCount.value_or(0), 1);
            continue;
        }
        // No relationship: same message kind, no details
        EXPECT_FALSE(response->hasBackups);
        EXPECT_EQ(response->event.getTagValue("has_backups").value_or(""), "false");
        EXPECT_FALSE(response->snapshotCount.has_value());
        EXPECT_FALSE(response->maxStorageBytes.has_value());
        EXPECT_FALSE(response->latestSnapshot.has_value());
    }
}

TEST_F(DiscoveryTest, ChallengeNamesOnlyTheTargetKey) {
    runDiscovery();
    auto challenges = network_.messages("backup_discovery_challenge");
    ASSERT_EQ(challenges.size(), 3u);
    for (const auto& recorded : challenges) {
        auto inbound = parseControlMessage(recorded.message);
        ASSERT_TRUE(inbound.has_value());
        auto* challenge = std::get_if<DiscoveryChallenge>(&inbound->message);
        ASSERT_NE(challenge, nullptr);
        EXPECT_EQ(challenge->event.getTagValue("target").value_or(""), identity_->publicKey());
        EXPECT_TRUE(challenge->event.getTagValue("challenge").has_value());
    }
}

TEST_F(DiscoveryTest, AdoptedProviderAllowsRestore) {
    DiscoveryStatus status = runDiscovery();
    ASSERT_EQ(status.providersFound.size(), 1u);

    ASSERT_TRUE(alfa_->node->discovery().adoptProvider(status.providersFound[0]));
    EXPECT_FALSE(alfa_->node->discovery().adoptProvider(status.providersFound[0]));
    auto provider = alfa_->node->relationshipStore().getProvider("BASE1");
    ASSERT_TRUE(provider.has_value());
    EXPECT_EQ(provider->status, RelationshipStatus::Active);

    RestoreExecutor& restore = alfa_->node->restoreExecutor();
    ASSERT_EQ(restore.startRestore("BASE1", *status.providersFound[0].latestSnapshotId).errorCode,
              BackupErrorCode::None);
    ASSERT_TRUE(restore.waitForCompletion(std::chrono::seconds(10)));
    EXPECT_EQ(restore.getStatus().state, TransferState::Complete);
    EXPECT_EQ(alfa_->readData("a.txt"), "first file");
    EXPECT_EQ(alfa_->readData("docs/b.txt"), "second file");
}

TEST_F(DiscoveryTest, AdoptedProviderIsNotBackedUpToRightAway) {
    DiscoveryStatus status = runDiscovery();
    ASSERT_EQ(status.providersFound.size(), 1u);
    ASSERT_TRUE(alfa_->node->discovery().adoptProvider(status.providersFound[0], 3));

    auto provider = alfa_->node->relationshipStore().getProvider("BASE1");
    ASSERT_TRUE(provider.has_value());
    ASSERT_TRUE(provider->nextScheduledBackup.has_value());
    EXPECT_TRUE(provider->lastSuccessfulBackup.has_value());
    int64_t now = utils::nowSeconds();
    EXPECT_GE(*provider->nextScheduledBackup, now + 3 * kSecondsPerDay - 60);

    // The fresh data directory is empty; a backup now would replace the snapshot
    EXPECT_TRUE(alfa_->node->scheduler().dueProviders(now).empty());
    EXPECT_EQ(alfa_->node->scheduler().runDueBackups(), "");
    EXPECT_EQ(base1_->node->snapshotStore().getSnapshots("ALFA").size(), 1u);

    RestoreExecutor& restore = alfa_->node->restoreExecutor();
    ASSERT_EQ(restore.startRestore("BASE1", snapshotId_).errorCode, BackupErrorCode::None);
    ASSERT_TRUE(restore.waitForCompletion(std::chrono::seconds(10)));
    EXPECT_EQ(restore.getStatus().filesTotal, 2);
    EXPECT_EQ(alfa_->readData("a.txt"), "first file");
}

TEST_F(DiscoveryTest, ResponsesToOtherChallengesAreIgnored) {
    std::string id = alfa_->node->discovery().startDiscovery(1);

    auto stray = base2_->identity->sign(kBackupEventKind, {
        {"action", "discovery_response"},
        {"challenge", "not-ours"},
        {"has_backups", "true"},
        {"callsign", "BASE2"}
    }, "");
    ASSERT_TRUE(stray.has_value());
    DiscoveryResponse response;
    response.event = *stray;
    response.discoveryId = id;
    response.hasBackups = true;
    response.snapshotCount = 5;
    alfa_->node->discovery().handleResponse("BASE2", response);

    ASSERT_TRUE(alfa_->node->discovery().waitForDiscovery(id, std::chrono::seconds(10)));
    auto status = alfa_->node->discovery().getDiscoveryStatus(id);
    ASSERT_TRUE(status.has_value());
    ASSERT_EQ(status->providersFound.size(), 1u);
    EXPECT_EQ(status->providersFound[0].callsign, "BASE1");
    EXPECT_EQ(status->devicesResponded, 3);
}

TEST_F(DiscoveryTest, OpenRunsDoNotHoldWorkers) {
    DiscoveryStatus status = runDiscovery();
    ASSERT_EQ(status.providersFound.size(), 1u);
    ASSERT_TRUE(alfa_->node->discovery().adoptProvider(status.providersFound[0]));
    alfa_->writeData("new.txt", "written after recovery");

    // More open runs than the node has workers
    std::string first = alfa_->node->discovery().startDiscovery(5);
    std::string second = alfa_->node->discovery().startDiscovery(5);
    std::string third = alfa_->node->discovery().startDiscovery(5);

    BackupExecutor& executor = alfa_->node->backupExecutor();
    auto started = std::chrono::steady_clock::now();
    ASSERT_EQ(executor.startBackup("BASE1").errorCode, BackupErrorCode::None);
    ASSERT_TRUE(executor.waitForCompletion(std::chrono::seconds(3)));
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(3));
    EXPECT_EQ(executor.getStatus().state, TransferState::Complete);

    for (const auto& id : {first, second, third}) {
        EXPECT_TRUE(waitUntil([&] {
            auto open = alfa_->node->discovery().getDiscoveryStatus(id);
            return open && open->devicesResponded == 3;
        }));
        auto open = alfa_->node->discovery().getDiscoveryStatus(id);
        ASSERT_TRUE(open.has_value());
        EXPECT_EQ(open->state, DiscoveryState::InProgress);
    }
}

TEST_F(DiscoveryTest, FinishedRunsAreDroppedAfterRetention) {
    ParallelTaskManager workers(1);
    TestTransport transport(network_, "ALFA");
    DiscoveryCoordinator coordinator(alfa_->node->relationshipStore(), alfa_->node->snapshotStore(),
                                     *identity_, transport, alfa_->node->peerDirectory(), workers,
                                     "ALFA", std::chrono::seconds(1));

    // Queued challenge tasks reference the coordinator, so no early returns
    std::string id = coordinator.startDiscovery(0);
    EXPECT_TRUE(coordinator.waitForDiscovery(id, std::chrono::seconds(5)));
    EXPECT_TRUE(waitUntil([&] { return !coordinator.getDiscoveryStatus(id).has_value(); },
                          std::chrono::seconds(5)));
    workers.shutdown();
}

TEST_F(DiscoveryTest, UnknownDiscoveryId) {
    EXPECT_FALSE(alfa_->node->discovery().getDiscoveryStatus("missing").has_value());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
