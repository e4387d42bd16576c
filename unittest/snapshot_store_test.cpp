#include <gtest/gtest.h>
#include "storage/snapshot_store.hpp"
#include "common/utils.hpp"
#include <filesystem>

class SnapshotStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dataDir_ = std::filesystem::temp_directory_path() / ("peervault_snapshots_" + utils::randomHex(6));
        std::filesystem::create_directories(dataDir_);
        relationships_ = std::make_unique<RelationshipStore>(dataDir_.string());
        ASSERT_TRUE(relationships_->load());
        snapshots_ = std::make_unique<SnapshotStore>(*relationships_);

        ClientRelationship client;
        client.clientCallsign = "ALFA";
        client.clientPublicKey = std::string(128, 'a');
        client.status = RelationshipStatus::Active;
        client.maxStorageBytes = 1000;
        ASSERT_TRUE(relationships_->saveClient(client));
    }

    void TearDown() override {
        snapshots_.reset();
        relationships_.reset();
        std::filesystem::remove_all(dataDir_);
    }

    Snapshot snapshot(const std::string& id, SnapshotState state) {
        Snapshot s;
        s.snapshotId = id;
        s.status = state;
        s.startedAt = utils::nowSeconds();
        return s;
    }

    std::string blobName(char fill) {
        return std::string(32, fill) + ".enc";
    }

    std::filesystem::path dataDir_;
    std::unique_ptr<RelationshipStore> relationships_;
    std::unique_ptr<SnapshotStore> snapshots_;
};

TEST_F(SnapshotStoreTest, ListsNewestFirstAndCountsSnapshots) {
    ASSERT_TRUE(snapshots_->updateSnapshotStatus("ALFA", snapshot("2026-03-01", SnapshotState::Complete)));
    ASSERT_TRUE(snapshots_->updateSnapshotStatus("ALFA", snapshot("2026-03-04", SnapshotState::InProgress)));

    auto list = snapshots_->getSnapshots("ALFA");
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].snapshotId, "2026-03-04");
    EXPECT_EQ(list[1].snapshotId, "2026-03-01");

    auto client = relationships_->getClient("ALFA");
    EXPECT_EQ(client->snapshotCount, 2);
    EXPECT_EQ(client->lastBackupStatus.value_or(""), "in_progress");
    EXPECT_TRUE(client->lastBackupAt.has_value());
}

TEST_F(SnapshotStoreTest, SameDaySnapshotIsOverwritten) {
    ASSERT_TRUE(snapshots_->updateSnapshotStatus("ALFA", snapshot("2026-03-01", SnapshotState::InProgress)));
    ASSERT_TRUE(snapshots_->updateSnapshotStatus("ALFA", snapshot("2026-03-01", SnapshotState::Complete)));

    auto list = snapshots_->getSnapshots("ALFA");
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].status, SnapshotState::Complete);
    EXPECT_EQ(relationships_->getClient("ALFA")->snapshotCount, 1);
}

TEST_F(SnapshotStoreTest, StorageAccountingFollowsBlobs) {
    Bytes first(70, 0x11);
    Bytes second(95, 0x22);
    ASSERT_TRUE(snapshots_->saveEncryptedFile("ALFA", "2026-03-01", blobName('a'), first));
    ASSERT_TRUE(snapshots_->saveEncryptedFile("ALFA", "2026-03-01", blobName('b'), second));
    EXPECT_EQ(relationships_->getClient("ALFA")->currentStorageBytes, 165);

    // Replacing a blob counts only the difference
    ASSERT_TRUE(snapshots_->saveEncryptedFile("ALFA", "2026-03-01", blobName('a'), Bytes(50, 0x33)));
    EXPECT_EQ(relationships_->getClient("ALFA")->currentStorageBytes, 145);

    auto stored = snapshots_->getEncryptedFile("ALFA", "2026-03-01", blobName('b'));
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, second);
}

// Quota is advisory: an over-quota upload is stored and counted
TEST_F(SnapshotStoreTest, OverQuotaUploadIsStillStored) {
    ASSERT_TRUE(snapshots_->saveEncryptedFile("ALFA", "2026-03-01", blobName('c'), Bytes(1500, 0x44)));
    EXPECT_EQ(relationships_->getClient("ALFA")->currentStorageBytes, 1500);
}

TEST_F(SnapshotStoreTest, ManifestIsStoredOpaque) {
    Bytes sealed{0x00, 0xff, 0x10, 0x20};
    ASSERT_TRUE(snapshots_->saveManifest("ALFA", "2026-03-01", sealed));
    auto loaded = snapshots_->getManifest("ALFA", "2026-03-01");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, sealed);
    EXPECT_FALSE(snapshots_->getManifest("ALFA", "2026-03-02").has_value());
}

TEST_F(SnapshotStoreTest, RejectsMalformedIdsAndUnknownClients) {
    EXPECT_FALSE(snapshots_->saveManifest("ALFA", "../../etc", Bytes{1}));
    EXPECT_FALSE(snapshots_->saveEncryptedFile("ALFA", "2026-03-01", "../../x.enc", Bytes{1}));
    EXPECT_FALSE(snapshots_->saveEncryptedFile("ALFA", "2026-03-01", "plain.txt", Bytes{1}));
    EXPECT_FALSE(snapshots_->updateSnapshotStatus("ALFA", snapshot("latest", SnapshotState::Complete)));
    EXPECT_FALSE(snapshots_->saveManifest("BRAVO", "2026-03-01", Bytes{1}));
    EXPECT_TRUE(snapshots_->getSnapshots("BRAVO").empty());
    EXPECT_FALSE(std::filesystem::exists(relationships_->clientDirectory("BRAVO")));
}

TEST_F(SnapshotStoreTest, DeleteSnapshotFreesStorage) {
    ASSERT_TRUE(snapshots_->updateSnapshotStatus("ALFA", snapshot("2026-03-01", SnapshotState::Complete)));
    ASSERT_TRUE(snapshots_->updateSnapshotStatus("ALFA", snapshot("2026-03-04", SnapshotState::Complete)));
    ASSERT_TRUE(snapshots_->saveEncryptedFile("ALFA", "2026-03-01", blobName('a'), Bytes(80, 0x01)));
    ASSERT_TRUE(snapshots_->saveEncryptedFile("ALFA", "2026-03-04", blobName('b'), Bytes(20, 0x02)));

    ASSERT_TRUE(snapshots_->deleteSnapshot("ALFA", "2026-03-01"));
    auto client = relationships_->getClient("ALFA");
    EXPECT_EQ(client->currentStorageBytes, 20);
    EXPECT_EQ(client->snapshotCount, 1);
    EXPECT_FALSE(snapshots_->getSnapshot("ALFA", "2026-03-01").has_value());
    EXPECT_FALSE(snapshots_->deleteSnapshot("ALFA", "2026-03-01"));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
