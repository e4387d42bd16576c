#include <gtest/gtest.h>
#include "protocol/control_message.hpp"
#include "identity/openssl_identity.hpp"

using json = nlohmann::json;

class ControlMessageTest : public ::testing::Test {
protected:
    void SetUp() override {
        identity_ = OpenSslIdentity::generate();
    }

    OpenSslIdentity identity_;
};

TEST_F(ControlMessageTest, InviteCarriesSignedEvent) {
    auto event = identity_.sign(kBackupEventKind, {{"action", "backup_invite"}, {"target", "BASE1"}}, "");
    ASSERT_TRUE(event.has_value());

    json wire = encodeControlMessage(BackupInvite{*event});
    EXPECT_EQ(wire["type"], "backup_invite");
    EXPECT_EQ(wire["event"]["kind"], kBackupEventKind);
    wire["from"] = "alfa";

    auto inbound = parseControlMessage(wire);
    ASSERT_TRUE(inbound.has_value());
    EXPECT_EQ(inbound->from, "ALFA");
    auto* invite = std::get_if<BackupInvite>(&inbound->message);
    ASSERT_NE(invite, nullptr);
    EXPECT_EQ(invite->event.id, event->id);
    EXPECT_TRUE(identity_.verify(invite->event));
    EXPECT_NE(signedEventOf(inbound->message), nullptr);
}

TEST_F(ControlMessageTest, DeclinedResponseOmitsTerms) {
    BackupInviteResponse declined;
    declined.accepted = false;
    json wire = encodeControlMessage(declined);
    EXPECT_EQ(wire["type"], "backup_invite_response");
    EXPECT_FALSE(wire.contains("provider_npub"));
    EXPECT_FALSE(wire.contains("max_storage_bytes"));

    BackupInviteResponse accepted;
    accepted.accepted = true;
    accepted.providerPublicKey = identity_.publicKey();
    accepted.maxStorageBytes = 1073741824LL;
    accepted.maxSnapshots = 10;
    auto inbound = parseControlMessage(encodeControlMessage(accepted));
    ASSERT_TRUE(inbound.has_value());
    auto* response = std::get_if<BackupInviteResponse>(&inbound->message);
    ASSERT_NE(response, nullptr);
    EXPECT_TRUE(response->accepted);
    EXPECT_EQ(response->maxStorageBytes, 1073741824LL);
    EXPECT_EQ(response->maxSnapshots, 10);
    EXPECT_EQ(signedEventOf(inbound->message), nullptr);
}

TEST_F(ControlMessageTest, BackupCompleteFields) {
    json wire = encodeControlMessage(BackupComplete{"2026-03-01", 3, 35});
    EXPECT_EQ(wire["type"], "backup_complete");
    EXPECT_EQ(wire["total_files"], 3);
    EXPECT_EQ(wire["total_bytes"], 35);

    auto inbound = parseControlMessage(wire);
    ASSERT_TRUE(inbound.has_value());
    auto* complete = std::get_if<BackupComplete>(&inbound->message);
    ASSERT_NE(complete, nullptr);
    EXPECT_EQ(complete->snapshotId, "2026-03-01");
    EXPECT_EQ(complete->totalFiles, 3);
    EXPECT_EQ(complete->totalBytes, 35);
}

TEST_F(ControlMessageTest, StatusChangeUsesLowerCaseNames) {
    json wire = encodeControlMessage(StatusChange{RelationshipStatus::Terminated});
    EXPECT_EQ(wire["type"], "backup_status_change");
    EXPECT_EQ(wire["status"], "terminated");

    wire["status"] = "exploded";
    EXPECT_FALSE(parseControlMessage(wire).has_value());
}

TEST_F(ControlMessageTest, RejectsUnknownOrMalformed) {
    EXPECT_FALSE(parseControlMessage(json{{"type", "backup_party"}}).has_value());
    EXPECT_FALSE(parseControlMessage(json{{"snapshot_id", "2026-03-01"}}).has_value());
    EXPECT_FALSE(parseControlMessage(json{{"type", "backup_start"}}).has_value());
    EXPECT_FALSE(parseControlMessage(json{{"type", "backup_invite"}, {"event", "nope"}}).has_value());
    EXPECT_FALSE(parseControlMessage(json::array()).has_value());
}

TEST_F(ControlMessageTest, DiscoveryResponseOptionalDetails) {
    auto event = identity_.sign(kBackupEventKind, {{"action", "discovery_response"}, {"has_backups", "false"}}, "");
    ASSERT_TRUE(event.has_value());

    DiscoveryResponse negative;
    negative.event = *event;
    negative.discoveryId = "abc";
    json wire = encodeControlMessage(negative);
    EXPECT_EQ(wire["type"], "backup_discovery_response");
    EXPECT_FALSE(wire.contains("snapshot_count"));

    auto inbound = parseControlMessage(wire);
    ASSERT_TRUE(inbound.has_value());
    auto* response = std::get_if<DiscoveryResponse>(&inbound->message);
    ASSERT_NE(response, nullptr);
    EXPECT_FALSE(response->hasBackups);
    EXPECT_FALSE(response->snapshotCount.has_value());
    EXPECT_EQ(messageType(inbound->message), "backup_discovery_response");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
