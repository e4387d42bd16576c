#include <gtest/gtest.h>
#include "test_network.hpp"
#include "protocol/control_message.hpp"
#include <limits>

using json = nlohmann::json;

class ProtocolRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        alfa_ = std::make_unique<TestPeer>(network_, "ALFA");
        base_ = std::make_unique<TestPeer>(network_, "BASE1");

        ProviderSettings settings;
        settings.enabled = true;
        ASSERT_TRUE(base_->node->relationships().enableProvider(settings));
    }

    void TearDown() override {
        base_.reset();
        alfa_.reset();
    }

    SignedEvent inviteEvent(int64_t createdAt) {
        auto event = alfa_->identity->sign(kBackupEventKind, {
            {"action", "backup_invite"},
            {"target", "BASE1"},
            {"callsign", "ALFA"},
            {"interval_days", "3"}
        }, "", createdAt);
        EXPECT_TRUE(event.has_value());
        return event.value_or(SignedEvent{});
    }

    bool deliverInvite(const SignedEvent& event) {
        json message = encodeControlMessage(BackupInvite{event});
        message["from"] = "ALFA";
        return base_->node->handleMessage(message);
    }

    TestNetwork network_;
    std::unique_ptr<TestPeer> alfa_;
    std::unique_ptr<TestPeer> base_;
};

TEST_F(ProtocolRouterTest, FreshInviteCreatesPendingClient) {
    EXPECT_TRUE(deliverInvite(inviteEvent(utils::nowSeconds())));

    auto client = base_->node->relationshipStore().getClient("ALFA");
    ASSERT_TRUE(client.has_value());
    EXPECT_EQ(client->status, RelationshipStatus::Pending);
    EXPECT_EQ(client->clientPublicKey, alfa_->identity->publicKey());
}

TEST_F(ProtocolRouterTest, StaleInviteIsDropped) {
    SignedEvent old = inviteEvent(utils::nowSeconds() - 301);
    EXPECT_EQ(base_->node->router().validate(BackupInvite{old}), BackupErrorCode::EventStale);
    EXPECT_FALSE(deliverInvite(old));

    SignedEvent future = inviteEvent(utils::nowSeconds() + 3600);
    EXPECT_FALSE(deliverInvite(future));

    EXPECT_FALSE(base_->node->relationshipStore().getClient("ALFA").has_value());
}

TEST_F(ProtocolRouterTest, ExtremeTimestampsAreStale) {
    SignedEvent earliest = inviteEvent(std::numeric_limits<int64_t>::min());
    EXPECT_EQ(base_->node->router().validate(BackupInvite{earliest}), BackupErrorCode::EventStale);
    EXPECT_FALSE(deliverInvite(earliest));

    SignedEvent latest = inviteEvent(std::numeric_limits<int64_t>::max());
    EXPECT_EQ(base_->node->router().validate(BackupInvite{latest}), BackupErrorCode::EventStale);
    EXPECT_FALSE(deliverInvite(latest));

    EXPECT_FALSE(base_->node->relationshipStore().getClient("ALFA").has_value());
}

TEST_F(ProtocolRouterTest, MistypedFieldsAreDropped) {
    json numericSender{{"type", "backup_start"}, {"snapshot_id", "2026-01-01"}, {"from", 42}};
    EXPECT_NO_THROW(EXPECT_FALSE(base_->node->handleMessage(numericSender)));

    json numericSnapshot{{"type", "backup_start"}, {"snapshot_id", 7}, {"from", "ALFA"}};
    EXPECT_NO_THROW(EXPECT_FALSE(base_->node->handleMessage(numericSnapshot)));

    EXPECT_TRUE(base_->node->snapshotStore().getSnapshots("ALFA").empty());
}

TEST_F(ProtocolRouterTest, ForgedInviteIsDropped) {
    SignedEvent forged = inviteEvent(utils::nowSeconds());
    forged.tags.push_back({"interval_days", "1"});
    EXPECT_EQ(base_->node->router().validate(BackupInvite{forged}), BackupErrorCode::SignatureInvalid);
    EXPECT_FALSE(deliverInvite(forged));

    // Claiming someone else's key with our own signature
    SignedEvent impersonated = inviteEvent(utils::nowSeconds());
    impersonated.pubkey = base_->identity->publicKey();
    impersonated.id = impersonated.computeId();
    EXPECT_FALSE(deliverInvite(impersonated));

    EXPECT_FALSE(base_->node->relationshipStore().getClient("ALFA").has_value());
}

TEST_F(ProtocolRouterTest, UnsignedKindsPassValidation) {
    EXPECT_EQ(base_->node->router().validate(BackupStart{"2026-03-01"}), BackupErrorCode::None);
    EXPECT_FALSE(base_->node->handleMessage(json{{"type", "backup_unknown"}, {"from", "ALFA"}}));
}

TEST_F(ProtocolRouterTest, BackupStartFromStrangerIsIgnored) {
    json start = encodeControlMessage(BackupStart{"2026-03-01"});
    start["from"] = "ALFA";
    base_->node->handleMessage(start);
    EXPECT_TRUE(base_->node->snapshotStore().getSnapshots("ALFA").empty());
    EXPECT_FALSE(std::filesystem::exists(base_->node->relationshipStore().clientDirectory("ALFA") / "2026-03-01"));
}

TEST_F(ProtocolRouterTest, MessageEndpointStampsSender) {
    json message = encodeControlMessage(BackupInvite{inviteEvent(utils::nowSeconds())});
    message["from"] = "MALLORY";
    ApiResponse response = base_->node->handleApiRequest("alfa", "POST", "/api/backup/message", message.dump());
    EXPECT_TRUE(response.success);
    EXPECT_TRUE(base_->node->relationshipStore().getClient("ALFA").has_value());
    EXPECT_FALSE(base_->node->relationshipStore().getClient("MALLORY").has_value());

    EXPECT_EQ(base_->node->handleApiRequest("ALFA", "GET", "/api/backup/message", "").statusCode, 405);
    EXPECT_EQ(base_->node->handleApiRequest("ALFA", "POST", "/api/backup/message", "not json").statusCode, 400);
    EXPECT_EQ(base_->node->handleApiRequest("ALFA", "GET", "/api/other", "").statusCode, 404);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
