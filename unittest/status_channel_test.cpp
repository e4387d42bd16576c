#include <gtest/gtest.h>
#include "common/status_channel.hpp"
#include "common/transfer_status.hpp"
#include <vector>

class StatusChannelTest : public ::testing::Test {
protected:
    StatusChannel<TransferStatus> channel_;
};

TEST_F(StatusChannelTest, EverySubscriberSeesPublish) {
    std::vector<int> first;
    std::vector<int> second;
    channel_.subscribe([&](const TransferStatus& s) { first.push_back(s.progressPercent); });
    channel_.subscribe([&](const TransferStatus& s) { second.push_back(s.progressPercent); });

    TransferStatus status;
    status.progressPercent = 40;
    channel_.publish(status);

    ASSERT_EQ(first.size(), 1u);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(first[0], 40);
    EXPECT_EQ(second[0], 40);
    EXPECT_EQ(channel_.subscriberCount(), 2u);
}

TEST_F(StatusChannelTest, UnsubscribeStopsDelivery) {
    int calls = 0;
    auto id = channel_.subscribe([&](const TransferStatus&) { calls++; });
    channel_.publish(TransferStatus{});
    channel_.unsubscribe(id);
    channel_.publish(TransferStatus{});

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(channel_.subscriberCount(), 0u);
}

TEST_F(StatusChannelTest, LateSubscriberReadsLatest) {
    TransferStatus status;
    status.snapshotId = "2026-03-01";
    status.state = TransferState::InProgress;
    channel_.publish(status);

    int calls = 0;
    channel_.subscribe([&](const TransferStatus&) { calls++; });
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(channel_.latest().snapshotId, "2026-03-01");
    EXPECT_TRUE(channel_.latest().isRunning());
}

// A subscriber may unsubscribe itself from inside its callback
TEST_F(StatusChannelTest, CallbackCanReenterChannel) {
    StatusChannel<TransferStatus>::SubscriptionId id = 0;
    int calls = 0;
    id = channel_.subscribe([&](const TransferStatus&) {
        calls++;
        channel_.unsubscribe(id);
    });
    channel_.publish(TransferStatus{});
    channel_.publish(TransferStatus{});
    EXPECT_EQ(calls, 1);
}

TEST_F(StatusChannelTest, ProgressIsClamped) {
    TransferStatus status;
    status.filesTotal = 3;
    status.filesTransferred = 1;
    status.recomputeProgress();
    EXPECT_EQ(status.progressPercent, 33);

    status.filesTransferred = 5;
    status.recomputeProgress();
    EXPECT_EQ(status.progressPercent, 100);

    status.filesTotal = 0;
    status.filesTransferred = 0;
    status.state = TransferState::Complete;
    status.recomputeProgress();
    EXPECT_EQ(status.progressPercent, 100);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
