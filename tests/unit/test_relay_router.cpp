#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "chunkrelay/network/relay_router.hpp"
#include "chunkrelay/network/relay_client.hpp"
#include "chunkrelay/network/relay_channel.hpp"
#include <boost/asio.hpp>
#include <string>
#include <vector>

using namespace chunkrelay::network;
using chunkrelay::transfer::TransferError;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {
    const PeerId ALICE = "alice";
    const PeerId BOB = "bob";

    std::vector<std::uint8_t> status_query_frame() {
        StatusQuery query;
        query.transfer_id = "t-1";
        query.target_peer = BOB;
        return encode_envelope(query);
    }
}

class MockPeerChannel : public PeerChannel {
public:
    MOCK_METHOD(bool, write, (const PeerId&, std::vector<std::uint8_t>), (override));
    MOCK_METHOD(bool, is_open, (), (const, override));
    MOCK_METHOD(std::size_t, buffered_amount, (), (const, override));
    MOCK_METHOD(void, set_delivery_handler, (DeliveryHandler), (override));
    MOCK_METHOD(void, set_state_handler, (StateHandler), (override));
};

class RelayRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        alice_channel_ = std::make_shared<NiceMock<MockPeerChannel>>();
        bob_channel_ = std::make_shared<NiceMock<MockPeerChannel>>();
        ON_CALL(*alice_channel_, is_open()).WillByDefault(Return(true));
        ON_CALL(*bob_channel_, is_open()).WillByDefault(Return(true));

        ASSERT_TRUE(router_.register_peer(ALICE, alice_channel_));
        ASSERT_TRUE(router_.register_peer(BOB, bob_channel_));
    }

    RelayRouter router_;
    std::shared_ptr<NiceMock<MockPeerChannel>> alice_channel_;
    std::shared_ptr<NiceMock<MockPeerChannel>> bob_channel_;
};

TEST_F(RelayRouterTest, Registration) {
    EXPECT_TRUE(router_.is_registered(ALICE));
    EXPECT_FALSE(router_.is_registered("carol"));

    // Identities are unique
    EXPECT_FALSE(router_.register_peer(ALICE, std::make_shared<NiceMock<MockPeerChannel>>()));
    EXPECT_FALSE(router_.register_peer("", std::make_shared<NiceMock<MockPeerChannel>>()));
    EXPECT_FALSE(router_.register_peer("carol", nullptr));

    EXPECT_EQ(router_.get_statistics().registered_peers, 2u);
    router_.unregister_peer(BOB);
    EXPECT_FALSE(router_.is_registered(BOB));
    EXPECT_EQ(router_.get_statistics().registered_peers, 1u);
}

TEST_F(RelayRouterTest, ForwardsToTarget) {
    auto frame = status_query_frame();

    EXPECT_CALL(*bob_channel_, write(ALICE, frame)).WillOnce(Return(true));
    EXPECT_CALL(*alice_channel_, write(_, _)).Times(0);

    auto result = router_.forward(frame, ALICE, BOB);
    EXPECT_TRUE(result.success());

    auto stats = router_.get_statistics();
    EXPECT_EQ(stats.messages_forwarded, 1u);
    EXPECT_EQ(stats.bytes_forwarded, frame.size());
    EXPECT_EQ(stats.messages_rejected, 0u);
}

TEST_F(RelayRouterTest, UnknownSenderRejected) {
    EXPECT_CALL(*bob_channel_, write(_, _)).Times(0);

    auto result = router_.forward(status_query_frame(), "mallory", BOB);
    EXPECT_EQ(result.error, TransferError::PeerUnreachable);
    EXPECT_EQ(router_.get_statistics().messages_rejected, 1u);
}

TEST_F(RelayRouterTest, UnknownOrClosedTargetUnreachable) {
    auto result = router_.forward(status_query_frame(), ALICE, "carol");
    EXPECT_EQ(result.error, TransferError::PeerUnreachable);

    EXPECT_CALL(*bob_channel_, is_open()).WillRepeatedly(Return(false));
    EXPECT_CALL(*bob_channel_, write(_, _)).Times(0);
    result = router_.forward(status_query_frame(), ALICE, BOB);
    EXPECT_EQ(result.error, TransferError::PeerUnreachable);

    EXPECT_EQ(router_.get_statistics().messages_rejected, 2u);
}

TEST_F(RelayRouterTest, OversizeEnvelopeRejected) {
    RelayRouter small(RelayConfig{64});
    ASSERT_TRUE(small.register_peer(ALICE, alice_channel_));
    ASSERT_TRUE(small.register_peer(BOB, bob_channel_));

    ChunkEnvelope chunk;
    chunk.transfer_id = "t-1";
    chunk.peer = BOB;
    chunk.encoded_payload = std::string(200, 'A');
    auto frame = encode_envelope(chunk);

    EXPECT_CALL(*bob_channel_, write(_, _)).Times(0);
    auto result = small.forward(frame, ALICE, BOB);
    EXPECT_EQ(result.error, TransferError::ChunkTooLarge);
    EXPECT_EQ(small.get_statistics().messages_rejected, 1u);
}

TEST_F(RelayRouterTest, MalformedEnvelopeRejected) {
    auto frame = status_query_frame();
    frame.back() ^= 0xFF;

    EXPECT_CALL(*bob_channel_, write(_, _)).Times(0);
    auto result = router_.forward(frame, ALICE, BOB);
    EXPECT_EQ(result.error, TransferError::InvalidMetadata);

    std::vector<std::uint8_t> garbage{0x01, 0x02, 0x03};
    result = router_.forward(garbage, ALICE, BOB);
    EXPECT_EQ(result.error, TransferError::InvalidMetadata);
}

TEST_F(RelayRouterTest, WriteFailureReported) {
    EXPECT_CALL(*bob_channel_, write(_, _)).WillOnce(Return(false));

    auto result = router_.forward(status_query_frame(), ALICE, BOB);
    EXPECT_EQ(result.error, TransferError::ChannelUnavailable);

    auto stats = router_.get_statistics();
    EXPECT_EQ(stats.delivery_failures, 1u);
    EXPECT_EQ(stats.messages_forwarded, 0u);
}

TEST_F(RelayRouterTest, BufferedAmountFromChannel) {
    EXPECT_CALL(*bob_channel_, buffered_amount()).WillRepeatedly(Return(4096));
    EXPECT_EQ(router_.buffered_amount(BOB), 4096u);
    EXPECT_EQ(router_.buffered_amount("carol"), 0u);
}

class RelayClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        alice_channel_ = std::make_shared<LocalPeerChannel>(io_.get_executor());
        bob_channel_ = std::make_shared<LocalPeerChannel>(io_.get_executor());
        alice_ = std::make_unique<RelayClient>(router_, ALICE, alice_channel_);
        bob_ = std::make_unique<RelayClient>(router_, BOB, bob_channel_);

        bob_->set_message_handler([this](const PeerId& from, Envelope envelope) {
            received_.emplace_back(from, std::move(envelope));
        });
    }

    void TearDown() override {
        alice_.reset();
        bob_.reset();
        io_.run();
    }

    boost::asio::io_context io_;
    RelayRouter router_;
    std::shared_ptr<LocalPeerChannel> alice_channel_;
    std::shared_ptr<LocalPeerChannel> bob_channel_;
    std::unique_ptr<RelayClient> alice_;
    std::unique_ptr<RelayClient> bob_;
    std::vector<std::pair<PeerId, Envelope>> received_;
};

TEST_F(RelayClientTest, DeliversInOrder) {
    for (std::uint32_t i = 0; i < 5; ++i) {
        ChunkAck ack;
        ack.transfer_id = "t-1";
        ack.chunk_index = i;
        ack.success = true;
        ASSERT_TRUE(alice_->send(BOB, ack).success());
    }
    EXPECT_GT(bob_channel_->buffered_amount(), 0u);

    io_.run();

    ASSERT_EQ(received_.size(), 5u);
    for (std::uint32_t i = 0; i < 5; ++i) {
        EXPECT_EQ(received_[i].first, ALICE);
        ASSERT_TRUE(std::holds_alternative<ChunkAck>(received_[i].second));
        EXPECT_EQ(std::get<ChunkAck>(received_[i].second).chunk_index, i);
    }
    EXPECT_EQ(bob_channel_->buffered_amount(), 0u);
    EXPECT_EQ(bob_channel_->frames_delivered(), 5u);
    EXPECT_EQ(alice_->messages_sent(), 5u);
    EXPECT_EQ(bob_->messages_received(), 5u);
}

TEST_F(RelayClientTest, DuplicateIdentityThrows) {
    auto channel = std::make_shared<LocalPeerChannel>(io_.get_executor());
    EXPECT_THROW({ RelayClient duplicate(router_, ALICE, channel); }, std::runtime_error);
    EXPECT_THROW({ RelayClient detached(router_, "carol", nullptr); }, std::invalid_argument);
}

TEST_F(RelayClientTest, ClosedChannelReportsUnavailable) {
    std::vector<bool> states;
    alice_->set_state_handler([&](bool open) { states.push_back(open); });

    alice_channel_->close();
    EXPECT_FALSE(alice_->is_connected());

    TransferCancel cancel;
    cancel.transfer_id = "t-1";
    cancel.target_peer = BOB;
    EXPECT_EQ(alice_->send(BOB, cancel).error, TransferError::ChannelUnavailable);

    alice_channel_->reopen();
    EXPECT_TRUE(alice_->send(BOB, cancel).success());

    io_.run();
    EXPECT_EQ(states, (std::vector<bool>{false, true}));
    EXPECT_EQ(received_.size(), 1u);
}

TEST_F(RelayClientTest, ClosedTargetIsUnreachable) {
    bob_channel_->close();

    TransferCancel cancel;
    cancel.transfer_id = "t-1";
    cancel.target_peer = BOB;
    EXPECT_EQ(alice_->send(BOB, cancel).error, TransferError::PeerUnreachable);
}

TEST(LossyPeerChannelTest, DropsSelectedFrames) {
    boost::asio::io_context io;
    RelayRouter router;

    auto sender_channel = std::make_shared<LocalPeerChannel>(io.get_executor());
    auto lossy = std::make_shared<LossyPeerChannel>(
        io.get_executor(), [](const PeerId&, std::span<const std::uint8_t> frame) {
            auto envelope = decode_envelope(frame);
            return std::holds_alternative<ChunkAck>(envelope) &&
                   std::get<ChunkAck>(envelope).chunk_index % 2 == 1;
        });

    std::vector<std::uint32_t> delivered;
    {
        RelayClient sender(router, ALICE, sender_channel);
        RelayClient receiver(router, BOB, lossy);
        receiver.set_message_handler([&](const PeerId&, Envelope envelope) {
            delivered.push_back(std::get<ChunkAck>(envelope).chunk_index);
        });

        for (std::uint32_t i = 0; i < 6; ++i) {
            ChunkAck ack;
            ack.transfer_id = "t-1";
            ack.chunk_index = i;
            ack.success = true;
            // The writer never learns about the drop
            EXPECT_TRUE(sender.send(BOB, ack).success());
        }
        io.run();
    }

    EXPECT_EQ(delivered, (std::vector<std::uint32_t>{0, 2, 4}));
    EXPECT_EQ(lossy->frames_dropped(), 3u);
    EXPECT_EQ(lossy->frames_delivered(), 3u);
}
