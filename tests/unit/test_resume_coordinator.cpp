#include <gtest/gtest.h>
#include "chunkrelay/transfer/resume_coordinator.hpp"
#include <algorithm>
#include <set>

using namespace chunkrelay::transfer;
using namespace chunkrelay::network;
using namespace std::chrono_literals;

namespace {
    // Receiver stand-in that loses a fixed set of retransmissions.
    class FakeHost : public ResumeHost {
    public:
        explicit FakeHost(std::uint32_t total) : total_(total) {}

        std::uint32_t total_chunks() const override { return total_; }

        TransferResult request_status() override {
            ++queries;
            if (channel_down) {
                return TransferResult(TransferError::ChannelUnavailable, "Relay connection is down");
            }
            return TransferResult();
        }

        std::optional<StatusResponse> await_status(std::chrono::milliseconds) override {
            if (silent) {
                return std::nullopt;
            }
            StatusResponse response;
            response.transfer_id = "t-1";
            response.received_chunk_indices.assign(held.begin(), held.end());
            response.total_received = static_cast<std::uint32_t>(held.size());
            return response;
        }

        std::vector<std::uint32_t> local_confirmed() const override { return local; }

        void adopt_confirmed(const std::vector<std::uint32_t>& indices) override {
            local = indices;
        }

        TransferResult retransmit(std::uint32_t index) override {
            retransmitted.push_back(index);
            if (lossy.count(index) > 0) {
                lossy.erase(index);
                return TransferResult();
            }
            if (failing.count(index) > 0) {
                return TransferResult(TransferError::PeerUnreachable, "Peer is not reachable");
            }
            held.insert(index);
            return TransferResult();
        }

        bool resume_aborted() const override { return aborted; }

        std::set<std::uint32_t> held;
        std::set<std::uint32_t> lossy;
        std::set<std::uint32_t> failing;
        std::vector<std::uint32_t> local;
        std::vector<std::uint32_t> retransmitted;
        int queries = 0;
        bool silent = false;
        bool channel_down = false;
        bool aborted = false;

    private:
        std::uint32_t total_;
    };

    std::set<std::uint32_t> all_but(std::uint32_t total, std::set<std::uint32_t> missing) {
        std::set<std::uint32_t> indices;
        for (std::uint32_t i = 0; i < total; ++i) {
            if (missing.count(i) == 0) {
                indices.insert(i);
            }
        }
        return indices;
    }
}

class ResumeCoordinatorTest : public ::testing::Test {
protected:
    ResumeConfig config_;
};

TEST_F(ResumeCoordinatorTest, ReconcileAdoptsReceiverView) {
    FakeHost host(10);
    host.held = {0, 1, 2, 5, 9};
    host.local = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9};

    ResumeCoordinator coordinator(host, config_);
    auto outcome = coordinator.reconcile();

    EXPECT_TRUE(outcome.authoritative);
    EXPECT_EQ(outcome.confirmed, (std::vector<std::uint32_t>{0, 1, 2, 5, 9}));
    EXPECT_EQ(outcome.missing, (std::vector<std::uint32_t>{3, 4, 6, 7, 8}));
    // The receiver's word replaces the local view
    EXPECT_EQ(host.local, outcome.confirmed);
}

TEST_F(ResumeCoordinatorTest, ReconcileIgnoresOutOfRangeIndices) {
    FakeHost host(4);
    host.held = {1, 3, 17};

    ResumeCoordinator coordinator(host, config_);
    auto outcome = coordinator.reconcile();
    EXPECT_EQ(outcome.confirmed, (std::vector<std::uint32_t>{1, 3}));
    EXPECT_EQ(outcome.missing, (std::vector<std::uint32_t>{0, 2}));
}

TEST_F(ResumeCoordinatorTest, ReconcileFallsBackToLocalView) {
    FakeHost host(6);
    host.silent = true;
    host.local = {4, 0, 2};

    ResumeCoordinator coordinator(host, config_);
    auto outcome = coordinator.reconcile();

    EXPECT_FALSE(outcome.authoritative);
    EXPECT_TRUE(outcome.query_result.success());
    EXPECT_EQ(outcome.confirmed, (std::vector<std::uint32_t>{0, 2, 4}));
    EXPECT_EQ(outcome.missing, (std::vector<std::uint32_t>{1, 3, 5}));
}

TEST_F(ResumeCoordinatorTest, RunConvergesInOneRound) {
    FakeHost host(4419);
    std::set<std::uint32_t> dropped;
    for (std::uint32_t i = 0; i < 550; ++i) {
        dropped.insert(i * 8 + 3);
    }
    host.held = all_but(4419, dropped);

    ResumeCoordinator coordinator(host, config_);
    auto result = coordinator.run();

    EXPECT_TRUE(result.success());
    EXPECT_EQ(coordinator.rounds_run(), 1u);
    EXPECT_EQ(coordinator.chunks_retransmitted(), 550u);
    EXPECT_EQ(host.held.size(), 4419u);
    EXPECT_EQ(host.queries, 2);

    std::set<std::uint32_t> resent(host.retransmitted.begin(), host.retransmitted.end());
    EXPECT_EQ(resent, dropped);
}

TEST_F(ResumeCoordinatorTest, RunNeedsNoRoundsWhenComplete) {
    FakeHost host(8);
    host.held = all_but(8, {});

    ResumeCoordinator coordinator(host, config_);
    EXPECT_TRUE(coordinator.run().success());
    EXPECT_EQ(coordinator.rounds_run(), 0u);
    EXPECT_TRUE(host.retransmitted.empty());
}

TEST_F(ResumeCoordinatorTest, LostRetransmissionsTakeAnotherRound) {
    FakeHost host(20);
    host.held = all_but(20, {4, 11, 19});
    host.lossy = {11};

    ResumeCoordinator coordinator(host, config_);
    EXPECT_TRUE(coordinator.run().success());
    EXPECT_EQ(coordinator.rounds_run(), 2u);
    EXPECT_EQ(host.retransmitted, (std::vector<std::uint32_t>{4, 11, 19, 11}));
}

TEST_F(ResumeCoordinatorTest, RoundsExhausted) {
    config_.max_rounds = 3;
    FakeHost host(5);
    host.held = {0, 1, 2, 3};
    host.failing = {4};

    ResumeCoordinator coordinator(host, config_);
    auto result = coordinator.run();

    EXPECT_EQ(result.error, TransferError::ResumeRoundsExhausted);
    EXPECT_EQ(coordinator.rounds_run(), 3u);
    EXPECT_EQ(host.retransmitted.size(), 3u);
    EXPECT_EQ(coordinator.chunks_retransmitted(), 0u);
}

TEST_F(ResumeCoordinatorTest, ChannelDownStopsRun) {
    FakeHost host(5);
    host.channel_down = true;

    ResumeCoordinator coordinator(host, config_);
    EXPECT_EQ(coordinator.run().error, TransferError::ChannelUnavailable);
    EXPECT_TRUE(host.retransmitted.empty());
}

TEST_F(ResumeCoordinatorTest, AbortStopsRun) {
    FakeHost host(5);
    host.aborted = true;

    ResumeCoordinator coordinator(host, config_);
    EXPECT_EQ(coordinator.run().error, TransferError::Cancelled);
    EXPECT_EQ(host.queries, 0);
}

TEST_F(ResumeCoordinatorTest, BatchesRespectConfiguredSize) {
    config_.batch_size = 4;
    config_.batch_delay = 1ms;
    FakeHost host(10);

    ResumeCoordinator coordinator(host, config_);
    EXPECT_TRUE(coordinator.run().success());
    EXPECT_EQ(coordinator.chunks_retransmitted(), 10u);

    std::vector<std::uint32_t> expected(10);
    for (std::uint32_t i = 0; i < 10; ++i) {
        expected[i] = i;
    }
    EXPECT_EQ(host.retransmitted, expected);
}
