#include <gtest/gtest.h>
#include "chunkrelay/transfer/sender_session.hpp"
#include <algorithm>
#include <atomic>
#include <numeric>
#include <set>
#include <thread>

using namespace chunkrelay::transfer;
using namespace chunkrelay::network;
using namespace std::chrono_literals;

namespace {
    constexpr std::uint32_t CHUNK_LENGTH = 10;

    class ScriptedTransport : public MessageTransport {
    public:
        using Hook = std::function<TransferResult(const Envelope&)>;

        void set_hook(Hook hook) {
            std::lock_guard<std::mutex> lock(mutex_);
            hook_ = std::move(hook);
        }

        TransferResult send(const PeerId&, const Envelope& envelope) override {
            Hook hook;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                sent_.push_back(envelope);
                hook = hook_;
            }
            return hook ? hook(envelope) : TransferResult();
        }

        std::size_t buffered_amount(const PeerId&) const override { return 0; }

        template<typename T>
        std::vector<T> sent_of() const {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<T> messages;
            for (const auto& envelope : sent_) {
                if (const auto* message = std::get_if<T>(&envelope)) {
                    messages.push_back(*message);
                }
            }
            return messages;
        }

        std::size_t chunk_attempts(std::uint32_t index) const {
            auto chunks = sent_of<ChunkEnvelope>();
            return static_cast<std::size_t>(std::count_if(chunks.begin(), chunks.end(),
                [index](const ChunkEnvelope& chunk) { return chunk.chunk_index == index; }));
        }

    private:
        mutable std::mutex mutex_;
        std::vector<Envelope> sent_;
        Hook hook_;
    };

    class FailingSource : public PayloadSource {
    public:
        std::uint64_t size() const override { return 40 * CHUNK_LENGTH; }
        std::vector<std::uint8_t> read(std::uint64_t, std::size_t) const override {
            throw std::runtime_error("disk went away");
        }
    };

    template<typename Predicate>
    bool wait_until(Predicate predicate, std::chrono::milliseconds timeout = 5000ms) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!predicate()) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(2ms);
        }
        return true;
    }
}

class SenderSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.flow.pacing_enabled = false;
        options_.flow.initial_rto = 50ms;
        options_.flow.min_rto = 20ms;
        options_.flow.max_rto = 100ms;
        options_.resume.stall_timeout = 60000ms;
        options_.resume.status_timeout = 500ms;

        data_.resize(400);
        for (std::size_t i = 0; i < data_.size(); ++i) {
            data_[i] = static_cast<std::uint8_t>(i * 7);
        }
    }

    void TearDown() override {
        if (session_) {
            session_->stop();
        }
        session_.reset();
    }

    TransferDescriptor make_descriptor(std::uint32_t total_chunks = 40) const {
        TransferDescriptor descriptor;
        descriptor.transfer_id = "0badc0de0badc0de0badc0de0badc0de";
        descriptor.peer = "bob";
        descriptor.file_name = "data.bin";
        descriptor.content_type = "application/octet-stream";
        descriptor.total_length = static_cast<std::uint64_t>(total_chunks) * CHUNK_LENGTH;
        descriptor.total_chunks = total_chunks;
        descriptor.chunk_length = CHUNK_LENGTH;
        descriptor.integrity_digest = std::string(64, '0');
        return descriptor;
    }

    SenderSession& create(std::uint32_t total_chunks = 40, std::shared_ptr<PayloadSource> source = nullptr) {
        if (!source) {
            std::vector<std::uint8_t> bytes(static_cast<std::size_t>(total_chunks) * CHUNK_LENGTH);
            for (std::size_t i = 0; i < bytes.size(); ++i) {
                bytes[i] = static_cast<std::uint8_t>(i * 7);
            }
            source = std::make_shared<MemoryPayloadSource>(std::move(bytes));
        }
        session_ = std::make_unique<SenderSession>(make_descriptor(total_chunks), source, transport_, options_);
        session_->set_event_handler([this](const TransferEvent& event) {
            std::lock_guard<std::mutex> lock(events_mutex_);
            events_.push_back(event);
        });
        return *session_;
    }

    void accept() {
        session_->handle_response(TransferResponse{"0badc0de0badc0de0badc0de0badc0de", "alice", true});
    }

    std::vector<TransferEvent> events() const {
        std::lock_guard<std::mutex> lock(events_mutex_);
        return events_;
    }

    bool has_event(TransferStatus status) const {
        auto all = events();
        return std::any_of(all.begin(), all.end(), [status](const TransferEvent& e) { return e.status == status; });
    }

    ChunkAck ack_for(const ChunkEnvelope& chunk, bool success = true) const {
        return ChunkAck{chunk.transfer_id, chunk.chunk_index, success, std::nullopt};
    }

    // Single-page receiver view covering the whole transfer.
    StatusResponse status_reply(std::vector<std::uint32_t> held) const {
        StatusResponse response;
        response.transfer_id = "0badc0de0badc0de0badc0de0badc0de";
        response.total_chunks = session_->total_chunks();
        response.range_end = response.total_chunks;
        response.total_received = static_cast<std::uint32_t>(held.size());
        response.received_chunk_indices = std::move(held);
        return response;
    }

    TransferOptions options_;
    std::vector<std::uint8_t> data_;
    ScriptedTransport transport_;
    std::unique_ptr<SenderSession> session_;

    mutable std::mutex events_mutex_;
    std::vector<TransferEvent> events_;
};

TEST_F(SenderSessionTest, RejectsEmptyPlanOrMissingSource) {
    auto descriptor = make_descriptor();
    descriptor.total_chunks = 0;
    auto source = std::make_shared<MemoryPayloadSource>(data_);
    EXPECT_THROW({ SenderSession empty(descriptor, source, transport_, options_); }, std::invalid_argument);
    EXPECT_THROW({ SenderSession sourceless(make_descriptor(), nullptr, transport_, options_); },
                 std::invalid_argument);
}

TEST_F(SenderSessionTest, StartSendsRequest) {
    auto& session = create();
    ASSERT_TRUE(session.start().success());

    auto requests = transport_.sent_of<TransferRequest>();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].total_chunks, 40u);
    EXPECT_EQ(requests[0].chunk_length, CHUNK_LENGTH);
    EXPECT_EQ(requests[0].total_length, 400u);
    EXPECT_EQ(requests[0].target_peer, "bob");

    // Nothing moves before the receiver answers
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(session.get_state(), SenderState::Requesting);
    EXPECT_TRUE(transport_.sent_of<ChunkEnvelope>().empty());
    EXPECT_EQ(session.start().error, TransferError::InvalidState);
}

TEST_F(SenderSessionTest, UndeliverableRequestFails) {
    transport_.set_hook([](const Envelope&) {
        return TransferResult(TransferError::PeerUnreachable, "Peer bob is not reachable");
    });
    auto& session = create();

    EXPECT_EQ(session.start().error, TransferError::PeerUnreachable);
    EXPECT_EQ(session.get_state(), SenderState::Failed);
    EXPECT_TRUE(has_event(TransferStatus::Failed));
}

TEST_F(SenderSessionTest, DeclinedRequest) {
    auto& session = create();
    ASSERT_TRUE(session.start().success());

    session.handle_response(TransferResponse{"0badc0de0badc0de0badc0de0badc0de", "alice", false});
    EXPECT_EQ(session.get_state(), SenderState::Rejected);
    EXPECT_EQ(session.get_error(), TransferError::Rejected);
    ASSERT_TRUE(wait_until([&] { return has_event(TransferStatus::Rejected); }));
    EXPECT_TRUE(transport_.sent_of<ChunkEnvelope>().empty());
}

TEST_F(SenderSessionTest, RequestTimesOut) {
    options_.sender.request_timeout = 50ms;
    auto& session = create();
    ASSERT_TRUE(session.start().success());

    ASSERT_TRUE(wait_until([&] { return session.is_terminal(); }));
    EXPECT_EQ(session.get_state(), SenderState::Failed);
    EXPECT_EQ(session.get_error(), TransferError::Timeout);
}

TEST_F(SenderSessionTest, AcknowledgedTransferCompletes) {
    auto& session = create();
    transport_.set_hook([this](const Envelope& envelope) {
        if (const auto* chunk = std::get_if<ChunkEnvelope>(&envelope)) {
            EXPECT_TRUE(chunk->require_ack);
            session_->handle_ack(ack_for(*chunk));
        }
        return TransferResult();
    });

    ASSERT_TRUE(session.start().success());
    accept();

    ASSERT_TRUE(wait_until([&] { return session.get_state() == SenderState::WaitingConfirmation; }));
    ASSERT_TRUE(wait_until([&] { return session.chunk_sends() == 40; }));
    EXPECT_EQ(session.confirmed_count(), 40u);

    auto chunks = transport_.sent_of<ChunkEnvelope>();
    std::set<std::uint32_t> indices;
    for (const auto& chunk : chunks) {
        indices.insert(chunk.chunk_index);
        EXPECT_EQ(chunk.is_last, chunk.chunk_index == 39);
    }
    EXPECT_EQ(indices.size(), 40u);

    session.handle_confirmation(TransferConfirmation{"0badc0de0badc0de0badc0de0badc0de", true, "Transfer verified"});
    EXPECT_EQ(session.get_state(), SenderState::Completed);
    ASSERT_TRUE(wait_until([&] { return has_event(TransferStatus::Completed); }));

    auto stats = session.get_stats();
    EXPECT_EQ(stats.chunks_done, 40u);
    EXPECT_DOUBLE_EQ(stats.progress_percentage, 100.0);
    EXPECT_EQ(stats.bytes_transferred, 400u);
}

TEST_F(SenderSessionTest, NeverAckedChunkExhaustsRetries) {
    auto& session = create();
    transport_.set_hook([this](const Envelope& envelope) {
        if (const auto* chunk = std::get_if<ChunkEnvelope>(&envelope)) {
            if (chunk->chunk_index != 12) {
                session_->handle_ack(ack_for(*chunk));
            }
        }
        return TransferResult();
    });

    ASSERT_TRUE(session.start().success());
    accept();

    ASSERT_TRUE(wait_until([&] { return session.is_terminal(); }));
    EXPECT_EQ(session.get_state(), SenderState::Failed);
    EXPECT_EQ(session.get_error(), TransferError::MaxRetriesExceeded);
    EXPECT_EQ(session.get_error_message(), "Chunk 12 failed after 3 attempts");
    EXPECT_EQ(session.confirmed_count(), 39u);

    // Nothing else goes out once the session has failed
    auto settled = transport_.sent_of<ChunkEnvelope>().size();
    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(transport_.sent_of<ChunkEnvelope>().size(), settled);
    EXPECT_EQ(transport_.chunk_attempts(12), 3u);

    auto all = events();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].status, TransferStatus::Failed);
}

TEST_F(SenderSessionTest, NegativeAckIsRetried) {
    auto& session = create();
    std::atomic<bool> refused{false};
    transport_.set_hook([this, &refused](const Envelope& envelope) {
        if (const auto* chunk = std::get_if<ChunkEnvelope>(&envelope)) {
            bool refuse = chunk->chunk_index == 5 && !refused.exchange(true);
            session_->handle_ack(ack_for(*chunk, !refuse));
        }
        return TransferResult();
    });

    ASSERT_TRUE(session.start().success());
    accept();

    ASSERT_TRUE(wait_until([&] { return session.get_state() == SenderState::WaitingConfirmation; }));
    EXPECT_EQ(transport_.chunk_attempts(5), 2u);
    EXPECT_EQ(session.get_stats().chunks_retransmitted, 1u);
}

TEST_F(SenderSessionTest, OversizeChunkFailsImmediately) {
    auto& session = create();
    transport_.set_hook([](const Envelope& envelope) {
        if (std::holds_alternative<ChunkEnvelope>(envelope)) {
            return TransferResult(TransferError::ChunkTooLarge, "Envelope exceeds relay ceiling");
        }
        return TransferResult();
    });

    ASSERT_TRUE(session.start().success());
    accept();

    ASSERT_TRUE(wait_until([&] { return session.is_terminal(); }));
    EXPECT_EQ(session.get_error(), TransferError::ChunkTooLarge);
}

TEST_F(SenderSessionTest, UnreadableSourceFails) {
    auto& session = create(40, std::make_shared<FailingSource>());
    ASSERT_TRUE(session.start().success());
    accept();

    ASSERT_TRUE(wait_until([&] { return session.is_terminal(); }));
    EXPECT_EQ(session.get_error(), TransferError::MaxRetriesExceeded);
    EXPECT_TRUE(transport_.sent_of<ChunkEnvelope>().empty());
}

TEST_F(SenderSessionTest, StallTriggersResume) {
    options_.sender.require_ack = false;
    options_.resume.stall_timeout = 100ms;
    auto& session = create();

    const std::set<std::uint32_t> dropped{3, 9, 17, 28, 39};
    std::mutex held_mutex;
    std::set<std::uint32_t> held;
    std::set<std::uint32_t> seen;

    transport_.set_hook([&, this](const Envelope& envelope) {
        if (const auto* chunk = std::get_if<ChunkEnvelope>(&envelope)) {
            std::lock_guard<std::mutex> lock(held_mutex);
            bool first = seen.insert(chunk->chunk_index).second;
            if (!first || dropped.count(chunk->chunk_index) == 0) {
                held.insert(chunk->chunk_index);
            }
        } else if (std::holds_alternative<StatusQuery>(envelope)) {
            std::vector<std::uint32_t> indices;
            {
                std::lock_guard<std::mutex> lock(held_mutex);
                indices.assign(held.begin(), held.end());
            }
            session_->handle_status_response(status_reply(std::move(indices)));
        }
        return TransferResult();
    });

    ASSERT_TRUE(session.start().success());
    accept();

    ASSERT_TRUE(wait_until([&] { return session.get_state() == SenderState::WaitingConfirmation; }));
    EXPECT_EQ(session.chunks_retransmitted(), dropped.size());
    EXPECT_EQ(session.resume_rounds(), 1u);
    EXPECT_EQ(session.confirmed_count(), 40u);

    for (auto index : dropped) {
        EXPECT_EQ(transport_.chunk_attempts(index), 2u);
    }
    for (const auto& chunk : transport_.sent_of<ChunkEnvelope>()) {
        EXPECT_FALSE(chunk.require_ack);
    }
}

TEST_F(SenderSessionTest, SilentReceiverExhaustsResumeRounds) {
    options_.sender.require_ack = false;
    options_.resume.stall_timeout = 50ms;
    options_.resume.status_timeout = 20ms;
    options_.resume.max_rounds = 2;
    auto& session = create(10);

    ASSERT_TRUE(session.start().success());
    accept();

    ASSERT_TRUE(wait_until([&] { return session.is_terminal(); }));
    EXPECT_EQ(session.get_error(), TransferError::ResumeRoundsExhausted);
    EXPECT_EQ(session.resume_rounds(), 2u);
    EXPECT_EQ(session.chunks_retransmitted(), 20u);
}

TEST_F(SenderSessionTest, ChannelLossPausesAndRecoveryResendsOnlyMissing) {
    options_.sender.require_ack = false;
    auto& session = create(300);

    enum class Link { Up, Down, Restored };
    std::mutex link_mutex;
    Link link = Link::Up;
    std::uint32_t delivered = 0;
    std::vector<std::uint32_t> resent;

    transport_.set_hook([&, this](const Envelope& envelope) {
        std::lock_guard<std::mutex> lock(link_mutex);
        if (link == Link::Down) {
            return TransferResult(TransferError::ChannelUnavailable, "Relay connection is down");
        }
        if (const auto* chunk = std::get_if<ChunkEnvelope>(&envelope)) {
            if (link == Link::Restored) {
                resent.push_back(chunk->chunk_index);
            } else if (delivered == 200) {
                link = Link::Down;
                return TransferResult(TransferError::ChannelUnavailable, "Relay connection is down");
            } else {
                ++delivered;
            }
        } else if (std::holds_alternative<StatusQuery>(envelope)) {
            // The receiver only ever got the first 180
            std::vector<std::uint32_t> indices(180);
            std::iota(indices.begin(), indices.end(), 0u);
            session_->handle_status_response(status_reply(std::move(indices)));
        }
        return TransferResult();
    });

    ASSERT_TRUE(session.start().success());
    accept();

    ASSERT_TRUE(wait_until([&] { return has_event(TransferStatus::Paused); }));
    EXPECT_EQ(session.get_state(), SenderState::Paused);
    EXPECT_EQ(events().front().error, TransferError::ChannelUnavailable);

    // Let the workers still holding an index hit the dead link
    std::this_thread::sleep_for(50ms);
    {
        std::lock_guard<std::mutex> lock(link_mutex);
        EXPECT_EQ(delivered, 200u);
        EXPECT_TRUE(resent.empty());
        link = Link::Restored;
    }
    session.on_channel_restored();

    ASSERT_TRUE(wait_until([&] {
        std::lock_guard<std::mutex> lock(link_mutex);
        return resent.size() >= 120;
    }));
    std::this_thread::sleep_for(50ms);

    EXPECT_EQ(session.confirmed_count(), 180u);
    EXPECT_EQ(session.get_state(), SenderState::Sending);
    EXPECT_TRUE(has_event(TransferStatus::Active));

    std::vector<std::uint32_t> expected(120);
    std::iota(expected.begin(), expected.end(), 180u);

    std::lock_guard<std::mutex> lock(link_mutex);
    auto actual = resent;
    std::sort(actual.begin(), actual.end());
    EXPECT_EQ(actual, expected);
}

TEST_F(SenderSessionTest, ChannelLostWhileSending) {
    options_.sender.require_ack = false;
    auto& session = create();
    std::atomic<bool> hold{true};
    transport_.set_hook([&hold](const Envelope& envelope) {
        if (std::holds_alternative<ChunkEnvelope>(envelope)) {
            while (hold.load()) {
                std::this_thread::sleep_for(1ms);
            }
        }
        return TransferResult();
    });

    ASSERT_TRUE(session.start().success());
    accept();

    session.on_channel_lost();
    EXPECT_EQ(session.get_state(), SenderState::Paused);
    hold = false;

    ASSERT_TRUE(wait_until([&] { return has_event(TransferStatus::Paused); }));
    std::this_thread::sleep_for(30ms);

    // Sends that were already in flight do not restart the session
    EXPECT_EQ(session.get_state(), SenderState::Paused);
    EXPECT_LE(transport_.sent_of<ChunkEnvelope>().size(), options_.flow.max_window);
}

TEST_F(SenderSessionTest, IntegrityFailureReported) {
    auto& session = create();
    transport_.set_hook([this](const Envelope& envelope) {
        if (const auto* chunk = std::get_if<ChunkEnvelope>(&envelope)) {
            session_->handle_ack(ack_for(*chunk));
        }
        return TransferResult();
    });
    ASSERT_TRUE(session.start().success());
    accept();
    ASSERT_TRUE(wait_until([&] { return session.get_state() == SenderState::WaitingConfirmation; }));

    session.handle_confirmation(TransferConfirmation{"0badc0de0badc0de0badc0de0badc0de", false,
                                                     "Integrity digest mismatch"});
    EXPECT_EQ(session.get_state(), SenderState::Failed);
    EXPECT_EQ(session.get_error(), TransferError::IntegrityMismatch);
    EXPECT_EQ(session.get_error_message(), "Receiver reported failure: Integrity digest mismatch");
}

TEST_F(SenderSessionTest, ConfirmationTimeoutFails) {
    options_.sender.confirmation_timeout = 20ms;
    options_.resume.status_timeout = 10ms;
    options_.resume.max_rounds = 1;
    auto& session = create(5);
    transport_.set_hook([this](const Envelope& envelope) {
        if (const auto* chunk = std::get_if<ChunkEnvelope>(&envelope)) {
            session_->handle_ack(ack_for(*chunk));
        }
        return TransferResult();
    });

    ASSERT_TRUE(session.start().success());
    accept();

    ASSERT_TRUE(wait_until([&] { return session.is_terminal(); }));
    EXPECT_EQ(session.get_state(), SenderState::Failed);
    EXPECT_EQ(session.get_error(), TransferError::Timeout);
    EXPECT_GE(transport_.sent_of<StatusQuery>().size(), 1u);
}

TEST_F(SenderSessionTest, CancelNotifiesReceiver) {
    auto& session = create();
    ASSERT_TRUE(session.start().success());

    EXPECT_TRUE(session.cancel().success());
    EXPECT_EQ(session.get_state(), SenderState::Cancelled);
    EXPECT_EQ(transport_.sent_of<TransferCancel>().size(), 1u);
    EXPECT_EQ(session.cancel().error, TransferError::InvalidState);

    // A late confirmation does not resurrect the session
    session.handle_confirmation(TransferConfirmation{"0badc0de0badc0de0badc0de0badc0de", true, ""});
    EXPECT_EQ(session.get_state(), SenderState::Cancelled);
}

TEST_F(SenderSessionTest, CancelledByReceiver) {
    auto& session = create();
    ASSERT_TRUE(session.start().success());
    accept();

    session.handle_cancel();
    EXPECT_EQ(session.get_state(), SenderState::Cancelled);
    EXPECT_TRUE(transport_.sent_of<TransferCancel>().empty());
}

TEST_F(SenderSessionTest, StatusPagesMergeBeforeAnswering) {
    auto& session = create(40);
    ASSERT_TRUE(session.request_status().success());

    auto page = [](std::uint32_t start, std::uint32_t end, std::vector<std::uint32_t> held) {
        StatusResponse response;
        response.transfer_id = "0badc0de0badc0de0badc0de0badc0de";
        response.total_chunks = 40;
        response.range_start = start;
        response.range_end = end;
        response.received_chunk_indices = std::move(held);
        response.total_received = 5;
        return response;
    };

    session.handle_status_response(page(0, 16, {1, 2, 15}));
    EXPECT_FALSE(session.await_status(10ms).has_value());

    session.handle_status_response(page(16, 40, {16, 39}));
    auto merged = session.await_status(10ms);
    ASSERT_TRUE(merged.has_value());
    EXPECT_EQ(merged->range_start, 0u);
    EXPECT_EQ(merged->range_end, 40u);
    EXPECT_EQ(merged->received_chunk_indices, (std::vector<std::uint32_t>{1, 2, 15, 16, 39}));
    EXPECT_EQ(merged->total_received, 5u);
}

TEST_F(SenderSessionTest, StrayStatusPagesIgnored) {
    auto& session = create(40);
    ASSERT_TRUE(session.request_status().success());

    // A later page without its predecessor
    StatusResponse tail;
    tail.transfer_id = "0badc0de0badc0de0badc0de0badc0de";
    tail.total_chunks = 40;
    tail.range_start = 16;
    tail.range_end = 40;
    session.handle_status_response(tail);
    EXPECT_FALSE(session.await_status(10ms).has_value());

    // A view of some other chunk plan
    StatusResponse wrong_plan;
    wrong_plan.transfer_id = tail.transfer_id;
    wrong_plan.total_chunks = 41;
    wrong_plan.range_end = 41;
    session.handle_status_response(wrong_plan);
    EXPECT_FALSE(session.await_status(10ms).has_value());
}

TEST_F(SenderSessionTest, CheckpointStartReconcilesFirst) {
    options_.sender.require_ack = false;
    auto& session = create(20);
    transport_.set_hook([this](const Envelope& envelope) {
        if (std::holds_alternative<StatusQuery>(envelope)) {
            std::vector<std::uint32_t> indices(15);
            std::iota(indices.begin(), indices.end(), 0u);
            session_->handle_status_response(status_reply(std::move(indices)));
        }
        return TransferResult();
    });

    ASSERT_TRUE(session.start_from_checkpoint({0, 1, 2, 3, 4}).success());

    ASSERT_TRUE(wait_until([&] { return transport_.sent_of<ChunkEnvelope>().size() >= 5; }));
    std::this_thread::sleep_for(50ms);

    std::set<std::uint32_t> sent;
    for (const auto& chunk : transport_.sent_of<ChunkEnvelope>()) {
        sent.insert(chunk.chunk_index);
    }
    EXPECT_EQ(sent, (std::set<std::uint32_t>{15, 16, 17, 18, 19}));
    EXPECT_EQ(session.confirmed_count(), 15u);
    EXPECT_TRUE(transport_.sent_of<TransferRequest>().empty());
}
