#pragma once

#include "chunkrelay/network/protocol.hpp"
#include "chunkrelay/network/relay_client.hpp"
#include "chunkrelay/transfer/flow_control.hpp"
#include "chunkrelay/transfer/payload_source.hpp"
#include "chunkrelay/transfer/resume_coordinator.hpp"
#include "chunkrelay/transfer/transfer_config.hpp"
#include "chunkrelay/transfer/transfer_types.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <unordered_map>
#include <vector>

namespace chunkrelay::storage {
class ResumeStore;
}

namespace chunkrelay::transfer {

struct PendingAckRecord {
    std::uint32_t chunk_index;
    std::chrono::steady_clock::time_point sent_at;
    std::uint32_t retry_count;
};

// One outbound transfer. A fixed pool of workers pulls chunk indices (due
// retries first, then unsent ones) while a supervisor thread handles ack
// timeouts, flow recomputation, resume triggers and every deadline.
class SenderSession : public ResumeHost {
public:
    using Clock = std::chrono::steady_clock;
    using EventHandler = std::function<void(const TransferEvent&)>;

    SenderSession(TransferDescriptor descriptor, std::shared_ptr<PayloadSource> source,
                  network::MessageTransport& transport, const TransferOptions& options,
                  std::shared_ptr<storage::ResumeStore> store = nullptr);
    ~SenderSession() override;

    SenderSession(const SenderSession&) = delete;
    SenderSession& operator=(const SenderSession&) = delete;

    void set_event_handler(EventHandler handler);

    // Sends the TransferRequest and spins up the workers.
    TransferResult start();

    // Picks up a checkpointed transfer: starts Paused with the saved set and
    // recovers through reconciliation straight away.
    TransferResult start_from_checkpoint(const std::vector<std::uint32_t>& confirmed);

    // Inbound envelopes
    void handle_response(const network::TransferResponse& response);
    void handle_ack(const network::ChunkAck& ack);
    void handle_confirmation(const network::TransferConfirmation& confirmation);
    void handle_status_response(network::StatusResponse response);
    void handle_cancel();

    TransferResult cancel();

    // Relay connection notifications
    void on_channel_lost();
    void on_channel_restored();

    void stop();

    SenderState get_state() const;
    bool is_terminal() const;
    TransferError get_error() const;
    std::string get_error_message() const;
    const TransferDescriptor& descriptor() const { return descriptor_; }

    std::uint32_t confirmed_count() const;
    std::uint32_t sent_count() const;
    std::uint64_t chunk_sends() const;
    std::uint64_t chunks_retransmitted() const { return coordinator_.chunks_retransmitted(); }
    std::uint32_t resume_rounds() const { return coordinator_.rounds_run(); }
    std::vector<std::uint32_t> confirmed_indices() const;
    const FlowMonitor& flow() const { return flow_; }
    TransferStats get_stats() const;

    // ResumeHost
    std::uint32_t total_chunks() const override { return descriptor_.total_chunks; }
    TransferResult request_status() override;
    std::optional<network::StatusResponse> await_status(std::chrono::milliseconds timeout) override;
    std::vector<std::uint32_t> local_confirmed() const override { return confirmed_indices(); }
    void adopt_confirmed(const std::vector<std::uint32_t>& indices) override;
    TransferResult retransmit(std::uint32_t index) override;
    bool resume_aborted() const override;

private:
    struct RetryEntry {
        Clock::time_point due;
        std::uint32_t chunk_index;

        bool operator>(const RetryEntry& other) const { return due > other.due; }
    };

    void launch_threads();
    void worker_loop();
    void supervisor_loop();

    std::optional<std::uint32_t> next_index_locked(Clock::time_point now);
    Clock::time_point next_wake_locked(Clock::time_point now) const;
    std::size_t outstanding_locked() const;

    TransferResult send_chunk(std::uint32_t index, bool require_ack);

    void check_ack_timeouts_locked(Clock::time_point now, std::optional<TransferEvent>& event);
    void register_failure_locked(std::uint32_t index, TransferError cause, std::optional<TransferEvent>& event);
    void mark_confirmed_locked(std::uint32_t index);
    bool enter_waiting_locked(Clock::time_point now);
    bool stall_detected_locked(Clock::time_point now) const;

    std::optional<TransferEvent> finish_locked(SenderState state, TransferError error, std::string message);
    std::optional<TransferEvent> pause_locked(std::string reason);

    void run_recovery();
    void run_resume();

    void save_checkpoint();
    void remove_checkpoint();

    TransferEvent make_event(TransferStatus status, TransferError error, std::string message) const;
    void publish(const std::optional<TransferEvent>& event);

    TransferDescriptor descriptor_;
    std::shared_ptr<PayloadSource> source_;
    network::MessageTransport& transport_;
    SenderConfig config_;
    ResumeConfig resume_config_;
    std::shared_ptr<storage::ResumeStore> store_;

    FlowMonitor flow_;
    ResumeCoordinator coordinator_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    SenderState state_;
    TransferError error_;
    std::string error_message_;
    bool started_;
    bool stopping_;
    bool recovery_requested_;
    bool resume_running_;

    std::unordered_map<std::uint32_t, PendingAckRecord> pending_;
    std::priority_queue<RetryEntry, std::vector<RetryEntry>, std::greater<RetryEntry>> retry_queue_;
    std::deque<std::uint32_t> work_queue_;
    std::vector<bool> confirmed_;
    std::vector<bool> sent_;
    std::vector<std::uint32_t> attempts_;
    std::uint32_t confirmed_count_;
    std::uint32_t sent_count_;
    std::uint64_t bytes_confirmed_;
    std::uint64_t chunk_sends_;
    std::uint64_t retries_;
    std::size_t in_flight_;
    std::uint32_t confirmation_rounds_;

    // Pages merge into status_pages_ until they cover every index.
    std::optional<network::StatusResponse> status_pages_;
    std::optional<network::StatusResponse> status_response_;

    Clock::time_point started_at_;
    Clock::time_point request_deadline_;
    Clock::time_point confirmation_deadline_;
    Clock::time_point last_progress_;

    std::mutex handler_mutex_;
    EventHandler event_handler_;

    std::vector<std::thread> workers_;
    std::thread supervisor_;
};

} // namespace chunkrelay::transfer
