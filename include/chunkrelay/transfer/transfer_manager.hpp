#pragma once

#include "chunkrelay/network/protocol.hpp"
#include "chunkrelay/network/relay_client.hpp"
#include "chunkrelay/transfer/payload_source.hpp"
#include "chunkrelay/transfer/receiver_session.hpp"
#include "chunkrelay/transfer/sender_session.hpp"
#include "chunkrelay/transfer/session_registry.hpp"
#include "chunkrelay/transfer/transfer_config.hpp"
#include "chunkrelay/transfer/transfer_decider.hpp"
#include "chunkrelay/transfer/transfer_types.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace chunkrelay::storage {
class ResumeStore;
}

namespace chunkrelay::transfer {

// Transfer endpoint for one relay identity. Owns the sender and receiver
// registries, dispatches inbound envelopes and reports terminal and
// pause/resume events to the caller.
class TransferManager {
public:
    using StatusHandler = std::function<void(const TransferEvent&)>;
    using PayloadHandler = std::function<void(const std::string& transfer_id, const network::PeerId& peer,
                                              const std::string& file_name, std::vector<std::uint8_t> payload)>;

    TransferManager(std::shared_ptr<network::RelayClient> client, TransferOptions options,
                    boost::asio::any_io_executor executor,
                    std::shared_ptr<TransferDecider> decider = nullptr,
                    std::shared_ptr<storage::ResumeStore> store = nullptr);
    ~TransferManager();

    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    // Hooks into the relay client and starts the maintenance thread.
    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    TransferResult send_payload(const network::PeerId& target, const std::string& file_name,
                                const std::string& content_type, std::shared_ptr<PayloadSource> source,
                                std::string& transfer_id);

    TransferResult cancel_transfer(const std::string& transfer_id);

    // Recreates a checkpointed sender over `source` and reconciles it with
    // the receiver right away.
    TransferResult resume_from_checkpoint(const std::string& transfer_id, std::shared_ptr<PayloadSource> source);

    void on_status(StatusHandler handler);
    void on_payload_received(PayloadHandler handler);

    std::optional<TransferStats> get_transfer_stats(const std::string& transfer_id) const;
    std::vector<TransferStats> get_all_transfers() const;

    std::shared_ptr<SenderSession> find_sender(const std::string& transfer_id) const;
    std::shared_ptr<ReceiverSession> find_receiver(const std::string& transfer_id) const;

    std::size_t purge_expired(SessionRegistry<SenderSession>::Clock::time_point now =
                                  SessionRegistry<SenderSession>::Clock::now());

    const network::PeerId& identity() const { return client_->identity(); }
    const TransferOptions& options() const { return options_; }

private:
    void handle_message(const network::PeerId& from, network::Envelope envelope);
    void handle_channel_state(bool open);

    void dispatch(const network::PeerId& from, const network::TransferRequest& request);
    void dispatch(const network::PeerId& from, const network::TransferResponse& response);
    void dispatch(const network::PeerId& from, const network::ChunkEnvelope& chunk);
    void dispatch(const network::PeerId& from, const network::ChunkAck& ack);
    void dispatch(const network::PeerId& from, const network::TransferConfirmation& confirmation);
    void dispatch(const network::PeerId& from, const network::StatusQuery& query);
    void dispatch(const network::PeerId& from, const network::StatusResponse& response);
    void dispatch(const network::PeerId& from, const network::TransferCancel& cancel);

    std::shared_ptr<SenderSession> sender_for(const network::PeerId& from, const std::string& transfer_id) const;
    std::shared_ptr<ReceiverSession> receiver_for(const network::PeerId& from, const std::string& transfer_id) const;

    std::shared_ptr<SenderSession> make_sender(TransferDescriptor descriptor, std::shared_ptr<PayloadSource> source);

    void notify_status(const TransferEvent& event);
    void maintenance_loop();

    std::shared_ptr<network::RelayClient> client_;
    TransferOptions options_;
    boost::asio::any_io_executor executor_;
    std::shared_ptr<TransferDecider> decider_;
    std::shared_ptr<storage::ResumeStore> store_;

    SessionRegistry<SenderSession> senders_;
    SessionRegistry<ReceiverSession> receivers_;

    mutable std::mutex handler_mutex_;
    StatusHandler status_handler_;
    PayloadHandler payload_handler_;

    std::atomic<bool> running_;
    std::mutex maintenance_mutex_;
    std::condition_variable maintenance_cv_;
    std::thread maintenance_thread_;
};

} // namespace chunkrelay::transfer
