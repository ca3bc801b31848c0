#include "chunkrelay/transfer/transfer_manager.hpp"
#include "chunkrelay/core/logger.hpp"
#include "chunkrelay/crypto/random.hpp"
#include "chunkrelay/storage/resume_store.hpp"
#include "chunkrelay/transfer/size_budgeter.hpp"
#include <stdexcept>

namespace chunkrelay::transfer {

TransferManager::TransferManager(std::shared_ptr<network::RelayClient> client, TransferOptions options,
                                 boost::asio::any_io_executor executor,
                                 std::shared_ptr<TransferDecider> decider,
                                 std::shared_ptr<storage::ResumeStore> store)
    : client_(std::move(client))
    , options_(std::move(options))
    , executor_(std::move(executor))
    , decider_(std::move(decider))
    , store_(std::move(store))
    , senders_(options_.session_grace)
    , receivers_(options_.session_grace)
    , running_(false) {

    if (!client_) {
        throw std::invalid_argument("Transfer manager needs a relay client");
    }
    if (!decider_) {
        decider_ = std::make_shared<AutoAcceptDecider>();
    }
}

TransferManager::~TransferManager() {
    stop();
}

void TransferManager::start() {
    if (running_.exchange(true)) {
        return;
    }

    client_->set_message_handler([this](const network::PeerId& from, network::Envelope envelope) {
        handle_message(from, std::move(envelope));
    });
    client_->set_state_handler([this](bool open) {
        handle_channel_state(open);
    });

    if (store_) {
        store_->cleanup_older_than();
    }

    maintenance_thread_ = std::thread(&TransferManager::maintenance_loop, this);
    LOG_INFO("Transfer endpoint {} started", client_->identity());
}

void TransferManager::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    client_->set_message_handler(nullptr);
    client_->set_state_handler(nullptr);

    maintenance_cv_.notify_all();
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }

    for (auto& sender : senders_.snapshot()) {
        sender->stop();
    }

    LOG_INFO("Transfer endpoint {} stopped", client_->identity());
}

TransferResult TransferManager::send_payload(const network::PeerId& target, const std::string& file_name,
                                             const std::string& content_type, std::shared_ptr<PayloadSource> source,
                                             std::string& transfer_id) {
    if (!running_) {
        return TransferResult(TransferError::InvalidState, "Endpoint is not running");
    }
    if (!source) {
        return TransferResult(TransferError::InvalidMetadata, "No payload source");
    }
    if (file_name.empty()) {
        return TransferResult(TransferError::InvalidMetadata, "Missing file name");
    }
    if (target == client_->identity()) {
        return TransferResult(TransferError::InvalidMetadata, "Cannot send to own identity");
    }

    ChunkPlan plan;
    SizeBudgeter budgeter(options_.budget);
    auto planned = budgeter.plan(source->size(), plan);
    if (!planned) {
        return planned;
    }

    std::string digest;
    try {
        digest = compute_digest(*source);
    } catch (const std::runtime_error& e) {
        LOG_ERROR("Cannot digest {}: {}", file_name, e.what());
        return TransferResult(TransferError::StorageError, e.what());
    }

    TransferDescriptor descriptor;
    descriptor.transfer_id = crypto::SecureRandom::generate_hex_id();
    descriptor.direction = TransferDirection::Send;
    descriptor.peer = target;
    descriptor.file_name = file_name;
    descriptor.content_type = content_type;
    descriptor.total_length = source->size();
    descriptor.total_chunks = plan.chunk_count;
    descriptor.chunk_length = plan.chunk_length;
    descriptor.integrity_digest = digest;

    auto session = make_sender(descriptor, std::move(source));
    if (!senders_.insert(descriptor.transfer_id, session)) {
        return TransferResult(TransferError::InvalidState, "Transfer id collision");
    }

    transfer_id = descriptor.transfer_id;
    return session->start();
}

TransferResult TransferManager::cancel_transfer(const std::string& transfer_id) {
    if (auto sender = senders_.find(transfer_id)) {
        return sender->cancel();
    }
    if (auto receiver = receivers_.find(transfer_id)) {
        return receiver->cancel();
    }
    return TransferResult(TransferError::InvalidState, "Unknown transfer " + transfer_id);
}

TransferResult TransferManager::resume_from_checkpoint(const std::string& transfer_id,
                                                       std::shared_ptr<PayloadSource> source) {
    if (!running_) {
        return TransferResult(TransferError::InvalidState, "Endpoint is not running");
    }
    if (!store_) {
        return TransferResult(TransferError::InvalidState, "No resume store configured");
    }
    if (!source) {
        return TransferResult(TransferError::InvalidMetadata, "No payload source");
    }
    if (senders_.contains(transfer_id)) {
        return TransferResult(TransferError::InvalidState, "Transfer " + transfer_id + " is already active");
    }

    auto checkpoint = store_->load(transfer_id);
    if (!checkpoint) {
        return TransferResult(TransferError::InvalidMetadata, "No checkpoint for " + transfer_id);
    }

    const auto& descriptor = checkpoint->descriptor;
    if (source->size() != descriptor.total_length) {
        return TransferResult(TransferError::InvalidMetadata, "Payload length differs from checkpoint");
    }

    try {
        if (compute_digest(*source) != descriptor.integrity_digest) {
            return TransferResult(TransferError::IntegrityMismatch, "Payload changed since checkpoint");
        }
    } catch (const std::runtime_error& e) {
        return TransferResult(TransferError::StorageError, e.what());
    }

    auto session = make_sender(descriptor, std::move(source));
    if (!senders_.insert(transfer_id, session)) {
        return TransferResult(TransferError::InvalidState, "Transfer " + transfer_id + " is already active");
    }

    return session->start_from_checkpoint(checkpoint->confirmed_chunks);
}

std::shared_ptr<SenderSession> TransferManager::make_sender(TransferDescriptor descriptor,
                                                            std::shared_ptr<PayloadSource> source) {
    auto session = std::make_shared<SenderSession>(std::move(descriptor), std::move(source), *client_,
                                                   options_, store_);
    session->set_event_handler([this](const TransferEvent& event) {
        notify_status(event);
    });
    return session;
}

void TransferManager::on_status(StatusHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    status_handler_ = std::move(handler);
}

void TransferManager::on_payload_received(PayloadHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    payload_handler_ = std::move(handler);
}

std::optional<TransferStats> TransferManager::get_transfer_stats(const std::string& transfer_id) const {
    if (auto sender = senders_.find(transfer_id)) {
        return sender->get_stats();
    }
    if (auto receiver = receivers_.find(transfer_id)) {
        return receiver->get_stats();
    }
    return std::nullopt;
}

std::vector<TransferStats> TransferManager::get_all_transfers() const {
    std::vector<TransferStats> all_stats;
    for (const auto& sender : senders_.snapshot()) {
        all_stats.push_back(sender->get_stats());
    }
    for (const auto& receiver : receivers_.snapshot()) {
        all_stats.push_back(receiver->get_stats());
    }
    return all_stats;
}

std::shared_ptr<SenderSession> TransferManager::find_sender(const std::string& transfer_id) const {
    return senders_.find(transfer_id);
}

std::shared_ptr<ReceiverSession> TransferManager::find_receiver(const std::string& transfer_id) const {
    return receivers_.find(transfer_id);
}

std::size_t TransferManager::purge_expired(SessionRegistry<SenderSession>::Clock::time_point now) {
    auto purged = senders_.purge_expired(now) + receivers_.purge_expired(now);
    if (purged > 0) {
        LOG_DEBUG("Purged {} finished transfers", purged);
    }
    return purged;
}

void TransferManager::handle_message(const network::PeerId& from, network::Envelope envelope) {
    std::visit([this, &from](const auto& message) { dispatch(from, message); }, envelope);
}

void TransferManager::handle_channel_state(bool open) {
    auto senders = senders_.snapshot();
    LOG_INFO("Relay connection {} for {} ({} senders)", open ? "restored" : "lost", client_->identity(),
             senders.size());

    for (auto& sender : senders) {
        if (open) {
            sender->on_channel_restored();
        } else {
            sender->on_channel_lost();
        }
    }
}

void TransferManager::dispatch(const network::PeerId& from, const network::TransferRequest& request) {
    if (receivers_.contains(request.transfer_id)) {
        LOG_DEBUG("Duplicate request for {} from {}", request.transfer_id, from);
        return;
    }

    auto session = std::make_shared<ReceiverSession>(request, from, options_.receiver, *client_, executor_);
    session->set_event_handler([this](const TransferEvent& event) {
        notify_status(event);
    });
    session->set_payload_handler([this](const TransferDescriptor& descriptor, std::vector<std::uint8_t> payload) {
        PayloadHandler handler;
        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            handler = payload_handler_;
        }
        if (handler) {
            handler(descriptor.transfer_id, descriptor.peer, descriptor.file_name, std::move(payload));
        }
    });

    if (!receivers_.insert(request.transfer_id, session)) {
        return;
    }

    LOG_INFO("Incoming transfer {} from {}: {} ({} bytes)", request.transfer_id, from, request.file_name,
             request.total_length);
    session->begin(*decider_);
}

void TransferManager::dispatch(const network::PeerId& from, const network::TransferResponse& response) {
    if (auto sender = sender_for(from, response.transfer_id)) {
        sender->handle_response(response);
    }
}

void TransferManager::dispatch(const network::PeerId& from, const network::ChunkEnvelope& chunk) {
    if (auto receiver = receiver_for(from, chunk.transfer_id)) {
        receiver->handle_chunk(chunk);
    }
}

void TransferManager::dispatch(const network::PeerId& from, const network::ChunkAck& ack) {
    if (auto sender = sender_for(from, ack.transfer_id)) {
        sender->handle_ack(ack);
    }
}

void TransferManager::dispatch(const network::PeerId& from, const network::TransferConfirmation& confirmation) {
    if (auto sender = sender_for(from, confirmation.transfer_id)) {
        sender->handle_confirmation(confirmation);
    }
}

void TransferManager::dispatch(const network::PeerId& from, const network::StatusQuery& query) {
    if (auto receiver = receiver_for(from, query.transfer_id)) {
        receiver->handle_status_query(query);
    }
}

void TransferManager::dispatch(const network::PeerId& from, const network::StatusResponse& response) {
    if (auto sender = sender_for(from, response.transfer_id)) {
        sender->handle_status_response(response);
    }
}

void TransferManager::dispatch(const network::PeerId& from, const network::TransferCancel& cancel) {
    if (auto sender = senders_.find(cancel.transfer_id); sender && sender->descriptor().peer == from) {
        sender->handle_cancel();
        return;
    }
    if (auto receiver = receivers_.find(cancel.transfer_id); receiver && receiver->descriptor().peer == from) {
        receiver->handle_cancel();
        return;
    }
    LOG_DEBUG("Cancel for unknown transfer {} from {}", cancel.transfer_id, from);
}

std::shared_ptr<SenderSession> TransferManager::sender_for(const network::PeerId& from,
                                                           const std::string& transfer_id) const {
    auto sender = senders_.find(transfer_id);
    if (!sender) {
        LOG_DEBUG("No sender for transfer {} (from {})", transfer_id, from);
        return nullptr;
    }
    if (sender->descriptor().peer != from) {
        LOG_WARN("Dropping message for {} from {}, expected {}", transfer_id, from, sender->descriptor().peer);
        return nullptr;
    }
    return sender;
}

std::shared_ptr<ReceiverSession> TransferManager::receiver_for(const network::PeerId& from,
                                                               const std::string& transfer_id) const {
    auto receiver = receivers_.find(transfer_id);
    if (!receiver) {
        LOG_DEBUG("No receiver for transfer {} (from {})", transfer_id, from);
        return nullptr;
    }
    if (receiver->descriptor().peer != from) {
        LOG_WARN("Dropping message for {} from {}, expected {}", transfer_id, from, receiver->descriptor().peer);
        return nullptr;
    }
    return receiver;
}

void TransferManager::notify_status(const TransferEvent& event) {
    StatusHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = status_handler_;
    }
    if (handler) {
        handler(event);
    }
}

void TransferManager::maintenance_loop() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(maintenance_mutex_);
            maintenance_cv_.wait_for(lock, options_.maintenance_interval, [this] { return !running_; });
        }
        if (!running_) {
            break;
        }

        auto now = ReceiverSession::Clock::now();
        for (auto& receiver : receivers_.snapshot()) {
            receiver->check_idle(now);
        }
        purge_expired(now);
    }
}

} // namespace chunkrelay::transfer
