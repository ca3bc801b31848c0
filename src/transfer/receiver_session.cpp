#include "chunkrelay/transfer/receiver_session.hpp"
#include "chunkrelay/core/logger.hpp"
#include "chunkrelay/crypto/encoding.hpp"
#include "chunkrelay/crypto/hash.hpp"
#include "chunkrelay/transfer/size_budgeter.hpp"
#include <cctype>

namespace chunkrelay::transfer {

namespace {
    bool is_hex_digest(const std::string& digest) {
        if (digest.size() != crypto::SHA256_HEX_SIZE) {
            return false;
        }
        for (char c : digest) {
            if (!std::isxdigit(static_cast<unsigned char>(c))) {
                return false;
            }
        }
        return true;
    }
}

ReceiverSession::ReceiverSession(network::TransferRequest request, network::PeerId sender, ReceiverConfig config,
                                 network::MessageTransport& transport, boost::asio::any_io_executor ack_executor)
    : request_(std::move(request))
    , config_(config)
    , transport_(transport)
    , ack_executor_(std::move(ack_executor))
    , state_(ReceiverState::AwaitingRequest)
    , error_(TransferError::Success)
    , held_count_(0)
    , bytes_received_(0)
    , duplicates_(0)
    , started_at_(Clock::now())
    , last_activity_(started_at_) {

    descriptor_.transfer_id = request_.transfer_id;
    descriptor_.direction = TransferDirection::Receive;
    descriptor_.peer = std::move(sender);
    descriptor_.file_name = request_.file_name;
    descriptor_.content_type = request_.content_type;
    descriptor_.total_length = request_.total_length;
    descriptor_.total_chunks = request_.total_chunks;
    descriptor_.chunk_length = request_.chunk_length;
    descriptor_.integrity_digest = request_.integrity_digest;
}

TransferResult ReceiverSession::validate_request(const network::TransferRequest& request) {
    if (request.transfer_id.empty()) {
        return TransferResult(TransferError::InvalidMetadata, "Missing transfer id");
    }
    if (request.file_name.empty()) {
        return TransferResult(TransferError::InvalidMetadata, "Missing file name");
    }
    if (request.total_length == 0) {
        return TransferResult(TransferError::InvalidMetadata, "Declared length is zero");
    }
    if (request.chunk_length == 0) {
        return TransferResult(TransferError::InvalidMetadata, "Declared chunk length is zero");
    }
    if (SizeBudgeter::chunk_count(request.total_length, request.chunk_length) != request.total_chunks) {
        return TransferResult(TransferError::InvalidMetadata, "Chunk count does not match length");
    }
    if (!is_hex_digest(request.integrity_digest)) {
        return TransferResult(TransferError::InvalidMetadata, "Integrity digest is not SHA-256 hex");
    }
    return TransferResult();
}

void ReceiverSession::set_event_handler(EventHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    event_handler_ = std::move(handler);
}

void ReceiverSession::set_payload_handler(PayloadHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    payload_handler_ = std::move(handler);
}

void ReceiverSession::begin(TransferDecider& decider) {
    auto validation = validate_request(request_);
    if (!validation) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = ReceiverState::Rejected;
            error_ = TransferError::InvalidMetadata;
        }
        LOG_WARN("Rejecting transfer {} from {}: {}", descriptor_.transfer_id, descriptor_.peer, validation.message);
        send_envelope(network::TransferResponse{descriptor_.transfer_id, descriptor_.peer, false});
        emit(make_event(TransferStatus::Rejected, TransferError::InvalidMetadata, validation.message));
        return;
    }

    std::weak_ptr<ReceiverSession> weak = weak_from_this();
    decider.decide(request_, [weak](Decision decision) {
        if (auto self = weak.lock()) {
            self->apply_decision(decision);
        }
    });
}

void ReceiverSession::apply_decision(Decision decision) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ReceiverState::AwaitingRequest) {
            LOG_DEBUG("Late decision for {} ignored in state {}", descriptor_.transfer_id, to_string(state_));
            return;
        }
        if (decision == Decision::Accept) {
            state_ = ReceiverState::Receiving;
            held_.assign(descriptor_.total_chunks, false);
            last_activity_ = Clock::now();
        } else {
            state_ = ReceiverState::Rejected;
            error_ = TransferError::Rejected;
        }
    }

    const bool accepted = decision == Decision::Accept;
    send_envelope(network::TransferResponse{descriptor_.transfer_id, descriptor_.peer, accepted});

    if (accepted) {
        LOG_INFO("Receiving {} ({} bytes, {} chunks) from {}", descriptor_.file_name,
                 descriptor_.total_length, descriptor_.total_chunks, descriptor_.peer);
    } else {
        emit(make_event(TransferStatus::Rejected, TransferError::Rejected, "Transfer declined"));
    }
}

void ReceiverSession::handle_chunk(const network::ChunkEnvelope& chunk) {
    std::optional<std::vector<std::uint8_t>> payload;
    std::optional<TransferEvent> event;
    std::optional<network::TransferConfirmation> confirmation;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (state_ != ReceiverState::Receiving) {
            // Late duplicates after completion are still good news for the sender
            bool held = state_ == ReceiverState::Completed && is_held_locked(chunk.chunk_index);
            if (chunk.require_ack && held) {
                post_ack(chunk.chunk_index, true);
            } else if (chunk.require_ack) {
                post_ack(chunk.chunk_index, false, std::string("Not receiving (") + to_string(state_) + ")");
            }
            return;
        }

        if (chunk.chunk_index >= descriptor_.total_chunks) {
            LOG_WARN("Chunk {} out of range for {} ({} chunks)", chunk.chunk_index,
                     descriptor_.transfer_id, descriptor_.total_chunks);
            if (chunk.require_ack) {
                post_ack(chunk.chunk_index, false, "Chunk index out of range");
            }
            return;
        }

        std::vector<std::uint8_t> data;
        auto decoded = crypto::base64::decode(chunk.encoded_payload, data);
        if (!decoded) {
            LOG_WARN("Chunk {} of {} failed to decode: {}", chunk.chunk_index, descriptor_.transfer_id,
                     decoded.message);
            if (chunk.require_ack) {
                post_ack(chunk.chunk_index, false, "Undecodable payload");
            }
            return;
        }

        if (data.size() != descriptor_.chunk_size_at(chunk.chunk_index)) {
            LOG_WARN("Chunk {} of {} has {} bytes, expected {}", chunk.chunk_index, descriptor_.transfer_id,
                     data.size(), descriptor_.chunk_size_at(chunk.chunk_index));
            if (chunk.require_ack) {
                post_ack(chunk.chunk_index, false, "Unexpected chunk length");
            }
            return;
        }

        last_activity_ = Clock::now();

        if (held_[chunk.chunk_index]) {
            ++duplicates_;
            chunks_[chunk.chunk_index] = std::move(data);
            LOG_DEBUG("Duplicate chunk {} of {}", chunk.chunk_index, descriptor_.transfer_id);
        } else {
            bytes_received_ += data.size();
            chunks_.emplace(chunk.chunk_index, std::move(data));
            held_[chunk.chunk_index] = true;
            ++held_count_;
        }

        if (chunk.require_ack) {
            post_ack(chunk.chunk_index, true);
        }

        if (held_count_ == descriptor_.total_chunks) {
            payload = reassemble_locked();
            discard_chunks_locked();
            confirmation = confirmation_;
            if (payload) {
                event = make_event(TransferStatus::Completed, TransferError::Success, "Transfer complete");
            } else {
                event = make_event(TransferStatus::Failed, error_,
                                   confirmation ? confirmation->message : "Reassembly failed");
            }
        }
    }

    if (confirmation) {
        send_envelope(*confirmation);
    }

    if (payload) {
        PayloadHandler handler;
        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            handler = payload_handler_;
        }
        if (handler) {
            handler(descriptor_, std::move(*payload));
        }
    }

    if (event) {
        emit(*event);
    }
}

std::optional<std::vector<std::uint8_t>> ReceiverSession::reassemble_locked() {
    state_ = ReceiverState::Reassembling;

    std::vector<std::uint8_t> buffer;
    buffer.reserve(static_cast<std::size_t>(descriptor_.total_length));

    for (std::uint32_t index = 0; index < descriptor_.total_chunks; ++index) {
        auto it = chunks_.find(index);
        if (it == chunks_.end()) {
            LOG_ERROR("Chunk {} missing during reassembly of {}", index, descriptor_.transfer_id);
            state_ = ReceiverState::Failed;
            error_ = TransferError::MissingChunk;
            confirmation_ = network::TransferConfirmation{descriptor_.transfer_id, false,
                                                          "Missing chunk " + std::to_string(index)};
            return std::nullopt;
        }
        buffer.insert(buffer.end(), it->second.begin(), it->second.end());
        chunks_.erase(it);
    }

    if (buffer.size() != descriptor_.total_length) {
        LOG_ERROR("Reassembled {} bytes for {}, declared {}", buffer.size(), descriptor_.transfer_id,
                  descriptor_.total_length);
        state_ = ReceiverState::Failed;
        error_ = TransferError::IntegrityMismatch;
        confirmation_ = network::TransferConfirmation{descriptor_.transfer_id, false, "Length mismatch"};
        return std::nullopt;
    }

    if (!crypto::hash_utils::verify_digest(buffer, descriptor_.integrity_digest)) {
        LOG_ERROR("Integrity digest mismatch for {} ({})", descriptor_.transfer_id, descriptor_.file_name);
        state_ = ReceiverState::Failed;
        error_ = TransferError::IntegrityMismatch;
        confirmation_ = network::TransferConfirmation{descriptor_.transfer_id, false, "Integrity digest mismatch"};
        return std::nullopt;
    }

    state_ = ReceiverState::Completed;
    confirmation_ = network::TransferConfirmation{descriptor_.transfer_id, true, "Transfer verified"};
    LOG_INFO("Transfer {} ({}) verified, {} bytes", descriptor_.transfer_id, descriptor_.file_name, buffer.size());
    return buffer;
}

void ReceiverSession::handle_status_query(const network::StatusQuery& query) {
    auto pages = status_pages();

    std::optional<network::TransferConfirmation> confirmation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ReceiverState::Completed || state_ == ReceiverState::Failed) {
            confirmation = confirmation_;
        }
    }

    LOG_DEBUG("Status for {}: {}/{} chunks held, {} page(s)", query.transfer_id, pages.front().total_received,
              descriptor_.total_chunks, pages.size());
    for (const auto& page : pages) {
        send_envelope(page);
    }

    if (confirmation) {
        send_envelope(*confirmation);
    }
}

network::StatusResponse ReceiverSession::status_snapshot() const {
    network::StatusResponse response;
    response.transfer_id = descriptor_.transfer_id;
    response.total_chunks = descriptor_.total_chunks;
    response.range_end = descriptor_.total_chunks;

    std::lock_guard<std::mutex> lock(mutex_);
    for (std::uint32_t index = 0; index < descriptor_.total_chunks; ++index) {
        if (is_held_locked(index)) {
            response.received_chunk_indices.push_back(index);
        } else {
            response.missing_chunk_indices.push_back(index);
        }
    }
    response.total_received = held_count_;
    return response;
}

std::vector<network::StatusResponse> ReceiverSession::status_pages() const {
    std::vector<network::StatusResponse> pages;

    std::lock_guard<std::mutex> lock(mutex_);
    const auto total = descriptor_.total_chunks;
    std::uint32_t start = 0;
    do {
        network::StatusResponse page;
        page.transfer_id = descriptor_.transfer_id;
        page.total_chunks = total;
        page.range_start = start;
        page.range_end = total - start > network::STATUS_PAGE_CHUNKS ? start + network::STATUS_PAGE_CHUNKS : total;
        page.total_received = held_count_;
        for (auto index = page.range_start; index < page.range_end; ++index) {
            if (is_held_locked(index)) {
                page.received_chunk_indices.push_back(index);
            }
        }
        start = page.range_end;
        pages.push_back(std::move(page));
    } while (start < total);
    return pages;
}

bool ReceiverSession::is_held_locked(std::uint32_t index) const {
    return index < held_.size() && held_[index];
}

void ReceiverSession::discard_chunks_locked() {
    std::map<std::uint32_t, std::vector<std::uint8_t>>().swap(chunks_);
}

void ReceiverSession::handle_cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (transfer::is_terminal(state_)) {
            return;
        }
        state_ = ReceiverState::Cancelled;
        error_ = TransferError::Cancelled;
        discard_chunks_locked();
        held_.clear();
        held_count_ = 0;
    }

    LOG_INFO("Transfer {} cancelled by {}", descriptor_.transfer_id, descriptor_.peer);
    emit(make_event(TransferStatus::Cancelled, TransferError::Cancelled, "Cancelled by sender"));
}

TransferResult ReceiverSession::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (transfer::is_terminal(state_)) {
            return TransferResult(TransferError::InvalidState, "Transfer already finished");
        }
        state_ = ReceiverState::Cancelled;
        error_ = TransferError::Cancelled;
        discard_chunks_locked();
        held_.clear();
        held_count_ = 0;
    }

    send_envelope(network::TransferCancel{descriptor_.transfer_id, descriptor_.peer});
    emit(make_event(TransferStatus::Cancelled, TransferError::Cancelled, "Cancelled locally"));
    return TransferResult();
}

bool ReceiverSession::check_idle(Clock::time_point now) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ReceiverState::Receiving && state_ != ReceiverState::AwaitingRequest) {
            return false;
        }
        if (now - last_activity_ < config_.idle_timeout) {
            return false;
        }
        state_ = ReceiverState::Failed;
        error_ = TransferError::Timeout;
        discard_chunks_locked();
        held_.clear();
        held_count_ = 0;
    }

    LOG_WARN("Transfer {} idle for {} ms, giving up", descriptor_.transfer_id, config_.idle_timeout.count());
    emit(make_event(TransferStatus::Failed, TransferError::Timeout, "No chunks received before idle timeout"));
    return true;
}

void ReceiverSession::post_ack(std::uint32_t index, bool success, std::optional<std::string> error) {
    network::ChunkAck ack{descriptor_.transfer_id, index, success, std::move(error)};
    auto self = shared_from_this();
    boost::asio::post(ack_executor_, [self, ack = std::move(ack)]() {
        self->send_envelope(ack);
    });
}

void ReceiverSession::send_envelope(const network::Envelope& envelope) {
    auto result = transport_.send(descriptor_.peer, envelope);
    if (!result) {
        LOG_DEBUG("{} for {} not delivered: {}", network::message_type_name(network::envelope_type(envelope)),
                  descriptor_.transfer_id, result.message);
    }
}

ReceiverState ReceiverSession::get_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool ReceiverSession::is_terminal() const {
    return transfer::is_terminal(get_state());
}

TransferError ReceiverSession::get_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

std::size_t ReceiverSession::received_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_count_;
}

std::size_t ReceiverSession::buffered_chunks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

std::uint64_t ReceiverSession::duplicate_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return duplicates_;
}

TransferStats ReceiverSession::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    TransferStats stats;
    stats.transfer_id = descriptor_.transfer_id;
    stats.direction = TransferDirection::Receive;
    stats.peer = descriptor_.peer;
    stats.file_name = descriptor_.file_name;
    stats.state = to_string(state_);
    stats.bytes_transferred = bytes_received_;
    stats.total_bytes = descriptor_.total_length;
    stats.chunks_done = held_count_;
    stats.total_chunks = descriptor_.total_chunks;
    stats.progress_percentage = descriptor_.total_chunks > 0
        ? 100.0 * static_cast<double>(held_count_) / descriptor_.total_chunks
        : 0.0;
    stats.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started_at_);
    return stats;
}

TransferEvent ReceiverSession::make_event(TransferStatus status, TransferError error, std::string message) const {
    return TransferEvent{descriptor_.transfer_id, TransferDirection::Receive, descriptor_.peer,
                         descriptor_.file_name, status, error, std::move(message)};
}

void ReceiverSession::emit(const TransferEvent& event) {
    EventHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = event_handler_;
    }
    if (handler) {
        handler(event);
    }
}

} // namespace chunkrelay::transfer
