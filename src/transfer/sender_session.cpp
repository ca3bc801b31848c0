#include "chunkrelay/transfer/sender_session.hpp"
#include "chunkrelay/core/logger.hpp"
#include "chunkrelay/crypto/encoding.hpp"
#include "chunkrelay/storage/resume_store.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace chunkrelay::transfer {

namespace {
    constexpr std::chrono::milliseconds IDLE_POLL{50};
    constexpr std::chrono::milliseconds SUPERVISOR_TICK{10};
    constexpr std::chrono::milliseconds RETRY_BACKOFF{25};

    TransferStatus status_for(SenderState state) {
        switch (state) {
            case SenderState::Completed: return TransferStatus::Completed;
            case SenderState::Failed:    return TransferStatus::Failed;
            case SenderState::Cancelled: return TransferStatus::Cancelled;
            case SenderState::Rejected:  return TransferStatus::Rejected;
            case SenderState::Paused:    return TransferStatus::Paused;
            default:                     return TransferStatus::Active;
        }
    }
}

SenderSession::SenderSession(TransferDescriptor descriptor, std::shared_ptr<PayloadSource> source,
                             network::MessageTransport& transport, const TransferOptions& options,
                             std::shared_ptr<storage::ResumeStore> store)
    : descriptor_(std::move(descriptor))
    , source_(std::move(source))
    , transport_(transport)
    , config_(options.sender)
    , resume_config_(options.resume)
    , store_(std::move(store))
    , flow_(options.flow)
    , coordinator_(*this, options.resume)
    , state_(SenderState::Requesting)
    , error_(TransferError::Success)
    , started_(false)
    , stopping_(false)
    , recovery_requested_(false)
    , resume_running_(false)
    , confirmed_(descriptor_.total_chunks, false)
    , sent_(descriptor_.total_chunks, false)
    , attempts_(descriptor_.total_chunks, 0)
    , confirmed_count_(0)
    , sent_count_(0)
    , bytes_confirmed_(0)
    , chunk_sends_(0)
    , retries_(0)
    , in_flight_(0)
    , confirmation_rounds_(0)
    , started_at_(Clock::now())
    , request_deadline_(started_at_)
    , confirmation_deadline_(started_at_)
    , last_progress_(started_at_) {

    if (!source_) {
        throw std::invalid_argument("Sender session needs a payload source");
    }
    if (descriptor_.total_chunks == 0 || descriptor_.chunk_length == 0) {
        throw std::invalid_argument("Sender session needs a non-empty chunk plan");
    }
    descriptor_.direction = TransferDirection::Send;
}

SenderSession::~SenderSession() {
    stop();
}

void SenderSession::set_event_handler(EventHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    event_handler_ = std::move(handler);
}

TransferResult SenderSession::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_) {
            return TransferResult(TransferError::InvalidState, "Session already started");
        }
        started_ = true;
        state_ = SenderState::Requesting;
        started_at_ = Clock::now();
        request_deadline_ = started_at_ + config_.request_timeout;
        last_progress_ = started_at_;
        for (std::uint32_t index = 0; index < descriptor_.total_chunks; ++index) {
            work_queue_.push_back(index);
        }
    }

    launch_threads();

    network::TransferRequest request;
    request.transfer_id = descriptor_.transfer_id;
    request.target_peer = descriptor_.peer;
    request.file_name = descriptor_.file_name;
    request.total_length = descriptor_.total_length;
    request.content_type = descriptor_.content_type;
    request.total_chunks = descriptor_.total_chunks;
    request.chunk_length = descriptor_.chunk_length;
    request.integrity_digest = descriptor_.integrity_digest;

    LOG_INFO("Requesting transfer {} of {} ({} bytes, {} x {} byte chunks) to {}", descriptor_.transfer_id,
             descriptor_.file_name, descriptor_.total_length, descriptor_.total_chunks,
             descriptor_.chunk_length, descriptor_.peer);

    auto result = transport_.send(descriptor_.peer, request);
    if (!result) {
        std::optional<TransferEvent> event;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            event = finish_locked(SenderState::Failed, result.error,
                                  "Transfer request not delivered: " + result.message);
        }
        publish(event);
    }
    return result;
}

TransferResult SenderSession::start_from_checkpoint(const std::vector<std::uint32_t>& confirmed) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_) {
            return TransferResult(TransferError::InvalidState, "Session already started");
        }
        started_ = true;
        state_ = SenderState::Paused;
        started_at_ = Clock::now();
        last_progress_ = started_at_;
        for (auto index : confirmed) {
            if (index < descriptor_.total_chunks) {
                mark_confirmed_locked(index);
            }
        }
        recovery_requested_ = true;
    }

    LOG_INFO("Resuming transfer {} from checkpoint ({} of {} chunks confirmed)", descriptor_.transfer_id,
             confirmed.size(), descriptor_.total_chunks);
    launch_threads();
    return TransferResult();
}

void SenderSession::launch_threads() {
    const auto pool_size = std::max<std::uint32_t>(1, flow_.config().max_window);
    workers_.reserve(pool_size);
    for (std::uint32_t i = 0; i < pool_size; ++i) {
        workers_.emplace_back(&SenderSession::worker_loop, this);
    }
    supervisor_ = std::thread(&SenderSession::supervisor_loop, this);
}

void SenderSession::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    if (supervisor_.joinable()) {
        supervisor_.join();
    }
}

void SenderSession::handle_response(const network::TransferResponse& response) {
    std::optional<TransferEvent> event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SenderState::Requesting) {
            LOG_DEBUG("Ignoring response for {} in state {}", descriptor_.transfer_id, to_string(state_));
            return;
        }

        if (response.accepted) {
            state_ = SenderState::Sending;
            last_progress_ = Clock::now();
            LOG_INFO("Transfer {} accepted by {}", descriptor_.transfer_id, descriptor_.peer);
        } else {
            event = finish_locked(SenderState::Rejected, TransferError::Rejected,
                                  descriptor_.peer + " declined the transfer");
        }
    }
    cv_.notify_all();
    publish(event);
}

void SenderSession::handle_ack(const network::ChunkAck& ack) {
    std::optional<TransferEvent> event;
    bool entered_waiting = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ack.chunk_index >= descriptor_.total_chunks) {
            return;
        }
        if (state_ != SenderState::Sending && state_ != SenderState::WaitingConfirmation &&
            state_ != SenderState::Paused) {
            return;
        }

        auto now = Clock::now();
        auto it = pending_.find(ack.chunk_index);

        if (ack.success) {
            if (it != pending_.end()) {
                auto rtt = std::chrono::duration_cast<std::chrono::milliseconds>(now - it->second.sent_at);
                flow_.on_ack_received(rtt, descriptor_.chunk_size_at(ack.chunk_index));
                pending_.erase(it);
            }
            mark_confirmed_locked(ack.chunk_index);
            last_progress_ = now;
            entered_waiting = enter_waiting_locked(now);
        } else {
            if (it == pending_.end()) {
                return;
            }
            pending_.erase(it);
            LOG_DEBUG("Chunk {} of {} refused: {}", ack.chunk_index, descriptor_.transfer_id,
                      ack.error.value_or("no reason"));
            flow_.on_failure();
            register_failure_locked(ack.chunk_index, TransferError::AckTimeout, event);
        }
    }
    cv_.notify_all();

    if (entered_waiting) {
        save_checkpoint();
    }
    publish(event);
}

void SenderSession::handle_confirmation(const network::TransferConfirmation& confirmation) {
    std::optional<TransferEvent> event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (transfer::is_terminal(state_)) {
            return;
        }

        if (confirmation.success) {
            event = finish_locked(SenderState::Completed, TransferError::Success,
                                  confirmation.message.empty() ? "Receiver confirmed the transfer" : confirmation.message);
        } else {
            event = finish_locked(SenderState::Failed, TransferError::IntegrityMismatch,
                                  "Receiver reported failure: " + confirmation.message);
        }
    }
    publish(event);
}

void SenderSession::handle_status_response(network::StatusResponse response) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (response.total_chunks != descriptor_.total_chunks) {
            LOG_WARN("Status for {} describes {} chunks, expected {}", descriptor_.transfer_id,
                     response.total_chunks, descriptor_.total_chunks);
            return;
        }

        if (response.range_start == 0) {
            status_pages_ = network::StatusResponse{};
            status_pages_->transfer_id = response.transfer_id;
            status_pages_->total_chunks = response.total_chunks;
        } else if (!status_pages_ || status_pages_->range_end != response.range_start) {
            LOG_DEBUG("Out of sequence status page [{}, {}) for {}", response.range_start, response.range_end,
                      descriptor_.transfer_id);
            status_pages_.reset();
            return;
        }

        auto& merged = *status_pages_;
        merged.received_chunk_indices.insert(merged.received_chunk_indices.end(),
                                             response.received_chunk_indices.begin(),
                                             response.received_chunk_indices.end());
        merged.missing_chunk_indices.insert(merged.missing_chunk_indices.end(),
                                            response.missing_chunk_indices.begin(),
                                            response.missing_chunk_indices.end());
        merged.range_end = response.range_end;
        merged.total_received = response.total_received;

        if (merged.range_end < descriptor_.total_chunks) {
            return;
        }
        status_response_ = std::move(merged);
        status_pages_.reset();
    }
    cv_.notify_all();
}

void SenderSession::handle_cancel() {
    std::optional<TransferEvent> event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        event = finish_locked(SenderState::Cancelled, TransferError::Cancelled, "Cancelled by receiver");
    }
    publish(event);
}

TransferResult SenderSession::cancel() {
    std::optional<TransferEvent> event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        event = finish_locked(SenderState::Cancelled, TransferError::Cancelled, "Cancelled locally");
    }
    if (!event) {
        return TransferResult(TransferError::InvalidState, "Transfer already finished");
    }

    auto result = transport_.send(descriptor_.peer, network::TransferCancel{descriptor_.transfer_id, descriptor_.peer});
    if (!result) {
        LOG_WARN("Cancel for {} not delivered: {}", descriptor_.transfer_id, result.message);
    }
    publish(event);
    return TransferResult();
}

void SenderSession::on_channel_lost() {
    std::optional<TransferEvent> event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        event = pause_locked("Relay connection lost");
    }
    publish(event);
}

void SenderSession::on_channel_restored() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SenderState::Paused) {
            return;
        }
        recovery_requested_ = true;
    }
    cv_.notify_all();
}

void SenderSession::worker_loop() {
    while (true) {
        std::uint32_t index = 0;
        bool require_ack = config_.require_ack;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            while (true) {
                if (stopping_ || transfer::is_terminal(state_)) {
                    return;
                }
                auto now = Clock::now();
                if (state_ == SenderState::Sending && outstanding_locked() < flow_.get_window_size()) {
                    auto next = next_index_locked(now);
                    if (next) {
                        index = *next;
                        break;
                    }
                }
                cv_.wait_until(lock, next_wake_locked(now));
            }

            ++in_flight_;
            if (require_ack) {
                pending_[index] = PendingAckRecord{index, Clock::now(), attempts_[index]};
            }
        }

        auto result = send_chunk(index, require_ack);

        std::optional<TransferEvent> event;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --in_flight_;

            if (result) {
                ++chunk_sends_;
                if (!sent_[index]) {
                    sent_[index] = true;
                    ++sent_count_;
                }
                last_progress_ = Clock::now();
                if (!require_ack) {
                    flow_.on_bytes_sent(descriptor_.chunk_size_at(index));
                }
            } else {
                pending_.erase(index);
                switch (result.error) {
                    case TransferError::ChannelUnavailable:
                        event = pause_locked(result.message);
                        break;
                    case TransferError::Cancelled:
                        break;
                    case TransferError::ChunkTooLarge:
                        event = finish_locked(SenderState::Failed, TransferError::ChunkTooLarge, result.message);
                        break;
                    default:
                        flow_.on_failure();
                        register_failure_locked(index, result.error, event);
                        break;
                }
            }
        }
        cv_.notify_all();
        publish(event);

        auto delay = flow_.get_pacing_delay();
        if (delay.count() > 0) {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, delay, [this] { return stopping_ || transfer::is_terminal(state_); });
        }
    }
}

void SenderSession::supervisor_loop() {
    while (true) {
        std::optional<TransferEvent> event;
        bool want_recovery = false;
        bool want_resume = false;
        auto now = Clock::now();
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, SUPERVISOR_TICK, [this] { return stopping_ || recovery_requested_; });
            if (stopping_ || transfer::is_terminal(state_)) {
                return;
            }

            now = Clock::now();
            switch (state_) {
                case SenderState::Requesting:
                    if (now >= request_deadline_) {
                        event = finish_locked(SenderState::Failed, TransferError::Timeout,
                                              "No response to transfer request");
                    }
                    break;

                case SenderState::Sending:
                    check_ack_timeouts_locked(now, event);
                    want_resume = !event && stall_detected_locked(now);
                    break;

                case SenderState::WaitingConfirmation:
                    if (now >= confirmation_deadline_) {
                        if (++confirmation_rounds_ > resume_config_.max_rounds) {
                            event = finish_locked(SenderState::Failed, TransferError::Timeout,
                                                  "Receiver never confirmed the transfer");
                        } else {
                            LOG_DEBUG("Confirmation for {} overdue, querying receiver", descriptor_.transfer_id);
                            want_resume = true;
                        }
                    }
                    break;

                case SenderState::Paused:
                    want_recovery = recovery_requested_;
                    break;

                default:
                    break;
            }

            if (want_resume) {
                resume_running_ = true;
            }
        }

        publish(event);
        flow_.maybe_adjust(now);

        if (want_recovery) {
            run_recovery();
        } else if (want_resume) {
            run_resume();
        }
    }
}

std::optional<std::uint32_t> SenderSession::next_index_locked(Clock::time_point now) {
    while (!retry_queue_.empty() && retry_queue_.top().due <= now) {
        auto index = retry_queue_.top().chunk_index;
        retry_queue_.pop();
        if (!confirmed_[index] && pending_.count(index) == 0) {
            return index;
        }
    }

    while (!work_queue_.empty()) {
        auto index = work_queue_.front();
        work_queue_.pop_front();
        if (!confirmed_[index] && pending_.count(index) == 0) {
            return index;
        }
    }

    return std::nullopt;
}

SenderSession::Clock::time_point SenderSession::next_wake_locked(Clock::time_point now) const {
    auto wake = now + IDLE_POLL;
    if (!retry_queue_.empty()) {
        wake = std::min(wake, retry_queue_.top().due);
    }
    return wake;
}

std::size_t SenderSession::outstanding_locked() const {
    return config_.require_ack ? pending_.size() : in_flight_;
}

TransferResult SenderSession::send_chunk(std::uint32_t index, bool require_ack) {
    auto drained = flow_.await_buffer_drain(
        [this] { return transport_.buffered_amount(descriptor_.peer); },
        [this] { return resume_aborted(); });
    if (!drained) {
        return drained;
    }

    const auto expected = descriptor_.chunk_size_at(index);
    std::vector<std::uint8_t> data;
    try {
        data = source_->read(descriptor_.chunk_offset(index), expected);
    } catch (const std::runtime_error& e) {
        LOG_ERROR("Reading chunk {} of {} failed: {}", index, descriptor_.file_name, e.what());
        return TransferResult(TransferError::StorageError, e.what());
    }

    if (data.size() != expected) {
        return TransferResult(TransferError::StorageError, "Short read for chunk " + std::to_string(index));
    }

    network::ChunkEnvelope chunk;
    chunk.transfer_id = descriptor_.transfer_id;
    chunk.peer = descriptor_.peer;
    chunk.chunk_index = index;
    chunk.encoded_payload = crypto::base64::encode(data);
    chunk.is_last = index + 1 == descriptor_.total_chunks;
    chunk.require_ack = require_ack;

    return transport_.send(descriptor_.peer, chunk);
}

void SenderSession::check_ack_timeouts_locked(Clock::time_point now, std::optional<TransferEvent>& event) {
    if (!config_.require_ack || pending_.empty()) {
        return;
    }

    const auto timeout = flow_.get_timeout();
    std::vector<std::uint32_t> expired;
    for (const auto& [index, record] : pending_) {
        if (now - record.sent_at >= timeout) {
            expired.push_back(index);
        }
    }

    std::sort(expired.begin(), expired.end());
    for (auto index : expired) {
        pending_.erase(index);
        flow_.on_failure();
        LOG_DEBUG("Ack for chunk {} of {} timed out after {} ms", index, descriptor_.transfer_id, timeout.count());
        register_failure_locked(index, TransferError::AckTimeout, event);
        if (event) {
            return;
        }
    }
}

void SenderSession::register_failure_locked(std::uint32_t index, TransferError cause,
                                            std::optional<TransferEvent>& event) {
    auto attempts = ++attempts_[index];
    if (attempts >= config_.max_chunk_retries) {
        LOG_WARN("Chunk {} of {} failed {} times ({})", index, descriptor_.transfer_id, attempts,
                 transfer_error_name(cause));
        event = finish_locked(SenderState::Failed, TransferError::MaxRetriesExceeded,
                              "Chunk " + std::to_string(index) + " failed after " + std::to_string(attempts) +
                              " attempts");
        return;
    }

    ++retries_;
    retry_queue_.push(RetryEntry{Clock::now() + RETRY_BACKOFF * attempts, index});
}

void SenderSession::mark_confirmed_locked(std::uint32_t index) {
    if (confirmed_[index]) {
        return;
    }
    confirmed_[index] = true;
    ++confirmed_count_;
    bytes_confirmed_ += descriptor_.chunk_size_at(index);
}

bool SenderSession::enter_waiting_locked(Clock::time_point now) {
    if (state_ != SenderState::Sending || confirmed_count_ < descriptor_.total_chunks) {
        return false;
    }

    state_ = SenderState::WaitingConfirmation;
    confirmation_deadline_ = now + config_.confirmation_timeout;
    work_queue_.clear();
    retry_queue_ = {};
    pending_.clear();
    LOG_INFO("All {} chunks of {} confirmed, waiting for integrity confirmation", descriptor_.total_chunks,
             descriptor_.transfer_id);
    return true;
}

bool SenderSession::stall_detected_locked(Clock::time_point now) const {
    if (resume_running_) {
        return false;
    }

    const auto threshold = static_cast<std::uint32_t>(
        std::ceil(resume_config_.trigger_ratio * static_cast<double>(descriptor_.total_chunks)));
    return sent_count_ >= threshold && now - last_progress_ >= resume_config_.stall_timeout;
}

std::optional<TransferEvent> SenderSession::finish_locked(SenderState state, TransferError error, std::string message) {
    if (transfer::is_terminal(state_)) {
        return std::nullopt;
    }

    state_ = state;
    error_ = error;
    error_message_ = message;
    work_queue_.clear();
    retry_queue_ = {};
    pending_.clear();
    cv_.notify_all();

    if (state == SenderState::Completed) {
        LOG_INFO("Transfer {} ({}) completed", descriptor_.transfer_id, descriptor_.file_name);
    } else {
        LOG_WARN("Transfer {} ({}) {}: {}", descriptor_.transfer_id, descriptor_.file_name, to_string(state), message);
    }

    return make_event(status_for(state), error, std::move(message));
}

std::optional<TransferEvent> SenderSession::pause_locked(std::string reason) {
    if (state_ != SenderState::Sending && state_ != SenderState::WaitingConfirmation) {
        return std::nullopt;
    }

    state_ = SenderState::Paused;
    pending_.clear();
    retry_queue_ = {};
    work_queue_.clear();
    cv_.notify_all();

    LOG_INFO("Transfer {} paused at {}/{} confirmed: {}", descriptor_.transfer_id, confirmed_count_,
             descriptor_.total_chunks, reason);
    return make_event(TransferStatus::Paused, TransferError::ChannelUnavailable, std::move(reason));
}

void SenderSession::run_recovery() {
    auto outcome = coordinator_.reconcile();

    std::optional<TransferEvent> event;
    bool entered_waiting = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        recovery_requested_ = false;
        if (state_ != SenderState::Paused) {
            return;
        }

        if (outcome.query_result.error == TransferError::ChannelUnavailable) {
            LOG_DEBUG("Relay still unavailable for {}, staying paused", descriptor_.transfer_id);
            return;
        }

        work_queue_.clear();
        retry_queue_ = {};
        pending_.clear();
        for (auto index : outcome.missing) {
            work_queue_.push_back(index);
            if (sent_[index]) {
                sent_[index] = false;
                --sent_count_;
            }
        }

        auto now = Clock::now();
        last_progress_ = now;
        state_ = SenderState::Sending;
        entered_waiting = enter_waiting_locked(now);

        event = make_event(TransferStatus::Active, TransferError::Success,
                           "Resumed with " + std::to_string(outcome.missing.size()) + " chunks missing");
        LOG_INFO("Transfer {} resumed: receiver holds {}, {} to resend", descriptor_.transfer_id,
                 outcome.confirmed.size(), outcome.missing.size());
    }
    cv_.notify_all();

    if (entered_waiting) {
        save_checkpoint();
    }
    publish(event);
}

void SenderSession::run_resume() {
    auto result = coordinator_.run();

    std::optional<TransferEvent> event;
    bool entered_waiting = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        resume_running_ = false;
        auto now = Clock::now();
        last_progress_ = now;

        if (transfer::is_terminal(state_)) {
            return;
        }

        switch (result.error) {
            case TransferError::Success:
                if (state_ == SenderState::WaitingConfirmation) {
                    confirmation_deadline_ = now + config_.confirmation_timeout;
                } else {
                    entered_waiting = enter_waiting_locked(now);
                }
                break;
            case TransferError::ChannelUnavailable:
                event = pause_locked(result.message);
                break;
            case TransferError::Cancelled:
                break;
            default:
                event = finish_locked(SenderState::Failed, result.error, result.message);
                break;
        }
    }
    cv_.notify_all();

    if (entered_waiting) {
        save_checkpoint();
    }
    publish(event);
}

TransferResult SenderSession::request_status() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_pages_.reset();
        status_response_.reset();
    }
    return transport_.send(descriptor_.peer, network::StatusQuery{descriptor_.transfer_id, descriptor_.peer});
}

std::optional<network::StatusResponse> SenderSession::await_status(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] {
        return status_response_.has_value() || stopping_ || transfer::is_terminal(state_);
    });

    if (!status_response_) {
        return std::nullopt;
    }

    auto response = std::move(*status_response_);
    status_response_.reset();
    return response;
}

void SenderSession::adopt_confirmed(const std::vector<std::uint32_t>& indices) {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto previous = confirmed_count_;
    std::fill(confirmed_.begin(), confirmed_.end(), false);
    confirmed_count_ = 0;
    bytes_confirmed_ = 0;

    for (auto index : indices) {
        if (index < descriptor_.total_chunks) {
            mark_confirmed_locked(index);
            pending_.erase(index);
        }
    }

    if (previous != confirmed_count_) {
        LOG_INFO("Adopted receiver view for {}: {} chunks held (local view had {})", descriptor_.transfer_id,
                 confirmed_count_, previous);
    }
}

TransferResult SenderSession::retransmit(std::uint32_t index) {
    if (resume_aborted()) {
        return TransferResult(TransferError::Cancelled, "Session finished");
    }

    auto result = send_chunk(index, false);
    if (result) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++chunk_sends_;
        if (!sent_[index]) {
            sent_[index] = true;
            ++sent_count_;
        }
    }
    return result;
}

bool SenderSession::resume_aborted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopping_ || transfer::is_terminal(state_);
}

void SenderSession::save_checkpoint() {
    if (!store_) {
        return;
    }

    storage::Checkpoint checkpoint;
    checkpoint.descriptor = descriptor_;
    checkpoint.confirmed_chunks = confirmed_indices();
    checkpoint.last_activity = std::chrono::system_clock::now();

    if (!store_->save(checkpoint)) {
        LOG_WARN("Could not checkpoint transfer {}", descriptor_.transfer_id);
    }
}

void SenderSession::remove_checkpoint() {
    if (store_) {
        store_->remove(descriptor_.transfer_id);
    }
}

TransferEvent SenderSession::make_event(TransferStatus status, TransferError error, std::string message) const {
    return TransferEvent{descriptor_.transfer_id, TransferDirection::Send, descriptor_.peer,
                         descriptor_.file_name, status, error, std::move(message)};
}

void SenderSession::publish(const std::optional<TransferEvent>& event) {
    if (!event) {
        return;
    }

    if (event->status == TransferStatus::Paused) {
        save_checkpoint();
    } else if (event->status != TransferStatus::Active) {
        remove_checkpoint();
    }

    EventHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = event_handler_;
    }
    if (handler) {
        handler(*event);
    }
}

SenderState SenderSession::get_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool SenderSession::is_terminal() const {
    return transfer::is_terminal(get_state());
}

TransferError SenderSession::get_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

std::string SenderSession::get_error_message() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_message_;
}

std::uint32_t SenderSession::confirmed_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return confirmed_count_;
}

std::uint32_t SenderSession::sent_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_count_;
}

std::uint64_t SenderSession::chunk_sends() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunk_sends_;
}

std::vector<std::uint32_t> SenderSession::confirmed_indices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::uint32_t> indices;
    indices.reserve(confirmed_count_);
    for (std::uint32_t index = 0; index < descriptor_.total_chunks; ++index) {
        if (confirmed_[index]) {
            indices.push_back(index);
        }
    }
    return indices;
}

TransferStats SenderSession::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    TransferStats stats;
    stats.transfer_id = descriptor_.transfer_id;
    stats.direction = TransferDirection::Send;
    stats.peer = descriptor_.peer;
    stats.file_name = descriptor_.file_name;
    stats.state = to_string(state_);
    stats.bytes_transferred = bytes_confirmed_;
    stats.total_bytes = descriptor_.total_length;
    stats.chunks_done = confirmed_count_;
    stats.total_chunks = descriptor_.total_chunks;
    stats.progress_percentage = 100.0 * static_cast<double>(confirmed_count_) / descriptor_.total_chunks;
    stats.chunks_retransmitted = retries_ + coordinator_.chunks_retransmitted();
    stats.window_size = flow_.get_window_size();
    stats.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started_at_);
    return stats;
}

} // namespace chunkrelay::transfer
