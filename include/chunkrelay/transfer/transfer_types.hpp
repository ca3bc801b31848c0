#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

namespace chunkrelay::transfer {

enum class TransferError {
    Success = 0,
    InvalidMetadata,
    PeerUnreachable,
    ChunkTooLarge,
    AckTimeout,
    MaxRetriesExceeded,
    ChannelUnavailable,
    IntegrityMismatch,
    ResumeRoundsExhausted,
    MissingChunk,
    InvalidState,
    Cancelled,
    Rejected,
    Timeout,
    StorageError
};

const char* transfer_error_name(TransferError error);

struct TransferResult {
    TransferError error;
    std::string message;

    TransferResult(TransferError err = TransferError::Success, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    bool success() const { return error == TransferError::Success; }
    explicit operator bool() const { return success(); }
};

enum class TransferDirection {
    Send,
    Receive
};

enum class SenderState {
    Requesting,
    Sending,
    WaitingConfirmation,
    Paused,
    Completed,
    Failed,
    Cancelled,
    Rejected
};

enum class ReceiverState {
    AwaitingRequest,
    Receiving,
    Reassembling,
    Completed,
    Failed,
    Cancelled,
    Rejected
};

// What the caller gets told about. Retry churn never shows up here.
enum class TransferStatus {
    Active,
    Paused,
    Completed,
    Failed,
    Cancelled,
    Rejected
};

const char* to_string(TransferDirection direction);
const char* to_string(SenderState state);
const char* to_string(ReceiverState state);
const char* to_string(TransferStatus status);

bool is_terminal(SenderState state);
bool is_terminal(ReceiverState state);

// Identity of one logical transfer, shared by the sending and receiving endpoint.
struct TransferDescriptor {
    std::string transfer_id;
    TransferDirection direction = TransferDirection::Send;
    std::string peer;
    std::string file_name;
    std::string content_type;
    std::uint64_t total_length = 0;
    std::uint32_t total_chunks = 0;
    std::uint32_t chunk_length = 0;
    std::string integrity_digest;

    // Byte length of chunk `index`; the last chunk carries the remainder.
    std::uint32_t chunk_size_at(std::uint32_t index) const;
    std::uint64_t chunk_offset(std::uint32_t index) const {
        return static_cast<std::uint64_t>(index) * chunk_length;
    }
};

struct TransferEvent {
    std::string transfer_id;
    TransferDirection direction;
    std::string peer;
    std::string file_name;
    TransferStatus status;
    TransferError error = TransferError::Success;
    std::string message;
};

struct TransferStats {
    std::string transfer_id;
    TransferDirection direction;
    std::string peer;
    std::string file_name;
    std::string state;
    double progress_percentage = 0.0;
    std::uint64_t bytes_transferred = 0;
    std::uint64_t total_bytes = 0;
    std::uint32_t chunks_done = 0;
    std::uint32_t total_chunks = 0;
    std::uint64_t chunks_retransmitted = 0;
    std::uint32_t window_size = 0;
    std::chrono::milliseconds elapsed{0};
};

}
