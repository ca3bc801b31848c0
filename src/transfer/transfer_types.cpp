#include "chunkrelay/transfer/transfer_types.hpp"

namespace chunkrelay::transfer {

const char* transfer_error_name(TransferError error) {
    switch (error) {
        case TransferError::Success:               return "Success";
        case TransferError::InvalidMetadata:       return "InvalidMetadata";
        case TransferError::PeerUnreachable:       return "PeerUnreachable";
        case TransferError::ChunkTooLarge:         return "ChunkTooLarge";
        case TransferError::AckTimeout:            return "AckTimeout";
        case TransferError::MaxRetriesExceeded:    return "MaxRetriesExceeded";
        case TransferError::ChannelUnavailable:    return "ChannelUnavailable";
        case TransferError::IntegrityMismatch:     return "IntegrityMismatch";
        case TransferError::ResumeRoundsExhausted: return "ResumeRoundsExhausted";
        case TransferError::MissingChunk:          return "MissingChunk";
        case TransferError::InvalidState:          return "InvalidState";
        case TransferError::Cancelled:             return "Cancelled";
        case TransferError::Rejected:              return "Rejected";
        case TransferError::Timeout:               return "Timeout";
        case TransferError::StorageError:          return "StorageError";
    }
    return "Unknown";
}

const char* to_string(TransferDirection direction) {
    return direction == TransferDirection::Send ? "send" : "receive";
}

const char* to_string(SenderState state) {
    switch (state) {
        case SenderState::Requesting:          return "Requesting";
        case SenderState::Sending:             return "Sending";
        case SenderState::WaitingConfirmation: return "WaitingConfirmation";
        case SenderState::Paused:              return "Paused";
        case SenderState::Completed:           return "Completed";
        case SenderState::Failed:              return "Failed";
        case SenderState::Cancelled:           return "Cancelled";
        case SenderState::Rejected:            return "Rejected";
    }
    return "Unknown";
}

const char* to_string(ReceiverState state) {
    switch (state) {
        case ReceiverState::AwaitingRequest: return "AwaitingRequest";
        case ReceiverState::Receiving:       return "Receiving";
        case ReceiverState::Reassembling:    return "Reassembling";
        case ReceiverState::Completed:       return "Completed";
        case ReceiverState::Failed:          return "Failed";
        case ReceiverState::Cancelled:       return "Cancelled";
        case ReceiverState::Rejected:        return "Rejected";
    }
    return "Unknown";
}

const char* to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::Active:    return "active";
        case TransferStatus::Paused:    return "paused";
        case TransferStatus::Completed: return "completed";
        case TransferStatus::Failed:    return "failed";
        case TransferStatus::Cancelled: return "cancelled";
        case TransferStatus::Rejected:  return "rejected";
    }
    return "unknown";
}

bool is_terminal(SenderState state) {
    return state == SenderState::Completed || state == SenderState::Failed ||
           state == SenderState::Cancelled || state == SenderState::Rejected;
}

bool is_terminal(ReceiverState state) {
    return state == ReceiverState::Completed || state == ReceiverState::Failed ||
           state == ReceiverState::Cancelled || state == ReceiverState::Rejected;
}

std::uint32_t TransferDescriptor::chunk_size_at(std::uint32_t index) const {
    if (total_chunks == 0 || index >= total_chunks) {
        return 0;
    }
    if (index + 1 < total_chunks) {
        return chunk_length;
    }
    return static_cast<std::uint32_t>(total_length - chunk_offset(index));
}

}
