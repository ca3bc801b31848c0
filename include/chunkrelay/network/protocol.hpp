#pragma once

#include <concepts>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace chunkrelay::network {

constexpr std::uint32_t PROTOCOL_MAGIC = 0x434B524C; // "CKRL"
constexpr std::uint16_t PROTOCOL_VERSION = 1;
constexpr std::size_t MESSAGE_HEADER_SIZE = 16;

// Chunk indices covered by one StatusResponse page (a 32 KiB bitmap).
constexpr std::uint32_t STATUS_PAGE_CHUNKS = 1u << 18;

using PeerId = std::string;

enum class MessageType : std::uint8_t {
    TRANSFER_REQUEST      = 0x01,
    TRANSFER_RESPONSE     = 0x02,
    CHUNK                 = 0x03,
    CHUNK_ACK             = 0x04,
    TRANSFER_CONFIRMATION = 0x05,
    STATUS_QUERY          = 0x06,
    STATUS_RESPONSE       = 0x07,
    TRANSFER_CANCEL       = 0x08
};

struct MessageHeader {
    std::uint32_t magic;
    std::uint16_t version;
    MessageType type;
    std::uint8_t flags;
    std::uint32_t payload_size;
    std::uint32_t checksum;         // CRC-32 of payload

    MessageHeader();
    MessageHeader(MessageType msg_type, std::uint32_t payload_len);

    bool is_valid() const;
    void calculate_checksum(std::span<const std::uint8_t> payload);
    bool verify_checksum(std::span<const std::uint8_t> payload) const;

    std::vector<std::uint8_t> serialize() const;
    static MessageHeader deserialize(std::span<const std::uint8_t> data);
};

struct TransferRequest {
    std::string transfer_id;
    PeerId target_peer;
    std::string file_name;
    std::uint64_t total_length = 0;
    std::string content_type;
    std::uint32_t total_chunks = 0;
    std::uint32_t chunk_length = 0;
    std::string integrity_digest;

    static constexpr MessageType TYPE = MessageType::TRANSFER_REQUEST;
    std::vector<std::uint8_t> serialize() const;
    static TransferRequest deserialize(std::span<const std::uint8_t> data);
};

struct TransferResponse {
    std::string transfer_id;
    PeerId sender_peer;
    bool accepted = false;

    static constexpr MessageType TYPE = MessageType::TRANSFER_RESPONSE;
    std::vector<std::uint8_t> serialize() const;
    static TransferResponse deserialize(std::span<const std::uint8_t> data);
};

struct ChunkEnvelope {
    std::string transfer_id;
    PeerId peer;
    std::uint32_t chunk_index = 0;
    std::string encoded_payload;
    bool is_last = false;
    bool require_ack = true;

    static constexpr MessageType TYPE = MessageType::CHUNK;
    std::vector<std::uint8_t> serialize() const;
    static ChunkEnvelope deserialize(std::span<const std::uint8_t> data);
};

struct ChunkAck {
    std::string transfer_id;
    std::uint32_t chunk_index = 0;
    bool success = false;
    std::optional<std::string> error;

    static constexpr MessageType TYPE = MessageType::CHUNK_ACK;
    std::vector<std::uint8_t> serialize() const;
    static ChunkAck deserialize(std::span<const std::uint8_t> data);
};

struct TransferConfirmation {
    std::string transfer_id;
    bool success = false;
    std::string message;

    static constexpr MessageType TYPE = MessageType::TRANSFER_CONFIRMATION;
    std::vector<std::uint8_t> serialize() const;
    static TransferConfirmation deserialize(std::span<const std::uint8_t> data);
};

struct StatusQuery {
    std::string transfer_id;
    PeerId target_peer;

    static constexpr MessageType TYPE = MessageType::STATUS_QUERY;
    std::vector<std::uint8_t> serialize() const;
    static StatusQuery deserialize(std::span<const std::uint8_t> data);
};

// One page of the receiver's view, covering [range_start, range_end). The
// received set travels as a bitmap; the missing list is its complement within
// the range and is rebuilt on decode.
struct StatusResponse {
    std::string transfer_id;
    std::uint32_t total_chunks = 0;
    std::uint32_t range_start = 0;
    std::uint32_t range_end = 0;
    std::vector<std::uint32_t> received_chunk_indices;
    std::vector<std::uint32_t> missing_chunk_indices;
    std::uint32_t total_received = 0;

    static constexpr MessageType TYPE = MessageType::STATUS_RESPONSE;
    std::vector<std::uint8_t> serialize() const;
    static StatusResponse deserialize(std::span<const std::uint8_t> data);
};

struct TransferCancel {
    std::string transfer_id;
    PeerId target_peer;

    static constexpr MessageType TYPE = MessageType::TRANSFER_CANCEL;
    std::vector<std::uint8_t> serialize() const;
    static TransferCancel deserialize(std::span<const std::uint8_t> data);
};

using Envelope = std::variant<TransferRequest, TransferResponse, ChunkEnvelope, ChunkAck,
                              TransferConfirmation, StatusQuery, StatusResponse, TransferCancel>;

template<typename T>
concept EnvelopePayload = requires(const T& t) {
    { t.serialize() } -> std::convertible_to<std::vector<std::uint8_t>>;
    { T::deserialize(std::declval<std::span<const std::uint8_t>>()) } -> std::same_as<T>;
    { T::TYPE } -> std::convertible_to<MessageType>;
};

// Header + payload. Throws std::runtime_error on any malformed input.
std::vector<std::uint8_t> encode_envelope(const Envelope& envelope);
Envelope decode_envelope(std::span<const std::uint8_t> data);

// Cheap shape check used by the router without building an Envelope.
bool is_well_formed(std::span<const std::uint8_t> data);

MessageType envelope_type(const Envelope& envelope);
const std::string& envelope_transfer_id(const Envelope& envelope);
const char* message_type_name(MessageType type);

std::uint32_t calculate_crc32(std::span<const std::uint8_t> data);

}

static_assert(chunkrelay::network::EnvelopePayload<chunkrelay::network::TransferRequest>);
static_assert(chunkrelay::network::EnvelopePayload<chunkrelay::network::ChunkEnvelope>);
static_assert(chunkrelay::network::EnvelopePayload<chunkrelay::network::StatusResponse>);
