#include "chunkrelay/network/protocol.hpp"
#include <array>
#include <stdexcept>
#include <type_traits>

namespace chunkrelay::network {

namespace {
    constexpr std::array<std::uint32_t, 256> make_crc_table() {
        std::array<std::uint32_t, 256> table{};
        for (std::uint32_t i = 0; i < 256; ++i) {
            std::uint32_t crc = i;
            for (int bit = 0; bit < 8; ++bit) {
                crc = (crc & 1) ? (crc >> 1) ^ 0xEDB88320u : crc >> 1;
            }
            table[i] = crc;
        }
        return table;
    }

    constexpr auto CRC_TABLE = make_crc_table();

    void write_uint8(std::vector<std::uint8_t>& buffer, std::uint8_t value) {
        buffer.push_back(value);
    }

    void write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value) {
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }

    void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
        buffer.push_back((value >> 24) & 0xFF);
        buffer.push_back((value >> 16) & 0xFF);
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }

    void write_uint64(std::vector<std::uint8_t>& buffer, std::uint64_t value) {
        write_uint32(buffer, static_cast<std::uint32_t>(value >> 32));
        write_uint32(buffer, static_cast<std::uint32_t>(value & 0xFFFFFFFF));
    }

    void write_bool(std::vector<std::uint8_t>& buffer, bool value) {
        buffer.push_back(value ? 1 : 0);
    }

    void write_string(std::vector<std::uint8_t>& buffer, const std::string& str) {
        write_uint32(buffer, static_cast<std::uint32_t>(str.size()));
        buffer.insert(buffer.end(), str.begin(), str.end());
    }

    std::uint8_t read_uint8(std::span<const std::uint8_t>& data) {
        if (data.empty()) throw std::runtime_error("Insufficient data for uint8");
        std::uint8_t value = data[0];
        data = data.subspan(1);
        return value;
    }

    std::uint16_t read_uint16(std::span<const std::uint8_t>& data) {
        if (data.size() < 2) throw std::runtime_error("Insufficient data for uint16");
        std::uint16_t value = (static_cast<std::uint16_t>(data[0]) << 8) |
                             static_cast<std::uint16_t>(data[1]);
        data = data.subspan(2);
        return value;
    }

    std::uint32_t read_uint32(std::span<const std::uint8_t>& data) {
        if (data.size() < 4) throw std::runtime_error("Insufficient data for uint32");
        std::uint32_t value = (static_cast<std::uint32_t>(data[0]) << 24) |
                             (static_cast<std::uint32_t>(data[1]) << 16) |
                             (static_cast<std::uint32_t>(data[2]) << 8) |
                             static_cast<std::uint32_t>(data[3]);
        data = data.subspan(4);
        return value;
    }

    std::uint64_t read_uint64(std::span<const std::uint8_t>& data) {
        std::uint64_t high = read_uint32(data);
        std::uint64_t low = read_uint32(data);
        return (high << 32) | low;
    }

    bool read_bool(std::span<const std::uint8_t>& data) {
        auto value = read_uint8(data);
        if (value > 1) throw std::runtime_error("Invalid boolean encoding");
        return value == 1;
    }

    std::string read_string(std::span<const std::uint8_t>& data) {
        auto length = read_uint32(data);
        if (data.size() < length) throw std::runtime_error("Insufficient data for string");
        std::string str(reinterpret_cast<const char*>(data.data()), length);
        data = data.subspan(length);
        return str;
    }

    void expect_consumed(std::span<const std::uint8_t> data) {
        if (!data.empty()) {
            throw std::runtime_error("Trailing bytes after message payload");
        }
    }

    template<EnvelopePayload T>
    Envelope decode_as(std::span<const std::uint8_t> payload) {
        return T::deserialize(payload);
    }
}

std::uint32_t calculate_crc32(std::span<const std::uint8_t> data) {
    std::uint32_t crc = 0xFFFFFFFF;
    for (auto byte : data) {
        crc = CRC_TABLE[(crc ^ byte) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

MessageHeader::MessageHeader()
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , type(MessageType::TRANSFER_REQUEST)
    , flags(0)
    , payload_size(0)
    , checksum(0) {
}

MessageHeader::MessageHeader(MessageType msg_type, std::uint32_t payload_len)
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , type(msg_type)
    , flags(0)
    , payload_size(payload_len)
    , checksum(0) {
}

bool MessageHeader::is_valid() const {
    auto raw_type = static_cast<std::uint8_t>(type);
    return magic == PROTOCOL_MAGIC && version == PROTOCOL_VERSION &&
           raw_type >= static_cast<std::uint8_t>(MessageType::TRANSFER_REQUEST) &&
           raw_type <= static_cast<std::uint8_t>(MessageType::TRANSFER_CANCEL);
}

void MessageHeader::calculate_checksum(std::span<const std::uint8_t> payload) {
    checksum = calculate_crc32(payload);
}

bool MessageHeader::verify_checksum(std::span<const std::uint8_t> payload) const {
    return calculate_crc32(payload) == checksum;
}

std::vector<std::uint8_t> MessageHeader::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(MESSAGE_HEADER_SIZE);

    write_uint32(buffer, magic);
    write_uint16(buffer, version);
    write_uint8(buffer, static_cast<std::uint8_t>(type));
    write_uint8(buffer, flags);
    write_uint32(buffer, payload_size);
    write_uint32(buffer, checksum);

    return buffer;
}

MessageHeader MessageHeader::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() < MESSAGE_HEADER_SIZE) {
        throw std::runtime_error("Insufficient data for message header");
    }

    MessageHeader header;
    auto span = data;

    header.magic = read_uint32(span);
    header.version = read_uint16(span);
    header.type = static_cast<MessageType>(read_uint8(span));
    header.flags = read_uint8(span);
    header.payload_size = read_uint32(span);
    header.checksum = read_uint32(span);

    return header;
}

std::vector<std::uint8_t> TransferRequest::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, transfer_id);
    write_string(buffer, target_peer);
    write_string(buffer, file_name);
    write_uint64(buffer, total_length);
    write_string(buffer, content_type);
    write_uint32(buffer, total_chunks);
    write_uint32(buffer, chunk_length);
    write_string(buffer, integrity_digest);
    return buffer;
}

TransferRequest TransferRequest::deserialize(std::span<const std::uint8_t> data) {
    TransferRequest msg;
    auto span = data;
    msg.transfer_id = read_string(span);
    msg.target_peer = read_string(span);
    msg.file_name = read_string(span);
    msg.total_length = read_uint64(span);
    msg.content_type = read_string(span);
    msg.total_chunks = read_uint32(span);
    msg.chunk_length = read_uint32(span);
    msg.integrity_digest = read_string(span);
    expect_consumed(span);
    return msg;
}

std::vector<std::uint8_t> TransferResponse::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, transfer_id);
    write_string(buffer, sender_peer);
    write_bool(buffer, accepted);
    return buffer;
}

TransferResponse TransferResponse::deserialize(std::span<const std::uint8_t> data) {
    TransferResponse msg;
    auto span = data;
    msg.transfer_id = read_string(span);
    msg.sender_peer = read_string(span);
    msg.accepted = read_bool(span);
    expect_consumed(span);
    return msg;
}

std::vector<std::uint8_t> ChunkEnvelope::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(32 + transfer_id.size() + peer.size() + encoded_payload.size());
    write_string(buffer, transfer_id);
    write_string(buffer, peer);
    write_uint32(buffer, chunk_index);
    write_string(buffer, encoded_payload);
    write_bool(buffer, is_last);
    write_bool(buffer, require_ack);
    return buffer;
}

ChunkEnvelope ChunkEnvelope::deserialize(std::span<const std::uint8_t> data) {
    ChunkEnvelope msg;
    auto span = data;
    msg.transfer_id = read_string(span);
    msg.peer = read_string(span);
    msg.chunk_index = read_uint32(span);
    msg.encoded_payload = read_string(span);
    msg.is_last = read_bool(span);
    msg.require_ack = read_bool(span);
    expect_consumed(span);
    return msg;
}

std::vector<std::uint8_t> ChunkAck::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, transfer_id);
    write_uint32(buffer, chunk_index);
    write_bool(buffer, success);
    write_bool(buffer, error.has_value());
    if (error) {
        write_string(buffer, *error);
    }
    return buffer;
}

ChunkAck ChunkAck::deserialize(std::span<const std::uint8_t> data) {
    ChunkAck msg;
    auto span = data;
    msg.transfer_id = read_string(span);
    msg.chunk_index = read_uint32(span);
    msg.success = read_bool(span);
    if (read_bool(span)) {
        msg.error = read_string(span);
    }
    expect_consumed(span);
    return msg;
}

std::vector<std::uint8_t> TransferConfirmation::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, transfer_id);
    write_bool(buffer, success);
    write_string(buffer, message);
    return buffer;
}

TransferConfirmation TransferConfirmation::deserialize(std::span<const std::uint8_t> data) {
    TransferConfirmation msg;
    auto span = data;
    msg.transfer_id = read_string(span);
    msg.success = read_bool(span);
    msg.message = read_string(span);
    expect_consumed(span);
    return msg;
}

std::vector<std::uint8_t> StatusQuery::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, transfer_id);
    write_string(buffer, target_peer);
    return buffer;
}

StatusQuery StatusQuery::deserialize(std::span<const std::uint8_t> data) {
    StatusQuery msg;
    auto span = data;
    msg.transfer_id = read_string(span);
    msg.target_peer = read_string(span);
    expect_consumed(span);
    return msg;
}

std::vector<std::uint8_t> StatusResponse::serialize() const {
    if (range_start > range_end || range_end - range_start > STATUS_PAGE_CHUNKS) {
        throw std::runtime_error("Status page range is invalid");
    }

    const std::uint32_t span_length = range_end - range_start;
    std::vector<std::uint8_t> bitmap((span_length + 7) / 8, 0);
    for (auto index : received_chunk_indices) {
        if (index < range_start || index >= range_end) {
            throw std::runtime_error("Received index outside status page");
        }
        const auto bit = index - range_start;
        bitmap[bit / 8] |= static_cast<std::uint8_t>(0x80u >> (bit % 8));
    }

    std::vector<std::uint8_t> buffer;
    buffer.reserve(24 + transfer_id.size() + bitmap.size());
    write_string(buffer, transfer_id);
    write_uint32(buffer, total_chunks);
    write_uint32(buffer, range_start);
    write_uint32(buffer, range_end);
    write_uint32(buffer, total_received);
    write_uint32(buffer, static_cast<std::uint32_t>(bitmap.size()));
    buffer.insert(buffer.end(), bitmap.begin(), bitmap.end());
    return buffer;
}

StatusResponse StatusResponse::deserialize(std::span<const std::uint8_t> data) {
    StatusResponse msg;
    auto span = data;
    msg.transfer_id = read_string(span);
    msg.total_chunks = read_uint32(span);
    msg.range_start = read_uint32(span);
    msg.range_end = read_uint32(span);
    msg.total_received = read_uint32(span);

    if (msg.range_start > msg.range_end || msg.range_end > msg.total_chunks ||
        msg.range_end - msg.range_start > STATUS_PAGE_CHUNKS) {
        throw std::runtime_error("Invalid status page range");
    }

    const std::uint32_t span_length = msg.range_end - msg.range_start;
    auto bitmap_size = read_uint32(span);
    if (bitmap_size != (span_length + 7) / 8 || span.size() < bitmap_size) {
        throw std::runtime_error("Status bitmap does not match range");
    }
    auto bitmap = span.first(bitmap_size);
    span = span.subspan(bitmap_size);
    expect_consumed(span);

    for (std::uint32_t bit = 0; bit < span_length; ++bit) {
        const auto index = msg.range_start + bit;
        if (bitmap[bit / 8] & (0x80u >> (bit % 8))) {
            msg.received_chunk_indices.push_back(index);
        } else {
            msg.missing_chunk_indices.push_back(index);
        }
    }
    return msg;
}

std::vector<std::uint8_t> TransferCancel::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, transfer_id);
    write_string(buffer, target_peer);
    return buffer;
}

TransferCancel TransferCancel::deserialize(std::span<const std::uint8_t> data) {
    TransferCancel msg;
    auto span = data;
    msg.transfer_id = read_string(span);
    msg.target_peer = read_string(span);
    expect_consumed(span);
    return msg;
}

std::vector<std::uint8_t> encode_envelope(const Envelope& envelope) {
    return std::visit([](const auto& message) {
        auto payload = message.serialize();
        MessageHeader header(std::decay_t<decltype(message)>::TYPE,
                             static_cast<std::uint32_t>(payload.size()));
        header.calculate_checksum(payload);

        auto frame = header.serialize();
        frame.insert(frame.end(), payload.begin(), payload.end());
        return frame;
    }, envelope);
}

Envelope decode_envelope(std::span<const std::uint8_t> data) {
    auto header = MessageHeader::deserialize(data);
    if (!header.is_valid()) {
        throw std::runtime_error("Invalid message header");
    }

    auto payload = data.subspan(MESSAGE_HEADER_SIZE);
    if (payload.size() != header.payload_size) {
        throw std::runtime_error("Payload size does not match header");
    }
    if (!header.verify_checksum(payload)) {
        throw std::runtime_error("Payload checksum mismatch");
    }

    switch (header.type) {
        case MessageType::TRANSFER_REQUEST:      return decode_as<TransferRequest>(payload);
        case MessageType::TRANSFER_RESPONSE:     return decode_as<TransferResponse>(payload);
        case MessageType::CHUNK:                 return decode_as<ChunkEnvelope>(payload);
        case MessageType::CHUNK_ACK:             return decode_as<ChunkAck>(payload);
        case MessageType::TRANSFER_CONFIRMATION: return decode_as<TransferConfirmation>(payload);
        case MessageType::STATUS_QUERY:          return decode_as<StatusQuery>(payload);
        case MessageType::STATUS_RESPONSE:       return decode_as<StatusResponse>(payload);
        case MessageType::TRANSFER_CANCEL:       return decode_as<TransferCancel>(payload);
    }

    throw std::runtime_error("Unknown message type");
}

bool is_well_formed(std::span<const std::uint8_t> data) {
    if (data.size() < MESSAGE_HEADER_SIZE) {
        return false;
    }

    try {
        auto header = MessageHeader::deserialize(data);
        auto payload = data.subspan(MESSAGE_HEADER_SIZE);
        return header.is_valid() && payload.size() == header.payload_size &&
               header.verify_checksum(payload);
    } catch (const std::runtime_error&) {
        return false;
    }
}

MessageType envelope_type(const Envelope& envelope) {
    return std::visit([](const auto& message) {
        return std::decay_t<decltype(message)>::TYPE;
    }, envelope);
}

const std::string& envelope_transfer_id(const Envelope& envelope) {
    return std::visit([](const auto& message) -> const std::string& {
        return message.transfer_id;
    }, envelope);
}

const char* message_type_name(MessageType type) {
    switch (type) {
        case MessageType::TRANSFER_REQUEST:      return "TransferRequest";
        case MessageType::TRANSFER_RESPONSE:     return "TransferResponse";
        case MessageType::CHUNK:                 return "Chunk";
        case MessageType::CHUNK_ACK:             return "ChunkAck";
        case MessageType::TRANSFER_CONFIRMATION: return "TransferConfirmation";
        case MessageType::STATUS_QUERY:          return "StatusQuery";
        case MessageType::STATUS_RESPONSE:       return "StatusResponse";
        case MessageType::TRANSFER_CANCEL:       return "TransferCancel";
    }
    return "Unknown";
}

}
