#include "chunkrelay/network/relay_client.hpp"
#include "chunkrelay/core/logger.hpp"
#include <stdexcept>

namespace chunkrelay::network {

using transfer::TransferError;
using transfer::TransferResult;

RelayClient::RelayClient(RelayRouter& router, PeerId identity, std::shared_ptr<PeerChannel> channel)
    : router_(router)
    , identity_(std::move(identity))
    , channel_(std::move(channel))
    , messages_sent_(0)
    , messages_received_(0)
    , decode_failures_(0) {

    if (!channel_) {
        throw std::invalid_argument("Relay client needs a channel");
    }

    channel_->set_delivery_handler([this](const PeerId& from, std::vector<std::uint8_t> frame) {
        handle_frame(from, std::move(frame));
    });
    channel_->set_state_handler([this](bool open) {
        handle_state(open);
    });

    if (!router_.register_peer(identity_, channel_)) {
        channel_->set_delivery_handler(nullptr);
        channel_->set_state_handler(nullptr);
        throw std::runtime_error("Identity " + identity_ + " is already registered");
    }
}

RelayClient::~RelayClient() {
    router_.unregister_peer(identity_);
    channel_->set_delivery_handler(nullptr);
    channel_->set_state_handler(nullptr);
}

TransferResult RelayClient::send(const PeerId& to_peer, const Envelope& envelope) {
    if (!channel_->is_open()) {
        return TransferResult(TransferError::ChannelUnavailable, "Relay connection is down");
    }

    auto frame = encode_envelope(envelope);
    auto result = router_.forward(frame, identity_, to_peer);
    if (result) {
        ++messages_sent_;
        LOG_TRACE("{} -> {}: {} ({} bytes)", identity_, to_peer,
                  message_type_name(envelope_type(envelope)), frame.size());
    }
    return result;
}

std::size_t RelayClient::buffered_amount(const PeerId& to_peer) const {
    return router_.buffered_amount(to_peer);
}

void RelayClient::set_message_handler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    message_handler_ = std::move(handler);
}

void RelayClient::set_state_handler(StateHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    state_handler_ = std::move(handler);
}

void RelayClient::handle_frame(const PeerId& from, std::vector<std::uint8_t> frame) {
    Envelope envelope;
    try {
        envelope = decode_envelope(frame);
    } catch (const std::runtime_error& e) {
        ++decode_failures_;
        LOG_WARN("Dropping undecodable message from {}: {}", from, e.what());
        return;
    }

    ++messages_received_;

    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = message_handler_;
    }
    if (handler) {
        handler(from, std::move(envelope));
    }
}

void RelayClient::handle_state(bool open) {
    LOG_INFO("Relay connection for {} is {}", identity_, open ? "up" : "down");

    StateHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = state_handler_;
    }
    if (handler) {
        handler(open);
    }
}

}
