#pragma once

#include "chunkrelay/network/protocol.hpp"
#include "chunkrelay/network/relay_channel.hpp"
#include "chunkrelay/network/relay_router.hpp"
#include "chunkrelay/transfer/transfer_types.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

namespace chunkrelay::network {

// Send primitive the transfer sessions talk to.
class MessageTransport {
public:
    virtual ~MessageTransport() = default;

    virtual transfer::TransferResult send(const PeerId& to_peer, const Envelope& envelope) = 0;
    virtual std::size_t buffered_amount(const PeerId& to_peer) const = 0;
};

// One addressable identity on the relay.
class RelayClient : public MessageTransport {
public:
    using MessageHandler = std::function<void(const PeerId& from, Envelope envelope)>;
    using StateHandler = std::function<void(bool open)>;

    RelayClient(RelayRouter& router, PeerId identity, std::shared_ptr<PeerChannel> channel);
    ~RelayClient() override;

    RelayClient(const RelayClient&) = delete;
    RelayClient& operator=(const RelayClient&) = delete;

    transfer::TransferResult send(const PeerId& to_peer, const Envelope& envelope) override;
    std::size_t buffered_amount(const PeerId& to_peer) const override;

    void set_message_handler(MessageHandler handler);
    void set_state_handler(StateHandler handler);

    const PeerId& identity() const { return identity_; }
    bool is_connected() const { return channel_->is_open(); }

    std::uint64_t messages_sent() const { return messages_sent_.load(); }
    std::uint64_t messages_received() const { return messages_received_.load(); }
    std::uint64_t decode_failures() const { return decode_failures_.load(); }

private:
    void handle_frame(const PeerId& from, std::vector<std::uint8_t> frame);
    void handle_state(bool open);

    RelayRouter& router_;
    PeerId identity_;
    std::shared_ptr<PeerChannel> channel_;

    mutable std::mutex handler_mutex_;
    MessageHandler message_handler_;
    StateHandler state_handler_;

    std::atomic<std::uint64_t> messages_sent_;
    std::atomic<std::uint64_t> messages_received_;
    std::atomic<std::uint64_t> decode_failures_;
};

}
