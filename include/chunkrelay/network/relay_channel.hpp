#pragma once

#include "chunkrelay/network/protocol.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <vector>

namespace chunkrelay::network {

// One peer's connection to the relay, as seen from the relay side.
class PeerChannel {
public:
    using DeliveryHandler = std::function<void(const PeerId& from, std::vector<std::uint8_t> frame)>;
    using StateHandler = std::function<void(bool open)>;

    virtual ~PeerChannel() = default;

    // Queues one frame for delivery. Returns false if the channel cannot take it.
    virtual bool write(const PeerId& from, std::vector<std::uint8_t> frame) = 0;
    virtual bool is_open() const = 0;
    virtual std::size_t buffered_amount() const = 0;

    virtual void set_delivery_handler(DeliveryHandler handler) = 0;
    virtual void set_state_handler(StateHandler handler) = 0;
};

// In-process channel. Frames are delivered on a strand so a handler never
// runs concurrently with another delivery on the same channel, and never
// re-enters the writer.
class LocalPeerChannel : public PeerChannel, public std::enable_shared_from_this<LocalPeerChannel> {
public:
    explicit LocalPeerChannel(boost::asio::any_io_executor executor);
    ~LocalPeerChannel() override;

    bool write(const PeerId& from, std::vector<std::uint8_t> frame) override;
    bool is_open() const override { return open_.load(); }
    std::size_t buffered_amount() const override { return buffered_.load(); }

    void set_delivery_handler(DeliveryHandler handler) override;
    void set_state_handler(StateHandler handler) override;

    // Simulated relay outage; state handlers observe the change on the strand.
    void close();
    void reopen();

    std::uint64_t frames_delivered() const { return frames_delivered_.load(); }

private:
    void notify_state(bool open);

    boost::asio::strand<boost::asio::any_io_executor> strand_;
    std::atomic<bool> open_;
    std::atomic<std::size_t> buffered_;
    std::atomic<std::uint64_t> frames_delivered_;

    mutable std::mutex handler_mutex_;
    DeliveryHandler delivery_handler_;
    StateHandler state_handler_;
};

// Local channel that silently discards the frames its policy selects, the
// way a lossy relay would. The writer still sees a successful write.
class LossyPeerChannel : public LocalPeerChannel {
public:
    using DropPolicy = std::function<bool(const PeerId& from, std::span<const std::uint8_t> frame)>;

    LossyPeerChannel(boost::asio::any_io_executor executor, DropPolicy policy);

    bool write(const PeerId& from, std::vector<std::uint8_t> frame) override;

    std::uint64_t frames_dropped() const { return frames_dropped_.load(); }

private:
    DropPolicy policy_;
    std::atomic<std::uint64_t> frames_dropped_;
};

}
