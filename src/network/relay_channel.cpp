#include "chunkrelay/network/relay_channel.hpp"
#include "chunkrelay/core/logger.hpp"

namespace chunkrelay::network {

LocalPeerChannel::LocalPeerChannel(boost::asio::any_io_executor executor)
    : strand_(boost::asio::make_strand(executor))
    , open_(true)
    , buffered_(0)
    , frames_delivered_(0) {
}

LocalPeerChannel::~LocalPeerChannel() {
    LOG_DEBUG("Local channel destroyed after {} frames", frames_delivered_.load());
}

bool LocalPeerChannel::write(const PeerId& from, std::vector<std::uint8_t> frame) {
    if (!open_.load()) {
        return false;
    }

    const auto size = frame.size();
    buffered_ += size;

    auto self = shared_from_this();
    boost::asio::post(strand_, [self, from, frame = std::move(frame), size]() mutable {
        self->buffered_ -= size;

        DeliveryHandler handler;
        {
            std::lock_guard<std::mutex> lock(self->handler_mutex_);
            handler = self->delivery_handler_;
        }

        if (handler) {
            ++self->frames_delivered_;
            handler(from, std::move(frame));
        }
    });

    return true;
}

void LocalPeerChannel::set_delivery_handler(DeliveryHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    delivery_handler_ = std::move(handler);
}

void LocalPeerChannel::set_state_handler(StateHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    state_handler_ = std::move(handler);
}

void LocalPeerChannel::close() {
    if (!open_.exchange(false)) {
        return;
    }
    LOG_INFO("Relay channel closed");
    notify_state(false);
}

void LocalPeerChannel::reopen() {
    if (open_.exchange(true)) {
        return;
    }
    LOG_INFO("Relay channel reopened");
    notify_state(true);
}

void LocalPeerChannel::notify_state(bool open) {
    auto self = shared_from_this();
    boost::asio::post(strand_, [self, open]() {
        StateHandler handler;
        {
            std::lock_guard<std::mutex> lock(self->handler_mutex_);
            handler = self->state_handler_;
        }
        if (handler) {
            handler(open);
        }
    });
}

LossyPeerChannel::LossyPeerChannel(boost::asio::any_io_executor executor, DropPolicy policy)
    : LocalPeerChannel(std::move(executor))
    , policy_(std::move(policy))
    , frames_dropped_(0) {
}

bool LossyPeerChannel::write(const PeerId& from, std::vector<std::uint8_t> frame) {
    if (!is_open()) {
        return false;
    }

    if (policy_ && policy_(from, frame)) {
        ++frames_dropped_;
        LOG_TRACE("Dropped {} byte frame from {}", frame.size(), from);
        return true;
    }

    return LocalPeerChannel::write(from, std::move(frame));
}

}
