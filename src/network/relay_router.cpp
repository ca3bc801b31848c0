#include "chunkrelay/network/relay_router.hpp"
#include "chunkrelay/core/config.hpp"
#include "chunkrelay/core/logger.hpp"

namespace chunkrelay::network {

using transfer::TransferError;
using transfer::TransferResult;

RelayConfig RelayConfig::from_config(const core::Config& config) {
    RelayConfig relay;
    relay.hard_ceiling = config.get_uint64("relay.hard_ceiling", relay.hard_ceiling);
    return relay;
}

RelayRouter::RelayRouter(RelayConfig config)
    : config_(config) {
    LOG_DEBUG("Relay router created with hard ceiling {} bytes", config_.hard_ceiling);
}

RelayRouter::~RelayRouter() {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    peers_.clear();
}

bool RelayRouter::register_peer(const PeerId& peer_id, std::shared_ptr<PeerChannel> channel) {
    if (peer_id.empty() || !channel) {
        return false;
    }

    auto entry = std::make_shared<PeerEntry>();
    entry->channel = std::move(channel);

    std::lock_guard<std::mutex> lock(peers_mutex_);
    auto [it, inserted] = peers_.emplace(peer_id, entry);
    if (!inserted) {
        LOG_WARN("Peer {} already registered with the relay", peer_id);
        return false;
    }

    LOG_INFO("Peer {} registered with the relay", peer_id);
    return true;
}

void RelayRouter::unregister_peer(const PeerId& peer_id) {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    if (peers_.erase(peer_id) > 0) {
        LOG_INFO("Peer {} left the relay", peer_id);
    }
}

bool RelayRouter::is_registered(const PeerId& peer_id) const {
    return find_peer(peer_id) != nullptr;
}

std::shared_ptr<RelayRouter::PeerEntry> RelayRouter::find_peer(const PeerId& peer_id) const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    auto it = peers_.find(peer_id);
    return it != peers_.end() ? it->second : nullptr;
}

void RelayRouter::count_rejection() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.messages_rejected;
}

TransferResult RelayRouter::forward(std::span<const std::uint8_t> envelope,
                                    const PeerId& from_peer, const PeerId& to_peer) {
    if (!find_peer(from_peer)) {
        count_rejection();
        return TransferResult(TransferError::PeerUnreachable, "Unknown sender " + from_peer);
    }

    auto target = find_peer(to_peer);
    if (!target || !target->channel->is_open()) {
        count_rejection();
        LOG_DEBUG("Target {} unreachable for message from {}", to_peer, from_peer);
        return TransferResult(TransferError::PeerUnreachable, "Peer " + to_peer + " is not reachable");
    }

    if (envelope.size() > config_.hard_ceiling) {
        count_rejection();
        LOG_ERROR("Envelope of {} bytes from {} exceeds the relay ceiling of {} bytes",
                  envelope.size(), from_peer, config_.hard_ceiling);
        return TransferResult(TransferError::ChunkTooLarge, "Envelope exceeds relay ceiling");
    }

    if (!is_well_formed(envelope)) {
        count_rejection();
        LOG_WARN("Malformed envelope from {} dropped", from_peer);
        return TransferResult(TransferError::InvalidMetadata, "Malformed envelope");
    }

    bool written = false;
    {
        std::lock_guard<std::mutex> write_lock(target->write_mutex);
        written = target->channel->write(from_peer,
                                         std::vector<std::uint8_t>(envelope.begin(), envelope.end()));
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    if (!written) {
        ++stats_.delivery_failures;
        return TransferResult(TransferError::ChannelUnavailable, "Write to " + to_peer + " failed");
    }

    ++stats_.messages_forwarded;
    stats_.bytes_forwarded += envelope.size();
    return TransferResult();
}

std::size_t RelayRouter::buffered_amount(const PeerId& peer_id) const {
    auto entry = find_peer(peer_id);
    return entry ? entry->channel->buffered_amount() : 0;
}

RelayRouter::Statistics RelayRouter::get_statistics() const {
    Statistics stats;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats = stats_;
    }
    std::lock_guard<std::mutex> lock(peers_mutex_);
    stats.registered_peers = peers_.size();
    return stats;
}

}
