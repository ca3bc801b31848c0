#pragma once

#include "chunkrelay/network/protocol.hpp"
#include "chunkrelay/network/relay_channel.hpp"
#include "chunkrelay/transfer/transfer_types.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <unordered_map>

namespace chunkrelay::core {
class Config;
}

namespace chunkrelay::network {

struct RelayConfig {
    std::size_t hard_ceiling = 131072;

    static RelayConfig from_config(const core::Config& config);
};

// Forwards one envelope at a time between registered peers. Holds no
// transfer state and never retries.
class RelayRouter {
public:
    explicit RelayRouter(RelayConfig config = {});
    ~RelayRouter();

    bool register_peer(const PeerId& peer_id, std::shared_ptr<PeerChannel> channel);
    void unregister_peer(const PeerId& peer_id);
    bool is_registered(const PeerId& peer_id) const;

    transfer::TransferResult forward(std::span<const std::uint8_t> envelope,
                                     const PeerId& from_peer, const PeerId& to_peer);

    // Bytes queued on the target's channel, 0 for unknown peers.
    std::size_t buffered_amount(const PeerId& peer_id) const;

    struct Statistics {
        std::uint64_t messages_forwarded = 0;
        std::uint64_t messages_rejected = 0;
        std::uint64_t delivery_failures = 0;
        std::uint64_t bytes_forwarded = 0;
        std::size_t registered_peers = 0;
    };

    Statistics get_statistics() const;
    const RelayConfig& config() const { return config_; }

private:
    struct PeerEntry {
        std::shared_ptr<PeerChannel> channel;
        std::mutex write_mutex;
    };

    std::shared_ptr<PeerEntry> find_peer(const PeerId& peer_id) const;
    void count_rejection();

    RelayConfig config_;

    mutable std::mutex peers_mutex_;
    std::unordered_map<PeerId, std::shared_ptr<PeerEntry>> peers_;

    mutable std::mutex stats_mutex_;
    Statistics stats_;
};

}
