#pragma once

#include "chunkrelay/network/protocol.hpp"
#include "chunkrelay/network/relay_client.hpp"
#include "chunkrelay/transfer/transfer_config.hpp"
#include "chunkrelay/transfer/transfer_decider.hpp"
#include "chunkrelay/transfer/transfer_types.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace chunkrelay::transfer {

// One inbound transfer: stores chunks by index, acknowledges them, then
// reassembles and verifies the payload once every index is present.
class ReceiverSession : public std::enable_shared_from_this<ReceiverSession> {
public:
    using Clock = std::chrono::steady_clock;
    using EventHandler = std::function<void(const TransferEvent&)>;
    using PayloadHandler = std::function<void(const TransferDescriptor&, std::vector<std::uint8_t>)>;

    ReceiverSession(network::TransferRequest request, network::PeerId sender, ReceiverConfig config,
                    network::MessageTransport& transport, boost::asio::any_io_executor ack_executor);

    static TransferResult validate_request(const network::TransferRequest& request);

    void set_event_handler(EventHandler handler);
    void set_payload_handler(PayloadHandler handler);

    // Validates the request and hands it to the decider; the response goes
    // out once the decision arrives.
    void begin(TransferDecider& decider);

    void handle_chunk(const network::ChunkEnvelope& chunk);
    void handle_status_query(const network::StatusQuery& query);
    void handle_cancel();

    // Local cancel; tells the sender.
    TransferResult cancel();

    // Fails the session if it has been idle past the configured timeout.
    bool check_idle(Clock::time_point now = Clock::now());

    // Whole-transfer view of held and missing indices.
    network::StatusResponse status_snapshot() const;

    // The same view split into pages that each fit one relay message.
    std::vector<network::StatusResponse> status_pages() const;

    ReceiverState get_state() const;
    bool is_terminal() const;
    TransferError get_error() const;
    const TransferDescriptor& descriptor() const { return descriptor_; }
    std::size_t received_count() const;
    // Chunk payloads still held in memory; zero once reassembly has run.
    std::size_t buffered_chunks() const;
    std::uint64_t duplicate_count() const;
    TransferStats get_stats() const;

private:
    void apply_decision(Decision decision);
    void post_ack(std::uint32_t index, bool success, std::optional<std::string> error = std::nullopt);
    void send_envelope(const network::Envelope& envelope);

    // Called with mutex_ held once every chunk is stored.
    std::optional<std::vector<std::uint8_t>> reassemble_locked();
    void discard_chunks_locked();
    bool is_held_locked(std::uint32_t index) const;

    TransferEvent make_event(TransferStatus status, TransferError error, std::string message) const;
    void emit(const TransferEvent& event);

    TransferDescriptor descriptor_;
    network::TransferRequest request_;
    ReceiverConfig config_;
    network::MessageTransport& transport_;
    boost::asio::any_io_executor ack_executor_;

    mutable std::mutex mutex_;
    ReceiverState state_;
    TransferError error_;
    // Payloads are dropped after reassembly; held_ keeps answering for them.
    std::map<std::uint32_t, std::vector<std::uint8_t>> chunks_;
    std::vector<bool> held_;
    std::uint32_t held_count_;
    std::uint64_t bytes_received_;
    std::uint64_t duplicates_;
    std::optional<network::TransferConfirmation> confirmation_;
    Clock::time_point started_at_;
    Clock::time_point last_activity_;

    std::mutex handler_mutex_;
    EventHandler event_handler_;
    PayloadHandler payload_handler_;
};

} // namespace chunkrelay::transfer
