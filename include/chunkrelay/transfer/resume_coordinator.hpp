#pragma once

#include "chunkrelay/network/protocol.hpp"
#include "chunkrelay/transfer/transfer_config.hpp"
#include "chunkrelay/transfer/transfer_types.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace chunkrelay::transfer {

// The side of a sending session the coordinator drives.
class ResumeHost {
public:
    virtual ~ResumeHost() = default;

    virtual std::uint32_t total_chunks() const = 0;

    // Sends a StatusQuery, discarding any earlier unread response.
    virtual TransferResult request_status() = 0;
    virtual std::optional<network::StatusResponse> await_status(std::chrono::milliseconds timeout) = 0;

    virtual std::vector<std::uint32_t> local_confirmed() const = 0;
    virtual void adopt_confirmed(const std::vector<std::uint32_t>& indices) = 0;

    // Resends one chunk without asking for an acknowledgment.
    virtual TransferResult retransmit(std::uint32_t index) = 0;

    virtual bool resume_aborted() const = 0;
};

struct Reconciliation {
    TransferResult query_result;
    bool authoritative = false;
    std::vector<std::uint32_t> confirmed;
    std::vector<std::uint32_t> missing;
};

class ResumeCoordinator {
public:
    ResumeCoordinator(ResumeHost& host, ResumeConfig config);

    // One status round trip. The receiver's set replaces the host's confirmed
    // set when it answers; otherwise the host's own set is used.
    Reconciliation reconcile();

    // Reconcile and retransmit until nothing is missing or max_rounds
    // retransmission passes have not been enough.
    TransferResult run();

    std::uint32_t rounds_run() const { return rounds_run_.load(); }
    std::uint64_t chunks_retransmitted() const { return chunks_retransmitted_.load(); }

private:
    TransferResult retransmit_missing(const std::vector<std::uint32_t>& missing);

    ResumeHost& host_;
    ResumeConfig config_;
    std::atomic<std::uint32_t> rounds_run_;
    std::atomic<std::uint64_t> chunks_retransmitted_;
};

} // namespace chunkrelay::transfer
