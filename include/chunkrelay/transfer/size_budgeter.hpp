#pragma once

#include "chunkrelay/transfer/transfer_config.hpp"
#include "chunkrelay/transfer/transfer_types.hpp"
#include <cstdint>

namespace chunkrelay::transfer {

// base64 turns every 3 bytes into 4
constexpr std::uint64_t ENCODING_RATIO_NUM = 4;
constexpr std::uint64_t ENCODING_RATIO_DEN = 3;
// Structured-envelope framing adds 10% on top of the encoded payload
constexpr std::uint64_t ENVELOPE_OVERHEAD_NUM = 11;
constexpr std::uint64_t ENVELOPE_OVERHEAD_DEN = 10;

struct ChunkPlan {
    std::uint32_t chunk_length = 0;
    std::uint32_t chunk_count = 0;
    std::uint64_t envelope_bound = 0;
};

class SizeBudgeter {
public:
    explicit SizeBudgeter(SizeBudget budget = {});

    // Largest chunk length whose encoded envelope stays under the ceiling,
    // further capped by the payload-size tier. Always at least 1.
    std::uint32_t compute_chunk_size(std::uint64_t payload_length) const;

    TransferResult plan(std::uint64_t payload_length, ChunkPlan& plan) const;

    const SizeBudget& budget() const { return budget_; }

    static std::uint32_t tier_cap(std::uint64_t payload_length);
    static std::uint64_t chunk_count(std::uint64_t payload_length, std::uint32_t chunk_length);
    static std::uint64_t encoded_envelope_bound(std::uint32_t chunk_length);

private:
    SizeBudget budget_;
};

}
