#include "chunkrelay/transfer/size_budgeter.hpp"
#include "chunkrelay/core/logger.hpp"
#include <algorithm>
#include <limits>

namespace chunkrelay::transfer {

namespace {
    constexpr std::uint64_t KiB = 1024;
    constexpr std::uint64_t MiB = 1024 * KiB;
    constexpr std::uint64_t GiB = 1024 * MiB;
}

SizeBudgeter::SizeBudgeter(SizeBudget budget)
    : budget_(budget) {
}

std::uint32_t SizeBudgeter::tier_cap(std::uint64_t payload_length) {
    if (payload_length < MiB) return static_cast<std::uint32_t>(16 * KiB);
    if (payload_length < 10 * MiB) return static_cast<std::uint32_t>(64 * KiB);
    if (payload_length < 100 * MiB) return static_cast<std::uint32_t>(256 * KiB);
    if (payload_length < GiB) return static_cast<std::uint32_t>(512 * KiB);
    return static_cast<std::uint32_t>(MiB);
}

std::uint32_t SizeBudgeter::compute_chunk_size(std::uint64_t payload_length) const {
    std::uint64_t usable = budget_.max_message_size > budget_.framing_reserve
        ? budget_.max_message_size - budget_.framing_reserve
        : 0;

    // usable / (4/3) / 1.10 in integer arithmetic
    std::uint64_t chunk = usable * ENCODING_RATIO_DEN * ENVELOPE_OVERHEAD_DEN /
                          (ENCODING_RATIO_NUM * ENVELOPE_OVERHEAD_NUM);

    chunk = std::min<std::uint64_t>(chunk, tier_cap(payload_length));
    chunk -= chunk % 3;

    return static_cast<std::uint32_t>(std::max<std::uint64_t>(chunk, 1));
}

std::uint64_t SizeBudgeter::chunk_count(std::uint64_t payload_length, std::uint32_t chunk_length) {
    if (chunk_length == 0) {
        return 0;
    }
    return (payload_length + chunk_length - 1) / chunk_length;
}

std::uint64_t SizeBudgeter::encoded_envelope_bound(std::uint32_t chunk_length) {
    std::uint64_t encoded = (static_cast<std::uint64_t>(chunk_length) + 2) / 3 * 4;
    return (encoded * ENVELOPE_OVERHEAD_NUM + ENVELOPE_OVERHEAD_DEN - 1) / ENVELOPE_OVERHEAD_DEN;
}

TransferResult SizeBudgeter::plan(std::uint64_t payload_length, ChunkPlan& plan) const {
    if (payload_length == 0) {
        return TransferResult(TransferError::InvalidMetadata, "Payload is empty");
    }

    plan.chunk_length = compute_chunk_size(payload_length);
    auto count = chunk_count(payload_length, plan.chunk_length);
    if (count > std::numeric_limits<std::uint32_t>::max()) {
        return TransferResult(TransferError::InvalidMetadata, "Payload needs more chunks than the wire can index");
    }

    plan.chunk_count = static_cast<std::uint32_t>(count);
    plan.envelope_bound = encoded_envelope_bound(plan.chunk_length);

    if (plan.envelope_bound > budget_.max_message_size && plan.chunk_length > 1) {
        LOG_ERROR("Chunk length {} exceeds message ceiling {} once encoded", plan.chunk_length,
                  budget_.max_message_size);
        return TransferResult(TransferError::ChunkTooLarge, "Encoded chunk exceeds message ceiling");
    }

    LOG_DEBUG("Planned {} chunks of {} bytes for {} byte payload", plan.chunk_count,
              plan.chunk_length, payload_length);
    return TransferResult();
}

}
