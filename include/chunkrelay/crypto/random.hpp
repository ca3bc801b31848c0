#pragma once

#include "crypto_types.hpp"
#include <atomic>
#include <cstdint>
#include <span>
#include <string>

namespace chunkrelay::crypto {

class SecureRandom {
public:
    // Idempotent and thread-safe; every other crypto entry point calls it.
    static bool initialize();

    static CryptoResult generate_bytes(std::span<std::uint8_t> output);
    static std::uint32_t generate_uniform(std::uint32_t upper_bound);
    static std::string generate_hex_id(size_t byte_count = TRANSFER_ID_BYTES);

private:
    static std::atomic<bool> initialized_;
};

}
