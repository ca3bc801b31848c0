#include "chunkrelay/crypto/random.hpp"
#include "chunkrelay/core/logger.hpp"
#include <sodium.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace chunkrelay::crypto {

std::atomic<bool> SecureRandom::initialized_{false};

bool SecureRandom::initialize() {
    if (initialized_.load()) {
        return true;
    }

    // sodium_init() is itself safe to call concurrently and more than once
    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }

    initialized_.store(true);
    return true;
}

CryptoResult SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    if (!initialize()) {
        return CryptoResult(CryptoError::RANDOM_GENERATION_FAILED, "Random generator not initialized");
    }

    if (output.empty()) {
        return CryptoResult(CryptoError::BUFFER_TOO_SMALL, "Output buffer is empty");
    }

    randombytes_buf(output.data(), output.size());
    return CryptoResult();
}

std::uint32_t SecureRandom::generate_uniform(std::uint32_t upper_bound) {
    if (!initialize()) {
        throw std::runtime_error("Random generator not initialized");
    }
    return randombytes_uniform(upper_bound);
}

std::string SecureRandom::generate_hex_id(size_t byte_count) {
    std::vector<std::uint8_t> bytes(byte_count);
    auto result = generate_bytes(bytes);
    if (!result.success()) {
        throw std::runtime_error("Failed to generate id: " + result.message);
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : bytes) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

}
