#include "chunkrelay/crypto/hash.hpp"
#include "chunkrelay/crypto/random.hpp"
#include "chunkrelay/core/logger.hpp"
#include <sodium.h>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace chunkrelay::crypto {

static_assert(crypto_hash_sha256_BYTES == SHA256_HASH_SIZE);

struct Sha256Hasher::Impl {
    crypto_hash_sha256_state state;
};

Sha256Hasher::Sha256Hasher()
    : impl_(std::make_unique<Impl>())
    , initialized_(false) {
}

Sha256Hasher::~Sha256Hasher() = default;

CryptoResult Sha256Hasher::initialize() {
    if (!SecureRandom::initialize()) {
        return CryptoResult(CryptoError::NOT_INITIALIZED, "libsodium unavailable");
    }

    if (crypto_hash_sha256_init(&impl_->state) != 0) {
        return CryptoResult(CryptoError::HASH_FAILED, "Failed to initialize SHA-256 hasher");
    }

    initialized_ = true;
    return CryptoResult();
}

CryptoResult Sha256Hasher::update(std::span<const std::uint8_t> data) {
    if (!initialized_) {
        return CryptoResult(CryptoError::NOT_INITIALIZED, "Hasher not initialized");
    }

    if (crypto_hash_sha256_update(&impl_->state, data.data(), data.size()) != 0) {
        return CryptoResult(CryptoError::HASH_FAILED, "Failed to update hash");
    }

    return CryptoResult();
}

CryptoResult Sha256Hasher::finalize(std::span<std::uint8_t> output) {
    if (!initialized_) {
        return CryptoResult(CryptoError::NOT_INITIALIZED, "Hasher not initialized");
    }

    if (output.size() < SHA256_HASH_SIZE) {
        return CryptoResult(CryptoError::BUFFER_TOO_SMALL, "Output buffer too small");
    }

    if (crypto_hash_sha256_final(&impl_->state, output.data()) != 0) {
        return CryptoResult(CryptoError::HASH_FAILED, "Failed to finalize hash");
    }

    initialized_ = false; // Hasher is consumed
    return CryptoResult();
}

Sha256Hash Sha256Hasher::finalize() {
    Sha256Hash result;
    auto crypto_result = finalize(std::span(result));
    if (!crypto_result.success()) {
        throw std::runtime_error("Failed to finalize hash: " + crypto_result.message);
    }
    return result;
}

Sha256Hash Sha256Hasher::hash(std::span<const std::uint8_t> data) {
    if (!SecureRandom::initialize()) {
        throw std::runtime_error("libsodium unavailable");
    }

    Sha256Hash result;
    crypto_hash_sha256(result.data(), data.data(), data.size());
    return result;
}

CryptoResult Sha256Hasher::hash_file(const std::filesystem::path& file_path, Sha256Hash& output) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return CryptoResult(CryptoError::HASH_FAILED, "Cannot open file for hashing");
    }

    Sha256Hasher hasher;
    auto result = hasher.initialize();
    if (!result.success()) {
        return result;
    }

    constexpr size_t buffer_size = 65536;
    std::vector<std::uint8_t> buffer(buffer_size);

    while (file.good()) {
        file.read(reinterpret_cast<char*>(buffer.data()), buffer_size);
        size_t bytes_read = static_cast<size_t>(file.gcount());

        if (bytes_read > 0) {
            result = hasher.update(std::span(buffer.data(), bytes_read));
            if (!result.success()) {
                return result;
            }
        }
    }

    return hasher.finalize(std::span(output));
}

namespace hash_utils {

std::string hash_to_hex(const Sha256Hash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : hash) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

std::optional<Sha256Hash> hash_from_hex(const std::string& hex_string) {
    if (hex_string.length() != SHA256_HEX_SIZE) {
        return std::nullopt;
    }

    Sha256Hash hash;
    for (size_t i = 0; i < SHA256_HASH_SIZE; ++i) {
        std::string byte_str = hex_string.substr(i * 2, 2);
        if (!std::isxdigit(static_cast<unsigned char>(byte_str[0])) ||
            !std::isxdigit(static_cast<unsigned char>(byte_str[1]))) {
            return std::nullopt;
        }
        hash[i] = static_cast<std::uint8_t>(std::stoul(byte_str, nullptr, 16));
    }

    return hash;
}

std::string digest_hex(std::span<const std::uint8_t> data) {
    return hash_to_hex(Sha256Hasher::hash(data));
}

bool verify_digest(std::span<const std::uint8_t> data, const std::string& expected_hex) {
    auto expected = hash_from_hex(expected_hex);
    if (!expected) {
        LOG_WARN("Malformed digest '{}'", expected_hex);
        return false;
    }
    return Sha256Hasher::hash(data) == *expected;
}

}

}
