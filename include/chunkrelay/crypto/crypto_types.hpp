#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace chunkrelay::crypto {

constexpr size_t SHA256_HASH_SIZE = 32;
constexpr size_t SHA256_HEX_SIZE = SHA256_HASH_SIZE * 2;

constexpr size_t TRANSFER_ID_BYTES = 16;

using Sha256Hash = std::array<std::uint8_t, SHA256_HASH_SIZE>;

enum class CryptoError {
    SUCCESS = 0,
    NOT_INITIALIZED,
    BUFFER_TOO_SMALL,
    HASH_FAILED,
    DECODE_FAILED,
    RANDOM_GENERATION_FAILED
};

struct CryptoResult {
    CryptoError error;
    std::string message;

    CryptoResult(CryptoError err = CryptoError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    bool success() const { return error == CryptoError::SUCCESS; }
    operator bool() const { return success(); }
};

}
