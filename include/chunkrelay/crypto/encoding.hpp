#pragma once

#include "crypto_types.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace chunkrelay::crypto {

// Binary-to-text codec for chunk payloads (standard base64 with padding).
namespace base64 {
    // Encoded size of `binary_length` bytes, without the trailing NUL.
    constexpr std::size_t encoded_length(std::size_t binary_length) {
        return ((binary_length + 2) / 3) * 4;
    }

    std::string encode(std::span<const std::uint8_t> data);
    CryptoResult decode(const std::string& encoded, std::vector<std::uint8_t>& output);
}

}
