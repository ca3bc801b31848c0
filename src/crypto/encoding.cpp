#include "chunkrelay/crypto/encoding.hpp"
#include "chunkrelay/crypto/random.hpp"
#include <sodium.h>
#include <stdexcept>

namespace chunkrelay::crypto::base64 {

namespace {
    constexpr int VARIANT = sodium_base64_VARIANT_ORIGINAL;
}

std::string encode(std::span<const std::uint8_t> data) {
    if (!SecureRandom::initialize()) {
        throw std::runtime_error("libsodium unavailable");
    }

    if (data.empty()) {
        return "";
    }

    const size_t max_len = sodium_base64_ENCODED_LEN(data.size(), VARIANT);
    std::string encoded(max_len, '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), data.data(), data.size(), VARIANT);

    encoded.resize(encoded_length(data.size()));
    return encoded;
}

CryptoResult decode(const std::string& encoded, std::vector<std::uint8_t>& output) {
    if (!SecureRandom::initialize()) {
        return CryptoResult(CryptoError::NOT_INITIALIZED, "libsodium unavailable");
    }

    output.clear();
    if (encoded.empty()) {
        return CryptoResult();
    }

    if (encoded.size() % 4 != 0) {
        return CryptoResult(CryptoError::DECODE_FAILED, "Encoded length is not a multiple of 4");
    }

    output.resize(encoded.size() / 4 * 3);
    size_t decoded_len = 0;
    const char* end = nullptr;

    if (sodium_base642bin(output.data(), output.size(), encoded.data(), encoded.size(),
                          nullptr, &decoded_len, &end, VARIANT) != 0 ||
        end != encoded.data() + encoded.size()) {
        output.clear();
        return CryptoResult(CryptoError::DECODE_FAILED, "Malformed base64 payload");
    }

    output.resize(decoded_len);
    return CryptoResult();
}

}
