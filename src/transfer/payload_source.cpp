#include "chunkrelay/transfer/payload_source.hpp"
#include "chunkrelay/crypto/hash.hpp"
#include <algorithm>
#include <stdexcept>

namespace chunkrelay::transfer {

namespace {
    constexpr std::size_t DIGEST_BLOCK_SIZE = 1024 * 1024;
}

MemoryPayloadSource::MemoryPayloadSource(std::vector<std::uint8_t> data)
    : data_(std::move(data)) {
}

std::vector<std::uint8_t> MemoryPayloadSource::read(std::uint64_t offset, std::size_t length) const {
    if (offset > data_.size()) {
        throw std::runtime_error("Read offset past end of payload");
    }

    auto available = static_cast<std::size_t>(data_.size() - offset);
    auto count = std::min(length, available);
    auto begin = data_.begin() + static_cast<std::ptrdiff_t>(offset);
    return std::vector<std::uint8_t>(begin, begin + static_cast<std::ptrdiff_t>(count));
}

FilePayloadSource::FilePayloadSource(const std::filesystem::path& path)
    : path_(path)
    , size_(0)
    , stream_(path, std::ios::binary) {

    if (!stream_.is_open()) {
        throw std::runtime_error("Cannot open " + path.string());
    }

    std::error_code ec;
    size_ = std::filesystem::file_size(path, ec);
    if (ec) {
        throw std::runtime_error("Cannot stat " + path.string() + ": " + ec.message());
    }
}

std::vector<std::uint8_t> FilePayloadSource::read(std::uint64_t offset, std::size_t length) const {
    if (offset > size_) {
        throw std::runtime_error("Read offset past end of " + path_.string());
    }

    auto count = static_cast<std::size_t>(std::min<std::uint64_t>(length, size_ - offset));
    std::vector<std::uint8_t> buffer(count);

    std::lock_guard<std::mutex> lock(mutex_);
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset));
    stream_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(count));
    if (static_cast<std::size_t>(stream_.gcount()) != count) {
        throw std::runtime_error("Short read from " + path_.string());
    }

    return buffer;
}

std::string compute_digest(const PayloadSource& source) {
    crypto::Sha256Hasher hasher;
    auto result = hasher.initialize();
    if (!result) {
        throw std::runtime_error("Digest initialization failed: " + result.message);
    }

    for (std::uint64_t offset = 0; offset < source.size(); offset += DIGEST_BLOCK_SIZE) {
        auto block = source.read(offset, DIGEST_BLOCK_SIZE);
        result = hasher.update(block);
        if (!result) {
            throw std::runtime_error("Digest update failed: " + result.message);
        }
    }

    return crypto::hash_utils::hash_to_hex(hasher.finalize());
}

} // namespace chunkrelay::transfer
