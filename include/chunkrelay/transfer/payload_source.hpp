#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace chunkrelay::transfer {

// Random-access view over the bytes being sent. Implementations must be safe
// to read from several sending workers at once.
class PayloadSource {
public:
    virtual ~PayloadSource() = default;

    virtual std::uint64_t size() const = 0;

    // Reads up to `length` bytes at `offset`. Throws std::runtime_error on I/O failure.
    virtual std::vector<std::uint8_t> read(std::uint64_t offset, std::size_t length) const = 0;
};

class MemoryPayloadSource : public PayloadSource {
public:
    explicit MemoryPayloadSource(std::vector<std::uint8_t> data);

    std::uint64_t size() const override { return data_.size(); }
    std::vector<std::uint8_t> read(std::uint64_t offset, std::size_t length) const override;

private:
    std::vector<std::uint8_t> data_;
};

class FilePayloadSource : public PayloadSource {
public:
    explicit FilePayloadSource(const std::filesystem::path& path);

    std::uint64_t size() const override { return size_; }
    std::vector<std::uint8_t> read(std::uint64_t offset, std::size_t length) const override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::uint64_t size_;
    mutable std::ifstream stream_;
    mutable std::mutex mutex_;
};

// SHA-256 hex digest over the whole source, read in blocks.
std::string compute_digest(const PayloadSource& source);

} // namespace chunkrelay::transfer
