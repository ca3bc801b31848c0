#pragma once

#include "chunkrelay/transfer/transfer_types.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace chunkrelay::storage {

// What a sender needs to pick an interrupted transfer back up.
struct Checkpoint {
    transfer::TransferDescriptor descriptor;
    std::vector<std::uint32_t> confirmed_chunks;
    std::chrono::system_clock::time_point last_activity;
};

class ResumeStore {
public:
    explicit ResumeStore(const std::filesystem::path& database_path);
    ~ResumeStore();

    ResumeStore(const ResumeStore&) = delete;
    ResumeStore& operator=(const ResumeStore&) = delete;

    bool initialize();

    bool save(const Checkpoint& checkpoint);
    std::optional<Checkpoint> load(const std::string& transfer_id);
    bool remove(const std::string& transfer_id);
    std::vector<Checkpoint> list();

    // Drops checkpoints untouched for longer than max_age; returns how many.
    std::size_t cleanup_older_than(std::chrono::hours max_age = std::chrono::hours(72));
    std::size_t count() const;

    const std::filesystem::path& path() const { return db_path_; }

private:
    bool create_tables();
    Checkpoint read_row(sqlite3_stmt* stmt) const;

    static std::vector<std::uint8_t> serialize_chunks(const std::vector<std::uint32_t>& chunks);
    static std::vector<std::uint32_t> deserialize_chunks(const std::uint8_t* data, std::size_t size);

    std::filesystem::path db_path_;
    sqlite3* db_;
    mutable std::mutex mutex_;
};

} // namespace chunkrelay::storage
