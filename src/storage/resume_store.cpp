#include "chunkrelay/storage/resume_store.hpp"
#include "chunkrelay/core/logger.hpp"
#include <sqlite3.h>

namespace chunkrelay::storage {

namespace {
    constexpr const char* SELECT_COLUMNS =
        "SELECT transfer_id, peer, file_name, content_type, total_length, total_chunks, "
        "chunk_length, integrity_digest, confirmed_chunks, last_activity FROM checkpoints";

    std::string column_text(sqlite3_stmt* stmt, int column) {
        auto text = sqlite3_column_text(stmt, column);
        return text ? reinterpret_cast<const char*>(text) : "";
    }

    std::int64_t to_unix_seconds(std::chrono::system_clock::time_point time) {
        return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
    }
}

ResumeStore::ResumeStore(const std::filesystem::path& database_path)
    : db_path_(database_path), db_(nullptr) {
}

ResumeStore::~ResumeStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool ResumeStore::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        return true;
    }

    int result = sqlite3_open(db_path_.string().c_str(), &db_);
    if (result != SQLITE_OK) {
        LOG_ERROR("Cannot open resume store {}: {}", db_path_.string(), db_ ? sqlite3_errmsg(db_) : "out of memory");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    return create_tables();
}

bool ResumeStore::create_tables() {
    const char* create_checkpoints_table = R"(
        CREATE TABLE IF NOT EXISTS checkpoints (
            transfer_id TEXT PRIMARY KEY,
            peer TEXT NOT NULL,
            file_name TEXT NOT NULL,
            content_type TEXT,
            total_length INTEGER NOT NULL,
            total_chunks INTEGER NOT NULL,
            chunk_length INTEGER NOT NULL,
            integrity_digest TEXT NOT NULL,
            confirmed_chunks BLOB,
            last_activity INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_checkpoints_activity ON checkpoints(last_activity);
    )";

    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, create_checkpoints_table, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to create resume tables: {}", error_msg ? error_msg : "unknown error");
        sqlite3_free(error_msg);
        return false;
    }
    return true;
}

bool ResumeStore::save(const Checkpoint& checkpoint) {
    const char* upsert_sql = R"(
        INSERT OR REPLACE INTO checkpoints
        (transfer_id, peer, file_name, content_type, total_length, total_chunks,
         chunk_length, integrity_digest, confirmed_chunks, last_activity)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )";

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }

    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, upsert_sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to prepare checkpoint insert: {}", sqlite3_errmsg(db_));
        return false;
    }

    const auto& d = checkpoint.descriptor;
    auto blob = serialize_chunks(checkpoint.confirmed_chunks);

    sqlite3_bind_text(stmt, 1, d.transfer_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, d.peer.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, d.file_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, d.content_type.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(d.total_length));
    sqlite3_bind_int64(stmt, 6, d.total_chunks);
    sqlite3_bind_int64(stmt, 7, d.chunk_length);
    sqlite3_bind_text(stmt, 8, d.integrity_digest.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 9, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 10, to_unix_seconds(checkpoint.last_activity));

    result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (result != SQLITE_DONE) {
        LOG_ERROR("Failed to save checkpoint for {}: {}", d.transfer_id, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::optional<Checkpoint> ResumeStore::load(const std::string& transfer_id) {
    std::string select_sql = std::string(SELECT_COLUMNS) + " WHERE transfer_id = ?;";

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return std::nullopt;
    }

    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, select_sql.c_str(), -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, transfer_id.c_str(), -1, SQLITE_TRANSIENT);
    result = sqlite3_step(stmt);

    if (result != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return std::nullopt;
    }

    auto checkpoint = read_row(stmt);
    sqlite3_finalize(stmt);
    return checkpoint;
}

bool ResumeStore::remove(const std::string& transfer_id) {
    const char* delete_sql = "DELETE FROM checkpoints WHERE transfer_id = ?;";

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }

    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, delete_sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, transfer_id.c_str(), -1, SQLITE_TRANSIENT);
    result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    return result == SQLITE_DONE && sqlite3_changes(db_) > 0;
}

std::vector<Checkpoint> ResumeStore::list() {
    std::vector<Checkpoint> checkpoints;
    std::string select_sql = std::string(SELECT_COLUMNS) + " ORDER BY last_activity DESC;";

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return checkpoints;
    }

    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, select_sql.c_str(), -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return checkpoints;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        checkpoints.push_back(read_row(stmt));
    }

    sqlite3_finalize(stmt);
    return checkpoints;
}

std::size_t ResumeStore::cleanup_older_than(std::chrono::hours max_age) {
    const char* delete_sql = "DELETE FROM checkpoints WHERE last_activity < ?;";
    auto cutoff = to_unix_seconds(std::chrono::system_clock::now() - max_age);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return 0;
    }

    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, delete_sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return 0;
    }

    sqlite3_bind_int64(stmt, 1, cutoff);
    result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (result != SQLITE_DONE) {
        LOG_WARN("Checkpoint cleanup failed: {}", sqlite3_errmsg(db_));
        return 0;
    }

    auto removed = static_cast<std::size_t>(sqlite3_changes(db_));
    if (removed > 0) {
        LOG_INFO("Removed {} stale checkpoints", removed);
    }
    return removed;
}

std::size_t ResumeStore::count() const {
    const char* count_sql = "SELECT COUNT(*) FROM checkpoints;";

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return 0;
    }

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, count_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    std::size_t total = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return total;
}

Checkpoint ResumeStore::read_row(sqlite3_stmt* stmt) const {
    Checkpoint checkpoint;
    auto& d = checkpoint.descriptor;

    d.transfer_id = column_text(stmt, 0);
    d.direction = transfer::TransferDirection::Send;
    d.peer = column_text(stmt, 1);
    d.file_name = column_text(stmt, 2);
    d.content_type = column_text(stmt, 3);
    d.total_length = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 4));
    d.total_chunks = static_cast<std::uint32_t>(sqlite3_column_int64(stmt, 5));
    d.chunk_length = static_cast<std::uint32_t>(sqlite3_column_int64(stmt, 6));
    d.integrity_digest = column_text(stmt, 7);

    auto blob = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt, 8));
    auto blob_size = static_cast<std::size_t>(sqlite3_column_bytes(stmt, 8));
    checkpoint.confirmed_chunks = deserialize_chunks(blob, blob_size);

    checkpoint.last_activity = std::chrono::system_clock::time_point(
        std::chrono::seconds(sqlite3_column_int64(stmt, 9)));
    return checkpoint;
}

std::vector<std::uint8_t> ResumeStore::serialize_chunks(const std::vector<std::uint32_t>& chunks) {
    std::vector<std::uint8_t> data;
    data.reserve(chunks.size() * 4);
    for (auto index : chunks) {
        data.push_back((index >> 24) & 0xFF);
        data.push_back((index >> 16) & 0xFF);
        data.push_back((index >> 8) & 0xFF);
        data.push_back(index & 0xFF);
    }
    return data;
}

std::vector<std::uint32_t> ResumeStore::deserialize_chunks(const std::uint8_t* data, std::size_t size) {
    std::vector<std::uint32_t> chunks;
    if (!data) {
        return chunks;
    }

    chunks.reserve(size / 4);
    for (std::size_t offset = 0; offset + 4 <= size; offset += 4) {
        chunks.push_back((static_cast<std::uint32_t>(data[offset]) << 24) |
                         (static_cast<std::uint32_t>(data[offset + 1]) << 16) |
                         (static_cast<std::uint32_t>(data[offset + 2]) << 8) |
                         static_cast<std::uint32_t>(data[offset + 3]));
    }
    return chunks;
}

} // namespace chunkrelay::storage
