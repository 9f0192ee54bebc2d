// File: src/storage/sqlite_blob_store.cpp
#include "storage/sqlite_blob_store.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace simgroup {

namespace {

int64_t NowMicros() {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

// ============================================================================
// Constructor and Destructor
// ============================================================================

SqliteBlobStore::SqliteBlobStore(const Config& config)
    : config_(config) {

    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    try {
        InitializeDatabase();
    } catch (...) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteBlobStore::~SqliteBlobStore() {
    if (db_) {
        // close_v2 defers the close until outstanding statements finish
        int rc = sqlite3_close_v2(db_);
        if (rc != SQLITE_OK) {
            std::cerr << "[SqliteBlobStore] close failed: " << sqlite3_errstr(rc) << std::endl;
        }
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void SqliteBlobStore::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_busy_timeout(db_, config_.busy_timeout_ms);

    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA journal_mode=WAL;");
    }

    ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";");
    ExecuteSQL("PRAGMA cache_size=-" + std::to_string(config_.cache_size_kb) + ";");

    std::string create_table = R"(
        CREATE TABLE IF NOT EXISTS blobs (
            key TEXT PRIMARY KEY,
            updated_at INTEGER NOT NULL,
            data BLOB NOT NULL
        );
    )";

    if (!ExecuteSQL(create_table)) {
        throw std::runtime_error("Failed to create blobs table");
    }
}

bool SqliteBlobStore::ExecuteSQL(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        if (error_msg) {
            std::cerr << "[SqliteBlobStore] " << error_msg << std::endl;
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

// ============================================================================
// BlobStore Interface
// ============================================================================

std::optional<Blob> SqliteBlobStore::Load(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    total_reads_.fetch_add(1, std::memory_order_relaxed);

    const char* sql = "SELECT data FROM blobs WHERE key = ?;";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), static_cast<int>(key.size()), SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);

    if (rc == SQLITE_ROW) {
        const void* blob_data = sqlite3_column_blob(stmt, 0);
        int blob_size = sqlite3_column_bytes(stmt, 0);

        Blob blob;
        if (blob_size > 0) {
            blob.assign(static_cast<const uint8_t*>(blob_data),
                        static_cast<const uint8_t*>(blob_data) + blob_size);
        }

        sqlite3_finalize(stmt);
        return blob;
    }

    sqlite3_finalize(stmt);
    return std::nullopt;
}

bool SqliteBlobStore::Save(const std::string& key, const Blob& data) {
    std::lock_guard<std::mutex> lock(mutex_);

    total_writes_.fetch_add(1, std::memory_order_relaxed);

    const char* sql = "INSERT OR REPLACE INTO blobs (key, updated_at, data) VALUES (?, ?, ?);";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), static_cast<int>(key.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, NowMicros());
    // zeroblob keeps the NOT NULL constraint satisfied for empty payloads
    if (data.empty()) {
        sqlite3_bind_zeroblob(stmt, 3, 0);
    } else {
        sqlite3_bind_blob(stmt, 3, data.data(), static_cast<int>(data.size()), SQLITE_TRANSIENT);
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    return rc == SQLITE_DONE;
}

bool SqliteBlobStore::Remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql = "DELETE FROM blobs WHERE key = ?;";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), static_cast<int>(key.size()), SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    return rc == SQLITE_DONE && sqlite3_changes(db_) > 0;
}

bool SqliteBlobStore::Exists(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql = "SELECT 1 FROM blobs WHERE key = ? LIMIT 1;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), static_cast<int>(key.size()), SQLITE_TRANSIENT);

    bool exists = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);

    return exists;
}

std::vector<std::string> SqliteBlobStore::ListKeys() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> keys;

    const char* sql = "SELECT key FROM blobs ORDER BY key;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return keys;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const unsigned char* text = sqlite3_column_text(stmt, 0);
        int length = sqlite3_column_bytes(stmt, 0);
        keys.emplace_back(reinterpret_cast<const char*>(text), static_cast<size_t>(length));
    }

    sqlite3_finalize(stmt);
    return keys;
}

BlobStoreStats SqliteBlobStore::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    BlobStoreStats stats;
    stats.total_reads = total_reads_.load(std::memory_order_relaxed);
    stats.total_writes = total_writes_.load(std::memory_order_relaxed);

    const char* sql = "SELECT COUNT(*), COALESCE(SUM(LENGTH(data)), 0) FROM blobs;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return stats;
    }

    if (sqlite3_step(stmt) == SQLITE_ROW) {
        stats.total_blobs = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
        stats.total_bytes = static_cast<size_t>(sqlite3_column_int64(stmt, 1));
    }

    sqlite3_finalize(stmt);
    return stats;
}

void SqliteBlobStore::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    ExecuteSQL("DELETE FROM blobs;");

    total_reads_.store(0, std::memory_order_relaxed);
    total_writes_.store(0, std::memory_order_relaxed);
}

void SqliteBlobStore::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA wal_checkpoint(TRUNCATE);");
    }
}

} // namespace simgroup
