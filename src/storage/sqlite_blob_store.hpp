// File: src/storage/sqlite_blob_store.hpp
#pragma once

#include "storage/blob_store.hpp"
#include <string>
#include <mutex>
#include <atomic>
#include <sqlite3.h>

namespace simgroup {

/// Persistent blob store using SQLite
///
/// One table, `blobs(key TEXT PRIMARY KEY, updated_at INTEGER, data BLOB)`.
/// Saves are upserts, so rewriting a checkpoint replaces the previous one
/// atomically. Write-Ahead Logging is enabled by default so that a crash
/// mid-save leaves the previous blob intact.
class SqliteBlobStore : public BlobStore {
public:
    struct Config {
        /// Path to the SQLite database file (":memory:" for a private in-memory db)
        std::string db_path;

        /// Enable Write-Ahead Logging
        bool enable_wal{true};

        /// Cache size in KB (default: 10MB)
        size_t cache_size_kb{10240};

        /// Milliseconds to wait on a locked database
        int busy_timeout_ms{5000};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};
    };

    /// @throws std::runtime_error if the database cannot be opened or initialized
    explicit SqliteBlobStore(const Config& config);

    ~SqliteBlobStore() override;

    SqliteBlobStore(const SqliteBlobStore&) = delete;
    SqliteBlobStore& operator=(const SqliteBlobStore&) = delete;

    std::optional<Blob> Load(const std::string& key) override;
    bool Save(const std::string& key, const Blob& data) override;
    bool Remove(const std::string& key) override;
    bool Exists(const std::string& key) const override;
    std::vector<std::string> ListKeys() const override;
    BlobStoreStats GetStats() const override;
    void Clear() override;

    /// Checkpoint the WAL into the main database file
    void Flush();

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    sqlite3* db_{nullptr};

    mutable std::mutex mutex_;

    mutable std::atomic<uint64_t> total_reads_{0};
    std::atomic<uint64_t> total_writes_{0};

    void InitializeDatabase();
    bool ExecuteSQL(const std::string& sql);
};

} // namespace simgroup
