// File: src/storage/blob_store.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace simgroup {

using Blob = std::vector<uint8_t>;

/// Statistics for monitoring a blob store
struct BlobStoreStats {
    size_t total_blobs{0};
    size_t total_bytes{0};
    uint64_t total_reads{0};
    uint64_t total_writes{0};
};

/// Abstract key/value persistence contract
///
/// Feature maps and run checkpoints are persisted as opaque blobs keyed by a
/// stable identifier (see MakeCacheKey). The format of each blob belongs to
/// its producer; the store only moves bytes.
///
/// Thread Safety: implementations must be safe to call from multiple threads.
class BlobStore {
public:
    virtual ~BlobStore() = default;

    /// Load a blob
    /// @return The stored bytes, std::nullopt if the key is absent
    virtual std::optional<Blob> Load(const std::string& key) = 0;

    /// Insert or replace a blob
    /// @return true if persisted
    virtual bool Save(const std::string& key, const Blob& data) = 0;

    /// Remove a blob
    /// @return true if the key existed
    virtual bool Remove(const std::string& key) = 0;

    virtual bool Exists(const std::string& key) const = 0;

    /// All stored keys, sorted
    virtual std::vector<std::string> ListKeys() const = 0;

    virtual BlobStoreStats GetStats() const = 0;

    /// Remove every blob
    virtual void Clear() = 0;
};

} // namespace simgroup
