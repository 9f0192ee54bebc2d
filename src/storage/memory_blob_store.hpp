// File: src/storage/memory_blob_store.hpp
#pragma once

#include "storage/blob_store.hpp"
#include <unordered_map>
#include <shared_mutex>
#include <atomic>

namespace simgroup {

/// In-memory blob store backed by a hash map
///
/// Used for ephemeral runs and tests. Thread-safe with shared_mutex
/// (multiple readers, single writer). Contents vanish with the object.
class MemoryBlobStore : public BlobStore {
public:
    MemoryBlobStore() = default;
    ~MemoryBlobStore() override = default;

    std::optional<Blob> Load(const std::string& key) override;
    bool Save(const std::string& key, const Blob& data) override;
    bool Remove(const std::string& key) override;
    bool Exists(const std::string& key) const override;
    std::vector<std::string> ListKeys() const override;
    BlobStoreStats GetStats() const override;
    void Clear() override;

private:
    std::unordered_map<std::string, Blob> blobs_;

    mutable std::shared_mutex mutex_;

    std::atomic<uint64_t> total_reads_{0};
    std::atomic<uint64_t> total_writes_{0};
};

} // namespace simgroup
