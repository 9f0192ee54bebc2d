// File: src/storage/memory_blob_store.cpp
#include "storage/memory_blob_store.hpp"
#include <algorithm>
#include <mutex>

namespace simgroup {

std::optional<Blob> MemoryBlobStore::Load(const std::string& key) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    total_reads_.fetch_add(1, std::memory_order_relaxed);

    auto it = blobs_.find(key);
    if (it == blobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryBlobStore::Save(const std::string& key, const Blob& data) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    total_writes_.fetch_add(1, std::memory_order_relaxed);
    blobs_[key] = data;
    return true;
}

bool MemoryBlobStore::Remove(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return blobs_.erase(key) > 0;
}

bool MemoryBlobStore::Exists(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return blobs_.find(key) != blobs_.end();
}

std::vector<std::string> MemoryBlobStore::ListKeys() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<std::string> keys;
    keys.reserve(blobs_.size());
    for (const auto& [key, data] : blobs_) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

BlobStoreStats MemoryBlobStore::GetStats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    BlobStoreStats stats;
    stats.total_blobs = blobs_.size();
    for (const auto& [key, data] : blobs_) {
        stats.total_bytes += data.size();
    }
    stats.total_reads = total_reads_.load(std::memory_order_relaxed);
    stats.total_writes = total_writes_.load(std::memory_order_relaxed);
    return stats;
}

void MemoryBlobStore::Clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    blobs_.clear();
    total_reads_.store(0, std::memory_order_relaxed);
    total_writes_.store(0, std::memory_order_relaxed);
}

} // namespace simgroup
