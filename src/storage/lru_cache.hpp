// File: src/storage/lru_cache.hpp
#pragma once

#include <unordered_map>
#include <list>
#include <optional>
#include <mutex>
#include <atomic>
#include <functional>

namespace simgroup {

/// Byte-bounded LRU (Least Recently Used) cache
///
/// Capacity is measured in bytes rather than entries: every value is
/// weighed by a size function supplied at construction, and least recently
/// used entries are evicted until the total weight fits again.
/// Thread-safe with mutex protection. Owned by the caller (no global state).
///
/// @tparam Key Key type (must be hashable)
/// @tparam Value Value type (must be copyable or movable)
template<typename Key, typename Value>
class LRUCache {
public:
    using SizeFunction = std::function<size_t(const Key&, const Value&)>;

    /// Construct cache with a byte budget
    /// @param capacity_bytes Maximum total weight of cached entries
    /// @param size_fn Weight of one entry; defaults to sizeof(Value)
    explicit LRUCache(size_t capacity_bytes, SizeFunction size_fn = nullptr)
        : capacity_bytes_(capacity_bytes), size_fn_(std::move(size_fn)) {
        if (capacity_bytes_ == 0) {
            capacity_bytes_ = 1;
        }
        if (!size_fn_) {
            size_fn_ = [](const Key&, const Value&) { return sizeof(Value); };
        }
    }

    /// Get value from cache
    /// If found, moves item to front (most recently used)
    /// @param key Key to lookup
    /// @return Value if found, std::nullopt otherwise
    std::optional<Value> Get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto map_it = map_.find(key);
        if (map_it == map_.end()) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        hits_.fetch_add(1, std::memory_order_relaxed);
        items_.splice(items_.begin(), items_, map_it->second);

        return map_it->second->value;
    }

    /// Put value into cache, evicting LRU entries until it fits
    /// @return false if the entry alone exceeds the capacity (not cached, any old value dropped)
    bool Put(const Key& key, const Value& value) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto map_it = map_.find(key);
        if (map_it != map_.end()) {
            used_bytes_ -= map_it->second->weight;
            items_.erase(map_it->second);
            map_.erase(map_it);
        }

        // An oversize update still drops the previous value
        size_t weight = size_fn_(key, value);
        if (weight > capacity_bytes_) {
            return false;
        }

        while (!items_.empty() && used_bytes_ + weight > capacity_bytes_) {
            auto& lru = items_.back();
            used_bytes_ -= lru.weight;
            map_.erase(lru.key);
            items_.pop_back();
            evictions_.fetch_add(1, std::memory_order_relaxed);
        }

        items_.push_front(Entry{key, value, weight});
        map_[key] = items_.begin();
        used_bytes_ += weight;
        return true;
    }

    /// Remove item from cache
    /// @return true if removed, false if not found
    bool Remove(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto map_it = map_.find(key);
        if (map_it == map_.end()) {
            return false;
        }

        used_bytes_ -= map_it->second->weight;
        items_.erase(map_it->second);
        map_.erase(map_it);
        return true;
    }

    /// Clear all items and statistics
    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);

        items_.clear();
        map_.clear();
        used_bytes_ = 0;

        hits_.store(0, std::memory_order_relaxed);
        misses_.store(0, std::memory_order_relaxed);
        evictions_.store(0, std::memory_order_relaxed);
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t UsedBytes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return used_bytes_;
    }

    size_t CapacityBytes() const {
        return capacity_bytes_;
    }

    bool Contains(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    /// Get cache hit rate
    /// @return Hit rate [0.0, 1.0]
    float HitRate() const {
        uint64_t total_hits = hits_.load(std::memory_order_relaxed);
        uint64_t total_misses = misses_.load(std::memory_order_relaxed);
        uint64_t total = total_hits + total_misses;

        if (total == 0) {
            return 0.0f;
        }

        return static_cast<float>(total_hits) / static_cast<float>(total);
    }

    uint64_t Hits() const { return hits_.load(std::memory_order_relaxed); }
    uint64_t Misses() const { return misses_.load(std::memory_order_relaxed); }
    uint64_t Evictions() const { return evictions_.load(std::memory_order_relaxed); }

    struct Stats {
        size_t entries{0};
        size_t used_bytes{0};
        size_t capacity_bytes{0};
        uint64_t hits{0};
        uint64_t misses{0};
        uint64_t evictions{0};
        float hit_rate{0.0f};
        float utilization{0.0f};  // used_bytes / capacity_bytes
    };

    Stats GetStats() const {
        std::lock_guard<std::mutex> lock(mutex_);

        Stats stats;
        stats.entries = items_.size();
        stats.used_bytes = used_bytes_;
        stats.capacity_bytes = capacity_bytes_;
        stats.hits = hits_.load(std::memory_order_relaxed);
        stats.misses = misses_.load(std::memory_order_relaxed);
        stats.evictions = evictions_.load(std::memory_order_relaxed);
        stats.hit_rate = HitRate();
        stats.utilization = static_cast<float>(used_bytes_) / static_cast<float>(capacity_bytes_);

        return stats;
    }

private:
    struct Entry {
        Key key;
        Value value;
        size_t weight;
    };

    size_t capacity_bytes_;
    size_t used_bytes_{0};
    SizeFunction size_fn_;

    /// Front = most recently used, Back = least recently used
    std::list<Entry> items_;
    std::unordered_map<Key, typename std::list<Entry>::iterator> map_;

    mutable std::mutex mutex_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
};

} // namespace simgroup
