// File: src/run/checkpoint.hpp
#pragma once

#include "core/types.hpp"
#include "storage/blob_store.hpp"
#include <string>
#include <utility>
#include <vector>

namespace simgroup {

/// RunCheckpoint: persisted state of a grouping run
///
/// Binary layout (little-endian host order):
///   "SGCK" | u32 version | u64 file_list_hash | u64 next_group_id |
///   u64 next_position | u8 is_complete |
///   assignment:  u64 n, n x (u64 file_index, u64 group_id, f32 score) |
///   membership:  u64 n, n x (u64 group_id, u64 m, m x (str path, f32 score)) |
///   duplicates:  u64 n, n x (str path, str path)
/// Strings are u64 length-prefixed.
struct RunCheckpoint {
    static constexpr uint32_t kVersion = 1;

    uint64_t file_list_hash{0};
    GroupAssignment assignment;
    GroupMembership membership;
    GroupID next_group_id{0};

    /// First scan position not yet processed
    size_t next_position{0};

    bool is_complete{false};

    std::vector<std::pair<std::string, std::string>> duplicates;

    Blob Serialize() const;

    /// @throws CheckpointFormatError on bad magic, unknown version or truncation
    static RunCheckpoint Deserialize(const Blob& blob);

    /// Every assigned file index is below file_count
    bool IndicesWithinBounds(size_t file_count) const;

    bool operator==(const RunCheckpoint& other) const;
    bool operator!=(const RunCheckpoint& other) const { return !(*this == other); }
};

} // namespace simgroup
