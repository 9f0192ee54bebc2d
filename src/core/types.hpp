// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <map>
#include <vector>

namespace simgroup {

// FileIndex: position of a file inside the ordered files_found sequence
using FileIndex = size_t;

// GroupID: monotonically increasing group counter, never reused within a run
using GroupID = uint64_t;

// CompareMode: which fingerprint a run compares
enum class CompareMode : uint8_t {
    EMBEDDING = 0,   // Dense image/text embeddings
    COLOR = 1,       // LAB color thumbnails
    PROMPTS = 2,     // Generation prompts (positive/negative)
    MODELS = 3,      // Checkpoint model and lora identifiers
    SIZE = 4,        // Pixel dimensions
};

// Convert CompareMode to string
const char* ToString(CompareMode mode);

// Parse CompareMode from string (case-sensitive, lower case)
CompareMode ParseCompareMode(const std::string& str);

// Polarity: direction in which raw metric scores improve
enum class Polarity : uint8_t {
    HIGHER_IS_BETTER = 0,  // similarities
    LOWER_IS_BETTER = 1,   // distances
};

const char* ToString(Polarity polarity);

// ScanPolicy: how candidate pairs are enumerated
enum class ScanPolicy : uint8_t {
    MATRIX = 0,     // Chunked matrix product (dense vectors only)
    ROTATION = 1,   // Rotation by offset, metric agnostic
};

const char* ToString(ScanPolicy policy);

// Progress listener: (phase label, percent complete)
using ProgressListener = std::function<void(const std::string&, float)>;

// GroupMember: a file's current group and the score that earned membership
struct GroupMember {
    GroupID group_id{0};
    float score{0.0f};

    bool operator==(const GroupMember& other) const {
        return group_id == other.group_id && score == other.score;
    }
    bool operator!=(const GroupMember& other) const { return !(*this == other); }
};

// file_index -> (group_id, score)
using GroupAssignment = std::map<FileIndex, GroupMember>;

// group_id -> {file_path: score}
using GroupMembership = std::map<GroupID, std::map<std::string, float>>;

// Stable 64-bit FNV-1a hash of an ordered list of file paths
uint64_t HashFileList(const std::vector<std::string>& files);

// Stable identifier for a persisted blob: (corpus directory, mode, payload kind)
std::string MakeCacheKey(const std::string& directory, CompareMode mode,
                         const std::string& payload);

} // namespace simgroup
