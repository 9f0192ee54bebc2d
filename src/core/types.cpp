// File: src/core/types.cpp
#include "core/types.hpp"
#include <sstream>
#include <stdexcept>

namespace simgroup {

// Enum implementations

const char* ToString(CompareMode mode) {
    switch (mode) {
        case CompareMode::EMBEDDING: return "embedding";
        case CompareMode::COLOR: return "color";
        case CompareMode::PROMPTS: return "prompts";
        case CompareMode::MODELS: return "models";
        case CompareMode::SIZE: return "size";
        default: return "unknown";
    }
}

CompareMode ParseCompareMode(const std::string& str) {
    if (str == "embedding") return CompareMode::EMBEDDING;
    if (str == "color") return CompareMode::COLOR;
    if (str == "prompts") return CompareMode::PROMPTS;
    if (str == "models") return CompareMode::MODELS;
    if (str == "size") return CompareMode::SIZE;
    throw std::invalid_argument("Unknown CompareMode: " + str);
}

const char* ToString(Polarity polarity) {
    switch (polarity) {
        case Polarity::HIGHER_IS_BETTER: return "HIGHER_IS_BETTER";
        case Polarity::LOWER_IS_BETTER: return "LOWER_IS_BETTER";
        default: return "UNKNOWN";
    }
}

const char* ToString(ScanPolicy policy) {
    switch (policy) {
        case ScanPolicy::MATRIX: return "MATRIX";
        case ScanPolicy::ROTATION: return "ROTATION";
        default: return "UNKNOWN";
    }
}

// File list hashing

uint64_t HashFileList(const std::vector<std::string>& files) {
    constexpr uint64_t kOffsetBasis = 14695981039346656037ULL;
    constexpr uint64_t kPrime = 1099511628211ULL;

    uint64_t hash = kOffsetBasis;
    for (const auto& file : files) {
        for (unsigned char c : file) {
            hash ^= c;
            hash *= kPrime;
        }
        // Separator so that ["ab", "c"] and ["a", "bc"] differ
        hash ^= static_cast<unsigned char>('\n');
        hash *= kPrime;
    }

    return hash;
}

std::string MakeCacheKey(const std::string& directory, CompareMode mode,
                         const std::string& payload) {
    std::ostringstream oss;
    oss << payload << ":" << ToString(mode) << ":" << directory;
    return oss.str();
}

} // namespace simgroup
