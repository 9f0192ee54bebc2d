// File: src/similarity/size_similarity.cpp
#include "similarity/size_similarity.hpp"
#include <cstdlib>
#include <regex>
#include <stdexcept>

namespace simgroup {

float SizeSimilarity::Score(const FeatureValue& a, const FeatureValue& b) const {
    const PixelSize& sa = a.AsSize();
    const PixelSize& sb = b.AsSize();

    int64_t width_diff = std::llabs(static_cast<int64_t>(sa.width) - sb.width);
    int64_t height_diff = std::llabs(static_cast<int64_t>(sa.height) - sb.height);

    if (width_diff > tolerance_ || height_diff > tolerance_) {
        return 0.0f;
    }

    if (tolerance_ == 0) {
        return 1.0f;
    }

    float tolerance = static_cast<float>(tolerance_);
    float width_sim = 1.0f - static_cast<float>(width_diff) / tolerance;
    float height_sim = 1.0f - static_cast<float>(height_diff) / tolerance;
    return (width_sim + height_sim) / 2.0f;
}

std::optional<PixelSize> ParseSizeSearch(const std::string& text) {
    static const std::regex kPatterns[] = {
        std::regex(R"((\d+)\s*[xX]\s*(\d+))"),
        std::regex(R"((\d+)\s*,\s*(\d+))"),
        std::regex(R"((\d+)\s+(\d+))"),
    };

    for (const auto& pattern : kPatterns) {
        std::smatch match;
        if (!std::regex_search(text, match, pattern)) {
            continue;
        }
        try {
            PixelSize size;
            size.width = static_cast<int32_t>(std::stoi(match[1].str()));
            size.height = static_cast<int32_t>(std::stoi(match[2].str()));
            return size;
        } catch (const std::out_of_range&) {
            continue;
        }
    }

    return std::nullopt;
}

} // namespace simgroup
