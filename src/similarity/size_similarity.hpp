// File: src/similarity/size_similarity.hpp
#pragma once

#include "similarity_metric.hpp"
#include <optional>
#include <string>

namespace simgroup {

/// Pixel dimension equality within a tolerance
///
/// Both width and height must differ by at most `tolerance` pixels,
/// otherwise the score is 0. Within tolerance:
/// - tolerance 0: 1.0 (exact match)
/// - tolerance > 0: mean over both axes of (1 - diff / tolerance)
class SizeSimilarity : public SimilarityMetric {
public:
    explicit SizeSimilarity(int32_t tolerance = 0)
        : tolerance_(tolerance < 0 ? 0 : tolerance) {}

    float Score(const FeatureValue& a, const FeatureValue& b) const override;

    Polarity GetPolarity() const override { return Polarity::HIGHER_IS_BETTER; }
    FeatureKind GetFeatureKind() const override { return FeatureKind::SIZE; }
    std::string GetName() const override { return "Size"; }

    int32_t GetTolerance() const { return tolerance_; }

private:
    int32_t tolerance_;
};

/// Parse a size query such as "512x512", "1024, 768" or "512 512"
/// @return std::nullopt if no width/height pair is found
std::optional<PixelSize> ParseSizeSearch(const std::string& text);

} // namespace simgroup
