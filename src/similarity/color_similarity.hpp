// File: src/similarity/color_similarity.hpp
#pragma once

#include "similarity_metric.hpp"
#include <vector>

namespace simgroup {

/// Perceptual color distance over LAB thumbnails
///
/// Per position, CIE76 Delta-E (Euclidean distance in LAB space, truncated
/// to an integer) between two equal-length color arrays. The score is the
/// sum of all Delta-E values: a distance, lower is more similar.
///
/// Relatedness is a consensus test rather than a threshold on the sum. A
/// position passes when its Delta-E is below the threshold handed to
/// Evaluate(). The pair is related when
///   - at least `min_passing` positions pass, and
///   - more than `min_clustered` passing positions sit inside contiguous
///     runs longer than `run_length` (scattered agreement does not count).
class ColorSimilarity : public SimilarityMetric {
public:
    struct Config {
        /// Minimum passing positions; 0 means half of the array length
        size_t min_passing{0};

        /// A run of passing positions must exceed this length to count
        size_t run_length{10};

        /// Clustered passing positions must exceed this count
        size_t min_clustered{10};
    };

    ColorSimilarity() = default;
    explicit ColorSimilarity(const Config& config) : config_(config) {}

    float Score(const FeatureValue& a, const FeatureValue& b) const override;

    /// @param threshold Per-position Delta-E threshold (strict)
    MetricResult Evaluate(const FeatureValue& a, const FeatureValue& b,
                          float threshold) const override;

    Polarity GetPolarity() const override { return Polarity::LOWER_IS_BETTER; }
    FeatureKind GetFeatureKind() const override { return FeatureKind::COLORS; }
    std::string GetName() const override { return "ColorDistance"; }

    /// Truncated CIE76 Delta-E per position
    /// @throws DimensionMismatchError if the arrays differ in length
    static std::vector<int> DeltaE(const ColorArray& a, const ColorArray& b);

    /// Consensus test over per-position pass flags
    bool IsConsensus(const std::vector<bool>& passing) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
};

} // namespace simgroup
