// File: src/similarity/set_similarity.hpp
#pragma once

#include "similarity_metric.hpp"
#include <string>
#include <vector>

namespace simgroup {

/// Overlap of generative-model provenance
///
/// Jaccard overlap of the checkpoint model sets and of the lora sets,
/// combined as 0.7 * models + 0.3 * loras. Duplicated names count once.
///
/// Edge cases:
/// - neither side names any model or lora: 1.0
/// - exactly one side names nothing: 0.0
class ModelSetSimilarity : public SimilarityMetric {
public:
    struct Config {
        float model_weight{0.7f};
        float lora_weight{0.3f};
    };

    ModelSetSimilarity() = default;
    explicit ModelSetSimilarity(const Config& config) : config_(config) {}

    float Score(const FeatureValue& a, const FeatureValue& b) const override;

    Polarity GetPolarity() const override { return Polarity::HIGHER_IS_BETTER; }
    FeatureKind GetFeatureKind() const override { return FeatureKind::MODELS; }
    std::string GetName() const override { return "ModelSet"; }

    /// |A n B| / |A u B| over distinct elements, 0 when both are empty
    static float Jaccard(const std::vector<std::string>& a, const std::vector<std::string>& b);

private:
    Config config_;
};

} // namespace simgroup
