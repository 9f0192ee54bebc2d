// File: src/similarity/cosine_similarity.hpp
#pragma once

#include "similarity_metric.hpp"

namespace simgroup {

/// Cosine similarity of dense embeddings
///
/// FeatureValue::Dense() stores unit vectors, so cosine similarity reduces
/// to a dot product. Range [-1, 1], higher is more similar.
///
/// Dimension mismatch raises DimensionMismatchError; vectors are never
/// truncated or padded.
class CosineSimilarity : public SimilarityMetric {
public:
    CosineSimilarity() = default;

    float Score(const FeatureValue& a, const FeatureValue& b) const override;
    std::vector<float> ScoreBatch(const FeatureValue& query,
                                  const std::vector<FeatureValue>& candidates) const override;

    Polarity GetPolarity() const override { return Polarity::HIGHER_IS_BETTER; }
    FeatureKind GetFeatureKind() const override { return FeatureKind::DENSE; }
    std::string GetName() const override { return "Cosine"; }
};

} // namespace simgroup
