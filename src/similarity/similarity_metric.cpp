// File: src/similarity/similarity_metric.cpp
#include "similarity/similarity_metric.hpp"

namespace simgroup {

MetricResult SimilarityMetric::Evaluate(const FeatureValue& a, const FeatureValue& b,
                                        float threshold) const {
    MetricResult result;
    result.score = Score(a, b);
    result.related = PassesThreshold(result.score, threshold);
    return result;
}

std::vector<float> SimilarityMetric::ScoreBatch(
        const FeatureValue& query,
        const std::vector<FeatureValue>& candidates) const {
    std::vector<float> results;
    results.reserve(candidates.size());

    for (const auto& candidate : candidates) {
        results.push_back(Score(query, candidate));
    }

    return results;
}

bool SimilarityMetric::PassesThreshold(float score, float threshold) const {
    if (GetPolarity() == Polarity::HIGHER_IS_BETTER) {
        return score > threshold;
    }
    return score < threshold;
}

bool SimilarityMetric::IsBetter(float a, float b) const {
    if (GetPolarity() == Polarity::HIGHER_IS_BETTER) {
        return a > b;
    }
    return a < b;
}

float SimilarityMetric::Drift(float previous, float current) const {
    if (GetPolarity() == Polarity::HIGHER_IS_BETTER) {
        return previous - current;
    }
    return current - previous;
}

} // namespace simgroup
