// File: src/similarity/cosine_similarity.cpp
#include "similarity/cosine_similarity.hpp"

namespace simgroup {

float CosineSimilarity::Score(const FeatureValue& a, const FeatureValue& b) const {
    return a.AsDense().DotProduct(b.AsDense());
}

std::vector<float> CosineSimilarity::ScoreBatch(
        const FeatureValue& query,
        const std::vector<FeatureValue>& candidates) const {
    const FeatureVector& q = query.AsDense();

    std::vector<float> results;
    results.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        results.push_back(q.DotProduct(candidate.AsDense()));
    }
    return results;
}

} // namespace simgroup
