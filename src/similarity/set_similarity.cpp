// File: src/similarity/set_similarity.cpp
#include "similarity/set_similarity.hpp"
#include <algorithm>
#include <iterator>
#include <set>

namespace simgroup {

float ModelSetSimilarity::Score(const FeatureValue& a, const FeatureValue& b) const {
    const ModelSets& sa = a.AsModels();
    const ModelSets& sb = b.AsModels();

    bool a_empty = sa.models.empty() && sa.loras.empty();
    bool b_empty = sb.models.empty() && sb.loras.empty();

    if (a_empty && b_empty) {
        return 1.0f;
    }
    if (a_empty || b_empty) {
        return 0.0f;
    }

    return Jaccard(sa.models, sb.models) * config_.model_weight +
           Jaccard(sa.loras, sb.loras) * config_.lora_weight;
}

float ModelSetSimilarity::Jaccard(const std::vector<std::string>& a,
                                  const std::vector<std::string>& b) {
    std::set<std::string> set_a(a.begin(), a.end());
    std::set<std::string> set_b(b.begin(), b.end());

    std::vector<std::string> intersection;
    std::set_intersection(set_a.begin(), set_a.end(), set_b.begin(), set_b.end(),
                          std::back_inserter(intersection));

    size_t union_size = set_a.size() + set_b.size() - intersection.size();
    if (union_size == 0) {
        return 0.0f;
    }

    return static_cast<float>(intersection.size()) / static_cast<float>(union_size);
}

} // namespace simgroup
