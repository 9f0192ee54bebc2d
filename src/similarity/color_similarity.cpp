// File: src/similarity/color_similarity.cpp
#include "similarity/color_similarity.hpp"
#include "core/errors.hpp"
#include <cmath>

namespace simgroup {

std::vector<int> ColorSimilarity::DeltaE(const ColorArray& a, const ColorArray& b) {
    if (a.size() != b.size()) {
        throw DimensionMismatchError(a.size(), b.size());
    }

    std::vector<int> result;
    result.reserve(a.size());

    for (size_t i = 0; i < a.size(); ++i) {
        float dl = a[i].l - b[i].l;
        float da = a[i].a - b[i].a;
        float db = a[i].b - b[i].b;
        result.push_back(static_cast<int>(std::sqrt(dl * dl + da * da + db * db)));
    }

    return result;
}

float ColorSimilarity::Score(const FeatureValue& a, const FeatureValue& b) const {
    int64_t total = 0;
    for (int delta : DeltaE(a.AsColors(), b.AsColors())) {
        total += delta;
    }
    return static_cast<float>(total);
}

MetricResult ColorSimilarity::Evaluate(const FeatureValue& a, const FeatureValue& b,
                                       float threshold) const {
    std::vector<int> deltas = DeltaE(a.AsColors(), b.AsColors());

    int64_t total = 0;
    std::vector<bool> passing;
    passing.reserve(deltas.size());
    for (int delta : deltas) {
        total += delta;
        passing.push_back(static_cast<float>(delta) < threshold);
    }

    MetricResult result;
    result.score = static_cast<float>(total);
    result.related = IsConsensus(passing);
    return result;
}

bool ColorSimilarity::IsConsensus(const std::vector<bool>& passing) const {
    size_t min_passing = config_.min_passing > 0 ? config_.min_passing : passing.size() / 2;

    size_t passing_count = 0;
    size_t clustered_count = 0;
    size_t run = 0;

    for (bool pass : passing) {
        if (!pass) {
            run = 0;
            continue;
        }
        ++passing_count;
        ++run;
        if (run > config_.run_length) {
            ++clustered_count;
        }
    }

    return passing_count >= min_passing && clustered_count > config_.min_clustered;
}

} // namespace simgroup
