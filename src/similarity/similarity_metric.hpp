// File: src/similarity/similarity_metric.hpp
#pragma once

#include "core/feature_value.hpp"
#include "core/types.hpp"
#include <vector>
#include <string>

namespace simgroup {

/// Outcome of comparing one pair under a threshold
struct MetricResult {
    /// Raw score in the metric's own units (similarity or distance)
    float score{0.0f};

    /// Whether the pair clears the metric's "related" test
    bool related{false};
};

/// Abstract base class for similarity metrics
///
/// A metric converts two FeatureValues of its kind into a raw score. Scores
/// are not normalized across metrics: cosine, text, model and size metrics
/// return similarities (higher is better) while the color metric returns an
/// aggregate distance (lower is better). Consumers must read GetPolarity()
/// before comparing a score to a threshold; PassesThreshold, IsBetter and
/// Drift do this for them.
///
/// Threshold comparisons are strict: a score exactly at the threshold is
/// not related.
class SimilarityMetric {
public:
    virtual ~SimilarityMetric() = default;

    /// Raw score for a pair
    /// @throws FeatureShapeError if either value is not of GetFeatureKind()
    /// @throws DimensionMismatchError if the values have different shapes
    virtual float Score(const FeatureValue& a, const FeatureValue& b) const = 0;

    /// Score plus the related decision. Default: strict threshold test on
    /// the score; metrics with a richer notion of relatedness override.
    virtual MetricResult Evaluate(const FeatureValue& a, const FeatureValue& b,
                                  float threshold) const;

    /// Score a query against many candidates
    virtual std::vector<float> ScoreBatch(const FeatureValue& query,
                                          const std::vector<FeatureValue>& candidates) const;

    virtual Polarity GetPolarity() const = 0;

    /// Kind of FeatureValue this metric consumes
    virtual FeatureKind GetFeatureKind() const = 0;

    virtual std::string GetName() const = 0;

    /// Check if metric is symmetric: score(a,b) == score(b,a)
    virtual bool IsSymmetric() const { return true; }

    /// Strict threshold test in the metric's polarity
    bool PassesThreshold(float score, float threshold) const;

    /// Whether score `a` is strictly better than score `b`
    bool IsBetter(float a, float b) const;

    /// How much worse `current` is than `previous` (negative if it improved)
    float Drift(float previous, float current) const;
};

} // namespace simgroup
