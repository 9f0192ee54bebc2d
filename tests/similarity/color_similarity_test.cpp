// File: tests/similarity/color_similarity_test.cpp
#include "similarity/color_similarity.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>

namespace simgroup {
namespace {

// 15x15 thumbnail
constexpr size_t kThumbnailSize = 225;

ColorArray Uniform(LabColor color, size_t count = kThumbnailSize) {
    return ColorArray(count, color);
}

TEST(ColorSimilarityTest, DeltaETruncatesEuclideanDistance) {
    ColorArray a = {LabColor{0.0f, 0.0f, 0.0f}};
    ColorArray b = {LabColor{3.0f, 4.0f, 0.5f}};

    std::vector<int> deltas = ColorSimilarity::DeltaE(a, b);

    ASSERT_EQ(1u, deltas.size());
    EXPECT_EQ(5, deltas[0]);
}

TEST(ColorSimilarityTest, IdenticalThumbnailsAreRelated) {
    ColorSimilarity metric;
    FeatureValue a = FeatureValue::Colors(Uniform(LabColor{50.0f, 10.0f, -10.0f}));

    MetricResult result = metric.Evaluate(a, a, 15.0f);

    EXPECT_FLOAT_EQ(0.0f, result.score);
    EXPECT_TRUE(result.related);
}

TEST(ColorSimilarityTest, UniformShiftAboveThresholdIsUnrelated) {
    ColorSimilarity metric;
    FeatureValue a = FeatureValue::Colors(Uniform(LabColor{40.0f, 0.0f, 0.0f}));
    FeatureValue b = FeatureValue::Colors(Uniform(LabColor{60.0f, 0.0f, 0.0f}));

    MetricResult result = metric.Evaluate(a, b, 15.0f);

    EXPECT_FLOAT_EQ(4500.0f, result.score);
    EXPECT_FLOAT_EQ(4500.0f, metric.Score(a, b));
    EXPECT_FALSE(result.related);
}

TEST(ColorSimilarityTest, ScatteredAgreementIsNotConsensus) {
    ColorSimilarity metric;
    ColorArray base = Uniform(LabColor{40.0f, 0.0f, 0.0f});
    ColorArray alternating = base;
    for (size_t i = 1; i < alternating.size(); i += 2) {
        alternating[i].l += 30.0f;
    }

    MetricResult result = metric.Evaluate(FeatureValue::Colors(base),
                                          FeatureValue::Colors(alternating), 15.0f);

    // Half the positions pass, but no run is long enough
    EXPECT_FALSE(result.related);
}

TEST(ColorSimilarityTest, ConsensusRules) {
    ColorSimilarity::Config config;
    config.min_passing = 0;
    config.run_length = 2;
    config.min_clustered = 1;
    ColorSimilarity metric(config);

    // Run of 4: positions 3 and 4 of the run count as clustered
    EXPECT_TRUE(metric.IsConsensus({true, true, true, true, false, false}));
    // Run of 3: only one clustered position, not more than min_clustered
    EXPECT_FALSE(metric.IsConsensus({true, true, true, false, false, false}));
    // Runs reset on a failing position
    EXPECT_FALSE(metric.IsConsensus({true, true, false, true, true, false}));
}

TEST(ColorSimilarityTest, MinPassingOverridesHalf) {
    ColorSimilarity::Config config;
    config.min_passing = 5;
    config.run_length = 1;
    config.min_clustered = 0;
    ColorSimilarity metric(config);

    EXPECT_FALSE(metric.IsConsensus({true, true, true, true, false, false}));
    EXPECT_TRUE(metric.IsConsensus({true, true, true, true, true, false}));
}

TEST(ColorSimilarityTest, LengthMismatchThrows) {
    ColorSimilarity metric;
    FeatureValue a = FeatureValue::Colors(Uniform(LabColor{}, 225));
    FeatureValue b = FeatureValue::Colors(Uniform(LabColor{}, 100));

    EXPECT_THROW(metric.Score(a, b), DimensionMismatchError);
    EXPECT_THROW(metric.Evaluate(a, b, 15.0f), DimensionMismatchError);
}

} // namespace
} // namespace simgroup
