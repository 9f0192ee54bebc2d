// File: tests/similarity/set_similarity_test.cpp
#include "similarity/set_similarity.hpp"
#include <gtest/gtest.h>

namespace simgroup {
namespace {

TEST(ModelSetSimilarityTest, BothEmptyIsIdentical) {
    ModelSetSimilarity metric;
    EXPECT_FLOAT_EQ(1.0f, metric.Score(FeatureValue::Models({}, {}), FeatureValue::Models({}, {})));
}

TEST(ModelSetSimilarityTest, OneEmptyIsUnrelated) {
    ModelSetSimilarity metric;
    EXPECT_FLOAT_EQ(0.0f, metric.Score(FeatureValue::Models({"sdxl"}, {}),
                                       FeatureValue::Models({}, {})));
}

TEST(ModelSetSimilarityTest, IdenticalSets) {
    ModelSetSimilarity metric;
    FeatureValue a = FeatureValue::Models({"sdxl", "refiner"}, {"detail"});
    FeatureValue b = FeatureValue::Models({"refiner", "sdxl", "sdxl"}, {"detail"});

    EXPECT_FLOAT_EQ(1.0f, metric.Score(a, b));
}

TEST(ModelSetSimilarityTest, SameModelsDifferentLoras) {
    ModelSetSimilarity metric;
    FeatureValue a = FeatureValue::Models({"sdxl"}, {"detail"});
    FeatureValue b = FeatureValue::Models({"sdxl"}, {"anime"});

    EXPECT_NEAR(0.7f, metric.Score(a, b), 1e-6f);
}

TEST(ModelSetSimilarityTest, Jaccard) {
    EXPECT_NEAR(1.0f / 3.0f, ModelSetSimilarity::Jaccard({"a", "b"}, {"b", "c"}), 1e-6f);
    EXPECT_FLOAT_EQ(0.0f, ModelSetSimilarity::Jaccard({}, {}));
    EXPECT_FLOAT_EQ(1.0f, ModelSetSimilarity::Jaccard({"a", "a"}, {"a"}));
}

TEST(ModelSetSimilarityTest, CustomWeights) {
    ModelSetSimilarity::Config config;
    config.model_weight = 0.5f;
    config.lora_weight = 0.5f;
    ModelSetSimilarity metric(config);

    FeatureValue a = FeatureValue::Models({"sdxl"}, {"detail"});
    FeatureValue b = FeatureValue::Models({"flux"}, {"detail"});

    EXPECT_NEAR(0.5f, metric.Score(a, b), 1e-6f);
}

} // namespace
} // namespace simgroup
