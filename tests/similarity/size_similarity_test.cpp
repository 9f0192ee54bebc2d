// File: tests/similarity/size_similarity_test.cpp
#include "similarity/size_similarity.hpp"
#include <gtest/gtest.h>

namespace simgroup {
namespace {

// ============================================================================
// SizeSimilarity Tests
// ============================================================================

TEST(SizeSimilarityTest, ExactMatchWithZeroTolerance) {
    SizeSimilarity metric;

    EXPECT_FLOAT_EQ(1.0f, metric.Score(FeatureValue::Size(512, 512), FeatureValue::Size(512, 512)));
    EXPECT_FLOAT_EQ(0.0f, metric.Score(FeatureValue::Size(512, 512), FeatureValue::Size(512, 514)));
}

TEST(SizeSimilarityTest, ToleranceScalesScore) {
    FeatureValue a = FeatureValue::Size(512, 512);
    FeatureValue b = FeatureValue::Size(514, 512);

    EXPECT_FLOAT_EQ(0.5f, SizeSimilarity(2).Score(a, b));
    EXPECT_FLOAT_EQ(0.75f, SizeSimilarity(4).Score(a, b));
    EXPECT_FLOAT_EQ(0.0f, SizeSimilarity(1).Score(a, b));
}

TEST(SizeSimilarityTest, NegativeToleranceClampsToZero) {
    SizeSimilarity metric(-5);
    EXPECT_EQ(0, metric.GetTolerance());
}

// ============================================================================
// ParseSizeSearch Tests
// ============================================================================

TEST(ParseSizeSearchTest, AcceptedForms) {
    auto by_x = ParseSizeSearch("512x512");
    ASSERT_TRUE(by_x.has_value());
    EXPECT_EQ(512, by_x->width);
    EXPECT_EQ(512, by_x->height);

    auto by_comma = ParseSizeSearch("1024, 768");
    ASSERT_TRUE(by_comma.has_value());
    EXPECT_EQ(1024, by_comma->width);
    EXPECT_EQ(768, by_comma->height);

    auto by_space = ParseSizeSearch("512 512");
    ASSERT_TRUE(by_space.has_value());
    EXPECT_EQ(512, by_space->width);
    EXPECT_EQ(512, by_space->height);

    auto embedded = ParseSizeSearch("size 640X480 px");
    ASSERT_TRUE(embedded.has_value());
    EXPECT_EQ(640, embedded->width);
    EXPECT_EQ(480, embedded->height);
}

TEST(ParseSizeSearchTest, RejectsTextWithoutPair) {
    EXPECT_FALSE(ParseSizeSearch("large").has_value());
    EXPECT_FALSE(ParseSizeSearch("512").has_value());
    EXPECT_FALSE(ParseSizeSearch("").has_value());
}

} // namespace
} // namespace simgroup
