// File: tests/similarity/text_similarity_test.cpp
#include "similarity/text_similarity.hpp"
#include <gtest/gtest.h>

namespace simgroup {
namespace {

// ============================================================================
// ComputeTextSimilarity Tests
// ============================================================================

TEST(TextSimilarityTest, EqualIgnoringCaseAndWhitespace) {
    EXPECT_FLOAT_EQ(1.0f, PromptSimilarity::ComputeTextSimilarity("A Cat", "  a cat "));
}

TEST(TextSimilarityTest, ContainmentScoresPointNine) {
    EXPECT_FLOAT_EQ(0.9f, PromptSimilarity::ComputeTextSimilarity("a cat", "a cat on a mat"));
    EXPECT_FLOAT_EQ(0.9f, PromptSimilarity::ComputeTextSimilarity("a cat on a mat", "a cat"));
}

TEST(TextSimilarityTest, ElementOverlapIsBoosted) {
    float score = PromptSimilarity::ComputeTextSimilarity("cat, dog, bird", "cat, dog, fish");

    // Elements: cat, dog and the unsplit string on each side
    EXPECT_NEAR(2.0f / 6.0f * 1.3f, score, 1e-5f);
}

TEST(TextSimilarityTest, FallsBackToWords) {
    EXPECT_FLOAT_EQ(0.5f, PromptSimilarity::ComputeTextSimilarity("a cat sitting", "a cat sat"));
}

TEST(TextSimilarityTest, WordScoreIsCapped) {
    float score = PromptSimilarity::ComputeTextSimilarity("red blue green yellow",
                                                          "green yellow red blue");
    EXPECT_FLOAT_EQ(0.7f, score);
}

TEST(TextSimilarityTest, EmptyOrBlankScoresZero) {
    EXPECT_FLOAT_EQ(0.0f, PromptSimilarity::ComputeTextSimilarity("", "a cat"));
    EXPECT_FLOAT_EQ(0.0f, PromptSimilarity::ComputeTextSimilarity("a cat", "   "));
    EXPECT_FLOAT_EQ(0.0f, PromptSimilarity::ComputeTextSimilarity("", ""));
}

// ============================================================================
// Word Matching Tests
// ============================================================================

TEST(TextSimilarityTest, SubstringWordsCountPointEight) {
    float score = PromptSimilarity::FuzzyWordSimilarity({"sunset", "beach"}, {"sunsets", "beach"});
    EXPECT_NEAR(1.8f / 3.0f, score, 1e-5f);
}

TEST(TextSimilarityTest, EditDistanceWordsCountPointSix) {
    float score = PromptSimilarity::FuzzyWordSimilarity({"colour"}, {"color"});
    EXPECT_NEAR(0.3f, score, 1e-5f);
}

TEST(TextSimilarityTest, ShortWordsNeverFuzzyMatch) {
    EXPECT_FLOAT_EQ(0.0f, PromptSimilarity::FuzzyWordSimilarity({"ab"}, {"ac"}));
}

TEST(TextSimilarityTest, LevenshteinDistance) {
    EXPECT_EQ(3u, PromptSimilarity::LevenshteinDistance("kitten", "sitting"));
    EXPECT_EQ(0u, PromptSimilarity::LevenshteinDistance("same", "same"));
    EXPECT_EQ(4u, PromptSimilarity::LevenshteinDistance("", "four"));
}

// ============================================================================
// PromptSimilarity Tests
// ============================================================================

TEST(PromptSimilarityTest, NegativePromptWeighted) {
    PromptSimilarity metric;
    FeatureValue a = FeatureValue::Prompts("cat", "blurry");
    FeatureValue b = FeatureValue::Prompts("cat", "");

    EXPECT_NEAR(0.7f, metric.Score(a, b), 1e-6f);
}

TEST(PromptSimilarityTest, PositiveAloneWhenNoNegatives) {
    PromptSimilarity metric;
    FeatureValue a = FeatureValue::Prompts("cat", "");
    FeatureValue b = FeatureValue::Prompts("cat", "");

    EXPECT_FLOAT_EQ(1.0f, metric.Score(a, b));
}

TEST(PromptSimilarityTest, CustomWeights) {
    PromptSimilarity::Config config;
    config.positive_weight = 0.5f;
    config.negative_weight = 0.5f;
    PromptSimilarity metric(config);

    FeatureValue a = FeatureValue::Prompts("cat", "blurry");
    FeatureValue b = FeatureValue::Prompts("dog", "blurry");

    EXPECT_NEAR(0.5f, metric.Score(a, b), 1e-6f);
}

} // namespace
} // namespace simgroup
