// File: tests/scan/pairwise_scanner_test.cpp
#include "scan/pairwise_scanner.hpp"
#include "similarity/cosine_similarity.hpp"
#include "similarity/size_similarity.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <set>
#include <utility>
#include <vector>

namespace simgroup {
namespace {

// ============================================================================
// Test Fixture
// ============================================================================

class PairwiseScannerTest : public ::testing::Test {
protected:
    CosineSimilarity metric;

    // Entries 0 and 1 point the same way, entry 2 is orthogonal
    std::vector<FeatureValue> features = {
        FeatureValue::Dense({1.0f, 0.0f}),
        FeatureValue::Dense({1.0f, 0.0f}),
        FeatureValue::Dense({0.0f, 1.0f}),
    };

    std::vector<std::pair<FileIndex, FileIndex>> pairs;
    std::vector<size_t> boundaries;

    PairwiseScanner::Config MakeConfig(ScanPolicy policy) const {
        PairwiseScanner::Config config;
        config.policy = policy;
        config.threshold = 0.9f;
        config.max_memory_bytes = 1 << 20;
        return config;
    }

    void RunScan(const PairwiseScanner& scanner, const std::vector<FeatureValue>& input,
                 size_t file_count, size_t start = 0) {
        scanner.Scan(
            input, file_count, start,
            [this](const CandidatePair& pair) { pairs.emplace_back(pair.base, pair.other); },
            [this](size_t position, size_t) { boundaries.push_back(position); });
    }
};

// ============================================================================
// Chunk Size Tests
// ============================================================================

TEST(PairwiseScannerChunkTest, ExactChunkMath) {
    EXPECT_EQ(25u, PairwiseScanner::CalculateChunkSize(1000, 10, 4));
    EXPECT_EQ(2u, PairwiseScanner::CalculateChunkSize(40, 5, 4));
}

TEST(PairwiseScannerChunkTest, NeverBelowOneRow) {
    EXPECT_EQ(1u, PairwiseScanner::CalculateChunkSize(10, 10, 4));
    EXPECT_GE(PairwiseScanner::CalculateChunkSize(0, 1000, 4), 1u);
    EXPECT_GE(PairwiseScanner::CalculateChunkSize(-1, 1000, 4), 1u);
    EXPECT_EQ(1u, PairwiseScanner::CalculateChunkSize(1000, 0, 4));
}

// ============================================================================
// Matrix Policy Tests
// ============================================================================

TEST_F(PairwiseScannerTest, MatrixEmitsUpperTriangleOnce) {
    PairwiseScanner scanner(metric, MakeConfig(ScanPolicy::MATRIX));

    RunScan(scanner, features, features.size());

    ASSERT_EQ(1u, pairs.size());
    EXPECT_EQ(0u, pairs[0].first);
    EXPECT_EQ(1u, pairs[0].second);
}

TEST_F(PairwiseScannerTest, MatrixBoundariesFollowChunks) {
    auto config = MakeConfig(ScanPolicy::MATRIX);
    std::vector<FeatureValue> five(5, FeatureValue::Dense({1.0f, 0.0f}));
    // 5 rows x 4 bytes per row, two rows per chunk
    config.max_memory_bytes = 40;
    PairwiseScanner scanner(metric, config);

    RunScan(scanner, five, five.size());

    std::vector<size_t> expected = {0, 2, 4};
    EXPECT_EQ(expected, boundaries);
    EXPECT_EQ(10u, pairs.size());
    for (const auto& [i, j] : pairs) {
        EXPECT_LT(i, j);
    }
}

TEST_F(PairwiseScannerTest, MatrixResumesAtRow) {
    auto config = MakeConfig(ScanPolicy::MATRIX);
    std::vector<FeatureValue> four(4, FeatureValue::Dense({0.0f, 1.0f}));
    config.max_memory_bytes = 16;
    PairwiseScanner scanner(metric, config);

    RunScan(scanner, four, four.size(), 2);

    std::vector<size_t> expected_boundaries = {2, 3};
    EXPECT_EQ(expected_boundaries, boundaries);
    ASSERT_EQ(1u, pairs.size());
    EXPECT_EQ(2u, pairs[0].first);
    EXPECT_EQ(3u, pairs[0].second);
}

TEST_F(PairwiseScannerTest, MatrixRequiresDenseMetric) {
    SizeSimilarity size_metric;
    EXPECT_THROW(PairwiseScanner(size_metric, MakeConfig(ScanPolicy::MATRIX)),
                 std::invalid_argument);
}

// ============================================================================
// Rotation Policy Tests
// ============================================================================

TEST_F(PairwiseScannerTest, RotationVisitsEachPairTwice) {
    PairwiseScanner scanner(metric, MakeConfig(ScanPolicy::ROTATION));

    RunScan(scanner, features, features.size());

    std::vector<std::pair<FileIndex, FileIndex>> expected = {{0, 1}, {1, 0}};
    EXPECT_EQ(expected, pairs);

    // Offset 0 is never scanned
    std::vector<size_t> expected_boundaries = {1, 2};
    EXPECT_EQ(expected_boundaries, boundaries);
    EXPECT_EQ(3u, scanner.TotalPositions(3));
}

TEST_F(PairwiseScannerTest, RotationCoversEveryUnorderedPair) {
    std::vector<FeatureValue> same(6, FeatureValue::Dense({1.0f, 1.0f}));
    PairwiseScanner scanner(metric, MakeConfig(ScanPolicy::ROTATION));

    RunScan(scanner, same, same.size());

    std::set<std::pair<FileIndex, FileIndex>> unordered;
    for (const auto& [a, b] : pairs) {
        EXPECT_NE(a, b);
        unordered.emplace(std::min(a, b), std::max(a, b));
    }
    EXPECT_EQ(30u, pairs.size());
    EXPECT_EQ(15u, unordered.size());
}

TEST_F(PairwiseScannerTest, RotationResumesAtOffset) {
    PairwiseScanner scanner(metric, MakeConfig(ScanPolicy::ROTATION));

    RunScan(scanner, features, features.size(), 2);

    std::vector<std::pair<FileIndex, FileIndex>> expected = {{1, 0}};
    EXPECT_EQ(expected, pairs);
    EXPECT_EQ(std::vector<size_t>{2}, boundaries);
}

TEST_F(PairwiseScannerTest, RotationWorksWithAnyMetric) {
    SizeSimilarity size_metric;
    auto config = MakeConfig(ScanPolicy::ROTATION);
    config.threshold = 0.5f;
    PairwiseScanner scanner(size_metric, config);

    std::vector<FeatureValue> sizes = {
        FeatureValue::Size(512, 512), FeatureValue::Size(1024, 768), FeatureValue::Size(512, 512)};
    RunScan(scanner, sizes, sizes.size());

    std::vector<std::pair<FileIndex, FileIndex>> expected = {{2, 0}, {0, 2}};
    EXPECT_EQ(expected, pairs);
}

// ============================================================================
// Edge Cases
// ============================================================================

TEST_F(PairwiseScannerTest, CountMismatchScansShorterLength) {
    PairwiseScanner scanner(metric, MakeConfig(ScanPolicy::ROTATION));

    RunScan(scanner, features, 2);

    for (const auto& [a, b] : pairs) {
        EXPECT_LT(a, 2u);
        EXPECT_LT(b, 2u);
    }
    EXPECT_EQ(2u, pairs.size());
}

TEST_F(PairwiseScannerTest, FewerThanTwoEntriesIsNoOp) {
    PairwiseScanner scanner(metric, MakeConfig(ScanPolicy::MATRIX));

    RunScan(scanner, {FeatureValue::Dense({1.0f})}, 1);

    EXPECT_TRUE(pairs.empty());
    EXPECT_TRUE(boundaries.empty());
}

TEST_F(PairwiseScannerTest, ThresholdIsStrict) {
    auto config = MakeConfig(ScanPolicy::MATRIX);
    config.threshold = 1.0f;
    PairwiseScanner scanner(metric, config);

    RunScan(scanner, features, features.size());

    EXPECT_TRUE(pairs.empty());
}

} // namespace
} // namespace simgroup
