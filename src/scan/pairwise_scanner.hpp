// File: src/scan/pairwise_scanner.hpp
#pragma once

#include "core/feature_value.hpp"
#include "core/types.hpp"
#include "similarity/similarity_metric.hpp"
#include <functional>
#include <vector>

namespace simgroup {

/// A related pair produced by a scan
struct CandidatePair {
    FileIndex base{0};
    FileIndex other{0};
    float score{0.0f};
};

/// PairwiseScanner: enumerates and scores candidate pairs of file indices
///
/// Two policies:
///
/// MATRIX (dense features only): all vectors are packed into one row-major
/// matrix which is multiplied by its own transpose in row chunks sized by
/// CalculateChunkSize(). Only the upper triangle (i < j) is emitted, so each
/// unordered pair is seen once. Scan positions are row indices and a
/// boundary is reported before each chunk.
///
/// ROTATION (any metric): for each offset i in 1..N-1, every index a is
/// compared with b = (a + i) mod N. Offsets i and N-i both occur, so every
/// unordered pair is visited twice. Scan positions are offsets and a
/// boundary is reported before each offset.
///
/// Within a position pairs are emitted in ascending index order, so the
/// stream is deterministic for a given input.
///
/// Boundaries are the only points where the caller may checkpoint or
/// cancel (by throwing from the boundary callback).
class PairwiseScanner {
public:
    struct Config {
        ScanPolicy policy{ScanPolicy::ROTATION};

        /// Related threshold handed to SimilarityMetric::Evaluate
        float threshold{0.0f};

        /// Memory budget for one matrix chunk; <= 0 auto-detects
        int64_t max_memory_bytes{0};

        bool verbose{false};
    };

    using PairCallback = std::function<void(const CandidatePair&)>;

    /// Called before the work at `position` begins; `total` is the end position
    using BoundaryCallback = std::function<void(size_t position, size_t total)>;

    PairwiseScanner(const SimilarityMetric& metric, const Config& config);

    /// Scan the features, starting at `start_position`
    ///
    /// @param features Features in file order
    /// @param file_count Number of files found; a mismatch with the feature
    ///        count is logged and the shorter length is scanned
    /// @throws std::invalid_argument if MATRIX is used with non-dense features
    void Scan(const std::vector<FeatureValue>& features,
              size_t file_count,
              size_t start_position,
              const PairCallback& on_pair,
              const BoundaryCallback& on_boundary) const;

    /// End position of a full scan over n entries
    size_t TotalPositions(size_t n) const;

    /// Rows per matrix chunk: max(1, max_memory_bytes / (n_rows * bytes_per_element))
    /// A non-positive budget is replaced by half of the available physical memory.
    static size_t CalculateChunkSize(int64_t max_memory_bytes, size_t n_rows,
                                     size_t bytes_per_element);

    /// Available physical memory in bytes (0 if unknown)
    static int64_t AvailableMemoryBytes();

    const Config& GetConfig() const { return config_; }

private:
    const SimilarityMetric& metric_;
    Config config_;

    void ScanMatrix(const std::vector<FeatureValue>& features, size_t n,
                    size_t start_position,
                    const PairCallback& on_pair,
                    const BoundaryCallback& on_boundary) const;

    void ScanRotation(const std::vector<FeatureValue>& features, size_t n,
                      size_t start_position,
                      const PairCallback& on_pair,
                      const BoundaryCallback& on_boundary) const;

    void LogDebug(const std::string& message) const;
};

} // namespace simgroup
