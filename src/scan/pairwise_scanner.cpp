// File: src/scan/pairwise_scanner.cpp
#include "scan/pairwise_scanner.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <unistd.h>

namespace simgroup {

PairwiseScanner::PairwiseScanner(const SimilarityMetric& metric, const Config& config)
    : metric_(metric), config_(config) {
    if (config_.policy == ScanPolicy::MATRIX && metric_.GetFeatureKind() != FeatureKind::DENSE) {
        throw std::invalid_argument(std::string("Matrix scan requires a dense metric, got ") +
                                    metric_.GetName());
    }
}

void PairwiseScanner::Scan(const std::vector<FeatureValue>& features,
                           size_t file_count,
                           size_t start_position,
                           const PairCallback& on_pair,
                           const BoundaryCallback& on_boundary) const {
    if (features.size() != file_count) {
        std::cerr << "[PairwiseScanner] Warning: mismatch between files found (" << file_count
                  << ") and features (" << features.size() << ")" << std::endl;
    }

    size_t n = std::min(features.size(), file_count);
    if (n < 2) {
        LogDebug("Fewer than two entries, nothing to scan");
        return;
    }

    if (config_.policy == ScanPolicy::MATRIX) {
        ScanMatrix(features, n, start_position, on_pair, on_boundary);
    } else {
        ScanRotation(features, n, start_position, on_pair, on_boundary);
    }
}

size_t PairwiseScanner::TotalPositions(size_t n) const {
    return n;
}

// ============================================================================
// Matrix policy
// ============================================================================

void PairwiseScanner::ScanMatrix(const std::vector<FeatureValue>& features, size_t n,
                                 size_t start_position,
                                 const PairCallback& on_pair,
                                 const BoundaryCallback& on_boundary) const {
    const size_t dim = features[0].AsDense().Dimension();

    // Row-major N x D matrix of unit vectors
    std::vector<float> matrix(n * dim);
    for (size_t i = 0; i < n; ++i) {
        const FeatureVector& row = features[i].AsDense();
        if (row.Dimension() != dim) {
            throw DimensionMismatchError(dim, row.Dimension());
        }
        std::copy(row.Data().begin(), row.Data().end(), matrix.begin() + i * dim);
    }

    const size_t chunk_size = CalculateChunkSize(config_.max_memory_bytes, n, sizeof(float));
    LogDebug("Matrix scan of " + std::to_string(n) + " rows, chunk size " +
             std::to_string(chunk_size));

    std::vector<float> block;

    for (size_t row_start = start_position; row_start < n; row_start += chunk_size) {
        if (on_boundary) {
            on_boundary(row_start, n);
        }

        const size_t row_end = std::min(n, row_start + chunk_size);
        const size_t rows = row_end - row_start;

        // block = chunk(N) * N^T, upper triangle only
        block.assign(rows * n, 0.0f);
        for (size_t r = 0; r < rows; ++r) {
            const size_t i = row_start + r;
            const float* a = &matrix[i * dim];
            for (size_t j = i + 1; j < n; ++j) {
                const float* b = &matrix[j * dim];
                float dot = 0.0f;
                for (size_t k = 0; k < dim; ++k) {
                    dot += a[k] * b[k];
                }
                block[r * n + j] = dot;
            }
        }

        for (size_t r = 0; r < rows; ++r) {
            const size_t i = row_start + r;
            for (size_t j = i + 1; j < n; ++j) {
                float score = block[r * n + j];
                if (metric_.PassesThreshold(score, config_.threshold)) {
                    on_pair(CandidatePair{i, j, score});
                }
            }
        }
    }
}

// ============================================================================
// Rotation policy
// ============================================================================

void PairwiseScanner::ScanRotation(const std::vector<FeatureValue>& features, size_t n,
                                   size_t start_position,
                                   const PairCallback& on_pair,
                                   const BoundaryCallback& on_boundary) const {
    // Offset 0 would compare every entry with itself
    size_t first_offset = std::max<size_t>(start_position, 1);

    for (size_t offset = first_offset; offset < n; ++offset) {
        if (on_boundary) {
            on_boundary(offset, n);
        }

        for (size_t a = 0; a < n; ++a) {
            size_t b = (a + offset) % n;
            MetricResult result = metric_.Evaluate(features[a], features[b], config_.threshold);
            if (result.related) {
                on_pair(CandidatePair{a, b, result.score});
            }
        }
    }
}

// ============================================================================
// Memory budget
// ============================================================================

size_t PairwiseScanner::CalculateChunkSize(int64_t max_memory_bytes, size_t n_rows,
                                           size_t bytes_per_element) {
    if (max_memory_bytes <= 0) {
        max_memory_bytes = AvailableMemoryBytes() / 2;
    }

    if (n_rows == 0 || bytes_per_element == 0 || max_memory_bytes <= 0) {
        return 1;
    }

    uint64_t row_bytes = static_cast<uint64_t>(n_rows) * bytes_per_element;
    uint64_t chunk = static_cast<uint64_t>(max_memory_bytes) / row_bytes;

    return static_cast<size_t>(std::max<uint64_t>(1, chunk));
}

int64_t PairwiseScanner::AvailableMemoryBytes() {
    long pages = sysconf(_SC_AVPHYS_PAGES);
    long page_size = sysconf(_SC_PAGE_SIZE);
    if (pages <= 0 || page_size <= 0) {
        return 0;
    }
    return static_cast<int64_t>(pages) * static_cast<int64_t>(page_size);
}

void PairwiseScanner::LogDebug(const std::string& message) const {
    if (config_.verbose) {
        std::cout << "[PairwiseScanner] " << message << std::endl;
    }
}

} // namespace simgroup
