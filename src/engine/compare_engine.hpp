// File: src/engine/compare_engine.hpp
#pragma once

#include "config/engine_config.hpp"
#include "core/feature_value.hpp"
#include "core/types.hpp"
#include "run/checkpointed_run.hpp"
#include "search/query_matcher.hpp"
#include "similarity/color_similarity.hpp"
#include "similarity/set_similarity.hpp"
#include "similarity/similarity_metric.hpp"
#include "similarity/text_similarity.hpp"
#include "storage/blob_store.hpp"
#include "storage/feature_store.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace simgroup {

/// CompareEngine - Unified interface for grouping and searching a corpus
///
/// One engine compares one corpus directory under one compare mode. The mode
/// selects the SimilarityMetric; everything downstream (scanner, assigner,
/// checkpointed run, query matcher) is metric agnostic.
///
/// Typical use:
///   engine.GatherFeatures(files, extractor);
///   RunResult groups = engine.RunGrouping();
///   QueryResult hits = engine.SearchByFile(path, extractor);
class CompareEngine {
public:
    /// Configuration for the compare engine
    struct Config {
        CompareMode mode{CompareMode::EMBEDDING};

        /// Corpus directory, part of every cache key
        std::string directory{"."};

        // Thresholds in the mode's polarity
        float threshold{0.9f};
        float duplicate_threshold{0.99f};
        float group_cutoff{0.1f};

        // Mode-specific metric settings
        ColorSimilarity::Config color;
        PromptSimilarity::Config prompts;
        ModelSetSimilarity::Config models;
        int32_t size_tolerance{0};

        // Feature gathering
        size_t max_files{0};                 // 0 = no limit
        bool overwrite_features{false};

        // Grouping
        bool store_checkpoints{true};
        bool overwrite_checkpoints{false};
        size_t checkpoint_interval{250};
        bool use_matrix_comparison{true};
        int64_t max_memory_bytes{0};

        // Search
        size_t max_results{50};
        bool return_only_closest{false};

        bool verbose{false};

        /// Engine settings for `directory` from a loaded EngineConfig
        /// @throws std::invalid_argument for an unknown mode
        static Config FromEngineConfig(const EngineConfig& engine_config,
                                       const std::string& directory);
    };

    /// Constructor
    /// @param blob_store Persistence for features and checkpoints
    /// @param config Engine configuration
    CompareEngine(std::shared_ptr<BlobStore> blob_store, const Config& config);

    // Disable copy and move
    CompareEngine(const CompareEngine&) = delete;
    CompareEngine& operator=(const CompareEngine&) = delete;
    CompareEngine(CompareEngine&&) = delete;
    CompareEngine& operator=(CompareEngine&&) = delete;

    /// Metric for the configured mode
    static std::unique_ptr<SimilarityMetric> CreateMetric(const Config& config);

    /// BlobStore named by the cache section ("sqlite" or "memory")
    /// @throws std::invalid_argument for an unknown store type
    static std::shared_ptr<BlobStore> CreateBlobStore(const EngineConfig& engine_config);

    void SetProgressListener(ProgressListener listener) { progress_listener_ = std::move(listener); }
    void SetConfirmCallback(CheckpointedRun::ConfirmCallback callback) {
        confirm_callback_ = std::move(callback);
    }

    // ========================================================================
    // Feature Gathering
    // ========================================================================

    /// Resolve features for the candidate files
    ///
    /// Duplicated paths are ignored, files failing extraction are skipped and
    /// at most `max_files` files are kept. The feature cache is saved before
    /// returning.
    /// @return Number of usable files
    /// @throws NoResultsError if no file is usable
    /// @throws FeatureShapeError if a feature disagrees with the cached shape
    size_t GatherFeatures(const std::vector<std::string>& files,
                          const FeatureExtractor& extractor);

    // ========================================================================
    // Grouping
    // ========================================================================

    /// Group the gathered corpus
    /// @throws NoResultsError if nothing was gathered
    /// @throws CheckpointMismatchError, RunCancelled
    RunResult RunGrouping(const CancellationToken* cancel = nullptr);

    /// Probable duplicate pairs of the last grouping run
    std::vector<ProbableDuplicateSet::PathPair> GetProbableDuplicates() const;

    /// Groups of the last grouping run
    const GroupMembership& GetGroups() const { return last_result_.membership; }

    // ========================================================================
    // Search
    // ========================================================================

    /// Rank the gathered corpus against resolved query terms
    /// @throws QueryError, NoResultsError
    QueryResult RunSearch(const QueryTerms& terms,
                          const std::optional<std::string>& exclude_path = std::nullopt) const;

    /// Rank the corpus against one file, which is left out of the ranking
    /// @throws QueryError if the file's feature cannot be extracted
    QueryResult SearchByFile(const std::string& path, const FeatureExtractor& extractor);

    /// Rank the corpus against comma-separated positive and negative text
    ///
    /// Embedding mode needs `encoder` and uses a third of the threshold.
    /// Without an encoder, prompt, model and size modes build the feature
    /// from the text itself.
    /// @param cache Caller-owned text feature cache, may be null
    /// @throws QueryError if there are no terms or a term cannot be encoded
    QueryResult SearchByText(const std::string& positive_text,
                             const std::string& negative_text,
                             const QueryMatcher::TextEncoder& encoder = nullptr,
                             QueryMatcher::TextCache* cache = nullptr) const;

    /// Whether two files are related under the mode's threshold
    /// @throws QueryError if either feature cannot be extracted
    bool IsRelated(const std::string& path_a, const std::string& path_b,
                   const FeatureExtractor& extractor);

    // ========================================================================
    // Corpus Maintenance
    // ========================================================================

    /// Drop files from the corpus and from the last grouping result
    /// @return Number of files removed
    size_t RemoveFromGroups(const std::vector<std::string>& paths);

    /// Append files not yet in the corpus
    /// @return Number of files added
    size_t ReaddFiles(const std::vector<std::string>& paths, const FeatureExtractor& extractor);

    // ========================================================================
    // Information
    // ========================================================================

    const std::vector<std::string>& GetFilesFound() const { return files_found_; }
    const std::vector<FeatureValue>& GetFeatures() const { return features_; }
    const SimilarityMetric& GetMetric() const { return *metric_; }
    const FeatureStore& GetFeatureStore() const { return *feature_store_; }
    const Config& GetConfig() const { return config_; }

    /// Effective search threshold for text-only queries
    float TextSearchThreshold() const;

private:
    std::shared_ptr<BlobStore> blob_store_;
    Config config_;

    std::unique_ptr<SimilarityMetric> metric_;
    std::unique_ptr<FeatureStore> feature_store_;

    std::vector<std::string> files_found_;
    std::vector<FeatureValue> features_;

    RunResult last_result_;

    /// Set when the corpus changed after gathering; the next run starts fresh
    bool corpus_changed_{false};

    ProgressListener progress_listener_;
    CheckpointedRun::ConfirmCallback confirm_callback_;

    QueryConfig MakeQueryConfig(float threshold) const;

    /// Gathered feature of `path`, extracted on demand for other files
    FeatureValue RequireFeature(const std::string& path, const FeatureExtractor& extractor);

    void ReportProgress(const std::string& label, float percent) const;
    void LogDebug(const std::string& message) const;
};

} // namespace simgroup
