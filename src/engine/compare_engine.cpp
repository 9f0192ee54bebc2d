// File: src/engine/compare_engine.cpp
#include "compare_engine.hpp"
#include "core/errors.hpp"
#include "similarity/cosine_similarity.hpp"
#include "similarity/size_similarity.hpp"
#include "storage/memory_blob_store.hpp"
#include "storage/sqlite_blob_store.hpp"
#include <algorithm>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <unordered_set>

namespace simgroup {

namespace {

constexpr float kProgressStep = 10.0f;
constexpr FileIndex kRemovedIndex = std::numeric_limits<FileIndex>::max();

const char* kFeaturesPayload = "features";
const char* kGroupsPayload = "groups";

std::string Trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

} // namespace

// ============================================================================
// Configuration
// ============================================================================

CompareEngine::Config CompareEngine::Config::FromEngineConfig(const EngineConfig& engine_config,
                                                              const std::string& directory) {
    Config config;
    config.mode = ParseCompareMode(engine_config.engine.mode);
    config.directory = directory;

    const ModeThresholds& thresholds = engine_config.ThresholdsFor(engine_config.engine.mode);
    config.threshold = thresholds.threshold;
    config.duplicate_threshold = thresholds.duplicate_threshold;
    config.group_cutoff = thresholds.group_cutoff;

    config.color.min_passing = engine_config.color.min_passing;
    config.color.run_length = engine_config.color.run_length;
    config.color.min_clustered = engine_config.color.min_clustered;
    config.prompts.positive_weight = engine_config.prompts.positive_weight;
    config.prompts.negative_weight = engine_config.prompts.negative_weight;
    config.models.model_weight = engine_config.models.model_weight;
    config.models.lora_weight = engine_config.models.lora_weight;
    config.size_tolerance = engine_config.size.tolerance;

    config.max_files = engine_config.engine.max_files;
    config.overwrite_features = engine_config.cache.overwrite_features;

    config.store_checkpoints = engine_config.engine.store_checkpoints;
    config.overwrite_checkpoints = engine_config.engine.overwrite_checkpoints;
    config.checkpoint_interval = engine_config.engine.checkpoint_interval;
    config.use_matrix_comparison = engine_config.engine.use_matrix_comparison;
    config.max_memory_bytes = engine_config.engine.max_memory_bytes;

    config.max_results = engine_config.search.max_results;
    config.return_only_closest = engine_config.search.return_only_closest;

    config.verbose = engine_config.engine.verbose;
    return config;
}

// ============================================================================
// Constructor & Initialization
// ============================================================================

CompareEngine::CompareEngine(std::shared_ptr<BlobStore> blob_store, const Config& config)
    : blob_store_(std::move(blob_store)), config_(config) {
    if (!blob_store_) {
        throw std::invalid_argument("CompareEngine requires a BlobStore");
    }

    metric_ = CreateMetric(config_);

    FeatureStore::Config store_config;
    store_config.cache_key = MakeCacheKey(config_.directory, config_.mode, kFeaturesPayload);
    store_config.expected_kind = metric_->GetFeatureKind();
    store_config.overwrite = config_.overwrite_features;
    store_config.verbose = config_.verbose;
    feature_store_ = std::make_unique<FeatureStore>(blob_store_, store_config);

    LogDebug("Compare mode " + std::string(ToString(config_.mode)) + " with metric " +
             metric_->GetName() + " for " + config_.directory);
}

std::unique_ptr<SimilarityMetric> CompareEngine::CreateMetric(const Config& config) {
    switch (config.mode) {
        case CompareMode::EMBEDDING:
            return std::make_unique<CosineSimilarity>();
        case CompareMode::COLOR:
            return std::make_unique<ColorSimilarity>(config.color);
        case CompareMode::PROMPTS:
            return std::make_unique<PromptSimilarity>(config.prompts);
        case CompareMode::MODELS:
            return std::make_unique<ModelSetSimilarity>(config.models);
        case CompareMode::SIZE:
            return std::make_unique<SizeSimilarity>(config.size_tolerance);
    }
    throw std::invalid_argument("Unknown compare mode");
}

std::shared_ptr<BlobStore> CompareEngine::CreateBlobStore(const EngineConfig& engine_config) {
    if (engine_config.cache.store_type == "memory") {
        return std::make_shared<MemoryBlobStore>();
    } else if (engine_config.cache.store_type == "sqlite") {
        SqliteBlobStore::Config db_config;
        db_config.db_path = engine_config.cache.database_path;
        return std::make_shared<SqliteBlobStore>(db_config);
    }
    throw std::invalid_argument("Unknown store type: " + engine_config.cache.store_type);
}

// ============================================================================
// Feature Gathering
// ============================================================================

size_t CompareEngine::GatherFeatures(const std::vector<std::string>& files,
                                     const FeatureExtractor& extractor) {
    files_found_.clear();
    features_.clear();
    last_result_ = RunResult{};
    corpus_changed_ = false;

    feature_store_->Load();

    size_t limit = config_.max_files == 0 ? files.size() : std::min(config_.max_files, files.size());
    std::unordered_set<std::string> seen;
    size_t skipped = 0;
    float next_progress = kProgressStep;

    LogDebug("Gathering features for up to " + std::to_string(limit) + " files");

    for (const auto& path : files) {
        if (files_found_.size() >= limit) {
            break;
        }
        if (!seen.insert(path).second) {
            continue;
        }

        auto feature = feature_store_->GetOrCompute(path, extractor);
        if (!feature) {
            ++skipped;
            continue;
        }

        files_found_.push_back(path);
        features_.push_back(std::move(*feature));

        float percent = 100.0f * static_cast<float>(files_found_.size()) / static_cast<float>(limit);
        if (percent >= next_progress) {
            ReportProgress("Gathering image data", percent);
            while (next_progress <= percent) {
                next_progress += kProgressStep;
            }
        }
    }

    feature_store_->Save();

    LogDebug("Gathered " + std::to_string(files_found_.size()) + " files, skipped " +
             std::to_string(skipped));

    if (files_found_.empty()) {
        throw NoResultsError("No usable files found in " + config_.directory);
    }
    return files_found_.size();
}

// ============================================================================
// Grouping
// ============================================================================

RunResult CompareEngine::RunGrouping(const CancellationToken* cancel) {
    if (files_found_.empty()) {
        throw NoResultsError("No files gathered for " + config_.directory);
    }

    CheckpointedRun::Config run_config;
    run_config.checkpoint_key = MakeCacheKey(config_.directory, config_.mode, kGroupsPayload);
    run_config.store_checkpoints = config_.store_checkpoints;
    run_config.overwrite = config_.overwrite_checkpoints || corpus_changed_;
    run_config.checkpoint_interval = config_.checkpoint_interval;
    run_config.verbose = config_.verbose;

    bool dense = metric_->GetFeatureKind() == FeatureKind::DENSE;
    run_config.scan.policy = (config_.use_matrix_comparison && dense) ? ScanPolicy::MATRIX
                                                                     : ScanPolicy::ROTATION;
    run_config.scan.threshold = config_.threshold;
    run_config.scan.max_memory_bytes = config_.max_memory_bytes;
    run_config.scan.verbose = config_.verbose;

    run_config.grouping.group_cutoff = config_.group_cutoff;
    run_config.grouping.duplicate_threshold = config_.duplicate_threshold;

    if (corpus_changed_) {
        LogDebug("Corpus changed since gathering, discarding stored groups");
    }

    CheckpointedRun run(blob_store_, *metric_, run_config);
    if (progress_listener_) {
        run.SetProgressListener(progress_listener_);
    }
    if (confirm_callback_) {
        run.SetConfirmCallback(confirm_callback_);
    }

    last_result_ = run.Run(files_found_, features_, cancel);
    corpus_changed_ = false;
    return last_result_;
}

std::vector<ProbableDuplicateSet::PathPair> CompareEngine::GetProbableDuplicates() const {
    return last_result_.duplicates;
}

// ============================================================================
// Search
// ============================================================================

QueryResult CompareEngine::RunSearch(const QueryTerms& terms,
                                     const std::optional<std::string>& exclude_path) const {
    QueryMatcher matcher(*metric_);
    QueryConfig query_config = MakeQueryConfig(config_.threshold);
    query_config.exclude_path = exclude_path;
    return matcher.Search(terms, files_found_, features_, query_config);
}

QueryResult CompareEngine::SearchByFile(const std::string& path, const FeatureExtractor& extractor) {
    QueryTerms terms;
    terms.positives.push_back(RequireFeature(path, extractor));
    LogDebug("Searching " + std::to_string(files_found_.size()) + " files for " + path);
    return RunSearch(terms, path);
}

QueryResult CompareEngine::SearchByText(const std::string& positive_text,
                                        const std::string& negative_text,
                                        const QueryMatcher::TextEncoder& encoder,
                                        QueryMatcher::TextCache* cache) const {
    QueryTerms terms;

    if (encoder) {
        terms.positives = QueryMatcher::ResolveTextTerms(positive_text, encoder, cache);
        terms.negatives = QueryMatcher::ResolveTextTerms(negative_text, encoder, cache);
    } else {
        switch (config_.mode) {
            case CompareMode::PROMPTS: {
                // One prompt pair, matched as a whole
                std::string positive = Trim(positive_text);
                std::string negative = Trim(negative_text);
                if (!positive.empty() || !negative.empty()) {
                    terms.positives.push_back(FeatureValue::Prompts(positive, negative));
                }
                break;
            }
            case CompareMode::MODELS: {
                auto positive = QueryMatcher::SplitTerms(positive_text);
                auto negative = QueryMatcher::SplitTerms(negative_text);
                if (!positive.empty()) {
                    terms.positives.push_back(FeatureValue::Models(std::move(positive), {}));
                }
                if (!negative.empty()) {
                    terms.negatives.push_back(FeatureValue::Models(std::move(negative), {}));
                }
                break;
            }
            case CompareMode::SIZE: {
                for (const auto* text : {&positive_text, &negative_text}) {
                    if (Trim(*text).empty()) {
                        continue;
                    }
                    auto size = ParseSizeSearch(*text);
                    if (!size) {
                        throw QueryError("Not a size: \"" + *text + "\"");
                    }
                    auto& target = (text == &positive_text) ? terms.positives : terms.negatives;
                    target.push_back(FeatureValue::Size(size->width, size->height));
                }
                break;
            }
            default:
                throw QueryError(std::string("Text search in ") + ToString(config_.mode) +
                                 " mode requires a text encoder");
        }
    }

    if (terms.Empty()) {
        throw QueryError("Search text has no terms");
    }

    QueryMatcher matcher(*metric_);
    return matcher.Search(terms, files_found_, features_, MakeQueryConfig(TextSearchThreshold()));
}

bool CompareEngine::IsRelated(const std::string& path_a, const std::string& path_b,
                              const FeatureExtractor& extractor) {
    FeatureValue a = RequireFeature(path_a, extractor);
    FeatureValue b = RequireFeature(path_b, extractor);
    return metric_->Evaluate(a, b, config_.threshold).related;
}

float CompareEngine::TextSearchThreshold() const {
    if (config_.mode == CompareMode::EMBEDDING) {
        return config_.threshold / 3.0f;
    }
    return config_.threshold;
}

QueryConfig CompareEngine::MakeQueryConfig(float threshold) const {
    QueryConfig query_config = QueryConfig::TopK(config_.max_results, threshold);
    query_config.return_only_closest = config_.return_only_closest;
    return query_config;
}

FeatureValue CompareEngine::RequireFeature(const std::string& path, const FeatureExtractor& extractor) {
    auto it = std::find(files_found_.begin(), files_found_.end(), path);
    if (it != files_found_.end()) {
        return features_[static_cast<size_t>(it - files_found_.begin())];
    }

    auto feature = feature_store_->GetOrCompute(path, extractor);
    if (!feature) {
        throw QueryError("Failed to extract features from " + path);
    }
    return *feature;
}

// ============================================================================
// Corpus Maintenance
// ============================================================================

size_t CompareEngine::RemoveFromGroups(const std::vector<std::string>& paths) {
    std::unordered_set<std::string> removed(paths.begin(), paths.end());

    std::vector<FileIndex> new_index(files_found_.size(), kRemovedIndex);
    std::vector<std::string> kept_files;
    std::vector<FeatureValue> kept_features;
    kept_files.reserve(files_found_.size());
    kept_features.reserve(features_.size());

    for (size_t i = 0; i < files_found_.size(); ++i) {
        if (removed.count(files_found_[i])) {
            continue;
        }
        new_index[i] = kept_files.size();
        kept_files.push_back(files_found_[i]);
        if (i < features_.size()) {
            kept_features.push_back(std::move(features_[i]));
        }
    }

    size_t count = files_found_.size() - kept_files.size();
    files_found_ = std::move(kept_files);
    features_ = std::move(kept_features);

    if (count == 0) {
        return 0;
    }

    GroupAssignment assignment;
    for (const auto& [index, member] : last_result_.assignment) {
        if (index < new_index.size() && new_index[index] != kRemovedIndex) {
            assignment[new_index[index]] = member;
        }
    }
    last_result_.assignment = std::move(assignment);

    for (auto it = last_result_.membership.begin(); it != last_result_.membership.end();) {
        for (const auto& path : removed) {
            it->second.erase(path);
        }
        if (it->second.size() < 2) {
            it = last_result_.membership.erase(it);
        } else {
            ++it;
        }
    }

    auto& duplicates = last_result_.duplicates;
    duplicates.erase(std::remove_if(duplicates.begin(), duplicates.end(),
                                    [&removed](const ProbableDuplicateSet::PathPair& pair) {
                                        return removed.count(pair.first) || removed.count(pair.second);
                                    }),
                     duplicates.end());

    corpus_changed_ = true;
    LogDebug("Removed " + std::to_string(count) + " files, " +
             std::to_string(files_found_.size()) + " remain");
    return count;
}

size_t CompareEngine::ReaddFiles(const std::vector<std::string>& paths,
                                 const FeatureExtractor& extractor) {
    std::unordered_set<std::string> present(files_found_.begin(), files_found_.end());
    size_t added = 0;

    for (const auto& path : paths) {
        if (present.count(path)) {
            continue;
        }

        auto feature = feature_store_->GetOrCompute(path, extractor);
        if (!feature) {
            continue;
        }

        files_found_.push_back(path);
        features_.push_back(std::move(*feature));
        present.insert(path);
        ++added;
        LogDebug("Readded file to compare: " + path);
    }

    if (added > 0) {
        feature_store_->Save();
        corpus_changed_ = true;
    }
    return added;
}

// ============================================================================
// Helpers
// ============================================================================

void CompareEngine::ReportProgress(const std::string& label, float percent) const {
    if (progress_listener_) {
        progress_listener_(label, percent);
    }
}

void CompareEngine::LogDebug(const std::string& message) const {
    if (config_.verbose) {
        std::cout << "[CompareEngine] " << message << std::endl;
    }
}

} // namespace simgroup
