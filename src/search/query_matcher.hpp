// File: src/search/query_matcher.hpp
#pragma once

#include "core/feature_value.hpp"
#include "similarity/similarity_metric.hpp"
#include "storage/lru_cache.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace simgroup {

/// One ranked corpus member
struct QueryMatch {
    std::string path;
    float score{0.0f};

    QueryMatch(std::string p, float s) : path(std::move(p)), score(s) {}

    bool operator==(const QueryMatch& other) const {
        return path == other.path && score == other.score;
    }
};

/// Ranked matches under rank slot 0, best first
using QueryResult = std::map<int, std::vector<QueryMatch>>;

/// Query configuration
struct QueryConfig {
    /// Cap on returned matches (ignored by return_only_closest)
    size_t max_results{50};

    /// Threshold in the metric's polarity; strict
    float threshold{0.0f};

    /// Return every member clearing the threshold against the first
    /// positive term instead of a capped ranking
    bool return_only_closest{false};

    /// Corpus member left out of the ranking (typically the query file)
    std::optional<std::string> exclude_path;

    static QueryConfig Default() {
        return QueryConfig{};
    }

    static QueryConfig TopK(size_t k, float threshold = 0.0f) {
        QueryConfig config;
        config.max_results = k;
        config.threshold = threshold;
        return config;
    }

    static QueryConfig ClosestOnly(float threshold) {
        QueryConfig config;
        config.threshold = threshold;
        config.return_only_closest = true;
        return config;
    }
};

/// Positive and negative query terms, already resolved to features
struct QueryTerms {
    std::vector<FeatureValue> positives;
    std::vector<FeatureValue> negatives;

    bool Empty() const { return positives.empty() && negatives.empty(); }
    size_t Size() const { return positives.size() + negatives.size(); }
};

/// QueryMatcher: ranks a corpus against positive/negative query terms
///
/// - one positive, no negative: members scoring strictly past the threshold,
///   best first, capped at max_results
/// - several terms: combined = mean(positive scores) - mean(negative scores),
///   best first, capped. A negative term pulls a member down rather than
///   excluding it.
/// - return_only_closest: members clearing the threshold against the first
///   positive term, best first, uncapped
///
/// "Best" follows the metric's polarity. Ties keep corpus order.
class QueryMatcher {
public:
    using TextEncoder = std::function<FeatureValue(const std::string&)>;
    using TextCache = LRUCache<std::string, FeatureValue>;

    explicit QueryMatcher(const SimilarityMetric& metric);

    /// @throws QueryError if there are no terms
    /// @throws NoResultsError if the corpus is empty
    QueryResult Search(const QueryTerms& terms,
                       const std::vector<std::string>& files,
                       const std::vector<FeatureValue>& features,
                       const QueryConfig& config = QueryConfig::Default()) const;

    /// Split comma-separated query text into trimmed, non-empty terms
    static std::vector<std::string> SplitTerms(const std::string& text);

    /// Encode each comma-separated term, consulting and filling `cache`
    /// @param cache Caller-owned cache, may be null
    /// @throws QueryError if the encoder fails
    static std::vector<FeatureValue> ResolveTextTerms(const std::string& text,
                                                      const TextEncoder& encoder,
                                                      TextCache* cache);

    /// Cache weighing entries by FeatureValue::EstimateByteSize
    static TextCache MakeTextCache(size_t capacity_bytes);

    struct Stats {
        size_t members_evaluated{0};
        size_t members_excluded{0};
        size_t results_returned{0};
    };

    const Stats& GetLastSearchStats() const { return last_stats_; }

private:
    const SimilarityMetric& metric_;
    mutable Stats last_stats_;

    std::vector<QueryMatch> SearchSingle(const FeatureValue& query,
                                         const std::vector<std::string>& files,
                                         const std::vector<FeatureValue>& features,
                                         size_t n, const QueryConfig& config) const;

    std::vector<QueryMatch> SearchCombined(const QueryTerms& terms,
                                           const std::vector<std::string>& files,
                                           const std::vector<FeatureValue>& features,
                                           size_t n, const QueryConfig& config) const;

    bool IsExcluded(const std::string& path, const QueryConfig& config) const;
    void SortBestFirst(std::vector<QueryMatch>& matches) const;
};

} // namespace simgroup
