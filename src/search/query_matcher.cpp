// File: src/search/query_matcher.cpp
#include "search/query_matcher.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstddef>

namespace simgroup {

QueryMatcher::QueryMatcher(const SimilarityMetric& metric) : metric_(metric) {}

QueryResult QueryMatcher::Search(const QueryTerms& terms,
                                 const std::vector<std::string>& files,
                                 const std::vector<FeatureValue>& features,
                                 const QueryConfig& config) const {
    if (terms.Empty()) {
        throw QueryError("Query has no positive or negative terms");
    }

    last_stats_ = Stats{};

    size_t n = std::min(files.size(), features.size());
    if (n == 0) {
        throw NoResultsError("No corpus members to rank");
    }

    std::vector<QueryMatch> matches;
    if (config.return_only_closest && !terms.positives.empty()) {
        matches = SearchSingle(terms.positives[0], files, features, n, config);
    } else if (terms.positives.size() == 1 && terms.negatives.empty()) {
        matches = SearchSingle(terms.positives[0], files, features, n, config);
        if (matches.size() > config.max_results) {
            matches.erase(matches.begin() + static_cast<std::ptrdiff_t>(config.max_results),
                          matches.end());
        }
    } else {
        matches = SearchCombined(terms, files, features, n, config);
    }

    last_stats_.results_returned = matches.size();

    QueryResult result;
    result[0] = std::move(matches);
    return result;
}

std::vector<QueryMatch> QueryMatcher::SearchSingle(const FeatureValue& query,
                                                   const std::vector<std::string>& files,
                                                   const std::vector<FeatureValue>& features,
                                                   size_t n, const QueryConfig& config) const {
    std::vector<QueryMatch> matches;

    for (size_t i = 0; i < n; ++i) {
        if (IsExcluded(files[i], config)) {
            last_stats_.members_excluded++;
            continue;
        }
        last_stats_.members_evaluated++;

        MetricResult result = metric_.Evaluate(query, features[i], config.threshold);
        if (result.related) {
            matches.emplace_back(files[i], result.score);
        }
    }

    SortBestFirst(matches);
    return matches;
}

std::vector<QueryMatch> QueryMatcher::SearchCombined(const QueryTerms& terms,
                                                     const std::vector<std::string>& files,
                                                     const std::vector<FeatureValue>& features,
                                                     size_t n, const QueryConfig& config) const {
    std::vector<QueryMatch> matches;
    matches.reserve(n);

    for (size_t i = 0; i < n; ++i) {
        if (IsExcluded(files[i], config)) {
            last_stats_.members_excluded++;
            continue;
        }
        last_stats_.members_evaluated++;

        float positive_avg = 0.0f;
        if (!terms.positives.empty()) {
            for (const auto& term : terms.positives) {
                positive_avg += metric_.Score(term, features[i]);
            }
            positive_avg /= static_cast<float>(terms.positives.size());
        }

        float negative_avg = 0.0f;
        if (!terms.negatives.empty()) {
            for (const auto& term : terms.negatives) {
                negative_avg += metric_.Score(term, features[i]);
            }
            negative_avg /= static_cast<float>(terms.negatives.size());
        }

        matches.emplace_back(files[i], positive_avg - negative_avg);
    }

    SortBestFirst(matches);
    if (matches.size() > config.max_results) {
        matches.erase(matches.begin() + static_cast<std::ptrdiff_t>(config.max_results),
                      matches.end());
    }
    return matches;
}

bool QueryMatcher::IsExcluded(const std::string& path, const QueryConfig& config) const {
    return config.exclude_path && *config.exclude_path == path;
}

void QueryMatcher::SortBestFirst(std::vector<QueryMatch>& matches) const {
    std::stable_sort(matches.begin(), matches.end(),
                     [this](const QueryMatch& a, const QueryMatch& b) {
                         return metric_.IsBetter(a.score, b.score);
                     });
}

// ============================================================================
// Text terms
// ============================================================================

std::vector<std::string> QueryMatcher::SplitTerms(const std::string& text) {
    std::vector<std::string> terms;

    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        size_t end = comma == std::string::npos ? text.size() : comma;

        size_t first = start;
        size_t last = end;
        while (first < last && std::isspace(static_cast<unsigned char>(text[first]))) ++first;
        while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1]))) --last;
        if (last > first) {
            terms.push_back(text.substr(first, last - first));
        }

        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }

    return terms;
}

std::vector<FeatureValue> QueryMatcher::ResolveTextTerms(const std::string& text,
                                                         const TextEncoder& encoder,
                                                         TextCache* cache) {
    std::vector<FeatureValue> features;

    for (const auto& term : SplitTerms(text)) {
        if (cache) {
            if (auto cached = cache->Get(term)) {
                features.push_back(std::move(*cached));
                continue;
            }
        }

        FeatureValue value;
        try {
            value = encoder(term);
        } catch (const std::exception& e) {
            throw QueryError("Failed to encode search text \"" + term + "\": " + e.what());
        }

        if (cache) {
            cache->Put(term, value);
        }
        features.push_back(std::move(value));
    }

    return features;
}

QueryMatcher::TextCache QueryMatcher::MakeTextCache(size_t capacity_bytes) {
    return TextCache(capacity_bytes, [](const std::string& key, const FeatureValue& value) {
        return key.capacity() + value.EstimateByteSize();
    });
}

} // namespace simgroup
