// File: src/similarity/text_similarity.hpp
#pragma once

#include "similarity_metric.hpp"
#include <set>
#include <string>

namespace simgroup {

/// Fuzzy similarity of generation prompts
///
/// Each prompt string is compared with a graduated fallback, stopping at the
/// first check that applies:
///   1. case-insensitive trimmed equality            -> 1.0
///   2. one contains the other                       -> 0.9
///   3. Jaccard overlap of comma/newline elements,
///      x1.3 (max 0.95) when two or more overlap     -> if > 0
///   4. word-level fuzzy matching, capped at 0.7
/// Empty or blank input scores 0.
///
/// The pair score weights the positive prompt 0.7 and the negative 0.3.
/// When neither side has a negative prompt the positive score is used alone.
class PromptSimilarity : public SimilarityMetric {
public:
    struct Config {
        float positive_weight{0.7f};
        float negative_weight{0.3f};
    };

    PromptSimilarity() = default;
    explicit PromptSimilarity(const Config& config) : config_(config) {}

    float Score(const FeatureValue& a, const FeatureValue& b) const override;

    Polarity GetPolarity() const override { return Polarity::HIGHER_IS_BETTER; }
    FeatureKind GetFeatureKind() const override { return FeatureKind::PROMPTS; }
    std::string GetName() const override { return "Prompt"; }

    /// Similarity of two free-text strings in [0, 1]
    static float ComputeTextSimilarity(const std::string& text1, const std::string& text2);

    /// Word-level fuzzy match: exact words count 1.0, substring matches
    /// between words of 3+ characters 0.8, edit distance <= 2 0.6,
    /// normalized by the number of unique words
    static float FuzzyWordSimilarity(const std::set<std::string>& words1,
                                     const std::set<std::string>& words2);

    static size_t LevenshteinDistance(const std::string& s1, const std::string& s2);

private:
    Config config_;
};

} // namespace simgroup
