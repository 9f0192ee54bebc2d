// File: src/similarity/text_similarity.cpp
#include "similarity/text_similarity.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>
#include <vector>

namespace simgroup {

namespace {

std::string ToLower(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string Trim(const std::string& text) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(text.begin(), text.end(), not_space);
    auto end = std::find_if(text.rbegin(), text.rend(), not_space).base();
    if (begin >= end) {
        return "";
    }
    return std::string(begin, end);
}

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// Elements from splitting on each structural separator in turn
std::set<std::string> SplitElements(const std::string& text) {
    static const char* kSeparators[] = {",", "\n", "\r\n"};

    std::set<std::string> elements;
    for (const char* separator : kSeparators) {
        std::string sep(separator);
        size_t start = 0;
        while (true) {
            size_t pos = text.find(sep, start);
            std::string piece = Trim(text.substr(start, pos == std::string::npos ? std::string::npos
                                                                                 : pos - start));
            if (!piece.empty()) {
                elements.insert(piece);
            }
            if (pos == std::string::npos) {
                break;
            }
            start = pos + sep.size();
        }
    }
    return elements;
}

std::set<std::string> SplitWords(const std::string& text) {
    std::set<std::string> words;
    std::istringstream iss(text);
    std::string word;
    while (iss >> word) {
        words.insert(word);
    }
    return words;
}

} // namespace

float PromptSimilarity::Score(const FeatureValue& a, const FeatureValue& b) const {
    const PromptPair& pa = a.AsPrompts();
    const PromptPair& pb = b.AsPrompts();

    float positive = ComputeTextSimilarity(pa.positive, pb.positive);
    // Without negatives on either side the pair is scored on the positive prompt alone
    if (pa.negative.empty() && pb.negative.empty()) {
        return positive;
    }

    float negative = ComputeTextSimilarity(pa.negative, pb.negative);
    return positive * config_.positive_weight + negative * config_.negative_weight;
}

float PromptSimilarity::ComputeTextSimilarity(const std::string& text1, const std::string& text2) {
    std::string lower1 = Trim(ToLower(text1));
    std::string lower2 = Trim(ToLower(text2));
    if (lower1.empty() || lower2.empty()) {
        return 0.0f;
    }

    if (lower1 == lower2) {
        return 1.0f;
    }
    if (Contains(lower1, lower2) || Contains(lower2, lower1)) {
        return 0.9f;
    }

    std::set<std::string> elements1 = SplitElements(lower1);
    std::set<std::string> elements2 = SplitElements(lower2);
    if (!elements1.empty() && !elements2.empty()) {
        std::vector<std::string> intersection;
        std::set_intersection(elements1.begin(), elements1.end(),
                              elements2.begin(), elements2.end(),
                              std::back_inserter(intersection));
        size_t union_size = elements1.size() + elements2.size() - intersection.size();

        float element_similarity = static_cast<float>(intersection.size()) /
                                   static_cast<float>(union_size);
        if (element_similarity > 0.0f) {
            if (intersection.size() >= 2) {
                element_similarity = std::min(0.95f, element_similarity * 1.3f);
            }
            return element_similarity;
        }
    }

    std::set<std::string> words1 = SplitWords(lower1);
    std::set<std::string> words2 = SplitWords(lower2);
    if (words1.empty() || words2.empty()) {
        return 0.0f;
    }

    return std::min(0.7f, FuzzyWordSimilarity(words1, words2));
}

float PromptSimilarity::FuzzyWordSimilarity(const std::set<std::string>& words1,
                                            const std::set<std::string>& words2) {
    std::set<std::string> exact;
    std::set_intersection(words1.begin(), words1.end(), words2.begin(), words2.end(),
                          std::inserter(exact, exact.begin()));

    std::set<std::pair<std::string, std::string>> substring_matches;
    for (const auto& w1 : words1) {
        for (const auto& w2 : words2) {
            if (w1 != w2 && w1.size() >= 3 && w2.size() >= 3 &&
                (Contains(w2, w1) || Contains(w1, w2))) {
                substring_matches.emplace(w1, w2);
            }
        }
    }

    std::set<std::pair<std::string, std::string>> fuzzy_matches;
    for (const auto& w1 : words1) {
        if (exact.count(w1)) continue;
        for (const auto& w2 : words2) {
            if (w1 == w2 || exact.count(w2)) continue;
            if (w1.size() < 3 || w2.size() < 3) continue;
            if (substring_matches.count({w1, w2}) || substring_matches.count({w2, w1})) continue;
            if (LevenshteinDistance(w1, w2) <= 2) {
                fuzzy_matches.emplace(w1, w2);
            }
        }
    }

    float total_matches = static_cast<float>(exact.size()) +
                          static_cast<float>(substring_matches.size()) * 0.8f +
                          static_cast<float>(fuzzy_matches.size()) * 0.6f;

    std::set<std::string> all_words = words1;
    all_words.insert(words2.begin(), words2.end());

    return all_words.empty() ? 0.0f : total_matches / static_cast<float>(all_words.size());
}

size_t PromptSimilarity::LevenshteinDistance(const std::string& s1, const std::string& s2) {
    if (s1.size() < s2.size()) {
        return LevenshteinDistance(s2, s1);
    }
    if (s2.empty()) {
        return s1.size();
    }

    std::vector<size_t> previous(s2.size() + 1);
    std::vector<size_t> current(s2.size() + 1);
    for (size_t j = 0; j <= s2.size(); ++j) {
        previous[j] = j;
    }

    for (size_t i = 0; i < s1.size(); ++i) {
        current[0] = i + 1;
        for (size_t j = 0; j < s2.size(); ++j) {
            size_t insertion = previous[j + 1] + 1;
            size_t deletion = current[j] + 1;
            size_t substitution = previous[j] + (s1[i] != s2[j] ? 1 : 0);
            current[j + 1] = std::min({insertion, deletion, substitution});
        }
        std::swap(previous, current);
    }

    return previous[s2.size()];
}

} // namespace simgroup
