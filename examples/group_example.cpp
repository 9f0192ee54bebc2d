// File: examples/group_example.cpp
//
// Grouping and search example using the SimGroup engine.
// Demonstrates:
// - Loading an EngineConfig (or using defaults)
// - Gathering features through a caller-supplied extractor
// - Grouping a corpus and listing probable duplicates
// - Searching by file and by text

#include "config/engine_config.hpp"
#include "core/errors.hpp"
#include "engine/compare_engine.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <map>

using namespace simgroup;

/// Synthetic embedding: three themes, five variations each, plus a few loners
std::map<std::string, FeatureValue> MakeCorpus() {
    std::map<std::string, FeatureValue> corpus;

    for (int theme = 0; theme < 3; ++theme) {
        for (int variant = 0; variant < 5; ++variant) {
            std::vector<float> embedding(8, 0.0f);
            embedding[theme] = 1.0f;
            embedding[3 + variant] = 0.05f;
            std::string path = "/photos/theme" + std::to_string(theme) + "_" +
                               std::to_string(variant) + ".png";
            corpus[path] = FeatureValue::Dense(embedding);
        }
    }

    for (int loner = 0; loner < 3; ++loner) {
        std::vector<float> embedding(8, 0.0f);
        embedding[7] = 1.0f;
        embedding[loner] = 0.9f * static_cast<float>(loner) - 0.9f;
        corpus["/photos/loner" + std::to_string(loner) + ".png"] = FeatureValue::Dense(embedding);
    }

    return corpus;
}

int main(int argc, char** argv) {
    std::cout << "=== SimGroup Grouping Example ===\n\n";

    // Step 1: Configuration
    std::cout << "Step 1: Loading configuration...\n";

    EngineConfig engine_config = EngineConfig::Default();
    if (argc > 1) {
        auto loaded = EngineConfig::LoadFromFile(argv[1]);
        if (!loaded) {
            std::cerr << "Could not load " << argv[1] << ", using defaults\n";
        } else {
            engine_config = *loaded;
        }
    }
    engine_config.engine.mode = "embedding";
    engine_config.cache.store_type = "memory";

    auto blob_store = CompareEngine::CreateBlobStore(engine_config);
    CompareEngine engine(blob_store,
                         CompareEngine::Config::FromEngineConfig(engine_config, "/photos"));
    std::cout << "  Mode: " << ToString(engine.GetConfig().mode)
              << ", metric: " << engine.GetMetric().GetName() << "\n\n";

    // Step 2: Gather features
    std::cout << "Step 2: Gathering features...\n";

    auto corpus = MakeCorpus();
    std::vector<std::string> files;
    for (const auto& [path, feature] : corpus) {
        files.push_back(path);
    }

    FeatureExtractor extractor = [&corpus](const std::string& path) -> std::optional<FeatureValue> {
        auto it = corpus.find(path);
        if (it == corpus.end()) {
            return std::nullopt;
        }
        return it->second;
    };

    engine.SetProgressListener([](const std::string& label, float percent) {
        std::cout << "  " << label << ": " << static_cast<int>(percent) << "%\n";
    });

    try {
        size_t usable = engine.GatherFeatures(files, extractor);
        std::cout << "  Usable files: " << usable << "\n\n";
    } catch (const NoResultsError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    // Step 3: Group
    std::cout << "Step 3: Grouping...\n";

    RunResult result = engine.RunGrouping();
    for (const auto& [group_id, members] : result.membership) {
        std::cout << "  Group " << group_id << " (" << members.size() << " files)\n";
        for (const auto& [path, score] : members) {
            std::cout << "    " << path << "  " << std::fixed << std::setprecision(4) << score << "\n";
        }
    }
    std::cout << "  Probable duplicates: " << engine.GetProbableDuplicates().size() << "\n\n";

    // Step 4: Search by file
    std::cout << "Step 4: Searching for files like /photos/theme1_0.png...\n";

    QueryResult by_file = engine.SearchByFile("/photos/theme1_0.png", extractor);
    for (const auto& match : by_file[0]) {
        std::cout << "    " << match.path << "  " << std::fixed << std::setprecision(4)
                  << match.score << "\n";
    }
    std::cout << "\n";

    // Step 5: Search by text with a toy encoder
    std::cout << "Step 5: Searching for \"theme two\" minus \"loner\"...\n";

    QueryMatcher::TextEncoder encoder = [](const std::string& text) {
        std::vector<float> embedding(8, 0.0f);
        embedding[text.find("loner") != std::string::npos ? 7 : 2] = 1.0f;
        return FeatureValue::Dense(embedding);
    };
    auto text_cache = QueryMatcher::MakeTextCache(engine_config.cache.text_cache_bytes);

    try {
        QueryResult by_text = engine.SearchByText("theme two", "loner", encoder, &text_cache);
        for (const auto& match : by_text[0]) {
            std::cout << "    " << match.path << "  " << std::fixed << std::setprecision(4)
                      << match.score << "\n";
        }
    } catch (const QueryError& e) {
        std::cerr << "Search failed: " << e.what() << "\n";
    }

    std::cout << "\n=== Example completed successfully ===\n";
    return 0;
}
