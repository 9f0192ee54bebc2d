// File: src/config/engine_config.cpp
//
// YAML configuration implementation for the SimGroup compare engine

#include "config/engine_config.hpp"
#include "core/types.hpp"
#include <yaml.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace simgroup {

// Helper function to read string from YAML scalar
static std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                       event->data.scalar.length);
}

// Helper to convert string to bool
static bool ParseBool(const std::string& value) {
    return (value == "true" || value == "True" || value == "TRUE" ||
            value == "yes" || value == "Yes" || value == "YES" ||
            value == "1" || value == "on" || value == "On" || value == "ON");
}

static const char* BoolString(bool value) {
    return value ? "true" : "false";
}

// Keys shared by every per-mode section
static bool ApplyThresholdKey(ModeThresholds& thresholds, const std::string& key,
                              const std::string& value) {
    if (key == "threshold") thresholds.threshold = std::stof(value);
    else if (key == "duplicate_threshold") thresholds.duplicate_threshold = std::stof(value);
    else if (key == "group_cutoff") thresholds.group_cutoff = std::stof(value);
    else return false;
    return true;
}

static void WriteThresholds(std::ostringstream& ss, const ModeThresholds& thresholds) {
    ss << "  threshold: " << thresholds.threshold << "\n";
    ss << "  duplicate_threshold: " << thresholds.duplicate_threshold << "\n";
    ss << "  group_cutoff: " << thresholds.group_cutoff << "\n";
}

static void ApplyValue(EngineConfig& config, const std::string& section,
                       const std::string& key, const std::string& value) {
    if (section == "engine") {
        if (key == "mode") config.engine.mode = value;
        else if (key == "verbose") config.engine.verbose = ParseBool(value);
        else if (key == "max_files") config.engine.max_files = std::stoul(value);
        else if (key == "store_checkpoints") config.engine.store_checkpoints = ParseBool(value);
        else if (key == "overwrite_checkpoints") config.engine.overwrite_checkpoints = ParseBool(value);
        else if (key == "checkpoint_interval") config.engine.checkpoint_interval = std::stoul(value);
        else if (key == "use_matrix_comparison") config.engine.use_matrix_comparison = ParseBool(value);
        else if (key == "max_memory_bytes") config.engine.max_memory_bytes = std::stoll(value);
    }
    else if (section == "embedding") {
        ApplyThresholdKey(config.embedding.thresholds, key, value);
    }
    else if (section == "color") {
        if (ApplyThresholdKey(config.color.thresholds, key, value)) return;
        if (key == "min_passing") config.color.min_passing = std::stoul(value);
        else if (key == "run_length") config.color.run_length = std::stoul(value);
        else if (key == "min_clustered") config.color.min_clustered = std::stoul(value);
    }
    else if (section == "prompts") {
        if (ApplyThresholdKey(config.prompts.thresholds, key, value)) return;
        if (key == "positive_weight") config.prompts.positive_weight = std::stof(value);
        else if (key == "negative_weight") config.prompts.negative_weight = std::stof(value);
    }
    else if (section == "models") {
        if (ApplyThresholdKey(config.models.thresholds, key, value)) return;
        if (key == "model_weight") config.models.model_weight = std::stof(value);
        else if (key == "lora_weight") config.models.lora_weight = std::stof(value);
    }
    else if (section == "size") {
        if (ApplyThresholdKey(config.size.thresholds, key, value)) return;
        if (key == "tolerance") config.size.tolerance = std::stoi(value);
    }
    else if (section == "search") {
        if (key == "max_results") config.search.max_results = std::stoul(value);
        else if (key == "return_only_closest") config.search.return_only_closest = ParseBool(value);
    }
    else if (section == "cache") {
        if (key == "store_type") config.cache.store_type = value;
        else if (key == "database_path") config.cache.database_path = value;
        else if (key == "overwrite_features") config.cache.overwrite_features = ParseBool(value);
        else if (key == "text_cache_bytes") config.cache.text_cache_bytes = std::stoul(value);
    }
}

std::optional<EngineConfig> EngineConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<EngineConfig> EngineConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    EngineConfig config = Default();
    std::string current_section;
    std::string current_key;
    int depth = 0;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::cerr << "YAML parse error at line " << parser.problem_mark.line + 1
                      << ": " << (parser.problem ? parser.problem : "unknown") << std::endl;
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_MAPPING_START_EVENT:
                depth++;
                break;

            case YAML_MAPPING_END_EVENT:
                depth--;
                if (depth == 1) {
                    current_section.clear();
                }
                break;

            case YAML_SCALAR_EVENT: {
                std::string value = GetScalarValue(&event);

                if (depth == 1) {
                    // Top-level key (section name)
                    current_section = value;
                } else if (depth == 2) {
                    if (current_key.empty()) {
                        current_key = value;
                    } else {
                        try {
                            ApplyValue(config, current_section, current_key, value);
                        } catch (const std::exception& e) {
                            std::cerr << "Invalid value '" << value << "' for "
                                      << current_section << "." << current_key
                                      << ": " << e.what() << std::endl;
                            yaml_event_delete(&event);
                            yaml_parser_delete(&parser);
                            return std::nullopt;
                        }
                        current_key.clear();
                    }
                }
                break;
            }

            case YAML_STREAM_END_EVENT:
            case YAML_DOCUMENT_END_EVENT:
                done = true;
                break;

            default:
                break;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    if (!config.Validate()) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : config.GetValidationErrors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return std::nullopt;
    }

    return config;
}

bool EngineConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << ToYamlString();
    return file.good();
}

std::string EngineConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# SimGroup Engine Configuration\n";
    ss << "# Auto-generated configuration file\n\n";

    ss << "engine:\n";
    ss << "  mode: \"" << engine.mode << "\"\n";
    ss << "  verbose: " << BoolString(engine.verbose) << "\n";
    ss << "  max_files: " << engine.max_files << "\n";
    ss << "  store_checkpoints: " << BoolString(engine.store_checkpoints) << "\n";
    ss << "  overwrite_checkpoints: " << BoolString(engine.overwrite_checkpoints) << "\n";
    ss << "  checkpoint_interval: " << engine.checkpoint_interval << "\n";
    ss << "  use_matrix_comparison: " << BoolString(engine.use_matrix_comparison) << "\n";
    ss << "  max_memory_bytes: " << engine.max_memory_bytes << "\n\n";

    ss << "embedding:\n";
    WriteThresholds(ss, embedding.thresholds);
    ss << "\n";

    ss << "color:\n";
    WriteThresholds(ss, color.thresholds);
    ss << "  min_passing: " << color.min_passing << "\n";
    ss << "  run_length: " << color.run_length << "\n";
    ss << "  min_clustered: " << color.min_clustered << "\n\n";

    ss << "prompts:\n";
    WriteThresholds(ss, prompts.thresholds);
    ss << "  positive_weight: " << prompts.positive_weight << "\n";
    ss << "  negative_weight: " << prompts.negative_weight << "\n\n";

    ss << "models:\n";
    WriteThresholds(ss, models.thresholds);
    ss << "  model_weight: " << models.model_weight << "\n";
    ss << "  lora_weight: " << models.lora_weight << "\n\n";

    ss << "size:\n";
    WriteThresholds(ss, size.thresholds);
    ss << "  tolerance: " << size.tolerance << "\n\n";

    ss << "search:\n";
    ss << "  max_results: " << search.max_results << "\n";
    ss << "  return_only_closest: " << BoolString(search.return_only_closest) << "\n\n";

    ss << "cache:\n";
    ss << "  store_type: \"" << cache.store_type << "\"\n";
    ss << "  database_path: \"" << cache.database_path << "\"\n";
    ss << "  overwrite_features: " << BoolString(cache.overwrite_features) << "\n";
    ss << "  text_cache_bytes: " << cache.text_cache_bytes << "\n";

    return ss.str();
}

bool EngineConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> EngineConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    try {
        ParseCompareMode(engine.mode);
    } catch (const std::invalid_argument&) {
        errors.push_back("mode must be one of: embedding, color, prompts, models, size");
    }

    if (engine.checkpoint_interval == 0) {
        errors.push_back("checkpoint_interval must be greater than 0");
    }

    // Similarities in [0, 1]; cosine may go down to -1
    if (embedding.thresholds.threshold < -1.0f || embedding.thresholds.threshold > 1.0f) {
        errors.push_back("embedding threshold must be between -1.0 and 1.0");
    }
    if (embedding.thresholds.duplicate_threshold < -1.0f || embedding.thresholds.duplicate_threshold > 1.0f) {
        errors.push_back("embedding duplicate_threshold must be between -1.0 and 1.0");
    }

    const std::pair<const char*, const ModeThresholds*> unit_modes[] = {
        {"prompts", &prompts.thresholds},
        {"models", &models.thresholds},
        {"size", &size.thresholds},
    };
    for (const auto& [name, thresholds] : unit_modes) {
        if (thresholds->threshold < 0.0f || thresholds->threshold > 1.0f) {
            errors.push_back(std::string(name) + " threshold must be between 0.0 and 1.0");
        }
        if (thresholds->duplicate_threshold < 0.0f || thresholds->duplicate_threshold > 1.0f) {
            errors.push_back(std::string(name) + " duplicate_threshold must be between 0.0 and 1.0");
        }
    }

    for (const ModeThresholds* thresholds : {&embedding.thresholds, &color.thresholds,
                                             &prompts.thresholds, &models.thresholds,
                                             &size.thresholds}) {
        if (thresholds->group_cutoff < 0.0f) {
            errors.push_back("group_cutoff must be non-negative");
            break;
        }
    }

    if (color.thresholds.threshold <= 0.0f) {
        errors.push_back("color threshold must be greater than 0");
    }
    if (color.thresholds.duplicate_threshold < 0.0f) {
        errors.push_back("color duplicate_threshold must be non-negative");
    }
    if (color.run_length == 0) {
        errors.push_back("color run_length must be greater than 0");
    }

    if (prompts.positive_weight < 0.0f || prompts.negative_weight < 0.0f) {
        errors.push_back("prompt weights must be non-negative");
    }
    if (prompts.positive_weight + prompts.negative_weight == 0.0f) {
        errors.push_back("sum of prompt weights must be greater than 0");
    }
    if (models.model_weight < 0.0f || models.lora_weight < 0.0f) {
        errors.push_back("model weights must be non-negative");
    }
    if (models.model_weight + models.lora_weight == 0.0f) {
        errors.push_back("sum of model weights must be greater than 0");
    }

    if (size.tolerance < 0) {
        errors.push_back("size tolerance must be non-negative");
    }

    if (search.max_results == 0) {
        errors.push_back("max_results must be greater than 0");
    }

    if (cache.store_type != "sqlite" && cache.store_type != "memory") {
        errors.push_back("store_type must be one of: sqlite, memory");
    }
    if (cache.store_type == "sqlite" && cache.database_path.empty()) {
        errors.push_back("database_path must be set for the sqlite store");
    }

    return errors;
}

const ModeThresholds& EngineConfig::ThresholdsFor(const std::string& mode) const {
    switch (ParseCompareMode(mode)) {
        case CompareMode::EMBEDDING: return embedding.thresholds;
        case CompareMode::COLOR: return color.thresholds;
        case CompareMode::PROMPTS: return prompts.thresholds;
        case CompareMode::MODELS: return models.thresholds;
        case CompareMode::SIZE: return size.thresholds;
    }
    throw std::invalid_argument("Unknown compare mode: " + mode);
}

EngineConfig EngineConfig::Default() {
    return EngineConfig{};
}

} // namespace simgroup
