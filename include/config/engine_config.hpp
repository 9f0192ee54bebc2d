// File: include/config/engine_config.hpp
//
// YAML configuration for the SimGroup compare engine
// Thresholds, scan policy, search and cache settings per compare mode

#ifndef SIMGROUP_ENGINE_CONFIG_HPP
#define SIMGROUP_ENGINE_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace simgroup {

/// Thresholds shared by every compare mode, in that mode's polarity
struct ModeThresholds {
    float threshold;            // related / search threshold (strict)
    float duplicate_threshold;  // probable duplicate threshold (strict)
    float group_cutoff;         // drift allowed before a group is split
};

/// Configuration structure for the compare engine
struct EngineConfig {
    // === Engine Settings ===
    struct Engine {
        std::string mode = "embedding";
        bool verbose = false;
        size_t max_files = 10000;               // 0 = no limit
        bool store_checkpoints = true;
        bool overwrite_checkpoints = false;
        size_t checkpoint_interval = 250;       // scan positions between checkpoints
        bool use_matrix_comparison = true;      // dense modes only
        int64_t max_memory_bytes = 0;           // <= 0 = half of available memory
    } engine;

    // === Per-mode Settings ===
    struct Embedding {
        ModeThresholds thresholds{0.9f, 0.99f, 0.1f};
    } embedding;

    struct Color {
        ModeThresholds thresholds{15.0f, 50.0f, 4500.0f};  // per-position dE, sum dE, sum dE
        size_t min_passing = 0;                // 0 = half of the positions
        size_t run_length = 10;
        size_t min_clustered = 10;
    } color;

    struct Prompts {
        ModeThresholds thresholds{0.85f, 0.95f, 0.75f};
        float positive_weight = 0.7f;
        float negative_weight = 0.3f;
    } prompts;

    struct Models {
        ModeThresholds thresholds{0.7f, 0.95f, 0.75f};
        float model_weight = 0.7f;
        float lora_weight = 0.3f;
    } models;

    struct Size {
        ModeThresholds thresholds{0.95f, 0.999f, 0.5f};
        int32_t tolerance = 0;                 // pixels
    } size;

    // === Search Settings ===
    struct Search {
        size_t max_results = 50;
        bool return_only_closest = false;
    } search;

    // === Cache Settings ===
    struct Cache {
        std::string store_type = "sqlite";     // "sqlite" or "memory"
        std::string database_path = "simgroup_cache.db";
        bool overwrite_features = false;
        size_t text_cache_bytes = 16 * 1024 * 1024;
    } cache;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return EngineConfig if successful, std::nullopt on error
    static std::optional<EngineConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return EngineConfig if successful, std::nullopt on error
    static std::optional<EngineConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string
    std::string ToYamlString() const;

    /// Validate configuration values
    bool Validate() const;

    /// Get validation errors (if any)
    std::vector<std::string> GetValidationErrors() const;

    /// Thresholds of the named compare mode
    /// @throws std::invalid_argument for an unknown mode
    const ModeThresholds& ThresholdsFor(const std::string& mode) const;

    /// Create default configuration
    static EngineConfig Default();
};

} // namespace simgroup

#endif // SIMGROUP_ENGINE_CONFIG_HPP
