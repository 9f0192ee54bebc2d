// File: tests/config/engine_config_test.cpp
//
// Tests for the YAML engine configuration

#include "config/engine_config.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace simgroup;

class EngineConfigTest : public ::testing::Test {
protected:
    std::string temp_config_path = "/tmp/test_simgroup_config.yaml";

    void TearDown() override {
        std::filesystem::remove(temp_config_path);
    }
};

TEST_F(EngineConfigTest, DefaultConfig) {
    auto config = EngineConfig::Default();

    EXPECT_EQ(config.engine.mode, "embedding");
    EXPECT_FALSE(config.engine.verbose);
    EXPECT_EQ(config.engine.max_files, 10000u);
    EXPECT_EQ(config.engine.checkpoint_interval, 250u);
    EXPECT_TRUE(config.engine.use_matrix_comparison);

    EXPECT_FLOAT_EQ(config.embedding.thresholds.threshold, 0.9f);
    EXPECT_FLOAT_EQ(config.embedding.thresholds.duplicate_threshold, 0.99f);
    EXPECT_FLOAT_EQ(config.color.thresholds.threshold, 15.0f);
    EXPECT_FLOAT_EQ(config.color.thresholds.group_cutoff, 4500.0f);
    EXPECT_FLOAT_EQ(config.prompts.positive_weight, 0.7f);
    EXPECT_FLOAT_EQ(config.models.lora_weight, 0.3f);
    EXPECT_EQ(config.size.tolerance, 0);

    EXPECT_EQ(config.search.max_results, 50u);
    EXPECT_EQ(config.cache.store_type, "sqlite");
    EXPECT_TRUE(config.Validate());
}

TEST_F(EngineConfigTest, LoadFromString) {
    std::string yaml = R"(
engine:
  mode: "color"
  verbose: true
  checkpoint_interval: 100
  use_matrix_comparison: no

color:
  threshold: 12
  min_passing: 100
  run_length: 8

size:
  tolerance: 4

search:
  max_results: 20
  return_only_closest: yes

cache:
  store_type: "memory"
)";

    auto config_opt = EngineConfig::LoadFromString(yaml);
    ASSERT_TRUE(config_opt.has_value());

    auto config = config_opt.value();
    EXPECT_EQ(config.engine.mode, "color");
    EXPECT_TRUE(config.engine.verbose);
    EXPECT_EQ(config.engine.checkpoint_interval, 100u);
    EXPECT_FALSE(config.engine.use_matrix_comparison);

    EXPECT_FLOAT_EQ(config.color.thresholds.threshold, 12.0f);
    EXPECT_FLOAT_EQ(config.color.thresholds.duplicate_threshold, 50.0f);
    EXPECT_EQ(config.color.min_passing, 100u);
    EXPECT_EQ(config.color.run_length, 8u);
    EXPECT_EQ(config.size.tolerance, 4);

    EXPECT_EQ(config.search.max_results, 20u);
    EXPECT_TRUE(config.search.return_only_closest);
    EXPECT_EQ(config.cache.store_type, "memory");
}

TEST_F(EngineConfigTest, SaveAndLoad) {
    auto config = EngineConfig::Default();
    config.engine.mode = "prompts";
    config.prompts.thresholds.threshold = 0.8f;
    config.prompts.negative_weight = 0.2f;
    config.cache.database_path = "/tmp/cache.db";

    ASSERT_TRUE(config.SaveToFile(temp_config_path));

    auto loaded_opt = EngineConfig::LoadFromFile(temp_config_path);
    ASSERT_TRUE(loaded_opt.has_value());

    auto loaded = loaded_opt.value();
    EXPECT_EQ(loaded.engine.mode, "prompts");
    EXPECT_FLOAT_EQ(loaded.prompts.thresholds.threshold, 0.8f);
    EXPECT_FLOAT_EQ(loaded.prompts.negative_weight, 0.2f);
    EXPECT_EQ(loaded.cache.database_path, "/tmp/cache.db");
}

TEST_F(EngineConfigTest, Validation) {
    auto config = EngineConfig::Default();
    EXPECT_TRUE(config.GetValidationErrors().empty());

    config.engine.mode = "texture";
    EXPECT_FALSE(config.Validate());

    config = EngineConfig::Default();
    config.embedding.thresholds.threshold = 1.5f;
    EXPECT_FALSE(config.Validate());

    config = EngineConfig::Default();
    config.prompts.thresholds.threshold = -0.1f;
    EXPECT_FALSE(config.Validate());

    config = EngineConfig::Default();
    config.models.model_weight = 0.0f;
    config.models.lora_weight = 0.0f;
    EXPECT_FALSE(config.Validate());

    config = EngineConfig::Default();
    config.engine.checkpoint_interval = 0;
    EXPECT_FALSE(config.Validate());

    config = EngineConfig::Default();
    config.cache.store_type = "sqlite";
    config.cache.database_path.clear();
    EXPECT_FALSE(config.Validate());
}

TEST_F(EngineConfigTest, InvalidModeFailsToLoad) {
    std::string yaml = R"(
engine:
  mode: "texture"
)";

    EXPECT_FALSE(EngineConfig::LoadFromString(yaml).has_value());
}

TEST_F(EngineConfigTest, NonNumericValueFailsToLoad) {
    std::string yaml = R"(
embedding:
  threshold: high
)";

    EXPECT_FALSE(EngineConfig::LoadFromString(yaml).has_value());
}

TEST_F(EngineConfigTest, ToYamlString) {
    auto config = EngineConfig::Default();
    config.engine.mode = "size";
    config.size.tolerance = 3;

    std::string yaml = config.ToYamlString();

    EXPECT_NE(yaml.find("mode: \"size\""), std::string::npos);
    EXPECT_NE(yaml.find("tolerance: 3"), std::string::npos);
}

TEST_F(EngineConfigTest, LoadNonexistentFile) {
    EXPECT_FALSE(EngineConfig::LoadFromFile("/nonexistent/path/config.yaml").has_value());
}

TEST_F(EngineConfigTest, PartialConfig) {
    std::string yaml = R"(
search:
  max_results: 5
)";

    auto config_opt = EngineConfig::LoadFromString(yaml);
    ASSERT_TRUE(config_opt.has_value());

    EXPECT_EQ(config_opt->search.max_results, 5u);
    EXPECT_EQ(config_opt->engine.mode, "embedding");
    EXPECT_EQ(config_opt->color.run_length, 10u);
}

TEST_F(EngineConfigTest, ThresholdsFor) {
    auto config = EngineConfig::Default();

    EXPECT_FLOAT_EQ(config.ThresholdsFor("embedding").threshold, 0.9f);
    EXPECT_FLOAT_EQ(config.ThresholdsFor("color").duplicate_threshold, 50.0f);
    EXPECT_FLOAT_EQ(config.ThresholdsFor("models").group_cutoff, 0.75f);
    EXPECT_FLOAT_EQ(config.ThresholdsFor("size").duplicate_threshold, 0.999f);
    EXPECT_THROW(config.ThresholdsFor("texture"), std::invalid_argument);
}
