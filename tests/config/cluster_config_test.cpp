// File: tests/config/cluster_config_test.cpp
//
// Tests for YAML configuration system

#include "config/cluster_config.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>
#include <limits>

using namespace clustra;

class ClusterConfigTest : public ::testing::Test {
protected:
    std::string temp_config_path = "/tmp/clustra_test_config.yaml";

    void TearDown() override {
        std::filesystem::remove(temp_config_path);
    }
};

TEST_F(ClusterConfigTest, DefaultConfig) {
    auto config = ClusterConfig::Default();

    EXPECT_EQ(config.size.min_size, 3u);
    EXPECT_EQ(config.size.max_size, 1000u);
    EXPECT_EQ(config.size.optimal_min_size, 10u);
    EXPECT_EQ(config.size.optimal_max_size, 500u);

    EXPECT_FLOAT_EQ(config.quality.coherence_weight, 0.35f);
    EXPECT_FLOAT_EQ(config.quality.density_weight, 0.25f);
    EXPECT_FLOAT_EQ(config.quality.size_weight, 0.20f);
    EXPECT_FLOAT_EQ(config.quality.engagement_weight, 0.20f);
    EXPECT_FLOAT_EQ(config.quality.medium_threshold, 0.4f);
    EXPECT_FLOAT_EQ(config.quality.high_threshold, 0.6f);
    EXPECT_FLOAT_EQ(config.quality.excellent_threshold, 0.8f);

    EXPECT_EQ(config.validation.max_name_length, 100u);
    EXPECT_EQ(config.validation.max_description_length, 500u);
    EXPECT_EQ(config.validation.max_topics, 20u);
    EXPECT_FLOAT_EQ(config.validation.max_centroid_magnitude, 10.0f);

    EXPECT_EQ(config.clustering.min_dimension, 32u);
    EXPECT_EQ(config.clustering.max_dimension, 512u);
    EXPECT_FLOAT_EQ(config.clustering.stale_threshold_hours, 72.0f);

    EXPECT_FLOAT_EQ(config.assignment.auto_assign_threshold, 0.8f);
    EXPECT_FLOAT_EQ(config.assignment.manual_review_threshold, 0.6f);

    EXPECT_FLOAT_EQ(config.analysis.low_coherence_threshold, 0.4f);
    EXPECT_FLOAT_EQ(config.analysis.low_density_threshold, 0.2f);
    EXPECT_EQ(config.analysis.oversized_threshold, 800u);
    EXPECT_EQ(config.analysis.undersized_threshold, 5u);

    EXPECT_TRUE(config.Validate());
    EXPECT_TRUE(config.GetValidationErrors().empty());
}

TEST_F(ClusterConfigTest, LoadFromString) {
    std::string yaml = R"(
quality:
  high_threshold: 0.65

clustering:
  stale_threshold_hours: 48
  auto_merge: true

analysis:
  oversized_threshold: 600
  max_issues: 3
)";

    auto config_opt = ClusterConfig::LoadFromString(yaml);
    ASSERT_TRUE(config_opt.has_value());

    auto config = config_opt.value();
    EXPECT_FLOAT_EQ(config.quality.high_threshold, 0.65f);
    EXPECT_FLOAT_EQ(config.clustering.stale_threshold_hours, 48.0f);
    EXPECT_TRUE(config.clustering.auto_merge);
    EXPECT_EQ(config.analysis.oversized_threshold, 600u);
    EXPECT_EQ(config.analysis.max_issues, 3u);

    // Untouched keys keep their defaults
    EXPECT_FLOAT_EQ(config.quality.coherence_weight, 0.35f);
    EXPECT_EQ(config.analysis.undersized_threshold, 5u);
}

TEST_F(ClusterConfigTest, SaveAndLoad) {
    auto config = ClusterConfig::Default();
    config.clustering.stale_threshold_hours = 12.0f;
    config.assignment.auto_assign_threshold = 0.9f;
    config.analysis.max_recommendations = 2;

    ASSERT_TRUE(config.SaveToFile(temp_config_path));

    auto loaded_opt = ClusterConfig::LoadFromFile(temp_config_path);
    ASSERT_TRUE(loaded_opt.has_value());
    EXPECT_EQ(config, loaded_opt.value());
}

TEST_F(ClusterConfigTest, ToYamlStringIsReadable) {
    auto config = ClusterConfig::Default();
    auto reloaded = ClusterConfig::LoadFromString(config.ToYamlString());
    ASSERT_TRUE(reloaded.has_value());
    EXPECT_EQ(config, reloaded.value());
}

TEST_F(ClusterConfigTest, LoadNonExistentFile) {
    auto config_opt = ClusterConfig::LoadFromFile("/nonexistent/path/config.yaml");
    EXPECT_FALSE(config_opt.has_value());
}

TEST_F(ClusterConfigTest, InvalidYAML) {
    std::string invalid_yaml = R"(
quality:
  high_threshold: [unclosed
)";

    auto config_opt = ClusterConfig::LoadFromString(invalid_yaml);
    EXPECT_FALSE(config_opt.has_value());
}

TEST_F(ClusterConfigTest, InvalidValueRejected) {
    std::string yaml = R"(
analysis:
  oversized_threshold: lots
)";
    EXPECT_FALSE(ClusterConfig::LoadFromString(yaml).has_value());

    std::string negative = R"(
size:
  min_size: -3
)";
    EXPECT_FALSE(ClusterConfig::LoadFromString(negative).has_value());
}

TEST_F(ClusterConfigTest, InvalidWeightsRejected) {
    auto config = ClusterConfig::Default();
    config.quality.coherence_weight = 0.6f;

    EXPECT_FALSE(config.Validate());
    EXPECT_FALSE(config.GetValidationErrors().empty());

    std::string yaml = R"(
quality:
  coherence_weight: 0.6
)";
    EXPECT_FALSE(ClusterConfig::LoadFromString(yaml).has_value());
}

TEST_F(ClusterConfigTest, UnorderedThresholdsRejected) {
    auto config = ClusterConfig::Default();
    config.quality.high_threshold = 0.9f;   // above excellent
    EXPECT_FALSE(config.Validate());

    config = ClusterConfig::Default();
    config.assignment.manual_review_threshold = 0.85f;   // above auto-assign
    EXPECT_FALSE(config.Validate());

    config = ClusterConfig::Default();
    config.clustering.min_dimension = 600;   // above max
    EXPECT_FALSE(config.Validate());
}

TEST_F(ClusterConfigTest, EqualityUsesTolerance) {
    auto a = ClusterConfig::Default();
    auto b = ClusterConfig::Default();
    b.quality.medium_threshold += 1e-7f;
    EXPECT_EQ(a, b);

    b.analysis.max_issues = 4;
    EXPECT_NE(a, b);
}

TEST_F(ClusterConfigTest, NaNValuesRejected) {
    std::string weight = R"(
quality:
  coherence_weight: nan
)";
    EXPECT_FALSE(ClusterConfig::LoadFromString(weight).has_value());

    std::string horizon = R"(
analysis:
  stability_horizon_days: nan
)";
    EXPECT_FALSE(ClusterConfig::LoadFromString(horizon).has_value());

    auto config = ClusterConfig::Default();
    config.clustering.stale_threshold_hours = std::numeric_limits<float>::quiet_NaN();
    EXPECT_FALSE(config.Validate());

    config = ClusterConfig::Default();
    config.quality.engagement_cap = std::numeric_limits<float>::infinity();
    EXPECT_FALSE(config.Validate());
}

TEST_F(ClusterConfigTest, CentroidMagnitudeBelowUnitRejected) {
    auto config = ClusterConfig::Default();
    config.validation.max_centroid_magnitude = 0.5f;
    EXPECT_FALSE(config.Validate());

    config.validation.max_centroid_magnitude = 1.0f;
    EXPECT_TRUE(config.Validate());

    std::string yaml = R"(
validation:
  max_centroid_magnitude: 0.5
)";
    EXPECT_FALSE(ClusterConfig::LoadFromString(yaml).has_value());
}

TEST_F(ClusterConfigTest, TrailingCharactersRejected) {
    std::string size = R"(
size:
  max_size: 12abc
)";
    EXPECT_FALSE(ClusterConfig::LoadFromString(size).has_value());

    std::string fractional = R"(
analysis:
  max_issues: 1.5
)";
    EXPECT_FALSE(ClusterConfig::LoadFromString(fractional).has_value());

    std::string weight = R"(
quality:
  coherence_weight: 0.35x
)";
    EXPECT_FALSE(ClusterConfig::LoadFromString(weight).has_value());
}
