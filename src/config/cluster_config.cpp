// File: src/config/cluster_config.cpp
//
// YAML Configuration Implementation for the clustering engine

#include "config/cluster_config.hpp"
#include <yaml.h>
#include <fstream>
#include <sstream>
#include <iostream>
#include <cmath>
#include <stdexcept>

namespace clustra {

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

// std::stoul silently wraps negative input, so reject it up front
static size_t ParseSize(const std::string& value) {
    if (value.find('-') != std::string::npos) {
        throw std::invalid_argument("negative value for unsigned field: " + value);
    }
    size_t consumed = 0;
    unsigned long parsed = std::stoul(value, &consumed);
    if (consumed != value.size()) {
        throw std::invalid_argument("trailing characters in integer: " + value);
    }
    return static_cast<size_t>(parsed);
}

static float ParseFloat(const std::string& value) {
    size_t consumed = 0;
    float parsed = std::stof(value, &consumed);
    if (consumed != value.size()) {
        throw std::invalid_argument("trailing characters in number: " + value);
    }
    return parsed;
}

static const char* BoolString(bool value) {
    return value ? "true" : "false";
}

// Applies one "section.key: value" pair; unknown keys are ignored
static void ApplyValue(ClusterConfig& config, const std::string& section,
                       const std::string& key, const std::string& value) {
    if (section == "size") {
        if (key == "min_size") config.size.min_size = ParseSize(value);
        else if (key == "max_size") config.size.max_size = ParseSize(value);
        else if (key == "optimal_min_size") config.size.optimal_min_size = ParseSize(value);
        else if (key == "optimal_max_size") config.size.optimal_max_size = ParseSize(value);
    }
    else if (section == "quality") {
        if (key == "coherence_weight") config.quality.coherence_weight = ParseFloat(value);
        else if (key == "density_weight") config.quality.density_weight = ParseFloat(value);
        else if (key == "size_weight") config.quality.size_weight = ParseFloat(value);
        else if (key == "engagement_weight") config.quality.engagement_weight = ParseFloat(value);
        else if (key == "size_score_min") config.quality.size_score_min = ParseFloat(value);
        else if (key == "size_score_max") config.quality.size_score_max = ParseFloat(value);
        else if (key == "engagement_cap") config.quality.engagement_cap = ParseFloat(value);
        else if (key == "medium_threshold") config.quality.medium_threshold = ParseFloat(value);
        else if (key == "high_threshold") config.quality.high_threshold = ParseFloat(value);
        else if (key == "excellent_threshold") config.quality.excellent_threshold = ParseFloat(value);
    }
    else if (section == "validation") {
        if (key == "max_name_length") config.validation.max_name_length = ParseSize(value);
        else if (key == "max_description_length") config.validation.max_description_length = ParseSize(value);
        else if (key == "max_topics") config.validation.max_topics = ParseSize(value);
        else if (key == "max_centroid_magnitude") config.validation.max_centroid_magnitude = ParseFloat(value);
        else if (key == "dominant_topic_count") config.validation.dominant_topic_count = ParseSize(value);
    }
    else if (section == "clustering") {
        if (key == "default_dimension") config.clustering.default_dimension = ParseSize(value);
        else if (key == "min_dimension") config.clustering.min_dimension = ParseSize(value);
        else if (key == "max_dimension") config.clustering.max_dimension = ParseSize(value);
        else if (key == "recompute_interval_hours") config.clustering.recompute_interval_hours = ParseFloat(value);
        else if (key == "stale_threshold_hours") config.clustering.stale_threshold_hours = ParseFloat(value);
        else if (key == "merge_similarity_threshold") config.clustering.merge_similarity_threshold = ParseFloat(value);
        else if (key == "split_coherence_threshold") config.clustering.split_coherence_threshold = ParseFloat(value);
        else if (key == "quality_threshold") config.clustering.quality_threshold = ParseFloat(value);
        else if (key == "auto_archive") config.clustering.auto_archive = ParseBool(value);
        else if (key == "auto_merge") config.clustering.auto_merge = ParseBool(value);
        else if (key == "auto_archive_after_days") config.clustering.auto_archive_after_days = ParseFloat(value);
        else if (key == "min_active_members") config.clustering.min_active_members = ParseSize(value);
    }
    else if (section == "assignment") {
        if (key == "min_similarity") config.assignment.min_similarity = ParseFloat(value);
        else if (key == "good_similarity") config.assignment.good_similarity = ParseFloat(value);
        else if (key == "excellent_similarity") config.assignment.excellent_similarity = ParseFloat(value);
        else if (key == "auto_assign_threshold") config.assignment.auto_assign_threshold = ParseFloat(value);
        else if (key == "manual_review_threshold") config.assignment.manual_review_threshold = ParseFloat(value);
    }
    else if (section == "analysis") {
        if (key == "low_coherence_threshold") config.analysis.low_coherence_threshold = ParseFloat(value);
        else if (key == "low_density_threshold") config.analysis.low_density_threshold = ParseFloat(value);
        else if (key == "oversized_threshold") config.analysis.oversized_threshold = ParseSize(value);
        else if (key == "undersized_threshold") config.analysis.undersized_threshold = ParseSize(value);
        else if (key == "merge_recommendation_confidence") config.analysis.merge_recommendation_confidence = ParseFloat(value);
        else if (key == "split_recommendation_confidence") config.analysis.split_recommendation_confidence = ParseFloat(value);
        else if (key == "recompute_recommendation_confidence") config.analysis.recompute_recommendation_confidence = ParseFloat(value);
        else if (key == "stale_confidence_bonus") config.analysis.stale_confidence_bonus = ParseFloat(value);
        else if (key == "max_issues") config.analysis.max_issues = ParseSize(value);
        else if (key == "max_recommendations") config.analysis.max_recommendations = ParseSize(value);
        else if (key == "stability_horizon_days") config.analysis.stability_horizon_days = ParseFloat(value);
    }
}

std::optional<ClusterConfig> ClusterConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<ClusterConfig> ClusterConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    ClusterConfig config = Default();
    std::string current_section;
    std::string current_key;
    int depth = 0;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::cerr << "YAML parse error";
            if (parser.problem != nullptr) {
                std::cerr << ": " << parser.problem << " at line " << (parser.problem_mark.line + 1);
            }
            std::cerr << std::endl;
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_STREAM_START_EVENT:
            case YAML_DOCUMENT_START_EVENT:
                break;

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
                        } catch (const std::logic_error& e) {
                            std::cerr << "Invalid value for " << current_section << "."
                                      << current_key << ": '" << value << "' (" << e.what() << ")"
                                      << std::endl;
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

bool ClusterConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << ToYamlString();
    return true;
}

std::string ClusterConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# Clustering engine configuration\n";
    ss << "# Auto-generated configuration file\n\n";

    ss << "size:\n";
    ss << "  min_size: " << size.min_size << "\n";
    ss << "  max_size: " << size.max_size << "\n";
    ss << "  optimal_min_size: " << size.optimal_min_size << "\n";
    ss << "  optimal_max_size: " << size.optimal_max_size << "\n\n";

    ss << "quality:\n";
    ss << "  coherence_weight: " << quality.coherence_weight << "\n";
    ss << "  density_weight: " << quality.density_weight << "\n";
    ss << "  size_weight: " << quality.size_weight << "\n";
    ss << "  engagement_weight: " << quality.engagement_weight << "\n";
    ss << "  size_score_min: " << quality.size_score_min << "\n";
    ss << "  size_score_max: " << quality.size_score_max << "\n";
    ss << "  engagement_cap: " << quality.engagement_cap << "\n";
    ss << "  medium_threshold: " << quality.medium_threshold << "\n";
    ss << "  high_threshold: " << quality.high_threshold << "\n";
    ss << "  excellent_threshold: " << quality.excellent_threshold << "\n\n";

    ss << "validation:\n";
    ss << "  max_name_length: " << validation.max_name_length << "\n";
    ss << "  max_description_length: " << validation.max_description_length << "\n";
    ss << "  max_topics: " << validation.max_topics << "\n";
    ss << "  max_centroid_magnitude: " << validation.max_centroid_magnitude << "\n";
    ss << "  dominant_topic_count: " << validation.dominant_topic_count << "\n\n";

    ss << "clustering:\n";
    ss << "  default_dimension: " << clustering.default_dimension << "\n";
    ss << "  min_dimension: " << clustering.min_dimension << "\n";
    ss << "  max_dimension: " << clustering.max_dimension << "\n";
    ss << "  recompute_interval_hours: " << clustering.recompute_interval_hours << "\n";
    ss << "  stale_threshold_hours: " << clustering.stale_threshold_hours << "\n";
    ss << "  merge_similarity_threshold: " << clustering.merge_similarity_threshold << "\n";
    ss << "  split_coherence_threshold: " << clustering.split_coherence_threshold << "\n";
    ss << "  quality_threshold: " << clustering.quality_threshold << "\n";
    ss << "  auto_archive: " << BoolString(clustering.auto_archive) << "\n";
    ss << "  auto_merge: " << BoolString(clustering.auto_merge) << "\n";
    ss << "  auto_archive_after_days: " << clustering.auto_archive_after_days << "\n";
    ss << "  min_active_members: " << clustering.min_active_members << "\n\n";

    ss << "assignment:\n";
    ss << "  min_similarity: " << assignment.min_similarity << "\n";
    ss << "  good_similarity: " << assignment.good_similarity << "\n";
    ss << "  excellent_similarity: " << assignment.excellent_similarity << "\n";
    ss << "  auto_assign_threshold: " << assignment.auto_assign_threshold << "\n";
    ss << "  manual_review_threshold: " << assignment.manual_review_threshold << "\n\n";

    ss << "analysis:\n";
    ss << "  low_coherence_threshold: " << analysis.low_coherence_threshold << "\n";
    ss << "  low_density_threshold: " << analysis.low_density_threshold << "\n";
    ss << "  oversized_threshold: " << analysis.oversized_threshold << "\n";
    ss << "  undersized_threshold: " << analysis.undersized_threshold << "\n";
    ss << "  merge_recommendation_confidence: " << analysis.merge_recommendation_confidence << "\n";
    ss << "  split_recommendation_confidence: " << analysis.split_recommendation_confidence << "\n";
    ss << "  recompute_recommendation_confidence: " << analysis.recompute_recommendation_confidence << "\n";
    ss << "  stale_confidence_bonus: " << analysis.stale_confidence_bonus << "\n";
    ss << "  max_issues: " << analysis.max_issues << "\n";
    ss << "  max_recommendations: " << analysis.max_recommendations << "\n";
    ss << "  stability_horizon_days: " << analysis.stability_horizon_days << "\n";

    return ss.str();
}

bool ClusterConfig::Validate() const {
    return GetValidationErrors().empty();
}

static bool InUnitRange(float value) {
    return value >= 0.0f && value <= 1.0f;
}

// NaN fails both comparisons, so these reject it along with infinities
static bool IsNonNegative(float value) {
    return std::isfinite(value) && value >= 0.0f;
}

static bool IsPositive(float value) {
    return std::isfinite(value) && value > 0.0f;
}

std::vector<std::string> ClusterConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    // Size bounds
    if (size.min_size > size.max_size) {
        errors.push_back("size.min_size must be <= size.max_size");
    }
    if (size.optimal_min_size == 0) {
        errors.push_back("size.optimal_min_size must be greater than 0");
    }
    if (size.optimal_min_size > size.optimal_max_size) {
        errors.push_back("size.optimal_min_size must be <= size.optimal_max_size");
    }

    // Quality weights must be non-negative and sum to ~1.0
    if (!IsNonNegative(quality.coherence_weight) || !IsNonNegative(quality.density_weight) ||
        !IsNonNegative(quality.size_weight) || !IsNonNegative(quality.engagement_weight)) {
        errors.push_back("quality weights must be finite and non-negative");
    }
    float weight_sum = quality.coherence_weight + quality.density_weight +
                       quality.size_weight + quality.engagement_weight;
    if (!(std::abs(weight_sum - 1.0f) <= 0.01f)) {
        errors.push_back("quality weights must sum to 1.0");
    }
    if (!InUnitRange(quality.size_score_min) || !InUnitRange(quality.size_score_max) ||
        quality.size_score_min > quality.size_score_max) {
        errors.push_back("quality size scores must satisfy 0 <= size_score_min <= size_score_max <= 1");
    }
    if (!IsPositive(quality.engagement_cap)) {
        errors.push_back("quality.engagement_cap must be greater than 0");
    }
    if (!(0.0f <= quality.medium_threshold &&
          quality.medium_threshold <= quality.high_threshold &&
          quality.high_threshold <= quality.excellent_threshold &&
          quality.excellent_threshold <= 1.0f)) {
        errors.push_back("quality level thresholds must be ordered within [0, 1]");
    }

    // Validation limits
    if (validation.max_name_length == 0) {
        errors.push_back("validation.max_name_length must be greater than 0");
    }
    if (validation.max_topics == 0) {
        errors.push_back("validation.max_topics must be greater than 0");
    }
    // Oversized centroids are rescaled to unit length, so a limit below 1 cannot hold
    if (!(std::isfinite(validation.max_centroid_magnitude) &&
          validation.max_centroid_magnitude >= 1.0f)) {
        errors.push_back("validation.max_centroid_magnitude must be at least 1.0");
    }

    // Clustering
    if (clustering.min_dimension == 0) {
        errors.push_back("clustering.min_dimension must be greater than 0");
    }
    if (clustering.min_dimension > clustering.max_dimension) {
        errors.push_back("clustering.min_dimension must be <= clustering.max_dimension");
    }
    if (clustering.default_dimension < clustering.min_dimension ||
        clustering.default_dimension > clustering.max_dimension) {
        errors.push_back("clustering.default_dimension must lie within [min_dimension, max_dimension]");
    }
    if (!IsPositive(clustering.recompute_interval_hours)) {
        errors.push_back("clustering.recompute_interval_hours must be greater than 0");
    }
    if (!IsPositive(clustering.stale_threshold_hours)) {
        errors.push_back("clustering.stale_threshold_hours must be greater than 0");
    }
    if (!InUnitRange(clustering.merge_similarity_threshold) ||
        !InUnitRange(clustering.split_coherence_threshold) ||
        !InUnitRange(clustering.quality_threshold)) {
        errors.push_back("clustering thresholds must be between 0.0 and 1.0");
    }
    if (!IsNonNegative(clustering.auto_archive_after_days)) {
        errors.push_back("clustering.auto_archive_after_days must be non-negative");
    }

    // Assignment
    if (!InUnitRange(assignment.min_similarity) || !InUnitRange(assignment.good_similarity) ||
        !InUnitRange(assignment.excellent_similarity)) {
        errors.push_back("assignment similarity grades must be between 0.0 and 1.0");
    }
    if (!(assignment.min_similarity <= assignment.good_similarity &&
          assignment.good_similarity <= assignment.excellent_similarity)) {
        errors.push_back("assignment similarity grades must be ordered");
    }
    if (!InUnitRange(assignment.auto_assign_threshold) ||
        !InUnitRange(assignment.manual_review_threshold)) {
        errors.push_back("assignment decision thresholds must be between 0.0 and 1.0");
    }
    if (assignment.manual_review_threshold > assignment.auto_assign_threshold) {
        errors.push_back("assignment.manual_review_threshold must be <= auto_assign_threshold");
    }

    // Analysis
    if (!InUnitRange(analysis.low_coherence_threshold) ||
        !InUnitRange(analysis.low_density_threshold)) {
        errors.push_back("analysis coherence/density thresholds must be between 0.0 and 1.0");
    }
    if (analysis.undersized_threshold > analysis.oversized_threshold) {
        errors.push_back("analysis.undersized_threshold must be <= oversized_threshold");
    }
    if (!InUnitRange(analysis.merge_recommendation_confidence) ||
        !InUnitRange(analysis.split_recommendation_confidence) ||
        !InUnitRange(analysis.recompute_recommendation_confidence) ||
        !InUnitRange(analysis.recompute_recommendation_confidence + analysis.stale_confidence_bonus)) {
        errors.push_back("analysis recommendation confidences must be between 0.0 and 1.0");
    }
    if (!IsPositive(analysis.stability_horizon_days)) {
        errors.push_back("analysis.stability_horizon_days must be greater than 0");
    }

    return errors;
}

ClusterConfig ClusterConfig::Default() {
    return ClusterConfig{};  // Uses default member initializers
}

static bool NearlyEqual(float a, float b) {
    return std::abs(a - b) <= 1e-6f;
}

bool ClusterConfig::operator==(const ClusterConfig& other) const {
    return size.min_size == other.size.min_size &&
           size.max_size == other.size.max_size &&
           size.optimal_min_size == other.size.optimal_min_size &&
           size.optimal_max_size == other.size.optimal_max_size &&
           NearlyEqual(quality.coherence_weight, other.quality.coherence_weight) &&
           NearlyEqual(quality.density_weight, other.quality.density_weight) &&
           NearlyEqual(quality.size_weight, other.quality.size_weight) &&
           NearlyEqual(quality.engagement_weight, other.quality.engagement_weight) &&
           NearlyEqual(quality.size_score_min, other.quality.size_score_min) &&
           NearlyEqual(quality.size_score_max, other.quality.size_score_max) &&
           NearlyEqual(quality.engagement_cap, other.quality.engagement_cap) &&
           NearlyEqual(quality.medium_threshold, other.quality.medium_threshold) &&
           NearlyEqual(quality.high_threshold, other.quality.high_threshold) &&
           NearlyEqual(quality.excellent_threshold, other.quality.excellent_threshold) &&
           validation.max_name_length == other.validation.max_name_length &&
           validation.max_description_length == other.validation.max_description_length &&
           validation.max_topics == other.validation.max_topics &&
           NearlyEqual(validation.max_centroid_magnitude, other.validation.max_centroid_magnitude) &&
           validation.dominant_topic_count == other.validation.dominant_topic_count &&
           clustering.default_dimension == other.clustering.default_dimension &&
           clustering.min_dimension == other.clustering.min_dimension &&
           clustering.max_dimension == other.clustering.max_dimension &&
           NearlyEqual(clustering.recompute_interval_hours, other.clustering.recompute_interval_hours) &&
           NearlyEqual(clustering.stale_threshold_hours, other.clustering.stale_threshold_hours) &&
           NearlyEqual(clustering.merge_similarity_threshold, other.clustering.merge_similarity_threshold) &&
           NearlyEqual(clustering.split_coherence_threshold, other.clustering.split_coherence_threshold) &&
           NearlyEqual(clustering.quality_threshold, other.clustering.quality_threshold) &&
           clustering.auto_archive == other.clustering.auto_archive &&
           clustering.auto_merge == other.clustering.auto_merge &&
           NearlyEqual(clustering.auto_archive_after_days, other.clustering.auto_archive_after_days) &&
           clustering.min_active_members == other.clustering.min_active_members &&
           NearlyEqual(assignment.min_similarity, other.assignment.min_similarity) &&
           NearlyEqual(assignment.good_similarity, other.assignment.good_similarity) &&
           NearlyEqual(assignment.excellent_similarity, other.assignment.excellent_similarity) &&
           NearlyEqual(assignment.auto_assign_threshold, other.assignment.auto_assign_threshold) &&
           NearlyEqual(assignment.manual_review_threshold, other.assignment.manual_review_threshold) &&
           NearlyEqual(analysis.low_coherence_threshold, other.analysis.low_coherence_threshold) &&
           NearlyEqual(analysis.low_density_threshold, other.analysis.low_density_threshold) &&
           analysis.oversized_threshold == other.analysis.oversized_threshold &&
           analysis.undersized_threshold == other.analysis.undersized_threshold &&
           NearlyEqual(analysis.merge_recommendation_confidence, other.analysis.merge_recommendation_confidence) &&
           NearlyEqual(analysis.split_recommendation_confidence, other.analysis.split_recommendation_confidence) &&
           NearlyEqual(analysis.recompute_recommendation_confidence, other.analysis.recompute_recommendation_confidence) &&
           NearlyEqual(analysis.stale_confidence_bonus, other.analysis.stale_confidence_bonus) &&
           analysis.max_issues == other.analysis.max_issues &&
           analysis.max_recommendations == other.analysis.max_recommendations &&
           NearlyEqual(analysis.stability_horizon_days, other.analysis.stability_horizon_days);
}

} // namespace clustra
