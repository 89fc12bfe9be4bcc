// File: include/config/cluster_config.hpp
//
// Policy values for the clustering engine.
// Every computation receives a ClusterConfig; each cluster may carry its own
// copy that differs from the global default. Can be loaded from YAML.

#ifndef CLUSTRA_CLUSTER_CONFIG_HPP
#define CLUSTRA_CLUSTER_CONFIG_HPP

#include <string>
#include <optional>
#include <vector>
#include <cstddef>

namespace clustra {

/// Thresholds, weights and bounds consumed by Cluster, QualityScorer,
/// ClusterAnalyzer and AssignmentPolicy
struct ClusterConfig {
    // === Membership Size Bounds ===
    struct Size {
        size_t min_size = 3;
        size_t max_size = 1000;
        size_t optimal_min_size = 10;
        size_t optimal_max_size = 500;
    } size;

    // === Quality Score ===
    // score = coherence*Wc + density*Wd + size_score*Ws + engagement*We
    struct Quality {
        float coherence_weight = 0.35f;
        float density_weight = 0.25f;
        float size_weight = 0.20f;
        float engagement_weight = 0.20f;

        float size_score_min = 0.2f;       // Floor for out-of-range sizes
        float size_score_max = 1.0f;       // Score inside the optimal range
        float engagement_cap = 1.0f;

        // Level boundaries: [0,medium) LOW, [medium,high) MEDIUM, [high,excellent) HIGH, else EXCELLENT
        float medium_threshold = 0.4f;
        float high_threshold = 0.6f;
        float excellent_threshold = 0.8f;
    } quality;

    // === Field Validation ===
    struct Validation {
        size_t max_name_length = 100;
        size_t max_description_length = 500;
        size_t max_topics = 20;
        float max_centroid_magnitude = 10.0f;
        size_t dominant_topic_count = 3;
    } validation;

    // === Clustering Lifecycle ===
    struct Clustering {
        size_t default_dimension = 128;
        size_t min_dimension = 32;
        size_t max_dimension = 512;

        float recompute_interval_hours = 24.0f;
        float stale_threshold_hours = 72.0f;

        float merge_similarity_threshold = 0.85f;
        float split_coherence_threshold = 0.3f;
        float quality_threshold = 0.5f;

        bool auto_archive = true;
        bool auto_merge = false;
        float auto_archive_after_days = 30.0f;
        size_t min_active_members = 5;
    } clustering;

    // === Assignment Decisions ===
    struct Assignment {
        float min_similarity = 0.5f;
        float good_similarity = 0.7f;
        float excellent_similarity = 0.85f;
        float auto_assign_threshold = 0.8f;
        float manual_review_threshold = 0.6f;
    } assignment;

    // === Health Analysis ===
    struct Analysis {
        float low_coherence_threshold = 0.4f;
        float low_density_threshold = 0.2f;
        size_t oversized_threshold = 800;
        size_t undersized_threshold = 5;

        float merge_recommendation_confidence = 0.7f;
        float split_recommendation_confidence = 0.6f;
        float recompute_recommendation_confidence = 0.5f;
        float stale_confidence_bonus = 0.1f;

        size_t max_issues = 10;
        size_t max_recommendations = 5;

        float stability_horizon_days = 30.0f;
    } analysis;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return ClusterConfig if successful, std::nullopt on error
    static std::optional<ClusterConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// Missing keys keep their defaults; unknown keys are ignored
    /// @param yaml_content YAML content as string
    /// @return ClusterConfig if successful, std::nullopt on error
    static std::optional<ClusterConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string (same layout LoadFromString reads)
    std::string ToYamlString() const;

    /// @return true if configuration is valid
    bool Validate() const;

    /// @return Vector of error messages, empty when valid
    std::vector<std::string> GetValidationErrors() const;

    /// Create default configuration
    static ClusterConfig Default();

    bool operator==(const ClusterConfig& other) const;
    bool operator!=(const ClusterConfig& other) const { return !(*this == other); }
};

} // namespace clustra

#endif // CLUSTRA_CLUSTER_CONFIG_HPP
