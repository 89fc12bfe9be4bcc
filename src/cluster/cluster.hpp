// File: src/cluster/cluster.hpp
#pragma once

#include "config/cluster_config.hpp"
#include "core/types.hpp"
#include "core/vector_ops.hpp"
#include "cluster/quality_scorer.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace clustra {

struct ClusterAnalysis;

/// Aggregate membership and engagement statistics of a cluster
struct ClusterStatistics {
    uint64_t total_members{0};
    uint64_t active_members{0};
    uint64_t total_interactions{0};

    float avg_views_per_member{0.0f};
    float avg_likes_per_member{0.0f};
    float avg_comments_per_member{0.0f};
    float avg_shares_per_member{0.0f};

    float engagement_rate{0.0f};   ///< [0,1]
    float growth_rate{0.0f};       ///< Signed, relative change per period
    float retention_rate{0.0f};    ///< [0,1]

    Timestamp last_calculated_at;

    bool operator==(const ClusterStatistics& other) const;
    bool operator!=(const ClusterStatistics& other) const { return !(*this == other); }
};

/// Partial statistics update; unset fields keep their current value
struct StatisticsUpdate {
    std::optional<uint64_t> total_members;
    std::optional<uint64_t> active_members;
    std::optional<uint64_t> total_interactions;
    std::optional<float> avg_views_per_member;
    std::optional<float> avg_likes_per_member;
    std::optional<float> avg_comments_per_member;
    std::optional<float> avg_shares_per_member;
    std::optional<float> engagement_rate;
    std::optional<float> growth_rate;
    std::optional<float> retention_rate;
};

/// Partial metrics update; provided values are clamped into range
struct MetricsUpdate {
    std::optional<float> density;
    std::optional<float> coherence;
    std::optional<float> avg_engagement;
};

/// Caller-supplied fields for Cluster::Create. centroid and dimension are required.
struct ClusterProps {
    EmbeddingVector centroid;
    size_t dimension{0};

    std::string name;          ///< Empty selects "Cluster <id prefix>"
    std::string description;

    size_t size{0};
    float density{0.0f};
    float coherence{0.0f};
    float avg_engagement{0.0f};

    std::vector<std::string> topics;
    std::vector<std::string> dominant_topics;   ///< Empty derives from topics

    ClusterType type{ClusterType::CONTENT_BASED};
    ClusterStatus status{ClusterStatus::ACTIVE};

    std::optional<ClusterStatistics> statistics;
    std::optional<ClusterConfig> config;        ///< Unset uses ClusterConfig::Default()
};

/// Fully-formed cluster record exchanged with the persistence layer
struct ClusterSnapshot {
    ClusterID id;
    std::string name;
    std::string description;

    EmbeddingVector centroid;
    size_t dimension{0};
    size_t size{0};
    float density{0.0f};
    float coherence{0.0f};
    float avg_engagement{0.0f};

    std::vector<std::string> topics;
    std::vector<std::string> dominant_topics;

    ClusterQuality quality{ClusterQuality::LOW};  ///< Ignored on hydration; always re-derived
    ClusterType type{ClusterType::CONTENT_BASED};
    ClusterStatus status{ClusterStatus::ACTIVE};

    ClusterStatistics statistics;
    ClusterConfig config;

    Timestamp created_at;
    Timestamp updated_at;
    std::optional<Timestamp> last_recomputed_at;
};

/// Cluster: a semantic group of content items around a centroid.
///
/// Owns the centroid, membership count and derived metrics. Every mutator
/// validates before writing, so a thrown ValidationError leaves the cluster
/// unchanged. Not internally synchronized: callers serialize mutations per
/// cluster id, while const methods may run concurrently on a shared instance.
class Cluster {
public:
    /// Create a new cluster with a fresh id and timestamps
    /// @throws ValidationError on any invariant violation
    static Cluster Create(const ClusterProps& props, Timestamp now = Timestamp::Now());

    /// Hydrate a cluster from a stored snapshot; quality is re-derived
    /// @throws ValidationError on any invariant violation
    static Cluster FromSnapshot(const ClusterSnapshot& snapshot);

    /// Copy of the full state for the persistence layer
    ClusterSnapshot ToSnapshot() const;

    // Getters
    ClusterID GetID() const { return id_; }
    const std::string& GetName() const { return name_; }
    const std::string& GetDescription() const { return description_; }
    const EmbeddingVector& GetCentroid() const { return centroid_; }
    size_t GetDimension() const { return dimension_; }
    size_t GetSize() const { return size_; }
    float GetDensity() const { return density_; }
    float GetCoherence() const { return coherence_; }
    float GetAvgEngagement() const { return avg_engagement_; }
    const std::vector<std::string>& GetTopics() const { return topics_; }
    const std::vector<std::string>& GetDominantTopics() const { return dominant_topics_; }
    ClusterQuality GetQuality() const { return quality_; }
    ClusterType GetType() const { return type_; }
    ClusterStatus GetStatus() const { return status_; }
    const ClusterStatistics& GetStatistics() const { return statistics_; }
    const ClusterConfig& GetConfig() const { return config_; }
    Timestamp GetCreatedAt() const { return created_at_; }
    Timestamp GetUpdatedAt() const { return updated_at_; }
    std::optional<Timestamp> GetLastRecomputedAt() const { return last_recomputed_at_; }

    /// Replace the centroid with a freshly computed one.
    /// Magnitudes above max_centroid_magnitude are rescaled to unit length.
    /// @throws DimensionMismatchError if the length differs from GetDimension()
    /// @throws ValidationError if any component is not finite
    void UpdateCentroid(const EmbeddingVector& centroid, Timestamp now = Timestamp::Now());

    /// Record one new member; re-derives density and quality
    void AddMember(Timestamp now = Timestamp::Now());

    /// Record one departed member; a no-op when the cluster is empty
    void RemoveMember(Timestamp now = Timestamp::Now());

    /// Apply externally computed metrics (clamped into range)
    /// @throws ValidationError if a provided value is NaN
    void UpdateMetrics(const MetricsUpdate& metrics, Timestamp now = Timestamp::Now());

    /// Replace topics (deduplicated, order kept). Without explicit dominant
    /// topics the first dominant_topic_count topics are used.
    /// @throws ValidationError if more than max_topics remain after deduplication
    void UpdateTopics(const std::vector<std::string>& topics,
                      const std::optional<std::vector<std::string>>& dominant_topics = std::nullopt,
                      Timestamp now = Timestamp::Now());

    /// Merge provided statistics fields and stamp last_calculated_at
    /// @throws ValidationError on out-of-range rates or negative averages
    void UpdateStatistics(const StatisticsUpdate& update, Timestamp now = Timestamp::Now());

    // Status transitions. ARCHIVED is revocable through Activate().
    void Archive(Timestamp now = Timestamp::Now());
    void Activate(Timestamp now = Timestamp::Now());
    void Deactivate(Timestamp now = Timestamp::Now());

    /// True if never recomputed or last recomputed more than
    /// stale_threshold_hours before now
    bool IsStale(Timestamp now = Timestamp::Now()) const;

    /// Current weighted quality score
    float GetQualityScore() const;
    QualityScorer::Breakdown GetQualityBreakdown() const;

    /// Health report; see ClusterAnalyzer
    ClusterAnalysis AnalyzeHealth(Timestamp now = Timestamp::Now()) const;

    std::string ToString() const;

private:
    Cluster() = default;

    QualityInputs GetQualityInputs() const;
    void RecalculateQuality();
    void RecalculateDensity();
    std::vector<std::string> IdentifyDominantTopics() const;

    // Throws ValidationError describing the first violated invariant
    void Validate() const;

    ClusterID id_;
    std::string name_;
    std::string description_;

    EmbeddingVector centroid_;
    size_t dimension_{0};
    size_t size_{0};
    float density_{0.0f};
    float coherence_{0.0f};
    float avg_engagement_{0.0f};

    std::vector<std::string> topics_;
    std::vector<std::string> dominant_topics_;

    ClusterQuality quality_{ClusterQuality::LOW};
    ClusterType type_{ClusterType::CONTENT_BASED};
    ClusterStatus status_{ClusterStatus::ACTIVE};

    ClusterStatistics statistics_;
    ClusterConfig config_;

    Timestamp created_at_;
    Timestamp updated_at_;
    std::optional<Timestamp> last_recomputed_at_;
};

} // namespace clustra
