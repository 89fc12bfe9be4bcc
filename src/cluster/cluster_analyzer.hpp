// File: src/cluster/cluster_analyzer.hpp
//
// Cluster Health Analysis
//
// Inspects a cluster snapshot and reports issues together with maintenance
// recommendations. Checks run in a fixed order so repeated analyses of the
// same input produce identical output:
//
//   1. Low coherence  (coherence < low_coherence_threshold)  -> high issue + recompute
//   2. Low density    (density < low_density_threshold)      -> medium issue
//   3. Oversized      (size > oversized_threshold)           -> medium issue + split
//   4. Undersized     (size < undersized_threshold, only if not oversized)
//                                                            -> low issue + merge
//   5. Stale          (Cluster::IsStale(now), judged by the cluster's
//                      own stale_threshold_hours)            -> medium issue + recompute
//
// The low-coherence recompute gains stale_confidence_bonus when the cluster
// is also stale.
//
// Component scores:
//   coherence = cluster coherence
//   density   = cluster density
//   diversity = min(|topics| / max_topics, 1) × 0.8 + 0.2   (0 with no topics)
//   stability = 0.5 × min(age_days / horizon, 1) + 0.5 × max(0, 1 − |growth_rate|)

#pragma once

#include "config/cluster_config.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace clustra {

class Cluster;

enum class IssueType : uint8_t {
    LOW_COHERENCE = 0,
    LOW_DENSITY = 1,
    OVERSIZED = 2,
    UNDERSIZED = 3,
    STALE = 4,
};

enum class IssueSeverity : uint8_t {
    LOW = 0,
    MEDIUM = 1,
    HIGH = 2,
};

enum class RecommendationType : uint8_t {
    MERGE = 0,
    SPLIT = 1,
    RECOMPUTE = 2,
    ARCHIVE = 3,
};

const char* ToString(IssueType type);
const char* ToString(IssueSeverity severity);
const char* ToString(RecommendationType type);

struct ClusterIssue {
    IssueType type{IssueType::LOW_COHERENCE};
    IssueSeverity severity{IssueSeverity::LOW};
    std::string description;
    std::string suggested_action;

    bool operator==(const ClusterIssue& other) const;
    bool operator!=(const ClusterIssue& other) const { return !(*this == other); }
};

struct ClusterRecommendation {
    RecommendationType type{RecommendationType::RECOMPUTE};
    std::string reason;
    float confidence{0.0f};
    std::vector<ClusterID> target_cluster_ids;

    bool operator==(const ClusterRecommendation& other) const;
    bool operator!=(const ClusterRecommendation& other) const { return !(*this == other); }
};

/// Result of ClusterAnalyzer::Analyze
struct ClusterAnalysis {
    ClusterID cluster_id;
    ClusterQuality quality{ClusterQuality::LOW};

    float coherence_score{0.0f};
    float density_score{0.0f};
    float diversity_score{0.0f};
    float stability_score{0.0f};

    std::vector<ClusterIssue> issues;                     ///< Detection order
    std::vector<ClusterRecommendation> recommendations;   ///< Detection order

    Timestamp analyzed_at;

    bool HasIssue(IssueType type) const;
    bool HasRecommendation(RecommendationType type) const;

    bool operator==(const ClusterAnalysis& other) const;
    bool operator!=(const ClusterAnalysis& other) const { return !(*this == other); }

    /// Stable textual form; identical analyses render identically
    std::string ToString() const;
};

/// Stateless health analyzer. Never mutates the cluster and never throws.
class ClusterAnalyzer {
public:
    ClusterAnalyzer();

    explicit ClusterAnalyzer(const ClusterConfig& config);

    /// Analyze a cluster as of `now`
    ClusterAnalysis Analyze(const Cluster& cluster, Timestamp now) const;

    /// Topic-variety score in [0,1]
    float ComputeDiversityScore(size_t topic_count) const;

    /// Age/growth stability score in [0,1]
    float ComputeStabilityScore(const Cluster& cluster, Timestamp now) const;

    const ClusterConfig& GetConfig() const { return config_; }

private:
    ClusterConfig config_;

    void CheckCoherence(const Cluster& cluster, bool stale,
                        std::vector<ClusterIssue>& issues,
                        std::vector<ClusterRecommendation>& recommendations) const;
    void CheckDensity(const Cluster& cluster,
                      std::vector<ClusterIssue>& issues) const;
    void CheckSize(const Cluster& cluster,
                   std::vector<ClusterIssue>& issues,
                   std::vector<ClusterRecommendation>& recommendations) const;
    void CheckStaleness(bool stale,
                        std::vector<ClusterIssue>& issues,
                        std::vector<ClusterRecommendation>& recommendations) const;
};

} // namespace clustra
