// File: src/cluster/quality_scorer.hpp
//
// Quality Scorer for Clusters
//
// Combines a cluster's raw metrics into a single quality score and maps it
// onto a quality level. The level is always derived from the score, never
// stored as an independent input.
//
// Mathematical Foundation:
//   Q(c) = w_c × C(c) + w_d × D(c) + w_s × S(c) + w_e × E(c)
//
// Where:
//   C(c) = coherence ∈ [0,1]
//   D(c) = density ∈ [0,1]
//   S(c) = size score: size_score_max inside [optimal_min, optimal_max],
//          otherwise max(size_score_min, ratio × size_score_max) with
//          ratio = size / optimal_min (undersized) or optimal_max / size (oversized)
//   E(c) = min(avg_engagement, engagement_cap)
//   w_c, w_d, w_s, w_e = weights (sum to 1.0)

#pragma once

#include "config/cluster_config.hpp"
#include "core/types.hpp"
#include <cstddef>

namespace clustra {

/// Raw metrics a quality score is computed from
struct QualityInputs {
    float coherence{0.0f};
    float density{0.0f};
    size_t size{0};
    float avg_engagement{0.0f};
};

/// Stateless scorer bound to the quality section of a ClusterConfig
class QualityScorer {
public:
    /// Detailed breakdown of score components (already weighted)
    struct Breakdown {
        float coherence_component{0.0f};
        float density_component{0.0f};
        float size_component{0.0f};
        float engagement_component{0.0f};
        float total{0.0f};
    };

    QualityScorer();

    explicit QualityScorer(const ClusterConfig& config);

    /// @return Weighted quality score
    float ComputeScore(const QualityInputs& inputs) const;

    /// Weighted components and their sum
    Breakdown GetBreakdown(const QualityInputs& inputs) const;

    /// Unweighted size score in [size_score_min, size_score_max]
    float ComputeSizeScore(size_t size) const;

    /// Map a score onto a quality level using the configured thresholds
    ClusterQuality ToLevel(float score) const;

    /// Shorthand for ToLevel(ComputeScore(inputs))
    ClusterQuality Evaluate(const QualityInputs& inputs) const;

private:
    ClusterConfig::Quality quality_;
    ClusterConfig::Size size_;
};

} // namespace clustra
