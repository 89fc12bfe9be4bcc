// File: src/cluster/quality_scorer.cpp
//
// Implementation of Quality Scorer

#include "cluster/quality_scorer.hpp"
#include <algorithm>

namespace clustra {

QualityScorer::QualityScorer()
    : QualityScorer(ClusterConfig::Default()) {}

QualityScorer::QualityScorer(const ClusterConfig& config)
    : quality_(config.quality), size_(config.size) {}

float QualityScorer::ComputeSizeScore(size_t size) const {
    if (size >= size_.optimal_min_size && size <= size_.optimal_max_size) {
        return quality_.size_score_max;
    }
    if (size == 0) {
        return quality_.size_score_min;
    }

    // Both divisors are non-zero here: optimal_min_size > size >= 1 or size > optimal_max_size
    float ratio = size < size_.optimal_min_size
        ? static_cast<float>(size) / static_cast<float>(size_.optimal_min_size)
        : static_cast<float>(size_.optimal_max_size) / static_cast<float>(size);

    return std::max(quality_.size_score_min, ratio * quality_.size_score_max);
}

QualityScorer::Breakdown QualityScorer::GetBreakdown(const QualityInputs& inputs) const {
    Breakdown breakdown;
    breakdown.coherence_component = inputs.coherence * quality_.coherence_weight;
    breakdown.density_component = inputs.density * quality_.density_weight;
    breakdown.size_component = ComputeSizeScore(inputs.size) * quality_.size_weight;
    breakdown.engagement_component =
        std::min(inputs.avg_engagement, quality_.engagement_cap) * quality_.engagement_weight;

    breakdown.total = breakdown.coherence_component +
                      breakdown.density_component +
                      breakdown.size_component +
                      breakdown.engagement_component;
    return breakdown;
}

float QualityScorer::ComputeScore(const QualityInputs& inputs) const {
    return GetBreakdown(inputs).total;
}

ClusterQuality QualityScorer::ToLevel(float score) const {
    if (score >= quality_.excellent_threshold) {
        return ClusterQuality::EXCELLENT;
    }
    if (score >= quality_.high_threshold) {
        return ClusterQuality::HIGH;
    }
    if (score >= quality_.medium_threshold) {
        return ClusterQuality::MEDIUM;
    }
    return ClusterQuality::LOW;
}

ClusterQuality QualityScorer::Evaluate(const QualityInputs& inputs) const {
    return ToLevel(ComputeScore(inputs));
}

} // namespace clustra
