// File: src/cluster/cluster_analyzer.cpp
//
// Implementation of Cluster Health Analysis

#include "cluster/cluster_analyzer.hpp"
#include "cluster/cluster.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace clustra {

namespace {

// Diversity score layout: floor plus a topic-ratio share
constexpr float kDiversityFloor = 0.2f;
constexpr float kDiversityRange = 0.8f;

std::string FormatFixed2(float value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

template <typename T>
void Truncate(std::vector<T>& items, size_t max_items) {
    if (items.size() > max_items) {
        items.resize(max_items);
    }
}

} // namespace

// ============================================================================
// Enum strings
// ============================================================================

const char* ToString(IssueType type) {
    switch (type) {
        case IssueType::LOW_COHERENCE: return "low_coherence";
        case IssueType::LOW_DENSITY: return "low_density";
        case IssueType::OVERSIZED: return "oversized";
        case IssueType::UNDERSIZED: return "undersized";
        case IssueType::STALE: return "stale";
        default: return "unknown";
    }
}

const char* ToString(IssueSeverity severity) {
    switch (severity) {
        case IssueSeverity::LOW: return "low";
        case IssueSeverity::MEDIUM: return "medium";
        case IssueSeverity::HIGH: return "high";
        default: return "unknown";
    }
}

const char* ToString(RecommendationType type) {
    switch (type) {
        case RecommendationType::MERGE: return "merge";
        case RecommendationType::SPLIT: return "split";
        case RecommendationType::RECOMPUTE: return "recompute";
        case RecommendationType::ARCHIVE: return "archive";
        default: return "unknown";
    }
}

// ============================================================================
// Result types
// ============================================================================

bool ClusterIssue::operator==(const ClusterIssue& other) const {
    return type == other.type &&
           severity == other.severity &&
           description == other.description &&
           suggested_action == other.suggested_action;
}

bool ClusterRecommendation::operator==(const ClusterRecommendation& other) const {
    return type == other.type &&
           reason == other.reason &&
           confidence == other.confidence &&
           target_cluster_ids == other.target_cluster_ids;
}

bool ClusterAnalysis::HasIssue(IssueType type) const {
    return std::any_of(issues.begin(), issues.end(),
                       [type](const ClusterIssue& issue) { return issue.type == type; });
}

bool ClusterAnalysis::HasRecommendation(RecommendationType type) const {
    return std::any_of(recommendations.begin(), recommendations.end(),
                       [type](const ClusterRecommendation& rec) { return rec.type == type; });
}

bool ClusterAnalysis::operator==(const ClusterAnalysis& other) const {
    return cluster_id == other.cluster_id &&
           quality == other.quality &&
           coherence_score == other.coherence_score &&
           density_score == other.density_score &&
           diversity_score == other.diversity_score &&
           stability_score == other.stability_score &&
           issues == other.issues &&
           recommendations == other.recommendations &&
           analyzed_at == other.analyzed_at;
}

std::string ClusterAnalysis::ToString() const {
    std::ostringstream oss;
    oss << "ClusterAnalysis{cluster=" << cluster_id.ToString()
        << ", quality=" << clustra::ToString(quality)
        << std::fixed << std::setprecision(6)
        << ", coherence=" << coherence_score
        << ", density=" << density_score
        << ", diversity=" << diversity_score
        << ", stability=" << stability_score
        << ", analyzed_at=" << analyzed_at.ToMicros()
        << ", issues=[";
    for (size_t i = 0; i < issues.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << clustra::ToString(issues[i].type) << "/" << clustra::ToString(issues[i].severity)
            << ": " << issues[i].description;
    }
    oss << "], recommendations=[";
    for (size_t i = 0; i < recommendations.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << clustra::ToString(recommendations[i].type)
            << "@" << recommendations[i].confidence
            << ": " << recommendations[i].reason;
    }
    oss << "]}";
    return oss.str();
}

// ============================================================================
// ClusterAnalyzer
// ============================================================================

ClusterAnalyzer::ClusterAnalyzer()
    : config_(ClusterConfig::Default()) {}

ClusterAnalyzer::ClusterAnalyzer(const ClusterConfig& config)
    : config_(config) {}

ClusterAnalysis ClusterAnalyzer::Analyze(const Cluster& cluster, Timestamp now) const {
    bool stale = cluster.IsStale(now);

    ClusterAnalysis analysis;
    analysis.cluster_id = cluster.GetID();
    analysis.quality = cluster.GetQuality();
    analysis.analyzed_at = now;

    CheckCoherence(cluster, stale, analysis.issues, analysis.recommendations);
    CheckDensity(cluster, analysis.issues);
    CheckSize(cluster, analysis.issues, analysis.recommendations);
    CheckStaleness(stale, analysis.issues, analysis.recommendations);

    Truncate(analysis.issues, config_.analysis.max_issues);
    Truncate(analysis.recommendations, config_.analysis.max_recommendations);

    analysis.coherence_score = cluster.GetCoherence();
    analysis.density_score = cluster.GetDensity();
    analysis.diversity_score = ComputeDiversityScore(cluster.GetTopics().size());
    analysis.stability_score = ComputeStabilityScore(cluster, now);

    return analysis;
}

float ClusterAnalyzer::ComputeDiversityScore(size_t topic_count) const {
    if (topic_count == 0) {
        return 0.0f;
    }

    size_t max_topics = std::max<size_t>(config_.validation.max_topics, 1);
    float topic_ratio = std::min(
        static_cast<float>(topic_count) / static_cast<float>(max_topics), 1.0f);
    return topic_ratio * kDiversityRange + kDiversityFloor;
}

float ClusterAnalyzer::ComputeStabilityScore(const Cluster& cluster, Timestamp now) const {
    double age_days = std::max(0.0, now.DaysSince(cluster.GetCreatedAt()));
    float age_score = static_cast<float>(
        std::min(age_days / config_.analysis.stability_horizon_days, 1.0));

    float growth_stability = std::max(0.0f, 1.0f - std::abs(cluster.GetStatistics().growth_rate));
    return age_score * 0.5f + growth_stability * 0.5f;
}

void ClusterAnalyzer::CheckCoherence(const Cluster& cluster, bool stale,
                                     std::vector<ClusterIssue>& issues,
                                     std::vector<ClusterRecommendation>& recommendations) const {
    const auto& analysis = config_.analysis;
    if (cluster.GetCoherence() >= analysis.low_coherence_threshold) {
        return;
    }

    ClusterIssue issue;
    issue.type = IssueType::LOW_COHERENCE;
    issue.severity = IssueSeverity::HIGH;
    issue.description = "Cluster coherence is " + FormatFixed2(cluster.GetCoherence()) +
                        ", below threshold";
    issue.suggested_action = "Consider recomputing cluster or splitting into sub-clusters";
    issues.push_back(std::move(issue));

    ClusterRecommendation rec;
    rec.type = RecommendationType::RECOMPUTE;
    rec.reason = "Low coherence detected";
    rec.confidence = analysis.recompute_recommendation_confidence +
                     (stale ? analysis.stale_confidence_bonus : 0.0f);
    recommendations.push_back(std::move(rec));
}

void ClusterAnalyzer::CheckDensity(const Cluster& cluster,
                                   std::vector<ClusterIssue>& issues) const {
    if (cluster.GetDensity() >= config_.analysis.low_density_threshold) {
        return;
    }

    ClusterIssue issue;
    issue.type = IssueType::LOW_DENSITY;
    issue.severity = IssueSeverity::MEDIUM;
    issue.description = "Cluster density is " + FormatFixed2(cluster.GetDensity()) +
                        ", below threshold";
    issue.suggested_action = "Consider merging with similar clusters";
    issues.push_back(std::move(issue));
}

void ClusterAnalyzer::CheckSize(const Cluster& cluster,
                                std::vector<ClusterIssue>& issues,
                                std::vector<ClusterRecommendation>& recommendations) const {
    const auto& analysis = config_.analysis;
    const size_t size = cluster.GetSize();

    if (size > analysis.oversized_threshold) {
        ClusterIssue issue;
        issue.type = IssueType::OVERSIZED;
        issue.severity = IssueSeverity::MEDIUM;
        issue.description = "Cluster has " + std::to_string(size) +
                            " members, exceeds recommended size";
        issue.suggested_action = "Consider splitting cluster";
        issues.push_back(std::move(issue));

        ClusterRecommendation rec;
        rec.type = RecommendationType::SPLIT;
        rec.reason = "Cluster is too large";
        rec.confidence = analysis.split_recommendation_confidence;
        recommendations.push_back(std::move(rec));
    } else if (size < analysis.undersized_threshold) {
        ClusterIssue issue;
        issue.type = IssueType::UNDERSIZED;
        issue.severity = IssueSeverity::LOW;
        issue.description = "Cluster has only " + std::to_string(size) + " members";
        issue.suggested_action = "Consider merging with similar clusters or archiving";
        issues.push_back(std::move(issue));

        ClusterRecommendation rec;
        rec.type = RecommendationType::MERGE;
        rec.reason = "Cluster is too small";
        rec.confidence = analysis.merge_recommendation_confidence;
        recommendations.push_back(std::move(rec));
    }
}

void ClusterAnalyzer::CheckStaleness(bool stale,
                                     std::vector<ClusterIssue>& issues,
                                     std::vector<ClusterRecommendation>& recommendations) const {
    if (!stale) {
        return;
    }

    ClusterIssue issue;
    issue.type = IssueType::STALE;
    issue.severity = IssueSeverity::MEDIUM;
    issue.description = "Cluster hasn't been recomputed recently";
    issue.suggested_action = "Recompute cluster centroid";
    issues.push_back(std::move(issue));

    ClusterRecommendation rec;
    rec.type = RecommendationType::RECOMPUTE;
    rec.reason = "Cluster is stale";
    rec.confidence = config_.analysis.recompute_recommendation_confidence +
                     config_.analysis.stale_confidence_bonus;
    recommendations.push_back(std::move(rec));
}

} // namespace clustra
