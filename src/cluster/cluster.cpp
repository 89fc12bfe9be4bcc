// File: src/cluster/cluster.cpp
#include "cluster/cluster.hpp"
#include "cluster/cluster_analyzer.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace clustra {

namespace {

// Interactions per member at which density saturates to 1.0
constexpr float kInteractionsPerMemberForFullDensity = 100.0f;

// Order-preserving deduplication
std::vector<std::string> Deduplicate(const std::vector<std::string>& values) {
    std::vector<std::string> result;
    std::unordered_set<std::string> seen;
    result.reserve(values.size());
    for (const auto& value : values) {
        if (seen.insert(value).second) {
            result.push_back(value);
        }
    }
    return result;
}

bool InUnitRange(float value) {
    return value >= 0.0f && value <= 1.0f;
}

void ValidateStatistics(const ClusterStatistics& stats) {
    if (!InUnitRange(stats.engagement_rate)) {
        throw ValidationError("Engagement rate must be between 0 and 1");
    }
    if (!InUnitRange(stats.retention_rate)) {
        throw ValidationError("Retention rate must be between 0 and 1");
    }
    if (!std::isfinite(stats.growth_rate)) {
        throw ValidationError("Growth rate must be finite");
    }
    const float averages[] = {stats.avg_views_per_member, stats.avg_likes_per_member,
                              stats.avg_comments_per_member, stats.avg_shares_per_member};
    for (float avg : averages) {
        if (!std::isfinite(avg) || avg < 0.0f) {
            throw ValidationError("Per-member averages must be finite and non-negative");
        }
    }
}

float RequireNotNaN(float value, const char* field) {
    if (std::isnan(value)) {
        throw ValidationError(std::string(field) + " must be a number");
    }
    return value;
}

} // namespace

// ============================================================================
// ClusterStatistics
// ============================================================================

bool ClusterStatistics::operator==(const ClusterStatistics& other) const {
    return total_members == other.total_members &&
           active_members == other.active_members &&
           total_interactions == other.total_interactions &&
           avg_views_per_member == other.avg_views_per_member &&
           avg_likes_per_member == other.avg_likes_per_member &&
           avg_comments_per_member == other.avg_comments_per_member &&
           avg_shares_per_member == other.avg_shares_per_member &&
           engagement_rate == other.engagement_rate &&
           growth_rate == other.growth_rate &&
           retention_rate == other.retention_rate &&
           last_calculated_at == other.last_calculated_at;
}

// ============================================================================
// Construction
// ============================================================================

Cluster Cluster::Create(const ClusterProps& props, Timestamp now) {
    Cluster cluster;
    cluster.config_ = props.config.value_or(ClusterConfig::Default());
    if (!cluster.config_.Validate()) {
        throw ValidationError("Invalid cluster configuration: " +
                              cluster.config_.GetValidationErrors().front());
    }

    cluster.id_ = ClusterID::Generate();
    cluster.name_ = props.name.empty()
        ? "Cluster " + cluster.id_.HexDigits().substr(8)
        : props.name;
    cluster.description_ = props.description;

    cluster.dimension_ = props.dimension;
    cluster.centroid_ = props.centroid.IsFinite()
        ? props.centroid.ClampedToMagnitude(cluster.config_.validation.max_centroid_magnitude)
        : props.centroid;

    cluster.size_ = props.size;
    cluster.density_ = props.density;
    cluster.coherence_ = props.coherence;
    cluster.avg_engagement_ = props.avg_engagement;

    cluster.topics_ = Deduplicate(props.topics);
    cluster.dominant_topics_ = props.dominant_topics.empty()
        ? cluster.IdentifyDominantTopics()
        : Deduplicate(props.dominant_topics);

    cluster.type_ = props.type;
    cluster.status_ = props.status;

    if (props.statistics) {
        cluster.statistics_ = *props.statistics;
    } else {
        cluster.statistics_.last_calculated_at = now;
    }

    cluster.created_at_ = now;
    cluster.updated_at_ = now;

    cluster.Validate();
    cluster.RecalculateQuality();
    return cluster;
}

Cluster Cluster::FromSnapshot(const ClusterSnapshot& snapshot) {
    if (!snapshot.id.IsValid()) {
        throw ValidationError("Snapshot has no valid cluster id");
    }
    if (!snapshot.config.Validate()) {
        throw ValidationError("Invalid cluster configuration: " +
                              snapshot.config.GetValidationErrors().front());
    }

    Cluster cluster;
    cluster.id_ = snapshot.id;
    cluster.name_ = snapshot.name;
    cluster.description_ = snapshot.description;
    cluster.config_ = snapshot.config;
    cluster.dimension_ = snapshot.dimension;
    cluster.centroid_ = snapshot.centroid.IsFinite()
        ? snapshot.centroid.ClampedToMagnitude(snapshot.config.validation.max_centroid_magnitude)
        : snapshot.centroid;
    cluster.size_ = snapshot.size;
    cluster.density_ = snapshot.density;
    cluster.coherence_ = snapshot.coherence;
    cluster.avg_engagement_ = snapshot.avg_engagement;
    cluster.topics_ = Deduplicate(snapshot.topics);
    cluster.dominant_topics_ = Deduplicate(snapshot.dominant_topics);
    cluster.type_ = snapshot.type;
    cluster.status_ = snapshot.status;
    cluster.statistics_ = snapshot.statistics;
    cluster.created_at_ = snapshot.created_at;
    cluster.updated_at_ = snapshot.updated_at;
    cluster.last_recomputed_at_ = snapshot.last_recomputed_at;

    cluster.Validate();
    cluster.RecalculateQuality();
    ClusterID::Reserve(cluster.id_);
    return cluster;
}

ClusterSnapshot Cluster::ToSnapshot() const {
    ClusterSnapshot snapshot;
    snapshot.id = id_;
    snapshot.name = name_;
    snapshot.description = description_;
    snapshot.centroid = centroid_;
    snapshot.dimension = dimension_;
    snapshot.size = size_;
    snapshot.density = density_;
    snapshot.coherence = coherence_;
    snapshot.avg_engagement = avg_engagement_;
    snapshot.topics = topics_;
    snapshot.dominant_topics = dominant_topics_;
    snapshot.quality = quality_;
    snapshot.type = type_;
    snapshot.status = status_;
    snapshot.statistics = statistics_;
    snapshot.config = config_;
    snapshot.created_at = created_at_;
    snapshot.updated_at = updated_at_;
    snapshot.last_recomputed_at = last_recomputed_at_;
    return snapshot;
}

// ============================================================================
// Mutators
// ============================================================================

void Cluster::UpdateCentroid(const EmbeddingVector& centroid, Timestamp now) {
    if (centroid.Dimension() != dimension_) {
        throw DimensionMismatchError(dimension_, centroid.Dimension());
    }
    if (!centroid.IsFinite()) {
        throw ValidationError("Centroid components must be finite");
    }

    centroid_ = centroid.ClampedToMagnitude(config_.validation.max_centroid_magnitude);
    last_recomputed_at_ = now;
    updated_at_ = now;
    RecalculateQuality();
}

void Cluster::AddMember(Timestamp now) {
    size_ += 1;
    statistics_.total_members += 1;
    statistics_.active_members += 1;
    updated_at_ = now;
    RecalculateDensity();
    RecalculateQuality();
}

void Cluster::RemoveMember(Timestamp now) {
    if (size_ == 0) {
        return;
    }

    size_ -= 1;
    if (statistics_.total_members > 0) statistics_.total_members -= 1;
    if (statistics_.active_members > 0) statistics_.active_members -= 1;
    updated_at_ = now;
    RecalculateDensity();
    RecalculateQuality();
}

void Cluster::UpdateMetrics(const MetricsUpdate& metrics, Timestamp now) {
    // Validate everything before touching any field
    std::optional<float> density, coherence, engagement;
    if (metrics.density) {
        density = std::clamp(RequireNotNaN(*metrics.density, "Density"), 0.0f, 1.0f);
    }
    if (metrics.coherence) {
        coherence = std::clamp(RequireNotNaN(*metrics.coherence, "Coherence"), 0.0f, 1.0f);
    }
    if (metrics.avg_engagement) {
        float value = RequireNotNaN(*metrics.avg_engagement, "Average engagement");
        if (std::isinf(value)) {
            throw ValidationError("Average engagement must be finite");
        }
        engagement = std::max(0.0f, value);
    }

    if (density) density_ = *density;
    if (coherence) coherence_ = *coherence;
    if (engagement) avg_engagement_ = *engagement;

    updated_at_ = now;
    RecalculateQuality();
}

void Cluster::UpdateTopics(const std::vector<std::string>& topics,
                           const std::optional<std::vector<std::string>>& dominant_topics,
                           Timestamp now) {
    const size_t max_topics = config_.validation.max_topics;

    std::vector<std::string> unique_topics = Deduplicate(topics);
    if (unique_topics.size() > max_topics) {
        throw ValidationError("Too many topics: max " + std::to_string(max_topics) +
                              ", got " + std::to_string(unique_topics.size()));
    }

    std::vector<std::string> unique_dominant;
    if (dominant_topics) {
        unique_dominant = Deduplicate(*dominant_topics);
        if (unique_dominant.size() > max_topics) {
            throw ValidationError("Too many dominant topics: max " + std::to_string(max_topics) +
                                  ", got " + std::to_string(unique_dominant.size()));
        }
    }

    topics_ = std::move(unique_topics);
    dominant_topics_ = dominant_topics ? std::move(unique_dominant) : IdentifyDominantTopics();
    updated_at_ = now;
}

void Cluster::UpdateStatistics(const StatisticsUpdate& update, Timestamp now) {
    ClusterStatistics merged = statistics_;
    if (update.total_members) merged.total_members = *update.total_members;
    if (update.active_members) merged.active_members = *update.active_members;
    if (update.total_interactions) merged.total_interactions = *update.total_interactions;
    if (update.avg_views_per_member) merged.avg_views_per_member = *update.avg_views_per_member;
    if (update.avg_likes_per_member) merged.avg_likes_per_member = *update.avg_likes_per_member;
    if (update.avg_comments_per_member) merged.avg_comments_per_member = *update.avg_comments_per_member;
    if (update.avg_shares_per_member) merged.avg_shares_per_member = *update.avg_shares_per_member;
    if (update.engagement_rate) merged.engagement_rate = *update.engagement_rate;
    if (update.growth_rate) merged.growth_rate = *update.growth_rate;
    if (update.retention_rate) merged.retention_rate = *update.retention_rate;
    merged.last_calculated_at = now;

    ValidateStatistics(merged);

    statistics_ = merged;
    updated_at_ = now;
}

void Cluster::Archive(Timestamp now) {
    status_ = ClusterStatus::ARCHIVED;
    updated_at_ = now;
}

void Cluster::Activate(Timestamp now) {
    status_ = ClusterStatus::ACTIVE;
    updated_at_ = now;
}

void Cluster::Deactivate(Timestamp now) {
    status_ = ClusterStatus::INACTIVE;
    updated_at_ = now;
}

// ============================================================================
// Read-only analyses
// ============================================================================

bool Cluster::IsStale(Timestamp now) const {
    if (!last_recomputed_at_) {
        return true;
    }
    return now.HoursSince(*last_recomputed_at_) > config_.clustering.stale_threshold_hours;
}

float Cluster::GetQualityScore() const {
    return QualityScorer(config_).ComputeScore(GetQualityInputs());
}

QualityScorer::Breakdown Cluster::GetQualityBreakdown() const {
    return QualityScorer(config_).GetBreakdown(GetQualityInputs());
}

ClusterAnalysis Cluster::AnalyzeHealth(Timestamp now) const {
    return ClusterAnalyzer(config_).Analyze(*this, now);
}

std::string Cluster::ToString() const {
    std::ostringstream oss;
    oss << "Cluster{id=" << id_.ToString()
        << ", name=\"" << name_ << "\""
        << ", type=" << clustra::ToString(type_)
        << ", status=" << clustra::ToString(status_)
        << ", quality=" << clustra::ToString(quality_)
        << ", dim=" << dimension_
        << ", size=" << size_
        << std::fixed << std::setprecision(3)
        << ", coherence=" << coherence_
        << ", density=" << density_
        << ", engagement=" << avg_engagement_
        << ", topics=" << topics_.size()
        << "}";
    return oss.str();
}

// ============================================================================
// Private helpers
// ============================================================================

QualityInputs Cluster::GetQualityInputs() const {
    QualityInputs inputs;
    inputs.coherence = coherence_;
    inputs.density = density_;
    inputs.size = size_;
    inputs.avg_engagement = avg_engagement_;
    return inputs;
}

void Cluster::RecalculateQuality() {
    quality_ = QualityScorer(config_).Evaluate(GetQualityInputs());
}

void Cluster::RecalculateDensity() {
    if (size_ == 0) {
        return;
    }
    float per_member_capacity = static_cast<float>(size_) * kInteractionsPerMemberForFullDensity;
    density_ = std::min(1.0f, static_cast<float>(statistics_.total_interactions) / per_member_capacity);
}

std::vector<std::string> Cluster::IdentifyDominantTopics() const {
    size_t count = std::min(config_.validation.dominant_topic_count, topics_.size());
    return std::vector<std::string>(topics_.begin(), topics_.begin() + static_cast<std::ptrdiff_t>(count));
}

void Cluster::Validate() const {
    const auto& clustering = config_.clustering;
    const auto& validation = config_.validation;

    if (centroid_.IsEmpty()) {
        throw ValidationError("Centroid is required");
    }
    if (dimension_ < clustering.min_dimension || dimension_ > clustering.max_dimension) {
        throw ValidationError("Invalid dimension " + std::to_string(dimension_) +
                              ": must be between " + std::to_string(clustering.min_dimension) +
                              " and " + std::to_string(clustering.max_dimension));
    }
    if (centroid_.Dimension() != dimension_) {
        throw DimensionMismatchError(dimension_, centroid_.Dimension());
    }
    if (!centroid_.IsFinite()) {
        throw ValidationError("Centroid components must be finite");
    }
    if (!InUnitRange(coherence_)) {
        throw ValidationError("Coherence must be between 0 and 1");
    }
    if (!InUnitRange(density_)) {
        throw ValidationError("Density must be between 0 and 1");
    }
    if (!std::isfinite(avg_engagement_) || avg_engagement_ < 0.0f) {
        throw ValidationError("Average engagement must be finite and non-negative");
    }
    if (name_.size() > validation.max_name_length) {
        throw ValidationError("Name too long: max " +
                              std::to_string(validation.max_name_length) + " characters");
    }
    if (description_.size() > validation.max_description_length) {
        throw ValidationError("Description too long: max " +
                              std::to_string(validation.max_description_length) + " characters");
    }
    if (topics_.size() > validation.max_topics) {
        throw ValidationError("Too many topics: max " + std::to_string(validation.max_topics) +
                              ", got " + std::to_string(topics_.size()));
    }
    if (dominant_topics_.size() > validation.max_topics) {
        throw ValidationError("Too many dominant topics: max " +
                              std::to_string(validation.max_topics));
    }
    ValidateStatistics(statistics_);
}

} // namespace clustra
