// File: src/maintenance/maintenance_planner.cpp
//
// Implementation of Maintenance Planner

#include "maintenance/maintenance_planner.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace clustra {

std::string ClusterSummary::ToString() const {
    std::ostringstream oss;
    oss << "ClusterSummary{total=" << total_clusters
        << ", active=" << active_clusters
        << std::fixed << std::setprecision(2)
        << ", avg_size=" << average_size
        << ", avg_coherence=" << average_coherence
        << ", avg_density=" << average_density
        << ", quality={";
    bool first = true;
    for (const auto& [quality, count] : quality_distribution) {
        if (!first) oss << ", ";
        oss << clustra::ToString(quality) << ": " << count;
        first = false;
    }
    oss << "}, type={";
    first = true;
    for (const auto& [type, count] : type_distribution) {
        if (!first) oss << ", ";
        oss << clustra::ToString(type) << ": " << count;
        first = false;
    }
    oss << "}}";
    return oss.str();
}

std::vector<ClusterID> MaintenancePlanner::SelectStale(const std::vector<Cluster>& clusters,
                                                       Timestamp now) const {
    std::vector<const Cluster*> candidates;
    for (const auto& cluster : clusters) {
        if (cluster.GetStatus() == ClusterStatus::ARCHIVED) {
            continue;
        }
        if (cluster.IsStale(now)) {
            candidates.push_back(&cluster);
        }
    }

    // Never recomputed first, then oldest recompute first, ties by id
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Cluster* a, const Cluster* b) {
        auto ra = a->GetLastRecomputedAt();
        auto rb = b->GetLastRecomputedAt();
        if (ra.has_value() != rb.has_value()) {
            return !ra.has_value();
        }
        if (ra && *ra != *rb) {
            return *ra < *rb;
        }
        return a->GetID() < b->GetID();
    });

    std::vector<ClusterID> result;
    result.reserve(candidates.size());
    for (const Cluster* cluster : candidates) {
        result.push_back(cluster->GetID());
    }
    return result;
}

bool MaintenancePlanner::ShouldAutoArchive(const Cluster& cluster, Timestamp now) const {
    const auto& clustering = cluster.GetConfig().clustering;

    if (!clustering.auto_archive) {
        return false;
    }
    if (cluster.GetStatus() == ClusterStatus::ARCHIVED) {
        return false;
    }
    if (cluster.GetStatistics().active_members >= clustering.min_active_members) {
        return false;
    }
    return now.DaysSince(cluster.GetCreatedAt()) > clustering.auto_archive_after_days;
}

ClusterSummary MaintenancePlanner::Summarize(const std::vector<Cluster>& clusters) const {
    ClusterSummary summary;
    summary.total_clusters = clusters.size();
    if (clusters.empty()) {
        return summary;
    }

    double total_size = 0.0;
    double total_coherence = 0.0;
    double total_density = 0.0;

    for (const auto& cluster : clusters) {
        if (cluster.GetStatus() == ClusterStatus::ACTIVE) {
            summary.active_clusters++;
        }
        total_size += static_cast<double>(cluster.GetSize());
        total_coherence += cluster.GetCoherence();
        total_density += cluster.GetDensity();

        summary.quality_distribution[cluster.GetQuality()]++;
        summary.type_distribution[cluster.GetType()]++;
    }

    double count = static_cast<double>(clusters.size());
    summary.average_size = static_cast<float>(total_size / count);
    summary.average_coherence = static_cast<float>(total_coherence / count);
    summary.average_density = static_cast<float>(total_density / count);
    return summary;
}

} // namespace clustra
