// File: src/maintenance/maintenance_planner.hpp
//
// Maintenance Planner
//
// Read-only helpers for an external scheduler that decides when clusters are
// recomputed or archived. Nothing here mutates a cluster or keeps state
// between calls.

#pragma once

#include "cluster/cluster.hpp"
#include <map>
#include <string>
#include <vector>

namespace clustra {

/// Aggregate view of a set of clusters
struct ClusterSummary {
    size_t total_clusters{0};
    size_t active_clusters{0};

    float average_size{0.0f};
    float average_coherence{0.0f};
    float average_density{0.0f};

    std::map<ClusterQuality, size_t> quality_distribution;
    std::map<ClusterType, size_t> type_distribution;

    std::string ToString() const;
};

class MaintenancePlanner {
public:
    /// Ids of stale, non-archived clusters ordered most stale first.
    /// Clusters never recomputed come before all others.
    std::vector<ClusterID> SelectStale(const std::vector<Cluster>& clusters,
                                       Timestamp now = Timestamp::Now()) const;

    /// True when the cluster's own config enables auto-archive, it is not yet
    /// archived, it has fewer than min_active_members active members and it
    /// is older than auto_archive_after_days.
    bool ShouldAutoArchive(const Cluster& cluster, Timestamp now = Timestamp::Now()) const;

    ClusterSummary Summarize(const std::vector<Cluster>& clusters) const;
};

} // namespace clustra
