// File: tests/maintenance/maintenance_planner_test.cpp
#include "maintenance/maintenance_planner.hpp"
#include <gtest/gtest.h>

namespace clustra {
namespace {

constexpr size_t kDim = 32;

class MaintenancePlannerTest : public ::testing::Test {
protected:
    Timestamp now = Timestamp::FromMicros(1700000000000000LL);
    MaintenancePlanner planner;

    ClusterProps Props() const {
        ClusterProps props;
        props.centroid = EmbeddingVector(std::vector<float>(kDim, 0.1f));
        props.dimension = kDim;
        return props;
    }

    Cluster RecomputedHoursAgo(double hours) const {
        Cluster cluster = Cluster::Create(Props(), now - std::chrono::hours(500));
        auto offset = std::chrono::duration_cast<Timestamp::Duration>(
            std::chrono::duration<double, std::ratio<3600>>(hours));
        cluster.UpdateCentroid(cluster.GetCentroid(), now - offset);
        return cluster;
    }
};

// ============================================================================
// SelectStale
// ============================================================================

TEST_F(MaintenancePlannerTest, SelectStaleOrdersMostStaleFirst) {
    std::vector<Cluster> clusters;
    clusters.push_back(RecomputedHoursAgo(100));
    clusters.push_back(RecomputedHoursAgo(1));
    clusters.push_back(Cluster::Create(Props(), now));   // never recomputed
    clusters.push_back(RecomputedHoursAgo(300));

    auto stale = planner.SelectStale(clusters, now);

    ASSERT_EQ(3u, stale.size());
    EXPECT_EQ(clusters[2].GetID(), stale[0]);
    EXPECT_EQ(clusters[3].GetID(), stale[1]);
    EXPECT_EQ(clusters[0].GetID(), stale[2]);
}

TEST_F(MaintenancePlannerTest, SelectStaleSkipsArchived) {
    std::vector<Cluster> clusters;
    clusters.push_back(RecomputedHoursAgo(100));
    clusters.back().Archive(now);
    clusters.push_back(RecomputedHoursAgo(90));
    clusters.back().Deactivate(now);

    auto stale = planner.SelectStale(clusters, now);

    ASSERT_EQ(1u, stale.size());
    EXPECT_EQ(clusters[1].GetID(), stale[0]);
}

TEST_F(MaintenancePlannerTest, SelectStaleEmptyInput) {
    EXPECT_TRUE(planner.SelectStale({}, now).empty());
}

// ============================================================================
// ShouldAutoArchive
// ============================================================================

TEST_F(MaintenancePlannerTest, AutoArchiveOldQuietCluster) {
    Cluster cluster = Cluster::Create(Props(), now - std::chrono::hours(24 * 31));
    EXPECT_TRUE(planner.ShouldAutoArchive(cluster, now));
}

TEST_F(MaintenancePlannerTest, NoAutoArchiveWhenYoung) {
    Cluster cluster = Cluster::Create(Props(), now - std::chrono::hours(24 * 10));
    EXPECT_FALSE(planner.ShouldAutoArchive(cluster, now));
}

TEST_F(MaintenancePlannerTest, NoAutoArchiveWithEnoughActiveMembers) {
    Cluster cluster = Cluster::Create(Props(), now - std::chrono::hours(24 * 60));
    for (int i = 0; i < 5; ++i) {
        cluster.AddMember(now);
    }
    EXPECT_FALSE(planner.ShouldAutoArchive(cluster, now));
}

TEST_F(MaintenancePlannerTest, NoAutoArchiveWhenDisabledOrArchived) {
    ClusterProps props = Props();
    ClusterConfig config = ClusterConfig::Default();
    config.clustering.auto_archive = false;
    props.config = config;
    Cluster disabled = Cluster::Create(props, now - std::chrono::hours(24 * 60));
    EXPECT_FALSE(planner.ShouldAutoArchive(disabled, now));

    Cluster archived = Cluster::Create(Props(), now - std::chrono::hours(24 * 60));
    archived.Archive(now);
    EXPECT_FALSE(planner.ShouldAutoArchive(archived, now));
}

// ============================================================================
// Summarize
// ============================================================================

TEST_F(MaintenancePlannerTest, SummarizeEmpty) {
    auto summary = planner.Summarize({});
    EXPECT_EQ(0u, summary.total_clusters);
    EXPECT_FLOAT_EQ(0.0f, summary.average_size);
    EXPECT_TRUE(summary.quality_distribution.empty());
}

TEST_F(MaintenancePlannerTest, SummarizeAggregates) {
    ClusterProps a = Props();
    a.size = 10;
    a.coherence = 0.8f;
    a.density = 0.4f;

    ClusterProps b = Props();
    b.size = 30;
    b.coherence = 0.4f;
    b.density = 0.2f;
    b.type = ClusterType::HYBRID;

    std::vector<Cluster> clusters;
    clusters.push_back(Cluster::Create(a, now));
    clusters.push_back(Cluster::Create(b, now));
    clusters.back().Deactivate(now);

    auto summary = planner.Summarize(clusters);

    EXPECT_EQ(2u, summary.total_clusters);
    EXPECT_EQ(1u, summary.active_clusters);
    EXPECT_FLOAT_EQ(20.0f, summary.average_size);
    EXPECT_NEAR(0.6f, summary.average_coherence, 1e-6f);
    EXPECT_NEAR(0.3f, summary.average_density, 1e-6f);
    EXPECT_EQ(1u, summary.type_distribution[ClusterType::CONTENT_BASED]);
    EXPECT_EQ(1u, summary.type_distribution[ClusterType::HYBRID]);

    size_t counted = 0;
    for (const auto& entry : summary.quality_distribution) {
        counted += entry.second;
    }
    EXPECT_EQ(2u, counted);
    EXPECT_NE(std::string::npos, summary.ToString().find("total=2"));
}

} // namespace
} // namespace clustra
