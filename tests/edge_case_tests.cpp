// File: tests/edge_case_tests.cpp
//
// Edge Case and Boundary Condition Tests
//
// This test suite focuses on:
// - Empty and degenerate inputs
// - Boundary values (min/max)
// - Error conditions that must leave state untouched
// - Status transitions in unusual orders

#include "cluster/cluster.hpp"
#include "cluster/cluster_analyzer.hpp"
#include "assignment/membership.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace clustra {
namespace {

ClusterProps PropsWithDimension(size_t dim) {
    ClusterProps props;
    props.centroid = EmbeddingVector(std::vector<float>(dim, 0.01f));
    props.dimension = dim;
    return props;
}

const Timestamp kNow = Timestamp::FromMicros(1700000000000000LL);

// ============================================================================
// Dimension Boundaries
// ============================================================================

TEST(EdgeCaseTest, DimensionBoundsAreInclusive) {
    EXPECT_NO_THROW(Cluster::Create(PropsWithDimension(32), kNow));
    EXPECT_NO_THROW(Cluster::Create(PropsWithDimension(512), kNow));
    EXPECT_THROW(Cluster::Create(PropsWithDimension(31), kNow), ValidationError);
    EXPECT_THROW(Cluster::Create(PropsWithDimension(513), kNow), ValidationError);
}

TEST(EdgeCaseTest, ZeroDimensionRejected) {
    ClusterProps props;
    props.dimension = 0;
    EXPECT_THROW(Cluster::Create(props, kNow), ValidationError);
}

TEST(EdgeCaseTest, DimensionMismatchIsAlsoValidationError) {
    Cluster cluster = Cluster::Create(PropsWithDimension(32), kNow);
    EmbeddingVector wrong(std::vector<float>(16, 0.1f));

    // Callers catching the general type still see it
    EXPECT_THROW(cluster.UpdateCentroid(wrong, kNow), ValidationError);
    EXPECT_THROW(cluster.UpdateCentroid(wrong, kNow), std::invalid_argument);
}

// ============================================================================
// Centroid Magnitude
// ============================================================================

TEST(EdgeCaseTest, ZeroCentroidIsAccepted) {
    ClusterProps props = PropsWithDimension(32);
    props.centroid = EmbeddingVector(32);
    Cluster cluster = Cluster::Create(props, kNow);
    EXPECT_FLOAT_EQ(0.0f, cluster.GetCentroid().Norm());
}

TEST(EdgeCaseTest, CentroidAtMagnitudeLimitIsKept) {
    Cluster cluster = Cluster::Create(PropsWithDimension(32), kNow);

    // Norm of 4 components at 5.0 is exactly 10
    EmbeddingVector at_limit(32);
    for (size_t i = 0; i < 4; ++i) {
        at_limit[i] = 5.0f;
    }
    cluster.UpdateCentroid(at_limit, kNow);
    EXPECT_FLOAT_EQ(10.0f, cluster.GetCentroid().Norm());
}

TEST(EdgeCaseTest, InfiniteCentroidRejectedAtCreate) {
    ClusterProps props = PropsWithDimension(32);
    props.centroid[0] = std::numeric_limits<float>::infinity();
    EXPECT_THROW(Cluster::Create(props, kNow), ValidationError);
}

// ============================================================================
// Membership Boundaries
// ============================================================================

TEST(EdgeCaseTest, RepeatedAddRemoveRoundTrip) {
    Cluster cluster = Cluster::Create(PropsWithDimension(32), kNow);

    for (int i = 0; i < 100; ++i) {
        cluster.AddMember(kNow);
    }
    for (int i = 0; i < 150; ++i) {
        cluster.RemoveMember(kNow);
    }

    EXPECT_EQ(0u, cluster.GetSize());
    EXPECT_EQ(0u, cluster.GetStatistics().active_members);
}

TEST(EdgeCaseTest, RemoveToZeroKeepsLastDensity) {
    ClusterProps props = PropsWithDimension(32);
    ClusterStatistics stats;
    stats.total_interactions = 50;
    props.statistics = stats;
    Cluster cluster = Cluster::Create(props, kNow);

    cluster.AddMember(kNow);
    EXPECT_FLOAT_EQ(0.5f, cluster.GetDensity());

    cluster.RemoveMember(kNow);
    EXPECT_EQ(0u, cluster.GetSize());
    EXPECT_FLOAT_EQ(0.5f, cluster.GetDensity());
}

// ============================================================================
// Topics
// ============================================================================

TEST(EdgeCaseTest, EmptyTopicsClearDominant) {
    ClusterProps props = PropsWithDimension(32);
    props.topics = {"a", "b"};
    Cluster cluster = Cluster::Create(props, kNow);

    cluster.UpdateTopics({}, std::nullopt, kNow);
    EXPECT_TRUE(cluster.GetTopics().empty());
    EXPECT_TRUE(cluster.GetDominantTopics().empty());
}

TEST(EdgeCaseTest, TooManyDominantTopicsRejected) {
    Cluster cluster = Cluster::Create(PropsWithDimension(32), kNow);
    std::vector<std::string> dominant;
    for (int i = 0; i < 21; ++i) {
        dominant.push_back("d" + std::to_string(i));
    }

    EXPECT_THROW(cluster.UpdateTopics({"a"}, dominant, kNow), ValidationError);
    EXPECT_TRUE(cluster.GetTopics().empty());
}

// ============================================================================
// Metrics
// ============================================================================

TEST(EdgeCaseTest, InfiniteEngagementRejected) {
    Cluster cluster = Cluster::Create(PropsWithDimension(32), kNow);
    MetricsUpdate update;
    update.avg_engagement = std::numeric_limits<float>::infinity();
    EXPECT_THROW(cluster.UpdateMetrics(update, kNow), ValidationError);
}

TEST(EdgeCaseTest, EmptyMetricsUpdateOnlyStamps) {
    Cluster cluster = Cluster::Create(PropsWithDimension(32), kNow);
    Timestamp later = kNow + std::chrono::seconds(30);

    cluster.UpdateMetrics(MetricsUpdate{}, later);
    EXPECT_FLOAT_EQ(0.0f, cluster.GetCoherence());
    EXPECT_EQ(later, cluster.GetUpdatedAt());
}

TEST(EdgeCaseTest, NonFiniteGrowthRateRejected) {
    Cluster cluster = Cluster::Create(PropsWithDimension(32), kNow);
    StatisticsUpdate update;
    update.growth_rate = std::numeric_limits<float>::quiet_NaN();
    EXPECT_THROW(cluster.UpdateStatistics(update, kNow), ValidationError);
}

// ============================================================================
// Status Transitions
// ============================================================================

TEST(EdgeCaseTest, RepeatedArchiveIsHarmless) {
    Cluster cluster = Cluster::Create(PropsWithDimension(32), kNow);
    cluster.Archive(kNow);
    cluster.Archive(kNow + std::chrono::hours(1));

    EXPECT_EQ(ClusterStatus::ARCHIVED, cluster.GetStatus());
    EXPECT_EQ(kNow + std::chrono::hours(1), cluster.GetUpdatedAt());
}

TEST(EdgeCaseTest, ArchivedClusterStillAcceptsMembers) {
    Cluster cluster = Cluster::Create(PropsWithDimension(32), kNow);
    cluster.Archive(kNow);
    cluster.AddMember(kNow);
    EXPECT_EQ(1u, cluster.GetSize());
}

// ============================================================================
// Analyzer Boundaries
// ============================================================================

TEST(EdgeCaseTest, AnalyzerThresholdsAreStrictlyBelow) {
    ClusterProps props = PropsWithDimension(32);
    props.coherence = 0.4f;
    props.density = 0.2f;
    props.size = 10;
    Cluster cluster = Cluster::Create(props, kNow);
    cluster.UpdateCentroid(cluster.GetCentroid(), kNow);

    auto analysis = ClusterAnalyzer().Analyze(cluster, kNow);
    EXPECT_FALSE(analysis.HasIssue(IssueType::LOW_COHERENCE));
    EXPECT_FALSE(analysis.HasIssue(IssueType::LOW_DENSITY));
}

TEST(EdgeCaseTest, ZeroLimitsProduceEmptyLists) {
    ClusterConfig config = ClusterConfig::Default();
    config.analysis.max_issues = 0;
    config.analysis.max_recommendations = 0;

    Cluster cluster = Cluster::Create(PropsWithDimension(32), kNow);
    auto analysis = ClusterAnalyzer(config).Analyze(cluster, kNow);

    EXPECT_TRUE(analysis.issues.empty());
    EXPECT_TRUE(analysis.recommendations.empty());
}

TEST(EdgeCaseTest, EmptyClusterAnalysisNeverDividesByZero) {
    Cluster cluster = Cluster::Create(PropsWithDimension(32), kNow);
    auto analysis = cluster.AnalyzeHealth(kNow);

    EXPECT_FLOAT_EQ(0.0f, analysis.diversity_score);
    EXPECT_FALSE(std::isnan(analysis.stability_score));
    EXPECT_TRUE(analysis.HasIssue(IssueType::UNDERSIZED));
}

// ============================================================================
// Assignment Boundaries
// ============================================================================

TEST(EdgeCaseTest, AssignmentExactlyAtAutoThreshold) {
    Cluster cluster = Cluster::Create(PropsWithDimension(32), kNow);
    auto assignment = ClusterAssignment::Create("item", cluster.GetID(), 0.8f, 0.0f,
                                                kAssignedByAlgorithm, kNow);

    EXPECT_EQ(AssignmentDecision::AUTO_ASSIGN, ApplyAssignment(cluster, assignment, kNow));
    EXPECT_EQ(1u, cluster.GetSize());
}

TEST(EdgeCaseTest, ReleaseOnEmptyClusterIsNoop) {
    Cluster cluster = Cluster::Create(PropsWithDimension(32), kNow);
    auto assignment = ClusterAssignment::Create("item", cluster.GetID(), 0.9f, 0.9f,
                                                kAssignedByAlgorithm, kNow);

    EXPECT_NO_THROW(ReleaseAssignment(cluster, assignment, kNow));
    EXPECT_EQ(0u, cluster.GetSize());
}

} // namespace
} // namespace clustra
