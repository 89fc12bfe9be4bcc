// File: tests/assignment/membership_test.cpp
#include "assignment/membership.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>

namespace clustra {
namespace {

constexpr size_t kDim = 64;

class MembershipTest : public ::testing::Test {
protected:
    Timestamp now = Timestamp::FromMicros(1700000000000000LL);

    Cluster MakeCluster(size_t size = 0) const {
        ClusterProps props;
        props.centroid = EmbeddingVector(std::vector<float>(kDim, 0.05f));
        props.dimension = kDim;
        props.size = size;
        return Cluster::Create(props, now);
    }

    ClusterAssignment AssignTo(const Cluster& cluster, float similarity) const {
        return ClusterAssignment::Create("item", cluster.GetID(), similarity, 0.9f,
                                         kAssignedByAlgorithm, now);
    }
};

TEST_F(MembershipTest, ApplyAutoAssignAddsMember) {
    Cluster cluster = MakeCluster();
    AssignmentDecision decision = ApplyAssignment(cluster, AssignTo(cluster, 0.9f), now);

    EXPECT_EQ(AssignmentDecision::AUTO_ASSIGN, decision);
    EXPECT_EQ(1u, cluster.GetSize());
}

TEST_F(MembershipTest, ApplyManualReviewLeavesClusterAlone) {
    Cluster cluster = MakeCluster();
    AssignmentDecision decision = ApplyAssignment(cluster, AssignTo(cluster, 0.7f), now);

    EXPECT_EQ(AssignmentDecision::MANUAL_REVIEW, decision);
    EXPECT_EQ(0u, cluster.GetSize());
}

TEST_F(MembershipTest, ApplyRejectLeavesClusterAlone) {
    Cluster cluster = MakeCluster();
    EXPECT_EQ(AssignmentDecision::REJECT,
              ApplyAssignment(cluster, AssignTo(cluster, 0.2f), now));
    EXPECT_EQ(0u, cluster.GetSize());
}

TEST_F(MembershipTest, ApplyRejectsForeignAssignment) {
    Cluster cluster = MakeCluster();
    Cluster other = MakeCluster();

    EXPECT_THROW(ApplyAssignment(cluster, AssignTo(other, 0.95f), now), ValidationError);
    EXPECT_EQ(0u, cluster.GetSize());
}

TEST_F(MembershipTest, ApplyRejectsDimensionMismatch) {
    Cluster cluster = MakeCluster();
    ClusterAssignment assignment = AssignTo(cluster, 0.95f);
    assignment.embedding_dimension = kDim * 2;

    EXPECT_THROW(ApplyAssignment(cluster, assignment, now), DimensionMismatchError);
    EXPECT_EQ(0u, cluster.GetSize());
}

TEST_F(MembershipTest, ConfirmAddsRegardlessOfBand) {
    Cluster cluster = MakeCluster();
    ClusterAssignment assignment = AssignTo(cluster, 0.65f);
    assignment.assigned_by = kAssignedByManual;

    ConfirmAssignment(cluster, assignment, now);
    EXPECT_EQ(1u, cluster.GetSize());
}

TEST_F(MembershipTest, ReleaseRemovesMember) {
    Cluster cluster = MakeCluster(3);
    ReleaseAssignment(cluster, AssignTo(cluster, 0.9f), now);
    EXPECT_EQ(2u, cluster.GetSize());
}

TEST_F(MembershipTest, ReassignMovesMember) {
    Cluster from = MakeCluster(4);
    Cluster to = MakeCluster(1);

    Reassign(from, to, AssignTo(to, 0.88f), now);

    EXPECT_EQ(3u, from.GetSize());
    EXPECT_EQ(2u, to.GetSize());
}

TEST_F(MembershipTest, ReassignValidatesBeforeMutating) {
    Cluster from = MakeCluster(4);
    Cluster to = MakeCluster(1);

    // Assignment points at the source, not the destination
    EXPECT_THROW(Reassign(from, to, AssignTo(from, 0.88f), now), ValidationError);
    EXPECT_EQ(4u, from.GetSize());
    EXPECT_EQ(1u, to.GetSize());

    ClusterAssignment bad_dim = AssignTo(to, 0.88f);
    bad_dim.embedding_dimension = 3;
    EXPECT_THROW(Reassign(from, to, bad_dim, now), DimensionMismatchError);
    EXPECT_EQ(4u, from.GetSize());
    EXPECT_EQ(1u, to.GetSize());
}

TEST_F(MembershipTest, ReassignFromEmptyClusterFails) {
    Cluster from = MakeCluster(0);
    Cluster to = MakeCluster(3);
    Timestamp updated = to.GetUpdatedAt();

    EXPECT_THROW(Reassign(from, to, AssignTo(to, 0.9f), now + std::chrono::hours(1)),
                 ValidationError);
    EXPECT_EQ(0u, from.GetSize());
    EXPECT_EQ(3u, to.GetSize());
    EXPECT_EQ(updated, to.GetUpdatedAt());
}

TEST_F(MembershipTest, ReassignWithinSameClusterFails) {
    Cluster cluster = MakeCluster(2);
    EXPECT_THROW(Reassign(cluster, cluster, AssignTo(cluster, 0.9f), now), ValidationError);
    EXPECT_EQ(2u, cluster.GetSize());
}

} // namespace
} // namespace clustra
