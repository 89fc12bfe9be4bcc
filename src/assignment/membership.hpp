// File: src/assignment/membership.hpp
//
// Membership helpers that turn validated assignments into Cluster mutations.
// Every helper validates completely before touching any cluster, so a thrown
// ValidationError leaves all clusters unchanged.

#pragma once

#include "assignment/assignment_policy.hpp"
#include "assignment/cluster_assignment.hpp"
#include "cluster/cluster.hpp"

namespace clustra {

/// Validate and classify an assignment with the cluster's own policy.
/// Adds a member only on AUTO_ASSIGN.
/// @throws ValidationError if the assignment targets another cluster or is invalid
AssignmentDecision ApplyAssignment(Cluster& cluster,
                                   const ClusterAssignment& assignment,
                                   Timestamp now = Timestamp::Now());

/// Manual approval path: adds a member regardless of the similarity band
void ConfirmAssignment(Cluster& cluster,
                       const ClusterAssignment& assignment,
                       Timestamp now = Timestamp::Now());

/// Drop the member an assignment had added
void ReleaseAssignment(Cluster& cluster,
                       const ClusterAssignment& assignment,
                       Timestamp now = Timestamp::Now());

/// Move a member from one cluster to another. `assignment` is the new binding
/// and must target `to`.
/// @throws ValidationError if `from` and `to` are the same cluster, or `from`
///         has no members; neither cluster is modified then
void Reassign(Cluster& from,
              Cluster& to,
              const ClusterAssignment& assignment,
              Timestamp now = Timestamp::Now());

} // namespace clustra
