// File: src/assignment/membership.cpp
#include "assignment/membership.hpp"
#include "core/errors.hpp"

namespace clustra {

namespace {

void RequireTarget(const Cluster& cluster, const ClusterAssignment& assignment) {
    if (assignment.cluster_id != cluster.GetID()) {
        throw ValidationError("Assignment targets " + assignment.cluster_id.ToString() +
                              ", not " + cluster.GetID().ToString());
    }
    ValidateAssignment(assignment, cluster.GetDimension());
}

} // namespace

AssignmentDecision ApplyAssignment(Cluster& cluster,
                                   const ClusterAssignment& assignment,
                                   Timestamp now) {
    RequireTarget(cluster, assignment);

    AssignmentPolicy policy(cluster.GetConfig());
    AssignmentDecision decision = policy.Classify(assignment.similarity);
    if (decision == AssignmentDecision::AUTO_ASSIGN) {
        cluster.AddMember(now);
    }
    return decision;
}

void ConfirmAssignment(Cluster& cluster,
                       const ClusterAssignment& assignment,
                       Timestamp now) {
    RequireTarget(cluster, assignment);
    cluster.AddMember(now);
}

void ReleaseAssignment(Cluster& cluster,
                       const ClusterAssignment& assignment,
                       Timestamp now) {
    if (assignment.cluster_id != cluster.GetID()) {
        throw ValidationError("Assignment targets " + assignment.cluster_id.ToString() +
                              ", not " + cluster.GetID().ToString());
    }
    cluster.RemoveMember(now);
}

void Reassign(Cluster& from,
              Cluster& to,
              const ClusterAssignment& assignment,
              Timestamp now) {
    if (from.GetID() == to.GetID()) {
        throw ValidationError("Cannot reassign within " + from.GetID().ToString());
    }
    RequireTarget(to, assignment);
    if (from.GetSize() == 0) {
        throw ValidationError("Cannot reassign out of empty cluster " + from.GetID().ToString());
    }

    from.RemoveMember(now);
    to.AddMember(now);
}

} // namespace clustra
