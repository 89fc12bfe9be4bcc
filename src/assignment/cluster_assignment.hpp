// File: src/assignment/cluster_assignment.hpp
#pragma once

#include "core/types.hpp"
#include <map>
#include <string>

namespace clustra {

/// Who produced an assignment when no user id is given
constexpr const char* kAssignedByAlgorithm = "algorithm";
constexpr const char* kAssignedByManual = "manual";

/// Binding of one content item to one cluster, as proposed by an external
/// similarity search. Immutable once created; a reassignment produces a new
/// record rather than editing this one.
struct ClusterAssignment {
    std::string item_id;
    ClusterID cluster_id;

    float similarity{0.0f};   ///< [0,1]
    float confidence{0.0f};   ///< [0,1]

    Timestamp assigned_at;
    std::string assigned_by{kAssignedByAlgorithm};

    std::map<std::string, std::string> metadata;

    /// Dimension of the item embedding; 0 when the producer did not report it
    size_t embedding_dimension{0};

    /// Build a validated assignment
    /// @throws ValidationError on an empty item id, an invalid cluster id,
    ///         an empty assigned_by or similarity/confidence outside [0,1]
    static ClusterAssignment Create(const std::string& item_id,
                                    ClusterID cluster_id,
                                    float similarity,
                                    float confidence,
                                    const std::string& assigned_by = kAssignedByAlgorithm,
                                    Timestamp now = Timestamp::Now());

    std::string ToString() const;
};

/// Check an assignment against the cluster it targets.
/// @throws ValidationError if similarity or confidence is outside [0,1]
/// @throws DimensionMismatchError if embedding_dimension is known and differs
///         from cluster_dimension
void ValidateAssignment(const ClusterAssignment& assignment, size_t cluster_dimension);

} // namespace clustra
