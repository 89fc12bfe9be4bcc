// File: src/assignment/cluster_assignment.cpp
#include "assignment/cluster_assignment.hpp"
#include "core/errors.hpp"
#include <iomanip>
#include <sstream>

namespace clustra {

namespace {

// NaN fails both comparisons and is rejected
bool InUnitRange(float value) {
    return value >= 0.0f && value <= 1.0f;
}

void ValidateScores(float similarity, float confidence) {
    if (!InUnitRange(similarity)) {
        throw ValidationError("Similarity must be between 0 and 1, got " +
                              std::to_string(similarity));
    }
    if (!InUnitRange(confidence)) {
        throw ValidationError("Confidence must be between 0 and 1, got " +
                              std::to_string(confidence));
    }
}

} // namespace

ClusterAssignment ClusterAssignment::Create(const std::string& item_id,
                                            ClusterID cluster_id,
                                            float similarity,
                                            float confidence,
                                            const std::string& assigned_by,
                                            Timestamp now) {
    if (item_id.empty()) {
        throw ValidationError("Assignment requires an item id");
    }
    if (!cluster_id.IsValid()) {
        throw ValidationError("Assignment requires a valid cluster id");
    }
    if (assigned_by.empty()) {
        throw ValidationError("Assignment requires assigned_by");
    }
    ValidateScores(similarity, confidence);

    ClusterAssignment assignment;
    assignment.item_id = item_id;
    assignment.cluster_id = cluster_id;
    assignment.similarity = similarity;
    assignment.confidence = confidence;
    assignment.assigned_at = now;
    assignment.assigned_by = assigned_by;
    return assignment;
}

std::string ClusterAssignment::ToString() const {
    std::ostringstream oss;
    oss << "ClusterAssignment{item=" << item_id
        << ", cluster=" << cluster_id.ToString()
        << std::fixed << std::setprecision(3)
        << ", similarity=" << similarity
        << ", confidence=" << confidence
        << ", by=" << assigned_by << "}";
    return oss.str();
}

void ValidateAssignment(const ClusterAssignment& assignment, size_t cluster_dimension) {
    ValidateScores(assignment.similarity, assignment.confidence);

    if (assignment.embedding_dimension != 0 &&
        assignment.embedding_dimension != cluster_dimension) {
        throw DimensionMismatchError(cluster_dimension, assignment.embedding_dimension);
    }
}

} // namespace clustra
