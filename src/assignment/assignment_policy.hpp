// File: src/assignment/assignment_policy.hpp
//
// Assignment Policy
//
// Pure threshold evaluation over a similarity value:
//
//   similarity >= auto_assign_threshold                        -> AUTO_ASSIGN
//   manual_review_threshold <= similarity < auto_assign        -> MANUAL_REVIEW
//   otherwise                                                  -> REJECT
//
// Grade buckets similarity into the configured quality bands for display.

#pragma once

#include "config/cluster_config.hpp"
#include <cstdint>

namespace clustra {

enum class AssignmentDecision : uint8_t {
    AUTO_ASSIGN = 0,
    MANUAL_REVIEW = 1,
    REJECT = 2,
};

enum class SimilarityGrade : uint8_t {
    POOR = 0,
    ACCEPTABLE = 1,
    GOOD = 2,
    EXCELLENT = 3,
};

const char* ToString(AssignmentDecision decision);
const char* ToString(SimilarityGrade grade);

class AssignmentPolicy {
public:
    AssignmentPolicy();

    explicit AssignmentPolicy(const ClusterConfig& config);

    AssignmentDecision Classify(float similarity) const;

    SimilarityGrade Grade(float similarity) const;

    const ClusterConfig::Assignment& GetThresholds() const { return thresholds_; }

private:
    ClusterConfig::Assignment thresholds_;
};

} // namespace clustra
