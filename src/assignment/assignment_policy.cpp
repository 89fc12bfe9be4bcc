// File: src/assignment/assignment_policy.cpp
#include "assignment/assignment_policy.hpp"

namespace clustra {

const char* ToString(AssignmentDecision decision) {
    switch (decision) {
        case AssignmentDecision::AUTO_ASSIGN: return "auto_assign";
        case AssignmentDecision::MANUAL_REVIEW: return "manual_review";
        case AssignmentDecision::REJECT: return "reject";
        default: return "unknown";
    }
}

const char* ToString(SimilarityGrade grade) {
    switch (grade) {
        case SimilarityGrade::POOR: return "poor";
        case SimilarityGrade::ACCEPTABLE: return "acceptable";
        case SimilarityGrade::GOOD: return "good";
        case SimilarityGrade::EXCELLENT: return "excellent";
        default: return "unknown";
    }
}

AssignmentPolicy::AssignmentPolicy()
    : AssignmentPolicy(ClusterConfig::Default()) {}

AssignmentPolicy::AssignmentPolicy(const ClusterConfig& config)
    : thresholds_(config.assignment) {}

AssignmentDecision AssignmentPolicy::Classify(float similarity) const {
    if (similarity >= thresholds_.auto_assign_threshold) {
        return AssignmentDecision::AUTO_ASSIGN;
    }
    if (similarity >= thresholds_.manual_review_threshold) {
        return AssignmentDecision::MANUAL_REVIEW;
    }
    return AssignmentDecision::REJECT;
}

SimilarityGrade AssignmentPolicy::Grade(float similarity) const {
    if (similarity >= thresholds_.excellent_similarity) {
        return SimilarityGrade::EXCELLENT;
    }
    if (similarity >= thresholds_.good_similarity) {
        return SimilarityGrade::GOOD;
    }
    if (similarity >= thresholds_.min_similarity) {
        return SimilarityGrade::ACCEPTABLE;
    }
    return SimilarityGrade::POOR;
}

} // namespace clustra
