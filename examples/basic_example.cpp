// File: examples/basic_example.cpp
//
// Basic clustering example using the clustra engine.
// Demonstrates:
// - Loading a ClusterConfig (YAML file or defaults)
// - Creating a cluster around a centroid
// - Applying assignments proposed by a similarity search
// - Recomputing the centroid and refreshing metrics
// - Viewing quality and health analysis

#include "assignment/membership.hpp"
#include "cluster/cluster_analyzer.hpp"
#include "maintenance/maintenance_planner.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <iostream>
#include <iomanip>
#include <optional>
#include <random>
#include <vector>

using namespace clustra;

/// Noisy copy of `base`, standing in for an item embedding
EmbeddingVector JitteredEmbedding(const EmbeddingVector& base, std::mt19937& gen, float noise) {
    std::normal_distribution<float> dist(0.0f, noise);
    EmbeddingVector result(base.Dimension());
    for (size_t i = 0; i < base.Dimension(); ++i) {
        result[i] = base[i] + dist(gen);
    }
    return result;
}

int main(int argc, char** argv) {
    std::cout << "=== clustra Basic Clustering Example ===\n\n";

    // Step 1: Configuration
    std::cout << "Step 1: Loading configuration...\n";
    ClusterConfig config = ClusterConfig::Default();
    if (argc > 1) {
        auto loaded = ClusterConfig::LoadFromFile(argv[1]);
        if (!loaded) {
            std::cerr << "Failed to load configuration from " << argv[1] << "\n";
            return 1;
        }
        config = *loaded;
        std::cout << "  ✓ Loaded " << argv[1] << "\n\n";
    } else {
        std::cout << "  ✓ Using defaults\n\n";
    }

    // Step 2: Create a cluster
    std::cout << "Step 2: Creating cluster...\n";
    const size_t dimension = config.clustering.default_dimension;
    EmbeddingVector seed(dimension);
    seed[0] = 1.0f;

    ClusterProps props;
    props.centroid = seed;
    props.dimension = dimension;
    props.name = "Outdoor cooking";
    props.topics = {"grilling", "camping", "recipes", "grilling"};
    props.config = config;

    std::optional<Cluster> created;
    try {
        created = Cluster::Create(props);
    } catch (const ValidationError& e) {
        std::cerr << "Cluster creation failed: " << e.what() << "\n";
        return 1;
    }
    Cluster& cluster = *created;
    std::cout << "  ✓ " << cluster.ToString() << "\n\n";

    // Step 3: Assign items
    std::cout << "Step 3: Assigning items...\n";
    std::mt19937 gen(7);
    std::vector<EmbeddingVector> members;
    size_t review = 0;
    size_t rejected = 0;
    for (int i = 0; i < 60; ++i) {
        float noise = (i % 4 == 0) ? 0.2f : 0.03f;
        EmbeddingVector item = JitteredEmbedding(seed, gen, noise);
        float similarity = std::max(0.0f, item.CosineSimilarity(cluster.GetCentroid()));

        auto assignment = ClusterAssignment::Create("post-" + std::to_string(i), cluster.GetID(),
                                                    similarity, similarity);
        assignment.embedding_dimension = item.Dimension();

        switch (ApplyAssignment(cluster, assignment)) {
            case AssignmentDecision::AUTO_ASSIGN:
                members.push_back(item);
                break;
            case AssignmentDecision::MANUAL_REVIEW:
                review++;
                break;
            case AssignmentDecision::REJECT:
                rejected++;
                break;
        }
    }
    std::cout << "  ✓ Auto-assigned: " << members.size()
              << ", manual review: " << review
              << ", rejected: " << rejected << "\n\n";

    // Step 4: Recompute
    std::cout << "Step 4: Recomputing centroid and metrics...\n";
    if (!members.empty()) {
        cluster.UpdateCentroid(EmbeddingVector::Mean(members));
    }

    float coherence_sum = 0.0f;
    for (const auto& member : members) {
        coherence_sum += member.CosineSimilarity(cluster.GetCentroid());
    }
    MetricsUpdate metrics;
    metrics.coherence = members.empty() ? 0.0f : coherence_sum / static_cast<float>(members.size());
    metrics.avg_engagement = 0.45f;
    cluster.UpdateMetrics(metrics);

    StatisticsUpdate stats;
    stats.total_interactions = members.size() * 40;
    stats.engagement_rate = 0.3f;
    cluster.UpdateStatistics(stats);
    std::cout << "  ✓ " << cluster.ToString() << "\n\n";

    // Step 5: Quality
    std::cout << "Step 5: Quality breakdown\n";
    auto breakdown = cluster.GetQualityBreakdown();
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "  Coherence:  " << breakdown.coherence_component << "\n";
    std::cout << "  Density:    " << breakdown.density_component << "\n";
    std::cout << "  Size:       " << breakdown.size_component << "\n";
    std::cout << "  Engagement: " << breakdown.engagement_component << "\n";
    std::cout << "  Total:      " << breakdown.total
              << " (" << ToString(cluster.GetQuality()) << ")\n\n";

    // Step 6: Health
    std::cout << "Step 6: Health analysis\n";
    auto analysis = cluster.AnalyzeHealth();
    if (analysis.issues.empty()) {
        std::cout << "  ✓ No issues\n";
    }
    for (const auto& issue : analysis.issues) {
        std::cout << "  [" << ToString(issue.severity) << "] " << issue.description
                  << " -> " << issue.suggested_action << "\n";
    }
    for (const auto& rec : analysis.recommendations) {
        std::cout << "  recommend " << ToString(rec.type)
                  << " (confidence " << rec.confidence << "): " << rec.reason << "\n";
    }

    MaintenancePlanner planner;
    std::cout << "\n" << planner.Summarize({cluster}).ToString() << "\n";

    std::cout << "\n=== Example Complete ===\n";
    return 0;
}
