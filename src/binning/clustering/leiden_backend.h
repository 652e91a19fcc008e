#pragma once

#include "clustering_types.h"
#include <memory>
#include <random>
#include <vector>

namespace cobin::binning {

// Forward declaration for aggregate graph
struct AggregateGraph;

class ILeidenBackend {
public:
    virtual ~ILeidenBackend() = default;

    virtual ClusteringResult cluster(
        const std::vector<WeightedEdge>& edges,
        int n_nodes,
        const LeidenConfig& config) = 0;

    virtual void set_seed(int seed) = 0;
};

// Leiden community detection (local moving, refinement, aggregation).
// Stops when every community is a single aggregate node, or when the
// iteration / wall-clock budget runs out; in the latter case the best
// partition seen so far is returned with converged = false.
class LeidenBackend : public ILeidenBackend {
public:
    LeidenBackend();
    ~LeidenBackend() override = default;

    ClusteringResult cluster(
        const std::vector<WeightedEdge>& edges,
        int n_nodes,
        const LeidenConfig& config) override;

    void set_seed(int seed) override { rng_.seed(seed); }

    // Quality of a partition of the given graph under config's null model
    static double quality(
        const std::vector<WeightedEdge>& edges,
        int n_nodes,
        const std::vector<int>& labels,
        const LeidenConfig& config);

private:
    AggregateGraph build_graph(
        const std::vector<WeightedEdge>& edges,
        int n_nodes,
        const LeidenConfig& config) const;

    // Gain of moving `node` from its community to another one
    double delta_quality(
        const AggregateGraph& g,
        int node,
        double edges_to_current,
        double edges_to_target,
        double weight_current,
        double weight_target,
        double size_current,
        double size_target,
        float resolution) const;

    // Local moving phase with a queue of unstable nodes
    bool move_nodes_fast(
        const AggregateGraph& g,
        std::vector<int>& labels,
        float resolution);

    // Merge singletons inside each community of `labels`
    std::vector<int> refine_partition(
        const AggregateGraph& g,
        const std::vector<int>& labels,
        float resolution);

    AggregateGraph aggregate_graph(
        const AggregateGraph& g,
        const std::vector<int>& labels,
        int n_communities) const;

    double quality(
        const AggregateGraph& g,
        const std::vector<int>& labels,
        float resolution) const;

    static int compact_labels(std::vector<int>& labels);

    NullModel null_model_ = NullModel::CPM;
    std::mt19937 rng_;
};

std::unique_ptr<ILeidenBackend> create_leiden_backend();

}  // namespace cobin::binning
