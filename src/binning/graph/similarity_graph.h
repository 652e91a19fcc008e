#pragma once

#include "../clustering/clustering_types.h"

#include <utility>
#include <vector>

namespace cobin::binning {

// Undirected weighted contig graph. Immutable once constructed: edges are
// stored once with u < v, sorted by (u, v). Nodes without edges are kept.
class SimilarityGraph {
public:
    SimilarityGraph() = default;

    // Throws std::invalid_argument on self-loops, duplicates or out-of-range nodes
    SimilarityGraph(int n_nodes, std::vector<WeightedEdge> edges);

    int n_nodes() const { return n_nodes_; }
    size_t n_edges() const { return edges_.size(); }

    const std::vector<WeightedEdge>& edges() const { return edges_; }
    const std::vector<std::pair<int, float>>& neighbors(int node) const { return adj_[node]; }
    int degree(int node) const { return static_cast<int>(adj_[node].size()); }
    int max_degree() const;

    bool has_edge(int u, int v) const;
    float weight(int u, int v) const;   // 0 when absent

    // Components sorted by their smallest node; members ascending
    std::vector<std::vector<int>> connected_components() const;

    // Edges among members, renumbered to positions in members
    std::vector<WeightedEdge> induced_edges(const std::vector<int>& members) const;

private:
    int n_nodes_ = 0;
    std::vector<WeightedEdge> edges_;
    std::vector<std::vector<std::pair<int, float>>> adj_;   // sorted by neighbor
};

}  // namespace cobin::binning
