#pragma once

#include "neighbor_graph.h"
#include "../clustering/subgraph_source.h"

#include <vector>

namespace cobin::binning {

// Refinement edges from a dense rescoring of every contig pair inside a
// coarse bin, instead of only the kNN-restricted edges of the graph.
// Bins larger than max_size fall back to the induced subgraph.
class RescoredSubgraphSource : public ISubgraphSource {
public:
    // All references must outlive the source
    RescoredSubgraphSource(const NeighborGraphBuilder& builder,
                           const std::vector<Contig>& contigs,
                           const IPairScorer& scorer,
                           const SimilarityGraph& graph,
                           int max_size);

    std::vector<WeightedEdge> edges_within(const std::vector<int>& members) const override;

private:
    const NeighborGraphBuilder& builder_;
    const std::vector<Contig>& contigs_;
    const IPairScorer& scorer_;
    const SimilarityGraph& graph_;
    int max_size_;
};

}  // namespace cobin::binning
