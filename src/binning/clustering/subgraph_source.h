#pragma once

#include "clustering_types.h"
#include "../graph/similarity_graph.h"

#include <vector>

namespace cobin::binning {

// Supplies the edges a refinement pass clusters for one coarse bin.
// Returned edges use positions in `members` as node ids.
class ISubgraphSource {
public:
    virtual ~ISubgraphSource() = default;

    virtual std::vector<WeightedEdge> edges_within(const std::vector<int>& members) const = 0;
};

// Edges of the similarity graph restricted to the bin
class InducedSubgraphSource : public ISubgraphSource {
public:
    explicit InducedSubgraphSource(const SimilarityGraph& graph) : graph_(graph) {}

    std::vector<WeightedEdge> edges_within(const std::vector<int>& members) const override {
        return graph_.induced_edges(members);
    }

private:
    const SimilarityGraph& graph_;
};

}  // namespace cobin::binning
