#include "rescored_subgraph.h"

#include <algorithm>
#include <utility>

namespace cobin::binning {

RescoredSubgraphSource::RescoredSubgraphSource(const NeighborGraphBuilder& builder,
                                               const std::vector<Contig>& contigs,
                                               const IPairScorer& scorer,
                                               const SimilarityGraph& graph,
                                               int max_size)
    : builder_(builder), contigs_(contigs), scorer_(scorer), graph_(graph), max_size_(max_size) {}

std::vector<WeightedEdge> RescoredSubgraphSource::edges_within(
    const std::vector<int>& members) const {

    if (static_cast<int>(members.size()) > max_size_) {
        return graph_.induced_edges(members);
    }

    const int n = static_cast<int>(members.size());
    std::vector<std::pair<int, int>> pairs;
    pairs.reserve(static_cast<size_t>(n) * (n - 1) / 2);
    for (int i = 0; i < n; ++i) {
        for (int j = i + 1; j < n; ++j) {
            int u = members[i];
            int v = members[j];
            pairs.emplace_back(std::min(u, v), std::max(u, v));
        }
    }

    auto scores = builder_.score_pairs(contigs_, pairs, scorer_);
    const float threshold = builder_.params().hits_threshold;

    std::vector<WeightedEdge> edges;
    size_t k = 0;
    for (int i = 0; i < n; ++i) {
        for (int j = i + 1; j < n; ++j, ++k) {
            float w = 0.0f;
            if (scores[k]) {
                if (scores[k]->combined >= threshold) w = scores[k]->combined;
            } else {
                // Scoring failed here: keep whatever the graph already knew
                w = graph_.weight(members[i], members[j]);
            }
            if (w > 0.0f) edges.emplace_back(i, j, w);
        }
    }
    return edges;
}

}  // namespace cobin::binning
