#pragma once

#include "fragment_features.h"
#include "pair_scorer.h"
#include "similarity_graph.h"
#include "vote_combiner.h"
#include "../clustering/clustering_types.h"
#include "../../util/cancellation.h"

#include <cobin/config.hpp>

#include <optional>
#include <utility>
#include <vector>

namespace cobin {
class Logger;
}

namespace cobin::binning {

struct GraphParams {
    int max_neighbors = DEFAULT_MAX_NEIGHBORS;      // candidate contigs per contig
    float hits_threshold = DEFAULT_HITS_THRESHOLD;  // min combined score to keep an edge
    int n_frags = DEFAULT_N_FRAGS;                  // fragments used per contig
    int max_fragment_pairs = 2500;                  // cap on comparisons per contig pair
    VoteCutoffs cutoffs{DEFAULT_VOTE_THRESHOLD, DEFAULT_VOTE_THRESHOLD};
    KnnConfig knn;
    int threads = 1;

    // Throws ConfigError
    void validate() const;
};

struct GraphStats {
    size_t n_contigs = 0;
    size_t n_candidates = 0;
    size_t n_scored = 0;
    size_t scoring_failures = 0;
    size_t n_passing = 0;           // combined >= hits_threshold
    size_t n_isolated = 0;
    long long n_comparisons = 0;    // fragment pairs scored
    std::vector<std::pair<int, int>> failed_pairs;
};

struct GraphBuildResult {
    SimilarityGraph graph;
    GraphStats stats;
};

class NeighborGraphBuilder {
public:
    // combiner must outlive the builder
    NeighborGraphBuilder(const GraphParams& params,
                         const IVoteCombiner& combiner,
                         Logger* log = nullptr);

    // profiles: one coarse vector per contig for the kNN prefilter.
    // Throws InputError, ConfigError or Cancelled; never returns a partial graph.
    GraphBuildResult build(const std::vector<Contig>& contigs,
                           const RowMatrixXf& profiles,
                           const IPairScorer& scorer,
                           const CancellationToken* token = nullptr) const;

    // Unordered contig pairs (u < v) to score, sorted. Above max_neighbors + 1
    // contigs only mutual kNN pairs are kept, so no contig has more than
    // max_neighbors candidates.
    std::vector<std::pair<int, int>> candidate_pairs(const RowMatrixXf& profiles) const;

    // Scores every pair in (min, max) order; a pair whose scorer call throws
    // yields std::nullopt.
    // Throws InputError on out-of-range scores, Cancelled if the token fires.
    std::vector<std::optional<EdgeScore>> score_pairs(
        const std::vector<Contig>& contigs,
        const std::vector<std::pair<int, int>>& pairs,
        const IPairScorer& scorer,
        const CancellationToken* token = nullptr) const;

    // Fragment comparisons for one contig pair (full cross product or stratified sample)
    std::vector<FragmentPair> fragment_pairs(const std::vector<Contig>& contigs,
                                             int a, int b) const;

    // Pairs with combined >= hits_threshold, in input order
    std::vector<WeightedEdge> select_edges(
        const std::vector<std::pair<int, int>>& pairs,
        const std::vector<std::optional<EdgeScore>>& scores,
        GraphStats* stats = nullptr) const;

    // Evenly spaced indices of `wanted` out of `available` fragments
    static std::vector<int> select_fragments(int available, int wanted);

    const GraphParams& params() const { return params_; }

private:
    void validate_inputs(const std::vector<Contig>& contigs, const RowMatrixXf& profiles) const;

    GraphParams params_;
    const IVoteCombiner& combiner_;
    Logger* log_;
};

// Convenience wrapper with the default conjunction policy
GraphBuildResult build_graph(const std::vector<Contig>& contigs,
                             const RowMatrixXf& profiles,
                             const IPairScorer& scorer,
                             const GraphParams& params);

}  // namespace cobin::binning
