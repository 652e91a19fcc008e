// Contig similarity graph construction
// kNN prefilter -> fragment-pair scoring -> vote aggregation -> thresholding

#include "neighbor_graph.h"
#include "../clustering/hnsw_knn_index.h"
#include "../../util/errors.h"
#include "../../util/logger.h"

#include <algorithm>
#include <cmath>
#include <omp.h>
#include <string>

namespace cobin::binning {

void GraphParams::validate() const {
    if (max_neighbors < 1) {
        throw ConfigError("max_neighbors must be >= 1, got " + std::to_string(max_neighbors));
    }
    if (!(hits_threshold >= 0.0f && hits_threshold <= 1.0f)) {
        throw ConfigError("hits_threshold must be in [0,1], got " + std::to_string(hits_threshold));
    }
    if (n_frags < 1) {
        throw ConfigError("n_frags must be >= 1, got " + std::to_string(n_frags));
    }
    if (max_fragment_pairs < 1) {
        throw ConfigError("max_fragment_pairs must be >= 1, got " +
                          std::to_string(max_fragment_pairs));
    }
    if (!(cutoffs.composition >= 0.0f && cutoffs.composition <= 1.0f) ||
        !(cutoffs.coverage >= 0.0f && cutoffs.coverage <= 1.0f)) {
        throw ConfigError("Vote cutoffs must be in [0,1]");
    }
    if (knn.M < 2 || knn.ef_construction < 1 || knn.ef_search < 1) {
        throw ConfigError("Invalid HNSW parameters");
    }
    if (threads < 1) {
        throw ConfigError("threads must be >= 1, got " + std::to_string(threads));
    }
}

NeighborGraphBuilder::NeighborGraphBuilder(const GraphParams& params,
                                           const IVoteCombiner& combiner,
                                           Logger* log)
    : params_(params), combiner_(combiner), log_(log) {
    params_.validate();
}

void NeighborGraphBuilder::validate_inputs(const std::vector<Contig>& contigs,
                                           const RowMatrixXf& profiles) const {
    if (profiles.rows() != static_cast<Eigen::Index>(contigs.size())) {
        throw InputError("Got " + std::to_string(profiles.rows()) + " profiles for " +
                         std::to_string(contigs.size()) + " contigs");
    }
    if (!contigs.empty() && profiles.cols() == 0) {
        throw InputError("Contig profiles have zero dimensions");
    }
    if (!profiles.allFinite()) {
        throw InputError("Contig profiles contain non-finite values");
    }
    for (const auto& c : contigs) {
        if (c.n_fragments < 1) {
            throw InputError("Contig " + c.id + " has no fragments");
        }
        if (c.length < 0) {
            throw InputError("Contig " + c.id + " has negative length");
        }
    }
}

std::vector<int> NeighborGraphBuilder::select_fragments(int available, int wanted) {
    int n = std::min(available, wanted);
    std::vector<int> idx;
    if (n <= 0) return idx;
    idx.reserve(n);
    if (n == available) {
        for (int i = 0; i < n; ++i) idx.push_back(i);
        return idx;
    }
    // Centre of n equal strata along the contig
    for (int i = 0; i < n; ++i) {
        long long pos = (2LL * i + 1) * available / (2LL * n);
        idx.push_back(static_cast<int>(pos));
    }
    return idx;
}

std::vector<FragmentPair> NeighborGraphBuilder::fragment_pairs(
    const std::vector<Contig>& contigs, int a, int b) const {

    auto frags_a = select_fragments(contigs[a].n_fragments, params_.n_frags);
    auto frags_b = select_fragments(contigs[b].n_fragments, params_.n_frags);

    long long total = static_cast<long long>(frags_a.size()) * frags_b.size();
    if (total > params_.max_fragment_pairs) {
        int per_side = std::max(1, static_cast<int>(std::sqrt(
            static_cast<double>(params_.max_fragment_pairs))));
        frags_a = select_fragments(contigs[a].n_fragments, std::min(per_side, params_.n_frags));
        frags_b = select_fragments(contigs[b].n_fragments, std::min(per_side, params_.n_frags));
    }

    std::vector<FragmentPair> pairs;
    pairs.reserve(frags_a.size() * frags_b.size());
    for (int fa : frags_a) {
        for (int fb : frags_b) {
            pairs.emplace_back(FragmentKey(a, fa), FragmentKey(b, fb));
        }
    }
    return pairs;
}

std::vector<std::pair<int, int>> NeighborGraphBuilder::candidate_pairs(
    const RowMatrixXf& profiles) const {

    int n = static_cast<int>(profiles.rows());
    std::vector<std::pair<int, int>> pairs;
    if (n < 2) return pairs;

    if (n - 1 <= params_.max_neighbors) {
        // Every other contig fits in the neighbor budget
        pairs.reserve(static_cast<size_t>(n) * (n - 1) / 2);
        for (int u = 0; u < n; ++u) {
            for (int v = u + 1; v < n; ++v) {
                pairs.emplace_back(u, v);
            }
        }
        return pairs;
    }

    KnnConfig knn = params_.knn;
    knn.k = params_.max_neighbors;
    HnswKnnIndex index(knn);
    index.build(profiles);
    NeighborList neighbors = index.query_all();

    std::vector<std::vector<int>> sorted_ids(n);
    for (int u = 0; u < n; ++u) {
        sorted_ids[u] = neighbors.ids[u];
        std::sort(sorted_ids[u].begin(), sorted_ids[u].end());
    }

    // Mutual neighbors only: each contig keeps at most max_neighbors candidates,
    // so the degree bound holds before any pair is scored
    pairs.reserve(static_cast<size_t>(n) * params_.max_neighbors / 2);
    for (int u = 0; u < n; ++u) {
        for (int v : sorted_ids[u]) {
            if (v <= u) continue;
            if (std::binary_search(sorted_ids[v].begin(), sorted_ids[v].end(), u)) {
                pairs.emplace_back(u, v);
            }
        }
    }
    return pairs;
}

std::vector<std::optional<EdgeScore>> NeighborGraphBuilder::score_pairs(
    const std::vector<Contig>& contigs,
    const std::vector<std::pair<int, int>>& pairs,
    const IPairScorer& scorer,
    const CancellationToken* token) const {

    const long long n_pairs = static_cast<long long>(pairs.size());
    std::vector<std::optional<EdgeScore>> scores(pairs.size());
    std::vector<std::string> input_errors(pairs.size());
    std::vector<std::string> failures(pairs.size());

    #pragma omp parallel for schedule(dynamic, 16) num_threads(params_.threads)
    for (long long i = 0; i < n_pairs; ++i) {
        if (is_cancelled(token)) continue;

        // Score (min, max) so EdgeScore(a, b) == EdgeScore(b, a)
        const int a = std::min(pairs[i].first, pairs[i].second);
        const int b = std::max(pairs[i].first, pairs[i].second);
        std::vector<PairScore> fragment_scores;
        try {
            scorer.score_batch(fragment_pairs(contigs, a, b), fragment_scores);
        } catch (const std::exception& e) {
            failures[i] = e.what();
            continue;
        }

        try {
            scores[i] = aggregate_votes(fragment_scores, params_.cutoffs, combiner_);
        } catch (const InputError& e) {
            input_errors[i] = e.what();
        }
    }

    check_cancelled(token, "pair scoring");

    for (size_t i = 0; i < pairs.size(); ++i) {
        if (!input_errors[i].empty()) {
            throw InputError(contigs[pairs[i].first].id + " vs " +
                             contigs[pairs[i].second].id + ": " + input_errors[i]);
        }
    }

    if (log_ != nullptr) {
        for (size_t i = 0; i < pairs.size(); ++i) {
            if (!failures[i].empty()) {
                log_->detail("Scoring failed for " + contigs[pairs[i].first].id + " vs " +
                             contigs[pairs[i].second].id + ": " + failures[i]);
            }
        }
    }

    return scores;
}

std::vector<WeightedEdge> NeighborGraphBuilder::select_edges(
    const std::vector<std::pair<int, int>>& pairs,
    const std::vector<std::optional<EdgeScore>>& scores,
    GraphStats* stats) const {

    // Each pair is kept or dropped on its own score alone
    std::vector<WeightedEdge> kept;
    for (size_t i = 0; i < pairs.size(); ++i) {
        if (!scores[i]) continue;
        if (scores[i]->combined >= params_.hits_threshold) {
            kept.emplace_back(pairs[i].first, pairs[i].second, scores[i]->combined);
        }
    }

    if (stats != nullptr) {
        stats->n_passing = kept.size();
    }
    return kept;
}

GraphBuildResult NeighborGraphBuilder::build(const std::vector<Contig>& contigs,
                                             const RowMatrixXf& profiles,
                                             const IPairScorer& scorer,
                                             const CancellationToken* token) const {
    validate_inputs(contigs, profiles);
    check_cancelled(token, "candidate generation");

    GraphBuildResult result;
    GraphStats& stats = result.stats;
    stats.n_contigs = contigs.size();

    auto pairs = candidate_pairs(profiles);
    stats.n_candidates = pairs.size();
    if (log_ != nullptr) {
        log_->info("Scoring " + std::to_string(pairs.size()) + " candidate pairs (max " +
                   std::to_string(params_.max_neighbors) + " neighbors per contig)");
    }

    auto scores = score_pairs(contigs, pairs, scorer, token);

    for (size_t i = 0; i < pairs.size(); ++i) {
        if (scores[i]) {
            ++stats.n_scored;
            stats.n_comparisons += scores[i]->n_comparisons;
        } else {
            ++stats.scoring_failures;
            stats.failed_pairs.push_back(pairs[i]);
        }
    }

    auto edges = select_edges(pairs, scores, &stats);
    result.graph = SimilarityGraph(static_cast<int>(contigs.size()), std::move(edges));

    for (int i = 0; i < result.graph.n_nodes(); ++i) {
        if (result.graph.degree(i) == 0) ++stats.n_isolated;
    }

    if (log_ != nullptr) {
        if (stats.scoring_failures > 0) {
            log_->warn(std::to_string(stats.scoring_failures) +
                       " candidate pairs failed to score and were dropped");
        }
        log_->info("Graph: " + std::to_string(result.graph.n_edges()) + " edges over " +
                   std::to_string(contigs.size()) + " contigs (" +
                   std::to_string(stats.n_isolated) + " isolated)");
        log_->section("Similarity graph");
        log_->metric("candidate_pairs", static_cast<int>(stats.n_candidates));
        log_->metric("fragment_comparisons", static_cast<double>(stats.n_comparisons), 0);
        log_->metric("passing_edges", static_cast<int>(stats.n_passing));
        log_->metric("max_degree", result.graph.max_degree());
        log_->metric("retained_edges", static_cast<int>(result.graph.n_edges()));
        log_->metric("scoring_failures", static_cast<int>(stats.scoring_failures));
        log_->metric("hits_threshold", params_.hits_threshold);
        log_->metric("vote_policy", combiner_.name());
    }

    return result;
}

GraphBuildResult build_graph(const std::vector<Contig>& contigs,
                             const RowMatrixXf& profiles,
                             const IPairScorer& scorer,
                             const GraphParams& params) {
    ConjunctionCombiner combiner;
    NeighborGraphBuilder builder(params, combiner);
    return builder.build(contigs, profiles, scorer);
}

}  // namespace cobin::binning
