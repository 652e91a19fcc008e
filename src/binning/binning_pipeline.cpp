#include "binning_pipeline.h"
#include "graph/rescored_subgraph.h"
#include "../util/errors.h"
#include "../util/logger.h"

#include <utility>

namespace cobin::binning {

void PipelineParams::validate() const {
    graph.validate();
    partition.validate();
    if (rescore_max < 0) {
        throw ConfigError("rescore_max must be >= 0, got " + std::to_string(rescore_max));
    }
}

PipelineParams pipeline_params(const ClusterConfig& config) {
    PipelineParams params;

    params.graph.max_neighbors = config.max_neighbors;
    params.graph.hits_threshold = config.hits_threshold;
    params.graph.n_frags = config.n_frags;
    params.graph.max_fragment_pairs = config.max_fragment_pairs;
    params.graph.cutoffs.composition = config.vote_threshold;
    params.graph.cutoffs.coverage = config.vote_threshold;
    params.graph.knn.random_seed = config.random_seed;
    params.graph.threads = config.threads;

    params.partition.gamma1 = config.gamma1;
    params.partition.gamma2 = config.gamma2;
    params.partition.random_seed = config.random_seed;
    params.partition.max_iterations = config.max_iterations;
    params.partition.max_seconds = config.max_seconds;
    params.partition.threads = config.threads;

    params.rescore_max = config.rescore_max;
    params.validate();
    return params;
}

BinningPipeline::BinningPipeline(const PipelineParams& params,
                                 std::unique_ptr<IVoteCombiner> combiner,
                                 Logger* log,
                                 BackendFactory factory)
    : params_(params), combiner_(std::move(combiner)), log_(log), factory_(std::move(factory)) {
    params_.validate();
    if (!combiner_) {
        throw ConfigError("No vote combiner");
    }
}

BinningResult BinningPipeline::run(const std::vector<Contig>& contigs,
                                   const RowMatrixXf& profiles,
                                   const IPairScorer& scorer,
                                   const CancellationToken* token,
                                   const std::vector<Contig>& extra_singletons) const {
    BinningResult result;

    NeighborGraphBuilder builder(params_.graph, *combiner_, log_);
    GraphBuildResult built = builder.build(contigs, profiles, scorer, token);
    result.graph = std::move(built.graph);
    result.stats = std::move(built.stats);

    check_cancelled(token, "graph construction");

    TwoStagePartitioner partitioner(params_.partition, log_, factory_);
    if (params_.rescore_max > 1) {
        if (log_ != nullptr) {
            log_->detail("Rescoring intra-bin pairs for coarse bins up to " +
                         std::to_string(params_.rescore_max) + " contigs");
        }
        RescoredSubgraphSource rescored(builder, contigs, scorer, result.graph,
                                        params_.rescore_max);
        result.partition = partitioner.partition(result.graph, &rescored, token);
    } else {
        result.partition = partitioner.partition(result.graph, nullptr, token);
    }

    check_cancelled(token, "partitioning");

    BinAssembler assembler;
    result.bins = assembler.assemble(result.partition, contigs, extra_singletons);

    if (log_ != nullptr) {
        BinSummary s = BinAssembler::summarize(result.bins);
        log_->info(std::to_string(s.n_bins) + " bins (" + std::to_string(s.n_singletons) +
                   " singletons, largest " + std::to_string(s.largest) + " contigs)");
        log_->section("Bins");
        log_->metric("bins", s.n_bins);
        log_->metric("singletons", s.n_singletons);
        log_->metric("largest_bin", static_cast<int>(s.largest));
        log_->metric("total_length", static_cast<double>(s.total_length), 0);

        log_->table_header("bins", {"bin", "contigs", "total_length"});
        for (const auto& bin : result.bins) {
            if (bin.size() < 2) continue;
            log_->table_row({std::to_string(bin.label), std::to_string(bin.size()),
                             std::to_string(bin.total_length)});
        }
    }

    return result;
}

}  // namespace cobin::binning
