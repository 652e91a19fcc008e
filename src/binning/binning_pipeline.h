#pragma once

#include "assembly/bin_assembler.h"
#include "clustering/two_stage_partitioner.h"
#include "graph/neighbor_graph.h"
#include "../util/cancellation.h"

#include <memory>
#include <vector>

namespace cobin {
class Logger;
}

namespace cobin::binning {

struct PipelineParams {
    GraphParams graph;
    PartitionParams partition;
    int rescore_max = 0;    // dense refinement rescoring for coarse bins up to this size

    void validate() const;
};

// Maps the command-line configuration onto the core parameter structs.
// Throws ConfigError (via validate) on out-of-range values.
PipelineParams pipeline_params(const ClusterConfig& config);

struct BinningResult {
    SimilarityGraph graph;
    GraphStats stats;
    Partition partition;
    std::vector<Bin> bins;
};

// graph -> barrier -> partition -> barrier -> bins.
// Each stage sees only the completed output of the previous one.
class BinningPipeline {
public:
    BinningPipeline(const PipelineParams& params,
                    std::unique_ptr<IVoteCombiner> combiner,
                    Logger* log = nullptr,
                    BackendFactory factory = create_leiden_backend);

    BinningResult run(const std::vector<Contig>& contigs,
                      const RowMatrixXf& profiles,
                      const IPairScorer& scorer,
                      const CancellationToken* token = nullptr,
                      const std::vector<Contig>& extra_singletons = {}) const;

private:
    PipelineParams params_;
    std::unique_ptr<IVoteCombiner> combiner_;
    Logger* log_;
    BackendFactory factory_;
};

}  // namespace cobin::binning
