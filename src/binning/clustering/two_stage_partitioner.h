#pragma once

#include "clustering_types.h"
#include "leiden_backend.h"
#include "subgraph_source.h"
#include "../graph/similarity_graph.h"
#include "../../util/cancellation.h"

#include <cobin/config.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace cobin {
class Logger;
}

namespace cobin::binning {

struct PartitionParams {
    float gamma1 = DEFAULT_GAMMA1;      // coarse resolution
    float gamma2 = DEFAULT_GAMMA2;      // refinement resolution
    int random_seed = 42;
    NullModel null_model = NullModel::CPM;
    int max_iterations = 50;            // per subgraph
    double max_seconds = 0.0;           // per subgraph, 0 = none
    int threads = 1;

    // Throws ConfigError
    void validate() const;
};

// Contig -> bin assignment. Labels are compacted in order of each bin's
// smallest node index, so equal inputs give identical label vectors.
struct Partition {
    std::vector<int> labels;            // final bin per node
    std::vector<int> coarse_labels;     // preliminary bin per node
    int n_coarse = 0;
    int n_final = 0;
    int n_split = 0;                    // coarse bins divided by refinement
    int n_unconverged = 0;              // subgraphs that hit the optimizer budget
    int n_refine_failures = 0;          // coarse bins kept whole after an error
    int n_coarse_failures = 0;          // components kept whole after an error
    bool degraded = false;

    size_t size() const { return labels.size(); }
};

using BackendFactory = std::function<std::unique_ptr<ILeidenBackend>()>;

// Coarse Leiden pass at gamma1 over the whole graph, then one refinement
// pass at gamma2 inside every coarse bin with more than one member.
class TwoStagePartitioner {
public:
    explicit TwoStagePartitioner(const PartitionParams& params,
                                 Logger* log = nullptr,
                                 BackendFactory factory = create_leiden_backend);

    // refine_source: edges used for refinement (induced subgraph when null)
    Partition partition(const SimilarityGraph& graph,
                        const ISubgraphSource* refine_source = nullptr,
                        const CancellationToken* token = nullptr) const;

    const PartitionParams& params() const { return params_; }

private:
    struct TaskResult {
        std::vector<int> labels;
        bool failed = false;
        bool converged = true;
        std::string error;
    };

    TaskResult run_task(const std::vector<WeightedEdge>& edges, int n_nodes,
                        float resolution) const;

    std::vector<int> coarse_stage(const SimilarityGraph& graph, Partition& out) const;

    std::vector<int> refine_stage(const SimilarityGraph& graph,
                                  const std::vector<int>& coarse,
                                  const ISubgraphSource& source,
                                  Partition& out) const;

    PartitionParams params_;
    Logger* log_;
    BackendFactory factory_;
};

// Convenience wrapper with default budgets
Partition partition(const SimilarityGraph& graph, float gamma1, float gamma2, int random_seed = 42);

}  // namespace cobin::binning
