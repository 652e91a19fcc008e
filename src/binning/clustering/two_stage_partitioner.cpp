// Two-stage partitioning: coarse Leiden pass, then per-bin refinement

#include "two_stage_partitioner.h"
#include "../../util/errors.h"
#include "../../util/logger.h"

#include <algorithm>
#include <map>
#include <omp.h>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace cobin::binning {

namespace {

// Relabel 0..k-1 in order of first appearance (= smallest member node)
int compact_in_node_order(std::vector<int>& labels) {
    std::unordered_map<int, int> mapping;
    int next_id = 0;
    for (int& label : labels) {
        auto it = mapping.find(label);
        if (it == mapping.end()) {
            mapping[label] = next_id;
            label = next_id++;
        } else {
            label = it->second;
        }
    }
    return next_id;
}

std::vector<std::vector<int>> group_by_label(const std::vector<int>& labels, int n_labels) {
    std::vector<std::vector<int>> groups(n_labels);
    for (size_t i = 0; i < labels.size(); ++i) {
        groups[labels[i]].push_back(static_cast<int>(i));
    }
    return groups;
}

}  // namespace

void PartitionParams::validate() const {
    if (!(gamma1 > 0.0f)) {
        throw ConfigError("gamma1 must be > 0, got " + std::to_string(gamma1));
    }
    if (!(gamma2 > 0.0f)) {
        throw ConfigError("gamma2 must be > 0, got " + std::to_string(gamma2));
    }
    if (max_iterations == 0 || max_iterations < -1) {
        throw ConfigError("max_iterations must be positive or -1, got " +
                          std::to_string(max_iterations));
    }
    if (max_seconds < 0.0) {
        throw ConfigError("max_seconds must be >= 0");
    }
    if (threads < 1) {
        throw ConfigError("threads must be >= 1, got " + std::to_string(threads));
    }
}

TwoStagePartitioner::TwoStagePartitioner(const PartitionParams& params,
                                         Logger* log,
                                         BackendFactory factory)
    : params_(params), log_(log), factory_(std::move(factory)) {
    params_.validate();
    if (!factory_) {
        throw ConfigError("No community detection backend");
    }
}

TwoStagePartitioner::TaskResult TwoStagePartitioner::run_task(
    const std::vector<WeightedEdge>& edges, int n_nodes, float resolution) const {

    TaskResult task;
    try {
        LeidenConfig config;
        config.resolution = resolution;
        config.max_iterations = params_.max_iterations;
        config.max_seconds = params_.max_seconds;
        config.random_seed = params_.random_seed;
        config.null_model = params_.null_model;

        auto backend = factory_();
        backend->set_seed(params_.random_seed);
        ClusteringResult result = backend->cluster(edges, n_nodes, config);
        if (result.labels.size() != static_cast<size_t>(n_nodes)) {
            throw std::runtime_error("backend returned " + std::to_string(result.labels.size()) +
                                     " labels for " + std::to_string(n_nodes) + " nodes");
        }
        task.labels = std::move(result.labels);
        task.converged = result.converged;
    } catch (const std::exception& e) {
        task.failed = true;
        task.error = e.what();
        task.labels.assign(n_nodes, 0);
    }
    return task;
}

std::vector<int> TwoStagePartitioner::coarse_stage(const SimilarityGraph& graph,
                                                   Partition& out) const {
    const int n = graph.n_nodes();
    auto components = graph.connected_components();

    // Components are independent: CPM never joins disconnected nodes
    std::vector<int> work;
    for (size_t c = 0; c < components.size(); ++c) {
        if (components[c].size() > 1) work.push_back(static_cast<int>(c));
    }

    std::vector<TaskResult> results(work.size());
    const int n_work = static_cast<int>(work.size());

    #pragma omp parallel for schedule(dynamic) num_threads(params_.threads)
    for (int t = 0; t < n_work; ++t) {
        const auto& members = components[work[t]];
        auto edges = graph.induced_edges(members);
        results[t] = run_task(edges, static_cast<int>(members.size()), params_.gamma1);
    }

    // Global id = (component, local community); compacted afterwards
    std::vector<int> coarse(n, -1);
    int next = 0;
    std::vector<int> local_base(components.size(), -1);
    for (size_t c = 0; c < components.size(); ++c) {
        if (components[c].size() == 1) {
            coarse[components[c][0]] = next++;
        } else {
            local_base[c] = next;
            next += static_cast<int>(components[c].size());
        }
    }

    for (int t = 0; t < n_work; ++t) {
        const auto& members = components[work[t]];
        const auto& task = results[t];
        if (task.failed) {
            ++out.n_coarse_failures;
            if (log_ != nullptr) {
                log_->warn("Coarse clustering failed on a component of " +
                           std::to_string(members.size()) + " contigs, kept as one bin: " +
                           task.error);
            }
        } else if (!task.converged) {
            ++out.n_unconverged;
        }
        for (size_t i = 0; i < members.size(); ++i) {
            coarse[members[i]] = local_base[work[t]] + task.labels[i];
        }
    }

    out.n_coarse = compact_in_node_order(coarse);
    return coarse;
}

std::vector<int> TwoStagePartitioner::refine_stage(const SimilarityGraph& graph,
                                                   const std::vector<int>& coarse,
                                                   const ISubgraphSource& source,
                                                   Partition& out) const {
    auto bins = group_by_label(coarse, out.n_coarse);

    std::vector<int> work;
    for (size_t b = 0; b < bins.size(); ++b) {
        if (bins[b].size() > 1) work.push_back(static_cast<int>(b));
    }

    std::vector<TaskResult> results(work.size());
    std::vector<std::string> input_errors(work.size());
    const int n_work = static_cast<int>(work.size());

    #pragma omp parallel for schedule(dynamic) num_threads(params_.threads)
    for (int t = 0; t < n_work; ++t) {
        const auto& members = bins[work[t]];
        std::vector<WeightedEdge> edges;
        try {
            edges = source.edges_within(members);
        } catch (const InputError& e) {
            // Malformed scores stay fatal; rethrown after the loop
            input_errors[t] = e.what();
            continue;
        } catch (const std::exception& e) {
            results[t].failed = true;
            results[t].error = e.what();
            results[t].labels.assign(members.size(), 0);
            continue;
        }
        results[t] = run_task(edges, static_cast<int>(members.size()), params_.gamma2);
    }

    for (const auto& err : input_errors) {
        if (!err.empty()) throw InputError(err);
    }

    // Final bin identity = (coarse bin, sub-community); singletons keep sub = 0
    std::vector<std::pair<int, int>> keys(graph.n_nodes());
    for (int i = 0; i < graph.n_nodes(); ++i) {
        keys[i] = {coarse[i], 0};
    }

    for (int t = 0; t < n_work; ++t) {
        const auto& members = bins[work[t]];
        const auto& task = results[t];
        if (task.failed) {
            ++out.n_refine_failures;
            if (log_ != nullptr) {
                log_->warn("Refinement failed for coarse bin " + std::to_string(work[t]) +
                           " (" + std::to_string(members.size()) + " contigs), kept whole: " +
                           task.error);
            }
            continue;
        }
        if (!task.converged) ++out.n_unconverged;

        int n_sub = 1 + *std::max_element(task.labels.begin(), task.labels.end());
        if (n_sub > 1) ++out.n_split;
        for (size_t i = 0; i < members.size(); ++i) {
            keys[members[i]].second = task.labels[i];
        }
    }

    std::map<std::pair<int, int>, int> key_ids;
    std::vector<int> labels(graph.n_nodes());
    for (int i = 0; i < graph.n_nodes(); ++i) {
        auto it = key_ids.emplace(keys[i], static_cast<int>(key_ids.size())).first;
        labels[i] = it->second;
    }
    out.n_final = compact_in_node_order(labels);
    return labels;
}

Partition TwoStagePartitioner::partition(const SimilarityGraph& graph,
                                         const ISubgraphSource* refine_source,
                                         const CancellationToken* token) const {
    Partition out;
    check_cancelled(token, "coarse partitioning");

    if (log_ != nullptr) {
        log_->info("Coarse clustering (gamma1=" + std::to_string(params_.gamma1) + ")");
    }
    out.coarse_labels = coarse_stage(graph, out);

    // Barrier between the two stages
    check_cancelled(token, "refinement");

    if (log_ != nullptr) {
        log_->info(std::to_string(out.n_coarse) + " coarse bins; refining (gamma2=" +
                   std::to_string(params_.gamma2) + ")");
    }
    InducedSubgraphSource induced(graph);
    const ISubgraphSource& source = refine_source != nullptr ? *refine_source : induced;
    out.labels = refine_stage(graph, out.coarse_labels, source, out);

    out.degraded = out.n_unconverged > 0 || out.n_refine_failures > 0 || out.n_coarse_failures > 0;

    if (log_ != nullptr) {
        log_->info(std::to_string(out.n_final) + " bins after refinement (" +
                   std::to_string(out.n_split) + " coarse bins split)");
        if (out.n_unconverged > 0) {
            log_->warn(std::to_string(out.n_unconverged) +
                       " subgraphs did not converge within the optimizer budget; "
                       "best partition found was kept");
        }
        log_->section("Partitioning");
        log_->metric("gamma1", params_.gamma1);
        log_->metric("gamma2", params_.gamma2);
        log_->metric("random_seed", params_.random_seed);
        log_->metric("coarse_bins", out.n_coarse);
        log_->metric("final_bins", out.n_final);
        log_->metric("split_bins", out.n_split);
        log_->metric("unconverged", out.n_unconverged);
        log_->metric("refine_failures", out.n_refine_failures);
        log_->decision("CONFIDENCE", out.degraded ? "degraded" : "nominal",
                       out.degraded ? "optimizer budget exhausted or subgraph failures" : "");
    }

    return out;
}

Partition partition(const SimilarityGraph& graph, float gamma1, float gamma2, int random_seed) {
    PartitionParams params;
    params.gamma1 = gamma1;
    params.gamma2 = gamma2;
    params.random_seed = random_seed;
    return TwoStagePartitioner(params).partition(graph);
}

}  // namespace cobin::binning
