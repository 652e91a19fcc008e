// Leiden clustering backend implementation
// Local moving + refinement + graph aggregation, CPM or modularity quality

#include "leiden_backend.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <deque>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace cobin::binning {

// ===========================================================================
// Graph structure for aggregation
// ===========================================================================

struct AggregateGraph {
    int n_nodes = 0;
    std::vector<std::vector<std::pair<int, double>>> adj;  // neighbor, weight (no self-loops)
    std::vector<double> self_weight;    // internal weight folded into the node
    std::vector<double> node_weights;   // strength: sum(adj) + 2 * self_weight
    std::vector<double> node_sizes;     // for CPM penalty
    double total_edge_weight = 0.0;     // m: every edge once, self weights included
};

LeidenBackend::LeidenBackend() : rng_(42) {}

AggregateGraph LeidenBackend::build_graph(
    const std::vector<WeightedEdge>& edges,
    int n_nodes,
    const LeidenConfig& config) const {

    AggregateGraph g;
    g.n_nodes = n_nodes;
    g.adj.resize(n_nodes);
    g.self_weight.assign(n_nodes, 0.0);
    g.node_weights.assign(n_nodes, 0.0);

    if (config.use_node_sizes) {
        if (config.node_sizes.size() != static_cast<size_t>(n_nodes)) {
            throw std::invalid_argument("node_sizes has " + std::to_string(config.node_sizes.size()) +
                                        " entries for " + std::to_string(n_nodes) + " nodes");
        }
        g.node_sizes = config.node_sizes;
    } else {
        g.node_sizes.assign(n_nodes, 1.0);
    }

    for (const auto& e : edges) {
        if (e.u < 0 || e.u >= n_nodes || e.v < 0 || e.v >= n_nodes) {
            throw std::invalid_argument("Edge endpoint outside [0, " + std::to_string(n_nodes) + ")");
        }
        if (!(e.w >= 0.0f) || !std::isfinite(e.w)) {
            throw std::invalid_argument("Edge weights must be finite and non-negative");
        }

        double w = static_cast<double>(e.w);
        if (e.u == e.v) {
            g.self_weight[e.u] += w;
            g.node_weights[e.u] += 2.0 * w;
        } else {
            g.adj[e.u].emplace_back(e.v, w);
            g.adj[e.v].emplace_back(e.u, w);
            g.node_weights[e.u] += w;
            g.node_weights[e.v] += w;
        }
        g.total_edge_weight += w;
    }

    return g;
}

double LeidenBackend::delta_quality(
    const AggregateGraph& g,
    int node,
    double edges_to_current,
    double edges_to_target,
    double weight_current,
    double weight_target,
    double size_current,
    double size_target,
    float resolution) const {

    if (null_model_ == NullModel::CPM) {
        // CPM penalty: resolution * n_c(n_c-1)/2 per community.
        // size_current includes the node itself.
        double s = g.node_sizes[node];
        return (edges_to_target - edges_to_current) -
               resolution * s * (size_target - size_current + s);
    }

    // Configuration model
    double m = g.total_edge_weight;
    if (m == 0.0) return 0.0;
    double k = g.node_weights[node];
    return (edges_to_target - edges_to_current) / m -
           resolution * k * (weight_target - weight_current + k) / (2.0 * m * m);
}

bool LeidenBackend::move_nodes_fast(
    const AggregateGraph& g,
    std::vector<int>& labels,
    float resolution) {

    const int n = g.n_nodes;
    std::vector<double> comm_weights(n, 0.0);
    std::vector<double> comm_sizes(n, 0.0);
    std::vector<int> comm_count(n, 0);
    for (int i = 0; i < n; ++i) {
        comm_weights[labels[i]] += g.node_weights[i];
        comm_sizes[labels[i]] += g.node_sizes[i];
        ++comm_count[labels[i]];
    }
    std::vector<int> empty_comms;
    for (int c = n - 1; c >= 0; --c) {
        if (comm_count[c] == 0) empty_comms.push_back(c);
    }

    // Dynamic queue: when a node moves, its neighbors get re-queued
    std::vector<bool> in_queue(n, true);
    std::vector<int> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), rng_);
    std::deque<int> queue(order.begin(), order.end());

    bool any_moved = false;

    while (!queue.empty()) {
        int node = queue.front();
        queue.pop_front();
        in_queue[node] = false;

        int current = labels[node];

        std::unordered_map<int, double> edges_to_comm;
        edges_to_comm[current] = 0.0;
        for (const auto& [j, w] : g.adj[node]) {
            edges_to_comm[labels[j]] += w;
        }
        double edges_to_current = edges_to_comm[current];

        int best = current;
        double best_delta = 0.0;

        for (const auto& [c, edges_to_c] : edges_to_comm) {
            if (c == current) continue;
            double delta = delta_quality(
                g, node, edges_to_current, edges_to_c,
                comm_weights[current], comm_weights[c],
                comm_sizes[current], comm_sizes[c], resolution);
            if (delta > best_delta || (delta == best_delta && best != current && c < best)) {
                best_delta = delta;
                best = c;
            }
        }

        // Leaving for an empty community
        if (comm_count[current] > 1 && !empty_comms.empty()) {
            int empty = empty_comms.back();
            double delta = delta_quality(
                g, node, edges_to_current, 0.0,
                comm_weights[current], 0.0,
                comm_sizes[current], 0.0, resolution);
            if (delta > best_delta) {
                best_delta = delta;
                best = empty;
            }
        }

        if (best_delta <= 1e-12 || best == current) continue;

        if (comm_count[best] == 0) empty_comms.pop_back();
        comm_weights[current] -= g.node_weights[node];
        comm_sizes[current] -= g.node_sizes[node];
        --comm_count[current];
        comm_weights[best] += g.node_weights[node];
        comm_sizes[best] += g.node_sizes[node];
        ++comm_count[best];
        if (comm_count[current] == 0) empty_comms.push_back(current);
        labels[node] = best;
        any_moved = true;

        // Re-queue neighbors that aren't in the new community
        for (const auto& [j, w] : g.adj[node]) {
            if (!in_queue[j] && labels[j] != best) {
                queue.push_back(j);
                in_queue[j] = true;
            }
        }
    }

    return any_moved;
}

std::vector<int> LeidenBackend::refine_partition(
    const AggregateGraph& g,
    const std::vector<int>& labels,
    float resolution) {

    const int n = g.n_nodes;
    std::vector<int> refined(n);
    std::iota(refined.begin(), refined.end(), 0);

    std::vector<double> comm_weights = g.node_weights;
    std::vector<double> comm_sizes = g.node_sizes;
    std::vector<int> comm_count(n, 1);

    std::vector<int> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), rng_);

    for (int node : order) {
        // Only nodes still on their own may merge
        int current = refined[node];
        if (comm_count[current] != 1) continue;

        std::unordered_map<int, double> edges_to_comm;
        for (const auto& [j, w] : g.adj[node]) {
            if (labels[j] != labels[node]) continue;
            edges_to_comm[refined[j]] += w;
        }

        int best = current;
        double best_delta = 0.0;
        for (const auto& [c, edges_to_c] : edges_to_comm) {
            if (c == current) continue;
            double delta = delta_quality(
                g, node, 0.0, edges_to_c,
                comm_weights[current], comm_weights[c],
                comm_sizes[current], comm_sizes[c], resolution);
            if (delta > best_delta + 1e-12 || (delta > 1e-12 && delta == best_delta && c < best)) {
                best_delta = delta;
                best = c;
            }
        }

        if (best != current) {
            comm_weights[current] -= g.node_weights[node];
            comm_sizes[current] -= g.node_sizes[node];
            --comm_count[current];
            comm_weights[best] += g.node_weights[node];
            comm_sizes[best] += g.node_sizes[node];
            ++comm_count[best];
            refined[node] = best;
        }
    }

    return refined;
}

AggregateGraph LeidenBackend::aggregate_graph(
    const AggregateGraph& g,
    const std::vector<int>& labels,
    int n_communities) const {

    AggregateGraph agg;
    agg.n_nodes = n_communities;
    agg.adj.resize(n_communities);
    agg.self_weight.assign(n_communities, 0.0);
    agg.node_weights.assign(n_communities, 0.0);
    agg.node_sizes.assign(n_communities, 0.0);
    agg.total_edge_weight = g.total_edge_weight;

    std::vector<std::unordered_map<int, double>> edge_map(n_communities);

    for (int i = 0; i < g.n_nodes; ++i) {
        int ci = labels[i];
        agg.node_sizes[ci] += g.node_sizes[i];
        agg.node_weights[ci] += g.node_weights[i];
        agg.self_weight[ci] += g.self_weight[i];
        for (const auto& [j, w] : g.adj[i]) {
            if (j < i) continue;  // Count each edge once
            int cj = labels[j];
            if (ci == cj) {
                agg.self_weight[ci] += w;
            } else {
                edge_map[std::min(ci, cj)][std::max(ci, cj)] += w;
            }
        }
    }

    for (int ci = 0; ci < n_communities; ++ci) {
        std::vector<std::pair<int, double>> row(edge_map[ci].begin(), edge_map[ci].end());
        std::sort(row.begin(), row.end());
        for (const auto& [cj, w] : row) {
            agg.adj[ci].emplace_back(cj, w);
            agg.adj[cj].emplace_back(ci, w);
        }
    }

    return agg;
}

int LeidenBackend::compact_labels(std::vector<int>& labels) {
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

double LeidenBackend::quality(
    const AggregateGraph& g,
    const std::vector<int>& labels,
    float resolution) const {

    if (g.n_nodes == 0) return 0.0;

    int n_labels = *std::max_element(labels.begin(), labels.end()) + 1;
    std::vector<double> internal(n_labels, 0.0);
    std::vector<double> sizes(n_labels, 0.0);
    std::vector<double> strengths(n_labels, 0.0);

    for (int i = 0; i < g.n_nodes; ++i) {
        int c = labels[i];
        sizes[c] += g.node_sizes[i];
        strengths[c] += g.node_weights[i];
        internal[c] += g.self_weight[i];
        for (const auto& [j, w] : g.adj[i]) {
            if (j > i && labels[j] == c) internal[c] += w;
        }
    }

    double q = 0.0;
    if (null_model_ == NullModel::CPM) {
        for (int c = 0; c < n_labels; ++c) {
            q += internal[c] - resolution * sizes[c] * (sizes[c] - 1.0) / 2.0;
        }
        return q;
    }

    double m = g.total_edge_weight;
    if (m == 0.0) return 0.0;
    for (int c = 0; c < n_labels; ++c) {
        double k = strengths[c] / (2.0 * m);
        q += internal[c] / m - resolution * k * k;
    }
    return q;
}

double LeidenBackend::quality(
    const std::vector<WeightedEdge>& edges,
    int n_nodes,
    const std::vector<int>& labels,
    const LeidenConfig& config) {

    if (labels.size() != static_cast<size_t>(n_nodes)) {
        throw std::invalid_argument("Label vector does not match node count");
    }
    LeidenBackend backend;
    backend.null_model_ = config.null_model;
    AggregateGraph g = backend.build_graph(edges, n_nodes, config);
    return backend.quality(g, labels, config.resolution);
}

ClusteringResult LeidenBackend::cluster(
    const std::vector<WeightedEdge>& edges,
    int n_nodes,
    const LeidenConfig& config) {

    if (n_nodes < 0) {
        throw std::invalid_argument("Negative node count");
    }
    if (!(config.resolution > 0.0f)) {
        throw std::invalid_argument("Resolution must be > 0");
    }

    auto start = std::chrono::steady_clock::now();
    auto out_of_time = [&]() {
        if (config.max_seconds <= 0.0) return false;
        double elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start).count();
        return elapsed > config.max_seconds;
    };

    rng_.seed(config.random_seed);
    null_model_ = config.null_model;
    const AggregateGraph base = build_graph(edges, n_nodes, config);

    ClusteringResult result;
    if (n_nodes == 0) return result;

    int max_iter = config.max_iterations;
    max_iter = (max_iter < 0) ? 1000 : max_iter;

    // membership[i]: node of the current level graph holding original node i
    std::vector<int> membership(n_nodes);
    std::iota(membership.begin(), membership.end(), 0);

    AggregateGraph g = base;
    std::vector<int> labels(n_nodes);
    std::iota(labels.begin(), labels.end(), 0);

    std::vector<int> current(n_nodes);
    std::vector<int> best_labels = membership;
    double best_quality = quality(base, best_labels, config.resolution);

    int iteration = 0;
    bool converged = false;

    while (iteration < max_iter && !out_of_time()) {
        move_nodes_fast(g, labels, config.resolution);
        ++iteration;

        int n_communities = compact_labels(labels);

        for (int i = 0; i < n_nodes; ++i) {
            current[i] = labels[membership[i]];
        }
        double q = quality(base, current, config.resolution);
        if (q > best_quality) {
            best_quality = q;
            best_labels = current;
        }

        // Each community is a single aggregate node: nothing left to merge
        if (n_communities == g.n_nodes) {
            best_labels = current;
            best_quality = q;
            converged = true;
            break;
        }

        std::vector<int> refined = refine_partition(g, labels, config.resolution);
        int n_refined = compact_labels(refined);

        // Refinement merged nothing: aggregate on the unrefined partition
        if (n_refined == g.n_nodes) {
            refined = labels;
            n_refined = n_communities;
        }

        std::vector<int> next_labels(n_refined, 0);
        for (int i = 0; i < g.n_nodes; ++i) {
            next_labels[refined[i]] = labels[i];
        }
        compact_labels(next_labels);

        for (int i = 0; i < n_nodes; ++i) {
            membership[i] = refined[membership[i]];
        }

        g = aggregate_graph(g, refined, n_refined);
        labels = std::move(next_labels);
    }

    result.labels = std::move(best_labels);
    result.num_clusters = compact_labels(result.labels);
    result.quality = best_quality;
    result.num_iterations = iteration;
    result.converged = converged;

    return result;
}

std::unique_ptr<ILeidenBackend> create_leiden_backend() {
    return std::make_unique<LeidenBackend>();
}

}  // namespace cobin::binning
