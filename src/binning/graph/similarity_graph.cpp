#include "similarity_graph.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace cobin::binning {

SimilarityGraph::SimilarityGraph(int n_nodes, std::vector<WeightedEdge> edges)
    : n_nodes_(n_nodes), edges_(std::move(edges)), adj_(n_nodes) {

    for (auto& e : edges_) {
        if (e.u < 0 || e.u >= n_nodes || e.v < 0 || e.v >= n_nodes) {
            throw std::invalid_argument("Edge (" + std::to_string(e.u) + "," +
                                        std::to_string(e.v) + ") outside graph of " +
                                        std::to_string(n_nodes) + " nodes");
        }
        if (e.u == e.v) {
            throw std::invalid_argument("Self-loop on node " + std::to_string(e.u));
        }
        if (e.u > e.v) std::swap(e.u, e.v);
    }

    std::sort(edges_.begin(), edges_.end(), [](const WeightedEdge& a, const WeightedEdge& b) {
        return a.u != b.u ? a.u < b.u : a.v < b.v;
    });

    for (size_t i = 0; i < edges_.size(); ++i) {
        const auto& e = edges_[i];
        if (i > 0 && edges_[i - 1].u == e.u && edges_[i - 1].v == e.v) {
            throw std::invalid_argument("Duplicate edge (" + std::to_string(e.u) + "," +
                                        std::to_string(e.v) + ")");
        }
        adj_[e.u].emplace_back(e.v, e.w);
        adj_[e.v].emplace_back(e.u, e.w);
    }

    for (auto& nbrs : adj_) {
        std::sort(nbrs.begin(), nbrs.end());
    }
}

int SimilarityGraph::max_degree() const {
    int best = 0;
    for (const auto& nbrs : adj_) {
        best = std::max(best, static_cast<int>(nbrs.size()));
    }
    return best;
}

bool SimilarityGraph::has_edge(int u, int v) const {
    if (u < 0 || u >= n_nodes_ || v < 0 || v >= n_nodes_) return false;
    const auto& nbrs = adj_[u];
    auto it = std::lower_bound(nbrs.begin(), nbrs.end(), std::make_pair(v, -1.0f));
    return it != nbrs.end() && it->first == v;
}

float SimilarityGraph::weight(int u, int v) const {
    if (u < 0 || u >= n_nodes_ || v < 0 || v >= n_nodes_) return 0.0f;
    const auto& nbrs = adj_[u];
    auto it = std::lower_bound(nbrs.begin(), nbrs.end(), std::make_pair(v, -1.0f));
    return (it != nbrs.end() && it->first == v) ? it->second : 0.0f;
}

std::vector<std::vector<int>> SimilarityGraph::connected_components() const {
    std::vector<int> comp(n_nodes_, -1);
    std::vector<std::vector<int>> components;

    for (int start = 0; start < n_nodes_; ++start) {
        if (comp[start] >= 0) continue;

        int id = static_cast<int>(components.size());
        std::vector<int> members;
        members.push_back(start);
        comp[start] = id;

        size_t head = 0;
        while (head < members.size()) {
            int node = members[head++];
            for (const auto& [j, w] : adj_[node]) {
                if (comp[j] < 0) {
                    comp[j] = id;
                    members.push_back(j);
                }
            }
        }

        std::sort(members.begin(), members.end());
        components.push_back(std::move(members));
    }

    return components;
}

std::vector<WeightedEdge> SimilarityGraph::induced_edges(const std::vector<int>& members) const {
    std::unordered_map<int, int> local;
    local.reserve(members.size());
    for (size_t i = 0; i < members.size(); ++i) {
        local[members[i]] = static_cast<int>(i);
    }

    std::vector<WeightedEdge> result;
    for (size_t i = 0; i < members.size(); ++i) {
        for (const auto& [j, w] : adj_[members[i]]) {
            auto it = local.find(j);
            if (it != local.end() && static_cast<int>(i) < it->second) {
                result.emplace_back(static_cast<int>(i), it->second, w);
            }
        }
    }
    return result;
}

}  // namespace cobin::binning
