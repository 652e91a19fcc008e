#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

namespace cobin::binning {

struct KnnConfig {
    int k = 100;
    int ef_search = 200;
    int M = 16;
    int ef_construction = 200;
    int random_seed = 42;
};

struct NeighborList {
    std::vector<std::vector<int>> ids;
    std::vector<std::vector<float>> dists;

    size_t size() const { return ids.size(); }

    void resize(size_t n, size_t k) {
        ids.resize(n);
        dists.resize(n);
        for (size_t i = 0; i < n; ++i) {
            ids[i].reserve(k);
            dists[i].reserve(k);
        }
    }
};

struct WeightedEdge {
    int u;
    int v;
    float w;

    WeightedEdge() : u(0), v(0), w(0.0f) {}
    WeightedEdge(int u_, int v_, float w_) : u(u_), v(v_), w(w_) {}

    bool operator==(const WeightedEdge& other) const {
        return u == other.u && v == other.v && w == other.w;
    }
};

struct ClusteringResult {
    std::vector<int> labels;
    int num_clusters = 0;
    double quality = 0.0;
    int num_iterations = 0;
    bool converged = true;      // false: budget exhausted, best partition seen returned
};

enum class NullModel {
    CPM,            // Constant Potts model: sum_c (w_c - resolution * n_c(n_c-1)/2)
    Configuration   // Newman-Girvan modularity (degree-based null)
};

struct LeidenConfig {
    float resolution = 1.0f;
    int max_iterations = 50;        // -1 for no iteration cap
    double max_seconds = 0.0;       // wall-clock budget, 0 = none
    int random_seed = 42;
    NullModel null_model = NullModel::CPM;

    // Node sizes (default 1 per node)
    bool use_node_sizes = false;
    std::vector<double> node_sizes;
};

}  // namespace cobin::binning
