#include "hnsw_knn_index.h"

#include <hnswlib/hnswlib.h>

#include <algorithm>
#include <stdexcept>

namespace cobin::binning {

HnswKnnIndex::HnswKnnIndex(const KnnConfig& config)
    : config_(config) {}

HnswKnnIndex::~HnswKnnIndex() = default;

HnswKnnIndex::HnswKnnIndex(HnswKnnIndex&&) noexcept = default;
HnswKnnIndex& HnswKnnIndex::operator=(HnswKnnIndex&&) noexcept = default;

void HnswKnnIndex::build(const RowMatrixXf& profiles) {
    if (profiles.rows() == 0 || profiles.cols() == 0) {
        throw std::invalid_argument("Empty profile matrix");
    }

    data_ = profiles;
    n_points_ = static_cast<size_t>(data_.rows());
    dim_ = static_cast<size_t>(data_.cols());

    space_ = std::make_unique<hnswlib::L2Space>(dim_);
    index_ = std::make_unique<hnswlib::HierarchicalNSW<float>>(
        space_.get(),
        n_points_,
        config_.M,
        config_.ef_construction,
        config_.random_seed
    );

    // Sequential insertion keeps the graph identical across runs
    for (size_t i = 0; i < n_points_; ++i) {
        index_->addPoint(data_.data() + i * dim_, i);
    }

    index_->setEf(std::max(config_.ef_search, config_.k + 1));
}

NeighborList HnswKnnIndex::query_all() const {
    return query_all(config_.k);
}

NeighborList HnswKnnIndex::query_all(int k) const {
    if (!is_built()) {
        throw std::runtime_error("Index not built");
    }

    NeighborList result;
    result.resize(n_points_, k);

    int actual_k = std::min(k + 1, static_cast<int>(n_points_));

    // Static scheduling: each slot is written by exactly one iteration
    #pragma omp parallel for schedule(static)
    for (size_t i = 0; i < n_points_; ++i) {
        auto neighbors = index_->searchKnn(data_.data() + i * dim_, actual_k);

        std::vector<std::pair<float, size_t>> sorted;
        sorted.reserve(neighbors.size());

        while (!neighbors.empty()) {
            const auto& top = neighbors.top();
            if (top.second != i) {
                sorted.emplace_back(top.first, top.second);
            }
            neighbors.pop();
        }

        std::sort(sorted.begin(), sorted.end());

        int count = std::min(static_cast<int>(sorted.size()), k);
        for (int j = 0; j < count; ++j) {
            result.ids[i].push_back(static_cast<int>(sorted[j].second));
            result.dists[i].push_back(sorted[j].first);
        }
    }

    return result;
}

}  // namespace cobin::binning
