#pragma once

#include "clustering_types.h"
#include "../graph/fragment_features.h"

#include <memory>
#include <vector>

namespace hnswlib {
template<typename dist_t> class HierarchicalNSW;
template<typename MTYPE> class SpaceInterface;
}

namespace cobin::binning {

// Approximate kNN over per-contig profiles (one row per contig).
// Used as the cheap prefilter that bounds the candidate pairs per contig.
class HnswKnnIndex {
public:
    explicit HnswKnnIndex(const KnnConfig& config = KnnConfig());
    ~HnswKnnIndex();

    HnswKnnIndex(const HnswKnnIndex&) = delete;
    HnswKnnIndex& operator=(const HnswKnnIndex&) = delete;
    HnswKnnIndex(HnswKnnIndex&&) noexcept;
    HnswKnnIndex& operator=(HnswKnnIndex&&) noexcept;

    void build(const RowMatrixXf& profiles);

    // k nearest other points for every indexed point, closest first
    NeighborList query_all() const;
    NeighborList query_all(int k) const;

    size_t size() const { return n_points_; }
    size_t dim() const { return dim_; }
    bool is_built() const { return index_ != nullptr; }

private:
    KnnConfig config_;
    std::unique_ptr<hnswlib::SpaceInterface<float>> space_;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> index_;
    size_t n_points_ = 0;
    size_t dim_ = 0;
    RowMatrixXf data_;
};

}  // namespace cobin::binning
