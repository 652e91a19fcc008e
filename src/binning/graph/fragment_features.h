#pragma once

#include <Eigen/Dense>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace cobin::binning {

using RowMatrixXf = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

struct Contig {
    std::string id;
    int64_t length = 0;
    int n_fragments = 0;

    Contig() = default;
    Contig(std::string id_, int64_t length_, int n_fragments_)
        : id(std::move(id_)), length(length_), n_fragments(n_fragments_) {}
};

// Stable key of one scoring unit
struct FragmentKey {
    int contig = 0;
    int fragment = 0;

    FragmentKey() = default;
    FragmentKey(int c, int f) : contig(c), fragment(f) {}
};

enum class FeatureSource { Composition, Coverage };

// Latent fragment vectors for one feature source.
// Rows of contig c are [offsets[c], offsets[c+1]).
struct FragmentMatrix {
    RowMatrixXf rows;
    std::vector<int> offsets;

    int n_contigs() const { return offsets.empty() ? 0 : static_cast<int>(offsets.size()) - 1; }
    int n_fragments(int contig) const { return offsets[contig + 1] - offsets[contig]; }
    int dim() const { return static_cast<int>(rows.cols()); }

    Eigen::Map<const Eigen::VectorXf> row(const FragmentKey& key) const {
        return Eigen::Map<const Eigen::VectorXf>(
            rows.data() + static_cast<Eigen::Index>(offsets[key.contig] + key.fragment) * rows.cols(),
            rows.cols());
    }
};

struct FragmentFeatures {
    std::vector<Contig> contigs;
    FragmentMatrix composition;
    FragmentMatrix coverage;

    const FragmentMatrix& source(FeatureSource s) const {
        return s == FeatureSource::Composition ? composition : coverage;
    }

    // Throws InputError if the two sources disagree with each other or with contigs
    void validate() const;

    // Per-contig mean of the fragment vectors (one row per contig)
    RowMatrixXf mean_profiles(FeatureSource s) const;

    // Composition and coverage means side by side
    RowMatrixXf combined_profiles() const;
};

}  // namespace cobin::binning
