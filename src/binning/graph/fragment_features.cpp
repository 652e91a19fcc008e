#include "fragment_features.h"
#include "../../util/errors.h"

#include <cmath>

namespace cobin::binning {

namespace {

void validate_matrix(const FragmentMatrix& m, const std::vector<Contig>& contigs,
                     const std::string& name) {
    if (m.n_contigs() != static_cast<int>(contigs.size())) {
        throw InputError(name + " features cover " + std::to_string(m.n_contigs()) +
                         " contigs, expected " + std::to_string(contigs.size()));
    }
    if (m.offsets.front() != 0 || m.offsets.back() != m.rows.rows()) {
        throw InputError(name + " row offsets do not span the feature matrix");
    }
    if (!contigs.empty() && m.dim() == 0) {
        throw InputError(name + " features have zero dimensions");
    }
    for (size_t c = 0; c < contigs.size(); ++c) {
        int n = m.n_fragments(static_cast<int>(c));
        if (n <= 0) {
            throw InputError("Contig " + contigs[c].id + " has no " + name + " fragments");
        }
        if (n != contigs[c].n_fragments) {
            throw InputError("Contig " + contigs[c].id + ": " + std::to_string(n) + " " + name +
                             " fragments, expected " + std::to_string(contigs[c].n_fragments));
        }
    }
    if (!m.rows.allFinite()) {
        throw InputError(name + " features contain non-finite values");
    }
}

}  // namespace

void FragmentFeatures::validate() const {
    if (composition.offsets.empty() || coverage.offsets.empty()) {
        throw InputError("Fragment features are empty");
    }
    validate_matrix(composition, contigs, "composition");
    validate_matrix(coverage, contigs, "coverage");
}

RowMatrixXf FragmentFeatures::mean_profiles(FeatureSource s) const {
    const FragmentMatrix& m = source(s);
    RowMatrixXf profiles(m.n_contigs(), m.dim());
    for (int c = 0; c < m.n_contigs(); ++c) {
        int n = m.n_fragments(c);
        profiles.row(c) = m.rows.middleRows(m.offsets[c], n).colwise().mean();
    }
    return profiles;
}

RowMatrixXf FragmentFeatures::combined_profiles() const {
    RowMatrixXf comp = mean_profiles(FeatureSource::Composition);
    RowMatrixXf cov = mean_profiles(FeatureSource::Coverage);
    RowMatrixXf profiles(comp.rows(), comp.cols() + cov.cols());
    profiles << comp, cov;
    return profiles;
}

}  // namespace cobin::binning
