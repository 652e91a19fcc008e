#include "pair_scorer.h"
#include "../../util/errors.h"

#include <cmath>

namespace cobin::binning {

void IPairScorer::score_batch(const std::vector<FragmentPair>& pairs,
                              std::vector<PairScore>& out) const {
    out.resize(pairs.size());
    for (size_t i = 0; i < pairs.size(); ++i) {
        out[i] = score(pairs[i].first, pairs[i].second);
    }
}

LatentKernelScorer::LatentKernelScorer(const FragmentFeatures& features, float bandwidth)
    : features_(features), bandwidth_(bandwidth) {
    if (!(bandwidth > 0.0f)) {
        throw ConfigError("Scorer bandwidth must be > 0, got " + std::to_string(bandwidth));
    }
}

float LatentKernelScorer::kernel(const FragmentMatrix& m,
                                 const FragmentKey& a,
                                 const FragmentKey& b) const {
    float d2 = (m.row(a) - m.row(b)).squaredNorm();
    return std::exp(-d2 / bandwidth_);
}

PairScore LatentKernelScorer::score(const FragmentKey& a, const FragmentKey& b) const {
    return PairScore(kernel(features_.composition, a, b),
                     kernel(features_.coverage, a, b));
}

}  // namespace cobin::binning
