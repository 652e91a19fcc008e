#pragma once

#include "fragment_features.h"

#include <utility>
#include <vector>

namespace cobin::binning {

// Similarity of two fragments, one value per feature source, each in [0,1]
struct PairScore {
    float composition = 0.0f;
    float coverage = 0.0f;

    PairScore() = default;
    PairScore(float comp, float cov) : composition(comp), coverage(cov) {}
};

using FragmentPair = std::pair<FragmentKey, FragmentKey>;

// Model boundary: scores fragment pairs. Implementations must be safe for
// concurrent calls from several scoring tasks; they may throw to signal a
// failure for the pair being scored.
class IPairScorer {
public:
    virtual ~IPairScorer() = default;

    virtual PairScore score(const FragmentKey& a, const FragmentKey& b) const = 0;

    // Batched form; out is resized to pairs.size()
    virtual void score_batch(const std::vector<FragmentPair>& pairs,
                             std::vector<PairScore>& out) const;
};

// Gaussian kernel on latent fragment vectors:
//   s = exp(-||x_a - x_b||^2 / bandwidth)
class LatentKernelScorer : public IPairScorer {
public:
    LatentKernelScorer(const FragmentFeatures& features, float bandwidth = 1.0f);

    PairScore score(const FragmentKey& a, const FragmentKey& b) const override;

    float bandwidth() const { return bandwidth_; }

private:
    float kernel(const FragmentMatrix& m, const FragmentKey& a, const FragmentKey& b) const;

    const FragmentFeatures& features_;
    float bandwidth_;
};

}  // namespace cobin::binning
