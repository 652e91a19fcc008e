// Fragment-pair scorer backed by a trained TorchScript pairwise model
#pragma once

#ifdef COBIN_USE_TORCH

#include "pair_scorer.h"

#include <torch/script.h>

#include <string>
#include <vector>

namespace cobin::binning {

// The model is called as
//   forward(comp_a, comp_b, cov_a, cov_b)
// with four (N x dim) float tensors holding the latent vectors of both
// fragments of N pairs, and returns either a (composition, coverage) tuple
// or a {"composition", "coverage"} dict of N probabilities each.
// Values outside [0,1] are rejected later by vote aggregation.
class TorchPairScorer : public IPairScorer {
public:
    // Throws InputError if the model cannot be loaded
    TorchPairScorer(const std::string& model_path, const FragmentFeatures& features);

    PairScore score(const FragmentKey& a, const FragmentKey& b) const override;

    // One forward call per batch; throws std::runtime_error (or c10::Error)
    // when the model output does not have the expected shape
    void score_batch(const std::vector<FragmentPair>& pairs,
                     std::vector<PairScore>& out) const override;

    const std::string& model_path() const { return model_path_; }

private:
    torch::Tensor gather(const FragmentMatrix& m, const std::vector<FragmentPair>& pairs,
                         bool first) const;

    std::string model_path_;
    const FragmentFeatures& features_;
    mutable torch::jit::script::Module module_;
};

}  // namespace cobin::binning

#endif  // COBIN_USE_TORCH
