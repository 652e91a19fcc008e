#ifdef COBIN_USE_TORCH

#include "torch_pair_scorer.h"
#include "../../util/errors.h"

#include <stdexcept>

namespace cobin::binning {

namespace {

torch::Tensor as_probabilities(const torch::IValue& value, int64_t n, const char* name) {
    torch::Tensor t = value.toTensor().reshape({-1}).to(torch::kCPU, torch::kFloat32).contiguous();
    if (t.numel() != n) {
        throw std::runtime_error(std::string("model returned ") + std::to_string(t.numel()) +
                                 " " + name + " scores for " + std::to_string(n) + " pairs");
    }
    return t;
}

}  // namespace

TorchPairScorer::TorchPairScorer(const std::string& model_path, const FragmentFeatures& features)
    : model_path_(model_path), features_(features) {
    try {
        module_ = torch::jit::load(model_path, torch::kCPU);
    } catch (const c10::Error& e) {
        throw InputError("Cannot load TorchScript model " + model_path + ": " + e.what_without_backtrace());
    }
    module_.eval();
}

torch::Tensor TorchPairScorer::gather(const FragmentMatrix& m,
                                      const std::vector<FragmentPair>& pairs,
                                      bool first) const {
    const int64_t n = static_cast<int64_t>(pairs.size());
    const int64_t dim = m.dim();
    torch::Tensor t = torch::empty({n, dim}, torch::kFloat32);
    float* dst = t.data_ptr<float>();
    for (int64_t i = 0; i < n; ++i) {
        const FragmentKey& key = first ? pairs[i].first : pairs[i].second;
        Eigen::Map<Eigen::VectorXf>(dst + i * dim, dim) = m.row(key);
    }
    return t;
}

void TorchPairScorer::score_batch(const std::vector<FragmentPair>& pairs,
                                  std::vector<PairScore>& out) const {
    out.resize(pairs.size());
    if (pairs.empty()) return;

    torch::NoGradGuard no_grad;
    const int64_t n = static_cast<int64_t>(pairs.size());

    std::vector<torch::jit::IValue> inputs;
    inputs.reserve(4);
    inputs.emplace_back(gather(features_.composition, pairs, true));
    inputs.emplace_back(gather(features_.composition, pairs, false));
    inputs.emplace_back(gather(features_.coverage, pairs, true));
    inputs.emplace_back(gather(features_.coverage, pairs, false));

    torch::jit::IValue result = module_.forward(inputs);

    torch::Tensor comp;
    torch::Tensor cov;
    if (result.isTuple()) {
        const auto& elems = result.toTuple()->elements();
        if (elems.size() != 2) {
            throw std::runtime_error("model returned a tuple of " + std::to_string(elems.size()) +
                                     ", expected (composition, coverage)");
        }
        comp = as_probabilities(elems[0], n, "composition");
        cov = as_probabilities(elems[1], n, "coverage");
    } else if (result.isGenericDict()) {
        auto dict = result.toGenericDict();
        comp = as_probabilities(dict.at("composition"), n, "composition");
        cov = as_probabilities(dict.at("coverage"), n, "coverage");
    } else {
        throw std::runtime_error("model output must be a (composition, coverage) tuple or dict");
    }

    auto comp_acc = comp.accessor<float, 1>();
    auto cov_acc = cov.accessor<float, 1>();
    for (int64_t i = 0; i < n; ++i) {
        out[i] = PairScore(comp_acc[i], cov_acc[i]);
    }
}

PairScore TorchPairScorer::score(const FragmentKey& a, const FragmentKey& b) const {
    std::vector<PairScore> out;
    score_batch({FragmentPair(a, b)}, out);
    return out[0];
}

}  // namespace cobin::binning

#endif  // COBIN_USE_TORCH
