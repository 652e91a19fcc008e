#include "vote_combiner.h"
#include "../../util/errors.h"

#include <sstream>

namespace cobin::binning {

namespace {

bool in_unit_range(float s) {
    return s >= 0.0f && s <= 1.0f;  // false for NaN
}

}  // namespace

WeightedMeanCombiner::WeightedMeanCombiner(float composition_weight)
    : weight_(composition_weight) {
    if (!(composition_weight >= 0.0f && composition_weight <= 1.0f)) {
        throw ConfigError("Composition weight must be in [0,1], got " +
                          std::to_string(composition_weight));
    }
}

std::unique_ptr<IVoteCombiner> make_vote_combiner(const std::string& name,
                                                  float composition_weight) {
    if (name == "conj") {
        return std::make_unique<ConjunctionCombiner>();
    }
    if (name == "mean") {
        return std::make_unique<WeightedMeanCombiner>(composition_weight);
    }
    throw ConfigError("Unknown vote combination rule '" + name + "' (expected conj or mean)");
}

EdgeScore aggregate_votes(const std::vector<PairScore>& scores,
                          const VoteCutoffs& cutoffs,
                          const IVoteCombiner& combiner) {
    EdgeScore edge;
    edge.n_comparisons = static_cast<int>(scores.size());
    if (scores.empty()) return edge;

    int comp_votes = 0;
    int cov_votes = 0;
    int both_votes = 0;

    for (const auto& s : scores) {
        if (!in_unit_range(s.composition) || !in_unit_range(s.coverage)) {
            std::ostringstream ss;
            ss << "Similarity score outside [0,1]: composition=" << s.composition
               << " coverage=" << s.coverage;
            throw InputError(ss.str());
        }
        bool comp = s.composition > cutoffs.composition;
        bool cov = s.coverage > cutoffs.coverage;
        comp_votes += comp;
        cov_votes += cov;
        both_votes += (comp && cov);
    }

    float n = static_cast<float>(scores.size());
    edge.composition = comp_votes / n;
    edge.coverage = cov_votes / n;
    edge.combined = combiner.combine(edge.composition, edge.coverage, both_votes / n);
    return edge;
}

}  // namespace cobin::binning
