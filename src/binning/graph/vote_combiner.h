#pragma once

#include "pair_scorer.h"

#include <memory>
#include <string>
#include <vector>

namespace cobin::binning {

// A fragment pair votes for a feature source when its score exceeds the cutoff
struct VoteCutoffs {
    float composition = 0.5f;
    float coverage = 0.5f;
};

// Contig-level edge score aggregated from fragment-pair votes
struct EdgeScore {
    float composition = 0.0f;   // fraction of composition votes
    float coverage = 0.0f;      // fraction of coverage votes
    float combined = 0.0f;      // value compared against hits_threshold
    int n_comparisons = 0;
};

// Policy merging the per-source vote fractions into one confidence value
class IVoteCombiner {
public:
    virtual ~IVoteCombiner() = default;

    // both: fraction of fragment pairs voting for both sources at once
    virtual float combine(float composition, float coverage, float both) const = 0;

    virtual std::string name() const = 0;
};

// Both sources must agree on the same fragment pair
class ConjunctionCombiner : public IVoteCombiner {
public:
    float combine(float, float, float both) const override { return both; }
    std::string name() const override { return "conj"; }
};

class WeightedMeanCombiner : public IVoteCombiner {
public:
    explicit WeightedMeanCombiner(float composition_weight = 0.5f);

    float combine(float composition, float coverage, float) const override {
        return weight_ * composition + (1.0f - weight_) * coverage;
    }
    std::string name() const override { return "mean"; }

private:
    float weight_;
};

// "conj" or "mean"; throws ConfigError for anything else
std::unique_ptr<IVoteCombiner> make_vote_combiner(const std::string& name,
                                                  float composition_weight = 0.5f);

// Throws InputError if a score lies outside [0,1] or is NaN
EdgeScore aggregate_votes(const std::vector<PairScore>& scores,
                          const VoteCutoffs& cutoffs,
                          const IVoteCombiner& combiner);

}  // namespace cobin::binning
