// COBIN - Centralized Configuration Structures
// All module configs in one place for consistency
#ifndef COBIN_CONFIG_HPP
#define COBIN_CONFIG_HPP

#include <string>
#include "cobin/version.h"

namespace cobin {

// Global version for all cobin tools (set by cmake from git describe)
constexpr const char* VERSION = COBIN_VERSION_STRING;

// Defaults shared by the CLI and the binning engine
constexpr int DEFAULT_N_FRAGS = 30;
constexpr int DEFAULT_MAX_NEIGHBORS = 100;
constexpr float DEFAULT_HITS_THRESHOLD = 0.8f;
constexpr float DEFAULT_VOTE_THRESHOLD = 0.5f;
constexpr float DEFAULT_GAMMA1 = 0.1f;
constexpr float DEFAULT_GAMMA2 = 0.75f;

// Clustering configuration (cobin cluster)
struct ClusterConfig {
    std::string composition_path;
    std::string coverage_path;
    std::string lengths_path;
    std::string singletons_path;
    std::string output_dir;
    std::string model_path;             // TorchScript pairwise model

    int threads = 1;

    // Graph construction
    int n_frags = DEFAULT_N_FRAGS;
    int max_neighbors = DEFAULT_MAX_NEIGHBORS;
    int max_fragment_pairs = 2500;
    float hits_threshold = DEFAULT_HITS_THRESHOLD;
    float vote_threshold = DEFAULT_VOTE_THRESHOLD;
    std::string combine = "conj";       // conj | mean
    float mean_weight = 0.5f;           // composition weight for "mean"
    std::string scorer = "model";       // model | kernel
    float bandwidth = 1.0f;             // latent kernel bandwidth (--scorer kernel)
    bool profile_combined = false;      // kNN prefilter on composition+coverage means

    // Partitioning
    float gamma1 = DEFAULT_GAMMA1;
    float gamma2 = DEFAULT_GAMMA2;
    int max_iterations = 50;
    double max_seconds = 60.0;
    int rescore_max = 0;                // 0 = refine on induced subgraph only
    int random_seed = 42;

    bool write_graph = false;
    bool verbose = false;
};

}  // namespace cobin

#endif  // COBIN_CONFIG_HPP
