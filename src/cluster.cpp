// COBIN - cluster.cpp
// 'cobin cluster': load latent representations, build the graph, partition, write bins

#include <cobin/config.hpp>

#include "binning/binning_pipeline.h"
#include "binning/graph/pair_scorer.h"
#include "binning/graph/torch_pair_scorer.h"
#include "binning/graph/vote_combiner.h"
#include "binning/io/repr_io.h"
#include "util/errors.h"
#include "util/logger.h"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cobin {

namespace {

void log_parameters(Logger& log, const ClusterConfig& config) {
    log.section("Parameters");
    log.metric("composition", config.composition_path);
    log.metric("coverage", config.coverage_path);
    log.metric("n_frags", config.n_frags);
    log.metric("max_neighbors", config.max_neighbors);
    log.metric("theta", config.hits_threshold);
    log.metric("vote_threshold", config.vote_threshold);
    log.metric("combine", config.combine);
    log.metric("scorer", config.scorer);
    if (config.scorer == "model") {
        log.metric("model", config.model_path);
    } else {
        log.metric("bandwidth", config.bandwidth);
    }
    log.metric("gamma1", config.gamma1);
    log.metric("gamma2", config.gamma2);
    log.metric("rescore_max", config.rescore_max);
    log.metric("max_iterations", config.max_iterations);
    log.metric("max_seconds", config.max_seconds, 1);
    log.metric("seed", config.random_seed);
    log.metric("threads", config.threads);
}

void check_scorer_config(const ClusterConfig& config) {
    if (config.scorer == "model") {
        if (config.model_path.empty()) {
            throw ConfigError("--scorer model needs --model FILE");
        }
#ifndef COBIN_USE_TORCH
        throw ConfigError("--scorer model needs a build with LibTorch (-DCOBIN_USE_TORCH=ON); "
                          "use --scorer kernel otherwise");
#endif
    } else if (config.scorer == "kernel") {
        if (!(config.bandwidth > 0.0f)) {
            throw ConfigError("bandwidth must be > 0, got " + std::to_string(config.bandwidth));
        }
    } else {
        throw ConfigError("Unknown scorer '" + config.scorer + "' (expected model or kernel)");
    }
}

// features must outlive the scorer
std::unique_ptr<binning::IPairScorer> make_pair_scorer(const ClusterConfig& config,
                                                       const binning::FragmentFeatures& features,
                                                       Logger& log) {
#ifdef COBIN_USE_TORCH
    if (config.scorer == "model") {
        log.info("Loading pairwise model " + config.model_path);
        return std::make_unique<binning::TorchPairScorer>(config.model_path, features);
    }
#endif
    log.warn("Scoring fragment pairs with the latent kernel, not a trained model");
    return std::make_unique<binning::LatentKernelScorer>(features, config.bandwidth);
}

}  // namespace

int run_cluster(const ClusterConfig& config) {
    Logger log("cluster", VERSION);
    log.set_verbose(config.verbose);

    try {
        // Parameters first: nothing is read or written on a bad configuration
        binning::PipelineParams params = binning::pipeline_params(config);
        auto combiner = binning::make_vote_combiner(config.combine, config.mean_weight);
        check_scorer_config(config);

        std::filesystem::create_directories(config.output_dir);
        const std::filesystem::path out_dir(config.output_dir);
        if (!log.open_trace((out_dir / "cobin.log").string())) {
            log.warn("Cannot create trace log in " + config.output_dir);
        }

        log.info("COBIN cluster v" + std::string(VERSION));
        log_parameters(log, config);

        std::unordered_map<std::string, int64_t> lengths;
        if (!config.lengths_path.empty()) {
            lengths = binning::load_contig_lengths(config.lengths_path);
            log.detail("Loaded " + std::to_string(lengths.size()) + " contig lengths");
        }

        log.info("Loading latent representations");
        binning::FragmentFeatures features = binning::load_fragment_features(
            config.composition_path, config.coverage_path, lengths);
        log.info("Loaded " + std::to_string(features.contigs.size()) + " contigs (" +
                 std::to_string(features.composition.rows.rows()) + " fragments, dims " +
                 std::to_string(features.composition.dim()) + "/" +
                 std::to_string(features.coverage.dim()) + ")");

        std::vector<binning::Contig> singletons;
        if (!config.singletons_path.empty()) {
            for (const auto& id : binning::load_contig_list(config.singletons_path)) {
                auto it = lengths.find(id);
                singletons.emplace_back(id, it != lengths.end() ? it->second : 0, 0);
            }
            log.info("Reporting " + std::to_string(singletons.size()) +
                     " excluded contigs as singleton bins");
        }

        std::unique_ptr<binning::IPairScorer> scorer = make_pair_scorer(config, features, log);
        binning::RowMatrixXf profiles = config.profile_combined
            ? features.combined_profiles()
            : features.mean_profiles(binning::FeatureSource::Coverage);

        binning::BinningPipeline pipeline(params, std::move(combiner), &log);
        binning::BinningResult result = pipeline.run(features.contigs, profiles, *scorer,
                                                     nullptr, singletons);

        const std::string assignments_path = (out_dir / "assignments.tsv").string();
        binning::write_assignments(assignments_path, result.bins);
        log.info("Wrote " + assignments_path);

        if (config.write_graph) {
            const std::string graph_path = (out_dir / "graph.tsv").string();
            binning::write_graph_tsv(graph_path, result.graph, features.contigs);
            log.info("Wrote " + graph_path);
        }

        if (result.partition.degraded) {
            log.warn("Result is degraded; see cobin.log for details");
        }
    } catch (const std::exception& e) {
        log.error(e.what());
        return 1;
    }

    return 0;
}

}  // namespace cobin
