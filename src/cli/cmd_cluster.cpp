// COBIN - cmd_cluster.cpp
// CLI handler for the 'cluster' subcommand

#include "cli_common.h"
#include <cobin/config.hpp>
#include <iostream>
#include <stdexcept>
#include <string>

namespace cobin {

extern int run_cluster(const ClusterConfig& config);

namespace {

ClusterConfig parse_cluster_args(int argc, char** argv) {
    ClusterConfig config;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--composition" && i + 1 < argc) {
            config.composition_path = argv[++i];
        }
        else if (arg == "--coverage" && i + 1 < argc) {
            config.coverage_path = argv[++i];
        }
        else if (arg == "--lengths" && i + 1 < argc) {
            config.lengths_path = argv[++i];
        }
        else if (arg == "--singletons" && i + 1 < argc) {
            config.singletons_path = argv[++i];
        }
        else if (arg == "--model" && i + 1 < argc) {
            config.model_path = argv[++i];
        }
        else if (arg == "--scorer" && i + 1 < argc) {
            config.scorer = argv[++i];
        }
        else if (arg == "--output" && i + 1 < argc) {
            config.output_dir = argv[++i];
        }
        else if (arg == "--n-frags" && i + 1 < argc) {
            config.n_frags = std::stoi(argv[++i]);
        }
        else if (arg == "--max-neighbors" && i + 1 < argc) {
            config.max_neighbors = std::stoi(argv[++i]);
        }
        else if (arg == "--theta" && i + 1 < argc) {
            config.hits_threshold = std::stof(argv[++i]);
        }
        else if (arg == "--vote-threshold" && i + 1 < argc) {
            config.vote_threshold = std::stof(argv[++i]);
        }
        else if (arg == "--combine" && i + 1 < argc) {
            config.combine = argv[++i];
        }
        else if (arg == "--mean-weight" && i + 1 < argc) {
            config.mean_weight = std::stof(argv[++i]);
        }
        else if (arg == "--bandwidth" && i + 1 < argc) {
            config.bandwidth = std::stof(argv[++i]);
        }
        else if (arg == "--gamma1" && i + 1 < argc) {
            config.gamma1 = std::stof(argv[++i]);
        }
        else if (arg == "--gamma2" && i + 1 < argc) {
            config.gamma2 = std::stof(argv[++i]);
        }
        else if (arg == "--rescore-max" && i + 1 < argc) {
            config.rescore_max = std::stoi(argv[++i]);
        }
        else if (arg == "--max-iterations" && i + 1 < argc) {
            config.max_iterations = std::stoi(argv[++i]);
        }
        else if (arg == "--max-seconds" && i + 1 < argc) {
            config.max_seconds = std::stod(argv[++i]);
        }
        else if (arg == "--seed" && i + 1 < argc) {
            config.random_seed = std::stoi(argv[++i]);
        }
        else if (arg == "--threads" && i + 1 < argc) {
            config.threads = std::stoi(argv[++i]);
        }
        else if (arg == "--knn-combined") {
            config.profile_combined = true;
        }
        else if (arg == "--write-graph") {
            config.write_graph = true;
        }
        else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        }
    }

    return config;
}

}  // namespace

int cmd_cluster(int argc, char** argv) {
    CLICommand cmd = make_cluster_command();

    if (cmd.has_help_flag(argc, argv)) {
        cmd.print_help();
        return 0;
    }

    if (!cmd.validate_required(argc, argv)) {
        return 1;
    }

    auto unknown = cmd.get_unknown(argc, argv);
    if (!unknown.empty()) {
        std::cerr << "Error: Unknown argument '" << unknown.front() << "'\n\n";
        cmd.print_help();
        return 1;
    }

    ClusterConfig config;
    try {
        config = parse_cluster_args(argc, argv);
    } catch (const std::exception& e) {
        // std::stoi / std::stof on a malformed number
        std::cerr << "Error: Invalid numeric argument (" << e.what() << ")\n";
        return 1;
    }

    return run_cluster(config);
}

}  // namespace cobin
