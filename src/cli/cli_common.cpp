// COBIN - cli_common.cpp
// Common CLI infrastructure implementation

#include "cli_common.h"
#include <iostream>
#include <algorithm>
#include <iomanip>

namespace cobin {

void CLICommand::print_help() const {
    std::cerr << "Usage: cobin " << name << " [options]\n\n";
    std::cerr << description << "\n";

    for (const auto& line : description_extra) {
        std::cerr << line << "\n";
    }
    std::cerr << "\n";

    // Collect required and optional options
    std::vector<const CLIOption*> required_opts;
    std::vector<const CLIOption*> optional_opts;

    for (const auto& opt : options) {
        if (opt.required) {
            required_opts.push_back(&opt);
        } else {
            optional_opts.push_back(&opt);
        }
    }

    // Calculate column width based on longest option/output
    const size_t MIN_COL = 21;
    size_t opt_col = MIN_COL;
    size_t out_col = MIN_COL;

    for (const auto& opt : options) {
        size_t len = 2 + opt.name.length();
        if (!opt.arg_name.empty()) len += 1 + opt.arg_name.length();
        if (len + 1 > opt_col) opt_col = len + 1;
    }
    for (const auto& out : outputs) {
        size_t len = 2 + out.filename.length();
        if (len + 1 > out_col) out_col = len + 1;
    }

    // Print required section
    if (!required_opts.empty()) {
        std::cerr << "Required:\n";
        for (const auto* opt : required_opts) {
            std::string opt_str = "  " + opt->name;
            if (!opt->arg_name.empty()) {
                opt_str += " " + opt->arg_name;
            }
            while (opt_str.length() < opt_col) opt_str += " ";
            std::cerr << opt_str << opt->description << "\n";
        }
        std::cerr << "\n";
    }

    // Print options section
    std::cerr << "Options:\n";
    for (const auto* opt : optional_opts) {
        std::string opt_str = "  " + opt->name;
        if (!opt->arg_name.empty()) {
            opt_str += " " + opt->arg_name;
        }
        while (opt_str.length() < opt_col) opt_str += " ";

        std::string desc = opt->description;
        if (!opt->default_value.empty()) {
            desc += " (default: " + opt->default_value + ")";
        }
        std::cerr << opt_str << desc << "\n";
    }
    std::cerr << "\n";

    // Print output section
    if (!outputs.empty()) {
        std::cerr << "Output:\n";
        for (const auto& out : outputs) {
            std::string out_str = "  " + out.filename;
            while (out_str.length() < out_col) out_str += " ";
            std::string desc = out.description;
            if (!out.condition.empty()) {
                desc += " " + out.condition;
            }
            std::cerr << out_str << desc << "\n";
        }
        std::cerr << "\n";
    }

    // Print note section
    if (!note.empty()) {
        std::cerr << "Note:\n  " << note << "\n\n";
    }

    // Print examples
    if (!examples.empty()) {
        std::cerr << "Example:\n";
        for (const auto& ex : examples) {
            std::cerr << "  " << ex << "\n";
        }
    }
}

bool CLICommand::has_help_flag(int argc, char** argv) const {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            return true;
        }
    }
    return false;
}

std::vector<std::string> CLICommand::get_missing_required(int argc, char** argv) const {
    std::vector<std::string> missing;
    for (const auto& opt : options) {
        if (opt.required) {
            bool found = false;
            for (int i = 1; i < argc; ++i) {
                if (argv[i] == opt.name && i + 1 < argc) {
                    found = true;
                    break;
                }
            }
            if (!found) {
                missing.push_back(opt.name);
            }
        }
    }
    return missing;
}

bool CLICommand::validate_required(int argc, char** argv) const {
    auto missing = get_missing_required(argc, argv);
    if (missing.empty()) {
        return true;
    }

    std::cerr << "Error: Missing required arguments.\n";
    std::cerr << "Required:";
    for (size_t i = 0; i < missing.size(); ++i) {
        if (i > 0) std::cerr << ",";
        std::cerr << " " << missing[i];
    }
    std::cerr << "\n\n";
    print_help();
    return false;
}

namespace {

// "-v, --verbose" -> {"-v", "--verbose"}
std::vector<std::string> option_aliases(const std::string& name) {
    std::vector<std::string> aliases;
    size_t start = 0;
    while (start < name.size()) {
        size_t comma = name.find(',', start);
        std::string alias = name.substr(start, comma == std::string::npos ? std::string::npos
                                                                           : comma - start);
        alias.erase(0, alias.find_first_not_of(' '));
        if (!alias.empty()) aliases.push_back(alias);
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return aliases;
}

}  // namespace

std::vector<std::string> CLICommand::get_unknown(int argc, char** argv) const {
    std::vector<std::string> unknown;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const CLIOption* match = nullptr;
        for (const auto& opt : options) {
            for (const auto& alias : option_aliases(opt.name)) {
                if (alias == arg) match = &opt;
            }
        }
        if (match == nullptr) {
            unknown.push_back(arg);
        } else if (!match->arg_name.empty()) {
            ++i;  // skip the value
        }
    }
    return unknown;
}

// Command definitions

CLICommand make_cluster_command() {
    CLICommand cmd;
    cmd.name = "cluster";
    cmd.description = "Bin contigs from latent fragment representations.";
    cmd.description_extra = {
        "",
        "Builds a contig similarity graph from fragment-pair votes on composition and",
        "coverage, then partitions it with a coarse and a refining Leiden pass.",
    };

    cmd.options = {
        {"--composition", "FILE", "Latent composition TSV (contig, fragment, dims...)", "", true},
        {"--coverage", "FILE", "Latent coverage TSV (same layout)", "", true},
        {"--output", "DIR", "Output directory", "", true},
        {"--lengths", "FILE", "Contig lengths TSV (contig, length)"},
        {"--singletons", "FILE", "Contigs excluded from clustering, reported as singleton bins"},
        {"--model", "FILE", "TorchScript pairwise model (required with --scorer model)"},
        {"--scorer", "X", "Fragment-pair scorer: model or kernel", "model"},
        {"--n-frags", "N", "Fragments compared per contig", "30"},
        {"--max-neighbors", "N", "Candidate neighbors per contig", "100"},
        {"--theta", "F", "Min combined vote fraction for an edge (0-1)", "0.8"},
        {"--vote-threshold", "F", "Per-feature score cutoff for a vote (0-1)", "0.5"},
        {"--combine", "X", "Vote combination: conj or mean", "conj"},
        {"--mean-weight", "F", "Composition weight for --combine mean", "0.5"},
        {"--knn-combined", "", "Candidate search on composition+coverage means (default: coverage)"},
        {"--bandwidth", "F", "Latent kernel bandwidth (--scorer kernel)", "1.0"},
        {"--gamma1", "F", "Coarse clustering resolution", "0.1"},
        {"--gamma2", "F", "Refinement resolution", "0.75"},
        {"--rescore-max", "N", "Rescore all intra-bin pairs for coarse bins up to N contigs (0=off)", "0"},
        {"--max-iterations", "N", "Leiden iterations per subgraph (-1 = until stable)", "50"},
        {"--max-seconds", "F", "Leiden wall-clock budget per subgraph (0 = none)", "60"},
        {"--seed", "N", "Random seed", "42"},
        {"--threads", "N", "Number of threads", "1"},
        {"--write-graph", "", "Write the similarity graph"},
        {"-v, --verbose", "", "Enable verbose output"},
        {"-h, --help", "", "Show this help message"},
    };

    cmd.outputs = {
        {"assignments.tsv", "Contig to bin assignments"},
        {"graph.tsv", "Similarity graph edges", "(with --write-graph)"},
        {"cobin.log", "Detailed trace log"},
    };

    cmd.note = "Singleton bins are reported; filter them downstream if needed.";

    cmd.examples = {
        "cobin cluster --composition comp.tsv --coverage cov.tsv --model pair_model.pt --output out/",
        "cobin cluster --composition comp.tsv --coverage cov.tsv --model pair_model.pt --output out/ --threads 16 --gamma2 1.0",
        "cobin cluster --composition comp.tsv --coverage cov.tsv --scorer kernel --bandwidth 0.5 --output out/",
    };

    return cmd;
}

}  // namespace cobin
