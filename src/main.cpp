// COBIN - COntig BINner
// Main entry point with git-style subcommand dispatch

#include <cobin/config.hpp>
#include <iostream>
#include <string>

// Forward declarations for subcommands
namespace cobin {
    int cmd_cluster(int argc, char** argv);
}

constexpr const char* CODENAME = "Contig binning from fragment-pair votes";

static void print_version() {
    std::cout << "cobin " << cobin::VERSION << "\n";
    std::cout << CODENAME << "\n";
}

static void print_usage(const char* prog) {
    std::cerr << "COBIN - COntig BINner\n";
    std::cerr << "Version: " << cobin::VERSION << "\n\n";
    std::cerr << "Usage: " << prog << " <command> [options]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  cluster          Build the contig graph and partition it into bins\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -h, --help     Show this help message\n";
    std::cerr << "  -v, --version  Show version information\n";
    std::cerr << "\n";
    std::cerr << "Examples:\n";
    std::cerr << "  cobin cluster --composition comp.tsv --coverage cov.tsv --output bins/\n";
    std::cerr << "\n";
    std::cerr << "For command-specific help, use: cobin <command> --help\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];

    if (cmd == "-h" || cmd == "--help") {
        print_usage(argv[0]);
        return 0;
    }

    if (cmd == "-v" || cmd == "--version") {
        print_version();
        return 0;
    }

    if (cmd == "cluster") {
        return cobin::cmd_cluster(argc - 1, argv + 1);
    } else {
        std::cerr << "Error: Unknown command '" << cmd << "'\n\n";
        print_usage(argv[0]);
        return 1;
    }
}
