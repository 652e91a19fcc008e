#pragma once

#include "../assembly/bin_assembler.h"
#include "../graph/fragment_features.h"
#include "../graph/similarity_graph.h"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace cobin::binning {

// One latent representation file: contig\tfragment\tdim0\tdim1...
// Rows of a contig are contiguous with fragment indices 0,1,2,...
// An optional header line (non-numeric second column) is skipped.
struct FragmentTable {
    std::vector<std::string> contig_ids;
    FragmentMatrix matrix;
};

// Throws InputError on unreadable or malformed files
FragmentTable load_fragment_tsv(const std::string& path);

// contig\tlength per line
std::unordered_map<std::string, int64_t> load_contig_lengths(const std::string& path);

// One contig id per line (first column)
std::vector<std::string> load_contig_list(const std::string& path);

// Joins composition and coverage tables into FragmentFeatures. Both must list
// the same contigs in the same order with equal fragment counts. Contigs
// missing from lengths get length 0.
FragmentFeatures load_fragment_features(const std::string& composition_path,
                                        const std::string& coverage_path,
                                        const std::unordered_map<std::string, int64_t>& lengths);

// contig\tbin, one row per binned contig; throws std::runtime_error if unwritable
void write_assignments(const std::string& path, const std::vector<Bin>& bins);

// contig_a\tcontig_b\tweight
void write_graph_tsv(const std::string& path, const SimilarityGraph& graph,
                     const std::vector<Contig>& contigs);

}  // namespace cobin::binning
