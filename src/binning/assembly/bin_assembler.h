#pragma once

#include "../clustering/two_stage_partitioner.h"
#include "../graph/fragment_features.h"

#include <cstdint>
#include <string>
#include <vector>

namespace cobin::binning {

struct Bin {
    int label = 0;
    std::vector<int> members;       // contig indices, ascending; empty for extra singletons
    std::vector<std::string> ids;   // contig ids in member order
    int64_t total_length = 0;

    size_t size() const { return ids.size(); }
};

struct BinSummary {
    int n_bins = 0;
    int n_singletons = 0;
    size_t largest = 0;
    int64_t total_length = 0;
};

// Partition -> bins. Singleton bins are kept.
class BinAssembler {
public:
    // Bins sorted by label. extra_singletons (contigs excluded before
    // clustering) follow as one bin each with labels continuing after
    // the last partition label. Throws InputError if the partition does not
    // cover the contigs or an extra singleton repeats a clustered id.
    std::vector<Bin> assemble(const Partition& partition,
                              const std::vector<Contig>& contigs,
                              const std::vector<Contig>& extra_singletons = {}) const;

    static BinSummary summarize(const std::vector<Bin>& bins);
};

}  // namespace cobin::binning
