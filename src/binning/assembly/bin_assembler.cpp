#include "bin_assembler.h"
#include "../../util/errors.h"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace cobin::binning {

std::vector<Bin> BinAssembler::assemble(const Partition& partition,
                                        const std::vector<Contig>& contigs,
                                        const std::vector<Contig>& extra_singletons) const {
    if (partition.labels.size() != contigs.size()) {
        throw InputError("Partition covers " + std::to_string(partition.labels.size()) +
                         " contigs, expected " + std::to_string(contigs.size()));
    }

    int max_label = -1;
    for (int label : partition.labels) {
        if (label < 0) throw InputError("Partition contains a negative label");
        max_label = std::max(max_label, label);
    }

    std::vector<std::vector<int>> groups(max_label + 1);
    for (size_t i = 0; i < partition.labels.size(); ++i) {
        groups[partition.labels[i]].push_back(static_cast<int>(i));
    }

    std::vector<Bin> bins;
    bins.reserve(groups.size() + extra_singletons.size());
    for (int label = 0; label <= max_label; ++label) {
        if (groups[label].empty()) continue;
        Bin bin;
        bin.label = label;
        bin.members = std::move(groups[label]);
        for (int idx : bin.members) {
            bin.ids.push_back(contigs[idx].id);
            bin.total_length += contigs[idx].length;
        }
        bins.push_back(std::move(bin));
    }

    std::unordered_set<std::string> seen;
    for (const auto& c : contigs) seen.insert(c.id);

    int next_label = max_label + 1;
    for (const auto& c : extra_singletons) {
        if (!seen.insert(c.id).second) {
            throw InputError("Singleton contig " + c.id + " is also listed for clustering");
        }
        Bin bin;
        bin.label = next_label++;
        bin.ids.push_back(c.id);
        bin.total_length = c.length;
        bins.push_back(std::move(bin));
    }

    return bins;
}

BinSummary BinAssembler::summarize(const std::vector<Bin>& bins) {
    BinSummary s;
    s.n_bins = static_cast<int>(bins.size());
    for (const auto& bin : bins) {
        if (bin.size() == 1) ++s.n_singletons;
        s.largest = std::max(s.largest, bin.size());
        s.total_length += bin.total_length;
    }
    return s;
}

}  // namespace cobin::binning
