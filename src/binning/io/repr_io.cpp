// Latent representation loading and result writing (TSV)

#include "repr_io.h"
#include "../../util/errors.h"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace cobin::binning {

namespace {

// Header: second column is not a number
bool is_header(const std::string& line) {
    std::istringstream iss(line);
    std::string first;
    double second;
    iss >> first;
    return !(iss >> second);
}

std::string where(const std::string& path, int line_no) {
    return path + ":" + std::to_string(line_no);
}

}  // namespace

FragmentTable load_fragment_tsv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw InputError("Cannot open representation file: " + path);
    }

    FragmentTable table;
    std::vector<std::vector<float>> rows;
    std::vector<int> offsets;
    int dim = -1;
    int expected_fragment = 0;

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        if (line_no == 1 && is_header(line)) continue;

        std::istringstream iss(line);
        std::string name;
        int fragment = -1;
        if (!(iss >> name >> fragment)) {
            throw InputError(where(path, line_no) + ": expected contig and fragment index");
        }

        std::vector<float> values;
        float val;
        while (iss >> val) values.push_back(val);
        if (!iss.eof()) {
            throw InputError(where(path, line_no) + ": non-numeric feature value");
        }
        if (values.empty()) {
            throw InputError(where(path, line_no) + ": no feature values");
        }
        if (dim < 0) {
            dim = static_cast<int>(values.size());
        } else if (static_cast<int>(values.size()) != dim) {
            throw InputError(where(path, line_no) + ": " + std::to_string(values.size()) +
                             " values, expected " + std::to_string(dim));
        }

        if (table.contig_ids.empty() || table.contig_ids.back() != name) {
            table.contig_ids.push_back(name);
            offsets.push_back(static_cast<int>(rows.size()));
            expected_fragment = 0;
        }
        if (fragment != expected_fragment) {
            throw InputError(where(path, line_no) + ": contig " + name + " fragment " +
                             std::to_string(fragment) + " out of order (expected " +
                             std::to_string(expected_fragment) + ")");
        }
        ++expected_fragment;
        rows.push_back(std::move(values));
    }
    offsets.push_back(static_cast<int>(rows.size()));

    if (rows.empty()) {
        throw InputError("No fragments in " + path);
    }

    // Contig rows must be contiguous
    std::unordered_map<std::string, int> seen;
    for (const auto& id : table.contig_ids) {
        if (++seen[id] > 1) {
            throw InputError(path + ": fragments of contig " + id + " are not contiguous");
        }
    }

    table.matrix.rows.resize(static_cast<Eigen::Index>(rows.size()), dim);
    for (size_t r = 0; r < rows.size(); ++r) {
        for (int d = 0; d < dim; ++d) {
            table.matrix.rows(static_cast<Eigen::Index>(r), d) = rows[r][d];
        }
    }
    table.matrix.offsets = std::move(offsets);
    return table;
}

std::unordered_map<std::string, int64_t> load_contig_lengths(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw InputError("Cannot open lengths file: " + path);
    }

    std::unordered_map<std::string, int64_t> lengths;
    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (line.empty()) continue;
        if (line_no == 1 && is_header(line)) continue;

        std::istringstream iss(line);
        std::string name;
        long long len = -1;
        if (!(iss >> name >> len) || len < 0) {
            throw InputError(where(path, line_no) + ": expected contig and non-negative length");
        }
        lengths[name] = static_cast<int64_t>(len);
    }
    return lengths;
}

std::vector<std::string> load_contig_list(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw InputError("Cannot open contig list: " + path);
    }

    std::vector<std::string> ids;
    std::string line;
    while (std::getline(file, line)) {
        std::istringstream iss(line);
        std::string name;
        if (iss >> name) ids.push_back(name);
    }
    return ids;
}

FragmentFeatures load_fragment_features(const std::string& composition_path,
                                        const std::string& coverage_path,
                                        const std::unordered_map<std::string, int64_t>& lengths) {
    FragmentTable comp = load_fragment_tsv(composition_path);
    FragmentTable cov = load_fragment_tsv(coverage_path);

    if (comp.contig_ids != cov.contig_ids) {
        throw InputError("Composition and coverage files list different contigs (" +
                         std::to_string(comp.contig_ids.size()) + " vs " +
                         std::to_string(cov.contig_ids.size()) + ")");
    }

    FragmentFeatures features;
    features.contigs.reserve(comp.contig_ids.size());
    for (size_t c = 0; c < comp.contig_ids.size(); ++c) {
        const std::string& id = comp.contig_ids[c];
        auto it = lengths.find(id);
        int64_t length = it != lengths.end() ? it->second : 0;
        features.contigs.emplace_back(id, length, comp.matrix.n_fragments(static_cast<int>(c)));
    }
    features.composition = std::move(comp.matrix);
    features.coverage = std::move(cov.matrix);
    features.validate();
    return features;
}

void write_assignments(const std::string& path, const std::vector<Bin>& bins) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot write " + path);
    }
    out << "contig\tbin\n";
    for (const auto& bin : bins) {
        for (const auto& id : bin.ids) {
            out << id << "\t" << bin.label << "\n";
        }
    }
}

void write_graph_tsv(const std::string& path, const SimilarityGraph& graph,
                     const std::vector<Contig>& contigs) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot write " + path);
    }
    out << "contig_a\tcontig_b\tweight\n";
    for (const auto& e : graph.edges()) {
        out << contigs[e.u].id << "\t" << contigs[e.v].id << "\t"
            << std::fixed << std::setprecision(4) << e.w << "\n";
    }
}

}  // namespace cobin::binning
