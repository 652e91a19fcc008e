#include "boost/test/unit_test.hpp"

#include "binning/clustering/two_stage_partitioner.h"
#include "util/errors.h"

#include <memory>
#include <stdexcept>

using namespace cobin;
using namespace cobin::binning;


BOOST_AUTO_TEST_SUITE( two_stage_partitioner )


// Two triangles joined by one weak edge (nodes offset..offset+5)
static void add_bridged_triangles(std::vector<WeightedEdge>& edges, int offset)
{
    const int t[2][3] = {{0, 1, 2}, {3, 4, 5}};
    for (const auto& tri : t) {
        edges.emplace_back(offset + tri[0], offset + tri[1], 1.0f);
        edges.emplace_back(offset + tri[0], offset + tri[2], 1.0f);
        edges.emplace_back(offset + tri[1], offset + tri[2], 1.0f);
    }
    edges.emplace_back(offset + 2, offset + 3, 0.1f);
}

// Two pairs joined by one weak edge (nodes offset..offset+3)
static void add_bridged_pairs(std::vector<WeightedEdge>& edges, int offset)
{
    edges.emplace_back(offset + 0, offset + 1, 1.0f);
    edges.emplace_back(offset + 2, offset + 3, 1.0f);
    edges.emplace_back(offset + 1, offset + 2, 0.1f);
}

static PartitionParams low_high_params()
{
    PartitionParams params;
    params.gamma1 = 0.01f;
    params.gamma2 = 0.75f;
    return params;
}

// Throws for subgraphs of a given size at a given resolution
class FailingBackend : public ILeidenBackend {
public:
    FailingBackend(int fail_size, float fail_resolution)
        : fail_size_(fail_size), fail_resolution_(fail_resolution) {}

    ClusteringResult cluster(const std::vector<WeightedEdge>& edges, int n_nodes,
                             const LeidenConfig& config) override {
        if (n_nodes == fail_size_ && config.resolution == fail_resolution_) {
            throw std::runtime_error("injected failure");
        }
        return inner_.cluster(edges, n_nodes, config);
    }

    void set_seed(int seed) override { inner_.set_seed(seed); }

private:
    int fail_size_;
    float fail_resolution_;
    LeidenBackend inner_;
};


BOOST_AUTO_TEST_CASE( test_refinement_splits_weakly_joined_groups )
{
    std::vector<WeightedEdge> edges;
    add_bridged_triangles(edges, 0);
    SimilarityGraph g(6, edges);

    TwoStagePartitioner partitioner(low_high_params());
    Partition p = partitioner.partition(g);

    BOOST_CHECK_EQUAL(p.n_coarse, 1);
    BOOST_CHECK_EQUAL(p.n_final, 2);
    BOOST_CHECK_EQUAL(p.n_split, 1);
    BOOST_CHECK(!p.degraded);
    BOOST_CHECK(p.labels == std::vector<int>({0, 0, 0, 1, 1, 1}));
}

BOOST_AUTO_TEST_CASE( test_refinement_never_merges_across_coarse_bins )
{
    std::vector<WeightedEdge> edges;
    add_bridged_triangles(edges, 0);
    add_bridged_pairs(edges, 6);
    edges.emplace_back(5, 6, 0.05f);
    SimilarityGraph g(11, edges);   // node 10 isolated

    for (float gamma2 : {0.05f, 0.3f, 0.75f, 1.5f}) {
        PartitionParams params = low_high_params();
        params.gamma2 = gamma2;
        Partition p = TwoStagePartitioner(params).partition(g);

        BOOST_REQUIRE_EQUAL(p.size(), 11u);
        BOOST_CHECK(p.n_final >= p.n_coarse);
        for (int i = 0; i < 11; ++i) {
            for (int j = 0; j < 11; ++j) {
                if (p.labels[i] == p.labels[j]) {
                    BOOST_CHECK_EQUAL(p.coarse_labels[i], p.coarse_labels[j]);
                }
            }
        }
    }
}

BOOST_AUTO_TEST_CASE( test_isolated_node_is_its_own_bin )
{
    SimilarityGraph g(4, {WeightedEdge(0, 1, 1.0f), WeightedEdge(1, 2, 1.0f), WeightedEdge(0, 2, 1.0f)});
    Partition p = partition(g, 0.1f, 0.75f);

    BOOST_CHECK_EQUAL(p.n_final, 2);
    BOOST_CHECK_EQUAL(p.labels[3], 1);
    BOOST_CHECK_EQUAL(p.labels[0], 0);
}

BOOST_AUTO_TEST_CASE( test_labels_follow_smallest_node )
{
    // groups {0,3} and {1,2}: bin of node 0 gets label 0
    SimilarityGraph g(4, {WeightedEdge(0, 3, 1.0f), WeightedEdge(1, 2, 1.0f)});
    Partition p = partition(g, 0.1f, 0.75f);

    BOOST_CHECK(p.labels == std::vector<int>({0, 1, 1, 0}));
}

BOOST_AUTO_TEST_CASE( test_deterministic_across_runs_and_threads )
{
    std::vector<WeightedEdge> edges;
    add_bridged_triangles(edges, 0);
    add_bridged_pairs(edges, 6);
    add_bridged_triangles(edges, 10);
    edges.emplace_back(4, 12, 0.2f);
    SimilarityGraph g(16, edges);

    PartitionParams params = low_high_params();
    params.random_seed = 1234;
    Partition first = TwoStagePartitioner(params).partition(g);
    Partition second = TwoStagePartitioner(params).partition(g);

    params.threads = 4;
    Partition threaded = TwoStagePartitioner(params).partition(g);

    BOOST_CHECK(first.labels == second.labels);
    BOOST_CHECK(first.coarse_labels == second.coarse_labels);
    BOOST_CHECK(first.labels == threaded.labels);
}

BOOST_AUTO_TEST_CASE( test_budget_exhaustion_is_degraded_not_fatal )
{
    std::vector<WeightedEdge> edges;
    add_bridged_triangles(edges, 0);
    SimilarityGraph g(6, edges);

    PartitionParams params = low_high_params();
    params.max_iterations = 1;
    Partition p = TwoStagePartitioner(params).partition(g);

    BOOST_CHECK_EQUAL(p.size(), 6u);
    BOOST_CHECK(p.n_unconverged > 0);
    BOOST_CHECK(p.degraded);
}

BOOST_AUTO_TEST_CASE( test_refinement_failure_keeps_bin_whole )
{
    std::vector<WeightedEdge> edges;
    add_bridged_triangles(edges, 0);    // coarse bin of 6
    add_bridged_pairs(edges, 6);        // coarse bin of 4
    SimilarityGraph g(10, edges);

    PartitionParams params = low_high_params();
    TwoStagePartitioner partitioner(params, nullptr, [&params]() {
        return std::unique_ptr<ILeidenBackend>(new FailingBackend(6, params.gamma2));
    });
    Partition p = partitioner.partition(g);

    BOOST_CHECK_EQUAL(p.n_refine_failures, 1);
    BOOST_CHECK(p.degraded);

    // failed bin stays whole, the other one is still refined
    for (int i = 1; i < 6; ++i) BOOST_CHECK_EQUAL(p.labels[i], p.labels[0]);
    BOOST_CHECK_EQUAL(p.labels[6], p.labels[7]);
    BOOST_CHECK_EQUAL(p.labels[8], p.labels[9]);
    BOOST_CHECK(p.labels[6] != p.labels[8]);
    BOOST_CHECK_EQUAL(p.n_final, 3);
}

BOOST_AUTO_TEST_CASE( test_coarse_failure_keeps_component_whole )
{
    std::vector<WeightedEdge> edges;
    add_bridged_triangles(edges, 0);
    add_bridged_pairs(edges, 6);
    SimilarityGraph g(10, edges);

    PartitionParams params = low_high_params();
    TwoStagePartitioner partitioner(params, nullptr, [&params]() {
        return std::unique_ptr<ILeidenBackend>(new FailingBackend(4, params.gamma1));
    });
    Partition p = partitioner.partition(g);

    BOOST_CHECK_EQUAL(p.n_coarse_failures, 1);
    BOOST_CHECK(p.degraded);
    BOOST_CHECK_EQUAL(p.coarse_labels[6], p.coarse_labels[9]);
    BOOST_CHECK_EQUAL(p.n_coarse, 2);
}

BOOST_AUTO_TEST_CASE( test_invalid_params )
{
    PartitionParams params;
    params.gamma1 = 0.0f;
    BOOST_CHECK_THROW(TwoStagePartitioner(params).params(), ConfigError);

    params = PartitionParams();
    params.gamma2 = -1.0f;
    BOOST_CHECK_THROW(params.validate(), ConfigError);

    params = PartitionParams();
    params.threads = 0;
    BOOST_CHECK_THROW(params.validate(), ConfigError);

    params = PartitionParams();
    params.max_iterations = 0;
    BOOST_CHECK_THROW(params.validate(), ConfigError);
}

BOOST_AUTO_TEST_CASE( test_cancelled_before_partitioning )
{
    CancellationToken token;
    token.cancel();
    SimilarityGraph g(2, {WeightedEdge(0, 1, 1.0f)});

    TwoStagePartitioner partitioner(low_high_params());
    BOOST_CHECK_THROW(partitioner.partition(g, nullptr, &token), Cancelled);
}

BOOST_AUTO_TEST_SUITE_END()
