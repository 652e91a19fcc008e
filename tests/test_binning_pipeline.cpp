#include "boost/test/unit_test.hpp"

#include "test_helpers.h"

#include "binning/binning_pipeline.h"
#include "util/errors.h"

#include <map>
#include <set>

using namespace cobin;
using namespace cobin::binning;
using namespace cobin::binning::test;


BOOST_AUTO_TEST_SUITE( binning_pipeline )


static PipelineParams default_params()
{
    PipelineParams params;
    params.graph.hits_threshold = 0.8f;
    params.partition.gamma1 = 0.1f;
    params.partition.gamma2 = 0.75f;
    return params;
}

static std::set<std::set<std::string>> bin_sets(const std::vector<Bin>& bins)
{
    std::set<std::set<std::string>> s;
    for (const auto& b : bins) s.emplace(b.ids.begin(), b.ids.end());
    return s;
}

static BinningResult run_pipeline(const std::vector<int>& groups,
                                  const std::vector<std::string>& ids,
                                  const PipelineParams& params,
                                  const IPairScorer& scorer,
                                  const std::vector<Contig>& extra = {})
{
    BinningPipeline pipeline(params, std::make_unique<ConjunctionCombiner>());
    return pipeline.run(make_contigs(ids), group_profiles(groups), scorer, nullptr, extra);
}


BOOST_AUTO_TEST_CASE( test_five_contig_example )
{
    const std::vector<int> groups = {0, 0, 0, 1, 1};
    GroupScorer scorer(groups, 0.95f, 0.1f);
    BinningResult r = run_pipeline(groups, {"A", "B", "C", "D", "E"}, default_params(), scorer);

    std::set<std::pair<int, int>> edges;
    for (const auto& e : r.graph.edges()) edges.emplace(e.u, e.v);
    const std::set<std::pair<int, int>> expected = {{0, 1}, {0, 2}, {1, 2}, {3, 4}};
    BOOST_CHECK(edges == expected);

    const std::set<std::set<std::string>> bins = {{"A", "B", "C"}, {"D", "E"}};
    BOOST_CHECK(bin_sets(r.bins) == bins);
    BOOST_CHECK(!r.partition.degraded);
}

BOOST_AUTO_TEST_CASE( test_unconnected_contig_is_singleton_bin )
{
    const std::vector<int> groups = {0, 0, 0, 1, 1, 2};
    GroupScorer scorer(groups);
    BinningResult r = run_pipeline(groups, {"A", "B", "C", "D", "E", "F"}, default_params(), scorer);

    BOOST_CHECK_EQUAL(r.graph.degree(5), 0);
    BOOST_CHECK(bin_sets(r.bins).count({"F"}) == 1);
    BOOST_CHECK_EQUAL(r.bins.size(), 3u);
}

BOOST_AUTO_TEST_CASE( test_every_contig_binned_once )
{
    const std::vector<int> groups = {0, 1, 0, 2, 1, 3, 2, 0, 4, 4};
    std::vector<std::string> ids;
    for (size_t i = 0; i < groups.size(); ++i) ids.push_back("k" + std::to_string(i));

    GroupScorer scorer(groups);
    std::vector<Contig> extra = {Contig("excluded", 100, 0)};
    BinningResult r = run_pipeline(groups, ids, default_params(), scorer, extra);

    std::map<std::string, int> seen;
    for (const auto& b : r.bins) {
        for (const auto& id : b.ids) ++seen[id];
    }
    BOOST_CHECK_EQUAL(seen.size(), ids.size() + 1);
    for (const auto& kv : seen) BOOST_CHECK_EQUAL(kv.second, 1);
    BOOST_CHECK_EQUAL(r.bins.size(), 6u);
}

BOOST_AUTO_TEST_CASE( test_scoring_failure_leaves_other_bins_alone )
{
    const std::vector<int> groups = {0, 0, 0, 0, 1, 1, 1, 2, 2};
    std::vector<std::string> ids;
    for (size_t i = 0; i < groups.size(); ++i) ids.push_back("k" + std::to_string(i));

    GroupScorer healthy(groups);
    FailingPairScorer failing(groups, 0, 1);

    BinningResult good = run_pipeline(groups, ids, default_params(), healthy);
    BinningResult bad = run_pipeline(groups, ids, default_params(), failing);

    BOOST_CHECK_EQUAL(bad.stats.scoring_failures, 1u);
    BOOST_CHECK_EQUAL(good.graph.n_edges(), bad.graph.n_edges() + 1);

    // bins without contigs 0 or 1 are unchanged
    auto bad_bins = bin_sets(bad.bins);
    for (const auto& bin : bin_sets(good.bins)) {
        if (bin.count("k0") || bin.count("k1")) continue;
        BOOST_CHECK(bad_bins.count(bin) == 1);
    }
}

BOOST_AUTO_TEST_CASE( test_deterministic_end_to_end )
{
    const std::vector<int> groups = {0, 1, 0, 2, 1, 2, 2, 0, 1, 3};
    std::vector<std::string> ids;
    for (size_t i = 0; i < groups.size(); ++i) ids.push_back("k" + std::to_string(i));

    FunctionScorer scorer([&groups](const FragmentKey& a, const FragmentKey& b) {
        float s = groups[a.contig] == groups[b.contig] ? 0.9f : 0.3f;
        if ((a.fragment + b.fragment) % 3 == 0) s = 0.45f;
        return PairScore(s, s);
    });

    PipelineParams params = default_params();
    params.graph.hits_threshold = 0.5f;
    params.partition.random_seed = 99;
    BinningResult first = run_pipeline(groups, ids, params, scorer);
    BinningResult second = run_pipeline(groups, ids, params, scorer);

    params.graph.threads = 4;
    params.partition.threads = 4;
    BinningResult threaded = run_pipeline(groups, ids, params, scorer);

    BOOST_CHECK(first.partition.labels == second.partition.labels);
    BOOST_CHECK(first.partition.labels == threaded.partition.labels);
    BOOST_CHECK(first.graph.edges() == threaded.graph.edges());
}

BOOST_AUTO_TEST_CASE( test_dense_rescoring_refinement )
{
    const std::vector<int> groups = {0, 0, 0, 1, 1};
    GroupScorer scorer(groups);

    PipelineParams params = default_params();
    params.rescore_max = 10;
    BinningResult r = run_pipeline(groups, {"A", "B", "C", "D", "E"}, params, scorer);

    const std::set<std::set<std::string>> bins = {{"A", "B", "C"}, {"D", "E"}};
    BOOST_CHECK(bin_sets(r.bins) == bins);
}

BOOST_AUTO_TEST_CASE( test_cancellation )
{
    CancellationToken token;
    token.cancel();

    const std::vector<int> groups = {0, 0};
    GroupScorer scorer(groups);
    BinningPipeline pipeline(default_params(), std::make_unique<ConjunctionCombiner>());

    BOOST_CHECK_THROW(pipeline.run(make_contigs(2), group_profiles(groups), scorer, &token),
                      Cancelled);
}

BOOST_AUTO_TEST_CASE( test_params_from_cluster_config )
{
    ClusterConfig config;
    config.threads = 3;
    config.vote_threshold = 0.6f;
    config.gamma2 = 1.25f;

    PipelineParams params = pipeline_params(config);
    BOOST_CHECK_EQUAL(params.graph.threads, 3);
    BOOST_CHECK_EQUAL(params.partition.threads, 3);
    BOOST_CHECK_EQUAL(params.graph.cutoffs.coverage, 0.6f);
    BOOST_CHECK_EQUAL(params.partition.gamma2, 1.25f);
    BOOST_CHECK_EQUAL(params.graph.n_frags, DEFAULT_N_FRAGS);

    config.gamma1 = 0.0f;
    BOOST_CHECK_THROW(pipeline_params(config), ConfigError);

    config = ClusterConfig();
    config.hits_threshold = 1.1f;
    BOOST_CHECK_THROW(pipeline_params(config), ConfigError);

    config = ClusterConfig();
    config.rescore_max = -1;
    BOOST_CHECK_THROW(pipeline_params(config), ConfigError);
}

BOOST_AUTO_TEST_SUITE_END()
