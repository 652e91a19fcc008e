#include "boost/test/unit_test.hpp"

#include "test_helpers.h"

#include "binning/graph/neighbor_graph.h"
#include "util/errors.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <set>

using namespace cobin;
using namespace cobin::binning;
using namespace cobin::binning::test;


BOOST_AUTO_TEST_SUITE( neighbor_graph )


static GraphParams exhaustive_params(int n_contigs)
{
    GraphParams params;
    params.max_neighbors = std::max(1, n_contigs - 1);
    return params;
}

static std::set<std::pair<int, int>> edge_set(const SimilarityGraph& g)
{
    std::set<std::pair<int, int>> s;
    for (const auto& e : g.edges()) s.emplace(e.u, e.v);
    return s;
}

// Vote fractions that differ from pair to pair
static PairScore graded_score(const FragmentKey& a, const FragmentKey& b)
{
    const int lo = std::min(a.contig, b.contig);
    const int hi = std::max(a.contig, b.contig);
    const int fa = a.contig == lo ? a.fragment : b.fragment;
    const int fb = a.contig == lo ? b.fragment : a.fragment;
    const float s = static_cast<float>((lo * 7 + hi * 3 + fa + 2 * fb) % 11) / 10.0f;
    return PairScore(s, s);
}


BOOST_AUTO_TEST_CASE( test_select_fragments )
{
    BOOST_CHECK(NeighborGraphBuilder::select_fragments(10, 3) == std::vector<int>({1, 5, 8}));
    BOOST_CHECK(NeighborGraphBuilder::select_fragments(2, 5) == std::vector<int>({0, 1}));
    BOOST_CHECK(NeighborGraphBuilder::select_fragments(0, 3).empty());
}

BOOST_AUTO_TEST_CASE( test_fragment_pair_cap )
{
    GraphParams params = exhaustive_params(2);
    params.n_frags = 30;
    params.max_fragment_pairs = 100;
    ConjunctionCombiner conj;
    NeighborGraphBuilder builder(params, conj);

    auto contigs = make_contigs(2, 50);
    BOOST_CHECK_EQUAL(builder.fragment_pairs(contigs, 0, 1).size(), 100u);

    auto small = make_contigs(2, 4);
    BOOST_CHECK_EQUAL(builder.fragment_pairs(small, 0, 1).size(), 16u);
}

BOOST_AUTO_TEST_CASE( test_all_pairs_when_neighbors_fit )
{
    ConjunctionCombiner conj;
    NeighborGraphBuilder builder(exhaustive_params(5), conj);

    auto pairs = builder.candidate_pairs(group_profiles({0, 0, 1, 1, 2}));
    BOOST_CHECK_EQUAL(pairs.size(), 10u);
    BOOST_CHECK(std::is_sorted(pairs.begin(), pairs.end()));
}

BOOST_AUTO_TEST_CASE( test_knn_candidates_include_nearest )
{
    const int n = 12;
    RowMatrixXf profiles(n, 2);
    for (int i = 0; i < n; ++i) {
        profiles(i, 0) = static_cast<float>(i);
        profiles(i, 1) = 0.0f;
    }

    GraphParams params;
    params.max_neighbors = 2;
    ConjunctionCombiner conj;
    NeighborGraphBuilder builder(params, conj);

    auto pairs = builder.candidate_pairs(profiles);
    std::set<std::pair<int, int>> found(pairs.begin(), pairs.end());

    std::vector<int> degree(n, 0);
    for (const auto& p : pairs) {
        ++degree[p.first];
        ++degree[p.second];
    }
    BOOST_CHECK(*std::max_element(degree.begin(), degree.end()) <= params.max_neighbors);
    for (int i = 0; i + 1 < n; ++i) {
        BOOST_CHECK(found.count({i, i + 1}) == 1);
    }
    for (const auto& p : pairs) {
        BOOST_CHECK(p.first < p.second);
    }
}

BOOST_AUTO_TEST_CASE( test_edge_score_symmetry )
{
    ConjunctionCombiner conj;
    NeighborGraphBuilder builder(exhaustive_params(4), conj);
    auto contigs = make_contigs(4, 5);

    // Answers differently depending on which contig comes first
    FunctionScorer scorer([](const FragmentKey& a, const FragmentKey& b) {
        return a.contig < b.contig ? PairScore(0.9f, 0.9f) : PairScore(0.2f, 0.2f);
    });

    auto scores = builder.score_pairs(contigs, {{0, 3}, {3, 0}, {1, 2}, {2, 1}}, scorer);

    BOOST_REQUIRE(scores[0] && scores[1] && scores[2] && scores[3]);
    BOOST_CHECK_EQUAL(scores[0]->combined, scores[1]->combined);
    BOOST_CHECK_EQUAL(scores[0]->composition, scores[1]->composition);
    BOOST_CHECK_EQUAL(scores[2]->combined, scores[3]->combined);
    BOOST_CHECK_EQUAL(scores[2]->coverage, scores[3]->coverage);

    FunctionScorer graded(graded_score);
    auto graded_scores = builder.score_pairs(contigs, {{1, 3}, {3, 1}}, graded);
    BOOST_REQUIRE(graded_scores[0] && graded_scores[1]);
    BOOST_CHECK_EQUAL(graded_scores[0]->combined, graded_scores[1]->combined);
}

BOOST_AUTO_TEST_CASE( test_every_contig_is_a_node )
{
    std::vector<int> groups = {0, 0, 1, 2};
    auto contigs = make_contigs(4);
    GroupScorer scorer(groups);

    GraphBuildResult r = build_graph(contigs, group_profiles(groups), scorer, exhaustive_params(4));

    BOOST_CHECK_EQUAL(r.graph.n_nodes(), 4);
    BOOST_CHECK_EQUAL(r.graph.n_edges(), 1u);
    BOOST_CHECK(r.graph.has_edge(0, 1));
    BOOST_CHECK_EQUAL(r.stats.n_isolated, 2u);
    BOOST_CHECK_EQUAL(r.stats.n_candidates, 6u);
    BOOST_CHECK_EQUAL(r.stats.n_comparisons, 6 * 16);
}

BOOST_AUTO_TEST_CASE( test_threshold_monotonicity )
{
    auto contigs = make_contigs(8, 6);
    std::vector<int> groups = {0, 0, 0, 1, 1, 2, 2, 2};
    FunctionScorer scorer(graded_score);

    std::set<std::pair<int, int>> previous;
    bool first = true;
    for (float theta : {0.0f, 0.1f, 0.2f, 0.3f, 0.5f, 0.7f, 0.9f, 1.0f}) {
        GraphParams params = exhaustive_params(8);
        params.hits_threshold = theta;
        GraphBuildResult r = build_graph(contigs, group_profiles(groups), scorer, params);
        auto current = edge_set(r.graph);
        if (!first) {
            BOOST_CHECK(std::includes(previous.begin(), previous.end(),
                                      current.begin(), current.end()));
        }
        previous = current;
        first = false;
    }
}

BOOST_AUTO_TEST_CASE( test_threshold_monotonicity_under_degree_cap )
{
    auto contigs = make_contigs(8, 6);
    std::vector<int> groups = {0, 0, 0, 0, 0, 0, 0, 0};
    FunctionScorer scorer(graded_score);

    std::set<std::pair<int, int>> previous;
    bool first = true;
    for (float theta : {0.0f, 0.2f, 0.4f, 0.6f}) {
        GraphParams params;
        params.max_neighbors = 3;
        params.hits_threshold = theta;
        GraphBuildResult r = build_graph(contigs, group_profiles(groups), scorer, params);

        BOOST_CHECK(r.graph.max_degree() <= 3);
        auto current = edge_set(r.graph);
        if (!first) {
            BOOST_CHECK(std::includes(previous.begin(), previous.end(),
                                      current.begin(), current.end()));
        }
        previous = current;
        first = false;
    }
}

BOOST_AUTO_TEST_CASE( test_scoring_failure_only_drops_that_pair )
{
    std::vector<int> groups = {0, 0, 0, 1, 1, 1};
    auto contigs = make_contigs(6);
    GraphParams params = exhaustive_params(6);

    GroupScorer healthy(groups);
    FailingPairScorer failing(groups, 1, 2);

    GraphBuildResult good = build_graph(contigs, group_profiles(groups), healthy, params);
    GraphBuildResult bad = build_graph(contigs, group_profiles(groups), failing, params);

    BOOST_CHECK_EQUAL(good.stats.scoring_failures, 0u);
    BOOST_CHECK_EQUAL(bad.stats.scoring_failures, 1u);
    BOOST_REQUIRE_EQUAL(bad.stats.failed_pairs.size(), 1u);
    BOOST_CHECK(bad.stats.failed_pairs[0] == std::make_pair(1, 2));

    auto expected = edge_set(good.graph);
    expected.erase({1, 2});
    BOOST_CHECK(edge_set(bad.graph) == expected);
}

BOOST_AUTO_TEST_CASE( test_failed_pair_leaves_other_edges_alone )
{
    GraphParams params;
    params.max_neighbors = 1;
    ConjunctionCombiner conj;
    NeighborGraphBuilder builder(params, conj);

    auto score = [](float w) {
        EdgeScore e;
        e.composition = e.coverage = e.combined = w;
        return std::optional<EdgeScore>(e);
    };
    std::vector<std::pair<int, int>> pairs = {{0, 1}, {0, 2}, {2, 3}};

    auto all = builder.select_edges(pairs, {score(0.99f), score(0.98f), score(0.97f)});
    auto one_failed = builder.select_edges(pairs, {std::nullopt, score(0.98f), score(0.97f)});

    BOOST_REQUIRE_EQUAL(all.size(), 3u);
    BOOST_REQUIRE_EQUAL(one_failed.size(), 2u);
    BOOST_CHECK_EQUAL(one_failed[0].u, 0);
    BOOST_CHECK_EQUAL(one_failed[0].v, 2);
    BOOST_CHECK_EQUAL(one_failed[1].u, 2);
    BOOST_CHECK_EQUAL(one_failed[1].v, 3);
}

BOOST_AUTO_TEST_CASE( test_scoring_failure_isolated_with_neighbor_bound )
{
    // 12 contigs on a line, two neighbors each: kNN path, bound active
    const int n = 12;
    RowMatrixXf profiles(n, 2);
    for (int i = 0; i < n; ++i) {
        profiles(i, 0) = static_cast<float>(i);
        profiles(i, 1) = 0.0f;
    }
    std::vector<int> groups(n, 0);
    auto contigs = make_contigs(n);

    GraphParams params;
    params.max_neighbors = 2;

    GroupScorer healthy(groups);
    FailingPairScorer failing(groups, 4, 5);

    GraphBuildResult good = build_graph(contigs, profiles, healthy, params);
    GraphBuildResult bad = build_graph(contigs, profiles, failing, params);

    BOOST_REQUIRE(good.graph.has_edge(4, 5));
    BOOST_CHECK(good.graph.max_degree() <= 2);
    BOOST_CHECK_EQUAL(bad.stats.scoring_failures, 1u);

    auto expected = edge_set(good.graph);
    expected.erase({4, 5});
    BOOST_CHECK(edge_set(bad.graph) == expected);
}

BOOST_AUTO_TEST_CASE( test_out_of_range_score_is_fatal )
{
    auto contigs = make_contigs(3);
    FunctionScorer scorer([](const FragmentKey&, const FragmentKey&) {
        return PairScore(1.5f, 0.5f);
    });

    BOOST_CHECK_THROW(build_graph(contigs, group_profiles({0, 0, 0}), scorer, exhaustive_params(3)),
                      InputError);
}

BOOST_AUTO_TEST_CASE( test_input_validation )
{
    GroupScorer scorer({0, 0});
    GraphParams params = exhaustive_params(2);

    auto no_fragments = make_contigs(2);
    no_fragments[1].n_fragments = 0;
    BOOST_CHECK_THROW(build_graph(no_fragments, group_profiles({0, 0}), scorer, params), InputError);

    // one profile for two contigs
    BOOST_CHECK_THROW(build_graph(make_contigs(2), group_profiles({0}), scorer, params), InputError);

    RowMatrixXf bad = group_profiles({0, 0});
    bad(0, 0) = std::numeric_limits<float>::infinity();
    BOOST_CHECK_THROW(build_graph(make_contigs(2), bad, scorer, params), InputError);
}

BOOST_AUTO_TEST_CASE( test_config_validation )
{
    ConjunctionCombiner conj;

    GraphParams params;
    params.hits_threshold = 1.5f;
    BOOST_CHECK_THROW(NeighborGraphBuilder(params, conj), ConfigError);

    params = GraphParams();
    params.max_neighbors = 0;
    BOOST_CHECK_THROW(NeighborGraphBuilder(params, conj), ConfigError);

    params = GraphParams();
    params.n_frags = 0;
    BOOST_CHECK_THROW(NeighborGraphBuilder(params, conj), ConfigError);

    params = GraphParams();
    params.cutoffs.coverage = -0.1f;
    BOOST_CHECK_THROW(NeighborGraphBuilder(params, conj), ConfigError);
}

BOOST_AUTO_TEST_CASE( test_cancelled_build )
{
    CancellationToken token;
    token.cancel();

    std::vector<int> groups = {0, 0, 1};
    ConjunctionCombiner conj;
    NeighborGraphBuilder builder(exhaustive_params(3), conj);
    GroupScorer scorer(groups);

    BOOST_CHECK_THROW(builder.build(make_contigs(3), group_profiles(groups), scorer, &token),
                      Cancelled);
}

BOOST_AUTO_TEST_CASE( test_latent_kernel_scorer )
{
    FragmentFeatures features;
    features.contigs = make_contigs(2, 1);
    features.composition.rows = RowMatrixXf::Zero(2, 2);
    features.composition.rows(1, 0) = 1.0f;
    features.composition.offsets = {0, 1, 2};
    features.coverage.rows = RowMatrixXf::Zero(2, 3);
    features.coverage.offsets = {0, 1, 2};
    features.validate();

    LatentKernelScorer scorer(features, 1.0f);
    PairScore s = scorer.score(FragmentKey(0, 0), FragmentKey(1, 0));

    BOOST_CHECK_CLOSE(s.composition, std::exp(-1.0f), 1e-4);
    BOOST_CHECK_CLOSE(s.coverage, 1.0f, 1e-4);

    BOOST_CHECK_THROW(LatentKernelScorer(features, 0.0f), ConfigError);

    RowMatrixXf means = features.mean_profiles(FeatureSource::Composition);
    BOOST_CHECK_EQUAL(means.rows(), 2);
    BOOST_CHECK_EQUAL(features.combined_profiles().cols(), 5);
}

BOOST_AUTO_TEST_SUITE_END()
