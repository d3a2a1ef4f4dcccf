#include <cstdlib>
#include <sstream>
#include <vector>

#include <gtest/gtest.h>

#include "kspacing/edge_list.hpp"
#include "kspacing/errors.hpp"
#include "kspacing/spacing.hpp"

using namespace kspacing;

namespace {

// Complete graph over points on a line, labels 1-based, distance = |x_i - x_j|.
EdgeList line_graph(const std::vector<int>& xs) {
    std::ostringstream oss;
    oss << xs.size() << "\n";
    for (std::size_t i = 0; i < xs.size(); ++i)
        for (std::size_t j = i + 1; j < xs.size(); ++j)
            oss << i + 1 << ' ' << j + 1 << ' ' << std::abs(xs[i] - xs[j]) << "\n";
    std::istringstream in(oss.str());
    return EdgeList(in);
}

} // namespace

TEST(ExplicitSpacing, ThreeElementScenario) {
    std::istringstream in("3\n1 2 1\n2 3 2\n1 3 3\n");
    EdgeList g(in);
    ASSERT_TRUE(g.is_valid());
    ExplicitSpacingClusterer c(g.get_element_count(), g.get_edges());
    EXPECT_EQ(c.spacing_for_clusters(2), 2);
}

TEST(ExplicitSpacing, PointsOnALine) {
    // gaps between neighbours: 1, 2, 7, 1, 9
    EdgeList g = line_graph({0, 1, 3, 10, 11, 20});
    ASSERT_TRUE(g.is_valid());
    ExplicitSpacingClusterer c(g.get_element_count(), g.get_edges());
    EXPECT_EQ(c.spacing_for_clusters(2), 9);
    EXPECT_EQ(c.spacing_for_clusters(3), 7);
    EXPECT_EQ(c.spacing_for_clusters(4), 2);
    EXPECT_EQ(c.spacing_for_clusters(5), 1);
}

TEST(ExplicitSpacing, SpacingNeverIncreasesWithK) {
    EdgeList g = line_graph({4, 17, 18, 30, 31, 33, 50, 52, 61, 90, 91, 95});
    ASSERT_TRUE(g.is_valid());
    ExplicitSpacingClusterer c(g.get_element_count(), g.get_edges());
    std::vector<uint32_t> ks;
    for (uint32_t k = 2; k < g.get_element_count(); ++k) ks.push_back(k);
    auto sweep = c.spacing_sweep(ks);
    ASSERT_EQ(sweep.size(), ks.size());
    for (std::size_t i = 1; i < sweep.size(); ++i) {
        EXPECT_EQ(sweep[i].first, ks[i]);
        EXPECT_LE(sweep[i].second, sweep[i - 1].second);
    }
}

TEST(ExplicitSpacing, EqualDistancesGiveSameSpacingInAnyOrder) {
    std::istringstream a("4\n1 2 5\n3 4 5\n2 3 5\n1 3 8\n1 4 8\n2 4 8\n");
    std::istringstream b("4\n2 3 5\n3 4 5\n1 2 5\n2 4 8\n1 4 8\n1 3 8\n");
    EdgeList ga(a), gb(b);
    ExplicitSpacingClusterer ca(4, ga.get_edges()), cb(4, gb.get_edges());
    EXPECT_EQ(ca.spacing_for_clusters(2), 5);
    EXPECT_EQ(cb.spacing_for_clusters(2), 5);
    EXPECT_EQ(ca.spacing_for_clusters(3), cb.spacing_for_clusters(3));
}

TEST(ExplicitSpacing, SortsUnorderedInput) {
    std::istringstream in("4\n1 4 40\n3 4 3\n1 2 1\n2 3 20\n1 3 30\n2 4 50\n");
    EdgeList g(in);
    ExplicitSpacingClusterer c(g.get_element_count(), g.get_edges());
    const auto& e = c.sorted_edges();
    for (std::size_t i = 1; i < e.size(); ++i) EXPECT_LE(e[i - 1].distance, e[i].distance);
    EXPECT_EQ(c.spacing_for_clusters(2), 20);
    EXPECT_EQ(c.spacing_for_clusters(3), 3);
}

TEST(ExplicitSpacing, RejectsInvalidClusterTarget) {
    EdgeList g = line_graph({0, 1, 5, 9});
    ExplicitSpacingClusterer c(g.get_element_count(), g.get_edges());
    EXPECT_THROW(c.spacing_for_clusters(0), InvalidClusterTarget);
    EXPECT_THROW(c.spacing_for_clusters(1), InvalidClusterTarget);
    EXPECT_THROW(c.spacing_for_clusters(4), InvalidClusterTarget);
    EXPECT_THROW(c.spacing_for_clusters(10), std::domain_error);
    EXPECT_NO_THROW(c.spacing_for_clusters(3));
}

TEST(ExplicitSpacing, DisconnectedGraphHasNoSpacing) {
    std::istringstream in("4\n1 2 3\n");
    EdgeList g(in);
    ExplicitSpacingClusterer c(g.get_element_count(), g.get_edges());
    EXPECT_THROW(c.spacing_for_clusters(2), SpacingUndefined);
    // three clusters are reached, but nothing joins them
    EXPECT_THROW(c.spacing_for_clusters(3), SpacingUndefined);
}

TEST(ExplicitSpacing, RejectsEdgeOutsideElementRange) {
    std::vector<WeightedEdge> edges{{0, 1, 2}, {1, 3, 4}};
    EXPECT_THROW(ExplicitSpacingClusterer(3, edges), std::invalid_argument);
}

TEST(ExplicitSpacing, VerboseTraceGoesToConfiguredSink) {
    std::istringstream in("3\n1 2 1\n2 3 2\n1 3 3\n");
    EdgeList g(in);
    ExplicitSpacingClusterer c(g.get_element_count(), g.get_edges());
    std::ostringstream log;
    ExplicitSpacingClusterer::Config cfg;
    cfg.verbose = true;
    cfg.log = &log;
    c.set_config(cfg);
    EXPECT_EQ(c.spacing_for_clusters(2), 2);
    EXPECT_NE(log.str().find("merged"), std::string::npos);
    EXPECT_NE(log.str().find("spacing edge 1-2 d=2"), std::string::npos);
}
