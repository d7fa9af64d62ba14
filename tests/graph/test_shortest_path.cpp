// graph/test/test_shortest_path.cpp - Tests for BFS shortest path and
//                                     Dijkstra
// Part of the graphwalk graph library (C++20)

#include <gw/graph/adjacency_graph.h>
#include <gw/graph/observer.h>
#include <gw/graph/shortest_path.h>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace gw::graph;

// =============================================================================
// Test graph factories
// =============================================================================

// 0→1, 1→2, 0→3, 3→4
adjacency_graph<int> make_two_routes() {
    adjacency_graph<int> g;
    g.add_edge(0, 1);
    g.add_edge(1, 2);
    g.add_edge(0, 3);
    g.add_edge(3, 4);
    return g;
}

// A→B(4), A→C(2), B→D(5), C→D(8)
adjacency_graph<std::string, int> make_weighted_diamond() {
    adjacency_graph<std::string, int> g;
    g.add_edge("A", "B", 4);
    g.add_edge("A", "C", 2);
    g.add_edge("B", "D", 5);
    g.add_edge("C", "D", 8);
    return g;
}

// Weighted graph where the fewest-hop path is not the cheapest:
// S→T(10), S→X(1), X→Y(1), Y→T(1)
adjacency_graph<std::string, double> make_detour() {
    adjacency_graph<std::string, double> g;
    g.add_edge("S", "T", 10.0);
    g.add_edge("S", "X", 1.0);
    g.add_edge("X", "Y", 1.0);
    g.add_edge("Y", "T", 1.0);
    return g;
}

struct relax_counter : null_observer {
    int relaxations = 0;
    std::vector<std::string> settled;

    template<typename W>
    void relax(std::string const&, std::string const&, W const&) { ++relaxations; }
    void visit(std::string const& n) { settled.push_back(n); }
};

// =============================================================================
// Unweighted shortest path
// =============================================================================

TEST(ShortestPath, PicksFewestEdges) {
    auto g = make_two_routes();
    auto p = shortest_path(g, 0, 4);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(*p, (std::vector<int>{0, 3, 4}));
    EXPECT_EQ(p->size() - 1, 2u);
}

TEST(ShortestPath, SameStartAndTarget) {
    auto g = make_two_routes();
    auto p = shortest_path(g, 2, 2);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(*p, (std::vector<int>{2}));
}

TEST(ShortestPath, UnreachableIsNullopt) {
    auto g = make_two_routes();
    EXPECT_FALSE(shortest_path(g, 4, 0).has_value());
    EXPECT_FALSE(shortest_path(g, 0, 99).has_value());
}

TEST(ShortestPath, IgnoresWeights) {
    auto g = make_detour();
    auto p = shortest_path(g, std::string("S"), std::string("T"));
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(*p, (std::vector<std::string>{"S", "T"}));
}

// =============================================================================
// Dijkstra: single target
// =============================================================================

TEST(Dijkstra, WeightedDiamond) {
    auto g = make_weighted_diamond();
    auto r = dijkstra(g, "A", "D");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->cost, 9);
    EXPECT_EQ(r->nodes, (std::vector<std::string>{"A", "B", "D"}));
}

TEST(Dijkstra, PrefersCheaperLongerRoute) {
    auto g = make_detour();
    auto r = dijkstra(g, "S", "T");
    ASSERT_TRUE(r.has_value());
    EXPECT_DOUBLE_EQ(r->cost, 3.0);
    EXPECT_EQ(r->nodes, (std::vector<std::string>{"S", "X", "Y", "T"}));
}

TEST(Dijkstra, SourceEqualsTarget) {
    auto g = make_weighted_diamond();
    auto r = dijkstra(g, "B", "B");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->cost, 0);
    EXPECT_EQ(r->nodes, (std::vector<std::string>{"B"}));
}

TEST(Dijkstra, UnreachableTarget) {
    auto g = make_weighted_diamond();
    EXPECT_FALSE(dijkstra(g, "D", "A").has_value());
    EXPECT_FALSE(dijkstra(g, "A", "Z").has_value());
}

TEST(Dijkstra, NegativeWeightThrows) {
    auto g = make_weighted_diamond();
    g.add_edge("D", "E", -1);
    EXPECT_THROW((void)dijkstra(g, "A", "B"), std::invalid_argument);
    EXPECT_THROW((void)dijkstra(g, "A"), std::invalid_argument);
}

TEST(Dijkstra, ZeroWeightEdgesAllowed) {
    adjacency_graph<int, int> g;
    g.add_edge(0, 1, 0);
    g.add_edge(1, 2, 0);
    auto r = dijkstra(g, 0, 2);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->cost, 0);
}

// =============================================================================
// Dijkstra: all targets
// =============================================================================

TEST(Dijkstra, AllTargetsDistances) {
    auto g = make_weighted_diamond();
    auto r = dijkstra(g, "A");
    EXPECT_EQ(r.source, "A");
    EXPECT_EQ(r.dist.at("A"), 0);
    EXPECT_EQ(r.dist.at("B"), 4);
    EXPECT_EQ(r.dist.at("C"), 2);
    EXPECT_EQ(r.dist.at("D"), 9);
    EXPECT_TRUE(r.verified);
    EXPECT_EQ(r.settled, (std::vector<std::string>{"A", "C", "B", "D"}));
}

TEST(Dijkstra, UnreachedNodesHaveNoDistance) {
    auto g = make_weighted_diamond();
    auto r = dijkstra(g, "C");
    EXPECT_FALSE(r.reached("A"));
    EXPECT_FALSE(r.distance_to("B").has_value());
    ASSERT_TRUE(r.distance_to("D").has_value());
    EXPECT_EQ(*r.distance_to("D"), 8);
    EXPECT_FALSE(reconstruct_path(r, "A").has_value());
}

TEST(Dijkstra, ReconstructPath) {
    auto g = make_weighted_diamond();
    auto r = dijkstra(g, "A");
    auto p = reconstruct_path(r, "D");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(*p, (std::vector<std::string>{"A", "B", "D"}));
    EXPECT_EQ(*reconstruct_path(r, "A"), (std::vector<std::string>{"A"}));
}

TEST(Dijkstra, SingleTargetMatchesAllTargets) {
    auto g = make_detour();
    auto all = dijkstra(g, "S");
    for (auto const& n : g.nodes()) {
        auto one = dijkstra(g, "S", n);
        ASSERT_TRUE(one.has_value()) << n;
        EXPECT_DOUBLE_EQ(one->cost, all.dist.at(n)) << n;
    }
}

TEST(Dijkstra, ObserverReportsRelaxations) {
    auto g = make_detour();
    relax_counter obs;
    (void)dijkstra(g, "S", obs);
    // S→T, S→X, X→Y, then Y→T improves T from 10 to 3.
    EXPECT_EQ(obs.relaxations, 4);
    EXPECT_EQ(obs.settled, (std::vector<std::string>{"S", "X", "Y", "T"}));
}

// =============================================================================
// Verification and path weight
// =============================================================================

TEST(VerifyShortestPath, DetectsTamperedDistance) {
    auto g = make_weighted_diamond();
    auto r = dijkstra(g, "A");
    ASSERT_TRUE(r.verified);
    r.dist.at("D") = 100;
    EXPECT_FALSE(verify_shortest_path(g, r));
    EXPECT_FALSE(r.verified);
}

TEST(VerifyShortestPath, DetectsBrokenPredecessor) {
    auto g = make_weighted_diamond();
    auto r = dijkstra(g, "A");
    r.pred.at("D") = "C";  // dist[D] != dist[C] + w(C, D)
    EXPECT_FALSE(verify_shortest_path(g, r));
}

TEST(PathWeight, SumsArcs) {
    auto g = make_weighted_diamond();
    EXPECT_EQ(path_weight(g, {"A", "C", "D"}), 10);
    EXPECT_EQ(path_weight(g, {"A"}), 0);
    EXPECT_FALSE(path_weight(g, {"A", "D"}).has_value());
    EXPECT_FALSE(path_weight(g, {}).has_value());
}
