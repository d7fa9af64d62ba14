// graph/test/test_scc.cpp - Tests for strongly_connected_components and
//                           transpose
// Part of the graphwalk graph library (C++20)

#include <gw/graph/adjacency_graph.h>
#include <gw/graph/scc.h>
#include <gw/graph/transpose.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

using namespace gw::graph;

// =============================================================================
// Test graph factories
// =============================================================================

// Linear chain: 0→1→2→3
adjacency_graph<int> make_chain() {
    adjacency_graph<int> g;
    g.add_edge(0, 1);
    g.add_edge(1, 2);
    g.add_edge(2, 3);
    return g;
}

// Two separate cycles: {0→1→0}, {2→3→4→2}
adjacency_graph<int> make_two_cycles() {
    adjacency_graph<int> g;
    g.add_edge(0, 1);
    g.add_edge(1, 0);
    g.add_edge(2, 3);
    g.add_edge(3, 4);
    g.add_edge(4, 2);
    return g;
}

// Condensation a→b: {A,B} → {C,D} → E
adjacency_graph<std::string> make_layered() {
    adjacency_graph<std::string> g;
    g.add_edge("A", "B");
    g.add_edge("B", "A");
    g.add_edge("B", "C");
    g.add_edge("C", "D");
    g.add_edge("D", "C");
    g.add_edge("D", "E");
    return g;
}

// Diamond: 0→1, 0→2, 1→3, 2→3
adjacency_graph<int> make_diamond() {
    adjacency_graph<int> g;
    g.add_edge(0, 1);
    g.add_edge(0, 2);
    g.add_edge(1, 3);
    g.add_edge(2, 3);
    return g;
}

// =============================================================================
// Strongly connected components
// =============================================================================

TEST(Scc, EmptyGraph) {
    adjacency_graph<int> g;
    auto r = strongly_connected_components(g);
    EXPECT_EQ(r.count(), 0u);
    EXPECT_TRUE(r.component_of.empty());
}

TEST(Scc, ChainIsAllSingletons) {
    auto r = strongly_connected_components(make_chain());
    EXPECT_EQ(r.count(), 4u);
    // Sink first: reverse topological order.
    EXPECT_EQ(r.component_of.at(3), 0u);
    EXPECT_EQ(r.component_of.at(0), 3u);
}

TEST(Scc, TwoCycles) {
    auto g = make_two_cycles();
    auto r = strongly_connected_components(g);
    ASSERT_EQ(r.count(), 2u);
    EXPECT_EQ(r.component_of.at(0), r.component_of.at(1));
    EXPECT_EQ(r.component_of.at(2), r.component_of.at(3));
    EXPECT_EQ(r.component_of.at(3), r.component_of.at(4));
    EXPECT_NE(r.component_of.at(0), r.component_of.at(2));
}

TEST(Scc, ReverseTopologicalNumbering) {
    auto g = make_layered();
    auto r = strongly_connected_components(g);
    ASSERT_EQ(r.count(), 3u);
    EXPECT_EQ(r.components[0], (std::vector<std::string>{"E"}));
    auto mid = r.components[1];
    std::sort(mid.begin(), mid.end());
    EXPECT_EQ(mid, (std::vector<std::string>{"C", "D"}));
    EXPECT_EQ(r.component_of.at("A"), 2u);
    EXPECT_EQ(r.component_of.at("B"), 2u);
}

TEST(Scc, EveryNodeAssignedOnce) {
    auto g = make_layered();
    auto r = strongly_connected_components(g);
    std::size_t members = 0;
    for (auto const& c : r.components) members += c.size();
    EXPECT_EQ(members, g.node_count());
    EXPECT_EQ(r.component_of.size(), g.node_count());
}

TEST(Scc, DeepChainDoesNotRecurse) {
    adjacency_graph<int> g;
    for (int i = 0; i < 50000; ++i) g.add_edge(i, i + 1);
    g.add_edge(50000, 0);
    EXPECT_EQ(strongly_connected_components(g).count(), 1u);
}

// =============================================================================
// Transpose
// =============================================================================

TEST(Transpose, ReversesEveryArc) {
    auto g = make_diamond();
    auto gt = transpose(g);
    EXPECT_EQ(gt.node_count(), 4u);
    EXPECT_EQ(gt.edge_count(), 4u);
    EXPECT_TRUE(gt.has_edge(1, 0));
    EXPECT_TRUE(gt.has_edge(2, 0));
    EXPECT_TRUE(gt.has_edge(3, 1));
    EXPECT_TRUE(gt.has_edge(3, 2));
    EXPECT_FALSE(gt.has_edge(0, 1));
    EXPECT_EQ(gt.nodes(), g.nodes());
}

TEST(Transpose, PreservesWeights) {
    adjacency_graph<std::string, int> g;
    g.add_edge("a", "b", 7);
    auto gt = transpose(g);
    ASSERT_TRUE(gt.edge_weight("b", "a").has_value());
    EXPECT_EQ(*gt.edge_weight("b", "a"), 7);
}

TEST(Transpose, TwiceIsIdentity) {
    auto g = make_layered();
    auto gtt = transpose(transpose(g));
    for (auto const& u : g.nodes()) {
        EXPECT_EQ(gtt.neighbors(u).size(), g.neighbors(u).size()) << u;
        for (auto const& v : g.neighbors(u)) {
            EXPECT_TRUE(gtt.has_edge(u, v)) << u << "->" << v;
        }
    }
}

TEST(Transpose, UndirectedIsUnchanged) {
    auto g = make_undirected<int>();
    g.add_edge(0, 1);
    g.add_edge(1, 2);
    auto gt = transpose(g);
    EXPECT_FALSE(gt.directed());
    EXPECT_EQ(gt.edges(), g.edges());
}
