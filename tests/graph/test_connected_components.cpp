// graph/test/test_connected_components.cpp - Tests for disjoint_set,
//                                           connected_components and
//                                           is_connected
// Part of the graphwalk graph library (C++20)

#include <gw/graph/adjacency_graph.h>
#include <gw/graph/connected_components.h>
#include <gw/graph/traversal.h>
#include <gw/graph/union_find.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

using namespace gw::graph;

// =============================================================================
// Test graph factories
// =============================================================================

// Undirected: {0,1,2} and {3,4}
adjacency_graph<int> make_two_islands() {
    auto g = make_undirected<int>();
    g.add_edge(0, 1);
    g.add_edge(1, 2);
    g.add_edge(3, 4);
    return g;
}

// Directed: 0→1, 2→1 (weakly connected, 2 unreachable from 0)
adjacency_graph<int> make_converging() {
    adjacency_graph<int> g;
    g.add_edge(0, 1);
    g.add_edge(2, 1);
    return g;
}

std::vector<int> sorted(std::vector<int> v) {
    std::sort(v.begin(), v.end());
    return v;
}

// =============================================================================
// disjoint_set
// =============================================================================

TEST(DisjointSet, SingletonsOnAdd) {
    disjoint_set<int> ds;
    EXPECT_TRUE(ds.add(1));
    EXPECT_TRUE(ds.add(2));
    EXPECT_FALSE(ds.add(1));
    EXPECT_EQ(ds.size(), 2u);
    EXPECT_EQ(ds.set_count(), 2u);
    EXPECT_TRUE(ds.contains(1));
    EXPECT_FALSE(ds.contains(3));
}

TEST(DisjointSet, UniteIsIdempotent) {
    disjoint_set<std::string> ds;
    EXPECT_TRUE(ds.unite("a", "b"));
    EXPECT_FALSE(ds.unite("b", "a"));
    EXPECT_FALSE(ds.unite("a", "b"));
    EXPECT_EQ(ds.set_count(), 1u);
    EXPECT_TRUE(ds.connected("a", "b"));
}

TEST(DisjointSet, FindAddsUnknown) {
    disjoint_set<int> ds;
    EXPECT_EQ(ds.find(9), 9);
    EXPECT_TRUE(ds.contains(9));
    EXPECT_EQ(ds.set_count(), 1u);
}

TEST(DisjointSet, ConnectedTransitive) {
    disjoint_set<int> ds(std::vector<int>{0, 1, 2, 3, 4});
    ds.unite(0, 1);
    ds.unite(1, 2);
    ds.unite(3, 4);
    EXPECT_TRUE(ds.connected(0, 2));
    EXPECT_FALSE(ds.connected(2, 3));
    EXPECT_FALSE(ds.connected(0, 99));
    EXPECT_TRUE(ds.connected(99, 99));
    EXPECT_EQ(ds.set_count(), 2u);
    EXPECT_EQ(ds.find(0), ds.find(2));
}

TEST(DisjointSet, GroupsInInsertionOrder) {
    disjoint_set<int> ds(std::vector<int>{5, 4, 3, 2, 1});
    ds.unite(1, 5);
    ds.unite(2, 4);
    auto const groups = ds.groups();
    ASSERT_EQ(groups.size(), 3u);
    EXPECT_EQ(groups[0], (std::vector<int>{5, 1}));
    EXPECT_EQ(groups[1], (std::vector<int>{4, 2}));
    EXPECT_EQ(groups[2], (std::vector<int>{3}));
}

TEST(DisjointSet, LongChainFindTerminates) {
    disjoint_set<int> ds;
    for (int i = 0; i < 10000; ++i) ds.unite(i, i + 1);
    EXPECT_EQ(ds.set_count(), 1u);
    EXPECT_TRUE(ds.connected(0, 10000));
}

// =============================================================================
// connected_components
// =============================================================================

TEST(ConnectedComponents, TwoIslandsDfs) {
    auto g = make_two_islands();
    auto r = connected_components(g, component_method::dfs);
    ASSERT_EQ(r.count(), 2u);
    EXPECT_EQ(sorted(r.components[0]), (std::vector<int>{0, 1, 2}));
    EXPECT_EQ(sorted(r.components[1]), (std::vector<int>{3, 4}));
}

TEST(ConnectedComponents, TwoIslandsUnionFind) {
    auto g = make_two_islands();
    auto r = connected_components(g, component_method::union_find);
    ASSERT_EQ(r.count(), 2u);
    EXPECT_EQ(r.components[0], (std::vector<int>{0, 1, 2}));
    EXPECT_EQ(r.components[1], (std::vector<int>{3, 4}));
}

TEST(ConnectedComponents, MethodsAgreeOnUndirected) {
    auto g = make_two_islands();
    g.add_node(7);
    auto dfs_r = connected_components(g, component_method::dfs);
    auto bfs_r = connected_components(g, component_method::bfs);
    auto uf_r = connected_components(g, component_method::union_find);
    ASSERT_EQ(dfs_r.count(), 3u);
    ASSERT_EQ(bfs_r.count(), 3u);
    ASSERT_EQ(uf_r.count(), 3u);
    for (auto const& n : g.nodes()) {
        EXPECT_EQ(dfs_r.component_of.at(n), uf_r.component_of.at(n)) << n;
        EXPECT_EQ(bfs_r.component_of.at(n), uf_r.component_of.at(n)) << n;
    }
}

TEST(ConnectedComponents, MemberOrderFollowsTraversal) {
    auto g = make_undirected<int>();
    g.add_edge(0, 1);
    g.add_edge(0, 2);
    g.add_edge(1, 3);
    auto dfs_r = connected_components(g, component_method::dfs);
    auto bfs_r = connected_components(g, component_method::bfs);
    EXPECT_EQ(dfs_r.components[0], (std::vector<int>{0, 1, 3, 2}));
    EXPECT_EQ(bfs_r.components[0], (std::vector<int>{0, 1, 2, 3}));
}

TEST(ConnectedComponents, DfsMethodMatchesDfsIterative) {
    // 2 is first seen from 0 but reached deeper through 3.
    auto g = make_undirected<int>();
    g.add_edge(0, 1);
    g.add_edge(0, 2);
    g.add_edge(1, 3);
    g.add_edge(3, 2);
    g.add_edge(3, 5);
    g.add_edge(2, 4);
    auto r = connected_components(g, component_method::dfs);
    ASSERT_EQ(r.count(), 1u);
    EXPECT_EQ(r.components[0], (std::vector<int>{0, 1, 3, 2, 4, 5}));
    EXPECT_EQ(r.components[0], dfs_iterative(g, 0));
    EXPECT_EQ(connected_components(g, component_method::bfs).components[0], bfs(g, 0));
}

TEST(ConnectedComponents, IsolatedNodesAreComponents) {
    adjacency_graph<int> g;
    g.add_node(1);
    g.add_node(2);
    auto r = connected_components(g);
    EXPECT_EQ(r.count(), 2u);
}

TEST(ConnectedComponents, EmptyGraph) {
    adjacency_graph<int> g;
    EXPECT_EQ(connected_components(g).count(), 0u);
    EXPECT_EQ(connected_components(g, component_method::union_find).count(), 0u);
}

TEST(ConnectedComponents, UnionFindIsWeakOnDirected) {
    auto g = make_converging();
    EXPECT_EQ(connected_components(g, component_method::union_find).count(), 1u);
    // Traversal follows arc direction: 2 is not reached from 0.
    EXPECT_EQ(connected_components(g, component_method::dfs).count(), 2u);
}

// =============================================================================
// is_connected / is_strongly_connected
// =============================================================================

TEST(IsConnected, Basic) {
    EXPECT_FALSE(is_connected(make_two_islands()));
    EXPECT_TRUE(is_connected(make_converging()));
    EXPECT_TRUE(is_connected(adjacency_graph<int>{}));

    adjacency_graph<int> single;
    single.add_node(0);
    EXPECT_TRUE(is_connected(single));
}

TEST(IsConnected, EmptyGraphIsVacuouslyConnected) {
    adjacency_graph<int> g;
    EXPECT_TRUE(is_connected(g));
    EXPECT_TRUE(is_connected(make_undirected<std::string>()));
    // Strong connectivity needs a start node.
    EXPECT_FALSE(is_strongly_connected(g));
}

TEST(IsStronglyConnected, Basic) {
    EXPECT_FALSE(is_strongly_connected(make_converging()));

    adjacency_graph<int> ring;
    ring.add_edge(0, 1);
    ring.add_edge(1, 2);
    ring.add_edge(2, 0);
    EXPECT_TRUE(is_strongly_connected(ring));

    // Every node reachable from 0 but 0 not reachable back.
    adjacency_graph<int> out_star;
    out_star.add_edge(0, 1);
    out_star.add_edge(0, 2);
    EXPECT_FALSE(is_strongly_connected(out_star));

    auto g = make_undirected<int>();
    g.add_edge(0, 1);
    g.add_edge(1, 2);
    EXPECT_TRUE(is_strongly_connected(g));
}
