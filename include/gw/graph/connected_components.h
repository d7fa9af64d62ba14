// graph/algorithms/connected_components.h - Connected components
// Part of the graphwalk graph library (C++20)
//
// ALGORITHMS:
//   component_method::dfs         dfs_iterative from each unvisited node
//   component_method::bfs         bfs from each unvisited node
//   component_method::union_find  disjoint_set over every arc
// Complexity: O(V + E) (Union-Find: O(V + E * alpha(V)) amortised)
//
// SEMANTICS:
// The traversal methods follow out_neighbors(), so on an undirected graph
// they partition the nodes into its connected components.  Union-Find
// unites both endpoints of every arc and therefore yields weakly connected
// components on directed input: edge direction is ignored.  On directed
// input the traversal methods report the nodes reachable from each seed
// that no earlier seed reached, which is not a connectivity relation.
//
// Components are listed in order of their first node (node order).
// Members appear in traversal order (DFS / BFS) or node order
// (Union-Find).

#ifndef GW_GRAPH_CONNECTED_COMPONENTS_H
#define GW_GRAPH_CONNECTED_COMPONENTS_H

#include "graph_concepts.h"
#include "graph_traits.h"
#include "observer.h"
#include "transpose.h"
#include "traversal.h"
#include "union_find.h"

#include <cstddef>
#include <utility>
#include <vector>

namespace gw::graph {

/// Selects the component-finding algorithm.
enum class component_method { dfs, bfs, union_find };

/// Result of connected components analysis.
///
/// - components[k]: members of component k
/// - component_of[n]: component id for node n (0-based, dense)
template<graph_queryable G>
struct components_result {
    std::vector<std::vector<node_t<G>>> components;
    node_map_t<G, std::size_t> component_of;

    [[nodiscard]] std::size_t count() const noexcept { return components.size(); }
};

/// Connected components of g.
///
/// Example:
/// ```cpp
/// // undirected: 0-1, 1-2, 3-4
/// auto r = connected_components(g);
/// // r.count() == 2, r.components == {{0, 1, 2}, {3, 4}}
/// ```
template<graph_queryable G>
[[nodiscard]] components_result<G>
connected_components(G const& g,
                     component_method method = component_method::dfs) {
    components_result<G> result;
    result.component_of = graph_traits<G>::template make_node_map<std::size_t>(g);

    if (method == component_method::union_find) {
        disjoint_set<node_t<G>> ds(g.nodes());
        for (auto const& u : g.nodes()) {
            for (auto const& a : g.out_neighbors(u)) {
                ds.unite(u, a.target);
            }
        }
        result.components = ds.groups();
    } else {
        // One traversal per unassigned seed, sharing the visited set.
        auto visited = graph_traits<G>::make_node_set(g);
        null_observer quiet;
        for (auto const& n : g.nodes()) {
            if (visited.contains(n)) continue;
            std::vector<node_t<G>> members;
            if (method == component_method::bfs) {
                detail::bfs_from(g, n, visited, members, quiet);
            } else {
                detail::dfs_iterative_from(g, n, visited, members, quiet);
            }
            result.components.push_back(std::move(members));
        }
    }

    for (std::size_t k = 0; k < result.components.size(); ++k) {
        for (auto const& n : result.components[k]) {
            result.component_of.insert_or_assign(n, k);
        }
    }
    return result;
}

/// True if g has at most one weakly connected component.  The empty graph
/// is vacuously connected.
template<graph_queryable G>
[[nodiscard]] bool is_connected(G const& g) {
    if (g.node_count() == 0) return true;
    return connected_components(g, component_method::union_find).count() == 1;
}

/// True if every node reaches every other node.  Checks that the first
/// node reaches all nodes in g and in its transpose.  Unlike is_connected,
/// the empty graph is not strongly connected: there is no node to start
/// from.
template<graph_queryable G>
[[nodiscard]] bool is_strongly_connected(G const& g) {
    if (g.node_count() == 0) return false;

    auto const& root = *g.nodes().begin();
    if (reachable(g, root).size() != g.node_count()) return false;

    auto const gt = transpose(g);
    return reachable(gt, root).size() == g.node_count();
}

} // namespace gw::graph

#endif // GW_GRAPH_CONNECTED_COMPONENTS_H
