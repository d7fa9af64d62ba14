// graph/algorithms/path_search.h - Depth-first path enumeration and
//                                  constrained breadth-first paths
// Part of the graphwalk graph library (C++20)
//
// ALGORITHMS:
//   find_any_path           first path found by DFS (not necessarily shortest)
//   all_paths               every simple path, optionally bounded in edges
//   shortest_path_avoiding  BFS shortest path that never enters a blocked node
//
// COST:
// all_paths enumerates simple paths, so its running time and output size
// are exponential in the worst case (a complete graph on V nodes has
// (V-2)! paths between two nodes).  Use max_edges to bound the search.
//
// A node is rejected only if it is already on the current path, so cycles
// elsewhere in the graph are tolerated without infinite recursion.

#ifndef GW_GRAPH_PATH_SEARCH_H
#define GW_GRAPH_PATH_SEARCH_H

#include "graph_concepts.h"
#include "graph_traits.h"
#include "shortest_path.h"

#include <cstddef>
#include <deque>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

namespace gw::graph {

/// Unbounded path length for all_paths.
inline constexpr std::size_t unbounded = std::numeric_limits<std::size_t>::max();

namespace detail {

template<graph_queryable G>
bool any_path_visit(G const& g, node_t<G> const& u, node_t<G> const& target,
                    node_set_t<G>& visited, path<node_t<G>>& current) {
    current.push_back(u);
    if (u == target) return true;
    visited.insert(u);

    for (auto const& a : g.out_neighbors(u)) {
        if (visited.contains(a.target)) continue;
        if (any_path_visit(g, a.target, target, visited, current)) return true;
    }
    current.pop_back();
    return false;
}

template<graph_queryable G>
void all_paths_visit(G const& g, node_t<G> const& u, node_t<G> const& target,
                     std::size_t max_edges,
                     node_set_t<G>& on_path, path<node_t<G>>& current,
                     std::vector<path<node_t<G>>>& out) {
    current.push_back(u);
    if (u == target) {
        out.push_back(current);
        current.pop_back();
        return;
    }

    // current.size() - 1 edges used so far.
    if (current.size() - 1 < max_edges) {
        on_path.insert(u);
        for (auto const& a : g.out_neighbors(u)) {
            if (on_path.contains(a.target)) continue;
            all_paths_visit(g, a.target, target, max_edges, on_path, current, out);
        }
        on_path.erase(u);
    }
    current.pop_back();
}

} // namespace detail

/// Some path from start to target found by depth-first search, or
/// std::nullopt.  start == target yields {start}.
template<graph_queryable G>
[[nodiscard]] std::optional<path<node_t<G>>>
find_any_path(G const& g, node_t<G> const& start, node_t<G> const& target) {
    auto visited = graph_traits<G>::make_node_set(g);
    path<node_t<G>> current;
    if (detail::any_path_visit(g, start, target, visited, current)) {
        return current;
    }
    return std::nullopt;
}

/// Every simple path from start to target with at most max_edges edges,
/// in depth-first discovery order.  start == target yields {{start}}.
///
/// Example:
/// ```cpp
/// // A->B, A->C, B->D, C->D
/// auto ps = all_paths(g, "A", "D");   // {{A,B,D}, {A,C,D}}
/// ```
template<graph_queryable G>
[[nodiscard]] std::vector<path<node_t<G>>>
all_paths(G const& g, node_t<G> const& start, node_t<G> const& target,
          std::size_t max_edges = unbounded) {
    std::vector<path<node_t<G>>> out;
    auto on_path = graph_traits<G>::make_node_set(g);
    path<node_t<G>> current;
    detail::all_paths_visit(g, start, target, max_edges, on_path, current, out);
    return out;
}

/// Minimum-edge-count path from start to target that never enters a node
/// in avoid.  std::nullopt if start or target is itself avoided or no such
/// path exists.
template<graph_queryable G>
[[nodiscard]] std::optional<path<node_t<G>>>
shortest_path_avoiding(G const& g, node_t<G> const& start,
                       node_t<G> const& target,
                       node_set_t<G> const& avoid) {
    using Node = node_t<G>;

    if (avoid.contains(start) || avoid.contains(target)) return std::nullopt;
    if (start == target) return path<Node>{start};

    auto pred = graph_traits<G>::template make_node_map<Node>(g);
    auto visited = graph_traits<G>::make_node_set(g);
    std::deque<Node> queue{start};
    visited.insert(start);

    while (!queue.empty()) {
        Node u = std::move(queue.front());
        queue.pop_front();
        for (auto const& a : g.out_neighbors(u)) {
            if (avoid.contains(a.target)) continue;
            if (!visited.insert(a.target).second) continue;
            pred.emplace(a.target, u);
            if (a.target == target) {
                return detail::walk_predecessors(pred, start, target);
            }
            queue.push_back(a.target);
        }
    }
    return std::nullopt;
}

} // namespace gw::graph

#endif // GW_GRAPH_PATH_SEARCH_H
