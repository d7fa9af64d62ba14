// graph/algorithms/traversal.h - Breadth-first and depth-first traversal
// Part of the graphwalk graph library (C++20)
//
// ALGORITHMS:
//   bfs            FIFO frontier, nodes marked at discovery (enqueue) time
//   bfs_levels     BFS grouped by hop distance
//   bfs_distances  hop count to every reachable node
//   bfs_within     nodes at most max_depth hops away
//   bfs_limited    BFS order truncated to a visit budget
//   dfs_recursive  recursion, nodes marked on entry
//   dfs_iterative  explicit stack, nodes marked on pop
//   reachable      visited set of a traversal
// Complexity: O(V + E) for every entry point.
//
// DESIGN RATIONALE:
// BFS marks a node visited the moment it is enqueued, not when it is
// dequeued.  This is what prevents duplicate enqueuing and what makes
// discovery order equal hop-distance order.
//
// The iterative DFS pushes neighbours in reverse so that the first
// inserted neighbour is popped first, reproducing the recursive
// left-to-right visiting order on trees.  A node may sit on the stack
// more than once; duplicates are filtered at pop time.  Recursion depth
// of dfs_recursive is bounded by the longest simple path, so deep or
// degenerate graphs should use dfs_iterative.
//
// A start node that is not in the graph is treated as an isolated
// singleton: the traversal yields just that node.

#ifndef GW_GRAPH_TRAVERSAL_H
#define GW_GRAPH_TRAVERSAL_H

#include "graph_concepts.h"
#include "graph_traits.h"
#include "observer.h"

#include <cstddef>
#include <deque>
#include <utility>
#include <vector>

namespace gw::graph {

/// Selects the DFS formulation.
enum class dfs_strategy { recursive, iterative };

// =========================================================================
// Breadth-first search
// =========================================================================

namespace detail {

/// BFS from start that appends to order and shares visited with the
/// caller, so repeated calls partition the graph.
template<graph_queryable G, typename Observer>
void bfs_from(G const& g, node_t<G> const& start,
              node_set_t<G>& visited,
              std::vector<node_t<G>>& order,
              Observer& obs) {
    using Node = node_t<G>;

    std::deque<Node> queue;
    visited.insert(start);
    queue.push_back(start);
    obs.discover(start);

    while (!queue.empty()) {
        Node u = std::move(queue.front());
        queue.pop_front();
        obs.visit(u);
        order.push_back(u);

        for (auto const& a : g.out_neighbors(u)) {
            obs.examine(u, a.target, a.weight);
            if (visited.insert(a.target).second) {
                obs.discover(a.target);
                queue.push_back(a.target);
            }
        }
    }
}

} // namespace detail

/// Breadth-first discovery order from start.
///
/// Example:
/// ```cpp
/// // 0->1, 0->3, 1->2, 3->4
/// auto order = bfs(g, 0);   // {0, 1, 3, 2, 4}
/// ```
template<graph_queryable G, typename Observer = null_observer>
[[nodiscard]] std::vector<node_t<G>>
bfs(G const& g, node_t<G> const& start, Observer&& obs = {}) {
    auto visited = graph_traits<G>::make_node_set(g);
    std::vector<node_t<G>> order;
    detail::bfs_from(g, start, visited, order, obs);
    return order;
}

/// BFS grouped by level: result[k] holds the nodes k hops from start.
template<graph_queryable G>
[[nodiscard]] std::vector<std::vector<node_t<G>>>
bfs_levels(G const& g, node_t<G> const& start) {
    using Node = node_t<G>;

    auto visited = graph_traits<G>::make_node_set(g);
    std::vector<std::vector<Node>> levels;
    std::vector<Node> frontier{start};
    visited.insert(start);

    while (!frontier.empty()) {
        std::vector<Node> next;
        for (auto const& u : frontier) {
            for (auto const& a : g.out_neighbors(u)) {
                if (visited.insert(a.target).second) {
                    next.push_back(a.target);
                }
            }
        }
        levels.push_back(std::move(frontier));
        frontier = std::move(next);
    }
    return levels;
}

/// Hop distance from start to every reachable node (start maps to 0).
template<graph_queryable G>
[[nodiscard]] node_map_t<G, std::size_t>
bfs_distances(G const& g, node_t<G> const& start) {
    using Node = node_t<G>;

    auto dist = graph_traits<G>::template make_node_map<std::size_t>(g);
    std::deque<Node> queue{start};
    dist.emplace(start, 0);

    while (!queue.empty()) {
        Node u = std::move(queue.front());
        queue.pop_front();
        auto const du = dist.at(u);
        for (auto const& a : g.out_neighbors(u)) {
            if (dist.emplace(a.target, du + 1).second) {
                queue.push_back(a.target);
            }
        }
    }
    return dist;
}

/// Nodes at distance 1..max_depth from start, in discovery order.
template<graph_queryable G>
[[nodiscard]] std::vector<node_t<G>>
bfs_within(G const& g, node_t<G> const& start, std::size_t max_depth) {
    std::vector<node_t<G>> out;
    auto levels = bfs_levels(g, start);
    for (std::size_t k = 1; k < levels.size() && k <= max_depth; ++k) {
        for (auto& n : levels[k]) out.push_back(std::move(n));
    }
    return out;
}

/// The first max_visits nodes of the BFS order.  Stops expanding as soon
/// as the budget is reached.
template<graph_queryable G>
[[nodiscard]] std::vector<node_t<G>>
bfs_limited(G const& g, node_t<G> const& start, std::size_t max_visits) {
    using Node = node_t<G>;

    std::vector<Node> order;
    if (max_visits == 0) return order;

    auto visited = graph_traits<G>::make_node_set(g);
    std::deque<Node> queue{start};
    visited.insert(start);

    while (!queue.empty() && order.size() < max_visits) {
        Node u = std::move(queue.front());
        queue.pop_front();
        order.push_back(u);
        for (auto const& a : g.out_neighbors(u)) {
            if (visited.insert(a.target).second) {
                queue.push_back(a.target);
            }
        }
    }
    return order;
}

// =========================================================================
// Depth-first search
// =========================================================================

namespace detail {

template<graph_queryable G, typename Observer>
void dfs_visit(G const& g, node_t<G> const& u,
               node_set_t<G>& visited,
               std::vector<node_t<G>>& order,
               Observer& obs) {
    visited.insert(u);
    obs.discover(u);
    obs.visit(u);
    order.push_back(u);

    for (auto const& a : g.out_neighbors(u)) {
        obs.examine(u, a.target, a.weight);
        if (!visited.contains(a.target)) {
            dfs_visit(g, a.target, visited, order, obs);
        }
    }
    obs.backtrack(u);
}

} // namespace detail

/// Recursive depth-first order from start.
///
/// Example:
/// ```cpp
/// // 0->1, 0->3, 1->2, 3->4
/// auto order = dfs_recursive(g, 0);   // {0, 1, 2, 3, 4}
/// ```
template<graph_queryable G, typename Observer = null_observer>
[[nodiscard]] std::vector<node_t<G>>
dfs_recursive(G const& g, node_t<G> const& start, Observer&& obs = {}) {
    auto visited = graph_traits<G>::make_node_set(g);
    std::vector<node_t<G>> order;
    detail::dfs_visit(g, start, visited, order, obs);
    return order;
}

namespace detail {

/// Explicit-stack DFS from start sharing visited with the caller.  A node
/// may sit on the stack more than once; it is discovered and visited only
/// when first popped.
template<graph_queryable G, typename Observer>
void dfs_iterative_from(G const& g, node_t<G> const& start,
                        node_set_t<G>& visited,
                        std::vector<node_t<G>>& order,
                        Observer& obs) {
    using Node = node_t<G>;

    std::vector<Node> stack{start};
    while (!stack.empty()) {
        Node u = std::move(stack.back());
        stack.pop_back();
        if (!visited.insert(u).second) continue;  // stale duplicate

        obs.discover(u);
        obs.visit(u);
        order.push_back(u);

        auto const nbrs = g.out_neighbors(u);
        for (auto it = nbrs.end(); it != nbrs.begin();) {
            --it;
            obs.examine(u, it->target, it->weight);
            if (!visited.contains(it->target)) {
                stack.push_back(it->target);
            }
        }
    }
}

} // namespace detail

/// Explicit-stack depth-first order from start.  Stack-safe equivalent of
/// dfs_recursive: same visited set, same order on trees.
template<graph_queryable G, typename Observer = null_observer>
[[nodiscard]] std::vector<node_t<G>>
dfs_iterative(G const& g, node_t<G> const& start, Observer&& obs = {}) {
    auto visited = graph_traits<G>::make_node_set(g);
    std::vector<node_t<G>> order;
    detail::dfs_iterative_from(g, start, visited, order, obs);
    return order;
}

/// Depth-first order from start using the selected formulation.
template<graph_queryable G, typename Observer = null_observer>
[[nodiscard]] std::vector<node_t<G>>
dfs(G const& g, node_t<G> const& start,
    dfs_strategy strategy = dfs_strategy::recursive,
    Observer&& obs = {}) {
    if (strategy == dfs_strategy::iterative) {
        return dfs_iterative(g, start, obs);
    }
    return dfs_recursive(g, start, obs);
}

/// Set of nodes reachable from start (start included).
template<graph_queryable G>
[[nodiscard]] node_set_t<G>
reachable(G const& g, node_t<G> const& start) {
    auto out = graph_traits<G>::make_node_set(g);
    for (auto& n : dfs_iterative(g, start)) out.insert(std::move(n));
    return out;
}

} // namespace gw::graph

#endif // GW_GRAPH_TRAVERSAL_H
