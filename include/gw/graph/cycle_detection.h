// graph/algorithms/cycle_detection.h - Directed and undirected cycle detection
// Part of the graphwalk graph library (C++20)
//
// ALGORITHMS:
//   Directed:   three-colour DFS (white / grey / black).  An arc into a grey
//               node is a back edge and closes a cycle.  Recursive and
//               iterative (explicit frame stack) formulations.
//   Undirected: DFS with parent tracking.  A visited neighbour that is not
//               the node we arrived from closes a cycle.
//   Shortest:   BFS from every node (directed: back to the start node;
//               undirected: non-tree edges, trimmed to a simple cycle).
// Complexity: O(V + E) for detection, O(V * (V + E)) for shortest_cycle.
//
// DESIGN RATIONALE:
// The two detectors are deliberately different algorithms.  In an
// undirected graph every tree edge u-v is stored as arcs u->v and v->u, so
// the three-colour method would see the arc back to the (still grey)
// parent and report a cycle on any edge at all.  Parent tracking skips
// exactly that arc.
//
// Both detectors start a fresh DFS from every still-unvisited node, in
// node order, so cycles in any component are found.
//
// Reported cycles are closed: the repeated node appears first and last,
// e.g. {0, 1, 2, 0}.  A self-loop is reported as {u, u}.

#ifndef GW_GRAPH_CYCLE_DETECTION_H
#define GW_GRAPH_CYCLE_DETECTION_H

#include "graph_concepts.h"
#include "graph_traits.h"
#include "observer.h"
#include "traversal.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <utility>
#include <vector>

namespace gw::graph {

/// Result of cycle detection.
///
/// - found: true if at least one cycle exists
/// - cycle: one closed cycle (first node repeated at the end), empty if
///   none was found
template<node_key Node>
struct cycle_result {
    bool found = false;
    path<Node> cycle;

    explicit operator bool() const noexcept { return found; }
};

namespace detail {

enum class colour : std::uint8_t { white, grey, black };

template<typename Node>
[[nodiscard]] path<Node>
close_cycle(std::vector<Node> const& stack, Node const& repeated) {
    auto it = std::find(stack.begin(), stack.end(), repeated);
    path<Node> cycle(it, stack.end());
    cycle.push_back(repeated);
    return cycle;
}

template<graph_queryable G, typename Observer>
bool directed_cycle_visit(G const& g, node_t<G> const& u,
                          node_map_t<G, colour>& colours,
                          std::vector<node_t<G>>& stack,
                          path<node_t<G>>& cycle,
                          Observer& obs) {
    colours[u] = colour::grey;
    stack.push_back(u);
    obs.discover(u);

    for (auto const& a : g.out_neighbors(u)) {
        obs.examine(u, a.target, a.weight);
        auto it = colours.find(a.target);
        auto const c = (it == colours.end()) ? colour::white : it->second;
        if (c == colour::grey) {
            obs.back_edge(u, a.target);
            cycle = close_cycle(stack, a.target);
            return true;
        }
        if (c == colour::white &&
            directed_cycle_visit(g, a.target, colours, stack, cycle, obs)) {
            return true;
        }
    }

    colours[u] = colour::black;
    stack.pop_back();
    obs.backtrack(u);
    return false;
}

template<graph_queryable G, typename Observer>
bool directed_cycle_iterative(G const& g, node_t<G> const& root,
                              node_map_t<G, colour>& colours,
                              path<node_t<G>>& cycle,
                              Observer& obs) {
    using Node = node_t<G>;
    using range_t = decltype(g.out_neighbors(std::declval<Node const&>()));
    using iter_t = decltype(std::declval<range_t const&>().begin());

    // DFS call stack frame: node plus the next arc to examine.
    struct frame {
        Node node;
        iter_t next;
        iter_t end;
    };
    std::vector<frame> call_stack;
    std::vector<Node> stack;

    auto push = [&](Node const& n) {
        colours[n] = colour::grey;
        stack.push_back(n);
        obs.discover(n);
        auto const range = g.out_neighbors(n);
        call_stack.push_back(frame{n, range.begin(), range.end()});
    };

    push(root);
    while (!call_stack.empty()) {
        auto& top = call_stack.back();
        if (top.next == top.end) {
            colours[top.node] = colour::black;
            obs.backtrack(top.node);
            stack.pop_back();
            call_stack.pop_back();
            continue;
        }

        auto const& a = *top.next;
        ++top.next;
        obs.examine(top.node, a.target, a.weight);

        auto it = colours.find(a.target);
        auto const c = (it == colours.end()) ? colour::white : it->second;
        if (c == colour::grey) {
            obs.back_edge(top.node, a.target);
            cycle = close_cycle(stack, a.target);
            return true;
        }
        if (c == colour::white) {
            Node next = a.target;
            push(next);  // invalidates top
        }
    }
    return false;
}

template<graph_queryable G>
bool undirected_cycle_visit(G const& g, node_t<G> const& u,
                            std::optional<node_t<G>> const& parent,
                            node_set_t<G>& visited,
                            std::vector<node_t<G>>& stack,
                            path<node_t<G>>& cycle) {
    visited.insert(u);
    stack.push_back(u);

    for (auto const& a : g.out_neighbors(u)) {
        if (!visited.contains(a.target)) {
            if (undirected_cycle_visit(g, a.target, std::optional{u},
                                       visited, stack, cycle)) {
                return true;
            }
        } else if (!parent || !(a.target == *parent)) {
            cycle = close_cycle(stack, a.target);
            return true;
        }
    }

    stack.pop_back();
    return false;
}

} // namespace detail

// =========================================================================
// Directed graphs
// =========================================================================

/// Find a cycle in a directed graph via three-colour DFS.
///
/// Example:
/// ```cpp
/// // 0->1->2->0
/// auto r = find_cycle_directed(g);   // r.found, r.cycle == {0, 1, 2, 0}
/// ```
template<graph_queryable G, typename Observer = null_observer>
[[nodiscard]] cycle_result<node_t<G>>
find_cycle_directed(G const& g,
                    dfs_strategy strategy = dfs_strategy::recursive,
                    Observer&& obs = {}) {
    cycle_result<node_t<G>> r;
    auto colours = graph_traits<G>::template make_node_map<detail::colour>(g);

    for (auto const& n : g.nodes()) {
        if (colours.contains(n)) continue;  // grey or black

        bool found = false;
        if (strategy == dfs_strategy::iterative) {
            found = detail::directed_cycle_iterative(g, n, colours, r.cycle, obs);
        } else {
            std::vector<node_t<G>> stack;
            found = detail::directed_cycle_visit(g, n, colours, stack, r.cycle, obs);
        }
        if (found) {
            r.found = true;
            return r;
        }
    }
    return r;
}

/// True if the directed graph contains at least one cycle.
template<graph_queryable G>
[[nodiscard]] bool
has_cycle_directed(G const& g, dfs_strategy strategy = dfs_strategy::recursive) {
    return find_cycle_directed(g, strategy).found;
}

// =========================================================================
// Undirected graphs
// =========================================================================

/// Find a cycle in an undirected graph via parent-tracking DFS.
template<graph_queryable G>
[[nodiscard]] cycle_result<node_t<G>>
find_cycle_undirected(G const& g) {
    cycle_result<node_t<G>> r;
    auto visited = graph_traits<G>::make_node_set(g);

    for (auto const& n : g.nodes()) {
        if (visited.contains(n)) continue;
        std::vector<node_t<G>> stack;
        if (detail::undirected_cycle_visit(g, n, std::optional<node_t<G>>{},
                                           visited, stack, r.cycle)) {
            r.found = true;
            return r;
        }
    }
    return r;
}

/// True if the undirected graph contains at least one cycle.
template<graph_queryable G>
[[nodiscard]] bool has_cycle_undirected(G const& g) {
    return find_cycle_undirected(g).found;
}

// =========================================================================
// Dispatch on graph kind
// =========================================================================

/// Cycle search using the detector matching g.directed().
template<graph_queryable G>
[[nodiscard]] cycle_result<node_t<G>> find_cycle(G const& g) {
    return g.directed() ? find_cycle_directed(g) : find_cycle_undirected(g);
}

/// True if g contains a cycle, using the detector matching g.directed().
template<graph_queryable G>
[[nodiscard]] bool has_cycle(G const& g) {
    return find_cycle(g).found;
}

// =========================================================================
// Shortest cycle
// =========================================================================

namespace detail {

/// Root path s..n through BFS predecessors.
template<typename PredMap, typename Node>
[[nodiscard]] path<Node> root_path(PredMap const& pred, Node const& n) {
    path<Node> p{n};
    for (auto it = pred.find(n); it != pred.end(); it = pred.find(p.back())) {
        p.push_back(it->second);
    }
    std::reverse(p.begin(), p.end());
    return p;
}

template<graph_queryable G>
[[nodiscard]] std::optional<path<node_t<G>>>
shortest_directed_cycle_through(G const& g, node_t<G> const& s) {
    using Node = node_t<G>;

    auto pred = graph_traits<G>::template make_node_map<Node>(g);
    auto visited = graph_traits<G>::make_node_set(g);
    std::deque<Node> queue{s};
    visited.insert(s);

    while (!queue.empty()) {
        Node u = std::move(queue.front());
        queue.pop_front();
        for (auto const& a : g.out_neighbors(u)) {
            if (a.target == s) {
                auto cycle = root_path(pred, u);
                cycle.push_back(s);
                return cycle;
            }
            if (visited.insert(a.target).second) {
                pred.emplace(a.target, u);
                queue.push_back(a.target);
            }
        }
    }
    return std::nullopt;
}

template<graph_queryable G>
[[nodiscard]] std::optional<path<node_t<G>>>
shortest_undirected_cycle_from(G const& g, node_t<G> const& s) {
    using Node = node_t<G>;

    auto pred = graph_traits<G>::template make_node_map<Node>(g);
    auto depth = graph_traits<G>::template make_node_map<std::size_t>(g);
    std::deque<Node> queue{s};
    depth.emplace(s, 0);
    std::optional<path<Node>> best;

    while (!queue.empty()) {
        Node u = std::move(queue.front());
        queue.pop_front();
        auto const du = depth.at(u);

        // Any cycle closed from this level or deeper has >= 2*du + 1 edges.
        if (best && 2 * du + 1 >= best->size() - 1) break;

        auto const pu = pred.find(u);
        for (auto const& a : g.out_neighbors(u)) {
            if (depth.emplace(a.target, du + 1).second) {
                pred.emplace(a.target, u);
                queue.push_back(a.target);
                continue;
            }
            if (pu != pred.end() && a.target == pu->second) continue;

            // Non-tree edge u-v: join the two root paths below their last
            // common node.
            auto pu_path = root_path(pred, u);
            auto pv_path = root_path(pred, a.target);
            std::size_t common = 0;
            while (common + 1 < pu_path.size() && common + 1 < pv_path.size() &&
                   pu_path[common + 1] == pv_path[common + 1]) {
                ++common;
            }
            path<Node> cycle(pu_path.begin() + static_cast<std::ptrdiff_t>(common),
                             pu_path.end());
            for (std::size_t i = pv_path.size(); i > common; --i) {
                cycle.push_back(pv_path[i - 1]);
            }
            if (!best || cycle.size() < best->size()) best = std::move(cycle);
        }
    }
    return best;
}

} // namespace detail

/// A cycle with the fewest edges, or std::nullopt for an acyclic graph.
/// Closed form: {c0, c1, ..., c0}.  Ties resolve to the first start node
/// in node order.
template<graph_queryable G>
[[nodiscard]] std::optional<path<node_t<G>>>
shortest_cycle(G const& g) {
    std::optional<path<node_t<G>>> best;
    for (auto const& s : g.nodes()) {
        auto c = g.directed() ? detail::shortest_directed_cycle_through(g, s)
                              : detail::shortest_undirected_cycle_from(g, s);
        if (c && (!best || c->size() < best->size())) {
            best = std::move(c);
        }
    }
    return best;
}

} // namespace gw::graph

#endif // GW_GRAPH_CYCLE_DETECTION_H
