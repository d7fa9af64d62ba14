// graph/representation/graph_concepts.h - Node key and graph concepts
// Part of the graphwalk graph library (C++20)
//
// DESIGN RATIONALE:
// Nodes are opaque keys.  A graph stores no per-node data beyond identity,
// so the only requirements on a key are equality, hashing and copying.
// Integers, std::string and small user structs (grid_cell) all qualify,
// which lets one algorithm instantiation serve every key type.
//
// graph_queryable is the single concept algorithms constrain on.  It is a
// read-only view: algorithms never mutate the graph they are given.

#ifndef GW_GRAPH_CONCEPTS_H
#define GW_GRAPH_CONCEPTS_H

#include <concepts>
#include <cstddef>
#include <functional>
#include <vector>

namespace gw::graph {

// =============================================================================
// Node key
// =============================================================================

/// A node_key is any copyable, default-constructible, equality-comparable
/// type with a std::hash.
template<typename N>
concept node_key =
    std::copyable<N> &&
    std::default_initializable<N> &&
    std::equality_comparable<N> &&
    requires(N const& n) {
        { std::hash<N>{}(n) } -> std::convertible_to<std::size_t>;
    };

/// Edge weight type: any arithmetic-like type with + and <.
template<typename W>
concept edge_weight =
    std::copyable<W> &&
    std::totally_ordered<W> &&
    requires(W a, W b) {
        { a + b } -> std::convertible_to<W>;
        W{0};
        W{1};
    };

// =============================================================================
// Edge records
// =============================================================================

/// One outgoing arc as stored in an adjacency list.
template<node_key Node, typename Weight>
struct weighted_edge {
    Node   target;
    Weight weight;

    friend bool operator==(weighted_edge const&, weighted_edge const&) = default;
};

/// A full (from, to, weight) edge, as reported by edges().
template<node_key Node, typename Weight>
struct edge {
    Node   from;
    Node   to;
    Weight weight;

    friend bool operator==(edge const&, edge const&) = default;
};

/// An ordered node sequence from a source to a target.
template<node_key Node>
using path = std::vector<Node>;

// =============================================================================
// Graph concepts
// =============================================================================

/// A graph_queryable provides immutable adjacency queries.
///
/// Requirements:
/// - node_type / weight_type member aliases
/// - node_count(): number of nodes
/// - nodes(): all nodes in deterministic (first-insertion) order
/// - out_neighbors(u): range of weighted_edge, empty for unknown u
/// - has_node(u), directed()
///
/// Satisfied by adjacency_graph<Node, Weight>.
template<typename G>
concept graph_queryable =
    requires(G const& g, typename G::node_type const& u) {
        typename G::node_type;
        typename G::weight_type;
        { g.node_count() } -> std::convertible_to<std::size_t>;
        { g.nodes() };
        { g.out_neighbors(u) };
        { g.has_node(u) } -> std::convertible_to<bool>;
        { g.directed() } -> std::convertible_to<bool>;
    } &&
    node_key<typename G::node_type>;

/// A graph whose weights can drive shortest-path and spanning-tree search.
/// edge_weight(u, v) returns an optional-like weight of arc u->v.
template<typename G>
concept weighted_graph_queryable =
    graph_queryable<G> &&
    edge_weight<typename G::weight_type> &&
    requires(G const& g, typename G::node_type const& u) {
        { *g.edge_weight(u, u) } -> std::convertible_to<typename G::weight_type>;
    };

} // namespace gw::graph

#endif // GW_GRAPH_CONCEPTS_H
