// graph/graph_traits.h - Type traits decoupling storage from algorithms
// Part of the graphwalk graph library (C++20)
//
// DESIGN RATIONALE:
// graph_traits<G> is the single customisation point that tells algorithms
// how to allocate per-call working state (visited sets, distance maps,
// predecessor maps) for a given graph type.  Algorithms never name the
// container types directly, so a graph with a different key or hash
// policy only needs a new specialisation.
//
// Each specialisation provides:
//   - node_type / weight_type: key and weight types of the graph
//   - node_map<T>: associative container keyed by node_type
//   - node_set: set of node_type
//   - make_node_map<T>(g): construct an empty map sized for g
//   - make_node_set(g): construct an empty set sized for g
//
// The primary template is intentionally undefined so that a compilation error
// for unsupported graph types gives a clear diagnostic.

#ifndef GW_GRAPH_TRAITS_H
#define GW_GRAPH_TRAITS_H

#include <cstddef>
#include <type_traits>

namespace gw::graph {

// =============================================================================
// Primary template (intentionally incomplete, must be specialised)
// =============================================================================

/// Primary graph_traits template.
///
/// To support a new graph type, provide a full specialisation.
template<typename G>
struct graph_traits;  // must be specialised

/// Const-qualified: strips const and delegates.
template<typename G>
struct graph_traits<G const> : graph_traits<G> {};

// =============================================================================
// Convenience aliases
// =============================================================================

/// The node key type for graph G.
template<typename G>
using node_t = typename graph_traits<G>::node_type;

/// The edge weight type for graph G.
template<typename G>
using weight_t = typename graph_traits<G>::weight_type;

/// Per-call node-keyed map for graph G.
template<typename G, typename T>
using node_map_t = typename graph_traits<G>::template node_map<T>;

/// Per-call node set for graph G.
template<typename G>
using node_set_t = typename graph_traits<G>::node_set;

} // namespace gw::graph

#endif // GW_GRAPH_TRAITS_H
