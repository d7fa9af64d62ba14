// graph/graph.h - Umbrella header for the graphwalk graph library
// Part of the graphwalk graph library (C++20)
//
// Single-include convenience header.  Pulls in all graph library
// components: representation, traversal, path finding, cycle detection,
// components, ordering, spanning trees, construction helpers and traits.
//
// Usage:
//   #include <gw/graph/graph.h>
//
// graph_io.h is included as well; it depends on <ostream> only.

#ifndef GW_GRAPH_GRAPH_H
#define GW_GRAPH_GRAPH_H

// --- Core types & concepts ---
#include "graph_concepts.h"
#include "graph_traits.h"
#include "observer.h"

// --- Representation ---
#include "adjacency_graph.h"

// --- Construction ---
#include "from_grid.h"

// --- Algorithms ---
#include "traversal.h"
#include "shortest_path.h"
#include "path_search.h"
#include "cycle_detection.h"
#include "union_find.h"
#include "connected_components.h"
#include "scc.h"
#include "topological_sort.h"
#include "minimum_spanning_tree.h"

// --- Transforms ---
#include "transpose.h"

// --- I/O ---
#include "graph_io.h"

#endif // GW_GRAPH_GRAPH_H
