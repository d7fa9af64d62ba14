// graph/construction/from_grid.h - Character-grid-to-graph factory
// Part of the graphwalk graph library (C++20)
//
// DESIGN RATIONALE:
// Mazes and floor plans are the usual teaching input for path search.
// from_grid converts rows of characters into an undirected
// adjacency_graph keyed by grid_cell:
//   open cell -> node, 4-neighbour step between open cells -> edge
//
// Nodes are inserted in row-major order before any edge, so nodes() is
// row-major.  Edges are added for the right and down steps of each cell
// while scanning; being undirected, each also covers the opposite step.
// Every edge has weight 1, so BFS and Dijkstra agree on path length.
//
// Ragged input is accepted: a cell past the end of its row is a wall.
//
// Example:
//   auto maze = from_grid({"S.#",
//                          "..E"});
//   // maze.graph.node_count() == 5
//   // *maze.start == grid_cell{0, 0}, *maze.goal == grid_cell{1, 2}

#ifndef GW_GRAPH_FROM_GRID_H
#define GW_GRAPH_FROM_GRID_H

#include "adjacency_graph.h"
#include "graph_concepts.h"

#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace gw::graph {

/// A (row, col) position in a character grid.
struct grid_cell {
    std::size_t row = 0;
    std::size_t col = 0;

    friend bool operator==(grid_cell const&, grid_cell const&) = default;
};

} // namespace gw::graph

template<>
struct std::hash<gw::graph::grid_cell> {
    std::size_t operator()(gw::graph::grid_cell const& c) const noexcept {
        std::size_t const h = std::hash<std::size_t>{}(c.row);
        return h ^ (std::hash<std::size_t>{}(c.col) + 0x9e3779b97f4a7c15ULL +
                    (h << 6) + (h >> 2));
    }
};

namespace gw::graph {

/// Graph built from a grid plus the marked start and goal cells.
struct grid_graph {
    adjacency_graph<grid_cell> graph{graph_kind::undirected};
    std::optional<grid_cell> start;  // cell marked 'S'
    std::optional<grid_cell> goal;   // cell marked 'E'
};

namespace detail {

[[nodiscard]] inline bool
open_cell(std::vector<std::string> const& rows, std::size_t r, std::size_t c,
          char wall) noexcept {
    return r < rows.size() && c < rows[r].size() && rows[r][c] != wall;
}

} // namespace detail

/// Build an undirected unit-weight graph from a character grid.
///
/// Throws std::invalid_argument if more than one 'S' or 'E' is present.
[[nodiscard]] inline grid_graph
from_grid(std::vector<std::string> const& rows, char wall = '#') {
    grid_graph out;

    // Nodes first, row-major.
    for (std::size_t r = 0; r < rows.size(); ++r) {
        for (std::size_t c = 0; c < rows[r].size(); ++c) {
            if (!detail::open_cell(rows, r, c, wall)) continue;
            grid_cell const cell{r, c};
            out.graph.add_node(cell);

            if (rows[r][c] == 'S') {
                if (out.start) throw std::invalid_argument("from_grid: more than one 'S'");
                out.start = cell;
            } else if (rows[r][c] == 'E') {
                if (out.goal) throw std::invalid_argument("from_grid: more than one 'E'");
                out.goal = cell;
            }
        }
    }

    // Right and down steps.
    for (std::size_t r = 0; r < rows.size(); ++r) {
        for (std::size_t c = 0; c < rows[r].size(); ++c) {
            if (!detail::open_cell(rows, r, c, wall)) continue;
            if (detail::open_cell(rows, r, c + 1, wall)) {
                out.graph.add_edge(grid_cell{r, c}, grid_cell{r, c + 1});
            }
            if (detail::open_cell(rows, r + 1, c, wall)) {
                out.graph.add_edge(grid_cell{r, c}, grid_cell{r + 1, c});
            }
        }
    }
    return out;
}

/// Copy of rows with the interior cells of p overwritten by mark.  The
/// first and last cells (start and goal) keep their characters.
[[nodiscard]] inline std::vector<std::string>
render_path(std::vector<std::string> rows, path<grid_cell> const& p,
            char mark = '*') {
    for (std::size_t i = 1; i + 1 < p.size(); ++i) {
        auto const& cell = p[i];
        if (cell.row < rows.size() && cell.col < rows[cell.row].size()) {
            rows[cell.row][cell.col] = mark;
        }
    }
    return rows;
}

} // namespace gw::graph

#endif // GW_GRAPH_FROM_GRID_H
