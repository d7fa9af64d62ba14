// examples/graph/example_maze_solver.cpp - BFS: Solving a Character Maze
//
// A maze drawn as text becomes an undirected grid graph: every open cell
// is a node and adjacent open cells are joined by unit-weight edges.
// BFS finds a route with the fewest steps; DFS finds *a* route, usually
// a longer one.  Both are drawn back onto the maze.
//
// Compile:
//   g++ -std=c++20 -O2 -I include -o example_maze_solver examples/graph/example_maze_solver.cpp

#include <gw/graph/from_grid.h>
#include <gw/graph/path_search.h>
#include <gw/graph/shortest_path.h>
#include <gw/graph/traversal.h>

#include <iostream>
#include <string>
#include <vector>

using namespace gw::graph;

// =========================================================================
// Maze
// =========================================================================
//
//   S  start        #  wall
//   E  exit         .  open floor

std::vector<std::string> const maze_rows = {
    "S.#.......",
    ".##.####..",
    "...#...#.#",
    "#.#..#.#..",
    "..#.##....",
    ".##...###.",
    "....#....E",
};

void print_rows(std::vector<std::string> const& rows) {
    for (auto const& row : rows) std::cout << "  " << row << "\n";
}

int main() {
    auto maze = from_grid(maze_rows);

    std::cout << "=== Maze Solver: BFS vs DFS ===\n\n";
    print_rows(maze_rows);
    std::cout << "\nOpen cells: " << maze.graph.node_count()
              << ", corridors: " << maze.graph.edge_count() << "\n";

    if (!maze.start || !maze.goal) {
        std::cout << "Maze needs both S and E.\n";
        return 1;
    }

    auto const bfs_route = shortest_path(maze.graph, *maze.start, *maze.goal);
    if (!bfs_route) {
        std::cout << "\nNo way out.\n";
        return 0;
    }
    std::cout << "\nShortest route (BFS): " << bfs_route->size() - 1 << " steps\n";
    print_rows(render_path(maze_rows, *bfs_route));

    auto const dfs_route = find_any_path(maze.graph, *maze.start, *maze.goal);
    if (dfs_route) {
        std::cout << "\nFirst route found by DFS: " << dfs_route->size() - 1 << " steps\n";
        print_rows(render_path(maze_rows, *dfs_route, '+'));
    }

    // How much of the maze each search had to look at.
    auto const levels = bfs_levels(maze.graph, *maze.start);
    std::cout << "\nBFS frontier sizes by distance from S:\n  ";
    for (auto const& level : levels) std::cout << level.size() << ' ';
    std::cout << "\n";
    return 0;
}
