// graph/test/test_from_grid.cpp - Tests for the character-grid factory and
//                                 maze solving on it
// Part of the graphwalk graph library (C++20)

#include <gw/graph/from_grid.h>
#include <gw/graph/path_search.h>
#include <gw/graph/shortest_path.h>
#include <gw/graph/traversal.h>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

using namespace gw::graph;

// =============================================================================
// Test grids
// =============================================================================

std::vector<std::string> sample_maze() {
    return {
        "S.#..",
        "..#.#",
        "#...#",
        "###..",
        "....E",
    };
}

// =============================================================================
// Construction
// =============================================================================

TEST(FromGrid, CellHashAndEquality) {
    std::unordered_set<grid_cell> cells{{0, 1}, {1, 0}, {0, 1}};
    EXPECT_EQ(cells.size(), 2u);
    EXPECT_EQ((grid_cell{2, 3}), (grid_cell{2, 3}));
    EXPECT_NE((grid_cell{2, 3}), (grid_cell{3, 2}));
}

TEST(FromGrid, TinyGrid) {
    auto maze = from_grid({"S.#",
                           "..E"});
    EXPECT_FALSE(maze.graph.directed());
    EXPECT_EQ(maze.graph.node_count(), 5u);
    // (0,0)-(0,1), (0,0)-(1,0), (0,1)-(1,1), (1,0)-(1,1), (1,1)-(1,2)
    EXPECT_EQ(maze.graph.edge_count(), 5u);
    ASSERT_TRUE(maze.start.has_value());
    ASSERT_TRUE(maze.goal.has_value());
    EXPECT_EQ(*maze.start, (grid_cell{0, 0}));
    EXPECT_EQ(*maze.goal, (grid_cell{1, 2}));
    EXPECT_FALSE(maze.graph.has_node(grid_cell{0, 2}));
}

TEST(FromGrid, NodesAreRowMajor) {
    auto maze = from_grid({"..",
                           ".."});
    std::vector<grid_cell> const expected{{0, 0}, {0, 1}, {1, 0}, {1, 1}};
    EXPECT_EQ(maze.graph.nodes(), expected);
    EXPECT_FALSE(maze.start.has_value());
    EXPECT_FALSE(maze.goal.has_value());
}

TEST(FromGrid, CustomWallAndRaggedRows) {
    auto maze = from_grid({"S.X.",
                           ".",
                           "..E"}, 'X');
    EXPECT_FALSE(maze.graph.has_node(grid_cell{0, 2}));
    EXPECT_FALSE(maze.graph.has_node(grid_cell{1, 1}));  // past row end
    EXPECT_TRUE(maze.graph.has_node(grid_cell{2, 2}));
    EXPECT_TRUE(maze.graph.has_edge(grid_cell{0, 0}, grid_cell{1, 0}));
    EXPECT_FALSE(maze.graph.has_edge(grid_cell{0, 1}, grid_cell{1, 1}));
}

TEST(FromGrid, DuplicateMarkersThrow) {
    EXPECT_THROW((void)from_grid({"S.S"}), std::invalid_argument);
    EXPECT_THROW((void)from_grid({"E", "E"}), std::invalid_argument);
}

TEST(FromGrid, UnitWeights) {
    auto maze = from_grid(sample_maze());
    for (auto const& e : maze.graph.edges()) {
        EXPECT_DOUBLE_EQ(e.weight, 1.0);
    }
}

// =============================================================================
// Maze solving
// =============================================================================

TEST(FromGrid, BfsSolvesSampleMaze) {
    auto maze = from_grid(sample_maze());
    auto p = shortest_path(maze.graph, *maze.start, *maze.goal);
    ASSERT_TRUE(p.has_value());
    // (0,0) (0,1) (1,1) (2,1) (2,2) (2,3) (3,3) (3,4) (4,4)
    EXPECT_EQ(p->size(), 9u);
    EXPECT_EQ(p->front(), *maze.start);
    EXPECT_EQ(p->back(), *maze.goal);
    for (std::size_t i = 1; i < p->size(); ++i) {
        EXPECT_TRUE(maze.graph.has_edge((*p)[i - 1], (*p)[i]));
    }
}

TEST(FromGrid, DijkstraAgreesWithBfs) {
    auto maze = from_grid(sample_maze());
    auto d = dijkstra(maze.graph, *maze.start, *maze.goal);
    ASSERT_TRUE(d.has_value());
    EXPECT_DOUBLE_EQ(d->cost, 8.0);
}

TEST(FromGrid, DfsFindsSomePath) {
    auto maze = from_grid(sample_maze());
    auto p = find_any_path(maze.graph, *maze.start, *maze.goal);
    ASSERT_TRUE(p.has_value());
    EXPECT_GE(p->size(), 9u);
}

TEST(FromGrid, BlockedMazeHasNoPath) {
    auto maze = from_grid({"S#.",
                           "##E"});
    EXPECT_FALSE(shortest_path(maze.graph, *maze.start, *maze.goal).has_value());
    EXPECT_EQ(bfs(maze.graph, *maze.start).size(), 1u);
}

TEST(FromGrid, RenderPathMarksInterior) {
    auto rows = sample_maze();
    auto maze = from_grid(rows);
    auto p = shortest_path(maze.graph, *maze.start, *maze.goal);
    ASSERT_TRUE(p.has_value());
    auto drawn = render_path(rows, *p);
    EXPECT_EQ(drawn[0][0], 'S');
    EXPECT_EQ(drawn[4][4], 'E');
    EXPECT_EQ(drawn[2][2], '*');
    EXPECT_EQ(drawn[0][2], '#');

    std::size_t stars = 0;
    for (auto const& row : drawn) {
        for (char c : row) stars += (c == '*');
    }
    EXPECT_EQ(stars, p->size() - 2);
}
