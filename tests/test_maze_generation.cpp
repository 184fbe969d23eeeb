// Google Test for maze generation and the maze file format
#include <gtest/gtest.h>
#include <cstdio>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "generate_maze.hpp"
#include "grid_graph.hpp"
#include "maze_file_operations.hpp"
#include "maze-path-solver.hpp"

TEST(MazeGeneration, SameSeedSameMaze) {
    std::mt19937 a(11), b(11);
    EXPECT_EQ(carve_maze_rows(15, 20, a), carve_maze_rows(15, 20, b));
}

TEST(MazeGeneration, CarvedMazeIsPerfect) {
    std::mt19937 rng(5);
    std::vector<std::string> rows = carve_maze_rows(11, 15, rng);
    GridGraph g = GridGraph::from_rows(rows);

    // border stays walled
    for (int c = 0; c < 15; ++c) {
        EXPECT_EQ(rows[0][c], '#');
        EXPECT_EQ(rows[10][c], '#');
    }
    int open = 0, edges = 0;
    for (int r = 0; r < 11; ++r) {
        for (int c = 0; c < 15; ++c) {
            if (rows[r][c] != '.') continue;
            ++open;
            edges += static_cast<int>(g.get_neighbors({r, c}).size());
        }
    }
    // every room is carved
    for (int r = 1; r < 11; r += 2)
        for (int c = 1; c < 15; c += 2) EXPECT_EQ(rows[r][c], '.');
    // a tree: one edge fewer than cells
    EXPECT_EQ(edges / 2, open - 1);
    EXPECT_EQ(open, 5 * 7 + (5 * 7 - 1));
}

TEST(MazeGeneration, GoalReachableForEverySize) {
    for (int rows = 4; rows <= 9; ++rows) {
        for (int cols = 4; cols <= 9; ++cols) {
            std::mt19937 rng(static_cast<unsigned int>(rows * 31 + cols));
            MazeProblem maze = random_maze(rows, cols, 1, rng);
            EXPECT_EQ(maze.start, (Cell{1, 1}));
            EXPECT_EQ(maze.goal, (Cell{rows - 2, cols - 2}));
            EXPECT_TRUE(find_path(maze, SearchStrategy::BFS).found()) << rows << "x" << cols;
        }
    }
}

TEST(MazeGeneration, TeleportersAvoidStartAndGoal) {
    std::mt19937 rng(9);
    MazeProblem maze = random_maze(15, 20, 2, rng);
    const auto& teleporters = maze.graph.get_teleporters();
    ASSERT_EQ(teleporters.size(), 2u);
    for (const Teleporter& t : teleporters) {
        EXPECT_TRUE(t.bidirectional);
        EXPECT_NE(t.from, maze.start);
        EXPECT_NE(t.to, maze.goal);
        EXPECT_FALSE(maze.graph.is_blocked(t.from));
        EXPECT_FALSE(maze.graph.is_blocked(t.to));
    }
}

TEST(MazeGeneration, InvalidSizesThrow) {
    std::mt19937 rng(1);
    EXPECT_THROW(carve_maze_rows(2, 5, rng), std::invalid_argument);
    EXPECT_THROW(random_maze(3, 10, 0, rng), std::invalid_argument);
    EXPECT_THROW(random_maze(10, 10, -1, rng), std::invalid_argument);
}

TEST(MazeFile, WriteThenReadKeepsTheMaze) {
    std::mt19937 rng(21);
    MazeProblem maze = random_maze(11, 13, 2, rng);
    std::string file = ::testing::TempDir() + "mindmaze_roundtrip.maze";
    write_maze_to_file(maze, file);
    MazeProblem back = read_maze_from_file(file);
    std::remove(file.c_str());

    EXPECT_EQ(back.start, maze.start);
    EXPECT_EQ(back.goal, maze.goal);
    EXPECT_EQ(back.graph.get_blocked_cells(), maze.graph.get_blocked_cells());
    ASSERT_EQ(back.graph.get_teleporters().size(), maze.graph.get_teleporters().size());
    EXPECT_EQ(find_path(back, SearchStrategy::BFS).path, find_path(maze, SearchStrategy::BFS).path);
}

TEST(MazeFile, MissingFileThrows) {
    EXPECT_THROW(read_maze_from_file("/nonexistent/dir/none.maze"), std::runtime_error);
}
