#ifndef __GENERATE_MAZE_HPP___
#define __GENERATE_MAZE_HPP___

#include <algorithm>
#include <array>
#include <cstddef>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "grid_graph.hpp"

/**
 * @file generate_maze.hpp
 * @brief Utilities to create random mazes for the maze level, benchmarks and tests.
 *
 * Mazes are carved with the recursive backtracker: every cell with odd row
 * and odd column is a room, the cells between rooms are walls that get
 * knocked down while the carver walks. The result is a perfect maze (exactly
 * one path between two rooms) until teleporters are added. The same seed
 * always produces the same maze.
 */

/**
 * @brief Carve a maze and return it as text rows (`.` open, `#` blocked).
 *
 * Carving starts at (1, 1) and moves two cells at a time in a shuffled
 * up/right/down/left order, opening the wall cell in between.
 *
 * @param rows Grid height (>= 3).
 * @param cols Grid width (>= 3).
 * @param rng Random number generator to use (std::mt19937).
 * @throws std::invalid_argument if the grid is smaller than 3 x 3.
 */
inline std::vector<std::string> carve_maze_rows(int rows, int cols, std::mt19937& rng) {
    if (rows < 3 || cols < 3) {
        throw std::invalid_argument("Maze must be at least 3x3");
    }
    std::vector<std::string> grid(rows, std::string(cols, '#'));

    struct Frame {
        Cell cell;
        std::array<Cell, 4> steps;
        int next;
    };
    const std::array<Cell, 4> directions = {{{-2, 0}, {0, 2}, {2, 0}, {0, -2}}};
    auto make_frame = [&](Cell c) {
        Frame f{c, directions, 0};
        std::shuffle(f.steps.begin(), f.steps.end(), rng);
        return f;
    };

    // explicit stack; large mazes would overflow the call stack otherwise
    std::vector<Frame> stack;
    grid[1][1] = '.';
    stack.push_back(make_frame({1, 1}));
    while (!stack.empty()) {
        Frame& top = stack.back();
        if (top.next == 4) {
            stack.pop_back();
            continue;
        }
        Cell step = top.steps[top.next++];
        Cell here = top.cell;
        Cell there{here.row + step.row, here.col + step.col};
        if (there.row <= 0 || there.row >= rows - 1 || there.col <= 0 || there.col >= cols - 1) continue;
        if (grid[there.row][there.col] != '#') continue;
        grid[here.row + step.row / 2][here.col + step.col / 2] = '.';
        grid[there.row][there.col] = '.';
        stack.push_back(make_frame(there));
    }
    return grid;
}

/**
 * @brief Generate a complete maze level: carved grid, start, goal and teleporters.
 *
 * Start is (1, 1) and goal is (rows - 2, cols - 2); both are forced open and
 * the goal is always reachable from the start.
 * Each teleporter pair joins two random open cells, bidirectionally, and never
 * uses the start, the goal or a cell that already has a teleporter. When the
 * maze runs out of free cells fewer pairs are placed.
 *
 * @param rows Grid height (>= 4).
 * @param cols Grid width (>= 4).
 * @param teleporter_pairs Number of teleporter pairs to place (>= 0).
 * @param rng Random number generator to use (std::mt19937).
 * @return A valid `MazeProblem`.
 */
inline MazeProblem random_maze(int rows, int cols, int teleporter_pairs, std::mt19937& rng) {
    if (rows < 4 || cols < 4) {
        throw std::invalid_argument("Maze level must be at least 4x4");
    }
    if (teleporter_pairs < 0) {
        throw std::invalid_argument("Teleporter pair count cannot be negative");
    }
    std::vector<std::string> lines = carve_maze_rows(rows, cols, rng);
    Cell start{1, 1};
    Cell goal{rows - 2, cols - 2};
    lines[start.row][start.col] = '.';
    lines[goal.row][goal.col] = '.';
    // with even sides the goal sits diagonal to the nearest room; open a link
    if (goal.row % 2 == 0 && goal.col % 2 == 0) lines[goal.row - 1][goal.col] = '.';

    std::vector<Cell> free_cells;
    for (int r = 1; r < rows - 1; ++r) {
        for (int c = 1; c < cols - 1; ++c) {
            Cell cell{r, c};
            if (lines[r][c] == '.' && cell != start && cell != goal) free_cells.push_back(cell);
        }
    }

    std::vector<Teleporter> teleporters;
    for (int i = 0; i < teleporter_pairs && free_cells.size() >= 2; ++i) {
        Cell ends[2];
        for (Cell& end : ends) {
            std::uniform_int_distribution<size_t> dist(0, free_cells.size() - 1);
            size_t pick = dist(rng);
            end = free_cells[pick];
            free_cells.erase(free_cells.begin() + static_cast<std::ptrdiff_t>(pick));
        }
        teleporters.push_back({ends[0], ends[1], true});
    }
    return MazeProblem(GridGraph::from_rows(lines, teleporters), start, goal);
}

#endif // __GENERATE_MAZE_HPP___
