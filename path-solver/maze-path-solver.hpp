#ifndef __MAZE_PATH_SOLVER_HPP___
#define __MAZE_PATH_SOLVER_HPP___

/**
 * @file maze-path-solver.hpp
 * @brief Breadth-first and depth-first path search over a `GridGraph`.
 */

#include <string>
#include <vector>

#include "grid_graph.hpp"
#include "trace_events.hpp"

enum class SearchStrategy { BFS, DFS };

enum class PathOutcome { Found, Unreachable };

/**
 * @brief Outcome of a maze search.
 *
 * `path` holds the cells from start to goal inclusive when `outcome` is
 * `Found`, and is empty when the goal is unreachable.
 */
struct PathResult {
    PathOutcome outcome = PathOutcome::Unreachable;
    std::vector<Cell> path;
    int cells_expanded = 0;

    bool found() const { return outcome == PathOutcome::Found; }
    /// Number of edges on the path, -1 when unreachable.
    int length() const { return found() ? static_cast<int>(path.size()) - 1 : -1; }
};

/**
 * @brief Find a path from `start` to `goal`.
 *
 * BFS returns a path with the fewest edges (a teleporter jump is one edge).
 * DFS returns some valid path. Neighbours are expanded up, right, down, left,
 * then teleporter, so both results are deterministic.
 *
 * @param graph Maze to search.
 * @param start Open start cell.
 * @param goal Open goal cell.
 * @param strategy BFS or DFS.
 * @param trace Optional sink; receives one `Visited` and one `FrontierSnapshot`
 *        per expansion, in exploration order.
 * @throws std::invalid_argument if start or goal is outside the grid or blocked.
 * @return Path or `Unreachable`.
 */
PathResult find_path(const GridGraph& graph, const Cell& start, const Cell& goal,
                     SearchStrategy strategy, TraceSink<Cell>* trace = nullptr);

/**
 * @brief Convenience overload taking a validated maze descriptor.
 */
PathResult find_path(const MazeProblem& problem, SearchStrategy strategy, TraceSink<Cell>* trace = nullptr);

std::string strategy_name(SearchStrategy strategy);

#endif // __MAZE_PATH_SOLVER_HPP___
