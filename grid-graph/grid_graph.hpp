/**
 * @file grid_graph.hpp
 * @brief Maze grid with blocked cells and teleporter edges.
 *
 * This header declares the Cell coordinate, the GridGraph used by the maze
 * searches, and the MazeProblem descriptor (graph plus start and goal).
 */

#ifndef __GRID_GRAPH_HPP___
#define __GRID_GRAPH_HPP___

#include <optional>
#include <string>
#include <vector>

/**
 * @brief A (row, column) coordinate in a maze grid.
 */
struct Cell {
    int row;
    int col;

    bool operator==(const Cell& rhs) const { return row == rhs.row && col == rhs.col; }
    bool operator!=(const Cell& rhs) const { return !(*this == rhs); }
    bool operator<(const Cell& rhs) const { return row != rhs.row ? row < rhs.row : col < rhs.col; }
};

/**
 * @brief Zero-cost jump between two non-adjacent cells.
 *
 * A bidirectional teleporter adds the edge in both directions; otherwise only
 * `from -> to` exists.
 */
struct Teleporter {
    Cell from;
    Cell to;
    bool bidirectional;
};

/**
 * @brief Rectangular maze of open and blocked cells plus teleporter edges.
 *
 * Adjacency is the 4-neighbourhood restricted to open cells, plus at most one
 * outgoing teleporter per cell. The graph may be disconnected. Instances are
 * immutable after construction.
 */
class GridGraph {

private:
    int rows = 0;
    int cols = 0;
    std::vector<bool> blocked;
    std::vector<int> teleport_target;   // cell index, -1 when none
    std::vector<Teleporter> teleporters;
    void init(int rows, int cols, const std::vector<Cell>& blocked_cells, const std::vector<Teleporter>& teleporters);
public:
    /**
     * @brief Build a grid from its dimensions, blocked cells and teleporters.
     *
     * @param rows Number of rows (> 0).
     * @param cols Number of columns (> 0).
     * @param blocked_cells Cells that cannot be entered.
     * @param teleporters Teleporter edges; endpoints must be open, distinct cells.
     * @throws std::invalid_argument on out-of-grid cells, blocked or duplicated
     *         teleporter endpoints, or a cell with two outgoing teleporters.
     */
    GridGraph(int rows, int cols, const std::vector<Cell>& blocked_cells,
              const std::vector<Teleporter>& teleporters = {});

    /**
     * @brief Build a grid from text rows, `#` marks a blocked cell.
     *
     * @param lines One string per row; all rows must have the same length.
     * @param teleporters Teleporter edges.
     * @throws std::invalid_argument on empty input or ragged rows.
     */
    static GridGraph from_rows(const std::vector<std::string>& lines,
                               const std::vector<Teleporter>& teleporters = {});

    int get_rows() const;
    int get_cols() const;

    /**
     * @brief Whether the coordinate lies inside the grid.
     */
    bool contains(const Cell& cell) const;

    /**
     * @brief Whether the cell is blocked. Cells outside the grid count as blocked.
     */
    bool is_blocked(const Cell& cell) const;

    /**
     * @brief Outgoing teleporter target of a cell, if it has one.
     */
    std::optional<Cell> get_teleport_target(const Cell& cell) const;

    /**
     * @brief Adjacent open cells in the fixed order up, right, down, left,
     * followed by the teleporter target when present.
     *
     * @param cell An open cell inside the grid.
     * @return Reachable neighbours in expansion order.
     */
    std::vector<Cell> get_neighbors(const Cell& cell) const;

    /**
     * @brief Row-major index of a cell (0..rows*cols-1).
     */
    int index_of(const Cell& cell) const;

    /**
     * @brief Inverse of index_of().
     */
    Cell cell_at(int index) const;

    /**
     * @brief Teleporters as declared at construction.
     */
    const std::vector<Teleporter>& get_teleporters() const;

    /**
     * @brief Every blocked cell in row-major order.
     */
    std::vector<Cell> get_blocked_cells() const;
};

/**
 * @brief Maze search problem: a grid with an open start and goal cell.
 */
struct MazeProblem {
    GridGraph graph;
    Cell start;
    Cell goal;

    /**
     * @throws std::invalid_argument if start or goal is outside the grid or blocked.
     */
    MazeProblem(GridGraph graph, Cell start, Cell goal);
};

#endif // __GRID_GRAPH_HPP___
