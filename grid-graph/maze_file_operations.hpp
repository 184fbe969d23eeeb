#ifndef __MAZE_FILE_OPERATIONS_HPP___
#define __MAZE_FILE_OPERATIONS_HPP___

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "grid_graph.hpp"

/**
 * @file maze_file_operations.hpp
 * @brief Helpers to read/write `MazeProblem` values from plain text files.
 *
 * File format:
 *   rows cols
 *   start_row start_col goal_row goal_col
 *   <rows lines of `.` (open) and `#` (blocked)>
 *   teleporter_count
 *   from_row from_col to_row to_col bidirectional(0|1)   (one per teleporter)
 */

/**
 * @brief Read a `MazeProblem` from a plain-text file.
 *
 * @param filename Path to the input file.
 * @throws std::runtime_error if the file cannot be opened or is truncated.
 * @throws std::invalid_argument if the maze it describes is malformed.
 * @return Constructed `MazeProblem`.
 */
inline MazeProblem read_maze_from_file(const std::string& filename) {
    std::ifstream infile(filename);
    if (!infile.is_open()) {
        throw std::runtime_error("Could not open file: " + filename);
    }
    int rows = 0, cols = 0;
    Cell start{}, goal{};
    infile >> rows >> cols >> start.row >> start.col >> goal.row >> goal.col;
    if (!infile) {
        throw std::runtime_error("Malformed maze header in: " + filename);
    }
    std::vector<std::string> lines(rows > 0 ? rows : 0);
    for (auto& line : lines) {
        infile >> line;
    }
    int teleporter_count = 0;
    infile >> teleporter_count;
    if (!infile) {
        throw std::runtime_error("Truncated maze file: " + filename);
    }
    std::vector<Teleporter> teleporters;
    for (int i = 0; i < teleporter_count; ++i) {
        Teleporter t{};
        int bidirectional = 0;
        infile >> t.from.row >> t.from.col >> t.to.row >> t.to.col >> bidirectional;
        if (!infile) {
            throw std::runtime_error("Truncated teleporter list in: " + filename);
        }
        t.bidirectional = bidirectional != 0;
        teleporters.push_back(t);
    }
    GridGraph graph = GridGraph::from_rows(lines, teleporters);
    if (graph.get_rows() != rows || graph.get_cols() != cols) {
        throw std::runtime_error("Maze size does not match header in: " + filename);
    }
    return MazeProblem(graph, start, goal);
}

/**
 * @brief Write a `MazeProblem` to a plain-text file.
 *
 * @param problem Maze to serialize.
 * @param filename Output file path.
 * @throws std::runtime_error if the file cannot be opened for writing.
 */
inline void write_maze_to_file(const MazeProblem& problem, const std::string& filename) {
    std::ofstream outfile(filename);
    if (!outfile.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + filename);
    }
    const GridGraph& g = problem.graph;
    outfile << g.get_rows() << " " << g.get_cols() << "\n";
    outfile << problem.start.row << " " << problem.start.col << " "
            << problem.goal.row << " " << problem.goal.col << "\n";
    for (int r = 0; r < g.get_rows(); ++r) {
        for (int c = 0; c < g.get_cols(); ++c) {
            outfile << (g.is_blocked({r, c}) ? '#' : '.');
        }
        outfile << "\n";
    }
    outfile << g.get_teleporters().size() << "\n";
    for (const Teleporter& t : g.get_teleporters()) {
        outfile << t.from.row << " " << t.from.col << " " << t.to.row << " " << t.to.col << " "
                << (t.bidirectional ? 1 : 0) << "\n";
    }
}

#endif // __MAZE_FILE_OPERATIONS_HPP___
