#ifndef __ADVERSARIAL_SOLVER_HPP___
#define __ADVERSARIAL_SOLVER_HPP___

/**
 * @file adversarial-solver.hpp
 * @brief Depth-limited minimax and alpha-beta search over a `Board`.
 *
 * Both algorithms search the same tree and return the same move and score;
 * alpha-beta only skips subtrees that cannot change the result. Every skipped
 * child is reported as a `Pruned` trace event so a viewer can show where the
 * cutoffs happened.
 */

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "board.hpp"
#include "trace_events.hpp"

enum class SearchAlgorithm { Minimax, AlphaBeta };

constexpr int MAX_SEARCH_DEPTH = 64;

/// Trace node of the adversarial search: the moves leading from the root.
using MovePath = std::vector<BoardMove>;

struct SearchConfig {
    SearchAlgorithm algorithm = SearchAlgorithm::AlphaBeta;
    int max_depth = 4;
    /// When set, iterative deepening from depth 1 until the budget runs out.
    std::optional<std::chrono::milliseconds> time_budget;
    /// Keep the trace of the returned iteration in `DecisionResult::trace`.
    bool record_trace = true;
};

struct SearchStats {
    long nodes_visited = 0;
    long nodes_pruned = 0;
    long leaf_evaluations = 0;
    long interior_nodes = 0;
    long moves_generated = 0;
    int max_ply = 0;
    std::chrono::microseconds elapsed{0};

    /// pruned / (visited + pruned), 0 for an empty search.
    double pruning_ratio() const;
    /// Average number of legal moves at an expanded node.
    double branching_factor() const;
};

/**
 * @brief Result of a decision.
 *
 * `move`, `score`, `trace` and the node counters describe the deepest fully
 * completed iteration; `stats.elapsed` covers the whole call.
 */
struct DecisionResult {
    BoardMove move;
    int score = 0;
    int depth_reached = 0;
    bool timed_out = false;
    std::vector<TraceEvent<MovePath>> trace;
    SearchStats stats;
};

/**
 * @brief Check the parts of a config that do not depend on the position.
 *
 * @throws std::invalid_argument on a depth outside [1, MAX_SEARCH_DEPTH] or a
 *         negative time budget.
 */
void validate_search_config(const SearchConfig& config);

/**
 * @brief Pick a move for `player` in `state`.
 *
 * Nodes where `player` is to move maximize, the others minimize. Terminal
 * nodes score `WIN_SCORE - ply` for a win of `player`, `-(WIN_SCORE - ply)`
 * for a loss and 0 for a draw; nodes at the depth limit use
 * `Board::evaluate`. Among equally scored moves the first in move order wins.
 *
 * @param board Rules of the game.
 * @param state Position to search from.
 * @param player Searching player; must be the side to move.
 * @param config Algorithm, depth and optional time budget.
 * @param sink Optional streaming sink; receives every event of every
 *        iteration, each iteration starting with `Visited` of the root.
 * @throws std::invalid_argument on a depth outside [1, MAX_SEARCH_DEPTH], a
 *         finished game, or when it is not `player`'s turn.
 */
DecisionResult choose_move(const Board& board, const BoardState& state, Player player,
                           const SearchConfig& config, TraceSink<MovePath>* sink = nullptr);

std::string algorithm_name(SearchAlgorithm algorithm);

#endif // __ADVERSARIAL_SOLVER_HPP___
