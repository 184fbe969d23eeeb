#ifndef __WATER_JUG_SOLVER_HPP___
#define __WATER_JUG_SOLVER_HPP___

/**
 * @file water-jug-solver.hpp
 * @brief Water-jug puzzle as a state space, solved with breadth-first search.
 *
 * A state holds the fill level of every jug. From a state a jug can be
 * filled, emptied, or poured into another jug until the source is empty or the
 * destination is full. The goal is any jug holding exactly `target`.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "trace_events.hpp"

/// Fill level per jug, same order as the capacities.
using JugState = std::vector<int>;

/// Upper bound on prod(capacity_i + 1) accepted by the solver.
constexpr size_t JUG_MAX_STATES = 4194304;

enum class JugAction { Fill, Empty, Pour };

/**
 * @brief One transition. `source` is the jug acted on; `target` is the
 * receiving jug for a pour and -1 otherwise. `amount` is the water moved.
 */
struct JugMove {
    JugAction action;
    int source;
    int target;
    int amount;

    bool operator==(const JugMove& rhs) const {
        return action == rhs.action && source == rhs.source && target == rhs.target && amount == rhs.amount;
    }
    bool operator!=(const JugMove& rhs) const { return !(*this == rhs); }

    /// Short label, e.g. "Pour jug 2 into jug 1" (jugs numbered from 1).
    std::string label() const;
    /// Longer text, e.g. "Pour 3L from jug 2 to jug 1".
    std::string description() const;
};

/**
 * @brief Validated jug problem descriptor.
 */
class JugPuzzle {

private:
    std::vector<int> capacities;
    int target;
    JugState start;
public:
    /**
     * @brief Construct a puzzle starting from all-empty jugs.
     *
     * @param capacities One positive capacity per jug.
     * @param target Non-negative amount to measure.
     * @throws std::invalid_argument on an empty or non-positive capacity list,
     *         a negative target, or a state space larger than JUG_MAX_STATES.
     */
    JugPuzzle(const std::vector<int>& capacities, int target);

    /**
     * @brief Construct a puzzle with explicit starting levels.
     *
     * @throws std::invalid_argument additionally when `start` has the wrong
     *         length or a level outside [0, capacity].
     */
    JugPuzzle(const std::vector<int>& capacities, int target, const JugState& start);

    const std::vector<int>& get_capacities() const;
    int get_target() const;
    const JugState& get_start() const;

    /**
     * @brief Whether `target % gcd(capacities) == 0 && target <= max(capacities)`.
     */
    bool is_feasible() const;

    /**
     * @brief Whether some jug in `state` holds exactly the target.
     */
    bool is_goal(const JugState& state) const;
};

struct JugSuccessor {
    JugMove move;
    JugState state;
};

/**
 * @brief All state-changing transitions from `state`, in the fixed order:
 * fill jugs ascending, empty jugs ascending, pours (i, j) with i then j ascending.
 */
std::vector<JugSuccessor> jug_successors(const JugState& state, const std::vector<int>& capacities);

/**
 * @brief Apply one move to a state.
 *
 * @throws std::invalid_argument if the move does not match a legal transition.
 */
JugState apply_jug_move(const JugState& state, const std::vector<int>& capacities, const JugMove& move);

/**
 * @brief Feasibility rule: target is a multiple of the gcd and fits the largest jug.
 */
bool is_jug_target_feasible(const std::vector<int>& capacities, int target);

enum class JugOutcome { Solved, Infeasible };

/**
 * @brief Solver result. `states` lists the start state followed by the state
 * after each move, so `states.size() == moves.size() + 1` when solved.
 */
struct JugSolution {
    JugOutcome outcome = JugOutcome::Infeasible;
    std::vector<JugMove> moves;
    std::vector<JugState> states;
    int states_visited = 0;

    bool solved() const { return outcome == JugOutcome::Solved; }
};

/**
 * @brief Shortest move sequence from the puzzle's start state.
 *
 * An infeasible target returns `Infeasible` immediately, without searching.
 *
 * @param puzzle Validated descriptor.
 * @param trace Optional sink receiving `Visited(state, depth)` per expansion.
 */
JugSolution solve_jug(const JugPuzzle& puzzle, TraceSink<JugState>* trace = nullptr);

/**
 * @brief Shortest move sequence from all-empty jugs.
 *
 * @throws std::invalid_argument on malformed capacities or target.
 */
JugSolution solve_jug(const std::vector<int>& capacities, int target, TraceSink<JugState>* trace = nullptr);

enum class HintStatus { Move, AlreadySolved, NoSolution };

struct JugHint {
    HintStatus status = HintStatus::NoSolution;
    std::optional<JugMove> move;
    /// Length of the shortest solution from the current state, -1 without one.
    int moves_remaining = -1;
};

/**
 * @brief First move of a shortest solution from the player's current state.
 *
 * Repeated calls from the same state return the same move.
 *
 * @param capacities Jug capacities.
 * @param current Current fill levels.
 * @param target Amount to measure.
 * @throws std::invalid_argument on malformed input.
 */
JugHint jug_hint(const std::vector<int>& capacities, const JugState& current, int target);

#endif // __WATER_JUG_SOLVER_HPP___
