#include <vector>

#include "capi_support.hpp"
#include "mindmaze_capi.h"
#include "water-jug-solver.hpp"

int mindmaze_jug_min_moves(const int* capacities, int jug_count, int target, int* out_visited) {
    if (!capacities || jug_count <= 0 || !out_visited) return MINDMAZE_JUG_BAD_ARGUMENTS;

    // solve_jug rejects bad capacities and targets with std::invalid_argument
    return capi::guarded(MINDMAZE_JUG_BAD_ARGUMENTS, [&]() {
        JugSolution solution = solve_jug(std::vector<int>(capacities, capacities + jug_count), target);
        *out_visited = solution.states_visited;
        return solution.solved() ? static_cast<int>(solution.moves.size()) : MINDMAZE_JUG_INFEASIBLE;
    });
}
