#include <chrono>
#include <string>

#include "capi_support.hpp"
#include "maze-path-solver.hpp"
#include "maze_file_operations.hpp"
#include "mindmaze_capi.h"

int mindmaze_path_length(const char* input_file, int strategy, double* out_time_ms, int* out_length,
                         int* out_expanded) {
    if (!input_file || !out_time_ms || !out_length || !out_expanded) return MINDMAZE_PATH_BAD_ARGUMENTS;
    if (strategy != 0 && strategy != 1) return MINDMAZE_PATH_BAD_ARGUMENTS;

    return capi::guarded(MINDMAZE_PATH_BAD_MAZE, [&]() {
        MazeProblem maze = read_maze_from_file(input_file);
        auto t0 = std::chrono::steady_clock::now();
        PathResult result = find_path(maze, strategy == 0 ? SearchStrategy::BFS : SearchStrategy::DFS);
        auto t1 = std::chrono::steady_clock::now();

        *out_time_ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
        *out_length = result.length();
        *out_expanded = result.cells_expanded;
        return result.found() ? MINDMAZE_PATH_FOUND : MINDMAZE_PATH_UNREACHABLE;
    });
}
