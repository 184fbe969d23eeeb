#ifndef __MINDMAZE_CAPI_H___
#define __MINDMAZE_CAPI_H___

/**
 * @file mindmaze_capi.h
 * @brief Plain C entry points of the search engine, for ctypes and other FFIs.
 *
 * No function throws; failures come back as negative status codes. Output
 * pointers are only written on success unless stated otherwise.
 */

#ifdef __cplusplus
extern "C" {
#endif

/* mindmaze_path_length */
#define MINDMAZE_PATH_FOUND 1
#define MINDMAZE_PATH_UNREACHABLE 0
#define MINDMAZE_PATH_BAD_ARGUMENTS (-1)
#define MINDMAZE_PATH_BAD_MAZE (-2)

/* mindmaze_jug_min_moves */
#define MINDMAZE_JUG_INFEASIBLE (-1)
#define MINDMAZE_JUG_BAD_ARGUMENTS (-2)

/* mindmaze_generate_maze_to_file */
#define MINDMAZE_GENERATE_OK 0
#define MINDMAZE_GENERATE_BAD_ARGUMENTS (-1)
#define MINDMAZE_GENERATE_BUFFER_TOO_SMALL (-2)
#define MINDMAZE_GENERATE_FAILED (-3)

/**
 * Search the maze stored in `input_file`; `strategy` 0 is BFS, 1 is DFS.
 *
 * On success `out_length` receives the number of edges on the path (-1 when
 * the goal is unreachable), `out_expanded` the expansion count and
 * `out_time_ms` the search time.
 *
 * Returns MINDMAZE_PATH_FOUND, MINDMAZE_PATH_UNREACHABLE,
 * MINDMAZE_PATH_BAD_ARGUMENTS (null pointer, unknown strategy) or
 * MINDMAZE_PATH_BAD_MAZE (unreadable or invalid file).
 */
int mindmaze_path_length(const char* input_file, int strategy, double* out_time_ms, int* out_length,
                         int* out_expanded);

/**
 * Minimal number of moves to measure `target` with `jug_count` jugs starting
 * empty. `out_visited` receives the number of states the search expanded,
 * also when the target is infeasible.
 *
 * Returns the move count, MINDMAZE_JUG_INFEASIBLE, or
 * MINDMAZE_JUG_BAD_ARGUMENTS (null pointer, no jugs, bad capacity or target).
 */
int mindmaze_jug_min_moves(const int* capacities, int jug_count, int target, int* out_visited);

/**
 * Generate a maze level and write it into `out_dir` (created if needed) as
 * `maze_<rows>x<cols>_t<pairs>_s<seed>.maze`. The same arguments always
 * produce the same file. The full path is copied NUL-terminated into
 * `out_path_buf`; nothing is written when it does not fit.
 *
 * Returns MINDMAZE_GENERATE_OK, MINDMAZE_GENERATE_BAD_ARGUMENTS,
 * MINDMAZE_GENERATE_BUFFER_TOO_SMALL or MINDMAZE_GENERATE_FAILED (invalid
 * size, I/O error).
 */
int mindmaze_generate_maze_to_file(int rows, int cols, int teleporter_pairs, unsigned int seed, const char* out_dir,
                                   char* out_path_buf, int out_path_buf_len);

#ifdef __cplusplus
}
#endif

#endif // __MINDMAZE_CAPI_H___
