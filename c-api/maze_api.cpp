#include <filesystem>
#include <random>
#include <string>

#include "capi_support.hpp"
#include "generate_maze.hpp"
#include "maze_file_operations.hpp"
#include "mindmaze_capi.h"

namespace fs = std::filesystem;

namespace {

std::string maze_file_name(int rows, int cols, int teleporter_pairs, unsigned int seed) {
    return "maze_" + std::to_string(rows) + "x" + std::to_string(cols) + "_t" + std::to_string(teleporter_pairs) +
           "_s" + std::to_string(seed) + ".maze";
}

} // namespace

int mindmaze_generate_maze_to_file(int rows, int cols, int teleporter_pairs, unsigned int seed, const char* out_dir,
                                   char* out_path_buf, int out_path_buf_len) {
    if (!out_dir || !out_path_buf || out_path_buf_len <= 0) return MINDMAZE_GENERATE_BAD_ARGUMENTS;

    return capi::guarded(MINDMAZE_GENERATE_FAILED, [&]() {
        std::string path = (fs::path(out_dir) / maze_file_name(rows, cols, teleporter_pairs, seed)).string();
        if (!capi::fits(path, out_path_buf_len)) return MINDMAZE_GENERATE_BUFFER_TOO_SMALL;

        std::mt19937 rng(seed);
        MazeProblem maze = random_maze(rows, cols, teleporter_pairs, rng);
        fs::create_directories(out_dir);
        write_maze_to_file(maze, path);
        capi::copy_out(path, out_path_buf);
        return MINDMAZE_GENERATE_OK;
    });
}
