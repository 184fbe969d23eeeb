#include <chrono>
#include <iostream>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>

#include "grid_graph.hpp"
#include "maze_file_operations.hpp"
#include "generate_maze.hpp"
#include "maze-path-solver.hpp"

using namespace std;

int main(int argc, char** argv) {
    int rows = 15;
    int cols = 20;
    int teleporter_pairs = 2;
    unsigned int seed = (unsigned int)chrono::high_resolution_clock::now().time_since_epoch().count();
    string input_file;

    // Simple argument parsing
    try {
        for (int i = 1; i < argc; ++i) {
            string a = argv[i];
            if (a == "--rows" && i + 1 < argc) { rows = stoi(argv[++i]); }
            else if (a == "--cols" && i + 1 < argc) { cols = stoi(argv[++i]); }
            else if (a == "--teleporters" && i + 1 < argc) { teleporter_pairs = stoi(argv[++i]); }
            else if (a == "--seed" && i + 1 < argc) { seed = (unsigned int)stoul(argv[++i]); }
            else if (a == "--input-file" && i + 1 < argc) { input_file = argv[++i]; }
            else if (a == "--help") {
                cout << "Usage: benchmark-path [--input-file F | --rows R --cols C --teleporters P --seed S]\n";
                return 0;
            }
        }
    } catch (const std::exception& e) {
        cerr << "Invalid argument value: " << e.what() << '\n';
        return 1;
    }

    auto load = [&]() {
        if (!input_file.empty()) return read_maze_from_file(input_file);
        mt19937 rng(seed);
        return random_maze(rows, cols, teleporter_pairs, rng);
    };
    optional<MazeProblem> loaded;
    try {
        loaded = load();
    } catch (const std::exception& e) {
        cerr << "Error loading maze: " << e.what() << '\n';
        return 2;
    }
    const MazeProblem& maze = *loaded;

    // CSV header
    cout << "rows,cols,teleporters,seed,strategy,time_ms,found,path_length,cells_expanded" << '\n';

    for (SearchStrategy strategy : {SearchStrategy::BFS, SearchStrategy::DFS}) {
        auto t0 = chrono::steady_clock::now();
        PathResult result = find_path(maze, strategy);
        auto t1 = chrono::steady_clock::now();
        double ms = chrono::duration_cast<chrono::duration<double, milli>>(t1 - t0).count();

        cout << maze.graph.get_rows() << ',' << maze.graph.get_cols() << ','
             << maze.graph.get_teleporters().size() << ',' << seed << ',' << strategy_name(strategy) << ','
             << ms << ',' << (result.found() ? 1 : 0) << ',' << result.length() << ','
             << result.cells_expanded << '\n';
    }
    return 0;
}
