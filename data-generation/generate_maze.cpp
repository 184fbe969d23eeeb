#include <iostream>
#include <random>
#include <stdexcept>
#include <string>

#include "grid_graph.hpp"
#include "maze_file_operations.hpp"
#include "generate_maze.hpp"

using namespace std;

int main(int argc, char** argv) {
    int rows = 15;
    int cols = 20;
    int teleporter_pairs = 2;
    int seed = 0;
    string output_file;

    // Simple argument parsing
    try {
        for (int i = 1; i < argc; ++i) {
            string a = argv[i];
            if (a == "--rows" && i + 1 < argc) { rows = stoi(argv[++i]); }
            else if (a == "--cols" && i + 1 < argc) { cols = stoi(argv[++i]); }
            else if (a == "--teleporters" && i + 1 < argc) { teleporter_pairs = stoi(argv[++i]); }
            else if (a == "--seed" && i + 1 < argc) { seed = stoi(argv[++i]); }
            else if (a == "--output-file" && i + 1 < argc) { output_file = argv[++i]; }
            else if (a == "--help") {
                cout << "Usage: generate-maze [--rows R] [--cols C] [--teleporters P] [--seed S] --output-file F\n";
                return 0;
            }
        }
    } catch (const std::exception& e) {
        cerr << "Invalid argument value: " << e.what() << '\n';
        return 1;
    }
    if (output_file.empty()) {
        cerr << "Missing --output-file\n";
        return 1;
    }
    try {
        mt19937 rng(seed);
        MazeProblem maze = random_maze(rows, cols, teleporter_pairs, rng);
        write_maze_to_file(maze, output_file);
    } catch (const std::exception& e) {
        cerr << "Error generating maze: " << e.what() << '\n';
        return 2;
    }
    return 0;
}
