#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "difficulty_policy.hpp"
#include "water-jug-solver.hpp"

using namespace std;

int main(int argc, char** argv) {
    string capacities_raw;
    int target = -1;
    string difficulty;
    bool show_moves = false;
    vector<int> capacities;

    // Simple argument parsing
    try {
        for (int i = 1; i < argc; ++i) {
            string a = argv[i];
            if (a == "--capacities" && i + 1 < argc) { capacities_raw = argv[++i]; }
            else if (a == "--target" && i + 1 < argc) { target = stoi(argv[++i]); }
            else if (a == "--difficulty" && i + 1 < argc) { difficulty = argv[++i]; }
            else if (a == "--moves") { show_moves = true; }
            else if (a == "--help") {
                cout << "Usage: benchmark-jug [--capacities 3,5 --target 4 | --difficulty easy] [--moves]\n";
                return 0;
            }
        }
    } catch (const std::exception& e) {
        cerr << "Invalid argument value: " << e.what() << '\n';
        return 1;
    }

    int allowance = 0;
    try {
        if (!difficulty.empty()) {
            LevelPreset preset = level_preset(GameKind::WaterJug, parse_difficulty(difficulty));
            capacities = preset.jug_capacities;
            target = preset.jug_target;
            allowance = preset.move_allowance;
        } else {
            std::stringstream ss(capacities_raw);
            std::string token;
            while (getline(ss, token, ',')) {
                capacities.push_back(stoi(token));
            }
        }
    } catch (const std::exception& e) {
        cerr << "Error reading arguments: " << e.what() << '\n';
        return 2;
    }

    JugSolution solution;
    double ms = 0.0;
    try {
        auto t0 = chrono::steady_clock::now();
        solution = solve_jug(capacities, target);
        auto t1 = chrono::steady_clock::now();
        ms = chrono::duration_cast<chrono::duration<double, milli>>(t1 - t0).count();
    } catch (const std::exception& e) {
        cerr << "Error solving puzzle: " << e.what() << '\n';
        return 3;
    }

    if (show_moves) {
        for (size_t i = 0; i < solution.moves.size(); ++i) {
            cout << i + 1 << ". " << solution.moves[i].description() << '\n';
        }
    }

    cout << "capacities: " << capacities_raw;
    if (capacities_raw.empty()) {
        for (size_t i = 0; i < capacities.size(); ++i) cout << (i ? "," : "") << capacities[i];
    }
    cout << ", target: " << target << ", time: " << ms << "ms, solvable: " << (solution.solved() ? 1 : 0)
         << ", moves: " << solution.moves.size() << ", visited states: " << solution.states_visited;
    if (allowance > 0) cout << ", allowance: " << allowance;
    cout << '\n';
    return 0;
}
