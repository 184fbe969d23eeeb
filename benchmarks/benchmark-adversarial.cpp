#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

#include "adversarial-solver.hpp"
#include "board_factory.hpp"
#include "difficulty_policy.hpp"

using namespace std;

int main(int argc, char** argv) {
    string game = "tictactoe";
    string difficulty = "hard";
    string algorithm;
    int depth = 0;
    int budget_ms = -1;
    int max_plies = 200;

    // Simple argument parsing
    try {
        for (int i = 1; i < argc; ++i) {
            string a = argv[i];
            if (a == "--game" && i + 1 < argc) { game = argv[++i]; }
            else if (a == "--difficulty" && i + 1 < argc) { difficulty = argv[++i]; }
            else if (a == "--algorithm" && i + 1 < argc) { algorithm = argv[++i]; }
            else if (a == "--depth" && i + 1 < argc) { depth = stoi(argv[++i]); }
            else if (a == "--budget-ms" && i + 1 < argc) { budget_ms = stoi(argv[++i]); }
            else if (a == "--max-plies" && i + 1 < argc) { max_plies = stoi(argv[++i]); }
            else if (a == "--help") {
                cout << "Usage: benchmark-adversarial [--game tictactoe|strategy] [--difficulty D] "
                        "[--algorithm minimax|alphabeta] [--depth N] [--budget-ms T] [--max-plies P]\n";
                return 0;
            }
        }
    } catch (const std::exception& e) {
        cerr << "Invalid argument value: " << e.what() << '\n';
        return 1;
    }

    GameKind kind;
    if (game == "tictactoe") kind = GameKind::TicTacToe;
    else if (game == "strategy") kind = GameKind::Strategy;
    else {
        cerr << "Unknown game: " << game << '\n';
        return 3;
    }

    BoardSetup setup;
    SearchConfig config;
    try {
        Difficulty level = parse_difficulty(difficulty);
        LevelPreset preset = level_preset(kind, level);
        config = search_config_for(kind, level);
        if (!algorithm.empty()) {
            if (algorithm == "minimax") config.algorithm = SearchAlgorithm::Minimax;
            else if (algorithm == "alphabeta") config.algorithm = SearchAlgorithm::AlphaBeta;
            else throw invalid_argument("Unknown algorithm: " + algorithm);
        }
        if (depth > 0) config.max_depth = depth;
        if (budget_ms == 0) config.time_budget.reset();
        else if (budget_ms > 0) config.time_budget = chrono::milliseconds(budget_ms);
        config.record_trace = false;
        validate_search_config(config);

        BoardDescriptor descriptor;
        descriptor.size = preset.board_size;
        descriptor.special_tiles = preset.special_tiles;
        if (kind == GameKind::Strategy) descriptor.variant = BoardVariant::Strategy;
        else if (!preset.special_tiles.empty()) descriptor.variant = BoardVariant::SpecialTicTacToe;
        else descriptor.variant = BoardVariant::PlainTicTacToe;
        setup = make_board(descriptor);
    } catch (const std::exception& e) {
        cerr << "Error setting up game: " << e.what() << '\n';
        return 2;
    }

    // CSV header
    cout << "ply,player,move,score,depth,timed_out,nodes_visited,nodes_pruned,pruning_ratio,time_ms" << '\n';

    const Board& board = *setup.board;
    BoardState state = setup.state;
    long total_nodes = 0;
    int ply = 0;
    try {
        while (!board.is_terminal(state).is_over() && ply < max_plies) {
            Player mover = state.to_move;
            DecisionResult decision = choose_move(board, state, mover, config);
            double ms = chrono::duration_cast<chrono::duration<double, milli>>(decision.stats.elapsed).count();
            total_nodes += decision.stats.nodes_visited;

            cout << ply << ',' << (mover == Player::A ? 'A' : 'B') << ',' << decision.move.to_string() << ','
                 << decision.score << ',' << decision.depth_reached << ',' << (decision.timed_out ? 1 : 0) << ','
                 << decision.stats.nodes_visited << ',' << decision.stats.nodes_pruned << ','
                 << decision.stats.pruning_ratio() << ',' << ms << '\n';

            state = board.apply_move(state, decision.move);
            ++ply;
        }
    } catch (const std::exception& e) {
        cerr << "Error at ply " << ply << ": " << e.what() << '\n';
        return 4;
    }

    GameOutcome outcome = board.is_terminal(state);
    string result = "unfinished";
    if (outcome.kind == OutcomeKind::Draw) result = "draw";
    else if (outcome.kind == OutcomeKind::Win) result = outcome.winner == Player::A ? "A wins" : "B wins";

    cout << variant_name(board.variant()) << ", algorithm: " << algorithm_name(config.algorithm)
         << ", depth: " << config.max_depth << ", plies: " << ply << ", result: " << result
         << ", total nodes: " << total_nodes << '\n';
    for (const string& row : state.to_rows()) cout << row << '\n';
    return 0;
}
