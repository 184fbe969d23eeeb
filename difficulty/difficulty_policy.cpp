#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

#include "difficulty_policy.hpp"

using namespace std;

namespace {

int level_index(Difficulty d) {
    return static_cast<int>(d);
}

} // namespace

SearchConfig search_config_for(GameKind game, Difficulty difficulty) {
    SearchConfig config;
    const int i = level_index(difficulty);
    switch (game) {
    case GameKind::TicTacToe: {
        static const int depths[] = {1, 3, 9, 4};
        config.max_depth = depths[i];
        config.algorithm = difficulty == Difficulty::Easy || difficulty == Difficulty::Medium
                               ? SearchAlgorithm::Minimax
                               : SearchAlgorithm::AlphaBeta;
        return config;
    }
    case GameKind::Strategy: {
        static const int depths[] = {2, 3, 4, 5};
        // a tenth of the level's per-move clock
        static const int budgets_ms[] = {2000, 1500, 1200, 1000};
        config.max_depth = depths[i];
        config.algorithm = SearchAlgorithm::AlphaBeta;
        config.time_budget = chrono::milliseconds(budgets_ms[i]);
        return config;
    }
    default:
        throw invalid_argument(game_name(game) + " has no computer opponent");
    }
}

LevelPreset level_preset(GameKind game, Difficulty difficulty) {
    LevelPreset preset;
    preset.game = game;
    preset.difficulty = difficulty;
    const int i = level_index(difficulty);

    switch (game) {
    case GameKind::TicTacToe:
        switch (difficulty) {
        case Difficulty::Easy:
            preset.board_size = 3;
            break;
        case Difficulty::Medium:
            preset.board_size = 3;
            preset.special_tiles = {{0, 0, TileTag::Double}};
            break;
        case Difficulty::Hard:
            preset.board_size = 3;
            preset.special_tiles = {{0, 0, TileTag::Double}, {2, 2, TileTag::Block}};
            break;
        case Difficulty::Expert:
            preset.board_size = 4;
            preset.special_tiles = {{0, 0, TileTag::Double}, {3, 3, TileTag::Block}, {1, 2, TileTag::Swap}};
            break;
        }
        break;
    case GameKind::Strategy: {
        static const int sizes[] = {5, 6, 6, 7};
        static const int clocks[] = {20, 15, 12, 10};
        preset.board_size = sizes[i];
        preset.move_time_limit = chrono::seconds(clocks[i]);
        switch (difficulty) {
        case Difficulty::Easy:
            preset.special_tiles = {{2, 0, TileTag::Shield}, {2, 2, TileTag::ExtraMove}, {2, 4, TileTag::Reinforce}};
            break;
        case Difficulty::Medium:
            preset.special_tiles = {{2, 1, TileTag::Shield}, {3, 4, TileTag::ExtraMove}, {3, 0, TileTag::Reinforce}};
            break;
        case Difficulty::Hard:
            preset.special_tiles = {{2, 3, TileTag::Shield}, {3, 2, TileTag::ExtraMove}};
            break;
        case Difficulty::Expert:
            preset.special_tiles = {{3, 3, TileTag::Shield}};
            break;
        }
        break;
    }
    case GameKind::WaterJug: {
        static const vector<int> capacities[] = {{3, 5}, {5, 3, 8}, {8, 5, 3}, {12, 7, 5, 3}};
        static const int targets[] = {4, 4, 7, 10};
        static const int allowances[] = {8, 10, 12, 15};
        preset.jug_capacities = capacities[i];
        preset.jug_target = targets[i];
        preset.move_allowance = allowances[i];
        break;
    }
    case GameKind::Maze: {
        static const int rows[] = {11, 15, 21, 25};
        static const int cols[] = {15, 20, 27, 35};
        static const int pairs[] = {1, 2, 2, 3};
        preset.maze_rows = rows[i];
        preset.maze_cols = cols[i];
        preset.teleporter_pairs = pairs[i];
        break;
    }
    }
    return preset;
}

Difficulty parse_difficulty(const string& text) {
    string lower = text;
    transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(tolower(c)); });
    if (lower == "easy" || lower == "1") return Difficulty::Easy;
    if (lower == "medium" || lower == "2") return Difficulty::Medium;
    if (lower == "hard" || lower == "3") return Difficulty::Hard;
    if (lower == "expert" || lower == "4") return Difficulty::Expert;
    throw invalid_argument("Unknown difficulty: " + text);
}

string difficulty_name(Difficulty difficulty) {
    switch (difficulty) {
    case Difficulty::Easy: return "easy";
    case Difficulty::Medium: return "medium";
    case Difficulty::Hard: return "hard";
    case Difficulty::Expert: return "expert";
    }
    return "unknown";
}

string game_name(GameKind game) {
    switch (game) {
    case GameKind::TicTacToe: return "tictactoe";
    case GameKind::Strategy: return "strategy";
    case GameKind::WaterJug: return "waterjug";
    case GameKind::Maze: return "maze";
    }
    return "unknown";
}
