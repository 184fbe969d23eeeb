#ifndef __DIFFICULTY_POLICY_HPP___
#define __DIFFICULTY_POLICY_HPP___

/**
 * @file difficulty_policy.hpp
 * @brief Difficulty levels and the level presets they select.
 */

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "adversarial-solver.hpp"
#include "board.hpp"

enum class Difficulty { Easy, Medium, Hard, Expert };

enum class GameKind { TicTacToe, Strategy, WaterJug, Maze };

/**
 * @brief Level setup for one (game, difficulty) pair.
 *
 * Only the fields of the selected game are meaningful; the others keep their
 * zero values.
 */
struct LevelPreset {
    GameKind game = GameKind::TicTacToe;
    Difficulty difficulty = Difficulty::Easy;

    // board games
    int board_size = 0;
    std::vector<SpecialTile> special_tiles;
    /// Time the player gets per move, if the level has a clock.
    std::optional<std::chrono::seconds> move_time_limit;

    // water jug
    std::vector<int> jug_capacities;
    int jug_target = 0;
    int move_allowance = 0;

    // maze
    int maze_rows = 0;
    int maze_cols = 0;
    int teleporter_pairs = 0;
};

/**
 * @brief Search settings of the computer opponent.
 *
 * @throws std::invalid_argument for games without an opponent (jug, maze).
 */
SearchConfig search_config_for(GameKind game, Difficulty difficulty);

LevelPreset level_preset(GameKind game, Difficulty difficulty);

/**
 * @brief Parse "easy".."expert" (any case) or "1".."4".
 *
 * @throws std::invalid_argument on anything else.
 */
Difficulty parse_difficulty(const std::string& text);

std::string difficulty_name(Difficulty difficulty);
std::string game_name(GameKind game);

#endif // __DIFFICULTY_POLICY_HPP___
