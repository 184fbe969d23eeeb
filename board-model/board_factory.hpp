#ifndef __BOARD_FACTORY_HPP___
#define __BOARD_FACTORY_HPP___

/**
 * @file board_factory.hpp
 * @brief Build a board and its starting state from a descriptor.
 */

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "board.hpp"

/**
 * @brief Everything needed to set up one game.
 *
 * `initial_marks`, when given, replaces the variant's starting position with
 * one text row per board row (`.` empty, `A`/`B`, `a`/`b` shielded, `#`
 * blocked).
 */
struct BoardDescriptor {
    BoardVariant variant = BoardVariant::PlainTicTacToe;
    int size = 3;
    std::vector<SpecialTile> special_tiles;
    std::optional<std::vector<std::string>> initial_marks;
    Player to_move = Player::A;
};

struct BoardSetup {
    std::shared_ptr<const Board> board;
    BoardState state;
};

/**
 * @brief Create the board rules and the starting state for `descriptor`.
 *
 * @throws std::invalid_argument on a bad size, bad tiles, ragged or unknown
 *         mark rows, or tiles given to plain tic-tac-toe.
 */
BoardSetup make_board(const BoardDescriptor& descriptor);

/**
 * @brief Parse one character of a mark row.
 *
 * @throws std::invalid_argument on an unknown character.
 */
Mark parse_mark(char c);

#endif // __BOARD_FACTORY_HPP___
