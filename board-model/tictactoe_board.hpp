#ifndef __TICTACTOE_BOARD_HPP___
#define __TICTACTOE_BOARD_HPP___

/**
 * @file tictactoe_board.hpp
 * @brief N x N tic-tac-toe, plain and with special tiles.
 */

#include <vector>

#include "board.hpp"

/**
 * @brief Tic-tac-toe on an N x N board (3 <= N <= 6).
 *
 * A player wins with a full row, column or diagonal of their marks; the game
 * is drawn when no empty cell is left. Moves are placements enumerated in
 * row-major order.
 */
class TicTacToeBoard : public Board {
public:
    static constexpr int MIN_SIZE = 3;
    static constexpr int MAX_SIZE = 6;

    /**
     * @throws std::invalid_argument if size is outside [MIN_SIZE, MAX_SIZE].
     */
    explicit TicTacToeBoard(int size);

    BoardVariant variant() const override { return BoardVariant::PlainTicTacToe; }
    BoardState initial_state() const override;
    std::vector<BoardMove> legal_moves(const BoardState& state) const override;
    BoardState apply_move(const BoardState& state, const BoardMove& move) const override;
    GameOutcome is_terminal(const BoardState& state) const override;
    int evaluate(const BoardState& state, Player perspective) const override;

    int get_size() const { return size_; }

protected:
    // Validates shape, game state and target cell, then places the mover's
    // mark and hands the turn over.
    BoardState place(const BoardState& state, const BoardMove& move) const;

    int size_;
};

/**
 * @brief Tic-tac-toe with special tiles.
 *
 * After a non-winning placement on a tagged cell:
 * - `Double`: the same player moves again.
 * - `Block`:  the first empty cell in row-major order becomes blocked.
 * - `Swap`:   every A mark becomes B and every B mark becomes A.
 */
class SpecialTicTacToeBoard : public TicTacToeBoard {
public:
    /**
     * @throws std::invalid_argument on a bad size, a tile outside the board,
     *         two tiles on one cell, or a tag other than Double/Block/Swap.
     */
    SpecialTicTacToeBoard(int size, const std::vector<SpecialTile>& tiles);

    BoardVariant variant() const override { return BoardVariant::SpecialTicTacToe; }
    BoardState initial_state() const override;
    BoardState apply_move(const BoardState& state, const BoardMove& move) const override;

    const std::vector<SpecialTile>& get_tiles() const { return tiles_; }

private:
    std::vector<SpecialTile> tiles_;
};

#endif // __TICTACTOE_BOARD_HPP___
