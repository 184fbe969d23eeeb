#ifndef __STRATEGY_BOARD_HPP___
#define __STRATEGY_BOARD_HPP___

/**
 * @file strategy_board.hpp
 * @brief Movement game with captures and power-up tiles.
 */

#include <optional>
#include <vector>

#include "board.hpp"

/**
 * @brief N x N strategy board (5 <= N <= 8).
 *
 * A starts on the bottom two rows and moves up, B starts on the top two rows
 * and moves down; both fill the cells with an even `row + col`. A piece steps
 * straight forward onto an empty cell, or diagonally forward onto an empty
 * cell or an unshielded opponent piece, capturing it. Shielded pieces step
 * one cell in any of the 8 directions, onto empty cells only, and cannot be
 * captured.
 *
 * Landing on a power-up tile consumes it:
 * - `ExtraMove`: the mover moves again.
 * - `Shield`:    the moving piece becomes shielded.
 * - `Reinforce`: a new piece of the mover appears on the first empty cell
 *                among up, down, left and right of the landing cell.
 *
 * A player wins by reaching the far row or by leaving the opponent without
 * pieces. The game is drawn when the side to move has no move or after
 * `4 * N * N` moves.
 */
class StrategyBoard : public Board {
public:
    static constexpr int MIN_SIZE = 5;
    static constexpr int MAX_SIZE = 8;

    /**
     * @throws std::invalid_argument on a bad size, a tile outside the board or
     *         on a starting piece, two tiles on one cell, or a tag other than
     *         ExtraMove/Shield/Reinforce.
     */
    explicit StrategyBoard(int size, const std::vector<SpecialTile>& tiles = {});

    BoardVariant variant() const override { return BoardVariant::Strategy; }
    BoardState initial_state() const override;
    std::vector<BoardMove> legal_moves(const BoardState& state) const override;
    BoardState apply_move(const BoardState& state, const BoardMove& move) const override;
    GameOutcome is_terminal(const BoardState& state) const override;
    int evaluate(const BoardState& state, Player perspective) const override;

    int get_size() const { return size_; }
    int get_move_limit() const { return 4 * size_ * size_; }
    const std::vector<SpecialTile>& get_tiles() const { return tiles_; }

private:
    std::vector<BoardMove> generate_moves(const BoardState& state) const;
    std::optional<Player> winner(const BoardState& state) const;
    void check_shape(const BoardState& state) const;

    int size_;
    std::vector<SpecialTile> tiles_;
};

#endif // __STRATEGY_BOARD_HPP___
