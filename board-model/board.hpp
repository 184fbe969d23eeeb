/**
 * @file board.hpp
 * @brief Game board abstraction shared by the adversarial searches.
 *
 * A `Board` holds the rules of one game variant and is immutable; the mutable
 * part of a game lives in `BoardState` values. `apply_move` returns a new
 * state and never touches its argument, so two branches of a search can never
 * alias the same state.
 */

#ifndef __BOARD_HPP___
#define __BOARD_HPP___

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class Player : uint8_t { A, B };

inline Player opponent(Player p) { return p == Player::A ? Player::B : Player::A; }

/// Cell content. Blocked cells belong to nobody; shielded pieces cannot be captured.
enum class Mark : uint8_t { Empty, A, B, Blocked, ShieldedA, ShieldedB };

/// Special-tile tag attached to a cell, triggered when a move lands on it.
enum class TileTag : uint8_t { None, Double, Block, Swap, ExtraMove, Shield, Reinforce };

struct SpecialTile {
    int row;
    int col;
    TileTag tag;
};

/**
 * @brief Owner of a mark, if it is a piece.
 */
std::optional<Player> mark_owner(Mark mark);

/**
 * @brief Plain mark of a player (A or B).
 */
Mark mark_of(Player player);

/**
 * @brief Snapshot of a game: marks, special tiles, side to move, move counter.
 */
struct BoardState {
    int rows = 0;
    int cols = 0;
    std::vector<Mark> marks;
    std::vector<TileTag> tiles;
    Player to_move = Player::A;
    int move_count = 0;

    int index(int row, int col) const { return row * cols + col; }
    Mark at(int row, int col) const { return marks[index(row, col)]; }
    TileTag tile_at(int row, int col) const { return tiles[index(row, col)]; }

    bool operator==(const BoardState& rhs) const;
    bool operator!=(const BoardState& rhs) const { return !(*this == rhs); }

    /**
     * @brief One text row per board row: `.` empty, `A`/`B` pieces, `a`/`b`
     * shielded pieces, `#` blocked.
     */
    std::vector<std::string> to_rows() const;
};

/**
 * @brief A move: placement games use `from == PLACEMENT`, movement games a
 * (from, to) pair of cell indices.
 */
struct BoardMove {
    static constexpr int PLACEMENT = -1;

    int from = PLACEMENT;
    int to = -1;

    bool operator==(const BoardMove& rhs) const { return from == rhs.from && to == rhs.to; }
    bool operator!=(const BoardMove& rhs) const { return !(*this == rhs); }
    bool operator<(const BoardMove& rhs) const { return from != rhs.from ? from < rhs.from : to < rhs.to; }

    std::string to_string() const;
};

enum class OutcomeKind { Ongoing, Win, Draw };

struct GameOutcome {
    OutcomeKind kind = OutcomeKind::Ongoing;
    Player winner = Player::A;  // meaningful only for Win

    bool is_over() const { return kind != OutcomeKind::Ongoing; }

    static GameOutcome ongoing() { return {OutcomeKind::Ongoing, Player::A}; }
    static GameOutcome win(Player p) { return {OutcomeKind::Win, p}; }
    static GameOutcome draw() { return {OutcomeKind::Draw, Player::A}; }
};

enum class BoardVariant { PlainTicTacToe, SpecialTicTacToe, Strategy };

std::string variant_name(BoardVariant variant);

/// Magnitude of a decided game; heuristic scores stay well below it.
constexpr int WIN_SCORE = 1000000;

/**
 * @brief Rules of one game variant.
 *
 * Implementations must enumerate moves in a deterministic order: the search
 * breaks ties by that order.
 */
class Board {
public:
    virtual ~Board() = default;

    virtual BoardVariant variant() const = 0;

    /**
     * @brief Starting position of this variant.
     */
    virtual BoardState initial_state() const = 0;

    /**
     * @brief Legal moves for the side to move; empty once the game is over.
     */
    virtual std::vector<BoardMove> legal_moves(const BoardState& state) const = 0;

    /**
     * @brief State after `move`. The argument is left untouched.
     *
     * @throws std::invalid_argument if the move is not legal in `state`.
     */
    virtual BoardState apply_move(const BoardState& state, const BoardMove& move) const = 0;

    virtual GameOutcome is_terminal(const BoardState& state) const = 0;

    /**
     * @brief Heuristic value of a non-terminal state for `perspective`
     * (higher is better for that player).
     */
    virtual int evaluate(const BoardState& state, Player perspective) const = 0;
};

#endif // __BOARD_HPP___
