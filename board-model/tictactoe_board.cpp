#include <stdexcept>
#include <string>
#include <vector>

#include "tictactoe_board.hpp"

using namespace std;

namespace {

// Cell indices of every winning line: rows, columns, both diagonals.
vector<vector<int>> winning_lines(int n) {
    vector<vector<int>> lines;
    for (int r = 0; r < n; ++r) {
        vector<int> line;
        for (int c = 0; c < n; ++c) line.push_back(r * n + c);
        lines.push_back(line);
    }
    for (int c = 0; c < n; ++c) {
        vector<int> line;
        for (int r = 0; r < n; ++r) line.push_back(r * n + c);
        lines.push_back(line);
    }
    vector<int> diag, anti;
    for (int i = 0; i < n; ++i) {
        diag.push_back(i * n + i);
        anti.push_back(i * n + (n - 1 - i));
    }
    lines.push_back(diag);
    lines.push_back(anti);
    return lines;
}

} // namespace

TicTacToeBoard::TicTacToeBoard(int size) : size_(size) {
    if (size < MIN_SIZE || size > MAX_SIZE) {
        throw invalid_argument("Tic-tac-toe size must be in [" + to_string(MIN_SIZE) + "," +
                               to_string(MAX_SIZE) + "], got " + to_string(size));
    }
}

BoardState TicTacToeBoard::initial_state() const {
    BoardState state;
    state.rows = size_;
    state.cols = size_;
    state.marks.assign(size_ * size_, Mark::Empty);
    state.tiles.assign(size_ * size_, TileTag::None);
    state.to_move = Player::A;
    state.move_count = 0;
    return state;
}

vector<BoardMove> TicTacToeBoard::legal_moves(const BoardState& state) const {
    vector<BoardMove> moves;
    if (is_terminal(state).is_over()) return moves;
    for (int i = 0; i < static_cast<int>(state.marks.size()); ++i) {
        if (state.marks[i] == Mark::Empty) moves.push_back({BoardMove::PLACEMENT, i});
    }
    return moves;
}

BoardState TicTacToeBoard::place(const BoardState& state, const BoardMove& move) const {
    if (state.rows != size_ || state.cols != size_ ||
        static_cast<int>(state.marks.size()) != size_ * size_ ||
        static_cast<int>(state.tiles.size()) != size_ * size_) {
        throw invalid_argument("State does not match a " + to_string(size_) + "x" + to_string(size_) + " board");
    }
    if (move.from != BoardMove::PLACEMENT || move.to < 0 || move.to >= size_ * size_) {
        throw invalid_argument("Not a placement on this board: " + move.to_string());
    }
    if (state.marks[move.to] != Mark::Empty) {
        throw invalid_argument("Cell " + to_string(move.to) + " is not empty");
    }
    if (is_terminal(state).is_over()) {
        throw invalid_argument("The game is already over");
    }
    BoardState next = state;
    next.marks[move.to] = mark_of(state.to_move);
    next.to_move = opponent(state.to_move);
    next.move_count = state.move_count + 1;
    return next;
}

BoardState TicTacToeBoard::apply_move(const BoardState& state, const BoardMove& move) const {
    return place(state, move);
}

GameOutcome TicTacToeBoard::is_terminal(const BoardState& state) const {
    for (const auto& line : winning_lines(size_)) {
        optional<Player> owner = mark_owner(state.marks[line[0]]);
        if (!owner) continue;
        bool complete = true;
        for (int idx : line) {
            if (mark_owner(state.marks[idx]) != owner) {
                complete = false;
                break;
            }
        }
        if (complete) return GameOutcome::win(*owner);
    }
    for (Mark m : state.marks) {
        if (m == Mark::Empty) return GameOutcome::ongoing();
    }
    return GameOutcome::draw();
}

int TicTacToeBoard::evaluate(const BoardState& state, Player perspective) const {
    int score = 0;
    for (const auto& line : winning_lines(size_)) {
        int own = 0, opp = 0, blocked = 0;
        for (int idx : line) {
            Mark m = state.marks[idx];
            if (m == Mark::Blocked) ++blocked;
            else if (auto owner = mark_owner(m)) (*owner == perspective ? own : opp) += 1;
        }
        // a blocked or contested line can no longer be won
        if (blocked > 0 || (own > 0 && opp > 0)) continue;
        score += own - opp;
    }
    if (size_ == 3 && state.at(1, 1) == mark_of(perspective)) {
        score += 2;
    }
    return score;
}

SpecialTicTacToeBoard::SpecialTicTacToeBoard(int size, const vector<SpecialTile>& tiles)
    : TicTacToeBoard(size), tiles_(tiles) {
    vector<bool> used(size * size, false);
    for (const SpecialTile& t : tiles) {
        if (t.row < 0 || t.row >= size || t.col < 0 || t.col >= size) {
            throw invalid_argument("Special tile outside the board");
        }
        if (t.tag != TileTag::Double && t.tag != TileTag::Block && t.tag != TileTag::Swap) {
            throw invalid_argument("Tic-tac-toe special tiles must be Double, Block or Swap");
        }
        int idx = t.row * size + t.col;
        if (used[idx]) {
            throw invalid_argument("Two special tiles on one cell");
        }
        used[idx] = true;
    }
}

BoardState SpecialTicTacToeBoard::initial_state() const {
    BoardState state = TicTacToeBoard::initial_state();
    for (const SpecialTile& t : tiles_) {
        state.tiles[state.index(t.row, t.col)] = t.tag;
    }
    return state;
}

BoardState SpecialTicTacToeBoard::apply_move(const BoardState& state, const BoardMove& move) const {
    BoardState next = place(state, move);
    TileTag tag = next.tiles[move.to];
    if (tag == TileTag::None) return next;
    next.tiles[move.to] = TileTag::None;
    // a winning placement ends the game before the tile fires
    if (is_terminal(next).is_over()) return next;

    switch (tag) {
    case TileTag::Double:
        next.to_move = state.to_move;
        break;
    case TileTag::Block:
        for (Mark& m : next.marks) {
            if (m == Mark::Empty) {
                m = Mark::Blocked;
                break;
            }
        }
        break;
    case TileTag::Swap:
        for (Mark& m : next.marks) {
            if (m == Mark::A) m = Mark::B;
            else if (m == Mark::B) m = Mark::A;
        }
        break;
    default:
        break;
    }
    return next;
}
