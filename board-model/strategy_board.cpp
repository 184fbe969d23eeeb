#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include "strategy_board.hpp"

using namespace std;

namespace {

struct Step {
    int dr;
    int dc;
};

const vector<Step> FORWARD_A = {{-1, 0}, {-1, -1}, {-1, 1}};
const vector<Step> FORWARD_B = {{1, 0}, {1, -1}, {1, 1}};
const vector<Step> ALL_DIRECTIONS = {{-1, 0}, {1, 0}, {0, -1}, {0, 1}, {-1, -1}, {-1, 1}, {1, -1}, {1, 1}};
// Reinforce order: up, down, left, right
const vector<Step> ORTHOGONAL = {{-1, 0}, {1, 0}, {0, -1}, {0, 1}};

bool is_shielded(Mark m) {
    return m == Mark::ShieldedA || m == Mark::ShieldedB;
}

Mark shielded_mark_of(Player p) {
    return p == Player::A ? Mark::ShieldedA : Mark::ShieldedB;
}

int far_row(Player p, int size) {
    return p == Player::A ? 0 : size - 1;
}

} // namespace

StrategyBoard::StrategyBoard(int size, const vector<SpecialTile>& tiles) : size_(size), tiles_(tiles) {
    if (size < MIN_SIZE || size > MAX_SIZE) {
        throw invalid_argument("Strategy board size must be in [" + to_string(MIN_SIZE) + "," +
                               to_string(MAX_SIZE) + "], got " + to_string(size));
    }
    vector<bool> used(size * size, false);
    for (const SpecialTile& t : tiles) {
        if (t.row < 0 || t.row >= size || t.col < 0 || t.col >= size) {
            throw invalid_argument("Power-up tile outside the board");
        }
        if (t.tag != TileTag::ExtraMove && t.tag != TileTag::Shield && t.tag != TileTag::Reinforce) {
            throw invalid_argument("Strategy power-ups must be ExtraMove, Shield or Reinforce");
        }
        int idx = t.row * size + t.col;
        if (used[idx]) {
            throw invalid_argument("Two power-up tiles on one cell");
        }
        if ((t.row + t.col) % 2 == 0 && (t.row < 2 || t.row >= size - 2)) {
            throw invalid_argument("Power-up tile on a starting piece");
        }
        used[idx] = true;
    }
}

BoardState StrategyBoard::initial_state() const {
    BoardState state;
    state.rows = size_;
    state.cols = size_;
    state.marks.assign(size_ * size_, Mark::Empty);
    state.tiles.assign(size_ * size_, TileTag::None);
    for (int r = 0; r < size_; ++r) {
        for (int c = 0; c < size_; ++c) {
            if ((r + c) % 2 != 0) continue;
            if (r < 2) state.marks[state.index(r, c)] = Mark::B;
            else if (r >= size_ - 2) state.marks[state.index(r, c)] = Mark::A;
        }
    }
    for (const SpecialTile& t : tiles_) {
        state.tiles[state.index(t.row, t.col)] = t.tag;
    }
    state.to_move = Player::A;
    state.move_count = 0;
    return state;
}

void StrategyBoard::check_shape(const BoardState& state) const {
    if (state.rows != size_ || state.cols != size_ ||
        static_cast<int>(state.marks.size()) != size_ * size_ ||
        static_cast<int>(state.tiles.size()) != size_ * size_) {
        throw invalid_argument("State does not match a " + to_string(size_) + "x" + to_string(size_) + " board");
    }
}

vector<BoardMove> StrategyBoard::generate_moves(const BoardState& state) const {
    vector<BoardMove> moves;
    const Player mover = state.to_move;
    for (int r = 0; r < size_; ++r) {
        for (int c = 0; c < size_; ++c) {
            Mark piece = state.at(r, c);
            if (mark_owner(piece) != mover) continue;
            const int from = state.index(r, c);

            if (is_shielded(piece)) {
                for (const Step& s : ALL_DIRECTIONS) {
                    int nr = r + s.dr, nc = c + s.dc;
                    if (nr < 0 || nr >= size_ || nc < 0 || nc >= size_) continue;
                    if (state.at(nr, nc) == Mark::Empty) moves.push_back({from, state.index(nr, nc)});
                }
                continue;
            }

            for (const Step& s : mover == Player::A ? FORWARD_A : FORWARD_B) {
                int nr = r + s.dr, nc = c + s.dc;
                if (nr < 0 || nr >= size_ || nc < 0 || nc >= size_) continue;
                Mark dest = state.at(nr, nc);
                bool diagonal = s.dc != 0;
                if (dest == Mark::Empty ||
                    (diagonal && mark_owner(dest) == opponent(mover) && !is_shielded(dest))) {
                    moves.push_back({from, state.index(nr, nc)});
                }
            }
        }
    }
    return moves;
}

optional<Player> StrategyBoard::winner(const BoardState& state) const {
    int pieces[2] = {0, 0};
    bool reached[2] = {false, false};
    for (int r = 0; r < size_; ++r) {
        for (int c = 0; c < size_; ++c) {
            optional<Player> owner = mark_owner(state.at(r, c));
            if (!owner) continue;
            int p = static_cast<int>(*owner);
            ++pieces[p];
            if (r == far_row(*owner, size_)) reached[p] = true;
        }
    }
    for (Player p : {Player::A, Player::B}) {
        int me = static_cast<int>(p);
        int them = static_cast<int>(opponent(p));
        if (reached[me] || pieces[them] == 0) return p;
    }
    return nullopt;
}

GameOutcome StrategyBoard::is_terminal(const BoardState& state) const {
    if (optional<Player> w = winner(state)) return GameOutcome::win(*w);
    if (state.move_count >= get_move_limit()) return GameOutcome::draw();
    if (generate_moves(state).empty()) return GameOutcome::draw();
    return GameOutcome::ongoing();
}

vector<BoardMove> StrategyBoard::legal_moves(const BoardState& state) const {
    check_shape(state);
    if (is_terminal(state).is_over()) return {};
    return generate_moves(state);
}

BoardState StrategyBoard::apply_move(const BoardState& state, const BoardMove& move) const {
    vector<BoardMove> legal = legal_moves(state);
    if (find(legal.begin(), legal.end(), move) == legal.end()) {
        throw invalid_argument("Illegal strategy move: " + move.to_string());
    }

    const Player mover = state.to_move;
    BoardState next = state;
    next.marks[move.to] = next.marks[move.from];
    next.marks[move.from] = Mark::Empty;
    next.to_move = opponent(mover);
    next.move_count = state.move_count + 1;

    TileTag tag = next.tiles[move.to];
    if (tag == TileTag::None) return next;
    next.tiles[move.to] = TileTag::None;
    // a winning move ends the game before the power-up fires
    if (winner(next)) return next;

    switch (tag) {
    case TileTag::ExtraMove:
        next.to_move = mover;
        break;
    case TileTag::Shield:
        next.marks[move.to] = shielded_mark_of(mover);
        break;
    case TileTag::Reinforce: {
        int r = move.to / size_, c = move.to % size_;
        for (const Step& s : ORTHOGONAL) {
            int nr = r + s.dr, nc = c + s.dc;
            if (nr < 0 || nr >= size_ || nc < 0 || nc >= size_) continue;
            if (next.at(nr, nc) == Mark::Empty) {
                next.marks[next.index(nr, nc)] = mark_of(mover);
                break;
            }
        }
        break;
    }
    default:
        break;
    }
    return next;
}

int StrategyBoard::evaluate(const BoardState& state, Player perspective) const {
    int totals[2] = {0, 0};
    const int centre = size_ / 2;
    for (int r = 0; r < size_; ++r) {
        for (int c = 0; c < size_; ++c) {
            Mark m = state.at(r, c);
            optional<Player> owner = mark_owner(m);
            if (!owner) continue;
            int progress = *owner == Player::A ? size_ - 1 - r : r;
            int value = 10 + 2 * progress - abs(c - centre);
            if (is_shielded(m)) value += 3;
            totals[static_cast<int>(*owner)] += value;
        }
    }
    return totals[static_cast<int>(perspective)] - totals[static_cast<int>(opponent(perspective))];
}
