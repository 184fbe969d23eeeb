#include <string>
#include <vector>

#include "board.hpp"

using namespace std;

optional<Player> mark_owner(Mark mark) {
    switch (mark) {
    case Mark::A:
    case Mark::ShieldedA:
        return Player::A;
    case Mark::B:
    case Mark::ShieldedB:
        return Player::B;
    default:
        return nullopt;
    }
}

Mark mark_of(Player player) {
    return player == Player::A ? Mark::A : Mark::B;
}

bool BoardState::operator==(const BoardState& rhs) const {
    return rows == rhs.rows && cols == rhs.cols && to_move == rhs.to_move &&
           move_count == rhs.move_count && marks == rhs.marks && tiles == rhs.tiles;
}

vector<string> BoardState::to_rows() const {
    vector<string> lines;
    for (int r = 0; r < rows; ++r) {
        string line;
        for (int c = 0; c < cols; ++c) {
            switch (at(r, c)) {
            case Mark::Empty: line += '.'; break;
            case Mark::A: line += 'A'; break;
            case Mark::B: line += 'B'; break;
            case Mark::ShieldedA: line += 'a'; break;
            case Mark::ShieldedB: line += 'b'; break;
            case Mark::Blocked: line += '#'; break;
            }
        }
        lines.push_back(line);
    }
    return lines;
}

string BoardMove::to_string() const {
    if (from == PLACEMENT) return std::to_string(to);
    return std::to_string(from) + "->" + std::to_string(to);
}

string variant_name(BoardVariant variant) {
    switch (variant) {
    case BoardVariant::PlainTicTacToe: return "tictactoe";
    case BoardVariant::SpecialTicTacToe: return "special-tictactoe";
    case BoardVariant::Strategy: return "strategy";
    }
    return "unknown";
}
