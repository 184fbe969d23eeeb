#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "board_factory.hpp"
#include "strategy_board.hpp"
#include "tictactoe_board.hpp"

using namespace std;

Mark parse_mark(char c) {
    switch (c) {
    case '.': return Mark::Empty;
    case 'A': return Mark::A;
    case 'B': return Mark::B;
    case 'a': return Mark::ShieldedA;
    case 'b': return Mark::ShieldedB;
    case '#': return Mark::Blocked;
    default:
        throw invalid_argument(string("Unknown board mark '") + c + "'");
    }
}

BoardSetup make_board(const BoardDescriptor& descriptor) {
    BoardSetup setup;
    switch (descriptor.variant) {
    case BoardVariant::PlainTicTacToe:
        if (!descriptor.special_tiles.empty()) {
            throw invalid_argument("Plain tic-tac-toe takes no special tiles");
        }
        setup.board = make_shared<TicTacToeBoard>(descriptor.size);
        break;
    case BoardVariant::SpecialTicTacToe:
        setup.board = make_shared<SpecialTicTacToeBoard>(descriptor.size, descriptor.special_tiles);
        break;
    case BoardVariant::Strategy:
        setup.board = make_shared<StrategyBoard>(descriptor.size, descriptor.special_tiles);
        break;
    }

    setup.state = setup.board->initial_state();
    setup.state.to_move = descriptor.to_move;

    if (descriptor.initial_marks) {
        const vector<string>& rows = *descriptor.initial_marks;
        if (static_cast<int>(rows.size()) != descriptor.size) {
            throw invalid_argument("Expected " + to_string(descriptor.size) + " mark rows, got " +
                                   to_string(rows.size()));
        }
        int placed = 0;
        for (int r = 0; r < descriptor.size; ++r) {
            if (static_cast<int>(rows[r].size()) != descriptor.size) {
                throw invalid_argument("Mark row " + to_string(r) + " has the wrong length");
            }
            for (int c = 0; c < descriptor.size; ++c) {
                Mark m = parse_mark(rows[r][c]);
                if (m != Mark::Empty && m != Mark::Blocked) ++placed;
                setup.state.marks[setup.state.index(r, c)] = m;
            }
        }
        bool tictactoe = descriptor.variant != BoardVariant::Strategy;
        for (Mark m : setup.state.marks) {
            if (tictactoe && (m == Mark::ShieldedA || m == Mark::ShieldedB)) {
                throw invalid_argument("Shielded pieces exist only on the strategy board");
            }
        }
        // placement games count one move per mark on the board
        if (tictactoe) setup.state.move_count = placed;
    }
    return setup;
}
