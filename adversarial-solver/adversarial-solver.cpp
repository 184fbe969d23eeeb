#include <algorithm>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "adversarial-solver.hpp"

using namespace std;
using Clock = chrono::steady_clock;

double SearchStats::pruning_ratio() const {
    long total = nodes_visited + nodes_pruned;
    return total == 0 ? 0.0 : static_cast<double>(nodes_pruned) / static_cast<double>(total);
}

double SearchStats::branching_factor() const {
    return interior_nodes == 0 ? 0.0 : static_cast<double>(moves_generated) / static_cast<double>(interior_nodes);
}

string algorithm_name(SearchAlgorithm algorithm) {
    return algorithm == SearchAlgorithm::Minimax ? "minimax" : "alphabeta";
}

namespace {

// Outside every reachable score.
constexpr int SCORE_INFINITY = WIN_SCORE + 1;

/**
 * One fixed-depth iteration. The searcher keeps the current move path, the
 * counters and the abort flag; the tree itself is never stored.
 */
class Iteration {
public:
    Iteration(const Board& board, Player me, SearchAlgorithm algorithm, int depth_limit,
              optional<Clock::time_point> deadline, bool keep_trace, TraceSink<MovePath>* sink)
        : board_(board), me_(me), pruning_(algorithm == SearchAlgorithm::AlphaBeta),
          depth_limit_(depth_limit), deadline_(deadline), keep_trace_(keep_trace), sink_(sink) {}

    /// Searches the root; `move` is left untouched when aborted.
    void run(const BoardState& root) {
        if (expired()) {
            aborted_ = true;
            return;
        }
        enter(0);
        vector<BoardMove> moves = board_.legal_moves(root);
        ++stats_.interior_nodes;
        stats_.moves_generated += static_cast<long>(moves.size());

        int alpha = -SCORE_INFINITY;
        const int beta = SCORE_INFINITY;
        int best = -SCORE_INFINITY;
        BoardMove best_move = moves.front();
        for (const BoardMove& move : moves) {
            path_.push_back(move);
            int v = search(board_.apply_move(root, move), 1, alpha, beta);
            path_.pop_back();
            if (aborted_) return;
            if (v > best) {
                best = v;
                best_move = move;
            }
            if (pruning_) alpha = max(alpha, best);
        }
        move = best_move;
        score = best;
    }

    bool aborted() const { return aborted_; }
    bool depth_cutoff() const { return depth_cutoff_; }
    const SearchStats& stats() const { return stats_; }
    vector<TraceEvent<MovePath>>& trace() { return trace_; }

    BoardMove move;
    int score = 0;

private:
    bool expired() const {
        // depth 1 always runs to completion
        return deadline_ && depth_limit_ > 1 && Clock::now() >= *deadline_;
    }

    void emit(TraceEvent<MovePath> event) {
        if (sink_) sink_->record(event);
        if (keep_trace_) trace_.push_back(std::move(event));
    }

    void enter(int ply) {
        ++stats_.nodes_visited;
        stats_.max_ply = max(stats_.max_ply, ply);
        emit(Visited<MovePath>{path_, ply});
    }

    int leaf(int score, int alpha, int beta) {
        ++stats_.leaf_evaluations;
        emit(Evaluated<MovePath>{path_, score, alpha, beta});
        return score;
    }

    int search(const BoardState& state, int ply, int alpha, int beta) {
        if (expired()) {
            aborted_ = true;
            return 0;
        }
        enter(ply);

        GameOutcome outcome = board_.is_terminal(state);
        if (outcome.kind == OutcomeKind::Win) {
            int magnitude = WIN_SCORE - ply;
            return leaf(outcome.winner == me_ ? magnitude : -magnitude, alpha, beta);
        }
        if (outcome.kind == OutcomeKind::Draw) {
            return leaf(0, alpha, beta);
        }
        if (ply >= depth_limit_) {
            depth_cutoff_ = true;
            return leaf(board_.evaluate(state, me_), alpha, beta);
        }

        vector<BoardMove> moves = board_.legal_moves(state);
        if (moves.empty()) {
            return leaf(board_.evaluate(state, me_), alpha, beta);
        }
        ++stats_.interior_nodes;
        stats_.moves_generated += static_cast<long>(moves.size());

        const bool maximizing = state.to_move == me_;
        int best = maximizing ? -SCORE_INFINITY : SCORE_INFINITY;
        for (size_t i = 0; i < moves.size(); ++i) {
            path_.push_back(moves[i]);
            int v = search(board_.apply_move(state, moves[i]), ply + 1, alpha, beta);
            path_.pop_back();
            if (aborted_) return 0;

            if (maximizing) {
                best = max(best, v);
                if (pruning_) alpha = max(alpha, best);
            } else {
                best = min(best, v);
                if (pruning_) beta = min(beta, best);
            }

            if (pruning_ && alpha >= beta) {
                for (size_t j = i + 1; j < moves.size(); ++j) {
                    path_.push_back(moves[j]);
                    emit(Pruned<MovePath>{path_, alpha, beta});
                    path_.pop_back();
                    ++stats_.nodes_pruned;
                }
                break;
            }
        }
        return best;
    }

    const Board& board_;
    const Player me_;
    const bool pruning_;
    const int depth_limit_;
    const optional<Clock::time_point> deadline_;
    const bool keep_trace_;
    TraceSink<MovePath>* sink_;

    MovePath path_;
    SearchStats stats_;
    vector<TraceEvent<MovePath>> trace_;
    bool aborted_ = false;
    bool depth_cutoff_ = false;
};

} // namespace

void validate_search_config(const SearchConfig& config) {
    if (config.max_depth < 1 || config.max_depth > MAX_SEARCH_DEPTH) {
        throw invalid_argument("Search depth must be in [1," + to_string(MAX_SEARCH_DEPTH) + "], got " +
                               to_string(config.max_depth));
    }
    if (config.time_budget && config.time_budget->count() < 0) {
        throw invalid_argument("Time budget cannot be negative");
    }
}

DecisionResult choose_move(const Board& board, const BoardState& state, Player player,
                           const SearchConfig& config, TraceSink<MovePath>* sink) {
    validate_search_config(config);
    if (board.is_terminal(state).is_over() || board.legal_moves(state).empty()) {
        throw invalid_argument("The game is over, there is no move to choose");
    }
    if (state.to_move != player) {
        throw invalid_argument("It is not the searching player's turn");
    }

    const auto start = Clock::now();
    optional<Clock::time_point> deadline;
    int first_depth = config.max_depth;
    if (config.time_budget) {
        deadline = start + *config.time_budget;
        first_depth = 1;
    }

    DecisionResult result;
    for (int depth = first_depth; depth <= config.max_depth; ++depth) {
        Iteration it(board, player, config.algorithm, depth, deadline, config.record_trace, sink);
        it.run(state);
        if (it.aborted()) {
            result.timed_out = true;
            break;
        }
        result.move = it.move;
        result.score = it.score;
        result.depth_reached = depth;
        result.stats = it.stats();
        result.trace = std::move(it.trace());
        // the whole tree fit inside this depth; going deeper changes nothing
        if (!it.depth_cutoff()) break;
    }
    result.stats.elapsed = chrono::duration_cast<chrono::microseconds>(Clock::now() - start);
    return result;
}
