#include <algorithm>
#include <deque>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

#include "water-jug-solver.hpp"

using namespace std;

string JugMove::label() const {
    switch (action) {
    case JugAction::Fill:
        return "Fill jug " + to_string(source + 1);
    case JugAction::Empty:
        return "Empty jug " + to_string(source + 1);
    case JugAction::Pour:
        return "Pour jug " + to_string(source + 1) + " into jug " + to_string(target + 1);
    }
    return "";
}

string JugMove::description() const {
    switch (action) {
    case JugAction::Fill:
        return "Fill jug " + to_string(source + 1) + " with " + to_string(amount) + "L";
    case JugAction::Empty:
        return "Empty jug " + to_string(source + 1) + " (" + to_string(amount) + "L)";
    case JugAction::Pour:
        return "Pour " + to_string(amount) + "L from jug " + to_string(source + 1) + " to jug " + to_string(target + 1);
    }
    return "";
}

static void validate_capacities(const vector<int>& capacities, int target) {
    if (capacities.empty()) {
        throw invalid_argument("At least one jug is required");
    }
    size_t states = 1;
    for (int cap : capacities) {
        if (cap <= 0) {
            throw invalid_argument("Jug capacities must be positive");
        }
        states *= static_cast<size_t>(cap) + 1;
        if (states > JUG_MAX_STATES) {
            throw invalid_argument("Jug state space exceeds " + to_string(JUG_MAX_STATES) + " states");
        }
    }
    if (target < 0) {
        throw invalid_argument("Target amount cannot be negative");
    }
}

static void validate_state(const JugState& state, const vector<int>& capacities) {
    if (state.size() != capacities.size()) {
        throw invalid_argument("Jug state has " + to_string(state.size()) + " levels for " +
                               to_string(capacities.size()) + " jugs");
    }
    for (size_t i = 0; i < state.size(); ++i) {
        if (state[i] < 0 || state[i] > capacities[i]) {
            throw invalid_argument("Jug " + to_string(i + 1) + " level out of range");
        }
    }
}

JugPuzzle::JugPuzzle(const vector<int>& capacities, int target)
    : JugPuzzle(capacities, target, JugState(capacities.size(), 0)) {
}

JugPuzzle::JugPuzzle(const vector<int>& capacities, int target, const JugState& start) {
    validate_capacities(capacities, target);
    validate_state(start, capacities);
    this->capacities = capacities;
    this->target = target;
    this->start = start;
}

const vector<int>& JugPuzzle::get_capacities() const {
    return capacities;
}

int JugPuzzle::get_target() const {
    return target;
}

const JugState& JugPuzzle::get_start() const {
    return start;
}

bool JugPuzzle::is_feasible() const {
    return is_jug_target_feasible(capacities, target);
}

bool JugPuzzle::is_goal(const JugState& state) const {
    return find(state.begin(), state.end(), target) != state.end();
}

bool is_jug_target_feasible(const vector<int>& capacities, int target) {
    if (capacities.empty() || target < 0) return false;
    int g = 0;
    int largest = 0;
    for (int cap : capacities) {
        g = gcd(g, cap);
        largest = max(largest, cap);
    }
    return target <= largest && target % g == 0;
}

vector<JugSuccessor> jug_successors(const JugState& state, const vector<int>& capacities) {
    vector<JugSuccessor> next;
    int n = static_cast<int>(state.size());
    for (int i = 0; i < n; ++i) {
        if (state[i] < capacities[i]) {
            JugState s = state;
            s[i] = capacities[i];
            next.push_back({{JugAction::Fill, i, -1, capacities[i] - state[i]}, s});
        }
    }
    for (int i = 0; i < n; ++i) {
        if (state[i] > 0) {
            JugState s = state;
            s[i] = 0;
            next.push_back({{JugAction::Empty, i, -1, state[i]}, s});
        }
    }
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            if (i == j || state[i] == 0 || state[j] == capacities[j]) continue;
            int amount = min(state[i], capacities[j] - state[j]);
            JugState s = state;
            s[i] -= amount;
            s[j] += amount;
            next.push_back({{JugAction::Pour, i, j, amount}, s});
        }
    }
    return next;
}

JugState apply_jug_move(const JugState& state, const vector<int>& capacities, const JugMove& move) {
    validate_state(state, capacities);
    for (const auto& succ : jug_successors(state, capacities)) {
        if (succ.move.action == move.action && succ.move.source == move.source &&
            succ.move.target == move.target) {
            return succ.state;
        }
    }
    throw invalid_argument("Illegal jug move: " + move.label());
}

namespace {

struct JugNode {
    JugState state;
    int parent;
    JugMove move;
    int depth;
};

size_t encode(const JugState& state, const vector<int>& capacities) {
    size_t key = 0;
    for (size_t i = 0; i < state.size(); ++i) {
        key = key * (static_cast<size_t>(capacities[i]) + 1) + static_cast<size_t>(state[i]);
    }
    return key;
}

size_t state_space_size(const vector<int>& capacities) {
    size_t n = 1;
    for (int cap : capacities) n *= static_cast<size_t>(cap) + 1;
    return n;
}

// BFS from `start`; returns the arena index of the first goal node or -1.
int bfs(const JugState& start, const vector<int>& capacities, int target,
        vector<JugNode>& arena, int& visited_count, TraceSink<JugState>* trace) {
    vector<bool> seen(state_space_size(capacities), false);
    deque<int> frontier;
    arena.push_back({start, -1, {JugAction::Fill, -1, -1, 0}, 0});
    seen[encode(start, capacities)] = true;
    frontier.push_back(0);

    while (!frontier.empty()) {
        int handle = frontier.front();
        frontier.pop_front();
        ++visited_count;
        // copy: arena may grow below
        const JugState state = arena[handle].state;
        const int depth = arena[handle].depth;
        if (trace) trace->record(Visited<JugState>{state, depth});

        if (find(state.begin(), state.end(), target) != state.end()) {
            return handle;
        }
        for (auto& succ : jug_successors(state, capacities)) {
            size_t key = encode(succ.state, capacities);
            if (seen[key]) continue;
            seen[key] = true;
            arena.push_back({std::move(succ.state), handle, succ.move, depth + 1});
            frontier.push_back(static_cast<int>(arena.size()) - 1);
        }
    }
    return -1;
}

JugSolution solve_from(const JugState& start, const vector<int>& capacities, int target,
                       TraceSink<JugState>* trace) {
    JugSolution solution;
    if (!is_jug_target_feasible(capacities, target)) {
        solution.outcome = JugOutcome::Infeasible;
        return solution;
    }
    vector<JugNode> arena;
    int goal = bfs(start, capacities, target, arena, solution.states_visited, trace);
    if (goal < 0) {
        solution.outcome = JugOutcome::Infeasible;
        return solution;
    }
    for (int h = goal; h != -1; h = arena[h].parent) {
        solution.states.push_back(arena[h].state);
        if (arena[h].parent != -1) solution.moves.push_back(arena[h].move);
    }
    reverse(solution.states.begin(), solution.states.end());
    reverse(solution.moves.begin(), solution.moves.end());
    solution.outcome = JugOutcome::Solved;
    return solution;
}

} // namespace

JugSolution solve_jug(const JugPuzzle& puzzle, TraceSink<JugState>* trace) {
    return solve_from(puzzle.get_start(), puzzle.get_capacities(), puzzle.get_target(), trace);
}

JugSolution solve_jug(const vector<int>& capacities, int target, TraceSink<JugState>* trace) {
    return solve_jug(JugPuzzle(capacities, target), trace);
}

JugHint jug_hint(const vector<int>& capacities, const JugState& current, int target) {
    JugPuzzle puzzle(capacities, target, current);
    JugHint hint;
    if (!puzzle.is_feasible()) {
        return hint;
    }
    if (puzzle.is_goal(current)) {
        hint.status = HintStatus::AlreadySolved;
        hint.moves_remaining = 0;
        return hint;
    }
    JugSolution solution = solve_jug(puzzle);
    if (!solution.solved() || solution.moves.empty()) {
        return hint;
    }
    hint.status = HintStatus::Move;
    hint.move = solution.moves.front();
    hint.moves_remaining = static_cast<int>(solution.moves.size());
    return hint;
}
