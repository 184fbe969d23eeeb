#include <algorithm>
#include <deque>
#include <stdexcept>
#include <vector>

#include "grid_graph.hpp"
#include "maze-path-solver.hpp"

using namespace std;

namespace {

// Search tree node; parents are arena indices, -1 at the root.
struct SearchNode {
    Cell cell;
    int parent;
    int depth;
};

vector<Cell> reconstruct_path(const vector<SearchNode>& arena, int handle) {
    vector<Cell> path;
    for (int h = handle; h != -1; h = arena[h].parent) {
        path.push_back(arena[h].cell);
    }
    reverse(path.begin(), path.end());
    return path;
}

void check_endpoint(const GridGraph& graph, const Cell& cell, const char* what) {
    if (!graph.contains(cell)) {
        throw invalid_argument(string(what) + " cell is outside the grid");
    }
    if (graph.is_blocked(cell)) {
        throw invalid_argument(string(what) + " cell is blocked");
    }
}

PathResult bfs(const GridGraph& graph, const Cell& start, const Cell& goal, TraceSink<Cell>* trace) {
    PathResult result;
    vector<SearchNode> arena;
    vector<bool> discovered(static_cast<size_t>(graph.get_rows()) * graph.get_cols(), false);
    deque<int> frontier;

    arena.push_back({start, -1, 0});
    discovered[graph.index_of(start)] = true;
    frontier.push_back(0);

    while (!frontier.empty()) {
        int handle = frontier.front();
        frontier.pop_front();
        const SearchNode node = arena[handle];
        ++result.cells_expanded;
        if (trace) trace->record(Visited<Cell>{node.cell, node.depth});

        if (node.cell == goal) {
            result.outcome = PathOutcome::Found;
            result.path = reconstruct_path(arena, handle);
            return result;
        }

        for (const Cell& next : graph.get_neighbors(node.cell)) {
            int idx = graph.index_of(next);
            if (discovered[idx]) continue;
            discovered[idx] = true;
            arena.push_back({next, handle, node.depth + 1});
            frontier.push_back(static_cast<int>(arena.size()) - 1);
        }

        if (trace) {
            FrontierSnapshot<Cell> snapshot;
            for (int h : frontier) snapshot.frontier.push_back(arena[h].cell);
            trace->record(snapshot);
        }
    }
    return result;
}

PathResult dfs(const GridGraph& graph, const Cell& start, const Cell& goal, TraceSink<Cell>* trace) {
    PathResult result;
    vector<SearchNode> arena;
    vector<bool> expanded(static_cast<size_t>(graph.get_rows()) * graph.get_cols(), false);
    vector<int> stack;

    arena.push_back({start, -1, 0});
    stack.push_back(0);

    while (!stack.empty()) {
        int handle = stack.back();
        stack.pop_back();
        const SearchNode node = arena[handle];
        int idx = graph.index_of(node.cell);
        if (expanded[idx]) continue;
        expanded[idx] = true;
        ++result.cells_expanded;
        if (trace) trace->record(Visited<Cell>{node.cell, node.depth});

        if (node.cell == goal) {
            result.outcome = PathOutcome::Found;
            result.path = reconstruct_path(arena, handle);
            return result;
        }

        // Push in reverse so the first neighbour is popped first.
        vector<Cell> neighbors = graph.get_neighbors(node.cell);
        for (auto it = neighbors.rbegin(); it != neighbors.rend(); ++it) {
            if (expanded[graph.index_of(*it)]) continue;
            arena.push_back({*it, handle, node.depth + 1});
            stack.push_back(static_cast<int>(arena.size()) - 1);
        }

        if (trace) {
            FrontierSnapshot<Cell> snapshot;
            vector<bool> listed(expanded.size(), false);
            for (auto it = stack.rbegin(); it != stack.rend(); ++it) {
                int cidx = graph.index_of(arena[*it].cell);
                if (expanded[cidx] || listed[cidx]) continue;
                listed[cidx] = true;
                snapshot.frontier.push_back(arena[*it].cell);
            }
            trace->record(snapshot);
        }
    }
    return result;
}

} // namespace

PathResult find_path(const GridGraph& graph, const Cell& start, const Cell& goal,
                     SearchStrategy strategy, TraceSink<Cell>* trace) {
    check_endpoint(graph, start, "Start");
    check_endpoint(graph, goal, "Goal");
    if (strategy == SearchStrategy::BFS) {
        return bfs(graph, start, goal, trace);
    }
    return dfs(graph, start, goal, trace);
}

PathResult find_path(const MazeProblem& problem, SearchStrategy strategy, TraceSink<Cell>* trace) {
    return find_path(problem.graph, problem.start, problem.goal, strategy, trace);
}

string strategy_name(SearchStrategy strategy) {
    return strategy == SearchStrategy::BFS ? "bfs" : "dfs";
}
