#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "grid_graph.hpp"

using namespace std;

static string cell_text(const Cell& c) {
    return "(" + to_string(c.row) + "," + to_string(c.col) + ")";
}

void GridGraph::init(int rows, int cols, const vector<Cell>& blocked_cells, const vector<Teleporter>& teleporters) {
    if (rows <= 0 || cols <= 0) {
        throw invalid_argument("Grid dimensions must be positive");
    }
    this->rows = rows;
    this->cols = cols;
    blocked.assign(static_cast<size_t>(rows) * cols, false);
    teleport_target.assign(static_cast<size_t>(rows) * cols, -1);

    for (const Cell& c : blocked_cells) {
        if (!contains(c)) {
            throw invalid_argument("Blocked cell outside grid: " + cell_text(c));
        }
        blocked[index_of(c)] = true;
    }

    auto link = [this](const Cell& from, const Cell& to) {
        int idx = index_of(from);
        if (teleport_target[idx] != -1) {
            throw invalid_argument("Cell has more than one outgoing teleporter: " + cell_text(from));
        }
        teleport_target[idx] = index_of(to);
    };
    for (const Teleporter& t : teleporters) {
        if (!contains(t.from) || !contains(t.to)) {
            throw invalid_argument("Teleporter endpoint outside grid: " + cell_text(t.from) + " -> " + cell_text(t.to));
        }
        if (t.from == t.to) {
            throw invalid_argument("Teleporter endpoints must differ: " + cell_text(t.from));
        }
        if (blocked[index_of(t.from)] || blocked[index_of(t.to)]) {
            throw invalid_argument("Teleporter endpoint is blocked: " + cell_text(t.from) + " -> " + cell_text(t.to));
        }
        link(t.from, t.to);
        if (t.bidirectional) {
            link(t.to, t.from);
        }
    }
    this->teleporters = teleporters;
}

GridGraph::GridGraph(int rows, int cols, const vector<Cell>& blocked_cells, const vector<Teleporter>& teleporters) {
    init(rows, cols, blocked_cells, teleporters);
}

GridGraph GridGraph::from_rows(const vector<string>& lines, const vector<Teleporter>& teleporters) {
    if (lines.empty() || lines[0].empty()) {
        throw invalid_argument("Maze rows cannot be empty");
    }
    int cols = static_cast<int>(lines[0].size());
    vector<Cell> walls;
    for (size_t r = 0; r < lines.size(); ++r) {
        if (static_cast<int>(lines[r].size()) != cols) {
            throw invalid_argument("Maze row " + to_string(r) + " has a different length");
        }
        for (int c = 0; c < cols; ++c) {
            if (lines[r][c] == '#') walls.push_back({static_cast<int>(r), c});
        }
    }
    return GridGraph(static_cast<int>(lines.size()), cols, walls, teleporters);
}

int GridGraph::get_rows() const {
    return rows;
}

int GridGraph::get_cols() const {
    return cols;
}

bool GridGraph::contains(const Cell& cell) const {
    return cell.row >= 0 && cell.row < rows && cell.col >= 0 && cell.col < cols;
}

bool GridGraph::is_blocked(const Cell& cell) const {
    if (!contains(cell)) return true;
    return blocked[index_of(cell)];
}

optional<Cell> GridGraph::get_teleport_target(const Cell& cell) const {
    if (!contains(cell)) return nullopt;
    int target = teleport_target[index_of(cell)];
    if (target < 0) return nullopt;
    return cell_at(target);
}

vector<Cell> GridGraph::get_neighbors(const Cell& cell) const {
    vector<Cell> neighbors;
    if (is_blocked(cell)) return neighbors;
    // up, right, down, left
    static const int directions[4][2] = {{-1, 0}, {0, 1}, {1, 0}, {0, -1}};
    for (const auto& d : directions) {
        Cell next{cell.row + d[0], cell.col + d[1]};
        if (!is_blocked(next)) neighbors.push_back(next);
    }
    if (auto target = get_teleport_target(cell)) {
        neighbors.push_back(*target);
    }
    return neighbors;
}

int GridGraph::index_of(const Cell& cell) const {
    return cell.row * cols + cell.col;
}

Cell GridGraph::cell_at(int index) const {
    return Cell{index / cols, index % cols};
}

const vector<Teleporter>& GridGraph::get_teleporters() const {
    return teleporters;
}

vector<Cell> GridGraph::get_blocked_cells() const {
    vector<Cell> cells;
    for (int i = 0; i < rows * cols; ++i) {
        if (blocked[i]) cells.push_back(cell_at(i));
    }
    return cells;
}

MazeProblem::MazeProblem(GridGraph graph, Cell start, Cell goal)
    : graph(std::move(graph)), start(start), goal(goal) {
    if (!this->graph.contains(start) || !this->graph.contains(goal)) {
        throw invalid_argument("Start and goal must lie inside the grid");
    }
    if (this->graph.is_blocked(start) || this->graph.is_blocked(goal)) {
        throw invalid_argument("Start and goal must be open cells");
    }
}
