// Google Test for find_path (BFS and DFS over a GridGraph)
#include <gtest/gtest.h>
#include <deque>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "grid_graph.hpp"
#include "generate_maze.hpp"
#include "maze-path-solver.hpp"
#include "trace_events.hpp"

// Reference distances by plain flood fill.
static std::vector<int> distances_from(const GridGraph& g, const Cell& start) {
    std::vector<int> dist(g.get_rows() * g.get_cols(), -1);
    std::deque<Cell> queue;
    dist[g.index_of(start)] = 0;
    queue.push_back(start);
    while (!queue.empty()) {
        Cell c = queue.front();
        queue.pop_front();
        for (const Cell& n : g.get_neighbors(c)) {
            if (dist[g.index_of(n)] != -1) continue;
            dist[g.index_of(n)] = dist[g.index_of(c)] + 1;
            queue.push_back(n);
        }
    }
    return dist;
}

static bool is_valid_path(const GridGraph& g, const std::vector<Cell>& path, const Cell& start, const Cell& goal) {
    if (path.empty() || path.front() != start || path.back() != goal) return false;
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        std::vector<Cell> n = g.get_neighbors(path[i]);
        bool adjacent = false;
        for (const Cell& c : n) adjacent = adjacent || c == path[i + 1];
        if (!adjacent) return false;
    }
    return true;
}

TEST(PathSearch, BfsFindsShortestPathInOpenGrid) {
    GridGraph g(5, 5, {});
    PathResult r = find_path(g, {0, 0}, {4, 4}, SearchStrategy::BFS);

    ASSERT_TRUE(r.found());
    EXPECT_EQ(r.length(), 8);
    EXPECT_EQ(r.path.size(), 9u);
    EXPECT_TRUE(is_valid_path(g, r.path, {0, 0}, {4, 4}));
}

TEST(PathSearch, StartEqualsGoal) {
    GridGraph g(3, 3, {});
    for (SearchStrategy s : {SearchStrategy::BFS, SearchStrategy::DFS}) {
        PathResult r = find_path(g, {1, 1}, {1, 1}, s);
        ASSERT_TRUE(r.found());
        ASSERT_EQ(r.path.size(), 1u);
        EXPECT_EQ(r.length(), 0);
        EXPECT_EQ(r.cells_expanded, 1);
    }
}

TEST(PathSearch, DisconnectedMazeIsUnreachable) {
    // a full wall down the middle column
    GridGraph g = GridGraph::from_rows({
        "..#..",
        "..#..",
        "..#..",
        "..#..",
        "..#..",
    });
    for (SearchStrategy s : {SearchStrategy::BFS, SearchStrategy::DFS}) {
        PathResult r = find_path(g, {0, 0}, {4, 4}, s);
        EXPECT_EQ(r.outcome, PathOutcome::Unreachable);
        EXPECT_TRUE(r.path.empty());
        EXPECT_EQ(r.length(), -1);
        // every cell on the start side gets expanded
        EXPECT_EQ(r.cells_expanded, 10);
    }
}

TEST(PathSearch, TeleporterCountsAsOneEdge) {
    GridGraph g(1, 10, {}, {{{0, 1}, {0, 8}, false}});
    PathResult r = find_path(g, {0, 0}, {0, 9}, SearchStrategy::BFS);

    ASSERT_TRUE(r.found());
    // (0,0) -> (0,1) -> teleport (0,8) -> (0,9)
    EXPECT_EQ(r.length(), 3);
    EXPECT_EQ(r.path[2], (Cell{0, 8}));
}

TEST(PathSearch, DirectedTeleporterHasNoWayBack) {
    GridGraph g = GridGraph::from_rows({".#."}, {{{0, 0}, {0, 2}, false}});

    EXPECT_TRUE(find_path(g, {0, 0}, {0, 2}, SearchStrategy::BFS).found());
    EXPECT_FALSE(find_path(g, {0, 2}, {0, 0}, SearchStrategy::BFS).found());
    EXPECT_FALSE(find_path(g, {0, 2}, {0, 0}, SearchStrategy::DFS).found());
}

TEST(PathSearch, DfsFollowsNeighbourOrder) {
    GridGraph g(3, 3, {});
    PathResult r = find_path(g, {2, 0}, {2, 2}, SearchStrategy::DFS);

    ASSERT_TRUE(r.found());
    // up first, then right at the top row, then down
    std::vector<Cell> expected = {{2, 0}, {1, 0}, {0, 0}, {0, 1}, {0, 2}, {1, 2}, {2, 2}};
    EXPECT_EQ(r.path, expected);
}

TEST(PathSearch, BfsNeverLongerThanDfsOnGeneratedMazes) {
    for (unsigned int seed = 1; seed <= 20; ++seed) {
        std::mt19937 rng(seed);
        MazeProblem maze = random_maze(11, 15, static_cast<int>(seed % 3), rng);
        PathResult bfs = find_path(maze, SearchStrategy::BFS);
        PathResult dfs = find_path(maze, SearchStrategy::DFS);
        ASSERT_TRUE(bfs.found()) << "seed " << seed;
        ASSERT_TRUE(dfs.found()) << "seed " << seed;
        EXPECT_LE(bfs.length(), dfs.length());
        EXPECT_TRUE(is_valid_path(maze.graph, dfs.path, maze.start, maze.goal));

        std::vector<int> dist = distances_from(maze.graph, maze.start);
        EXPECT_EQ(bfs.length(), dist[maze.graph.index_of(maze.goal)]);
    }
}

TEST(PathSearch, BfsMatchesFloodFillOnRandomGrids) {
    std::mt19937 rng(7);
    std::bernoulli_distribution wall(0.3);
    for (int round = 0; round < 30; ++round) {
        std::vector<std::string> rows(8, std::string(8, '.'));
        for (auto& row : rows)
            for (char& c : row) c = wall(rng) ? '#' : '.';
        rows[0][0] = '.';
        rows[7][7] = '.';
        GridGraph g = GridGraph::from_rows(rows);
        std::vector<int> dist = distances_from(g, {0, 0});
        PathResult r = find_path(g, {0, 0}, {7, 7}, SearchStrategy::BFS);
        EXPECT_EQ(r.length(), dist[g.index_of({7, 7})]);
        EXPECT_EQ(r.found(), find_path(g, {0, 0}, {7, 7}, SearchStrategy::DFS).found());
    }
}

TEST(PathSearch, TraceHasVisitAndSnapshotPerExpansion) {
    GridGraph g(3, 3, {});
    for (SearchStrategy s : {SearchStrategy::BFS, SearchStrategy::DFS}) {
        VectorTraceSink<Cell> sink;
        PathResult r = find_path(g, {0, 0}, {2, 2}, s, &sink);
        ASSERT_TRUE(r.found());

        size_t visits = count_events<Visited<Cell>>(sink.events());
        EXPECT_EQ(visits, static_cast<size_t>(r.cells_expanded));
        // the goal expansion returns before its snapshot
        EXPECT_EQ(count_events<FrontierSnapshot<Cell>>(sink.events()), visits - 1);

        const auto& first = std::get<Visited<Cell>>(sink.events().front());
        EXPECT_EQ(first.node, (Cell{0, 0}));
        EXPECT_EQ(first.depth, 0);
        const auto& last = std::get<Visited<Cell>>(sink.events().back());
        EXPECT_EQ(last.node, (Cell{2, 2}));
    }
}

TEST(PathSearch, DeterministicPathAndTrace) {
    std::mt19937 rng(42);
    MazeProblem maze = random_maze(15, 20, 2, rng);
    ASSERT_EQ(maze.graph.get_teleporters().size(), 2u);

    for (SearchStrategy s : {SearchStrategy::BFS, SearchStrategy::DFS}) {
        VectorTraceSink<Cell> first_trace;
        VectorTraceSink<Cell> second_trace;
        PathResult first = find_path(maze, s, &first_trace);
        PathResult second = find_path(maze, s, &second_trace);

        EXPECT_EQ(first.outcome, second.outcome);
        EXPECT_EQ(first.path, second.path);
        EXPECT_EQ(first.cells_expanded, second.cells_expanded);
        ASSERT_EQ(first_trace.size(), second_trace.size()) << strategy_name(s);
        for (size_t i = 0; i < first_trace.size(); ++i) {
            ASSERT_EQ(first_trace.events()[i].index(), second_trace.events()[i].index()) << "event " << i;
            EXPECT_TRUE(first_trace.events()[i] == second_trace.events()[i]) << "event " << i;
        }
    }
}

TEST(PathSearch, BfsSnapshotIsQueueOrder) {
    GridGraph g(3, 3, {});
    VectorTraceSink<Cell> sink;
    find_path(g, {1, 1}, {0, 0}, SearchStrategy::BFS, &sink);

    const auto& snap = std::get<FrontierSnapshot<Cell>>(sink.events()[1]);
    std::vector<Cell> expected = {{0, 1}, {1, 2}, {2, 1}, {1, 0}};
    EXPECT_EQ(snap.frontier, expected);
}

TEST(PathSearch, BadEndpointsThrow) {
    GridGraph g = GridGraph::from_rows({"..", "#."});
    EXPECT_THROW(find_path(g, {1, 0}, {0, 0}, SearchStrategy::BFS), std::invalid_argument);
    EXPECT_THROW(find_path(g, {0, 0}, {5, 5}, SearchStrategy::DFS), std::invalid_argument);
}
