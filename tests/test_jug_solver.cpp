// Google Test for the water-jug solver and hints
#include <gtest/gtest.h>
#include <algorithm>
#include <numeric>
#include <random>
#include <stdexcept>
#include <vector>

#include "difficulty_policy.hpp"
#include "trace_events.hpp"
#include "water-jug-solver.hpp"

TEST(JugSolver, ClassicThreeFiveFour) {
    JugSolution s = solve_jug({3, 5}, 4);

    ASSERT_TRUE(s.solved());
    EXPECT_EQ(s.moves.size(), 6u);
    EXPECT_EQ(s.states_visited, 14);
    ASSERT_EQ(s.states.size(), s.moves.size() + 1);
    EXPECT_EQ(s.states.front(), (JugState{0, 0}));
    EXPECT_EQ(s.states.back(), (JugState{3, 4}));
    // fill the 5 first, then pour it into the 3
    EXPECT_EQ(s.moves[0], (JugMove{JugAction::Fill, 1, -1, 5}));
    EXPECT_EQ(s.moves[1], (JugMove{JugAction::Pour, 1, 0, 3}));
}

TEST(JugSolver, FourThreeTwoNeedsFourMoves) {
    JugSolution s = solve_jug({4, 3}, 2);

    ASSERT_TRUE(s.solved());
    ASSERT_EQ(s.moves.size(), 4u);
    std::vector<JugState> expected = {{0, 0}, {0, 3}, {3, 0}, {3, 3}, {4, 2}};
    EXPECT_EQ(s.states, expected);
}

TEST(JugSolver, MovesReplayToRecordedStates) {
    std::vector<int> caps = {8, 5, 3};
    JugSolution s = solve_jug(caps, 7);
    ASSERT_TRUE(s.solved());
    for (size_t i = 0; i < s.moves.size(); ++i) {
        EXPECT_EQ(apply_jug_move(s.states[i], caps, s.moves[i]), s.states[i + 1]);
    }
}

TEST(JugSolver, InfeasibleTargetsSkipSearch) {
    JugSolution odd = solve_jug({2, 4}, 3);
    EXPECT_EQ(odd.outcome, JugOutcome::Infeasible);
    EXPECT_EQ(odd.states_visited, 0);
    EXPECT_TRUE(odd.moves.empty());

    JugSolution too_big = solve_jug({3, 5}, 6);
    EXPECT_EQ(too_big.outcome, JugOutcome::Infeasible);
    EXPECT_EQ(too_big.states_visited, 0);
}

TEST(JugSolver, ZeroTargetIsSolvedAtStart) {
    JugSolution s = solve_jug({3, 5}, 0);
    ASSERT_TRUE(s.solved());
    EXPECT_TRUE(s.moves.empty());
    EXPECT_EQ(s.states.size(), 1u);
}

TEST(JugSolver, SolvedIffGcdRuleHolds) {
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> cap(1, 9);
    std::uniform_int_distribution<int> jugs(2, 3);
    std::uniform_int_distribution<int> tgt(0, 12);
    for (int round = 0; round < 200; ++round) {
        std::vector<int> caps(jugs(rng));
        for (int& c : caps) c = cap(rng);
        int target = tgt(rng);
        int g = 0, largest = 0;
        for (int c : caps) {
            g = std::gcd(g, c);
            largest = std::max(largest, c);
        }
        bool feasible = target <= largest && target % g == 0;
        EXPECT_EQ(is_jug_target_feasible(caps, target), feasible);
        EXPECT_EQ(solve_jug(caps, target).solved(), feasible);
    }
}

TEST(JugSolver, SuccessorOrderAndNoOps) {
    std::vector<JugSuccessor> from_empty = jug_successors({0, 0}, {3, 5});
    ASSERT_EQ(from_empty.size(), 2u);
    EXPECT_EQ(from_empty[0].move.action, JugAction::Fill);
    EXPECT_EQ(from_empty[0].move.source, 0);
    EXPECT_EQ(from_empty[1].move.source, 1);

    std::vector<JugSuccessor> next = jug_successors({3, 0}, {3, 5});
    ASSERT_EQ(next.size(), 3u);
    EXPECT_EQ(next[0].state, (JugState{3, 5}));
    EXPECT_EQ(next[1].state, (JugState{0, 0}));
    EXPECT_EQ(next[2].move, (JugMove{JugAction::Pour, 0, 1, 3}));
    EXPECT_EQ(next[2].state, (JugState{0, 3}));
}

TEST(JugSolver, IllegalMoveThrows) {
    // filling a full jug changes nothing and is not a move
    EXPECT_THROW(apply_jug_move({3, 0}, {3, 5}, {JugAction::Fill, 0, -1, 0}), std::invalid_argument);
    EXPECT_THROW(apply_jug_move({0, 0}, {3, 5}, {JugAction::Pour, 0, 1, 0}), std::invalid_argument);
    EXPECT_THROW(apply_jug_move({4, 0}, {3, 5}, {JugAction::Empty, 0, -1, 4}), std::invalid_argument);
}

TEST(JugSolver, InvalidPuzzlesThrow) {
    EXPECT_THROW(solve_jug({}, 1), std::invalid_argument);
    EXPECT_THROW(solve_jug({3, 0}, 1), std::invalid_argument);
    EXPECT_THROW(solve_jug({3, 5}, -1), std::invalid_argument);
    EXPECT_THROW(solve_jug({5000, 5000}, 1), std::invalid_argument);
    EXPECT_THROW(JugPuzzle({3, 5}, 4, {4, 0}), std::invalid_argument);
    EXPECT_THROW(JugPuzzle({3, 5}, 4, {0}), std::invalid_argument);
}

TEST(JugSolver, CustomStartState) {
    JugPuzzle puzzle({3, 5}, 4, {3, 0});
    JugSolution s = solve_jug(puzzle);
    ASSERT_TRUE(s.solved());
    EXPECT_EQ(s.states.front(), (JugState{3, 0}));
    EXPECT_EQ(s.moves.size(), 7u);
}

TEST(JugSolver, TraceVisitsEveryExpandedState) {
    VectorTraceSink<JugState> sink;
    JugSolution s = solve_jug({3, 5}, 4, &sink);
    ASSERT_EQ(sink.size(), static_cast<size_t>(s.states_visited));
    const auto& first = std::get<Visited<JugState>>(sink.events().front());
    EXPECT_EQ(first.node, (JugState{0, 0}));
    EXPECT_EQ(first.depth, 0);
    const auto& last = std::get<Visited<JugState>>(sink.events().back());
    EXPECT_EQ(last.node, (JugState{3, 4}));
    EXPECT_EQ(last.depth, 6);
}

TEST(JugSolver, RepeatedSolvesAreIdentical) {
    VectorTraceSink<JugState> first_trace;
    VectorTraceSink<JugState> second_trace;
    JugSolution first = solve_jug({8, 5, 3}, 7, &first_trace);
    JugSolution second = solve_jug({8, 5, 3}, 7, &second_trace);

    ASSERT_TRUE(first.solved());
    EXPECT_EQ(first.moves, second.moves);
    EXPECT_EQ(first.states, second.states);
    EXPECT_EQ(first.states_visited, second.states_visited);
    EXPECT_TRUE(first_trace.events() == second_trace.events());
}

TEST(JugHintTest, HintIsFirstMoveOfShortestSolution) {
    JugHint h = jug_hint({3, 5}, {0, 0}, 4);
    ASSERT_EQ(h.status, HintStatus::Move);
    ASSERT_TRUE(h.move.has_value());
    EXPECT_EQ(*h.move, (JugMove{JugAction::Fill, 1, -1, 5}));
    EXPECT_EQ(h.moves_remaining, 6);

    // same state, same hint
    JugHint again = jug_hint({3, 5}, {0, 0}, 4);
    EXPECT_EQ(*again.move, *h.move);

    // following the hint shortens the remaining solution by one
    JugState next = apply_jug_move({0, 0}, {3, 5}, *h.move);
    EXPECT_EQ(jug_hint({3, 5}, next, 4).moves_remaining, 5);
}

TEST(JugHintTest, SolvedAndHopelessStates) {
    JugHint solved = jug_hint({3, 5}, {0, 4}, 4);
    EXPECT_EQ(solved.status, HintStatus::AlreadySolved);
    EXPECT_FALSE(solved.move.has_value());
    EXPECT_EQ(solved.moves_remaining, 0);

    JugHint none = jug_hint({2, 4}, {2, 0}, 3);
    EXPECT_EQ(none.status, HintStatus::NoSolution);
    EXPECT_FALSE(none.move.has_value());
}

TEST(JugSolver, LevelPresetsFitTheirMoveAllowance) {
    for (Difficulty d : {Difficulty::Easy, Difficulty::Medium, Difficulty::Hard, Difficulty::Expert}) {
        LevelPreset p = level_preset(GameKind::WaterJug, d);
        JugSolution s = solve_jug(p.jug_capacities, p.jug_target);
        ASSERT_TRUE(s.solved());
        EXPECT_LE(static_cast<int>(s.moves.size()), p.move_allowance);
    }
}

TEST(JugSolver, MoveLabels) {
    JugMove pour{JugAction::Pour, 1, 0, 3};
    EXPECT_EQ(pour.label(), "Pour jug 2 into jug 1");
    EXPECT_EQ(pour.description(), "Pour 3L from jug 2 to jug 1");
    EXPECT_EQ((JugMove{JugAction::Fill, 0, -1, 3}).label(), "Fill jug 1");
}
