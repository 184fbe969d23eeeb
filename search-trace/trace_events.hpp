/**
 * @file trace_events.hpp
 * @brief Trace events emitted by the searches for step-by-step replay.
 *
 * A trace is the ordered record of what a search did internally. The node type
 * depends on the search: a `Cell` for maze search, a `JugState` for the jug
 * solver and the move path from the root for adversarial search.
 */

#ifndef __TRACE_EVENTS_HPP___
#define __TRACE_EVENTS_HPP___

#include <cstddef>
#include <variant>
#include <vector>

/**
 * @brief A node was taken off the frontier and expanded.
 */
template <typename Node>
struct Visited {
    Node node;
    int depth;
};

/**
 * @brief Frontier contents right after an expansion, in pop order.
 */
template <typename Node>
struct FrontierSnapshot {
    std::vector<Node> frontier;
};

/**
 * @brief A leaf was scored. `alpha`/`beta` are the window at the leaf.
 */
template <typename Node>
struct Evaluated {
    Node node;
    int score;
    int alpha;
    int beta;
};

/**
 * @brief A child subtree was skipped because `alpha >= beta` at its parent.
 */
template <typename Node>
struct Pruned {
    Node node;
    int alpha;
    int beta;
};

template <typename Node>
bool operator==(const Visited<Node>& lhs, const Visited<Node>& rhs) {
    return lhs.node == rhs.node && lhs.depth == rhs.depth;
}

template <typename Node>
bool operator==(const FrontierSnapshot<Node>& lhs, const FrontierSnapshot<Node>& rhs) {
    return lhs.frontier == rhs.frontier;
}

template <typename Node>
bool operator==(const Evaluated<Node>& lhs, const Evaluated<Node>& rhs) {
    return lhs.node == rhs.node && lhs.score == rhs.score && lhs.alpha == rhs.alpha && lhs.beta == rhs.beta;
}

template <typename Node>
bool operator==(const Pruned<Node>& lhs, const Pruned<Node>& rhs) {
    return lhs.node == rhs.node && lhs.alpha == rhs.alpha && lhs.beta == rhs.beta;
}

template <typename Node>
using TraceEvent = std::variant<Visited<Node>, FrontierSnapshot<Node>, Evaluated<Node>, Pruned<Node>>;

/**
 * @brief Receiver of trace events, called in the order the search produces them.
 *
 * Searches take an optional `TraceSink*`; a null sink disables tracing.
 */
template <typename Node>
class TraceSink {
public:
    virtual ~TraceSink() = default;
    virtual void record(const TraceEvent<Node>& event) = 0;
};

/**
 * @brief Batch sink: keeps every event in memory for replay after the search.
 */
template <typename Node>
class VectorTraceSink : public TraceSink<Node> {
public:
    void record(const TraceEvent<Node>& event) override { events_.push_back(event); }

    const std::vector<TraceEvent<Node>>& events() const { return events_; }
    size_t size() const { return events_.size(); }
    void clear() { events_.clear(); }

private:
    std::vector<TraceEvent<Node>> events_;
};

/**
 * @brief Count events of one alternative, e.g. `count_events<Pruned<Path>>(trace)`.
 */
template <typename Event, typename Node>
size_t count_events(const std::vector<TraceEvent<Node>>& trace) {
    size_t n = 0;
    for (const auto& ev : trace) {
        if (std::holds_alternative<Event>(ev)) ++n;
    }
    return n;
}

#endif // __TRACE_EVENTS_HPP___
