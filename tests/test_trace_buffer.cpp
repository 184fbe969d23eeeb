// Google Test for TraceBuffer (single producer, single consumer)
#include <gtest/gtest.h>
#include <thread>
#include <type_traits>
#include <variant>
#include <vector>

#include "trace_buffer.hpp"
#include "trace_events.hpp"

TEST(TraceBufferTest, PollsInPushOrderAcrossChunks) {
    TraceBuffer<int> buffer;
    const int n = static_cast<int>(TraceBuffer<int>::CHUNK_SIZE) * 2 + 17;
    for (int i = 0; i < n; ++i) buffer.push(Visited<int>{i, i % 5});

    TraceEvent<int> ev;
    for (int i = 0; i < n; ++i) {
        ASSERT_TRUE(buffer.poll(ev));
        EXPECT_EQ(std::get<Visited<int>>(ev).node, i);
    }
    EXPECT_FALSE(buffer.poll(ev));
    EXPECT_EQ(buffer.pushed(), static_cast<size_t>(n));
}

TEST(TraceBufferTest, EmptyAndClosed) {
    TraceBuffer<int> buffer;
    TraceEvent<int> ev;
    EXPECT_FALSE(buffer.poll(ev));
    EXPECT_FALSE(buffer.closed());

    buffer.push(Pruned<int>{3, 5, 1});
    buffer.close();
    EXPECT_TRUE(buffer.closed());
    std::vector<TraceEvent<int>> out;
    EXPECT_EQ(buffer.drain(out), 1u);
    EXPECT_EQ(count_events<Pruned<int>>(out), 1u);
}

TEST(TraceBufferTest, ConcurrentProducerAndConsumer) {
    TraceBuffer<int> buffer;
    const int n = 20000;
    std::thread producer([&buffer]() {
        for (int i = 0; i < n; ++i) {
            if (i % 3 == 0) buffer.push(Evaluated<int>{i, -i, -1, 1});
            else buffer.push(Visited<int>{i, 0});
        }
        buffer.close();
    });

    std::vector<TraceEvent<int>> seen;
    while (!buffer.closed()) buffer.drain(seen);
    buffer.drain(seen);
    producer.join();

    ASSERT_EQ(seen.size(), static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        int node = std::visit(
            [](const auto& e) -> int {
                using E = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<E, FrontierSnapshot<int>>) return -1;
                else return e.node;
            },
            seen[i]);
        EXPECT_EQ(node, i);
    }
    EXPECT_EQ(count_events<Evaluated<int>>(seen), static_cast<size_t>((n + 2) / 3));
}

TEST(TraceBufferTest, SinkForwardsToBuffer) {
    TraceBuffer<int> buffer;
    BufferTraceSink<int> sink(buffer);
    TraceSink<int>& base = sink;
    base.record(FrontierSnapshot<int>{{1, 2, 3}});

    TraceEvent<int> ev;
    ASSERT_TRUE(buffer.poll(ev));
    EXPECT_EQ(std::get<FrontierSnapshot<int>>(ev).frontier, (std::vector<int>{1, 2, 3}));
}

TEST(VectorTraceSinkTest, KeepsEventsUntilCleared) {
    VectorTraceSink<int> sink;
    sink.record(Visited<int>{1, 0});
    sink.record(Visited<int>{2, 1});
    EXPECT_EQ(sink.size(), 2u);
    EXPECT_EQ(count_events<Visited<int>>(sink.events()), 2u);
    sink.clear();
    EXPECT_EQ(sink.size(), 0u);
}

TEST(TraceEventTest, EqualityComparesEveryField) {
    TraceEvent<int> a = Evaluated<int>{4, 10, -3, 7};
    EXPECT_TRUE(a == (TraceEvent<int>{Evaluated<int>{4, 10, -3, 7}}));
    EXPECT_FALSE(a == (TraceEvent<int>{Evaluated<int>{4, 10, -3, 8}}));
    EXPECT_FALSE(a == (TraceEvent<int>{Evaluated<int>{4, 11, -3, 7}}));
    // same fields, different alternative
    EXPECT_FALSE((TraceEvent<int>{Pruned<int>{4, -3, 7}}) == (TraceEvent<int>{Evaluated<int>{4, 0, -3, 7}}));
    EXPECT_FALSE((TraceEvent<int>{Visited<int>{1, 0}}) == (TraceEvent<int>{Visited<int>{1, 1}}));
    EXPECT_TRUE((TraceEvent<int>{FrontierSnapshot<int>{{1, 2}}}) == (TraceEvent<int>{FrontierSnapshot<int>{{1, 2}}}));
}

TEST(TraceBufferTest, LongChainOfChunksStaysReadable) {
    const size_t chunks = 1000;
    const size_t n = TraceBuffer<int>::CHUNK_SIZE * chunks;
    std::vector<TraceEvent<int>> out;
    {
        TraceBuffer<int> buffer;
        for (size_t i = 0; i < n; ++i) buffer.push(Visited<int>{static_cast<int>(i), 0});
        buffer.close();
        EXPECT_EQ(buffer.drain(out), n);
    }
    // the events were copied out before the buffer released its chunks
    ASSERT_EQ(out.size(), n);
    EXPECT_EQ(std::get<Visited<int>>(out.back()).node, static_cast<int>(n - 1));
}
