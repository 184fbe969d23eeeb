/**
 * @file trace_buffer.hpp
 * @brief Append-only trace buffer shared between a search thread and a viewer.
 *
 * One thread (the search) pushes events, one other thread (the visualizer)
 * polls them while the search is still running. Events live in fixed-size
 * chunks that are never moved or freed before the buffer itself, so a slot
 * published to the consumer stays valid.
 */

#ifndef __TRACE_BUFFER_HPP___
#define __TRACE_BUFFER_HPP___

#include <array>
#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "trace_events.hpp"

template <typename Node>
class TraceBuffer {
public:
    static constexpr size_t CHUNK_SIZE = 256;

    TraceBuffer() : head_(std::make_unique<Chunk>()), write_chunk_(head_.get()), read_chunk_(head_.get()) {}

    ~TraceBuffer() {
        // release the chain front to back, one chunk at a time
        while (head_) head_ = std::move(head_->owned_next);
    }

    TraceBuffer(const TraceBuffer&) = delete;
    TraceBuffer& operator=(const TraceBuffer&) = delete;

    /**
     * @brief Append one event. Producer thread only.
     */
    void push(TraceEvent<Node> event) {
        size_t n = write_chunk_->count.load(std::memory_order_relaxed);
        if (n == CHUNK_SIZE) {
            write_chunk_->owned_next = std::make_unique<Chunk>();
            Chunk* next = write_chunk_->owned_next.get();
            write_chunk_->next.store(next, std::memory_order_release);
            write_chunk_ = next;
            n = 0;
        }
        write_chunk_->slots[n].emplace(std::move(event));
        write_chunk_->count.store(n + 1, std::memory_order_release);
        pushed_.fetch_add(1, std::memory_order_relaxed);
    }

    /**
     * @brief Mark the end of the stream. Producer thread only; no push after this.
     */
    void close() { closed_.store(true, std::memory_order_release); }

    /**
     * @brief Take the next published event, if any. Consumer thread only.
     *
     * @param out Receives the event.
     * @return true if an event was read.
     */
    bool poll(TraceEvent<Node>& out) {
        for (;;) {
            size_t n = read_chunk_->count.load(std::memory_order_acquire);
            if (read_index_ < n) {
                out = *read_chunk_->slots[read_index_++];
                return true;
            }
            if (n < CHUNK_SIZE) return false;
            Chunk* next = read_chunk_->next.load(std::memory_order_acquire);
            if (!next) return false;
            read_chunk_ = next;
            read_index_ = 0;
        }
    }

    /**
     * @brief Move every currently published event into `out`. Consumer thread only.
     *
     * @return Number of events appended.
     */
    size_t drain(std::vector<TraceEvent<Node>>& out) {
        size_t n = 0;
        TraceEvent<Node> ev;
        while (poll(ev)) {
            out.push_back(std::move(ev));
            ++n;
        }
        return n;
    }

    /**
     * @brief True once the producer called close(). Events pushed before
     * close() are all visible to poll() after this returns true.
     */
    bool closed() const { return closed_.load(std::memory_order_acquire); }

    /// Approximate number of events pushed so far.
    size_t pushed() const { return pushed_.load(std::memory_order_relaxed); }

private:
    struct Chunk {
        std::array<std::optional<TraceEvent<Node>>, CHUNK_SIZE> slots;
        std::atomic<size_t> count{0};
        // consumer follows `next`; `owned_next` is touched by the producer only
        std::atomic<Chunk*> next{nullptr};
        std::unique_ptr<Chunk> owned_next;
    };

    std::unique_ptr<Chunk> head_;
    // producer side
    Chunk* write_chunk_;
    // consumer side
    Chunk* read_chunk_;
    size_t read_index_ = 0;

    std::atomic<bool> closed_{false};
    std::atomic<size_t> pushed_{0};
};

/**
 * @brief Streaming sink: forwards each event into a `TraceBuffer`.
 */
template <typename Node>
class BufferTraceSink : public TraceSink<Node> {
public:
    explicit BufferTraceSink(TraceBuffer<Node>& buffer) : buffer_(buffer) {}

    void record(const TraceEvent<Node>& event) override { buffer_.push(event); }

private:
    TraceBuffer<Node>& buffer_;
};

#endif // __TRACE_BUFFER_HPP___
