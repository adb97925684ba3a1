#pragma once
#include "event.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace headgram {

// Bounded multi-producer / multi-consumer FIFO of engine events.
// When full, push() evicts the oldest queued event and counts the drop.
class EventQueue {
public:
    static constexpr size_t DEFAULT_CAPACITY = 10000;

    explicit EventQueue(size_t capacity = DEFAULT_CAPACITY);

    // Non-blocking. Returns false only once the queue is closed.
    bool push(Event event);

    // Block until an event is available. Returns nullopt once the queue is
    // closed and drained.
    std::optional<Event> pop();

    // Like pop() but gives up after timeout (nullopt).
    std::optional<Event> pop_for(std::chrono::milliseconds timeout);

    // Refuse further pushes and wake every waiter. Queued events stay
    // poppable.
    void close();

    bool closed() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }
    uint64_t dropped_count() const;

private:
    std::optional<Event> take_locked();

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> events_;
    uint64_t dropped_ = 0;
    bool closed_ = false;
};

} // namespace headgram
