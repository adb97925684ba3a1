#pragma once
#include "engine.hpp"
#include "event.hpp"
#include "event_queue.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <nlohmann/json.hpp>

namespace headgram {

struct TransportOptions {
    double poll_timeout_seconds = 1.0;
    size_t queue_capacity = EventQueue::DEFAULT_CAPACITY;
};

// Bridges the engine's blocking receive primitive to the rest of the
// program. Owns the single poll thread; everything else talks to the engine
// through submit() / execute_local() and reads events via next_event().
class Transport {
public:
    static constexpr std::chrono::milliseconds DEFAULT_SHUTDOWN_TIMEOUT{2000};

    // The engine must outlive the poll thread, including an abandoned one.
    explicit Transport(Engine& engine, TransportOptions options = {});
    ~Transport();

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    // Fire-and-forget. Serialization or engine errors propagate.
    void submit(const nlohmann::json& command);

    // Only for requests documented as answerable without network access.
    // nullopt if the engine gave no answer or the answer did not parse.
    std::optional<nlohmann::json> execute_local(const nlohmann::json& query);

    // Block until the next event, in engine order.
    // Throws TransportClosed after shutdown once the queue is drained.
    Event next_event();

    // Bounded wait: nullopt on timeout. Throws TransportClosed like above.
    std::optional<Event> next_event(std::chrono::milliseconds timeout);

    // Stop polling, best-effort send "close", wait up to timeout for the
    // poll thread. Returns false if the thread had to be abandoned.
    // Idempotent: later calls return the first call's result.
    bool shutdown(std::chrono::milliseconds timeout = DEFAULT_SHUTDOWN_TIMEOUT);

    bool running() const;

    uint64_t dropped_count() const;
    uint64_t malformed_count() const;
    uint64_t poll_error_count() const;

private:
    // Shared with the poll thread so an abandoned thread never touches a
    // destroyed Transport.
    struct PollState {
        explicit PollState(size_t capacity) : queue(capacity) {}

        EventQueue queue;
        std::atomic<bool> running{true};
        std::atomic<uint64_t> malformed{0};
        std::atomic<uint64_t> poll_errors{0};

        std::mutex done_mutex;
        std::condition_variable done_cv;
        bool done = false;
    };

    static void poll_loop(Engine& engine, std::shared_ptr<PollState> state,
                          double poll_timeout_seconds);

    Engine& engine_;
    TransportOptions options_;
    std::shared_ptr<PollState> state_;
    std::thread thread_;
    std::mutex shutdown_mutex_;
    bool shut_down_ = false;
    bool joined_ = false;
};

} // namespace headgram
