#include "transport.hpp"
#include "commands.hpp"
#include "errors.hpp"
#include <iostream>

namespace headgram {

Transport::Transport(Engine& engine, TransportOptions options)
    : engine_(engine),
      options_(options),
      state_(std::make_shared<PollState>(options.queue_capacity))
{
    thread_ = std::thread(&Transport::poll_loop, std::ref(engine_), state_,
                          options_.poll_timeout_seconds);
}

Transport::~Transport() {
    shutdown();
}

void Transport::poll_loop(Engine& engine, std::shared_ptr<PollState> state,
                          double poll_timeout_seconds) {
    while (state->running.load()) {
        std::optional<std::string> raw;
        try {
            raw = engine.receive(poll_timeout_seconds);
        } catch (const std::exception& e) {
            state->poll_errors.fetch_add(1);
            std::cerr << "[transport] Receive failed, retrying: " << e.what() << "\n";
            continue;
        } catch (...) {
            state->poll_errors.fetch_add(1);
            std::cerr << "[transport] Receive failed with unknown error, retrying\n";
            continue;
        }
        if (!raw || raw->empty()) continue;

        auto event = Event::parse(*raw);
        if (!event) {
            state->malformed.fetch_add(1);
            std::cerr << "[transport] Discarding malformed payload: "
                      << raw->substr(0, 120) << "\n";
            continue;
        }

        if (!state->queue.push(std::move(*event))) {
            std::cerr << "[transport] Event queue closed, poll thread exiting\n";
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(state->done_mutex);
        state->done = true;
    }
    state->done_cv.notify_all();
}

void Transport::submit(const nlohmann::json& command) {
    engine_.send(command.dump());
}

std::optional<nlohmann::json> Transport::execute_local(const nlohmann::json& query) {
    auto raw = engine_.execute(query.dump());
    if (!raw || raw->empty()) return std::nullopt;
    auto j = nlohmann::json::parse(*raw, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) return std::nullopt;
    return j;
}

Event Transport::next_event() {
    auto event = state_->queue.pop();
    if (!event) throw TransportClosed();
    return std::move(*event);
}

std::optional<Event> Transport::next_event(std::chrono::milliseconds timeout) {
    auto event = state_->queue.pop_for(timeout);
    if (!event && state_->queue.closed() && state_->queue.size() == 0) {
        throw TransportClosed();
    }
    return event;
}

bool Transport::shutdown(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> guard(shutdown_mutex_);
    if (shut_down_) return joined_;
    shut_down_ = true;

    state_->running.store(false);
    try {
        submit(commands::close());
    } catch (const std::exception& e) {
        std::cerr << "[transport] Failed to send close: " << e.what() << "\n";
    }

    bool finished;
    {
        std::unique_lock<std::mutex> lock(state_->done_mutex);
        finished = state_->done_cv.wait_for(lock, timeout,
                                            [this] { return state_->done; });
    }

    if (finished) {
        if (thread_.joinable()) thread_.join();
    } else {
        std::cerr << "[transport] Poll thread did not stop within "
                  << timeout.count() << "ms, abandoning it\n";
        if (thread_.joinable()) thread_.detach();
    }

    state_->queue.close();
    joined_ = finished;
    return finished;
}

bool Transport::running() const {
    return state_->running.load();
}

uint64_t Transport::dropped_count() const {
    return state_->queue.dropped_count();
}

uint64_t Transport::malformed_count() const {
    return state_->malformed.load();
}

uint64_t Transport::poll_error_count() const {
    return state_->poll_errors.load();
}

} // namespace headgram
