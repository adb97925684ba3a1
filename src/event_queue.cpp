#include "event_queue.hpp"

namespace headgram {

EventQueue::EventQueue(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity)
{}

bool EventQueue::push(Event event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;
        if (events_.size() >= capacity_) {
            events_.pop_front();
            ++dropped_;
        }
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
    return true;
}

std::optional<Event> EventQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !events_.empty() || closed_; });
    return take_locked();
}

std::optional<Event> EventQueue::pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; })) {
        return std::nullopt;
    }
    return take_locked();
}

std::optional<Event> EventQueue::take_locked() {
    if (events_.empty()) return std::nullopt;
    Event event = std::move(events_.front());
    events_.pop_front();
    return event;
}

void EventQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

uint64_t EventQueue::dropped_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

} // namespace headgram
