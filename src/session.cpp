#include "session.hpp"
#include "dispatcher.hpp"
#include "errors.hpp"
#include "sender.hpp"
#include "transport.hpp"
#include <iostream>

namespace headgram {

Session::Session(Transport& transport, Dispatcher& dispatcher, Sender& sender)
    : transport_(transport), dispatcher_(dispatcher), sender_(sender)
{}

void Session::post_send(std::string destination, std::string text) {
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    inbox_.push_back(SendRequest{std::move(destination), std::move(text)});
}

size_t Session::pending_sends() const {
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    return inbox_.size();
}

void Session::drain_inbox() {
    std::deque<SendRequest> requests;
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        requests.swap(inbox_);
    }
    for (const auto& req : requests) {
        sender_.send(req.destination, req.text);
    }
}

bool Session::poll_once(std::chrono::milliseconds wait) {
    drain_inbox();

    std::optional<Event> event;
    try {
        event = transport_.next_event(wait);
    } catch (const TransportClosed&) {
        return false;
    }
    if (!event) return true;

    try {
        dispatcher_.handle(*event);
    } catch (const std::exception& e) {
        std::cerr << "[session] Failed to handle " << event->type() << ": "
                  << e.what() << "\n";
    }
    ++events_handled_;
    return true;
}

void Session::run(const std::atomic<bool>& stop, std::chrono::milliseconds wait) {
    while (!stop.load()) {
        if (!poll_once(wait)) {
            std::cerr << "[session] Transport closed, leaving consumer loop\n";
            return;
        }
    }
}

} // namespace headgram
