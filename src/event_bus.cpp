#include "event_bus.hpp"
#include <exception>
#include <iostream>

namespace headgram {

uint64_t EventBus::subscribe(const std::string& tag, const std::string& name,
                             NotificationHandler handler) {
    auto sub = std::make_shared<Subscriber>();
    sub->tag = tag;
    sub->name = name;
    sub->handler = std::move(handler);

    std::lock_guard<std::mutex> lock(mutex_);
    sub->id = next_id_++;
    subscribers_.push_back(std::move(sub));
    return subscribers_.back()->id;
}

size_t EventBus::publish(const Notification& notification) {
    std::vector<std::shared_ptr<Subscriber>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& sub : subscribers_) {
            if (sub->tag == notification.type_tag) targets.push_back(sub);
        }
    }

    size_t delivered = 0;
    for (const auto& sub : targets) {
        try {
            sub->handler(notification);
            delivered++;
        } catch (const std::exception& e) {
            std::cerr << "[bus] " << sub->name << " failed on "
                      << notification.type_tag << ": " << e.what() << "\n";
            record_failure(*sub);
        }
    }
    return delivered;
}

void EventBus::record_failure(Subscriber& sub) {
    std::lock_guard<std::mutex> lock(mutex_);
    sub.failures++;
    failures_++;
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& sub : subscribers_) {
        if (sub->tag == tag) n++;
    }
    return n;
}

uint64_t EventBus::failure_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

std::vector<std::pair<std::string, uint64_t>> EventBus::failing_subscribers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<std::string, uint64_t>> out;
    for (const auto& sub : subscribers_) {
        if (sub->failures > 0) out.emplace_back(sub->name, sub->failures);
    }
    return out;
}

} // namespace headgram
