#pragma once
#include "notifications.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace headgram {

using NotificationHandler = std::function<void(const Notification&)>;

// Fan-out point for everything the core produces for outer consumers
// (console, log file, history, wire envelopes). Consumers register under a
// name so a misbehaving one can be identified in logs and at shutdown.
class EventBus {
public:
    // Returns a subscription id, unique for the bus's lifetime
    uint64_t subscribe(const std::string& tag, const std::string& name,
                       NotificationHandler handler);

    // Synchronous, in registration order, without the lock held, so a
    // handler may subscribe (the newcomer sees the next publish). A handler
    // that throws is logged and counted against its name; the rest still run.
    // Returns the number of handlers that completed.
    size_t publish(const Notification& notification);

    size_t subscriber_count(const std::string& tag) const;

    // Handler exceptions since construction
    uint64_t failure_count() const;

    // (name, failures) for every subscriber that has failed at least once
    std::vector<std::pair<std::string, uint64_t>> failing_subscribers() const;

private:
    struct Subscriber {
        uint64_t id;
        std::string tag;
        std::string name;
        NotificationHandler handler;
        uint64_t failures = 0;
    };

    void record_failure(Subscriber& sub);

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<Subscriber>> subscribers_;
    uint64_t next_id_ = 1;
    uint64_t failures_ = 0;
};

// Typed registration: the handler receives the concrete notification.
template<typename N>
uint64_t subscribe(EventBus& bus, std::function<void(const N&)> handler,
                   const std::string& name = "anonymous") {
    return bus.subscribe(N::TAG, name, [h = std::move(handler)](const Notification& n) {
        h(static_cast<const N&>(n));
    });
}

} // namespace headgram
