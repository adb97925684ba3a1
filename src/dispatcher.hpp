#pragma once
#include "event.hpp"
#include "records.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace headgram {

class EventBus;
class Resolver;

// Turns the post-login event stream into FormattedMessage notifications and
// feeds user/chat records back into the resolver.
class Dispatcher {
public:
    Dispatcher(Resolver& resolver, EventBus& bus);

    // Process one engine event. Unknown kinds are ignored.
    void handle(const Event& event);

    // Build the display record for a message object (resolving names,
    // possibly issuing lookups). Does not publish.
    FormattedMessage format_message(const nlohmann::json& message);

    // Literal text for messageText, placeholder naming the kind otherwise
    static std::string message_text(const nlohmann::json& content);

    // Local "HH:MM", or "--:--" without a timestamp
    static std::string message_time(std::optional<int64_t> epoch_seconds);

    Resolver& resolver() { return resolver_; }
    uint64_t formatted_count() const { return formatted_; }

private:
    void on_new_message(const nlohmann::json& payload);

    Resolver& resolver_;
    EventBus& bus_;
    uint64_t formatted_ = 0;
};

} // namespace headgram
