#pragma once
#include "records.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace headgram {

class Dispatcher;
class EventBus;
class Transport;

struct SenderOptions {
    std::chrono::milliseconds resolve_timeout{10000};
};

// Resolves a destination ("12345" or "@username") and submits a plain-text
// sendMessage. Runs in the same consumer context as the Dispatcher: events
// read while waiting for a username are handed to it, so none are lost.
class Sender {
public:
    Sender(Transport& transport, Dispatcher& dispatcher,
           EventBus* bus = nullptr, SenderOptions options = {});

    // Throws InvalidDestination (no engine traffic) or ResolutionTimeout.
    int64_t resolve_destination(const std::string& destination);

    // Never throws; every failure comes back as a SendResult and is
    // published as SendCompletedEvent when a bus is set.
    SendResult send(const std::string& destination, const std::string& text);

    // Strict integer parse of the whole (trimmed) string
    static std::optional<int64_t> parse_chat_id(const std::string& text);

private:
    int64_t wait_for_username(const std::string& username);
    SendResult attempt(const std::string& destination, const std::string& text);

    Transport& transport_;
    Dispatcher& dispatcher_;
    EventBus* bus_;
    SenderOptions options_;
};

} // namespace headgram
