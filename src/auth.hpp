#pragma once
#include "commands.hpp"
#include "event.hpp"
#include <atomic>
#include <chrono>
#include <optional>
#include <string>

namespace headgram {

class Transport;
class EventBus;

struct AuthConfig {
    EngineParameters parameters;
    std::string encryption_key;              // empty = unencrypted database
    std::optional<std::string> phone_number; // asked for when absent
};

// Source of the secrets the user has to type in during login.
class CredentialPrompt {
public:
    struct Registration {
        std::string first_name;
        std::string last_name;
    };

    virtual ~CredentialPrompt() = default;

    virtual std::string phone_number() = 0;
    virtual std::string code() = 0;
    virtual std::string password() = 0;
    virtual Registration registration() = 0;
};

// Drive the engine's authorization state machine until Ready.
//
// Reads events from the transport, ignoring everything but authorization
// updates, and answers each state with the matching command. Returns once
// Ready is reached; throws AuthClosedError if the engine reports Closed.
// Every state seen is published as AuthStateChangedEvent when bus is set.
// When stop is set, the wait for the next event is checked against it every
// AUTH_STOP_CHECK and AuthCancelled is thrown once it becomes true.
//
// Must be the only reader of the transport while it runs.
constexpr std::chrono::milliseconds AUTH_STOP_CHECK{200};

void authorize(Transport& transport, const AuthConfig& config,
               CredentialPrompt& prompt, EventBus* bus = nullptr,
               const std::atomic<bool>* stop = nullptr);

} // namespace headgram
