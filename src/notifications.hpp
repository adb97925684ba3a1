#pragma once
#include "event.hpp"
#include "records.hpp"
#include <string>

namespace headgram {

// Tag-based notification dispatch; no RTTI, no dynamic_cast.
// Notifications are stack-allocated structs; never deleted through base pointer.

struct Notification {
    const char* type_tag;
};

// ── Notification tags ───────────────────────────────────────────

namespace notification_tags {
    constexpr const char* MessageFormatted = "MessageFormatted";
    constexpr const char* AuthStateChanged = "AuthStateChanged";
    constexpr const char* SendCompleted    = "SendCompleted";
} // namespace notification_tags

// ── Notification structs ────────────────────────────────────────

struct MessageFormattedEvent : Notification {
    static constexpr const char* TAG = notification_tags::MessageFormatted;
    FormattedMessage message;

    MessageFormattedEvent() { type_tag = TAG; }
};

struct AuthStateChangedEvent : Notification {
    static constexpr const char* TAG = notification_tags::AuthStateChanged;
    AuthorizationState state = AuthorizationState::Other;
    std::string raw_type;
    std::string status;  // "authenticating" | "authenticated" | "error"
    std::string detail;

    AuthStateChangedEvent() { type_tag = TAG; }
};

struct SendCompletedEvent : Notification {
    static constexpr const char* TAG = notification_tags::SendCompleted;
    std::string destination;
    SendResult result;

    SendCompletedEvent() { type_tag = TAG; }
};

} // namespace headgram
