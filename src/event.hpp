#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace headgram {

// ── Engine discriminators ───────────────────────────────────────

namespace event_types {
    constexpr const char* UpdateAuthorizationState = "updateAuthorizationState";
    constexpr const char* UpdateNewMessage         = "updateNewMessage";
    constexpr const char* UpdateUser               = "updateUser";
    constexpr const char* UpdateNewChat            = "updateNewChat";
    constexpr const char* UpdateChatTitle          = "updateChatTitle";
    constexpr const char* User                     = "user";
    constexpr const char* Chat                     = "chat";
    constexpr const char* Error                    = "error";
} // namespace event_types

// One unit of the inbound stream. Immutable once built.
class Event {
public:
    Event(std::string type, nlohmann::json payload)
        : type_(std::move(type)), payload_(std::move(payload)) {}

    // Parse raw engine output. Returns nullopt unless the text is a JSON
    // object carrying a string "@type".
    static std::optional<Event> parse(const std::string& raw);

    // Wrap an already-parsed object (same discriminator rules as parse)
    static std::optional<Event> from_json(nlohmann::json payload);

    const std::string& type() const { return type_; }
    const nlohmann::json& payload() const { return payload_; }

    bool is(const char* type) const { return type_ == type; }

private:
    std::string type_;
    nlohmann::json payload_;
};

// ── Authorization state ─────────────────────────────────────────

enum class AuthorizationState {
    WaitParameters,
    WaitEncryptionKey,
    WaitPhoneNumber,
    WaitCode,
    WaitPassword,
    WaitRegistration,
    Ready,
    Closed,
    Other,
};

struct AuthorizationUpdate {
    AuthorizationState state = AuthorizationState::Other;
    std::string raw_type; // engine discriminator, kept for Other
};

AuthorizationState parse_authorization_state(const std::string& type);

const char* to_string(AuthorizationState state);

// Extract the carried state from an updateAuthorizationState event.
// Returns nullopt for every other event kind.
std::optional<AuthorizationUpdate> authorization_update(const Event& event);

} // namespace headgram
