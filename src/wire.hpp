#pragma once
#include "notifications.hpp"
#include "records.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace headgram {

// JSON envelopes exchanged with browser clients over the WebSocket gateway:
//   server -> client  {"type": "auth_status"|"message"|"send_result"|"error", "data": {...}}
//   client -> server  {"type": "authenticate"|"send_message", "data": {...}}
// The same frames are spoken one per line on stdin/stdout in --json mode.
namespace wire {

nlohmann::json to_json(const FormattedMessage& msg);

nlohmann::json message_envelope(const FormattedMessage& msg);
nlohmann::json auth_status_envelope(const std::string& status, const std::string& message);
nlohmann::json auth_status_envelope(const AuthStateChangedEvent& ev);
nlohmann::json send_result_envelope(const SendResult& result);
nlohmann::json error_envelope(const std::string& message);

struct ClientCommand {
    enum class Kind { Authenticate, SendMessage };

    Kind kind = Kind::SendMessage;

    // authenticate
    int64_t api_id = 0;
    std::string api_hash;
    std::optional<std::string> phone;

    // send_message; chat_id may be numeric or "@username"
    std::string destination;
    std::string text;
};

// Parse one inbound frame. Throws std::invalid_argument with a message
// suitable for an error envelope.
ClientCommand parse_client_command(const std::string& frame);

} // namespace wire
} // namespace headgram
