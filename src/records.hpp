#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace headgram {

// Display-ready view of one incoming message.
struct FormattedMessage {
    std::string time;   // local "HH:MM", or "--:--" when the engine sent no date
    std::string sender;
    std::string chat;
    std::string text;
    int64_t chat_id = 0;
    std::optional<int64_t> message_id;
};

enum class SendError {
    None,
    InvalidDestination,
    ResolutionTimeout,
    SendFailure,
};

const char* to_string(SendError error);

struct SendResult {
    bool success = false;
    SendError error = SendError::None;
    std::optional<int64_t> chat_id;
    std::string message; // human-readable outcome

    static SendResult ok(int64_t chat_id) {
        return {true, SendError::None, chat_id, "Message sent"};
    }
    static SendResult failure(SendError error, std::string message) {
        return {false, error, std::nullopt, std::move(message)};
    }
};

// "[HH:MM] [sender | chat]"
std::string header_line(const FormattedMessage& msg);

// "> text"
std::string body_line(const FormattedMessage& msg);

} // namespace headgram
