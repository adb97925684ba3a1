#include "records.hpp"

namespace headgram {

const char* to_string(SendError error) {
    switch (error) {
        case SendError::None:               return "none";
        case SendError::InvalidDestination: return "invalid_destination";
        case SendError::ResolutionTimeout:  return "resolution_timeout";
        case SendError::SendFailure:        return "send_failure";
    }
    return "send_failure";
}

std::string header_line(const FormattedMessage& msg) {
    return "[" + msg.time + "] [" + msg.sender + " | " + msg.chat + "]";
}

std::string body_line(const FormattedMessage& msg) {
    return "> " + msg.text;
}

} // namespace headgram
