#include "wire.hpp"
#include <stdexcept>

namespace headgram::wire {

nlohmann::json to_json(const FormattedMessage& msg) {
    nlohmann::json j = {
        {"time", msg.time},
        {"sender", msg.sender},
        {"chat", msg.chat},
        {"text", msg.text},
        {"chat_id", msg.chat_id}
    };
    if (msg.message_id) j["message_id"] = *msg.message_id;
    return j;
}

nlohmann::json message_envelope(const FormattedMessage& msg) {
    return {{"type", "message"}, {"data", to_json(msg)}};
}

nlohmann::json auth_status_envelope(const std::string& status, const std::string& message) {
    return {{"type", "auth_status"}, {"data", {{"status", status}, {"message", message}}}};
}

nlohmann::json auth_status_envelope(const AuthStateChangedEvent& ev) {
    return auth_status_envelope(ev.status, ev.detail);
}

nlohmann::json send_result_envelope(const SendResult& result) {
    nlohmann::json data = {{"success", result.success}};
    if (result.success) {
        data["message"] = result.message;
        if (result.chat_id) data["chat_id"] = *result.chat_id;
    } else {
        data["error"] = result.message;
        data["error_kind"] = to_string(result.error);
    }
    return {{"type", "send_result"}, {"data", data}};
}

nlohmann::json error_envelope(const std::string& message) {
    return {{"type", "error"}, {"data", {{"message", message}}}};
}

static const nlohmann::json& require_field(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw std::invalid_argument(std::string("Missing field: ") + key);
    }
    return *it;
}

ClientCommand parse_client_command(const std::string& frame) {
    auto j = nlohmann::json::parse(frame, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        throw std::invalid_argument("Invalid JSON format");
    }

    const auto& type = require_field(j, "type");
    const auto& data = require_field(j, "data");
    if (!type.is_string() || !data.is_object()) {
        throw std::invalid_argument("Malformed command envelope");
    }

    ClientCommand cmd;
    std::string kind = type.get<std::string>();
    if (kind == "authenticate") {
        cmd.kind = ClientCommand::Kind::Authenticate;
        const auto& api_id = require_field(data, "api_id");
        if (api_id.is_number_integer()) {
            cmd.api_id = api_id.get<int64_t>();
        } else if (api_id.is_string()) {
            try {
                cmd.api_id = std::stoll(api_id.get<std::string>());
            } catch (const std::exception&) {
                throw std::invalid_argument("api_id must be an integer");
            }
        } else {
            throw std::invalid_argument("api_id must be an integer");
        }
        const auto& api_hash = require_field(data, "api_hash");
        if (!api_hash.is_string()) throw std::invalid_argument("api_hash must be a string");
        cmd.api_hash = api_hash.get<std::string>();
        auto phone = data.find("phone");
        if (phone != data.end() && phone->is_string() && !phone->get<std::string>().empty()) {
            cmd.phone = phone->get<std::string>();
        }
    } else if (kind == "send_message") {
        cmd.kind = ClientCommand::Kind::SendMessage;
        const auto& chat = require_field(data, "chat_id");
        if (chat.is_number_integer()) {
            cmd.destination = std::to_string(chat.get<int64_t>());
        } else if (chat.is_string()) {
            cmd.destination = chat.get<std::string>();
        } else {
            throw std::invalid_argument("chat_id must be an integer or @username");
        }
        const auto& text = require_field(data, "text");
        if (!text.is_string()) throw std::invalid_argument("text must be a string");
        cmd.text = text.get<std::string>();
    } else {
        throw std::invalid_argument("Unknown command type: " + kind);
    }
    return cmd;
}

} // namespace headgram::wire
