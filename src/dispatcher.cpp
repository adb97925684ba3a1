#include "dispatcher.hpp"
#include "event_bus.hpp"
#include "resolver.hpp"
#include "util.hpp"
#include <iostream>

namespace headgram {

namespace {

std::optional<int64_t> int_field(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return std::nullopt;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number_integer()) return std::nullopt;
    return it->get<int64_t>();
}

std::string string_field(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return {};
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

const nlohmann::json& object_field(const nlohmann::json& obj, const char* key) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (!obj.is_object()) return empty;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_object()) return empty;
    return *it;
}

} // anonymous namespace

Dispatcher::Dispatcher(Resolver& resolver, EventBus& bus)
    : resolver_(resolver), bus_(bus)
{}

void Dispatcher::handle(const Event& event) {
    const auto& p = event.payload();

    if (event.is(event_types::UpdateNewMessage)) {
        on_new_message(p);
    } else if (event.is(event_types::User)) {
        resolver_.on_user_record(p);
    } else if (event.is(event_types::Chat)) {
        resolver_.on_chat_record(p);
    } else if (event.is(event_types::UpdateUser)) {
        resolver_.on_user_record(object_field(p, "user"));
    } else if (event.is(event_types::UpdateNewChat)) {
        resolver_.on_chat_record(object_field(p, "chat"));
    } else if (event.is(event_types::UpdateChatTitle)) {
        auto chat_id = int_field(p, "chat_id");
        auto title = p.find("title");
        if (chat_id && title != p.end() && title->is_string()) {
            resolver_.on_chat_title(*chat_id, title->get<std::string>());
        }
    } else if (event.is(event_types::Error)) {
        std::cerr << "[dispatcher] Engine error " << int_field(p, "code").value_or(0)
                  << ": " << string_field(p, "message") << "\n";
    }
}

void Dispatcher::on_new_message(const nlohmann::json& payload) {
    MessageFormattedEvent ev;
    ev.message = format_message(object_field(payload, "message"));
    ++formatted_;
    bus_.publish(ev);
}

FormattedMessage Dispatcher::format_message(const nlohmann::json& message) {
    FormattedMessage out;

    const auto& sender = object_field(message, "sender_id");
    std::string sender_type = string_field(sender, "@type");
    if (sender_type == "messageSenderUser") {
        if (auto user_id = int_field(sender, "user_id"))
            out.sender = resolver_.user_name(*user_id);
    } else if (sender_type == "messageSenderChat") {
        if (auto sender_chat = int_field(sender, "chat_id"))
            out.sender = resolver_.chat_name(*sender_chat);
    }

    if (auto chat_id = int_field(message, "chat_id")) {
        out.chat_id = *chat_id;
        out.chat = resolver_.chat_name(*chat_id);
    }

    out.message_id = int_field(message, "id");
    out.text = message_text(object_field(message, "content"));
    out.time = message_time(int_field(message, "date"));
    return out;
}

std::string Dispatcher::message_text(const nlohmann::json& content) {
    std::string kind = string_field(content, "@type");
    if (kind == "messageText") {
        return string_field(object_field(content, "text"), "text");
    }
    return "<Unsupported message type " + kind + ">";
}

std::string Dispatcher::message_time(std::optional<int64_t> epoch_seconds) {
    if (!epoch_seconds) return "--:--";
    return format_local_time(*epoch_seconds);
}

} // namespace headgram
