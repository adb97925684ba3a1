#include "sender.hpp"
#include "commands.hpp"
#include "dispatcher.hpp"
#include "errors.hpp"
#include "event_bus.hpp"
#include "resolver.hpp"
#include "transport.hpp"
#include "util.hpp"
#include <cerrno>
#include <cstdlib>
#include <iostream>

namespace headgram {

Sender::Sender(Transport& transport, Dispatcher& dispatcher,
               EventBus* bus, SenderOptions options)
    : transport_(transport), dispatcher_(dispatcher), bus_(bus), options_(options)
{}

std::optional<int64_t> Sender::parse_chat_id(const std::string& text) {
    std::string s = trim(text);
    if (s.empty()) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(s.c_str(), &end, 10);
    if (errno == ERANGE || end == s.c_str() || *end != '\0') return std::nullopt;
    return static_cast<int64_t>(value);
}

int64_t Sender::resolve_destination(const std::string& destination) {
    std::string dest = trim(destination);

    if (!dest.empty() && dest[0] == '@') {
        std::string username = dest.substr(1);
        if (username.empty()) throw InvalidDestination(destination);

        if (auto known = dispatcher_.resolver().chat_for_username(username)) {
            return *known;
        }
        transport_.submit(commands::search_public_chat(username));
        return wait_for_username(username);
    }

    auto chat_id = parse_chat_id(dest);
    if (!chat_id) throw InvalidDestination(destination);
    return *chat_id;
}

int64_t Sender::wait_for_username(const std::string& username) {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + options_.resolve_timeout;

    while (true) {
        auto now = clock::now();
        if (now >= deadline) break;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (remaining.count() == 0) remaining = std::chrono::milliseconds(1);

        auto event = transport_.next_event(remaining);
        if (!event) break;

        // Everything read here belongs to the normal stream as well; the
        // matching chat record also lands in the username index this way.
        dispatcher_.handle(*event);

        if (event->is(event_types::Chat) || event->is(event_types::UpdateNewChat)) {
            if (auto chat_id = dispatcher_.resolver().chat_for_username(username)) {
                return *chat_id;
            }
        }
    }
    throw ResolutionTimeout("@" + username);
}

SendResult Sender::attempt(const std::string& destination, const std::string& text) {
    try {
        int64_t chat_id = resolve_destination(destination);
        if (text.empty()) {
            return SendResult::failure(SendError::SendFailure, "Message text is empty");
        }
        transport_.submit(commands::send_text(chat_id, text));
        return SendResult::ok(chat_id);
    } catch (const InvalidDestination& e) {
        return SendResult::failure(SendError::InvalidDestination, e.what());
    } catch (const ResolutionTimeout& e) {
        return SendResult::failure(SendError::ResolutionTimeout, e.what());
    } catch (const std::exception& e) {
        return SendResult::failure(SendError::SendFailure, e.what());
    }
}

SendResult Sender::send(const std::string& destination, const std::string& text) {
    SendResult result = attempt(destination, text);
    if (!result.success) {
        std::cerr << "[sender] Send to " << destination << " failed: "
                  << result.message << "\n";
    }

    if (bus_) {
        SendCompletedEvent ev;
        ev.destination = destination;
        ev.result = result;
        bus_->publish(ev);
    }
    return result;
}

} // namespace headgram
