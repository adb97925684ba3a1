#include <catch2/catch_test_macros.hpp>
#include "session.hpp"
#include "dispatcher.hpp"
#include "event_bus.hpp"
#include "resolver.hpp"
#include "sender.hpp"
#include "transport.hpp"
#include "mock_engine.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>

using namespace headgram;

namespace {

TransportOptions fast_options() {
    TransportOptions opts;
    opts.poll_timeout_seconds = 0.02;
    return opts;
}

struct Fixture {
    MockEngine engine;
    Transport transport{engine, fast_options()};
    Resolver resolver{transport};
    EventBus bus;
    Dispatcher dispatcher{resolver, bus};
    Sender sender{transport, dispatcher, &bus};
    Session session{transport, dispatcher, sender};
};

constexpr std::chrono::milliseconds SHORT_WAIT{50};

} // anonymous namespace

TEST_CASE("Session: posted send runs on next poll", "[session]") {
    Fixture f;
    f.session.post_send("12345", "queued");
    REQUIRE(f.session.pending_sends() == 1);
    REQUIRE(f.engine.sent().empty());

    REQUIRE(f.session.poll_once(SHORT_WAIT));

    REQUIRE(f.session.pending_sends() == 0);
    auto sends = f.engine.sent_of_type("sendMessage");
    REQUIRE(sends.size() == 1);
    REQUIRE(sends[0]["input_message_content"]["text"]["text"] == "queued");
}

TEST_CASE("Session: sends run in posting order", "[session]") {
    Fixture f;
    f.session.post_send("1", "first");
    f.session.post_send("2", "second");
    f.session.poll_once(SHORT_WAIT);

    auto sends = f.engine.sent_of_type("sendMessage");
    REQUIRE(sends.size() == 2);
    REQUIRE(sends[0]["chat_id"] == 1);
    REQUIRE(sends[1]["chat_id"] == 2);
}

TEST_CASE("Session: events reach the dispatcher", "[session]") {
    Fixture f;
    int messages = 0;
    subscribe<MessageFormattedEvent>(f.bus, [&](const MessageFormattedEvent&) { messages++; });

    f.engine.push(new_message_from_user(1, 2, text_content("a")));
    f.engine.push(new_message_from_user(1, 2, text_content("b")));

    for (int i = 0; i < 20 && messages < 2; ++i) f.session.poll_once(SHORT_WAIT);

    REQUIRE(messages == 2);
    REQUIRE(f.session.events_handled() == 2);
}

TEST_CASE("Session: idle poll returns true", "[session]") {
    Fixture f;
    REQUIRE(f.session.poll_once(std::chrono::milliseconds(10)));
    REQUIRE(f.session.events_handled() == 0);
}

TEST_CASE("Session: handler exception does not stop the loop", "[session]") {
    Fixture f;
    subscribe<MessageFormattedEvent>(f.bus, [](const MessageFormattedEvent&) {
        throw std::runtime_error("boom");
    });

    f.engine.push(new_message_from_user(1, 2, text_content("a")));
    for (int i = 0; i < 20 && f.session.events_handled() == 0; ++i) {
        REQUIRE(f.session.poll_once(SHORT_WAIT));
    }
    REQUIRE(f.session.events_handled() == 1);
}

TEST_CASE("Session: poll_once returns false after shutdown", "[session]") {
    Fixture f;
    f.transport.shutdown();
    REQUIRE_FALSE(f.session.poll_once(SHORT_WAIT));
}

TEST_CASE("Session: run exits when stop is set", "[session]") {
    Fixture f;
    std::atomic<bool> stop{false};
    std::thread loop([&] { f.session.run(stop, std::chrono::milliseconds(20)); });

    f.session.post_send("42", "from another thread");
    for (int i = 0; i < 100 && f.engine.sent_of_type("sendMessage").empty(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    stop = true;
    loop.join();

    REQUIRE(f.engine.sent_of_type("sendMessage").size() == 1);
}

TEST_CASE("Session: run exits when transport closes", "[session]") {
    Fixture f;
    std::atomic<bool> stop{false};
    std::thread loop([&] { f.session.run(stop, std::chrono::milliseconds(20)); });

    f.transport.shutdown();
    loop.join();
    SUCCEED();
}
