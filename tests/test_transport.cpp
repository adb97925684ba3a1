#include <catch2/catch_test_macros.hpp>
#include "transport.hpp"
#include "errors.hpp"
#include "mock_engine.hpp"

#include <atomic>
#include <thread>

using namespace headgram;

static TransportOptions fast_options() {
    TransportOptions opts;
    opts.poll_timeout_seconds = 0.02;
    return opts;
}

// ── submit / execute_local ──────────────────────────────────────

TEST_CASE("Transport: submit forwards serialized command", "[transport]") {
    MockEngine engine;
    Transport transport(engine, fast_options());

    transport.submit({{"@type", "getChat"}, {"chat_id", 7}});

    auto sent = engine.sent();
    REQUIRE(sent.size() == 1);
    REQUIRE(sent[0]["@type"] == "getChat");
    REQUIRE(sent[0]["chat_id"] == 7);
}

TEST_CASE("Transport: execute_local returns parsed answer", "[transport]") {
    MockEngine engine;
    engine.execute_response = R"({"@type":"ok"})";
    Transport transport(engine, fast_options());

    auto result = transport.execute_local({{"@type", "setLogVerbosityLevel"}, {"new_verbosity_level", 1}});
    REQUIRE(result.has_value());
    REQUIRE((*result)["@type"] == "ok");
    REQUIRE(engine.last_execute.find("setLogVerbosityLevel") != std::string::npos);
}

TEST_CASE("Transport: execute_local without answer is nullopt", "[transport]") {
    MockEngine engine;
    Transport transport(engine, fast_options());
    REQUIRE_FALSE(transport.execute_local({{"@type", "getOption"}}).has_value());
}

TEST_CASE("Transport: execute_local with unparsable answer is nullopt", "[transport]") {
    MockEngine engine;
    engine.execute_response = "garbage{";
    Transport transport(engine, fast_options());
    REQUIRE_FALSE(transport.execute_local({{"@type", "getOption"}}).has_value());
}

// ── next_event ──────────────────────────────────────────────────

TEST_CASE("Transport: events arrive in engine order", "[transport]") {
    MockEngine engine;
    Transport transport(engine, fast_options());

    for (int i = 0; i < 50; ++i) engine.push({{"@type", "updateOption"}, {"seq", i}});

    for (int i = 0; i < 50; ++i) {
        Event ev = transport.next_event();
        REQUIRE(ev.payload()["seq"] == i);
    }
}

TEST_CASE("Transport: malformed payloads are discarded and counted", "[transport]") {
    MockEngine engine;
    Transport transport(engine, fast_options());

    engine.push_raw("not json at all");
    engine.push_raw("[1,2,3]");
    engine.push_raw(R"({"no_type":true})");
    engine.push({{"@type", "chat"}, {"id", 1}});

    Event ev = transport.next_event();
    REQUIRE(ev.type() == "chat");
    REQUIRE(transport.malformed_count() == 3);
}

TEST_CASE("Transport: engine exceptions do not stop polling", "[transport]") {
    MockEngine engine;
    Transport transport(engine, fast_options());

    engine.push_failure("transient receive failure");
    engine.push({{"@type", "user"}, {"id", 9}});

    Event ev = transport.next_event();
    REQUIRE(ev.type() == "user");
    REQUIRE(transport.poll_error_count() == 1);
    REQUIRE(transport.running());
}

TEST_CASE("Transport: non-standard exceptions do not stop polling", "[transport]") {
    MockEngine engine;
    Transport transport(engine, fast_options());

    engine.push_foreign_failure();
    engine.push_failure("then a regular one");
    engine.push({{"@type", "chat"}, {"id", 3}});

    Event ev = transport.next_event();
    REQUIRE(ev.type() == "chat");
    REQUIRE(transport.poll_error_count() == 2);
}

TEST_CASE("Transport: bounded next_event times out", "[transport]") {
    MockEngine engine;
    Transport transport(engine, fast_options());
    REQUIRE_FALSE(transport.next_event(std::chrono::milliseconds(30)).has_value());
}

TEST_CASE("Transport: overflow drops oldest events", "[transport]") {
    MockEngine engine;
    TransportOptions opts = fast_options();
    opts.queue_capacity = 2;
    Transport transport(engine, opts);

    engine.push({{"@type", "a"}});
    engine.push({{"@type", "b"}});
    engine.push({{"@type", "c"}});

    // Wait for the poll thread to move all three into the queue
    for (int i = 0; i < 100 && transport.dropped_count() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(transport.dropped_count() == 1);
    REQUIRE(transport.next_event().type() == "b");
    REQUIRE(transport.next_event().type() == "c");
}

// ── shutdown ────────────────────────────────────────────────────

TEST_CASE("Transport: shutdown sends close and joins", "[transport]") {
    MockEngine engine;
    Transport transport(engine, fast_options());

    REQUIRE(transport.shutdown());
    REQUIRE_FALSE(transport.running());
    REQUIRE(engine.sent_of_type("close").size() == 1);

    // Idempotent
    REQUIRE(transport.shutdown());
    REQUIRE(engine.sent_of_type("close").size() == 1);
}

TEST_CASE("Transport: next_event after shutdown throws once drained", "[transport]") {
    MockEngine engine;
    Transport transport(engine, fast_options());
    transport.shutdown();

    REQUIRE_THROWS_AS(transport.next_event(), TransportClosed);
    REQUIRE_THROWS_AS(transport.next_event(std::chrono::milliseconds(10)), TransportClosed);
}

TEST_CASE("Transport: close failure during shutdown is tolerated", "[transport]") {
    MockEngine engine;
    Transport transport(engine, fast_options());
    engine.fail_sends = true;
    REQUIRE(transport.shutdown());
}

namespace {

// receive() ignores its timeout until released
class StuckEngine : public Engine {
public:
    std::atomic<bool> released{false};

    void send(const std::string&) override {}
    std::optional<std::string> receive(double) override {
        while (!released.load()) std::this_thread::sleep_for(std::chrono::milliseconds(5));
        return std::nullopt;
    }
    std::optional<std::string> execute(const std::string&) override { return std::nullopt; }
};

} // anonymous namespace

TEST_CASE("Transport: shutdown abandons a stuck poll thread", "[transport]") {
    // Outlives the detached poll thread
    static StuckEngine engine;
    {
        Transport transport(engine, fast_options());
        auto start = std::chrono::steady_clock::now();
        REQUIRE_FALSE(transport.shutdown(std::chrono::milliseconds(50)));
        REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(2));

        // A repeated call reports the same outcome
        REQUIRE_FALSE(transport.shutdown());
        REQUIRE_THROWS_AS(transport.next_event(), TransportClosed);
    }
    engine.released.store(true);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
}
