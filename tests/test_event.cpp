#include <catch2/catch_test_macros.hpp>
#include "event.hpp"

using namespace headgram;

// ── Event::parse ────────────────────────────────────────────────

TEST_CASE("Event::parse: object with @type", "[event]") {
    auto ev = Event::parse(R"({"@type":"chat","id":5,"title":"Dev"})");
    REQUIRE(ev.has_value());
    REQUIRE(ev->type() == "chat");
    REQUIRE(ev->is(event_types::Chat));
    REQUIRE(ev->payload()["title"] == "Dev");
}

TEST_CASE("Event::parse: rejects malformed text", "[event]") {
    REQUIRE_FALSE(Event::parse("not json").has_value());
    REQUIRE_FALSE(Event::parse("{\"@type\":").has_value());
    REQUIRE_FALSE(Event::parse("").has_value());
}

TEST_CASE("Event::parse: rejects payloads without a string discriminator", "[event]") {
    REQUIRE_FALSE(Event::parse("[1,2,3]").has_value());
    REQUIRE_FALSE(Event::parse(R"({"id":1})").has_value());
    REQUIRE_FALSE(Event::parse(R"({"@type":7})").has_value());
}

// ── Authorization state ─────────────────────────────────────────

TEST_CASE("parse_authorization_state: maps engine discriminators", "[event]") {
    REQUIRE(parse_authorization_state("authorizationStateWaitTdlibParameters") == AuthorizationState::WaitParameters);
    REQUIRE(parse_authorization_state("authorizationStateWaitEncryptionKey") == AuthorizationState::WaitEncryptionKey);
    REQUIRE(parse_authorization_state("authorizationStateWaitPhoneNumber") == AuthorizationState::WaitPhoneNumber);
    REQUIRE(parse_authorization_state("authorizationStateWaitCode") == AuthorizationState::WaitCode);
    REQUIRE(parse_authorization_state("authorizationStateWaitPassword") == AuthorizationState::WaitPassword);
    REQUIRE(parse_authorization_state("authorizationStateWaitRegistration") == AuthorizationState::WaitRegistration);
    REQUIRE(parse_authorization_state("authorizationStateReady") == AuthorizationState::Ready);
    REQUIRE(parse_authorization_state("authorizationStateClosed") == AuthorizationState::Closed);
    REQUIRE(parse_authorization_state("authorizationStateLoggingOut") == AuthorizationState::Other);
}

TEST_CASE("authorization_update: extracts nested state", "[event]") {
    auto ev = Event::parse(R"({"@type":"updateAuthorizationState",
                               "authorization_state":{"@type":"authorizationStateWaitCode"}})");
    REQUIRE(ev.has_value());
    auto update = authorization_update(*ev);
    REQUIRE(update.has_value());
    REQUIRE(update->state == AuthorizationState::WaitCode);
    REQUIRE(update->raw_type == "authorizationStateWaitCode");
}

TEST_CASE("authorization_update: unknown state keeps raw type", "[event]") {
    auto ev = Event::parse(R"({"@type":"updateAuthorizationState",
                               "authorization_state":{"@type":"authorizationStateClosing"}})");
    auto update = authorization_update(*ev);
    REQUIRE(update.has_value());
    REQUIRE(update->state == AuthorizationState::Other);
    REQUIRE(update->raw_type == "authorizationStateClosing");
}

TEST_CASE("authorization_update: other events yield nullopt", "[event]") {
    auto ev = Event::parse(R"({"@type":"updateNewMessage","message":{}})");
    REQUIRE_FALSE(authorization_update(*ev).has_value());
}

TEST_CASE("to_string: authorization states", "[event]") {
    REQUIRE(std::string(to_string(AuthorizationState::Ready)) == "ready");
    REQUIRE(std::string(to_string(AuthorizationState::WaitCode)) == "wait_code");
}
