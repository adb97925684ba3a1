#include "event.hpp"

namespace headgram {

std::optional<Event> Event::parse(const std::string& raw) {
    auto j = nlohmann::json::parse(raw, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) return std::nullopt;
    return from_json(std::move(j));
}

std::optional<Event> Event::from_json(nlohmann::json payload) {
    if (!payload.is_object()) return std::nullopt;
    auto it = payload.find("@type");
    if (it == payload.end() || !it->is_string()) return std::nullopt;
    std::string type = it->get<std::string>();
    return Event(std::move(type), std::move(payload));
}

AuthorizationState parse_authorization_state(const std::string& type) {
    if (type == "authorizationStateWaitTdlibParameters") return AuthorizationState::WaitParameters;
    if (type == "authorizationStateWaitEncryptionKey")   return AuthorizationState::WaitEncryptionKey;
    if (type == "authorizationStateWaitPhoneNumber")     return AuthorizationState::WaitPhoneNumber;
    if (type == "authorizationStateWaitCode")            return AuthorizationState::WaitCode;
    if (type == "authorizationStateWaitPassword")        return AuthorizationState::WaitPassword;
    if (type == "authorizationStateWaitRegistration")    return AuthorizationState::WaitRegistration;
    if (type == "authorizationStateReady")               return AuthorizationState::Ready;
    if (type == "authorizationStateClosed")              return AuthorizationState::Closed;
    return AuthorizationState::Other;
}

const char* to_string(AuthorizationState state) {
    switch (state) {
        case AuthorizationState::WaitParameters:    return "wait_parameters";
        case AuthorizationState::WaitEncryptionKey: return "wait_encryption_key";
        case AuthorizationState::WaitPhoneNumber:   return "wait_phone_number";
        case AuthorizationState::WaitCode:          return "wait_code";
        case AuthorizationState::WaitPassword:      return "wait_password";
        case AuthorizationState::WaitRegistration:  return "wait_registration";
        case AuthorizationState::Ready:             return "ready";
        case AuthorizationState::Closed:            return "closed";
        case AuthorizationState::Other:             return "other";
    }
    return "other";
}

std::optional<AuthorizationUpdate> authorization_update(const Event& event) {
    if (!event.is(event_types::UpdateAuthorizationState)) return std::nullopt;

    AuthorizationUpdate update;
    const auto& p = event.payload();
    auto it = p.find("authorization_state");
    if (it != p.end() && it->is_object()) {
        auto t = it->find("@type");
        if (t != it->end() && t->is_string()) update.raw_type = t->get<std::string>();
    }
    update.state = parse_authorization_state(update.raw_type);
    return update;
}

} // namespace headgram
