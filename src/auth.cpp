#include "auth.hpp"
#include "errors.hpp"
#include "event_bus.hpp"
#include "transport.hpp"
#include <iostream>

namespace headgram {

namespace {

const char* describe(AuthorizationState state) {
    switch (state) {
        case AuthorizationState::WaitParameters:    return "Sending engine parameters";
        case AuthorizationState::WaitEncryptionKey: return "Checking database encryption key";
        case AuthorizationState::WaitPhoneNumber:   return "Waiting for phone number";
        case AuthorizationState::WaitCode:          return "Waiting for authentication code";
        case AuthorizationState::WaitPassword:      return "Waiting for 2FA password";
        case AuthorizationState::WaitRegistration:  return "Waiting for registration details";
        case AuthorizationState::Ready:             return "Successfully authenticated";
        case AuthorizationState::Closed:            return "Authentication failed: engine closed the session";
        case AuthorizationState::Other:             return "Authenticating";
    }
    return "Authenticating";
}

void publish_state(EventBus* bus, const AuthorizationUpdate& update) {
    if (!bus) return;
    AuthStateChangedEvent ev;
    ev.state = update.state;
    ev.raw_type = update.raw_type;
    if (update.state == AuthorizationState::Ready) {
        ev.status = "authenticated";
    } else if (update.state == AuthorizationState::Closed) {
        ev.status = "error";
    } else {
        ev.status = "authenticating";
    }
    ev.detail = describe(update.state);
    bus->publish(ev);
}

} // anonymous namespace

void authorize(Transport& transport, const AuthConfig& config,
               CredentialPrompt& prompt, EventBus* bus,
               const std::atomic<bool>* stop) {
    bool phone_offered = false;

    while (true) {
        if (stop && stop->load()) {
            std::cerr << "[auth] Authorization interrupted\n";
            throw AuthCancelled();
        }
        auto next = transport.next_event(AUTH_STOP_CHECK);
        if (!next) continue;

        Event event = std::move(*next);
        auto update = authorization_update(event);
        if (!update) continue;

        publish_state(bus, *update);

        switch (update->state) {
            case AuthorizationState::WaitParameters:
                transport.submit(commands::set_tdlib_parameters(config.parameters));
                break;

            case AuthorizationState::WaitEncryptionKey:
                transport.submit(commands::check_encryption_key(config.encryption_key));
                break;

            case AuthorizationState::WaitPhoneNumber: {
                // The configured number is offered once; if the engine asks
                // again it was rejected, so ask the user instead.
                std::string phone;
                if (config.phone_number && !config.phone_number->empty() && !phone_offered) {
                    phone = *config.phone_number;
                } else {
                    phone = prompt.phone_number();
                }
                phone_offered = true;
                transport.submit(commands::set_phone_number(phone));
                break;
            }

            case AuthorizationState::WaitCode:
                transport.submit(commands::check_code(prompt.code()));
                break;

            case AuthorizationState::WaitPassword:
                transport.submit(commands::check_password(prompt.password()));
                break;

            case AuthorizationState::WaitRegistration: {
                auto reg = prompt.registration();
                transport.submit(commands::register_user(reg.first_name, reg.last_name));
                break;
            }

            case AuthorizationState::Ready:
                std::cerr << "[auth] Authorization complete\n";
                return;

            case AuthorizationState::Closed:
                throw AuthClosedError();

            case AuthorizationState::Other:
                break;
        }
    }
}

} // namespace headgram
