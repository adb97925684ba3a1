#pragma once
#include <stdexcept>
#include <string>

namespace headgram {

// The engine closed the session before authorization reached Ready.
class AuthClosedError : public std::runtime_error {
public:
    AuthClosedError()
        : std::runtime_error("engine closed the authorization process") {}
};

// Login was interrupted by the caller's stop flag.
class AuthCancelled : public std::runtime_error {
public:
    AuthCancelled() : std::runtime_error("authorization cancelled") {}
};

// A destination could not be resolved within the configured bound.
class ResolutionTimeout : public std::runtime_error {
public:
    explicit ResolutionTimeout(const std::string& destination)
        : std::runtime_error("could not resolve '" + destination + "' in time"),
          destination_(destination) {}

    const std::string& destination() const { return destination_; }

private:
    std::string destination_;
};

// Destination text is neither an integer chat id nor an @username.
class InvalidDestination : public std::invalid_argument {
public:
    explicit InvalidDestination(const std::string& destination)
        : std::invalid_argument("invalid chat identifier '" + destination +
                                "': provide an integer id or a public @username"),
          destination_(destination) {}

    const std::string& destination() const { return destination_; }

private:
    std::string destination_;
};

// next_event() called after shutdown with nothing left to deliver.
class TransportClosed : public std::runtime_error {
public:
    TransportClosed() : std::runtime_error("transport is shut down") {}
};

} // namespace headgram
