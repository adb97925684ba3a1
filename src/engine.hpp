#pragma once
#include <optional>
#include <string>

namespace headgram {

// Raw JSON interface of the wrapped messaging engine (injectable for testing).
// send() and receive() may be called from different threads; receive() is
// only ever called from the transport's poll thread.
class Engine {
public:
    virtual ~Engine() = default;

    // Queue a request for asynchronous processing. Fire-and-forget.
    virtual void send(const std::string& request) = 0;

    // Block up to timeout_seconds for the next update or response.
    // nullopt on timeout.
    virtual std::optional<std::string> receive(double timeout_seconds) = 0;

    // Synchronously answer a request that needs no network round-trip.
    // nullopt if the engine cannot answer it synchronously.
    virtual std::optional<std::string> execute(const std::string& request) = 0;
};

} // namespace headgram
