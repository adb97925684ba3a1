#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

namespace headgram {

class Dispatcher;
class Sender;
class Transport;

// The post-login consumer loop. Dispatcher and Sender share one logical
// reader of the transport: send requests posted from other threads are
// parked in an inbox and executed between events, never concurrently with
// dispatching.
class Session {
public:
    static constexpr std::chrono::milliseconds DEFAULT_WAIT{200};

    Session(Transport& transport, Dispatcher& dispatcher, Sender& sender);

    // Thread-safe. The request runs on the loop's thread; its outcome is
    // published by the Sender.
    void post_send(std::string destination, std::string text);

    // Run until stop is set or the transport is shut down.
    void run(const std::atomic<bool>& stop, std::chrono::milliseconds wait = DEFAULT_WAIT);

    // One iteration: drain the inbox, then handle at most one event.
    // Returns false once the transport is closed.
    bool poll_once(std::chrono::milliseconds wait = DEFAULT_WAIT);

    size_t pending_sends() const;
    uint64_t events_handled() const { return events_handled_; }

private:
    struct SendRequest {
        std::string destination;
        std::string text;
    };

    void drain_inbox();

    Transport& transport_;
    Dispatcher& dispatcher_;
    Sender& sender_;

    mutable std::mutex inbox_mutex_;
    std::deque<SendRequest> inbox_;
    uint64_t events_handled_ = 0;
};

} // namespace headgram
