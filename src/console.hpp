#pragma once
#include "auth.hpp"
#include <atomic>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>

namespace headgram {

class EventBus;
class MessageHistory;
class Session;

// Read one line from fd without blocking past `stop` (~200ms granularity).
// Returns nullopt on EOF, read error, or when stop is set.
std::optional<std::string> read_line(int fd, const std::atomic<bool>& stop);

// Credential prompts on a terminal (stdin/stdout by default).
class ConsolePrompt : public CredentialPrompt {
public:
    ConsolePrompt(const std::atomic<bool>& stop, std::ostream& out, int in_fd = 0);

    std::string phone_number() override;
    std::string code() override;
    std::string password() override;
    Registration registration() override;

private:
    // Throws std::runtime_error when input ends or is interrupted
    std::string ask(const std::string& question);

    const std::atomic<bool>& stop_;
    std::ostream& out_;
    int in_fd_;
};

// Prints formatted messages, auth progress and send outcomes, either as
// human-readable text or as one wire envelope per line.
class ConsolePrinter {
public:
    ConsolePrinter(std::ostream& out, bool print_messages, bool json_lines = false);

    void subscribe(EventBus& bus);

    // Serializes writes with the prompt loop
    std::mutex& mutex() { return mutex_; }
    std::ostream& out() { return out_; }

    // Whole line under the lock, flushed
    void write_line(const std::string& line);

private:
    void subscribe_text(EventBus& bus);
    void subscribe_json(EventBus& bus);

    std::ostream& out_;
    bool print_messages_;
    bool json_lines_;
    std::mutex mutex_;
};

// Interactive "destination, then text" loop feeding the session inbox.
// "/history" replays recent messages when history is set.
// Returns on EOF, an exit word (exit, quit, :q, q), or when stop is set.
void run_send_prompt(Session& session, ConsolePrinter& printer,
                     const std::atomic<bool>& stop,
                     const MessageHistory* history = nullptr, int in_fd = 0);

// Non-interactive counterpart of run_send_prompt for --json mode: one wire
// command per input line. send_message is posted to the session; anything
// unparsable, and authenticate (login already happened), is answered with an
// error envelope. Returns on EOF or when stop is set.
void run_json_commands(Session& session, ConsolePrinter& printer,
                       const std::atomic<bool>& stop, int in_fd = 0);

} // namespace headgram
