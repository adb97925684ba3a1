#include "console.hpp"
#include "event_bus.hpp"
#include "message_log.hpp"
#include "session.hpp"
#include "util.hpp"
#include "wire.hpp"
#include <cerrno>
#include <ostream>
#include <stdexcept>
#include <poll.h>
#include <unistd.h>

namespace headgram {

std::optional<std::string> read_line(int fd, const std::atomic<bool>& stop) {
    std::string line;
    while (!stop.load()) {
        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int ret = ::poll(&pfd, 1, 200);
        if (ret < 0) {
            if (errno == EINTR) continue;
            return std::nullopt;
        }
        if (ret == 0) continue;

        char c;
        ssize_t n = ::read(fd, &c, 1);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return std::nullopt;
        }
        if (n == 0) {
            // EOF: hand back a trailing partial line once
            if (line.empty()) return std::nullopt;
            return line;
        }
        if (c == '\n') {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }
        line += c;
    }
    return std::nullopt;
}

// ── ConsolePrompt ───────────────────────────────────────────────

ConsolePrompt::ConsolePrompt(const std::atomic<bool>& stop, std::ostream& out, int in_fd)
    : stop_(stop), out_(out), in_fd_(in_fd)
{}

std::string ConsolePrompt::ask(const std::string& question) {
    out_ << question << std::flush;
    auto line = read_line(in_fd_, stop_);
    if (!line) throw std::runtime_error("input closed while waiting for: " + question);
    return trim(*line);
}

std::string ConsolePrompt::phone_number() {
    return ask("Enter your phone number (international format): ");
}

std::string ConsolePrompt::code() {
    return ask("Enter the authentication code you received: ");
}

std::string ConsolePrompt::password() {
    return ask("Enter your 2FA password: ");
}

CredentialPrompt::Registration ConsolePrompt::registration() {
    Registration reg;
    reg.first_name = ask("Enter your first name: ");
    reg.last_name = ask("Enter your last name: ");
    return reg;
}

// ── ConsolePrinter ──────────────────────────────────────────────

ConsolePrinter::ConsolePrinter(std::ostream& out, bool print_messages, bool json_lines)
    : out_(out), print_messages_(print_messages), json_lines_(json_lines)
{}

void ConsolePrinter::subscribe(EventBus& bus) {
    if (json_lines_) {
        subscribe_json(bus);
    } else {
        subscribe_text(bus);
    }
}

void ConsolePrinter::write_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << '\n' << std::flush;
}

void ConsolePrinter::subscribe_text(EventBus& bus) {
    if (print_messages_) {
        headgram::subscribe<MessageFormattedEvent>(bus,
            [this](const MessageFormattedEvent& ev) {
                write_line(header_line(ev.message) + '\n' + body_line(ev.message) + '\n');
            }, "console");
    }

    headgram::subscribe<AuthStateChangedEvent>(bus,
        [this](const AuthStateChangedEvent& ev) {
            if (ev.state != AuthorizationState::Ready) return;
            write_line("Authentication successful.  You are now logged in.");
        }, "console");

    headgram::subscribe<SendCompletedEvent>(bus,
        [this](const SendCompletedEvent& ev) {
            if (ev.result.success) {
                write_line("Message sent!\n");
            } else {
                write_line("Could not send to '" + ev.destination + "': " +
                           ev.result.message + '\n');
            }
        }, "console");
}

void ConsolePrinter::subscribe_json(EventBus& bus) {
    if (print_messages_) {
        headgram::subscribe<MessageFormattedEvent>(bus,
            [this](const MessageFormattedEvent& ev) {
                write_line(wire::message_envelope(ev.message).dump());
            }, "console");
    }

    headgram::subscribe<AuthStateChangedEvent>(bus,
        [this](const AuthStateChangedEvent& ev) {
            write_line(wire::auth_status_envelope(ev).dump());
        }, "console");

    headgram::subscribe<SendCompletedEvent>(bus,
        [this](const SendCompletedEvent& ev) {
            write_line(wire::send_result_envelope(ev.result).dump());
        }, "console");
}

// ── Send prompt loop ────────────────────────────────────────────

namespace {

bool is_exit_word(const std::string& input) {
    static const char* const words[] = {"exit", "quit", ":q", "q"};
    for (const char* w : words) {
        if (iequals(input, w)) return true;
    }
    return false;
}

} // anonymous namespace

void run_send_prompt(Session& session, ConsolePrinter& printer,
                     const std::atomic<bool>& stop,
                     const MessageHistory* history, int in_fd) {
    auto prompt = [&](const char* text) {
        std::lock_guard<std::mutex> lock(printer.mutex());
        printer.out() << text << std::flush;
    };

    {
        std::lock_guard<std::mutex> lock(printer.mutex());
        printer.out() << "\nYou can now send messages.  Type 'exit' to quit the send loop.\n";
    }

    while (!stop.load()) {
        prompt("Enter chat ID or @username: ");
        auto dest = read_line(in_fd, stop);
        if (!dest) break;
        std::string destination = trim(*dest);
        if (destination.empty()) continue;

        if (is_exit_word(destination)) break;

        if (iequals(destination, "/history") && history) {
            std::lock_guard<std::mutex> lock(printer.mutex());
            for (const auto& msg : history->recent(20)) {
                printer.out() << header_line(msg) << '\n' << body_line(msg) << '\n';
            }
            printer.out() << std::flush;
            continue;
        }

        prompt("Enter your message: ");
        auto text = read_line(in_fd, stop);
        if (!text) break;
        if (text->empty()) continue;

        session.post_send(destination, *text);
    }
}

void run_json_commands(Session& session, ConsolePrinter& printer,
                       const std::atomic<bool>& stop, int in_fd) {
    while (!stop.load()) {
        auto line = read_line(in_fd, stop);
        if (!line) break;
        if (trim(*line).empty()) continue;

        wire::ClientCommand cmd;
        try {
            cmd = wire::parse_client_command(*line);
        } catch (const std::invalid_argument& e) {
            printer.write_line(wire::error_envelope(e.what()).dump());
            continue;
        }

        if (cmd.kind == wire::ClientCommand::Kind::Authenticate) {
            printer.write_line(wire::error_envelope("Already authenticated").dump());
            continue;
        }
        session.post_send(cmd.destination, cmd.text);
    }
}

} // namespace headgram
