#include "auth.hpp"
#include "commands.hpp"
#include "config.hpp"
#include "console.hpp"
#include "dispatcher.hpp"
#include "engines/tdjson_engine.hpp"
#include "errors.hpp"
#include "event_bus.hpp"
#include "message_log.hpp"
#include "resolver.hpp"
#include "sender.hpp"
#include "session.hpp"
#include "transport.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: headgram [options]\n"
              << "\n"
              << "Options:\n"
              << "  --api-id ID               Engine API id (from https://my.telegram.org)\n"
              << "  --api-hash HASH           Engine API hash\n"
              << "  --phone NUMBER            Phone number in international format (prompted if omitted)\n"
              << "  --database-directory DIR  Engine database directory (default: ./tdlib)\n"
              << "  --files-directory DIR     Engine files directory (default: ./tdlib)\n"
              << "  --log-file PATH           Append incoming messages here (default: messages.log)\n"
              << "  --quiet                   Do not print incoming messages to the console\n"
              << "  --listen-only             Receive only; no interactive send prompt\n"
              << "  --json                    Print messages and status as JSON lines and read\n"
              << "                            send_message commands as JSON lines from stdin\n"
              << "  -h, --help                Show this help\n"
              << "\n"
              << "Send prompt commands:\n"
              << "  /history                  Show the most recent messages\n"
              << "  exit, quit, :q, q         Leave the send loop and shut down\n"
              << "\n"
              << "Environment variables:\n"
              << "  HEADGRAM_API_ID, HEADGRAM_API_HASH, HEADGRAM_PHONE\n"
              << "  HEADGRAM_DATABASE_DIR, HEADGRAM_FILES_DIR, HEADGRAM_ENCRYPTION_KEY\n";
}

int main(int argc, char* argv[]) try {
    auto config = headgram::Config::load();
    bool listen_only = false;
    bool json_lines = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--api-id") == 0 && i + 1 < argc) {
            config.engine.api_id = std::stoll(argv[++i]);
        } else if (std::strcmp(argv[i], "--api-hash") == 0 && i + 1 < argc) {
            config.engine.api_hash = argv[++i];
        } else if (std::strcmp(argv[i], "--phone") == 0 && i + 1 < argc) {
            config.phone = argv[++i];
        } else if (std::strcmp(argv[i], "--database-directory") == 0 && i + 1 < argc) {
            config.storage.database_directory = argv[++i];
        } else if (std::strcmp(argv[i], "--files-directory") == 0 && i + 1 < argc) {
            config.storage.files_directory = argv[++i];
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            config.messages.log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--quiet") == 0) {
            config.messages.print_to_console = false;
        } else if (std::strcmp(argv[i], "--listen-only") == 0) {
            listen_only = true;
        } else if (std::strcmp(argv[i], "--json") == 0) {
            json_lines = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    if (!config.has_credentials()) {
        std::cerr << "Error: --api-id and --api-hash are required "
                  << "(or set them in " << headgram::config_path() << ").\n";
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    headgram::TdJsonEngine engine;
    headgram::Transport transport(engine, config.transport_options());
    auto shutdown_timeout = std::chrono::milliseconds(config.transport.shutdown_timeout_ms);

    if (!transport.execute_local(headgram::commands::set_log_verbosity(config.engine.log_verbosity))) {
        std::cerr << "[headgram] Engine did not accept log verbosity "
                  << config.engine.log_verbosity << "\n";
    }

    headgram::EventBus bus;
    headgram::ConsolePrinter printer(std::cout, config.messages.print_to_console, json_lines);
    printer.subscribe(bus);

    // Login phase: the authorizer is the only reader of the transport
    headgram::ConsolePrompt prompt(g_shutdown, std::cout);
    try {
        headgram::authorize(transport, config.auth_config(), prompt, &bus, &g_shutdown);
    } catch (const headgram::AuthCancelled&) {
        std::cerr << "Interrupted during login.\n";
        transport.shutdown(shutdown_timeout);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: authorization failed: " << e.what() << "\n";
        transport.shutdown(shutdown_timeout);
        return 1;
    }

    // Post-login phase: one consumer loop owns resolver, dispatcher and sender
    headgram::Resolver resolver(transport);
    headgram::Dispatcher dispatcher(resolver, bus);
    headgram::Sender sender(transport, dispatcher, &bus, config.sender_options());

    headgram::MessageLog message_log(config.messages.log_file);
    message_log.subscribe(bus);
    headgram::MessageHistory history(config.messages.history_limit);
    history.subscribe(bus);

    headgram::Session session(transport, dispatcher, sender);
    std::thread consumer([&session] {
        session.run(g_shutdown);
        g_shutdown.store(true);
    });

    if (listen_only) {
        std::cerr << "[headgram] Listening for messages. Press Ctrl+C to exit.\n";
        while (!g_shutdown.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    } else if (json_lines) {
        headgram::run_json_commands(session, printer, g_shutdown);
    } else {
        headgram::run_send_prompt(session, printer, g_shutdown, &history);
    }

    g_shutdown.store(true);
    consumer.join();

    std::cerr << "[headgram] Shutting down.\n";
    transport.shutdown(shutdown_timeout);
    if (transport.dropped_count() > 0 || transport.malformed_count() > 0) {
        std::cerr << "[headgram] Dropped " << transport.dropped_count()
                  << " events on overflow, discarded " << transport.malformed_count()
                  << " malformed payloads\n";
    }
    for (const auto& [name, failures] : bus.failing_subscribers()) {
        std::cerr << "[headgram] Output " << name << " failed " << failures << " times\n";
    }
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
