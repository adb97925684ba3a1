#pragma once
#include "auth.hpp"
#include "sender.hpp"
#include "transport.hpp"
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace headgram {

struct EngineConfig {
    int64_t api_id = 0;
    std::string api_hash;
    std::string device_model = "headless";
    std::string system_version;          // empty = host OS name
    std::string application_version = "headless-client";
    std::string system_language_code = "en";
    bool use_test_dc = false;
    int log_verbosity = 1;               // engine-internal log level
};

struct StorageConfig {
    std::string database_directory = "tdlib";
    std::string files_directory = "tdlib";
    std::string encryption_key;          // empty = unencrypted
};

struct MessagesConfig {
    std::string log_file = "messages.log";
    bool print_to_console = true;
    uint32_t history_limit = 100;
};

struct TransportConfig {
    uint32_t queue_capacity = 10000;
    double poll_timeout = 1.0;           // seconds per receive call
    uint32_t shutdown_timeout_ms = 2000;
    uint32_t resolve_timeout_ms = 10000; // @username lookups
};

struct Config {
    EngineConfig engine;
    StorageConfig storage;
    MessagesConfig messages;
    TransportConfig transport;
    std::string phone;                   // empty = prompt

    // Load from ~/.headgram/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a (merged) config document; unknown or mistyped keys keep defaults
    static Config from_json(const nlohmann::json& j);

    // Apply HEADGRAM_* environment overrides
    void apply_env();

    // api_id and api_hash are both set
    bool has_credentials() const;

    AuthConfig auth_config() const;
    TransportOptions transport_options() const;
    SenderOptions sender_options() const;
};

// Path of the config file (~ expanded)
std::string config_path();

} // namespace headgram
