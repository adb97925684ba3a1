#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sys/utsname.h>
#include <nlohmann/json.hpp>

namespace headgram {

std::string config_path() {
    return expand_home("~/.headgram/config.json");
}

nlohmann::json Config::defaults_json() {
    return {
        {"phone", ""},
        {"engine", {
            {"api_id", 0},
            {"api_hash", ""},
            {"device_model", "headless"},
            {"system_version", ""},
            {"application_version", "headless-client"},
            {"system_language_code", "en"},
            {"use_test_dc", false},
            {"log_verbosity", 1}
        }},
        {"storage", {
            {"database_directory", "tdlib"},
            {"files_directory", "tdlib"},
            {"encryption_key", ""}
        }},
        {"messages", {
            {"log_file", "messages.log"},
            {"print_to_console", true},
            {"history_limit", 100}
        }},
        {"transport", {
            {"queue_capacity", 10000},
            {"poll_timeout", 1.0},
            {"shutdown_timeout_ms", 2000},
            {"resolve_timeout_ms", 10000}
        }}
    };
}

static bool non_negative(const nlohmann::json& v) {
    return v.is_number_integer() && v.get<int64_t>() >= 0;
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::load() {
    std::string path = config_path();
    nlohmann::json j;

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            nlohmann::json on_disk = nlohmann::json::parse(file);
            file.close();
            if (!on_disk.is_object()) throw std::runtime_error("config root is not an object");
            j = merge_defaults(on_disk, defaults_json());
            if (j != on_disk) {
                if (atomic_write_file(path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: " << path << "\n";
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[config] Ignoring malformed " << path << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << path << "\n";
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("phone") && j["phone"].is_string())
        cfg.phone = j["phone"].get<std::string>();

    if (j.contains("engine") && j["engine"].is_object()) {
        auto& e = j["engine"];
        if (e.contains("api_id") && e["api_id"].is_number_integer())
            cfg.engine.api_id = e["api_id"].get<int64_t>();
        if (e.contains("api_hash") && e["api_hash"].is_string())
            cfg.engine.api_hash = e["api_hash"].get<std::string>();
        if (e.contains("device_model") && e["device_model"].is_string())
            cfg.engine.device_model = e["device_model"].get<std::string>();
        if (e.contains("system_version") && e["system_version"].is_string())
            cfg.engine.system_version = e["system_version"].get<std::string>();
        if (e.contains("application_version") && e["application_version"].is_string())
            cfg.engine.application_version = e["application_version"].get<std::string>();
        if (e.contains("system_language_code") && e["system_language_code"].is_string())
            cfg.engine.system_language_code = e["system_language_code"].get<std::string>();
        if (e.contains("use_test_dc") && e["use_test_dc"].is_boolean())
            cfg.engine.use_test_dc = e["use_test_dc"].get<bool>();
        if (e.contains("log_verbosity") && e["log_verbosity"].is_number_integer())
            cfg.engine.log_verbosity = e["log_verbosity"].get<int>();
    }

    if (j.contains("storage") && j["storage"].is_object()) {
        auto& s = j["storage"];
        if (s.contains("database_directory") && s["database_directory"].is_string())
            cfg.storage.database_directory = s["database_directory"].get<std::string>();
        if (s.contains("files_directory") && s["files_directory"].is_string())
            cfg.storage.files_directory = s["files_directory"].get<std::string>();
        if (s.contains("encryption_key") && s["encryption_key"].is_string())
            cfg.storage.encryption_key = s["encryption_key"].get<std::string>();
    }

    if (j.contains("messages") && j["messages"].is_object()) {
        auto& m = j["messages"];
        if (m.contains("log_file") && m["log_file"].is_string())
            cfg.messages.log_file = m["log_file"].get<std::string>();
        if (m.contains("print_to_console") && m["print_to_console"].is_boolean())
            cfg.messages.print_to_console = m["print_to_console"].get<bool>();
        if (m.contains("history_limit") && non_negative(m["history_limit"]))
            cfg.messages.history_limit = m["history_limit"].get<uint32_t>();
    }

    if (j.contains("transport") && j["transport"].is_object()) {
        auto& t = j["transport"];
        if (t.contains("queue_capacity") && non_negative(t["queue_capacity"]))
            cfg.transport.queue_capacity = t["queue_capacity"].get<uint32_t>();
        if (t.contains("poll_timeout") && t["poll_timeout"].is_number())
            cfg.transport.poll_timeout = t["poll_timeout"].get<double>();
        if (t.contains("shutdown_timeout_ms") && non_negative(t["shutdown_timeout_ms"]))
            cfg.transport.shutdown_timeout_ms = t["shutdown_timeout_ms"].get<uint32_t>();
        if (t.contains("resolve_timeout_ms") && non_negative(t["resolve_timeout_ms"]))
            cfg.transport.resolve_timeout_ms = t["resolve_timeout_ms"].get<uint32_t>();
    }

    return cfg;
}

void Config::apply_env() {
    // Environment variables always override config file
    if (const char* v = std::getenv("HEADGRAM_API_ID")) {
        try {
            engine.api_id = std::stoll(v);
        } catch (const std::exception&) {
            std::cerr << "[config] Ignoring non-numeric HEADGRAM_API_ID\n";
        }
    }
    if (const char* v = std::getenv("HEADGRAM_API_HASH"))
        engine.api_hash = v;
    if (const char* v = std::getenv("HEADGRAM_PHONE"))
        phone = v;
    if (const char* v = std::getenv("HEADGRAM_DATABASE_DIR"))
        storage.database_directory = v;
    if (const char* v = std::getenv("HEADGRAM_FILES_DIR"))
        storage.files_directory = v;
    if (const char* v = std::getenv("HEADGRAM_ENCRYPTION_KEY"))
        storage.encryption_key = v;
}

bool Config::has_credentials() const {
    return engine.api_id != 0 && !engine.api_hash.empty();
}

AuthConfig Config::auth_config() const {
    AuthConfig ac;
    auto& p = ac.parameters;
    p.api_id = engine.api_id;
    p.api_hash = engine.api_hash;
    p.database_directory = storage.database_directory;
    p.files_directory = storage.files_directory;
    p.use_test_dc = engine.use_test_dc;
    p.system_language_code = engine.system_language_code;
    p.device_model = engine.device_model;
    p.application_version = engine.application_version;
    p.system_version = engine.system_version;
    if (p.system_version.empty()) {
        struct utsname info;
        p.system_version = (uname(&info) == 0) ? info.sysname : "unknown";
    }
    ac.encryption_key = storage.encryption_key;
    if (!phone.empty()) ac.phone_number = phone;
    return ac;
}

TransportOptions Config::transport_options() const {
    TransportOptions opts;
    opts.poll_timeout_seconds = transport.poll_timeout > 0 ? transport.poll_timeout : 1.0;
    opts.queue_capacity = transport.queue_capacity;
    return opts;
}

SenderOptions Config::sender_options() const {
    SenderOptions opts;
    opts.resolve_timeout = std::chrono::milliseconds(transport.resolve_timeout_ms);
    return opts;
}

} // namespace headgram
