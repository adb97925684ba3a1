#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace headgram;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.engine.api_id == 0);
    REQUIRE(cfg.engine.api_hash.empty());
    REQUIRE(cfg.storage.database_directory == "tdlib");
    REQUIRE(cfg.storage.files_directory == "tdlib");
    REQUIRE(cfg.messages.log_file == "messages.log");
    REQUIRE(cfg.messages.history_limit == 100);
    REQUIRE(cfg.transport.queue_capacity == 10000);
    REQUIRE(cfg.transport.resolve_timeout_ms == 10000);
    REQUIRE_FALSE(cfg.has_credentials());
}

TEST_CASE("Config: defaults_json round-trips through from_json", "[config]") {
    Config cfg = Config::from_json(Config::defaults_json());
    REQUIRE(cfg.engine.device_model == "headless");
    REQUIRE(cfg.engine.application_version == "headless-client");
    REQUIRE(cfg.messages.print_to_console);
    REQUIRE(cfg.phone.empty());
}

TEST_CASE("Config::from_json: mistyped keys keep defaults", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "engine": {"api_id": "abc", "api_hash": 5},
        "messages": {"history_limit": -3},
        "transport": "fast"
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.engine.api_id == 0);
    REQUIRE(cfg.engine.api_hash.empty());
    REQUIRE(cfg.messages.history_limit == 100);
    REQUIRE(cfg.transport.queue_capacity == 10000);
}

TEST_CASE("Config: has_credentials needs both id and hash", "[config]") {
    Config cfg;
    cfg.engine.api_id = 123;
    REQUIRE_FALSE(cfg.has_credentials());
    cfg.engine.api_hash = "abc";
    REQUIRE(cfg.has_credentials());
}

// ── Derived options ─────────────────────────────────────────────

TEST_CASE("Config::auth_config: maps engine and storage sections", "[config]") {
    Config cfg;
    cfg.engine.api_id = 999;
    cfg.engine.api_hash = "h";
    cfg.engine.use_test_dc = true;
    cfg.engine.system_version = "TestOS";
    cfg.storage.database_directory = "/var/db";
    cfg.storage.files_directory = "/var/files";
    cfg.storage.encryption_key = "k";
    cfg.phone = "+100";

    AuthConfig ac = cfg.auth_config();
    REQUIRE(ac.parameters.api_id == 999);
    REQUIRE(ac.parameters.api_hash == "h");
    REQUIRE(ac.parameters.use_test_dc);
    REQUIRE(ac.parameters.system_version == "TestOS");
    REQUIRE(ac.parameters.database_directory == "/var/db");
    REQUIRE(ac.parameters.files_directory == "/var/files");
    REQUIRE(ac.encryption_key == "k");
    REQUIRE(ac.phone_number.value() == "+100");
}

TEST_CASE("Config::auth_config: blank system version uses host OS", "[config]") {
    Config cfg;
    AuthConfig ac = cfg.auth_config();
    REQUIRE_FALSE(ac.parameters.system_version.empty());
    REQUIRE_FALSE(ac.phone_number.has_value());
}

TEST_CASE("Config: transport and sender options", "[config]") {
    Config cfg;
    cfg.transport.queue_capacity = 64;
    cfg.transport.poll_timeout = 0;
    cfg.transport.resolve_timeout_ms = 2500;

    auto topts = cfg.transport_options();
    REQUIRE(topts.queue_capacity == 64);
    REQUIRE(topts.poll_timeout_seconds == 1.0);

    auto sopts = cfg.sender_options();
    REQUIRE(sopts.resolve_timeout == std::chrono::milliseconds(2500));
}

// ── Config::load ────────────────────────────────────────────────

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "headgram_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

static const char* const ENV_VARS[] = {
    "HEADGRAM_API_ID", "HEADGRAM_API_HASH", "HEADGRAM_PHONE",
    "HEADGRAM_DATABASE_DIR", "HEADGRAM_FILES_DIR", "HEADGRAM_ENCRYPTION_KEY",
};

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        for (const char* var : ENV_VARS) unsetenv(var);
    }

    ~ConfigTestGuard() {
        for (const char* var : ENV_VARS) unsetenv(var);
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.headgram/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.headgram");
        std::ofstream f(config_path());
        f << content;
    }

    nlohmann::json read_config() const {
        std::ifstream f(config_path());
        return nlohmann::json::parse(f);
    }
};

TEST_CASE("Config::load: creates default file when missing", "[config]") {
    ConfigTestGuard guard;
    Config cfg = Config::load();

    REQUIRE(cfg.engine.api_id == 0);
    REQUIRE(std::filesystem::exists(guard.config_path()));
    auto written = guard.read_config();
    REQUIRE(written["messages"]["history_limit"] == 100);
}

TEST_CASE("Config::load: reads values from file", "[config]") {
    ConfigTestGuard guard;
    guard.write_config(R"({
        "phone": "+15551234",
        "engine": {"api_id": 4242, "api_hash": "abcdef", "use_test_dc": true},
        "storage": {"database_directory": "/tmp/hg-db"},
        "messages": {"log_file": "chat.log", "history_limit": 25}
    })");

    Config cfg = Config::load();
    REQUIRE(cfg.phone == "+15551234");
    REQUIRE(cfg.engine.api_id == 4242);
    REQUIRE(cfg.engine.api_hash == "abcdef");
    REQUIRE(cfg.engine.use_test_dc);
    REQUIRE(cfg.storage.database_directory == "/tmp/hg-db");
    REQUIRE(cfg.storage.files_directory == "tdlib");
    REQUIRE(cfg.messages.log_file == "chat.log");
    REQUIRE(cfg.messages.history_limit == 25);
}

TEST_CASE("Config::load: migrates missing keys into file", "[config]") {
    ConfigTestGuard guard;
    guard.write_config(R"({"engine": {"api_id": 7}})");

    Config cfg = Config::load();
    REQUIRE(cfg.engine.api_id == 7);

    auto written = guard.read_config();
    REQUIRE(written["engine"]["api_id"] == 7);
    REQUIRE(written["engine"].contains("api_hash"));
    REQUIRE(written.contains("transport"));
}

TEST_CASE("Config::load: malformed file falls back to defaults", "[config]") {
    ConfigTestGuard guard;
    guard.write_config("{ not json");

    Config cfg = Config::load();
    REQUIRE(cfg.engine.api_id == 0);
    REQUIRE(cfg.messages.log_file == "messages.log");
}

TEST_CASE("Config::load: non-object root falls back to defaults", "[config]") {
    ConfigTestGuard guard;
    guard.write_config("[1, 2, 3]");

    Config cfg = Config::load();
    REQUIRE(cfg.transport.queue_capacity == 10000);
}

TEST_CASE("Config::load: env vars override file", "[config]") {
    ConfigTestGuard guard;
    guard.write_config(R"({"engine": {"api_id": 1, "api_hash": "file"}})");

    setenv("HEADGRAM_API_ID", "31337", 1);
    setenv("HEADGRAM_API_HASH", "env-hash", 1);
    setenv("HEADGRAM_PHONE", "+4477", 1);
    setenv("HEADGRAM_DATABASE_DIR", "/env/db", 1);
    setenv("HEADGRAM_FILES_DIR", "/env/files", 1);
    setenv("HEADGRAM_ENCRYPTION_KEY", "env-key", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.engine.api_id == 31337);
    REQUIRE(cfg.engine.api_hash == "env-hash");
    REQUIRE(cfg.phone == "+4477");
    REQUIRE(cfg.storage.database_directory == "/env/db");
    REQUIRE(cfg.storage.files_directory == "/env/files");
    REQUIRE(cfg.storage.encryption_key == "env-key");
}

TEST_CASE("Config::load: non-numeric api id in env is ignored", "[config]") {
    ConfigTestGuard guard;
    guard.write_config(R"({"engine": {"api_id": 55}})");
    setenv("HEADGRAM_API_ID", "twelve", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.engine.api_id == 55);
}
