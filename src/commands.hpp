#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace headgram {

// Engine configuration submitted in answer to WaitParameters.
struct EngineParameters {
    int64_t api_id = 0;
    std::string api_hash;
    std::string database_directory = "tdlib";
    std::string files_directory = "tdlib";
    bool use_test_dc = false;
    bool use_file_database = true;
    bool use_chat_info_database = true;
    bool use_message_database = true;
    bool use_secret_chats = true;
    bool enable_storage_optimizer = true;
    bool ignore_file_names = false;
    std::string system_language_code = "en";
    std::string device_model = "headless";
    std::string system_version = "linux";
    std::string application_version = "headgram";
};

// Builders for every outbound engine request this client issues.
namespace commands {

nlohmann::json set_tdlib_parameters(const EngineParameters& params);
nlohmann::json check_encryption_key(const std::string& key);
nlohmann::json set_phone_number(const std::string& phone);
nlohmann::json check_code(const std::string& code);
nlohmann::json check_password(const std::string& password);
nlohmann::json register_user(const std::string& first_name, const std::string& last_name);

nlohmann::json get_user(int64_t user_id);
nlohmann::json get_chat(int64_t chat_id);
nlohmann::json search_public_chat(const std::string& username);

// Plain-text sendMessage
nlohmann::json send_text(int64_t chat_id, const std::string& text);

nlohmann::json close();

// Answered synchronously via execute_local
nlohmann::json set_log_verbosity(int level);

} // namespace commands
} // namespace headgram
