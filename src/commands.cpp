#include "commands.hpp"

namespace headgram::commands {

nlohmann::json set_tdlib_parameters(const EngineParameters& p) {
    return {
        {"@type", "setTdlibParameters"},
        {"parameters", {
            {"@type", "tdlibParameters"},
            {"use_test_dc", p.use_test_dc},
            {"database_directory", p.database_directory},
            {"files_directory", p.files_directory},
            {"use_file_database", p.use_file_database},
            {"use_chat_info_database", p.use_chat_info_database},
            {"use_message_database", p.use_message_database},
            {"use_secret_chats", p.use_secret_chats},
            {"api_id", p.api_id},
            {"api_hash", p.api_hash},
            {"system_language_code", p.system_language_code},
            {"device_model", p.device_model},
            {"system_version", p.system_version},
            {"application_version", p.application_version},
            {"enable_storage_optimizer", p.enable_storage_optimizer},
            {"ignore_file_names", p.ignore_file_names}
        }}
    };
}

nlohmann::json check_encryption_key(const std::string& key) {
    return {{"@type", "checkDatabaseEncryptionKey"}, {"encryption_key", key}};
}

nlohmann::json set_phone_number(const std::string& phone) {
    return {
        {"@type", "setAuthenticationPhoneNumber"},
        {"phone_number", phone},
        {"settings", {
            {"@type", "phoneNumberAuthenticationSettings"},
            {"allow_flash_call", false},
            {"allow_missed_call", false},
            {"is_current_phone_number", false},
            {"allow_sms_retriever_api", false}
        }}
    };
}

nlohmann::json check_code(const std::string& code) {
    return {{"@type", "checkAuthenticationCode"}, {"code", code}};
}

nlohmann::json check_password(const std::string& password) {
    return {{"@type", "checkAuthenticationPassword"}, {"password", password}};
}

nlohmann::json register_user(const std::string& first_name, const std::string& last_name) {
    return {{"@type", "registerUser"}, {"first_name", first_name}, {"last_name", last_name}};
}

nlohmann::json get_user(int64_t user_id) {
    return {{"@type", "getUser"}, {"user_id", user_id}};
}

nlohmann::json get_chat(int64_t chat_id) {
    return {{"@type", "getChat"}, {"chat_id", chat_id}};
}

nlohmann::json search_public_chat(const std::string& username) {
    return {{"@type", "searchPublicChat"}, {"username", username}};
}

nlohmann::json send_text(int64_t chat_id, const std::string& text) {
    return {
        {"@type", "sendMessage"},
        {"chat_id", chat_id},
        {"input_message_content", {
            {"@type", "inputMessageText"},
            {"text", {
                {"@type", "formattedText"},
                {"text", text},
                {"entities", nlohmann::json::array()}
            }}
        }}
    };
}

nlohmann::json close() {
    return {{"@type", "close"}};
}

nlohmann::json set_log_verbosity(int level) {
    return {{"@type", "setLogVerbosityLevel"}, {"new_verbosity_level", level}};
}

} // namespace headgram::commands
