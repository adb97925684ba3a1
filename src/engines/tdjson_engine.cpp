#include "engines/tdjson_engine.hpp"
#include <td/telegram/td_json_client.h>

namespace headgram {

TdJsonEngine::TdJsonEngine()
    : client_id_(td_create_client_id())
{
    // A TDLib instance only starts emitting updates after its first request.
    td_send(client_id_, R"({"@type":"getOption","name":"version"})");
}

void TdJsonEngine::send(const std::string& request) {
    td_send(client_id_, request.c_str());
}

std::optional<std::string> TdJsonEngine::receive(double timeout_seconds) {
    const char* result = td_receive(timeout_seconds);
    if (result == nullptr) return std::nullopt;
    return std::string(result);
}

std::optional<std::string> TdJsonEngine::execute(const std::string& request) {
    const char* result = td_execute(request.c_str());
    if (result == nullptr) return std::nullopt;
    return std::string(result);
}

} // namespace headgram
