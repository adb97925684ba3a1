#pragma once
#include "../engine.hpp"

namespace headgram {

// TDLib td_json_client binding. One instance owns one TDLib client id.
class TdJsonEngine : public Engine {
public:
    TdJsonEngine();

    void send(const std::string& request) override;
    std::optional<std::string> receive(double timeout_seconds) override;
    std::optional<std::string> execute(const std::string& request) override;

    int client_id() const { return client_id_; }

private:
    int client_id_;
};

} // namespace headgram
