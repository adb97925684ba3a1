#include "resolver.hpp"
#include "commands.hpp"
#include "transport.hpp"
#include "util.hpp"
#include <iostream>

namespace headgram {

namespace {

std::optional<int64_t> record_id(const nlohmann::json& record) {
    if (!record.is_object()) return std::nullopt;
    auto it = record.find("id");
    if (it == record.end() || !it->is_number_integer()) return std::nullopt;
    return it->get<int64_t>();
}

std::string string_field(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

} // anonymous namespace

Resolver::Resolver(Transport& transport)
    : transport_(transport), drops_seen_(transport.dropped_count())
{}

std::string Resolver::placeholder(EntityKind kind, int64_t id) {
    return (kind == EntityKind::User ? "user:" : "chat:") + std::to_string(id);
}

std::string Resolver::user_name(int64_t user_id) {
    return resolve(EntityKind::User, user_id);
}

std::string Resolver::chat_name(int64_t chat_id) {
    return resolve(EntityKind::Chat, chat_id);
}

void Resolver::forget_pending_after_drops() {
    uint64_t drops = transport_.dropped_count();
    if (drops == drops_seen_) return;
    drops_seen_ = drops;

    size_t stale = users_.pending.size() + chats_.pending.size();
    if (stale == 0) return;
    std::cerr << "[resolver] Event queue overflowed; re-requesting "
              << stale << " pending lookups\n";
    users_.pending.clear();
    chats_.pending.clear();
}

std::string Resolver::resolve(EntityKind kind, int64_t id) {
    forget_pending_after_drops();

    auto& ents = entities(kind);
    auto it = ents.names.find(id);
    if (it != ents.names.end()) return it->second;

    if (ents.pending.count(id) == 0) {
        try {
            transport_.submit(kind == EntityKind::User ? commands::get_user(id)
                                                       : commands::get_chat(id));
            ents.pending.insert(id);
        } catch (const std::exception& e) {
            // Not marked pending, so the next reference retries.
            std::cerr << "[resolver] Lookup for " << placeholder(kind, id)
                      << " failed: " << e.what() << "\n";
        }
    }
    return placeholder(kind, id);
}

void Resolver::store(EntityKind kind, int64_t id, std::string name) {
    auto& ents = entities(kind);
    ents.names[id] = std::move(name);
    ents.pending.erase(id);
}

std::optional<std::string> Resolver::primary_username(const nlohmann::json& record) {
    std::string username = string_field(record, "username");
    if (!username.empty()) return username;

    auto it = record.find("usernames");
    if (it != record.end() && it->is_object()) {
        auto active = it->find("active_usernames");
        if (active != it->end() && active->is_array()) {
            for (const auto& u : *active) {
                if (u.is_string() && !u.get<std::string>().empty())
                    return u.get<std::string>();
            }
        }
    }
    return std::nullopt;
}

std::string Resolver::user_display_name(const nlohmann::json& user) {
    if (auto username = primary_username(user)) return "@" + *username;

    std::string first = trim(string_field(user, "first_name"));
    std::string last = trim(string_field(user, "last_name"));
    std::string display = first;
    if (!last.empty()) {
        if (!display.empty()) display += ' ';
        display += last;
    }
    if (!display.empty()) return display;

    auto id = record_id(user);
    return placeholder(EntityKind::User, id.value_or(0));
}

void Resolver::on_user_record(const nlohmann::json& user) {
    auto id = record_id(user);
    if (!id) return;
    store(EntityKind::User, *id, user_display_name(user));
}

void Resolver::on_chat_record(const nlohmann::json& chat) {
    auto id = record_id(chat);
    if (!id) return;

    std::string title = string_field(chat, "title");
    store(EntityKind::Chat, *id, title.empty() ? placeholder(EntityKind::Chat, *id) : title);

    if (auto username = primary_username(chat)) {
        chat_usernames_[to_lower(*username)] = *id;
    }
}

void Resolver::on_chat_title(int64_t chat_id, const std::string& title) {
    store(EntityKind::Chat, chat_id,
          title.empty() ? placeholder(EntityKind::Chat, chat_id) : title);
}

std::optional<int64_t> Resolver::chat_for_username(const std::string& username) const {
    std::string key = username;
    if (!key.empty() && key[0] == '@') key = key.substr(1);
    auto it = chat_usernames_.find(to_lower(key));
    if (it == chat_usernames_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> Resolver::cached(EntityKind kind, int64_t id) const {
    const auto& ents = entities(kind);
    auto it = ents.names.find(id);
    if (it == ents.names.end()) return std::nullopt;
    return it->second;
}

bool Resolver::pending(EntityKind kind, int64_t id) const {
    return entities(kind).pending.count(id) != 0;
}

size_t Resolver::pending_count(EntityKind kind) const {
    return entities(kind).pending.size();
}

} // namespace headgram
