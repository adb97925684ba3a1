#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <nlohmann/json.hpp>

namespace headgram {

class Transport;

enum class EntityKind { User, Chat };

// Id -> display-name caches plus the set of lookups in flight, one pair per
// entity kind. Owned by a single consumer context; not thread-safe.
//
// Resolution is lazy: a miss returns a placeholder right away and asks the
// engine once; the answer arrives later as a user/chat record. Names already
// handed out are never revisited. If the transport has dropped events since
// the last lookup, every pending lookup is forgotten and re-requested on its
// next reference, since its answer may have been among the dropped.
class Resolver {
public:
    explicit Resolver(Transport& transport);

    // Cached name, or "user:<id>" / "chat:<id>" while unknown. Issues at most
    // one lookup per id until its record arrives.
    std::string user_name(int64_t user_id);
    std::string chat_name(int64_t chat_id);

    // Upsert from engine records; clears the pending mark.
    // Records without an integer "id" are ignored.
    void on_user_record(const nlohmann::json& user);
    void on_chat_record(const nlohmann::json& chat);
    void on_chat_title(int64_t chat_id, const std::string& title);

    // Chat id learned from a chat record carrying this username
    // (case-insensitive, leading '@' optional).
    std::optional<int64_t> chat_for_username(const std::string& username) const;

    std::optional<std::string> cached(EntityKind kind, int64_t id) const;
    bool pending(EntityKind kind, int64_t id) const;
    size_t pending_count(EntityKind kind) const;

    // "@username", else trimmed "first last", else "user:<id>"
    static std::string user_display_name(const nlohmann::json& user);

    // First public username of a user/chat record, if any
    static std::optional<std::string> primary_username(const nlohmann::json& record);

    static std::string placeholder(EntityKind kind, int64_t id);

private:
    struct Entities {
        std::unordered_map<int64_t, std::string> names;
        std::unordered_set<int64_t> pending;
    };

    std::string resolve(EntityKind kind, int64_t id);
    void forget_pending_after_drops();
    void store(EntityKind kind, int64_t id, std::string name);

    Entities& entities(EntityKind kind) { return kind == EntityKind::User ? users_ : chats_; }
    const Entities& entities(EntityKind kind) const { return kind == EntityKind::User ? users_ : chats_; }

    Transport& transport_;
    Entities users_;
    Entities chats_;
    std::unordered_map<std::string, int64_t> chat_usernames_; // lower-cased
    uint64_t drops_seen_ = 0;
};

} // namespace headgram
