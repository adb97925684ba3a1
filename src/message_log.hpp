#pragma once
#include "records.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace headgram {

class EventBus;

// Append-only text log of formatted messages, flushed per record.
class MessageLog {
public:
    explicit MessageLog(const std::string& path);

    bool is_open() const { return out_.is_open(); }
    const std::string& path() const { return path_; }

    void append(const FormattedMessage& msg);

    // Append every MessageFormattedEvent published on bus
    uint64_t subscribe(EventBus& bus);

private:
    std::string path_;
    std::ofstream out_;
};

// The most recent formatted messages, oldest first. Thread-safe.
class MessageHistory {
public:
    static constexpr size_t DEFAULT_LIMIT = 100;

    explicit MessageHistory(size_t limit = DEFAULT_LIMIT);

    void add(FormattedMessage msg);

    // Up to `count` newest entries (all when 0), oldest first
    std::vector<FormattedMessage> recent(size_t count = 0) const;

    size_t size() const;
    size_t limit() const { return limit_; }

    uint64_t subscribe(EventBus& bus);

private:
    const size_t limit_;
    mutable std::mutex mutex_;
    std::deque<FormattedMessage> entries_;
};

} // namespace headgram
