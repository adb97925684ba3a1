#include "message_log.hpp"
#include "event_bus.hpp"
#include <filesystem>
#include <iostream>
#include <system_error>

namespace headgram {

MessageLog::MessageLog(const std::string& path)
    : path_(path)
{
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);

    out_.open(path, std::ios::app);
    if (!out_.is_open()) {
        std::cerr << "[log] Warning: cannot open message log " << path << "\n";
    }
}

void MessageLog::append(const FormattedMessage& msg) {
    if (!out_.is_open()) return;
    out_ << header_line(msg) << '\n'
         << body_line(msg) << '\n';
    out_.flush();
}

uint64_t MessageLog::subscribe(EventBus& bus) {
    return headgram::subscribe<MessageFormattedEvent>(bus,
        [this](const MessageFormattedEvent& ev) { append(ev.message); }, "message-log");
}

MessageHistory::MessageHistory(size_t limit)
    : limit_(limit == 0 ? 1 : limit)
{}

void MessageHistory::add(FormattedMessage msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(std::move(msg));
    while (entries_.size() > limit_) entries_.pop_front();
}

std::vector<FormattedMessage> MessageHistory::recent(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = (count == 0 || count > entries_.size()) ? entries_.size() : count;
    return std::vector<FormattedMessage>(entries_.end() - static_cast<std::ptrdiff_t>(n),
                                         entries_.end());
}

size_t MessageHistory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

uint64_t MessageHistory::subscribe(EventBus& bus) {
    return headgram::subscribe<MessageFormattedEvent>(bus,
        [this](const MessageFormattedEvent& ev) { add(ev.message); }, "history");
}

} // namespace headgram
