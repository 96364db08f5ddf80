#include "session/event_log.h"
#include "logger.h"
#include <ctime>

namespace voxlink {

namespace {

std::string clock_timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm local_tm;
    localtime_r(&now, &local_tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &local_tm);
    return buf;
}

} // namespace

const char* sender_name(Sender sender) {
    return sender == Sender::User ? "User" : "Agent";
}

EventLog::EventLog(size_t capacity) : capacity_(capacity > 0 ? capacity : 1) {}

void EventLog::add(const std::string& message, Severity severity, Sender sender) {
    LogEntry entry;
    entry.timestamp = clock_timestamp();
    entry.sender = sender;
    entry.message = message;
    entry.severity = severity;

    Logger::event(severity, std::string("[") + sender_name(sender) + "] " + message);

    entries_.push_back(entry);
    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }

    auto observers = observers_;
    for (const auto& o : observers) {
        o.second(entry);
    }
}

std::vector<LogEntry> EventLog::entries() const {
    return std::vector<LogEntry>(entries_.begin(), entries_.end());
}

const LogEntry* EventLog::find_last(const std::string& needle) const {
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->message.find(needle) != std::string::npos) return &*it;
    }
    return nullptr;
}

size_t EventLog::subscribe(Observer observer) {
    size_t token = next_token_++;
    observers_[token] = std::move(observer);
    return token;
}

void EventLog::unsubscribe(size_t token) {
    observers_.erase(token);
}

} // namespace voxlink
