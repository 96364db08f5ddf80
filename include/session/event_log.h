#pragma once

#include "common.h"
#include <deque>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace voxlink {

enum class Sender {
    Agent,
    User
};

const char* sender_name(Sender sender);

struct LogEntry {
    std::string timestamp;  ///< local "HH:MM:SS"
    Sender sender = Sender::Agent;
    std::string message;
    Severity severity = Severity::Info;
};

/**
 * @brief Bounded, observable session log (the user-visible event stream)
 *
 * Keeps the most recent `capacity` entries. Every entry is mirrored to Logger.
 * Not thread-safe: used from the session thread only.
 */
class EventLog {
public:
    using Observer = std::function<void(const LogEntry&)>;

    explicit EventLog(size_t capacity = SESSION_LOG_CAPACITY);

    void add(const std::string& message, Severity severity = Severity::Info,
             Sender sender = Sender::Agent);

    std::vector<LogEntry> entries() const;
    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }

    /// Most recent entry whose message contains `needle`, or nullptr
    const LogEntry* find_last(const std::string& needle) const;

    size_t subscribe(Observer observer);
    void unsubscribe(size_t token);

private:
    size_t capacity_;
    std::deque<LogEntry> entries_;
    std::map<size_t, Observer> observers_;
    size_t next_token_ = 1;
};

} // namespace voxlink
