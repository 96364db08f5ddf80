#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <memory>

namespace voxlink {

// Audio types
using Sample = int16_t;
using PcmBuffer = std::vector<Sample>;
using FloatBuffer = std::vector<float>;

// Timing
using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

inline int64_t ms_since(TimePoint start) {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<Duration>(now - start).count();
}

/// Wall-clock milliseconds since the Unix epoch (record timestamps, offline ids)
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/// Severity tag of user-visible log events
enum class Severity {
    Info,
    Error,
    Success
};

inline const char* severity_name(Severity s) {
    switch (s) {
        case Severity::Info: return "info";
        case Severity::Error: return "error";
        case Severity::Success: return "success";
        default: return "unknown";
    }
}

// Wire format constants
constexpr int CAPTURE_WIRE_RATE = 16000;   // outbound microphone PCM
constexpr int PLAYBACK_WIRE_RATE = 24000;  // inbound model audio PCM
constexpr int DEFAULT_CAPTURE_FRAME = 4096;

// Session constants
constexpr int WAKE_SILENCE_DELAY_MS = 500;
constexpr int WAKE_SILENCE_SAMPLES = 8000;
constexpr size_t SESSION_LOG_CAPACITY = 50;
constexpr size_t SEARCH_RESULT_CAP = 5;

} // namespace voxlink
