/**
 * Deterministic checks for transcript-level logic.
 * Asserts:
 * - Start/stop phrases match case-insensitively (ASCII and Cyrillic), earliest first.
 * - Emotion tags are read from the head of the agent transcript only.
 * - Connection/recording transitions only happen from their legal states.
 * - The session log is bounded and notifies observers.
 * - Logger level checks follow configure() and fall back to INFO+.
 *
 * Run from build dir: ./test_transcript
 */

#include "common.h"
#include "errors.h"
#include "logger.h"
#include "session/augmentation_slot.h"
#include "session/emotion.h"
#include "session/event_log.h"
#include "session/recording_protocol.h"
#include "state_machine.h"
#include "utils.h"
#include <iostream>
#include <string>
#include <vector>

using namespace voxlink;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    // --- utils ---
    ASSERT(utils::is_empty_or_whitespace(""));
    ASSERT(utils::is_empty_or_whitespace(" \t\n"));
    ASSERT(!utils::is_empty_or_whitespace(" a "));
    ASSERT(utils::to_lower_utf8("ЗАПИСЬ Ёж Abc") == "запись ёж abc");
    ASSERT(utils::to_lower_utf8("ПРИВЕТ").size() == std::string("ПРИВЕТ").size());

    std::string acc;
    utils::append_segment(acc, "  one ");
    utils::append_segment(acc, "   ");
    utils::append_segment(acc, "two");
    ASSERT(acc == "one two");
    ASSERT(utils::preview("abcdef", 3) == "abc...");
    ASSERT(utils::preview("abc", 3) == "abc");

    // --- find_phrase ---
    std::vector<std::string> start = {"start recording", "begin recording", "начать запись"};

    PhraseMatch m = find_phrase("ok BEGIN Recording now", start);
    ASSERT(m.found);
    ASSERT(m.phrase == "begin recording");
    ASSERT(m.before == "ok ");
    ASSERT(m.after == " now");

    // Earliest occurrence wins regardless of list order
    m = find_phrase("begin recording, no wait, start recording", start);
    ASSERT(m.found && m.phrase == "begin recording");
    ASSERT(m.after == ", no wait, start recording");

    m = find_phrase("Хорошо, НАЧАТЬ ЗАПИСЬ: молоко", start);
    ASSERT(m.found);
    ASSERT(m.phrase == "начать запись");
    ASSERT(m.before == "Хорошо, ");
    ASSERT(m.after == ": молоко");

    ASSERT(!find_phrase("begin the recording", start).found);
    ASSERT(!find_phrase("anything", {""}).found);
    ASSERT(!find_phrase("", start).found);

    // --- extract_emotion ---
    ASSERT(extract_emotion("Threat: stand down.") == Emotion::Threat);
    ASSERT(extract_emotion("  *[Threat]*: meatbag") == Emotion::Threat);
    ASSERT(extract_emotion("Joy: hello") == Emotion::Happy);
    ASSERT(extract_emotion("happy: hello") == Emotion::Happy);
    ASSERT(extract_emotion("Радость: привет") == Emotion::Happy);
    ASSERT(extract_emotion("Угроза: стоять") == Emotion::Threat);
    ASSERT(extract_emotion("[Сарказм]: конечно") == Emotion::Suspicious);
    ASSERT(extract_emotion("Sarcasm: sure") == Emotion::Suspicious);
    ASSERT(extract_emotion("Statement: fact") == Emotion::Neutral);
    ASSERT(extract_emotion("I feel joy: really") == Emotion::Neutral);  // tag must lead
    ASSERT(extract_emotion("Threat") == Emotion::Neutral);              // no colon yet
    ASSERT(extract_emotion("") == Emotion::Neutral);
    ASSERT(std::string(emotion_name(Emotion::Suspicious)) == "suspicious");

    // --- StateMachine ---
    StateMachine sm;
    ASSERT(sm.connection_state() == ConnectionState::Disconnected);
    ASSERT(!sm.on_channel_open());
    ASSERT(!sm.on_start_phrase());

    ASSERT(sm.on_connect_requested());
    ASSERT(sm.connection_state() == ConnectionState::Connecting);
    ASSERT(!sm.on_connect_requested());
    ASSERT(!sm.on_start_phrase());

    ASSERT(sm.on_connect_failed());
    ASSERT(sm.connection_state() == ConnectionState::Error);
    ASSERT(sm.on_connect_requested());
    ASSERT(sm.on_channel_open());
    ASSERT(sm.is_connected());
    ASSERT(!sm.on_connect_failed());

    ASSERT(sm.on_start_phrase());
    ASSERT(sm.is_recording());
    ASSERT(!sm.on_start_phrase());
    ASSERT(sm.on_stop_phrase());
    ASSERT(!sm.is_recording());
    ASSERT(!sm.on_stop_phrase());

    ASSERT(sm.on_start_phrase());
    sm.on_teardown();
    ASSERT(sm.connection_state() == ConnectionState::Disconnected);
    ASSERT(sm.recording_state() == RecordingState::Idle);
    ASSERT(std::string(connection_state_name(ConnectionState::Connecting)) == "CONNECTING");
    ASSERT(std::string(recording_state_name(RecordingState::Recording)) == "RECORDING");

    // --- AugmentationSlot ---
    AugmentationSlot slot;
    ASSERT(slot.try_claim(3));
    ASSERT(!slot.try_claim(3));
    ASSERT(!slot.release(2));  // older session cannot free a newer claim
    ASSERT(slot.occupied());
    ASSERT(slot.release(3));
    ASSERT(!slot.occupied());
    ASSERT(slot.try_claim(4));
    slot.reset();
    ASSERT(!slot.occupied());

    // --- EventLog ---
    EventLog log(3);
    int notified = 0;
    size_t token = log.subscribe([&notified](const LogEntry&) { notified++; });
    log.add("one");
    log.add("two", Severity::Success);
    log.add("three", Severity::Info, Sender::User);
    log.add("four", Severity::Error);
    ASSERT(log.size() == 3);
    ASSERT(log.entries().front().message == "two");
    ASSERT(log.entries().back().severity == Severity::Error);
    ASSERT(log.entries()[1].sender == Sender::User);
    ASSERT(log.entries()[0].timestamp.size() == 8);
    ASSERT(notified == 4);
    ASSERT(log.find_last("thr") != nullptr);
    ASSERT(log.find_last("one") == nullptr);

    log.unsubscribe(token);
    log.add("five");
    ASSERT(notified == 4);

    // --- Logger ---
    ASSERT(Logger::is_enabled(LogLevel::INFO));
    ASSERT(!Logger::is_enabled(LogLevel::DEBUG));
    Logger::configure(LogLevel::WARN, "");
    ASSERT(!Logger::is_enabled(LogLevel::INFO));
    ASSERT(Logger::is_enabled(LogLevel::ERROR));
    Logger::configure(Logger::parse_level("Debug"), "");
    ASSERT(Logger::is_enabled(LogLevel::DEBUG));
    Logger::shutdown();
    ASSERT(!Logger::is_enabled(LogLevel::DEBUG));
    ASSERT(describe(make_timeout_error()) == "timeout: Operation timed out");

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All transcript tests passed.\n";
    return 0;
}
