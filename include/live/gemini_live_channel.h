#pragma once

#include "live/live_channel.h"
#include "net/transport.h"
#include <string>
#include <vector>

namespace voxlink {

/**
 * @brief Session parameters carried by the setup message
 */
struct LiveSetup {
    std::string model;
    std::string voice_name;
    std::string system_instruction;
    std::string function_declarations_json = "[]";
    int capture_wire_rate = CAPTURE_WIRE_RATE;
};

// Message builders (client -> server)

std::string build_setup_message(const LiveSetup& setup);
std::string build_audio_message(const PcmBuffer& pcm, int sample_rate);
std::string build_text_message(const std::string& text);
std::string build_tool_response_message(const FunctionCall& call, const ToolResult& result);

/**
 * @brief Decode one server message into events
 *
 * Order within a message: SetupComplete, ToolCall, Interrupted,
 * InputTranscript, OutputTranscript, AudioDelta (one per inline-data part),
 * TurnComplete. Audio parts with invalid base64 are skipped.
 *
 * @return ParseError for malformed JSON
 */
Result<std::vector<LiveEvent>> parse_server_message(const std::string& raw);

/// Unwritten messages at which outbound microphone frames start being dropped
constexpr size_t MAX_AUDIO_BACKLOG = 8;

/**
 * @brief Gemini Live BidiGenerateContent over a message transport
 *
 * Audio frames are dropped, never queued, while the transport has
 * MAX_AUDIO_BACKLOG or more unwritten messages. Text and tool responses are
 * always queued.
 */
class GeminiLiveChannel : public LiveChannel {
public:
    GeminiLiveChannel(Transport& transport, LiveSetup setup);
    ~GeminiLiveChannel() override;

    void open(EventHandler handler) override;
    void send_audio(const PcmBuffer& pcm) override;
    void send_text(const std::string& text) override;
    void send_tool_response(const FunctionCall& call, const ToolResult& result) override;
    void close() override;
    bool is_open() const override;

    /// Microphone frames dropped on a backed-up transport since open()
    size_t dropped_audio_frames() const { return dropped_audio_; }

private:
    void on_message(const std::string& raw);
    void emit(const LiveEvent& event);

    Transport& transport_;
    LiveSetup setup_;
    EventHandler handler_;
    bool setup_complete_ = false;
    bool backlogged_ = false;
    size_t dropped_audio_ = 0;
};

} // namespace voxlink
