#pragma once

#include "common.h"
#include "errors.h"
#include "tool.h"
#include <functional>
#include <string>
#include <vector>

namespace voxlink {

struct FunctionCall {
    std::string id;
    std::string name;
    std::string args_json;  ///< JSON object
};

/**
 * @brief One inbound event from the remote speech channel
 */
struct LiveEvent {
    enum class Type {
        SetupComplete,     ///< channel-open acknowledgment
        ToolCall,
        Interrupted,
        InputTranscript,   ///< user speech delta (text)
        OutputTranscript,  ///< agent speech delta (text)
        AudioDelta,        ///< wire PCM bytes (audio)
        TurnComplete,
        Closed,
        Error              ///< text holds the reason
    };

    Type type = Type::Error;
    std::string text;
    std::string audio;
    std::vector<FunctionCall> calls;

    static LiveEvent make(Type type, std::string text = "") {
        LiveEvent e;
        e.type = type;
        e.text = std::move(text);
        return e;
    }
};

const char* live_event_name(LiveEvent::Type type);

/**
 * @brief Duplex channel to the remote real-time speech service
 *
 * Events are delivered in arrival order on the session thread.
 */
class LiveChannel {
public:
    using EventHandler = std::function<void(const LiveEvent&)>;

    virtual ~LiveChannel() = default;

    /// Start connecting; SetupComplete or Error/Closed follows
    virtual void open(EventHandler handler) = 0;

    /// Wire PCM at the capture wire rate
    virtual void send_audio(const PcmBuffer& pcm) = 0;

    /// Free-text instruction into the conversation
    virtual void send_text(const std::string& text) = 0;

    virtual void send_tool_response(const FunctionCall& call, const ToolResult& result) = 0;

    /// No events are delivered after close()
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

} // namespace voxlink
