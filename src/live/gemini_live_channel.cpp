#include "live/gemini_live_channel.h"
#include "audio/pcm_codec.h"
#include "logger.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace voxlink {

const char* live_event_name(LiveEvent::Type type) {
    switch (type) {
        case LiveEvent::Type::SetupComplete: return "setup_complete";
        case LiveEvent::Type::ToolCall: return "tool_call";
        case LiveEvent::Type::Interrupted: return "interrupted";
        case LiveEvent::Type::InputTranscript: return "input_transcript";
        case LiveEvent::Type::OutputTranscript: return "output_transcript";
        case LiveEvent::Type::AudioDelta: return "audio_delta";
        case LiveEvent::Type::TurnComplete: return "turn_complete";
        case LiveEvent::Type::Closed: return "closed";
        case LiveEvent::Type::Error: return "error";
        default: return "unknown";
    }
}

std::string build_setup_message(const LiveSetup& setup) {
    json declarations;
    try {
        declarations = json::parse(setup.function_declarations_json);
    } catch (const json::exception& e) {
        Logger::error("Invalid function declarations: " + std::string(e.what()));
        declarations = json::array();
    }

    std::string model = setup.model;
    if (model.compare(0, 7, "models/") != 0) model = "models/" + model;

    json msg;
    json& s = msg["setup"];
    s["model"] = model;
    s["generationConfig"]["responseModalities"] = json::array({"AUDIO"});
    s["generationConfig"]["speechConfig"]["voiceConfig"]["prebuiltVoiceConfig"]["voiceName"] = setup.voice_name;
    if (!setup.system_instruction.empty()) {
        s["systemInstruction"]["parts"] = json::array({{{"text", setup.system_instruction}}});
    }
    if (declarations.is_array() && !declarations.empty()) {
        s["tools"] = json::array({{{"functionDeclarations", declarations}}});
    }
    s["inputAudioTranscription"] = json::object();
    s["outputAudioTranscription"] = json::object();
    return msg.dump();
}

std::string build_audio_message(const PcmBuffer& pcm, int sample_rate) {
    json msg;
    msg["realtimeInput"]["audio"]["data"] = pcm::base64_encode(pcm::pcm16_to_bytes(pcm));
    msg["realtimeInput"]["audio"]["mimeType"] = "audio/pcm;rate=" + std::to_string(sample_rate);
    return msg.dump();
}

std::string build_text_message(const std::string& text) {
    json msg;
    msg["realtimeInput"]["text"] = text;
    return msg.dump();
}

std::string build_tool_response_message(const FunctionCall& call, const ToolResult& result) {
    json response;
    if (result.success) {
        response["result"] = result.content;
    } else {
        response["error"] = result.error;
    }
    json msg;
    msg["toolResponse"]["functionResponses"] = json::array({
        {{"id", call.id}, {"name", call.name}, {"response", response}}
    });
    return msg.dump();
}

Result<std::vector<LiveEvent>> parse_server_message(const std::string& raw) {
    json msg;
    try {
        msg = json::parse(raw);
    } catch (const json::exception& e) {
        return make_parse_error("Live message: " + std::string(e.what()));
    }
    if (!msg.is_object()) {
        return make_parse_error("Live message is not an object");
    }

    std::vector<LiveEvent> events;

    if (msg.contains("setupComplete")) {
        events.push_back(LiveEvent::make(LiveEvent::Type::SetupComplete));
    }

    if (msg.contains("toolCall") && msg["toolCall"].contains("functionCalls") &&
        msg["toolCall"]["functionCalls"].is_array()) {
        LiveEvent e = LiveEvent::make(LiveEvent::Type::ToolCall);
        for (const auto& fc : msg["toolCall"]["functionCalls"]) {
            FunctionCall call;
            call.id = fc.value("id", "");
            call.name = fc.value("name", "");
            call.args_json = fc.contains("args") ? fc["args"].dump() : "{}";
            e.calls.push_back(call);
        }
        if (!e.calls.empty()) events.push_back(e);
    }

    if (!msg.contains("serverContent") || !msg["serverContent"].is_object()) {
        return events;
    }
    const json& content = msg["serverContent"];

    if (content.value("interrupted", false)) {
        events.push_back(LiveEvent::make(LiveEvent::Type::Interrupted));
    }
    if (content.contains("inputTranscription") && content["inputTranscription"].contains("text") &&
        content["inputTranscription"]["text"].is_string()) {
        events.push_back(LiveEvent::make(LiveEvent::Type::InputTranscript,
                                         content["inputTranscription"]["text"].get<std::string>()));
    }
    if (content.contains("outputTranscription") && content["outputTranscription"].contains("text") &&
        content["outputTranscription"]["text"].is_string()) {
        events.push_back(LiveEvent::make(LiveEvent::Type::OutputTranscript,
                                         content["outputTranscription"]["text"].get<std::string>()));
    }
    if (content.contains("modelTurn") && content["modelTurn"].contains("parts") &&
        content["modelTurn"]["parts"].is_array()) {
        for (const auto& part : content["modelTurn"]["parts"]) {
            if (!part.contains("inlineData") || !part["inlineData"].contains("data")) continue;
            const json& data = part["inlineData"]["data"];
            if (!data.is_string()) continue;
            auto bytes = pcm::base64_decode(data.get<std::string>());
            if (!bytes) {
                Logger::warn("[Live] Audio part skipped: " + bytes.error().message);
                continue;
            }
            LiveEvent e = LiveEvent::make(LiveEvent::Type::AudioDelta);
            e.audio = std::move(bytes.value());
            events.push_back(std::move(e));
        }
    }
    if (content.value("turnComplete", false)) {
        events.push_back(LiveEvent::make(LiveEvent::Type::TurnComplete));
    }
    return events;
}

GeminiLiveChannel::GeminiLiveChannel(Transport& transport, LiveSetup setup)
    : transport_(transport), setup_(std::move(setup)) {}

GeminiLiveChannel::~GeminiLiveChannel() {
    close();
}

void GeminiLiveChannel::open(EventHandler handler) {
    handler_ = std::move(handler);
    setup_complete_ = false;
    backlogged_ = false;
    dropped_audio_ = 0;

    Transport::Handlers handlers;
    handlers.on_open = [this]() {
        LOG_LIVE("Transport open, sending setup");
        transport_.send(build_setup_message(setup_));
    };
    handlers.on_message = [this](const std::string& raw) { on_message(raw); };
    handlers.on_error = [this](const Error& error) {
        setup_complete_ = false;
        emit(LiveEvent::make(LiveEvent::Type::Error, error.message));
    };
    handlers.on_close = [this]() {
        setup_complete_ = false;
        emit(LiveEvent::make(LiveEvent::Type::Closed));
    };
    transport_.open(std::move(handlers));
}

void GeminiLiveChannel::on_message(const std::string& raw) {
    auto events = parse_server_message(raw);
    if (!events) {
        Logger::warn("[Live] Malformed message skipped: " + events.error().message);
        return;
    }
    for (const auto& event : events.value()) {
        if (event.type == LiveEvent::Type::SetupComplete) {
            setup_complete_ = true;
        }
        emit(event);
        // The handler may close the channel mid-message
        if (!handler_) break;
    }
}

void GeminiLiveChannel::emit(const LiveEvent& event) {
    if (handler_) {
        EventHandler handler = handler_;
        handler(event);
    }
}

void GeminiLiveChannel::send_audio(const PcmBuffer& pcm) {
    if (!is_open()) return;

    if (transport_.pending_writes() >= MAX_AUDIO_BACKLOG) {
        if (!backlogged_) {
            Logger::warn("[Live] Uplink backed up, dropping microphone frames");
            backlogged_ = true;
        }
        dropped_audio_++;
        return;
    }
    if (backlogged_) {
        LOG_LIVE("Uplink recovered after " + std::to_string(dropped_audio_) + " dropped frame(s)");
        backlogged_ = false;
    }
    transport_.send(build_audio_message(pcm, setup_.capture_wire_rate));
}

void GeminiLiveChannel::send_text(const std::string& text) {
    if (!is_open()) return;
    transport_.send(build_text_message(text));
}

void GeminiLiveChannel::send_tool_response(const FunctionCall& call, const ToolResult& result) {
    if (!is_open()) return;
    transport_.send(build_tool_response_message(call, result));
}

void GeminiLiveChannel::close() {
    handler_ = nullptr;
    setup_complete_ = false;
    transport_.close();
}

bool GeminiLiveChannel::is_open() const {
    return setup_complete_ && transport_.is_open();
}

} // namespace voxlink
