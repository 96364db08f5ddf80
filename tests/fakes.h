#pragma once

/**
 * In-process stand-ins for the network, audio hardware and classifier.
 * Every fake records what it was asked to do and lets the test drive the
 * other side by hand.
 */

#include "audio/audio_device.h"
#include "context/intent_classifier.h"
#include "context/tag_extractor.h"
#include "live/live_channel.h"
#include "net/transport.h"
#include <deque>
#include <string>
#include <utility>
#include <vector>

namespace voxlink {
namespace testing {

class FakeTransport : public Transport {
public:
    void open(Handlers handlers) override {
        handlers_ = std::move(handlers);
        open_ = false;
        open_calls++;
    }

    void send(const std::string& message) override {
        if (!open_) {
            dropped.push_back(message);
            return;
        }
        sent.push_back(message);
    }

    void close() override {
        open_ = false;
        handlers_ = Handlers{};
        close_calls++;
    }

    bool is_open() const override { return open_; }

    size_t pending_writes() const override { return backlog; }

    // Server side

    void accept() {
        open_ = true;
        if (handlers_.on_open) handlers_.on_open();
    }

    void deliver(const std::string& message) {
        auto on_message = handlers_.on_message;
        if (on_message) on_message(message);
    }

    void fail(const std::string& reason) {
        open_ = false;
        auto on_error = handlers_.on_error;
        handlers_ = Handlers{};
        if (on_error) on_error(make_network_error(reason));
    }

    void remote_close() {
        open_ = false;
        auto on_close = handlers_.on_close;
        handlers_ = Handlers{};
        if (on_close) on_close();
    }

    std::vector<std::string> sent;
    std::vector<std::string> dropped;
    size_t backlog = 0;  // simulated unwritten messages
    int open_calls = 0;
    int close_calls = 0;

private:
    Handlers handlers_;
    bool open_ = false;
};

class FakeAudioDevice : public AudioDevice {
public:
    Result<void> open_capture(CaptureCallback callback) override {
        if (deny_capture) {
            return make_device_error("Permission denied");
        }
        capture_ = std::move(callback);
        // A real stream may deliver before open returns
        if (!block_on_open.empty()) capture_(block_on_open.data(), block_on_open.size(), native_rate);
        return Result<void>();
    }

    int capture_sample_rate() const override { return native_rate; }

    Result<void> open_playback(int sample_rate, RenderCallback callback) override {
        playback_rate = sample_rate;
        render_ = std::move(callback);
        return Result<void>();
    }

    void close() override {
        capture_ = nullptr;
        render_ = nullptr;
        close_calls++;
    }

    bool capturing() const { return static_cast<bool>(capture_); }

    // Audio thread side

    void feed(const std::vector<float>& block) {
        if (capture_) capture_(block.data(), block.size(), native_rate);
    }

    std::vector<float> render(size_t frames) {
        std::vector<float> out(frames, 0.0f);
        if (render_) render_(out.data(), frames);
        return out;
    }

    bool deny_capture = false;
    std::vector<float> block_on_open;
    int native_rate = 48000;
    int playback_rate = 0;
    int close_calls = 0;

private:
    CaptureCallback capture_;
    RenderCallback render_;
};

/// Holds classify() callbacks until the test answers them
class FakeClassifier : public IntentClassifier {
public:
    void classify(const std::string& utterance, Callback callback) override {
        utterances.push_back(utterance);
        pending.push_back(std::move(callback));
    }

    void answer(Result<Classification> result) {
        if (pending.empty()) return;
        Callback callback = std::move(pending.front());
        pending.pop_front();
        callback(result);
    }

    void answer_none() {
        answer(Classification{});
    }

    std::vector<std::string> utterances;
    std::deque<Callback> pending;
};

class FakeTagExtractor : public TagExtractor {
public:
    void extract_tags(const std::string& text, Callback callback) override {
        requests.push_back(text);
        callback(tags);
    }

    std::vector<std::string> tags;
    std::vector<std::string> requests;
};

class FakeLiveChannel : public LiveChannel {
public:
    void open(EventHandler handler) override {
        handler_ = std::move(handler);
        open_ = false;
        open_calls++;
    }

    void send_audio(const PcmBuffer& pcm) override {
        if (open_) audio_frames.push_back(pcm);
    }

    void send_text(const std::string& text) override {
        if (open_) texts.push_back(text);
    }

    void send_tool_response(const FunctionCall& call, const ToolResult& result) override {
        if (open_) tool_responses.emplace_back(call, result);
    }

    void close() override {
        handler_ = nullptr;
        open_ = false;
        close_calls++;
    }

    bool is_open() const override { return open_; }

    // Server side

    void emit(const LiveEvent& event) {
        if (!handler_) return;
        EventHandler handler = handler_;
        handler(event);
    }

    void setup_complete() {
        open_ = true;
        emit(LiveEvent::make(LiveEvent::Type::SetupComplete));
    }

    void input(const std::string& text) { emit(LiveEvent::make(LiveEvent::Type::InputTranscript, text)); }
    void output(const std::string& text) { emit(LiveEvent::make(LiveEvent::Type::OutputTranscript, text)); }
    void turn_complete() { emit(LiveEvent::make(LiveEvent::Type::TurnComplete)); }
    void interrupted() { emit(LiveEvent::make(LiveEvent::Type::Interrupted)); }

    void audio(const std::string& pcm_bytes) {
        LiveEvent e = LiveEvent::make(LiveEvent::Type::AudioDelta);
        e.audio = pcm_bytes;
        emit(e);
    }

    void tool_call(const std::string& id, const std::string& name, const std::string& args_json) {
        LiveEvent e = LiveEvent::make(LiveEvent::Type::ToolCall);
        e.calls.push_back(FunctionCall{id, name, args_json});
        emit(e);
    }

    void remote_close() {
        open_ = false;
        emit(LiveEvent::make(LiveEvent::Type::Closed));
    }

    void error(const std::string& message) {
        open_ = false;
        emit(LiveEvent::make(LiveEvent::Type::Error, message));
    }

    bool has_handler() const { return static_cast<bool>(handler_); }

    std::vector<PcmBuffer> audio_frames;
    std::vector<std::string> texts;
    std::vector<std::pair<FunctionCall, ToolResult>> tool_responses;
    int open_calls = 0;
    int close_calls = 0;

private:
    EventHandler handler_;
    bool open_ = false;
};

} // namespace testing
} // namespace voxlink
