#include "session/session_orchestrator.h"
#include "audio/audio_pipeline.h"
#include "context/context_augmentation_engine.h"
#include "logger.h"
#include "memory/memory_store_client.h"
#include "session/event_log.h"
#include "session/prompts.h"
#include "session/recording_protocol.h"
#include "tool_registry.h"
#include "utils.h"
#include <boost/asio/post.hpp>
#include <chrono>

namespace voxlink {

SessionOrchestrator::SessionOrchestrator(boost::asio::io_context& ioc,
                                         const Config& config,
                                         LiveChannel& channel,
                                         AudioPipeline& audio,
                                         MemoryStoreClient& memory,
                                         ContextAugmentationEngine& engine,
                                         ToolRegistry& tools,
                                         EventLog& log)
    : ioc_(ioc)
    , config_(config)
    , channel_(channel)
    , audio_(audio)
    , memory_(memory)
    , engine_(engine)
    , tools_(tools)
    , log_(log)
    , wake_timer_(ioc)
    , rng_(std::random_device{}())
{
    memory_log_token_ = memory_.subscribe([this](const std::string& message, Severity severity) {
        log_.add(message, severity, Sender::Agent);
    });
}

SessionOrchestrator::~SessionOrchestrator() {
    memory_.unsubscribe(memory_log_token_);
    if (state_.connection_state() != ConnectionState::Disconnected) {
        generation_++;
        release_resources();
    }
}

// --- Lifecycle ---

void SessionOrchestrator::connect() {
    if (config_.live.api_key.empty()) {
        log_.add("API Key missing.", Severity::Error);
        return;
    }
    if (!state_.on_connect_requested()) {
        LOG_SESSION(std::string("Connect ignored in state ") + connection_state_name(state_.connection_state()));
        return;
    }

    uint64_t generation = ++generation_;
    log_.add("Initializing audio protocols...");
    log_.add("Contacting voice core...");

    channel_.open([this, generation](const LiveEvent& event) {
        if (generation != generation_.load()) return;
        handle_event(event);
    });
}

void SessionOrchestrator::disconnect() {
    if (state_.connection_state() == ConnectionState::Disconnected) return;

    generation_++;
    release_resources();
    state_.on_teardown();
    log_.add("Connection terminated.");
}

void SessionOrchestrator::on_channel_open() {
    if (!state_.on_channel_open()) return;
    log_.add("Connection established. Voice link active.", Severity::Success);

    run_memory_census();

    auto started = audio_.start([this](PcmBuffer frame) { on_capture_frame(std::move(frame)); });
    if (!started) {
        log_.add("Microphone access denied: " + started.error().message, Severity::Error);
        disconnect();
        return;
    }

    ready_ = true;
    schedule_wake_silence();
}

void SessionOrchestrator::fail_connect(const std::string& reason) {
    generation_++;
    release_resources();
    state_.on_connect_failed();
    log_.add("Initialization Failure: " + reason, Severity::Error);
}

void SessionOrchestrator::release_resources() {
    ready_ = false;
    wake_timer_.cancel();
    audio_.stop();
    channel_.close();
    user_transcript_.clear();
    agent_transcript_.clear();
    recording_buffer_.clear();
    slot_.reset();
    emotion_ = Emotion::Neutral;
}

void SessionOrchestrator::run_memory_census() {
    uint64_t generation = generation_;
    memory_.get_all_memories([this, generation](const std::vector<MemoryRecord>& records) {
        if (!is_current(generation) || records.empty()) return;
        log_.add("MEMORY CHECK: " + std::to_string(records.size()) + " RECORDS FOUND.");
    });
}

void SessionOrchestrator::schedule_wake_silence() {
    uint64_t generation = generation_;
    wake_timer_.expires_after(std::chrono::milliseconds(WAKE_SILENCE_DELAY_MS));
    wake_timer_.async_wait([this, generation](const boost::system::error_code& ec) {
        if (ec || !is_current(generation)) return;
        LOG_SESSION("Sending wake-up silence");
        channel_.send_audio(PcmBuffer(WAKE_SILENCE_SAMPLES, 0));
    });
}

bool SessionOrchestrator::is_current(uint64_t generation) const {
    return generation == generation_.load() && state_.is_connected();
}

// --- Capture (audio thread) ---

void SessionOrchestrator::on_capture_frame(PcmBuffer frame) {
    if (!ready_.load()) return;
    uint64_t generation = generation_.load();
    boost::asio::post(ioc_, [this, generation, frame = std::move(frame)]() {
        if (generation != generation_.load() || !ready_.load()) return;
        channel_.send_audio(frame);
    });
}

// --- Channel events ---

void SessionOrchestrator::handle_event(const LiveEvent& event) {
    switch (event.type) {
        case LiveEvent::Type::SetupComplete:
            on_channel_open();
            return;

        case LiveEvent::Type::Closed:
            if (state_.connection_state() == ConnectionState::Connecting) {
                fail_connect("Channel closed before setup completed");
            } else if (state_.is_connected()) {
                log_.add("Session closed remotely.", Severity::Error);
                disconnect();
            }
            return;

        case LiveEvent::Type::Error:
            if (state_.connection_state() == ConnectionState::Connecting) {
                fail_connect(event.text);
            } else if (state_.is_connected()) {
                log_.add("Protocol Error: " + event.text, Severity::Error);
                disconnect();
            }
            return;

        default:
            break;
    }

    if (!state_.is_connected()) return;

    switch (event.type) {
        case LiveEvent::Type::ToolCall:
            dispatch_tool_calls(event);
            break;

        case LiveEvent::Type::Interrupted:
            LOG_SESSION("Interrupted: stopping playback");
            audio_.interrupt();
            agent_transcript_.clear();
            break;

        case LiveEvent::Type::InputTranscript:
            on_input_transcript(event.text);
            break;

        case LiveEvent::Type::OutputTranscript:
            agent_transcript_ += event.text;
            emotion_ = extract_emotion(agent_transcript_);
            break;

        case LiveEvent::Type::AudioDelta:
            commit_user_utterance(CommitTrigger::EarlyCommit);
            audio_.play_chunk(event.audio);
            break;

        case LiveEvent::Type::TurnComplete:
            on_turn_complete();
            break;

        default:
            break;
    }
}

void SessionOrchestrator::dispatch_tool_calls(const LiveEvent& event) {
    if (state_.is_recording()) {
        LOG_SESSION("Recording: " + std::to_string(event.calls.size()) + " tool call(s) ignored");
        return;
    }

    for (const auto& call : event.calls) {
        LOG_SESSION("Tool call: " + call.name + " " + call.args_json);
        uint64_t generation = generation_;
        tools_.dispatch(call.name, call.args_json, [this, generation, call](ToolResult result) {
            if (!is_current(generation)) {
                LOG_SESSION("Stale tool response dropped: " + call.name);
                return;
            }
            channel_.send_tool_response(call, result);
        });
    }
}

// --- Transcripts and recording ---

void SessionOrchestrator::on_input_transcript(const std::string& text) {
    user_transcript_ += text;

    if (state_.is_recording()) {
        check_stop_phrase();
        return;
    }

    PhraseMatch start = find_phrase(user_transcript_, config_.recording.start_phrases);
    if (!start.found || !state_.on_start_phrase()) return;

    log_.add("RECORDING STARTED", Severity::Success);
    LOG_SESSION("Start phrase \"" + start.phrase + "\" detected");
    recording_buffer_.clear();
    // Text after the start phrase opens the recording and may already hold the stop phrase
    user_transcript_ = start.after;
    check_stop_phrase();
}

bool SessionOrchestrator::check_stop_phrase() {
    PhraseMatch stop = find_phrase(user_transcript_, config_.recording.stop_phrases);
    if (!stop.found) return false;

    utils::append_segment(recording_buffer_, stop.before);
    std::string utterance = recording_buffer_;
    recording_buffer_.clear();
    user_transcript_.clear();
    state_.on_stop_phrase();

    log_.add("RECORDING COMPLETE", Severity::Success);
    LOG_SESSION("Stop phrase \"" + stop.phrase + "\" detected, flushing recording");
    if (!utils::is_empty_or_whitespace(utterance)) {
        start_augmentation(utterance);
    }
    return true;
}

void SessionOrchestrator::on_turn_complete() {
    if (state_.is_recording()) {
        utils::append_segment(recording_buffer_, user_transcript_);
        user_transcript_.clear();
    } else {
        commit_user_utterance(CommitTrigger::TurnComplete);
    }

    if (!utils::is_empty_or_whitespace(agent_transcript_)) {
        log_.add(agent_transcript_, Severity::Info, Sender::Agent);
    }
    agent_transcript_.clear();
}

// --- Augmentation ---

void SessionOrchestrator::commit_user_utterance(CommitTrigger trigger) {
    if (!state_.is_connected() || state_.is_recording()) return;
    if (utils::is_empty_or_whitespace(user_transcript_)) return;
    if (trigger == CommitTrigger::EarlyCommit && slot_.occupied()) return;

    std::string utterance = user_transcript_;
    user_transcript_.clear();
    LOG_SESSION(std::string("Utterance committed (") +
                (trigger == CommitTrigger::EarlyCommit ? "early commit" : "turn complete") + ")");
    start_augmentation(utterance);
}

void SessionOrchestrator::start_augmentation(const std::string& utterance) {
    log_.add(utils::trim_copy(utterance), Severity::Info, Sender::User);

    uint64_t generation = generation_;
    if (!slot_.try_claim(generation)) {
        Logger::warn("[Session] Augmentation in flight, utterance dropped: \"" +
                     utils::preview(utterance, 40) + "\"");
        return;
    }

    channel_.send_text(pick_thinking_prompt(config_.session.thinking_prompts, rng_));

    engine_.process(utterance, [this, generation, utterance](AugmentationResult result) {
        on_augmentation_complete(generation, utterance, result);
    });
}

void SessionOrchestrator::on_augmentation_complete(uint64_t generation, const std::string& utterance,
                                                   const AugmentationResult& result) {
    if (!is_current(generation)) {
        LOG_SESSION("Stale augmentation result ignored");
        return;
    }
    slot_.release(generation);

    if (result.log) {
        log_.add(*result.log, Severity::Info, Sender::Agent);
    }
    if (result.injection) {
        log_.add("CONTEXT UPDATE INJECTED", Severity::Success);
    }
    channel_.send_text(build_followup_prompt(result.injection, utterance));
}

} // namespace voxlink
