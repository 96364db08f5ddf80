#pragma once

#include "common.h"
#include "config.h"
#include "live/live_channel.h"
#include "session/augmentation_slot.h"
#include "session/emotion.h"
#include "state_machine.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <optional>
#include <random>
#include <string>

namespace voxlink {

class AudioPipeline;
class ContextAugmentationEngine;
class EventLog;
class MemoryStoreClient;
class ToolRegistry;
struct AugmentationResult;

/**
 * @brief Real-time session: microphone frames out, model events in, memory on the side
 *
 * Everything except on_capture_frame() runs on the io_context thread.
 *
 * Turn boundary: the user transcript is committed for augmentation when the
 * first agent audio chunk arrives (early commit) or, failing that, on turn
 * complete. Both paths go through commit_user_utterance(); committing an
 * empty buffer is a no-op. At most one augmentation is in flight; a commit
 * that finds the slot occupied discards its utterance.
 *
 * Every asynchronous completion carries the session generation it was
 * started under and is ignored once the generation has moved on.
 */
class SessionOrchestrator {
public:
    enum class CommitTrigger {
        EarlyCommit,   ///< first agent audio chunk of the reply
        TurnComplete   ///< formal end of turn
    };

    SessionOrchestrator(boost::asio::io_context& ioc,
                        const Config& config,
                        LiveChannel& channel,
                        AudioPipeline& audio,
                        MemoryStoreClient& memory,
                        ContextAugmentationEngine& engine,
                        ToolRegistry& tools,
                        EventLog& log);
    ~SessionOrchestrator();

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    /// Disconnected/Error -> Connecting; ignored otherwise
    void connect();

    /// Tear down the session; no-op when already disconnected
    void disconnect();

    /// One inbound channel event, in arrival order
    void handle_event(const LiveEvent& event);

    /**
     * @brief Extract-and-clear the user transcript and start augmentation
     *
     * No-op when not connected, while recording, or when the buffer is
     * blank. An early commit also requires a free augmentation slot.
     */
    void commit_user_utterance(CommitTrigger trigger);

    /// Capture frame sink (audio thread): posts the frame or drops it
    void on_capture_frame(PcmBuffer frame);

    ConnectionState connection_state() const { return state_.connection_state(); }
    RecordingState recording_state() const { return state_.recording_state(); }
    Emotion emotion() const { return emotion_; }
    uint64_t generation() const { return generation_.load(); }
    bool augmentation_in_flight() const { return slot_.occupied(); }
    bool accepting_frames() const { return ready_.load(); }

    const std::string& user_transcript() const { return user_transcript_; }
    const std::string& agent_transcript() const { return agent_transcript_; }
    const std::string& recording_buffer() const { return recording_buffer_; }

private:
    void on_channel_open();
    void fail_connect(const std::string& reason);
    void release_resources();
    void run_memory_census();
    void schedule_wake_silence();

    void on_input_transcript(const std::string& text);
    void on_turn_complete();
    void dispatch_tool_calls(const LiveEvent& event);

    /// Returns true if a stop phrase ended the recording
    bool check_stop_phrase();

    void start_augmentation(const std::string& utterance);
    void on_augmentation_complete(uint64_t generation, const std::string& utterance,
                                  const AugmentationResult& result);

    bool is_current(uint64_t generation) const;

    boost::asio::io_context& ioc_;
    const Config& config_;
    LiveChannel& channel_;
    AudioPipeline& audio_;
    MemoryStoreClient& memory_;
    ContextAugmentationEngine& engine_;
    ToolRegistry& tools_;
    EventLog& log_;

    StateMachine state_;
    AugmentationSlot slot_;
    boost::asio::steady_timer wake_timer_;
    std::mt19937 rng_;
    size_t memory_log_token_ = 0;

    std::atomic<uint64_t> generation_{0};
    std::atomic<bool> ready_{false};

    std::string user_transcript_;
    std::string agent_transcript_;
    std::string recording_buffer_;
    Emotion emotion_ = Emotion::Neutral;
};

} // namespace voxlink
