#pragma once

#include "audio/audio_device.h"
#include "audio/effect_chain.h"
#include "audio/playback_scheduler.h"
#include "common.h"
#include "config.h"
#include "errors.h"
#include <atomic>
#include <functional>
#include <string>

namespace voxlink {

/**
 * @brief Capture and playback paths between the audio device and the session
 *
 * Capture (audio thread): RMS -> boxcar downsample to the wire rate ->
 * 16-bit PCM -> frame sink. The sink must not block; it decides whether the
 * frame is sent or dropped.
 *
 * Playback: wire PCM chunks are decoded and handed to the gapless scheduler;
 * the render callback mixes active buffers and runs them through the effect
 * chain.
 */
class AudioPipeline {
public:
    using FrameSink = std::function<void(PcmBuffer frame)>;

    AudioPipeline(AudioDevice& device, const AudioConfig& audio, const EffectsConfig& effects);
    ~AudioPipeline();

    AudioPipeline(const AudioPipeline&) = delete;
    AudioPipeline& operator=(const AudioPipeline&) = delete;

    /**
     * @brief Acquire the microphone and open playback
     * @return DeviceError if either stream cannot be opened or the capture
     *         rate is below the wire rate
     */
    Result<void> start(FrameSink sink);

    /// Release the device, stop all playback, reset volume
    void stop();

    bool is_running() const { return running_; }

    /// Capture path for one device block; blocks below the wire rate are dropped
    void handle_capture(const float* samples, size_t count, int sample_rate);

    /// Render path for one output block
    void render(float* out, size_t count);

    /**
     * @brief Decode one wire PCM chunk and schedule it
     * @return false if the chunk was malformed and dropped
     */
    bool play_chunk(const std::string& pcm_bytes);

    /// Stop every scheduled buffer and reset the schedule cursor
    void interrupt();

    /// Latest capture RMS (0 when stopped)
    float volume() const { return volume_.load(); }

    PlaybackScheduler& scheduler() { return scheduler_; }

private:
    AudioDevice& device_;
    AudioConfig audio_config_;
    PlaybackScheduler scheduler_;
    EffectChain effects_;
    FrameSink sink_;
    std::atomic<float> volume_{0.0f};
    std::atomic<bool> running_{false};
};

} // namespace voxlink
