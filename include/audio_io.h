#pragma once

#include "audio/audio_device.h"
#include "config.h"
#include <string>
#include <memory>

namespace voxlink {

/**
 * @brief Audio device backed by PortAudio
 *
 * Opens a mono float32 capture stream at the device's default rate (or the
 * configured input_sample_rate) delivering capture_frame_samples per block,
 * and a mono float32 playback stream at the requested rate.
 *
 * Thread Safety:
 * - Callbacks run in PortAudio's thread (separate from the session loop)
 * - close() stops both streams before returning, so no callback runs after it
 */
class AudioIO : public AudioDevice {
public:
    explicit AudioIO(const AudioConfig& config);
    ~AudioIO() override;

    // Non-copyable
    AudioIO(const AudioIO&) = delete;
    AudioIO& operator=(const AudioIO&) = delete;

    Result<void> open_capture(CaptureCallback callback) override;
    int capture_sample_rate() const override;
    Result<void> open_playback(int sample_rate, RenderCallback callback) override;
    void close() override;

    /**
     * @brief List all available audio devices to the log
     */
    static void list_devices();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voxlink
