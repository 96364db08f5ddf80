#pragma once

#include "errors.h"
#include <cstddef>
#include <functional>

namespace voxlink {

/**
 * @brief Capture and playback device seam
 *
 * The capture callback is invoked on the audio thread with one fixed-size
 * block of mono float samples and the rate of the stream that produced it;
 * it must not block and may start firing before open_capture() returns.
 * The render callback is invoked on the audio thread to fill one output block.
 */
class AudioDevice {
public:
    using CaptureCallback = std::function<void(const float* samples, size_t count, int sample_rate)>;
    using RenderCallback = std::function<void(float* out, size_t count)>;

    virtual ~AudioDevice() = default;

    /**
     * @brief Acquire the microphone and start delivering blocks
     * @return DeviceError when the device is missing or access is denied
     */
    virtual Result<void> open_capture(CaptureCallback callback) = 0;

    /// Native rate of the opened capture stream (Hz)
    virtual int capture_sample_rate() const = 0;

    virtual Result<void> open_playback(int sample_rate, RenderCallback callback) = 0;

    /// Stop and release both streams. Safe to call repeatedly.
    virtual void close() = 0;
};

} // namespace voxlink
