#pragma once

#include "common.h"
#include <cstdint>
#include <list>
#include <mutex>

namespace voxlink {

struct PlaybackHandle {
    uint64_t id = 0;
    double start = 0.0;     ///< seconds on the playback clock
    double duration = 0.0;  ///< seconds
};

/**
 * @brief Gapless scheduler for decoded playback buffers
 *
 * The playback clock is the number of frames rendered so far divided by the
 * sample rate. Each buffer starts at max(cursor, now) and advances the cursor
 * by its duration, so consecutive buffers never gap or overlap. A buffer
 * leaves the active set exactly once: when render() plays its last frame, or
 * on stop_all().
 *
 * Thread Safety: schedule/stop_all run on the session thread and render() on
 * the audio thread; all state is guarded by one mutex.
 */
class PlaybackScheduler {
public:
    explicit PlaybackScheduler(int sample_rate);

    PlaybackHandle schedule(FloatBuffer samples);

    /// Stop and drop every active buffer, then reset the cursor to zero
    void stop_all();

    /// Mix active buffers into out (overwrites) and advance the clock
    void render(float* out, size_t frames);

    double now() const;
    double cursor() const;
    size_t active_count() const;
    bool is_active(uint64_t id) const;
    int sample_rate() const { return sample_rate_; }

private:
    struct Scheduled {
        uint64_t id;
        int64_t start_frame;
        FloatBuffer samples;
    };

    const int sample_rate_;
    mutable std::mutex mutex_;
    std::list<Scheduled> active_;
    int64_t clock_frames_ = 0;
    int64_t cursor_frames_ = 0;
    uint64_t next_id_ = 1;
};

} // namespace voxlink
