#include "audio/playback_scheduler.h"
#include <algorithm>

namespace voxlink {

PlaybackScheduler::PlaybackScheduler(int sample_rate)
    : sample_rate_(sample_rate > 0 ? sample_rate : PLAYBACK_WIRE_RATE) {}

PlaybackHandle PlaybackScheduler::schedule(FloatBuffer samples) {
    std::lock_guard<std::mutex> lock(mutex_);

    int64_t start = std::max(cursor_frames_, clock_frames_);
    int64_t length = static_cast<int64_t>(samples.size());

    PlaybackHandle handle;
    handle.id = next_id_++;
    handle.start = static_cast<double>(start) / sample_rate_;
    handle.duration = static_cast<double>(length) / sample_rate_;

    cursor_frames_ = start + length;
    if (length > 0) {
        active_.push_back(Scheduled{handle.id, start, std::move(samples)});
    }
    return handle;
}

void PlaybackScheduler::stop_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.clear();
    cursor_frames_ = 0;
}

void PlaybackScheduler::render(float* out, size_t frames) {
    std::fill(out, out + frames, 0.0f);

    std::lock_guard<std::mutex> lock(mutex_);
    const int64_t block_start = clock_frames_;
    const int64_t block_end = block_start + static_cast<int64_t>(frames);

    for (auto it = active_.begin(); it != active_.end();) {
        const int64_t buf_end = it->start_frame + static_cast<int64_t>(it->samples.size());
        const int64_t from = std::max(block_start, it->start_frame);
        const int64_t to = std::min(block_end, buf_end);
        for (int64_t t = from; t < to; ++t) {
            out[t - block_start] += it->samples[static_cast<size_t>(t - it->start_frame)];
        }
        if (buf_end <= block_end) {
            it = active_.erase(it);
        } else {
            ++it;
        }
    }
    clock_frames_ = block_end;
}

double PlaybackScheduler::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<double>(clock_frames_) / sample_rate_;
}

double PlaybackScheduler::cursor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<double>(cursor_frames_) / sample_rate_;
}

size_t PlaybackScheduler::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

bool PlaybackScheduler::is_active(uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(active_.begin(), active_.end(),
                       [id](const Scheduled& s) { return s.id == id; });
}

} // namespace voxlink
