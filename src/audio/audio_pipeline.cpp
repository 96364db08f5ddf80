#include "audio/audio_pipeline.h"
#include "audio/pcm_codec.h"
#include "logger.h"
#include <stdexcept>

namespace voxlink {

AudioPipeline::AudioPipeline(AudioDevice& device, const AudioConfig& audio, const EffectsConfig& effects)
    : device_(device),
      audio_config_(audio),
      scheduler_(audio.playback_wire_rate),
      effects_(effects, audio.playback_wire_rate) {}

AudioPipeline::~AudioPipeline() {
    stop();
}

Result<void> AudioPipeline::start(FrameSink sink) {
    if (running_) {
        return Result<void>();
    }
    sink_ = std::move(sink);
    effects_.reset();

    auto captured = device_.open_capture([this](const float* samples, size_t count, int sample_rate) {
        handle_capture(samples, count, sample_rate);
    });
    if (!captured) {
        sink_ = nullptr;
        return captured.error();
    }

    int capture_rate = device_.capture_sample_rate();
    if (capture_rate < audio_config_.capture_wire_rate) {
        device_.close();
        sink_ = nullptr;
        return make_device_error("Capture rate " + std::to_string(capture_rate) +
                                 " Hz is below the wire rate " +
                                 std::to_string(audio_config_.capture_wire_rate) + " Hz");
    }

    auto playback = device_.open_playback(audio_config_.playback_wire_rate,
                                          [this](float* out, size_t count) { render(out, count); });
    if (!playback) {
        device_.close();
        sink_ = nullptr;
        return playback.error();
    }

    running_ = true;
    LOG_AUDIO("Pipeline started: capture " + std::to_string(capture_rate) + " Hz -> " +
              std::to_string(audio_config_.capture_wire_rate) + " Hz, playback " +
              std::to_string(audio_config_.playback_wire_rate) + " Hz");
    return Result<void>();
}

void AudioPipeline::stop() {
    // Device first so no callback observes a cleared sink
    device_.close();
    running_ = false;
    sink_ = nullptr;
    scheduler_.stop_all();
    volume_ = 0.0f;
}

void AudioPipeline::handle_capture(const float* samples, size_t count, int sample_rate) {
    float rms = pcm::compute_rms(samples, count);
    volume_ = rms;
    LOG_AUDIO("Capture block: " + std::to_string(count) + " samples @ " +
              std::to_string(sample_rate) + " Hz, rms " + std::to_string(rms));

    // start() rejects such a stream and closes the device
    if (!sink_ || sample_rate < audio_config_.capture_wire_rate) return;

    try {
        FloatBuffer wire = pcm::downsample(samples, count, sample_rate, audio_config_.capture_wire_rate);
        sink_(pcm::float_to_pcm16(wire.data(), wire.size()));
    } catch (const std::invalid_argument& e) {
        Logger::error(std::string("Capture frame dropped: ") + e.what());
    }
}

void AudioPipeline::render(float* out, size_t count) {
    scheduler_.render(out, count);
    effects_.process(out, count);
}

bool AudioPipeline::play_chunk(const std::string& pcm_bytes) {
    auto pcm = pcm::bytes_to_pcm16(pcm_bytes);
    if (!pcm) {
        Logger::warn("Audio chunk dropped: " + pcm.error().message);
        return false;
    }
    if (pcm.value().empty()) return false;
    scheduler_.schedule(pcm::pcm16_to_float(pcm.value()));
    return true;
}

void AudioPipeline::interrupt() {
    scheduler_.stop_all();
    LOG_AUDIO("Playback interrupted");
}

} // namespace voxlink
