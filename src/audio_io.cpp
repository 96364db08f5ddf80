#include "audio_io.h"
#include "logger.h"
#include <portaudio.h>
#include <mutex>
#include <cstring>
#include <sstream>

namespace voxlink {

class AudioIO::Impl {
public:
    explicit Impl(const AudioConfig& config)
        : config_(config), initialized_(false), input_stream_(nullptr), output_stream_(nullptr),
          capture_rate_(0) {}

    ~Impl() {
        close();
    }

    Result<void> open_capture(CaptureCallback callback) {
        auto init = ensure_initialized();
        if (!init) return init;
        if (input_stream_) {
            return make_error(ErrorType::InvalidState, "Capture stream already open");
        }

        int input_idx = find_device(config_.input_device, true);
        if (input_idx < 0) {
            return make_device_error("Input device not found: " + config_.input_device);
        }
        const PaDeviceInfo* input_info = Pa_GetDeviceInfo(input_idx);
        if (!input_info || input_info->maxInputChannels == 0) {
            return make_device_error("Device '" + config_.input_device + "' reports no input channels");
        }

        capture_rate_ = config_.input_sample_rate > 0
                            ? config_.input_sample_rate
                            : static_cast<int>(input_info->defaultSampleRate);
        capture_callback_ = std::move(callback);

        PaStreamParameters input_params;
        input_params.device = input_idx;
        input_params.channelCount = 1;
        input_params.sampleFormat = paFloat32;
        input_params.suggestedLatency = input_info->defaultLowInputLatency;
        input_params.hostApiSpecificStreamInfo = nullptr;

        PaError err = Pa_OpenStream(&input_stream_, &input_params, nullptr, capture_rate_,
                                    static_cast<unsigned long>(config_.capture_frame_samples),
                                    paClipOff, capture_callback, this);
        if (err != paNoError) {
            input_stream_ = nullptr;
            return make_device_error("Failed to open input stream: " + std::string(Pa_GetErrorText(err)));
        }

        err = Pa_StartStream(input_stream_);
        if (err != paNoError) {
            std::ostringstream err_oss;
            err_oss << "Failed to start input stream: " << Pa_GetErrorText(err)
                    << " (Error code: " << err << ")";
            if (err == paUnanticipatedHostError) {
                err_oss << "; microphone access may be denied";
            }
            Pa_CloseStream(input_stream_);
            input_stream_ = nullptr;
            return make_device_error(err_oss.str());
        }

        std::ostringstream oss;
        oss << "Capture: [" << input_idx << "] " << input_info->name << " @ " << capture_rate_ << " Hz";
        LOG_AUDIO(oss.str());
        return Result<void>();
    }

    Result<void> open_playback(int sample_rate, RenderCallback callback) {
        auto init = ensure_initialized();
        if (!init) return init;
        if (output_stream_) {
            return make_error(ErrorType::InvalidState, "Playback stream already open");
        }

        int output_idx = find_device(config_.output_device, false);
        if (output_idx < 0) {
            return make_device_error("Output device not found: " + config_.output_device);
        }
        const PaDeviceInfo* output_info = Pa_GetDeviceInfo(output_idx);
        if (!output_info || output_info->maxOutputChannels == 0) {
            return make_device_error("Device '" + config_.output_device + "' reports no output channels");
        }

        render_callback_ = std::move(callback);

        PaStreamParameters output_params;
        output_params.device = output_idx;
        output_params.channelCount = 1;
        output_params.sampleFormat = paFloat32;
        output_params.suggestedLatency = output_info->defaultLowOutputLatency;
        output_params.hostApiSpecificStreamInfo = nullptr;

        PaError err = Pa_OpenStream(&output_stream_, nullptr, &output_params, sample_rate,
                                    paFramesPerBufferUnspecified, paClipOff, render_callback, this);
        if (err != paNoError) {
            output_stream_ = nullptr;
            return make_device_error("Failed to open output stream: " + std::string(Pa_GetErrorText(err)));
        }

        err = Pa_StartStream(output_stream_);
        if (err != paNoError) {
            Pa_CloseStream(output_stream_);
            output_stream_ = nullptr;
            return make_device_error("Failed to start output stream: " + std::string(Pa_GetErrorText(err)));
        }

        std::ostringstream oss;
        oss << "Playback: [" << output_idx << "] " << output_info->name << " @ " << sample_rate << " Hz";
        LOG_AUDIO(oss.str());
        return Result<void>();
    }

    int capture_sample_rate() const {
        return capture_rate_;
    }

    void close() {
        if (input_stream_) {
            Pa_StopStream(input_stream_);
            Pa_CloseStream(input_stream_);
            input_stream_ = nullptr;
        }
        if (output_stream_) {
            Pa_StopStream(output_stream_);
            Pa_CloseStream(output_stream_);
            output_stream_ = nullptr;
        }
        capture_callback_ = nullptr;
        render_callback_ = nullptr;

        if (initialized_) {
            Pa_Terminate();
            initialized_ = false;
        }
    }

    static void list_devices() {
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
            return;
        }

        int num_devices = Pa_GetDeviceCount();
        Logger::info("Available audio devices:");

        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            std::ostringstream oss;
            oss << "  [" << i << "] " << info->name;
            if (info->maxInputChannels > 0) oss << " (IN:" << info->maxInputChannels << ")";
            if (info->maxOutputChannels > 0) oss << " (OUT:" << info->maxOutputChannels << ")";
            if (info->maxInputChannels == 0 && info->maxOutputChannels == 0) oss << " (no I/O)";
            oss << " " << static_cast<int>(info->defaultSampleRate) << " Hz";
            Logger::info(oss.str());
        }

        Pa_Terminate();
    }

private:
    Result<void> ensure_initialized() {
        if (initialized_) return Result<void>();
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            return make_device_error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
        }
        initialized_ = true;
        return Result<void>();
    }

    int find_device(const std::string& name, bool is_input) {
        int num_devices = Pa_GetDeviceCount();

        // Try default device first (most common case)
        if (name == "default" || name.empty()) {
            int default_idx = is_input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice();
            if (default_idx != paNoDevice) {
                const PaDeviceInfo* info = Pa_GetDeviceInfo(default_idx);
                std::ostringstream oss;
                oss << "Using default " << (is_input ? "input" : "output")
                    << " device: [" << default_idx << "] " << info->name;
                Logger::debug(oss.str());
                return default_idx;
            }
            return -1;
        }

        // Try parsing as numeric device index
        try {
            size_t consumed = 0;
            int device_idx = std::stoi(name, &consumed);
            if (consumed == name.size() && device_idx >= 0 && device_idx < num_devices) {
                return device_idx;
            }
        } catch (const std::exception&) {
            // Not a number, continue to name matching
        }

        // Exact name match, then substring match
        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (info && info->name == name && has_direction(info, is_input)) {
                return i;
            }
        }
        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (info && std::strstr(info->name, name.c_str()) && has_direction(info, is_input)) {
                return i;
            }
        }

        return -1;
    }

    static bool has_direction(const PaDeviceInfo* info, bool is_input) {
        return is_input ? info->maxInputChannels > 0 : info->maxOutputChannels > 0;
    }

    static int capture_callback(const void* input, void* output,
                                unsigned long frame_count,
                                const PaStreamCallbackTimeInfo* time_info,
                                PaStreamCallbackFlags status_flags,
                                void* user_data) {
        (void)output;
        (void)time_info;
        (void)status_flags;
        Impl* self = static_cast<Impl*>(user_data);
        if (input && self->capture_callback_) {
            self->capture_callback_(static_cast<const float*>(input), frame_count, self->capture_rate_);
        }
        return paContinue;
    }

    static int render_callback(const void* input, void* output,
                               unsigned long frame_count,
                               const PaStreamCallbackTimeInfo* time_info,
                               PaStreamCallbackFlags status_flags,
                               void* user_data) {
        (void)input;
        (void)time_info;
        (void)status_flags;
        Impl* self = static_cast<Impl*>(user_data);
        float* out = static_cast<float*>(output);
        if (self->render_callback_) {
            self->render_callback_(out, frame_count);
        } else {
            std::memset(out, 0, frame_count * sizeof(float));
        }
        return paContinue;
    }

    AudioConfig config_;
    bool initialized_;
    PaStream* input_stream_;
    PaStream* output_stream_;
    int capture_rate_;
    CaptureCallback capture_callback_;
    RenderCallback render_callback_;
};

AudioIO::AudioIO(const AudioConfig& config) : pimpl_(std::make_unique<Impl>(config)) {}

AudioIO::~AudioIO() = default;

Result<void> AudioIO::open_capture(CaptureCallback callback) {
    return pimpl_->open_capture(std::move(callback));
}

int AudioIO::capture_sample_rate() const {
    return pimpl_->capture_sample_rate();
}

Result<void> AudioIO::open_playback(int sample_rate, RenderCallback callback) {
    return pimpl_->open_playback(sample_rate, std::move(callback));
}

void AudioIO::close() {
    pimpl_->close();
}

void AudioIO::list_devices() {
    Impl::list_devices();
}

} // namespace voxlink
