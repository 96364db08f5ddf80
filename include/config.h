#pragma once

#include "common.h"
#include <string>
#include <cstdint>
#include <vector>

namespace voxlink {

struct AudioConfig {
    std::string input_device = "default";
    std::string output_device = "default";
    /// Capture device rate; 0 = device default. Downsampled to the wire rate when different.
    int input_sample_rate = 0;
    int capture_frame_samples = DEFAULT_CAPTURE_FRAME;
    /// Wire rate of outbound PCM (fixed by the speech service)
    int capture_wire_rate = CAPTURE_WIRE_RATE;
    /// Wire rate of inbound model audio; the playback device is opened at this rate
    int playback_wire_rate = PLAYBACK_WIRE_RATE;
};

/// Voice effect graph: high-pass -> (dry | feedback delay) -> compressor
struct EffectsConfig {
    bool enabled = true;
    float highpass_hz = 150.0f;
    float delay_ms = 12.0f;
    float feedback = 0.75f;
    float dry_gain = 0.7f;
    float wet_gain = 0.5f;
    float compressor_threshold_db = -24.0f;
    float compressor_knee_db = 30.0f;
    float compressor_ratio = 12.0f;
    float compressor_attack_ms = 3.0f;
    float compressor_release_ms = 250.0f;
};

/// Remote real-time speech channel (Gemini Live)
struct LiveConfig {
    std::string endpoint = "wss://generativelanguage.googleapis.com/ws/"
                           "google.ai.generativelanguage.v1beta.GenerativeService.BidiGenerateContent";
    std::string api_key;
    std::string model = "gemini-2.5-flash-native-audio-preview-09-2025";
    std::string voice_name = "Charon";
    std::string system_instruction;
    /// When set, system_instruction is read from this file (relative to the config file)
    std::string system_instruction_file;
};

/// Intent classifier / tag extractor (Gemini generateContent over HTTPS)
struct ClassifierConfig {
    std::string endpoint = "https://generativelanguage.googleapis.com/v1beta";
    std::string api_key;
    std::string model = "gemini-2.5-flash";
    int timeout_ms = 15000;
    int connect_timeout_ms = 3000;
};

struct MemoryStoreConfig {
    std::string url = "wss://localhost:8443/ws";
    std::string login = "admin";
    std::string password;
    std::string partition = "hk47";
    size_t search_limit = SEARCH_RESULT_CAP;
};

/// Spoken phrases that open and close a dictation (recording) span
struct RecordingConfig {
    std::vector<std::string> start_phrases = {"begin recording", "start recording"};
    std::vector<std::string> stop_phrases = {"end recording", "stop recording"};
};

struct SessionConfig {
    size_t log_capacity = SESSION_LOG_CAPACITY;
    /// Filler phrases sent while augmentation runs; empty = built-in set
    std::vector<std::string> thinking_prompts;
};

struct Config {
    AudioConfig audio;
    EffectsConfig effects;
    LiveConfig live;
    ClassifierConfig classifier;
    MemoryStoreConfig memory_store;
    RecordingConfig recording;
    SessionConfig session;

    std::string log_level = "info";
    std::string log_file;

    /**
     * @brief Load JSON config; missing keys keep defaults. Environment overrides
     * (API_KEY, HK_DB_URL, HK_DB_USER, HK_DB_PASS) are applied afterwards.
     * Unreadable or malformed files log a warning and yield defaults.
     */
    static Config load_from_file(const std::string& path);

    /// Apply environment overrides only
    void apply_environment();

    void save_to_file(const std::string& path) const;
};

} // namespace voxlink
