#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

void read_string_list(const json& j, const char* key, std::vector<std::string>& out) {
    if (!j.contains(key) || !j[key].is_array()) return;
    out.clear();
    for (const auto& item : j[key]) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
}

/// Apply full JSON config (all sections) into cfg
void apply_json_to_config(voxlink::Config& cfg, const json& j) {
    // Audio config
    if (j.contains("audio")) {
        auto& a = j["audio"];
        if (a.contains("input_device")) cfg.audio.input_device = a["input_device"];
        if (a.contains("output_device")) cfg.audio.output_device = a["output_device"];
        if (a.contains("input_sample_rate")) cfg.audio.input_sample_rate = a["input_sample_rate"];
        if (a.contains("capture_frame_samples")) cfg.audio.capture_frame_samples = a["capture_frame_samples"];
        if (a.contains("capture_wire_rate")) cfg.audio.capture_wire_rate = a["capture_wire_rate"];
        if (a.contains("playback_wire_rate")) cfg.audio.playback_wire_rate = a["playback_wire_rate"];
    }

    // Voice effect chain
    if (j.contains("effects")) {
        auto& e = j["effects"];
        if (e.contains("enabled")) cfg.effects.enabled = e["enabled"];
        if (e.contains("highpass_hz")) cfg.effects.highpass_hz = e["highpass_hz"];
        if (e.contains("delay_ms")) cfg.effects.delay_ms = e["delay_ms"];
        if (e.contains("feedback")) cfg.effects.feedback = e["feedback"];
        if (e.contains("dry_gain")) cfg.effects.dry_gain = e["dry_gain"];
        if (e.contains("wet_gain")) cfg.effects.wet_gain = e["wet_gain"];
        if (e.contains("compressor_threshold_db")) cfg.effects.compressor_threshold_db = e["compressor_threshold_db"];
        if (e.contains("compressor_knee_db")) cfg.effects.compressor_knee_db = e["compressor_knee_db"];
        if (e.contains("compressor_ratio")) cfg.effects.compressor_ratio = e["compressor_ratio"];
        if (e.contains("compressor_attack_ms")) cfg.effects.compressor_attack_ms = e["compressor_attack_ms"];
        if (e.contains("compressor_release_ms")) cfg.effects.compressor_release_ms = e["compressor_release_ms"];
    }

    // Live speech channel
    if (j.contains("live")) {
        auto& l = j["live"];
        if (l.contains("endpoint")) cfg.live.endpoint = l["endpoint"];
        if (l.contains("api_key")) cfg.live.api_key = l["api_key"];
        if (l.contains("model")) cfg.live.model = l["model"];
        if (l.contains("voice_name")) cfg.live.voice_name = l["voice_name"];
        if (l.contains("system_instruction")) cfg.live.system_instruction = l["system_instruction"];
        if (l.contains("system_instruction_file")) cfg.live.system_instruction_file = l["system_instruction_file"];
    }

    // Classifier
    if (j.contains("classifier")) {
        auto& c = j["classifier"];
        if (c.contains("endpoint")) cfg.classifier.endpoint = c["endpoint"];
        if (c.contains("api_key")) cfg.classifier.api_key = c["api_key"];
        if (c.contains("model")) cfg.classifier.model = c["model"];
        if (c.contains("timeout_ms")) cfg.classifier.timeout_ms = c["timeout_ms"];
        if (c.contains("connect_timeout_ms")) cfg.classifier.connect_timeout_ms = c["connect_timeout_ms"];
    }

    // Memory store
    if (j.contains("memory_store")) {
        auto& m = j["memory_store"];
        if (m.contains("url")) cfg.memory_store.url = m["url"];
        if (m.contains("login")) cfg.memory_store.login = m["login"];
        if (m.contains("password")) cfg.memory_store.password = m["password"];
        if (m.contains("partition")) cfg.memory_store.partition = m["partition"];
        if (m.contains("search_limit")) cfg.memory_store.search_limit = m["search_limit"];
    }

    // Recording protocol phrases
    if (j.contains("recording")) {
        auto& r = j["recording"];
        read_string_list(r, "start_phrases", cfg.recording.start_phrases);
        read_string_list(r, "stop_phrases", cfg.recording.stop_phrases);
    }

    if (j.contains("session")) {
        auto& s = j["session"];
        if (s.contains("log_capacity")) cfg.session.log_capacity = s["log_capacity"];
        read_string_list(s, "thinking_prompts", cfg.session.thinking_prompts);
    }

    if (j.contains("log")) {
        auto& lg = j["log"];
        if (lg.contains("level")) cfg.log_level = lg["level"];
        if (lg.contains("file")) cfg.log_file = lg["file"];
    }
}

} // namespace

namespace voxlink {

void Config::apply_environment() {
    if (const char* key = std::getenv("API_KEY")) {
        if (live.api_key.empty()) live.api_key = key;
        if (classifier.api_key.empty()) classifier.api_key = key;
    }
    if (const char* url = std::getenv("HK_DB_URL")) memory_store.url = url;
    if (const char* user = std::getenv("HK_DB_USER")) memory_store.login = user;
    if (const char* pass = std::getenv("HK_DB_PASS")) memory_store.password = pass;
}

Config Config::load_from_file(const std::string& path) {
    Config cfg;

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::warn("Could not open config file: " + path + ". Using defaults.");
        cfg.apply_environment();
        return cfg;
    }
    json j;
    try {
        file >> j;
        apply_json_to_config(cfg, j);
    } catch (const json::exception& e) {
        Logger::error("Error parsing config JSON: " + std::string(e.what()));
        Config defaults;
        defaults.apply_environment();
        return defaults;
    }

    if (!cfg.live.system_instruction_file.empty()) {
        std::string instruction_path = resolve_relative_to(cfg.live.system_instruction_file, path);
        auto text = read_text_file(instruction_path);
        if (text) {
            cfg.live.system_instruction = text.value();
        } else {
            Logger::warn("system_instruction_file: " + text.error().message + "; using inline system_instruction.");
        }
    }
    if (!cfg.log_file.empty()) cfg.log_file = expand_path(cfg.log_file);

    cfg.apply_environment();
    return cfg;
}

void Config::save_to_file(const std::string& path) const {
    json j;

    j["audio"]["input_device"] = audio.input_device;
    j["audio"]["output_device"] = audio.output_device;
    if (audio.input_sample_rate != 0) j["audio"]["input_sample_rate"] = audio.input_sample_rate;
    j["audio"]["capture_frame_samples"] = audio.capture_frame_samples;
    j["audio"]["capture_wire_rate"] = audio.capture_wire_rate;
    j["audio"]["playback_wire_rate"] = audio.playback_wire_rate;

    j["effects"]["enabled"] = effects.enabled;
    j["effects"]["highpass_hz"] = effects.highpass_hz;
    j["effects"]["delay_ms"] = effects.delay_ms;
    j["effects"]["feedback"] = effects.feedback;
    j["effects"]["dry_gain"] = effects.dry_gain;
    j["effects"]["wet_gain"] = effects.wet_gain;
    j["effects"]["compressor_threshold_db"] = effects.compressor_threshold_db;
    j["effects"]["compressor_knee_db"] = effects.compressor_knee_db;
    j["effects"]["compressor_ratio"] = effects.compressor_ratio;
    j["effects"]["compressor_attack_ms"] = effects.compressor_attack_ms;
    j["effects"]["compressor_release_ms"] = effects.compressor_release_ms;

    // Secrets (api keys, password) are never persisted
    j["live"]["endpoint"] = live.endpoint;
    j["live"]["model"] = live.model;
    j["live"]["voice_name"] = live.voice_name;
    if (!live.system_instruction_file.empty()) {
        j["live"]["system_instruction_file"] = live.system_instruction_file;
    } else {
        j["live"]["system_instruction"] = live.system_instruction;
    }

    j["classifier"]["endpoint"] = classifier.endpoint;
    j["classifier"]["model"] = classifier.model;
    j["classifier"]["timeout_ms"] = classifier.timeout_ms;
    j["classifier"]["connect_timeout_ms"] = classifier.connect_timeout_ms;

    j["memory_store"]["url"] = memory_store.url;
    j["memory_store"]["login"] = memory_store.login;
    j["memory_store"]["partition"] = memory_store.partition;
    j["memory_store"]["search_limit"] = memory_store.search_limit;

    j["recording"]["start_phrases"] = recording.start_phrases;
    j["recording"]["stop_phrases"] = recording.stop_phrases;

    j["session"]["log_capacity"] = session.log_capacity;
    if (!session.thinking_prompts.empty()) {
        j["session"]["thinking_prompts"] = session.thinking_prompts;
    }

    j["log"]["level"] = log_level;
    if (!log_file.empty()) j["log"]["file"] = log_file;

    std::ofstream file(path);
    if (file.is_open()) {
        file << j.dump(2);
    } else {
        Logger::error("Could not write config file: " + path);
    }
}

} // namespace voxlink
