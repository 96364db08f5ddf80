/**
 * Configuration loading: defaults, JSON sections, environment overrides,
 * system instruction files and path helpers.
 *
 * Run from build dir: ./test_config
 */

#include "config.h"
#include "path_utils.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace voxlink;
namespace fs = std::filesystem;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static void clear_environment() {
    unsetenv("API_KEY");
    unsetenv("HK_DB_URL");
    unsetenv("HK_DB_USER");
    unsetenv("HK_DB_PASS");
}

static void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

static void test_defaults(const fs::path& dir) {
    Config cfg = Config::load_from_file((dir / "does_not_exist.json").string());
    ASSERT(cfg.audio.capture_wire_rate == 16000);
    ASSERT(cfg.audio.playback_wire_rate == 24000);
    ASSERT(cfg.live.api_key.empty());
    ASSERT(cfg.live.voice_name == "Charon");
    ASSERT(cfg.memory_store.search_limit == 5);
    ASSERT(cfg.session.log_capacity == 50);
    ASSERT(cfg.session.thinking_prompts.empty());
    ASSERT(!cfg.recording.start_phrases.empty());
    ASSERT(cfg.effects.enabled);
    ASSERT(cfg.classifier.timeout_ms > 0);
}

static void test_load_sections(const fs::path& dir) {
    fs::path file = dir / "config.json";
    write_file(file, R"({
        "audio": {"input_sample_rate": 44100, "capture_frame_samples": 2048},
        "effects": {"enabled": false, "feedback": 0.5},
        "live": {"api_key": "live-key", "model": "models/custom", "voice_name": "Puck",
                 "system_instruction": "Inline persona"},
        "classifier": {"model": "gemini-lite", "timeout_ms": 5000},
        "memory_store": {"url": "wss://db.example:9443/ws", "partition": "p1", "search_limit": 3},
        "recording": {"start_phrases": ["go dictate"], "stop_phrases": ["done dictating", 7]},
        "session": {"log_capacity": 20, "thinking_prompts": ["[SYSTEM: Hm.]"]},
        "log": {"level": "debug"}
    })");

    Config cfg = Config::load_from_file(file.string());
    ASSERT(cfg.audio.input_sample_rate == 44100);
    ASSERT(cfg.audio.capture_frame_samples == 2048);
    ASSERT(cfg.audio.capture_wire_rate == 16000);  // untouched keys keep defaults
    ASSERT(!cfg.effects.enabled);
    ASSERT(cfg.effects.feedback == 0.5f);
    ASSERT(cfg.live.api_key == "live-key");
    ASSERT(cfg.live.model == "models/custom");
    ASSERT(cfg.live.voice_name == "Puck");
    ASSERT(cfg.live.system_instruction == "Inline persona");
    ASSERT(cfg.classifier.model == "gemini-lite");
    ASSERT(cfg.classifier.api_key.empty());
    ASSERT(cfg.memory_store.url == "wss://db.example:9443/ws");
    ASSERT(cfg.memory_store.partition == "p1");
    ASSERT(cfg.memory_store.search_limit == 3);
    ASSERT(cfg.recording.start_phrases.size() == 1 && cfg.recording.start_phrases[0] == "go dictate");
    ASSERT(cfg.recording.stop_phrases.size() == 1);
    ASSERT(cfg.session.log_capacity == 20);
    ASSERT(cfg.session.thinking_prompts.size() == 1);
    ASSERT(cfg.log_level == "debug");
}

static void test_environment_overrides(const fs::path& dir) {
    fs::path file = dir / "env.json";
    write_file(file, R"({"live": {"api_key": "from-file"}, "memory_store": {"login": "file-user"}})");

    setenv("API_KEY", "from-env", 1);
    setenv("HK_DB_URL", "wss://env.example/ws", 1);
    setenv("HK_DB_USER", "env-user", 1);
    setenv("HK_DB_PASS", "env-pass", 1);

    Config cfg = Config::load_from_file(file.string());
    ASSERT(cfg.live.api_key == "from-file");        // explicit key wins
    ASSERT(cfg.classifier.api_key == "from-env");   // empty key takes API_KEY
    ASSERT(cfg.memory_store.url == "wss://env.example/ws");
    ASSERT(cfg.memory_store.login == "env-user");
    ASSERT(cfg.memory_store.password == "env-pass");

    Config missing = Config::load_from_file((dir / "nope.json").string());
    ASSERT(missing.live.api_key == "from-env");

    clear_environment();
}

static void test_malformed_file(const fs::path& dir) {
    fs::path file = dir / "broken.json";
    write_file(file, R"({"live": {"voice_name": "Puck",)");
    Config cfg = Config::load_from_file(file.string());
    ASSERT(cfg.live.voice_name == "Charon");

    // Wrong value types are treated as malformed too
    write_file(file, R"({"audio": {"input_sample_rate": "fast"}})");
    cfg = Config::load_from_file(file.string());
    ASSERT(cfg.audio.input_sample_rate == 0);
}

static void test_system_instruction_file(const fs::path& dir) {
    fs::create_directories(dir / "prompts");
    write_file(dir / "prompts" / "persona.txt", "Persona from file.\nSecond line.");

    fs::path file = dir / "with_prompt.json";
    write_file(file, R"({"live": {"system_instruction": "inline", "system_instruction_file": "prompts/persona.txt"}})");
    Config cfg = Config::load_from_file(file.string());
    ASSERT(cfg.live.system_instruction == "Persona from file.\nSecond line.");

    // Unreadable file keeps the inline instruction
    write_file(file, R"({"live": {"system_instruction": "inline", "system_instruction_file": "prompts/missing.txt"}})");
    cfg = Config::load_from_file(file.string());
    ASSERT(cfg.live.system_instruction == "inline");
}

static void test_save_round_trip(const fs::path& dir) {
    Config cfg;
    cfg.live.api_key = "secret";
    cfg.memory_store.password = "hunter2";
    cfg.live.voice_name = "Kore";
    cfg.recording.stop_phrases = {"over and out"};

    fs::path file = dir / "saved.json";
    cfg.save_to_file(file.string());

    std::ifstream in(file);
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    ASSERT(text.find("secret") == std::string::npos);
    ASSERT(text.find("hunter2") == std::string::npos);

    Config loaded = Config::load_from_file(file.string());
    ASSERT(loaded.live.voice_name == "Kore");
    ASSERT(loaded.recording.stop_phrases.size() == 1);
    ASSERT(loaded.live.api_key.empty());
}

static void test_path_helpers() {
    setenv("HOME", "/home/tester", 1);
    ASSERT(expand_path("~") == "/home/tester");
    ASSERT(expand_path("~/logs/a.log") == "/home/tester/logs/a.log");
    ASSERT(expand_path("~other/x") == "~other/x");
    ASSERT(expand_path("") == "");

    ASSERT(resolve_relative_to("p.txt", "/etc/voxlink/config.json") == "/etc/voxlink/p.txt");
    ASSERT(resolve_relative_to("/abs/p.txt", "/etc/voxlink/config.json") == "/abs/p.txt");
    ASSERT(resolve_relative_to("p.txt", "config.json") == "p.txt");

    ASSERT(read_text_file("/nonexistent/voxlink/file.txt").is_error());

    ASSERT(!executable_dir().empty());
    ASSERT(locate_config_file("no/such/voxlink.json") == "no/such/voxlink.json");
}

static void test_locate_config_in_cwd(const fs::path& dir) {
    fs::path previous = fs::current_path();
    fs::create_directories(dir / "config");
    write_file(dir / "config" / "config.json", "{}");
    fs::current_path(dir);
    ASSERT(locate_config_file("config/config.json") == "config/config.json");
    fs::current_path(previous);
}

int main() {
    clear_environment();

    fs::path dir = fs::temp_directory_path() / ("voxlink_config_test_" + std::to_string(::getpid()));
    fs::create_directories(dir);

    test_defaults(dir);
    test_load_sections(dir);
    test_environment_overrides(dir);
    test_malformed_file(dir);
    test_system_instruction_file(dir);
    test_save_round_trip(dir);
    test_path_helpers();
    test_locate_config_in_cwd(dir);

    std::error_code ec;
    fs::remove_all(dir, ec);

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All config tests passed.\n";
    return 0;
}
