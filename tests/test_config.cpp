/**
 * Config loading: defaults, partial documents, api_key_file, validation.
 */

#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>

using namespace duplex_voice;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- Defaults ---
    Config defaults;
    ASSERT(defaults.audio.input_sample_rate == 16000);
    ASSERT(defaults.audio.output_sample_rate == 24000);
    ASSERT(defaults.audio.frame_samples == 4096);
    ASSERT(defaults.transport.protocol == "live_api");
    ASSERT(defaults.transport.voice_id == "Kore");
    ASSERT(defaults.validate().is_ok());

    // --- Partial document keeps the rest ---
    auto partial = Config::load_from_string(R"({
        "transport": {"protocol": "generic", "endpoint": "ws://localhost:9000/voice", "voice_id": "Puck"},
        "session": {"event_queue_size": 32},
        "unknown_section": {"ignored": true}
    })");
    ASSERT(partial.is_ok());
    if (partial.is_ok()) {
        const Config& c = partial.value();
        ASSERT(c.transport.protocol == "generic");
        ASSERT(c.transport.endpoint == "ws://localhost:9000/voice");
        ASSERT(c.transport.voice_id == "Puck");
        ASSERT(c.session.event_queue_size == 32);
        ASSERT(c.session.playback_queue_size == 64);
        ASSERT(c.audio.frame_samples == 4096);
        ASSERT(c.validate().is_ok());
    }

    // --- Parse and type errors ---
    auto broken = Config::load_from_string("{ \"audio\": ");
    ASSERT(broken.is_error() && broken.error().type == ErrorType::ConfigError);
    auto wrong_type = Config::load_from_string(R"({"audio": {"frame_samples": "lots"}})");
    ASSERT(wrong_type.is_error() && wrong_type.error().type == ErrorType::ConfigError);
    auto not_object = Config::load_from_string("[1, 2, 3]");
    ASSERT(not_object.is_error());
    auto missing = Config::load_from_file("/nonexistent/duplex_voice/config.json");
    ASSERT(missing.is_error() && missing.error().type == ErrorType::ConfigError);

    // --- Validation ---
    {
        Config c;
        c.transport.protocol = "smoke-signals";
        ASSERT(c.validate().is_error());
    }
    {
        Config c;
        c.audio.frame_samples = 0;
        ASSERT(c.validate().is_error());
    }
    {
        Config c;
        c.transport.endpoint.clear();
        ASSERT(c.validate().is_error());
    }
    {
        Config c;
        c.transport.handshake_timeout_ms = -1;
        ASSERT(c.validate().is_error());
    }
    {
        Config c;
        c.session.event_queue_size = 0;
        ASSERT(c.validate().is_error() && c.validate().error().type == ErrorType::ConfigError);
    }

    // --- api_key_file is read and trimmed; inline key wins ---
    std::string key_path = "test_config_api_key.txt";
    {
        std::ofstream key_file(key_path);
        key_file << "  file-key-123\n";
    }
    auto from_file = Config::load_from_string(R"({"transport": {"api_key_file": "test_config_api_key.txt"}})");
    ASSERT(from_file.is_ok() && from_file.value().transport.api_key == "file-key-123");
    auto inline_key = Config::load_from_string(
        R"({"transport": {"api_key": "inline", "api_key_file": "test_config_api_key.txt"}})");
    ASSERT(inline_key.is_ok() && inline_key.value().transport.api_key == "inline");
    auto missing_key = Config::load_from_string(R"({"transport": {"api_key_file": "/nonexistent/key"}})");
    ASSERT(missing_key.is_error() && missing_key.error().type == ErrorType::ConfigError);

    // --- save/load keeps settings but never writes the key ---
    std::string saved_path = "test_config_saved.json";
    Config original;
    original.transport.api_key = "do-not-persist";
    original.transport.voice_id = "Charon";
    original.session.playback_queue_size = 12;
    original.save_to_file(saved_path);
    auto reloaded = Config::load_from_file(saved_path);
    ASSERT(reloaded.is_ok());
    if (reloaded.is_ok()) {
        ASSERT(reloaded.value().transport.voice_id == "Charon");
        ASSERT(reloaded.value().session.playback_queue_size == 12);
        ASSERT(reloaded.value().transport.api_key.empty());
    }
    std::remove(key_path.c_str());
    std::remove(saved_path.c_str());

    // --- ~ expansion ---
    const char* home = std::getenv("HOME");
    if (home) {
        ASSERT(expand_path("~/keys/live.txt") == std::string(home) + "/keys/live.txt");
    }
    ASSERT(expand_path("~other/file") == "~other/file");
    ASSERT(expand_path("/abs/path") == "/abs/path");
    ASSERT(expand_path("").empty());

    // --- Log level names ---
    ASSERT(Logger::parse_level("debug") == LogLevel::DEBUG);
    ASSERT(Logger::parse_level("WARN") == LogLevel::WARN);
    ASSERT(Logger::parse_level("nonsense") == LogLevel::INFO);

    // --- Levels and thread labels ---
    Logger::set_level(LogLevel::WARN);
    ASSERT(Logger::get_level() == LogLevel::WARN);
    Logger::set_thread_name("config-test");
    Logger::debug("filtered out");
    Logger::set_thread_name("");
    Logger::set_level(LogLevel::ERROR);
    ASSERT(Logger::get_level() == LogLevel::ERROR);

    Logger::shutdown();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All config tests passed.\n";
    return 0;
}
