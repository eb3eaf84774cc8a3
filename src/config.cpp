#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include "utils.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

/// Apply JSON sections onto cfg. Unknown keys are ignored; wrong types throw json::exception.
void apply_json_to_config(duplex_voice::Config& cfg, const json& j) {
    // Audio config
    if (j.contains("audio")) {
        auto& a = j["audio"];
        if (a.contains("input_device")) cfg.audio.input_device = a["input_device"].get<std::string>();
        if (a.contains("output_device")) cfg.audio.output_device = a["output_device"].get<std::string>();
        if (a.contains("input_sample_rate")) cfg.audio.input_sample_rate = a["input_sample_rate"];
        if (a.contains("output_sample_rate")) cfg.audio.output_sample_rate = a["output_sample_rate"];
        if (a.contains("frame_samples")) cfg.audio.frame_samples = a["frame_samples"];
    }

    // Transport config
    if (j.contains("transport")) {
        auto& t = j["transport"];
        if (t.contains("endpoint")) cfg.transport.endpoint = t["endpoint"].get<std::string>();
        if (t.contains("protocol")) cfg.transport.protocol = t["protocol"].get<std::string>();
        if (t.contains("model")) cfg.transport.model = t["model"].get<std::string>();
        if (t.contains("voice_id")) cfg.transport.voice_id = t["voice_id"].get<std::string>();
        if (t.contains("api_key")) cfg.transport.api_key = t["api_key"].get<std::string>();
        if (t.contains("api_key_file")) cfg.transport.api_key_file = t["api_key_file"].get<std::string>();
        if (t.contains("connect_timeout_ms")) cfg.transport.connect_timeout_ms = t["connect_timeout_ms"];
        if (t.contains("handshake_timeout_ms")) cfg.transport.handshake_timeout_ms = t["handshake_timeout_ms"];
        if (t.contains("send_queue_frames")) cfg.transport.send_queue_frames = t["send_queue_frames"];
        if (t.contains("input_transcription")) cfg.transport.input_transcription = t["input_transcription"];
        if (t.contains("output_transcription")) cfg.transport.output_transcription = t["output_transcription"];
    }

    // Session config
    if (j.contains("session")) {
        auto& s = j["session"];
        if (s.contains("event_queue_size")) cfg.session.event_queue_size = s["event_queue_size"];
        if (s.contains("playback_queue_size")) cfg.session.playback_queue_size = s["playback_queue_size"];
        if (s.contains("default_instruction"))
            cfg.session.default_instruction = s["default_instruction"].get<std::string>();
    }

    // Logging config
    if (j.contains("logging")) {
        auto& l = j["logging"];
        if (l.contains("level")) cfg.logging.level = l["level"].get<std::string>();
        if (l.contains("file")) cfg.logging.file = l["file"].get<std::string>();
    }
}

/// Resolve api_key from api_key_file when the key itself is not inline.
duplex_voice::Result<void> resolve_api_key(duplex_voice::Config& cfg) {
    if (!cfg.transport.api_key.empty() || cfg.transport.api_key_file.empty()) {
        return {};
    }
    std::string key_path = duplex_voice::expand_path(cfg.transport.api_key_file);
    std::ifstream kf(key_path);
    if (!kf.is_open()) {
        return duplex_voice::make_config_error("could not open api_key_file " + key_path);
    }
    std::stringstream buffer;
    buffer << kf.rdbuf();
    std::string key = buffer.str();
    cfg.transport.api_key = duplex_voice::utils::trim(key);
    return {};
}

} // anonymous namespace

namespace duplex_voice {

Result<Config> Config::load_from_string(const std::string& json_text) {
    Config cfg;
    try {
        json j = json::parse(json_text);
        if (!j.is_object()) {
            return make_config_error("top-level JSON value must be an object");
        }
        apply_json_to_config(cfg, j);
    } catch (const json::exception& e) {
        return make_config_error("Error parsing config: " + std::string(e.what()));
    }

    auto key = resolve_api_key(cfg);
    if (key.is_error()) {
        return key.error();
    }
    if (!cfg.logging.file.empty()) {
        cfg.logging.file = expand_path(cfg.logging.file);
    }
    return cfg;
}

Result<Config> Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_config_error("could not open config file " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = load_from_string(buffer.str());
    if (result.is_ok()) {
        Logger::info("Loaded config from " + path);
    }
    return result;
}

Result<void> Config::validate() const {
    if (audio.input_sample_rate <= 0 || audio.output_sample_rate <= 0) {
        return make_config_error("sample rates must be positive");
    }
    if (audio.frame_samples <= 0) {
        return make_config_error("audio.frame_samples must be positive");
    }
    if (transport.endpoint.empty()) {
        return make_config_error("transport.endpoint is required");
    }
    if (transport.protocol != "generic" && transport.protocol != "live_api") {
        return make_config_error("transport.protocol must be \"generic\" or \"live_api\", got \"" +
                                 transport.protocol + "\"");
    }
    if (transport.connect_timeout_ms <= 0 || transport.handshake_timeout_ms <= 0) {
        return make_config_error("transport timeouts must be positive");
    }
    if (transport.send_queue_frames <= 0 || session.event_queue_size <= 0 ||
        session.playback_queue_size <= 0) {
        return make_config_error("queue sizes must be positive");
    }
    return {};
}

void Config::save_to_file(const std::string& path) const {
    json j;

    j["audio"]["input_device"] = audio.input_device;
    j["audio"]["output_device"] = audio.output_device;
    j["audio"]["input_sample_rate"] = audio.input_sample_rate;
    j["audio"]["output_sample_rate"] = audio.output_sample_rate;
    j["audio"]["frame_samples"] = audio.frame_samples;

    // api_key is deliberately not written back
    j["transport"]["endpoint"] = transport.endpoint;
    j["transport"]["protocol"] = transport.protocol;
    j["transport"]["model"] = transport.model;
    j["transport"]["voice_id"] = transport.voice_id;
    j["transport"]["api_key_file"] = transport.api_key_file;
    j["transport"]["connect_timeout_ms"] = transport.connect_timeout_ms;
    j["transport"]["handshake_timeout_ms"] = transport.handshake_timeout_ms;
    j["transport"]["send_queue_frames"] = transport.send_queue_frames;
    j["transport"]["input_transcription"] = transport.input_transcription;
    j["transport"]["output_transcription"] = transport.output_transcription;

    j["session"]["event_queue_size"] = session.event_queue_size;
    j["session"]["playback_queue_size"] = session.playback_queue_size;
    j["session"]["default_instruction"] = session.default_instruction;

    j["logging"]["level"] = logging.level;
    j["logging"]["file"] = logging.file;

    std::ofstream file(path);
    if (!file.is_open()) {
        Logger::error("Failed to open config file for writing: " + path);
        return;
    }
    file << j.dump(2);
}

} // namespace duplex_voice
