#pragma once

#include "common.h"
#include "errors.h"
#include <string>
#include <cstdint>

namespace duplex_voice {

struct AudioConfig {
    std::string input_device = "default";   ///< "default", device index, or exact device name
    std::string output_device = "default";
    int input_sample_rate = DEFAULT_INPUT_SAMPLE_RATE;
    /// Rate of the remote's synthesized speech; the output stream is opened at this rate
    int output_sample_rate = DEFAULT_OUTPUT_SAMPLE_RATE;
    /// Samples per captured frame; sets the capture cadence (4096 @ 16 kHz = 256 ms)
    int frame_samples = DEFAULT_FRAME_SAMPLES;
};

struct TransportConfig {
    std::string endpoint = "wss://generativelanguage.googleapis.com/ws/"
                           "google.ai.generativelanguage.v1beta.GenerativeService.BidiGenerateContent";
    std::string protocol = "live_api";      ///< "generic" | "live_api"
    std::string model = "models/gemini-2.5-flash-native-audio-preview-12-2025";
    std::string voice_id = DEFAULT_VOICE_ID;
    std::string api_key;
    std::string api_key_file;               ///< Read when api_key is empty (~ expanded)
    int connect_timeout_ms = 10000;
    int handshake_timeout_ms = 10000;
    int send_queue_frames = 32;             ///< Outbound frames buffered before newest is dropped
    bool input_transcription = true;        ///< Ask the remote to transcribe the local speaker
    bool output_transcription = true;       ///< Ask the remote to transcribe its own speech
};

struct SessionConfig {
    int event_queue_size = 256;
    int playback_queue_size = 64;
    std::string default_instruction = "You are a friendly conversational partner. Keep replies short.";
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

struct Config {
    AudioConfig audio;
    TransportConfig transport;
    SessionConfig session;
    LoggingConfig logging;

    /**
     * @brief Load configuration from a JSON file; absent keys keep their defaults
     * @return Config, or ConfigError if the file cannot be read or parsed
     */
    static Result<Config> load_from_file(const std::string& path);

    /**
     * @brief Parse configuration from a JSON document
     */
    static Result<Config> load_from_string(const std::string& json_text);

    /**
     * @brief Check ranges and required fields
     */
    Result<void> validate() const;

    void save_to_file(const std::string& path) const;
};

} // namespace duplex_voice
