#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <memory>

namespace duplex_voice {

// Audio types
using Sample = int16_t;
using FloatSamples = std::vector<float>;

// Timing
using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

inline int64_t ms_since(TimePoint start) {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<Duration>(now - start).count();
}

// Audio format constants
constexpr int DEFAULT_INPUT_SAMPLE_RATE = 16000;
constexpr int DEFAULT_OUTPUT_SAMPLE_RATE = 24000;   // Remote synthesizes at a fixed 24 kHz
constexpr int DEFAULT_FRAME_SAMPLES = 4096;          // 256 ms @ 16kHz
constexpr int CHANNELS = 1;

// Wire constants
constexpr const char* INPUT_ENCODING = "pcm16@16kHz mono";
constexpr const char* DEFAULT_VOICE_ID = "Kore";

/**
 * @brief One captured block of microphone audio
 *
 * Produced by AudioCaptureStage once per device buffer; moved (never copied)
 * into the transport send queue.
 */
struct AudioFrame {
    std::vector<Sample> samples;
    int sample_rate = DEFAULT_INPUT_SAMPLE_RATE;
    int channels = CHANNELS;
    uint64_t sequence = 0;

    double duration_seconds() const {
        return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

/**
 * @brief Decoded remote speech, ready for scheduling
 */
struct DecodedAudioBuffer {
    FloatSamples samples;
    int sample_rate = DEFAULT_OUTPUT_SAMPLE_RATE;

    double duration_seconds() const {
        return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
    bool empty() const { return samples.empty(); }
};

enum class Speaker {
    Local,   ///< The person at the microphone
    Remote   ///< The conversational agent
};

struct TranscriptFragment {
    Speaker speaker = Speaker::Remote;
    std::string text;
    bool is_final = false;
};

enum class SessionState {
    Idle,
    Connecting,
    Connected,
    Disconnected,
    Error
};

inline const char* speaker_name(Speaker speaker) {
    return speaker == Speaker::Local ? "local" : "remote";
}

inline const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Connecting: return "connecting";
        case SessionState::Connected: return "connected";
        case SessionState::Disconnected: return "disconnected";
        case SessionState::Error: return "error";
    }
    return "unknown";
}

} // namespace duplex_voice
