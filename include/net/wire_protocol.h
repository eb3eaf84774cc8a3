#pragma once

/**
 * @file wire_protocol.h
 * @brief JSON message dialects spoken over the duplex channel
 *
 * A codec knows how to phrase the setup request and outbound audio, and how to
 * classify every inbound message. Two dialects:
 * - "generic":  {"type": ...} messages (setup/ready/audio_input/audio_output/transcript/closed/error)
 * - "live_api": the realtime bidirectional "live" API (setup/setupComplete/realtimeInput/serverContent)
 */

#include "common.h"
#include "config.h"
#include "errors.h"
#include <memory>
#include <string>
#include <vector>

namespace duplex_voice {
namespace net {

/**
 * @brief Everything the remote needs to start a conversation
 */
struct SetupRequest {
    std::string behavior_instruction;
    std::string voice_id = DEFAULT_VOICE_ID;
    std::string model;
    int input_sample_rate = DEFAULT_INPUT_SAMPLE_RATE;
    bool input_transcription = true;
    bool output_transcription = true;
};

enum class InboundKind {
    Ready,         ///< Setup acknowledged
    Audio,         ///< audio_base64 holds one PCM16 LE chunk
    Transcript,    ///< fragment holds a transcript delta
    Interrupted,   ///< Remote stopped speaking mid-turn; unplayed audio is stale
    Closed,        ///< Remote ended the session
    Error          ///< Remote reported an error; message holds the text
};

struct InboundEvent {
    InboundKind kind = InboundKind::Ready;
    std::string audio_base64;
    TranscriptFragment fragment;
    std::string message;
};

class IMessageCodec {
public:
    virtual ~IMessageCodec() = default;

    virtual std::string name() const = 0;

    /// URL to connect to, with credentials applied where the dialect expects them
    virtual std::string connect_url(const TransportConfig& config) const = 0;

    /// Extra upgrade headers
    virtual std::vector<std::string> connect_headers(const TransportConfig& config) const = 0;

    virtual std::string encode_setup(const SetupRequest& request) const = 0;

    virtual std::string encode_audio(const AudioFrame& frame) const = 0;

    /**
     * @brief Classify one inbound message
     * @return Events in document order (possibly none for messages we ignore),
     *         or ProtocolError if the message is not valid JSON
     */
    virtual Result<std::vector<InboundEvent>> decode(const std::string& message) const = 0;
};

/**
 * @brief Create the codec for a `transport.protocol` value
 * @return nullptr for an unknown dialect name
 */
std::unique_ptr<IMessageCodec> make_message_codec(const std::string& protocol);

/// True if a remote error text looks like a credential problem
bool is_auth_message(const std::string& message);

} // namespace net
} // namespace duplex_voice
