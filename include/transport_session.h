#pragma once

#include "common.h"
#include "config.h"
#include "errors.h"
#include "net/channel_interface.h"
#include "net/wire_protocol.h"
#include <functional>
#include <memory>
#include <string>

namespace duplex_voice {

/**
 * @brief Consumers of inbound traffic
 *
 * All callbacks run on the receive thread, in arrival order. They must only
 * hand work off (enqueue), never block.
 */
struct TransportHandlers {
    std::function<void(DecodedAudioBuffer buffer)> on_audio;
    std::function<void(const TranscriptFragment& fragment)> on_transcript;
    std::function<void()> on_interrupted;
    /// Called at most once: drop, remote close or remote error. Not called after close().
    std::function<void(const Error& error)> on_failure;
};

/**
 * @brief What was negotiated by connect()
 */
struct ChannelInfo {
    std::string protocol;
    std::string voice_id;
    int64_t handshake_ms = 0;
};

/**
 * @brief Owns the duplex channel to the remote agent
 *
 * connect() performs the handshake synchronously. Afterwards a sender thread
 * drains the outbound frame queue in order and a receive thread classifies
 * each inbound message and dispatches it to the handlers.
 *
 * Errors from connect():
 * - NetworkError: cannot connect, or the channel dropped during the handshake
 * - AuthError: credentials refused (HTTP 401/403, close code 1008, auth error text)
 * - ProtocolError: handshake timeout or an unexpected/malformed reply
 */
class TransportSession {
public:
    TransportSession(std::unique_ptr<net::IChannel> channel,
                     std::unique_ptr<net::IMessageCodec> codec,
                     const TransportConfig& transport_config,
                     const AudioConfig& audio_config);
    ~TransportSession();

    TransportSession(const TransportSession&) = delete;
    TransportSession& operator=(const TransportSession&) = delete;

    /**
     * @brief Open the channel, send setup and wait for the ready acknowledgement
     * @param behavior_instruction Free-text instruction for the remote agent
     * @param voice_id Synthesized voice to use
     * @param handlers Inbound consumers; installed only on success
     */
    Result<ChannelInfo> connect(const std::string& behavior_instruction,
                                const std::string& voice_id,
                                TransportHandlers handlers);

    /**
     * @brief Queue a frame for sending. Never blocks.
     *
     * Dropped silently when not connected; dropped with a warning when the
     * send queue is full.
     */
    void send(AudioFrame frame);

    /**
     * @brief Stop both threads and release the channel. Idempotent, safe from any thread.
     */
    void close();

    bool is_connected() const;
    /// Whether the underlying channel handle is still held
    bool channel_open() const;
    uint64_t frames_sent() const;
    uint64_t frames_dropped() const;
    uint64_t decode_errors() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace duplex_voice
