#pragma once

#include "config.h"
#include "common.h"
#include "errors.h"
#include "session_backend.h"
#include "session_events.h"
#include <chrono>
#include <memory>
#include <string>

namespace duplex_voice {

/**
 * @brief Which handles the current session instance holds
 */
struct SessionResources {
    bool microphone_open = false;
    bool capture_running = false;
    bool output_open = false;
    bool playback_running = false;
    bool channel_open = false;

    bool any() const {
        return microphone_open || capture_running || output_open || playback_running || channel_open;
    }
};

/**
 * @brief Duplex voice session: the public contract
 *
 * Manages the complete session lifecycle:
 * - connect(): microphone, output device, transport handshake, capture
 * - Relaying level, transcript and status events through one ordered queue
 * - Teardown on disconnect() or on any asynchronous failure
 *
 * One session at a time. A finished (Disconnected or Error) instance is
 * discarded by the next connect().
 */
class SessionController {
public:
    /**
     * @param config Audio, transport and session settings (credentials included)
     * @param backend Creates devices and channels for each session instance
     */
    SessionController(const Config& config, std::shared_ptr<ISessionBackend> backend);

    /**
     * @brief Destructor - disconnects and joins every internal thread
     */
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    /**
     * @brief Start a conversation. Blocks until Connected or failed.
     * @param behavior_instruction Free-text instruction for the remote agent
     * @return Classified error on failure (the Error status event carries the same message)
     * @throws SessionActiveError if a session is already Connecting or Connected
     */
    Result<void> connect(const std::string& behavior_instruction);

    /**
     * @brief Release everything the session holds. Valid in any state, safe to repeat.
     */
    void disconnect();

    SessionState state() const;
    bool is_active() const;
    SessionResources resources() const;

    /// Error that ended the last instance (type None if it did not fail)
    Error last_error() const;

    /**
     * @brief Take the next event in publication order
     * @return False if none arrived within `timeout`
     */
    bool poll_event(SessionEvent& out, std::chrono::milliseconds timeout);

    size_t pending_events() const;

    const Config& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace duplex_voice
