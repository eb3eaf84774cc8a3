#pragma once

#include "common.h"
#include <memory>

namespace duplex_voice {

/**
 * @brief Lifecycle of one session instance
 *
 * - Idle -> Connecting (begin_connect)
 * - Connecting -> Connected (on_connected)
 * - Connecting | Connected -> Error (on_failure)
 * - Idle | Connecting | Connected -> Disconnected (on_disconnect)
 *
 * Disconnected and Error are terminal for the instance; reset() starts a new
 * one from Idle. Every event returns false and leaves the state alone when it
 * is not valid in the current state. Not thread-safe: the owning controller
 * serializes access.
 */
class SessionStateMachine {
public:
    SessionStateMachine();
    ~SessionStateMachine();

    SessionState get_state() const;

    bool begin_connect();
    bool on_connected();
    bool on_failure();
    bool on_disconnect();

    /// Connecting or Connected
    bool is_active() const;

    /// Disconnected or Error
    bool is_terminal() const;

    void reset();

    static bool is_valid_transition(SessionState from, SessionState to);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace duplex_voice
