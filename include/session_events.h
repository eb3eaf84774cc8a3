#pragma once

/**
 * @file session_events.h
 * @brief Typed events from a session to its caller
 *
 * Internal threads publish onto one ordered EventQueue; the caller drains it
 * with SessionController::poll_event() and, if it prefers callbacks, hands
 * each event to dispatch_event() on its own thread.
 */

#include "common.h"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

namespace duplex_voice {

enum class SessionEventType {
    StatusChanged,
    TranscriptUpdate,
    AudioLevel
};

struct SessionEvent {
    SessionEventType type = SessionEventType::StatusChanged;

    // StatusChanged
    SessionState status = SessionState::Idle;
    std::string message;         ///< Human-readable reason, set for Error

    // TranscriptUpdate
    std::string text;
    bool is_local_speaker = false;
    bool turn_complete = false;

    // AudioLevel
    float level = 0.0f;          ///< RMS of the latest captured frame, [0, 1]

    static SessionEvent status_changed(SessionState status, const std::string& message = "");
    static SessionEvent transcript(const std::string& text, bool is_local_speaker, bool turn_complete);
    static SessionEvent audio_level(float level);
};

/**
 * @brief Callback-style view of the event stream
 */
struct SessionCallbacks {
    std::function<void(const std::string& text, bool is_local_speaker)> on_transcript_update;
    std::function<void(float level)> on_audio_level;
    std::function<void(SessionState status, const std::string& message)> on_status_change;
};

/// Invoke the matching callback (if set) for one event
void dispatch_event(const SessionEvent& event, const SessionCallbacks& callbacks);

/**
 * @brief Ordered multi-producer event queue
 *
 * Capacity bounds the backlog a slow caller can build up. When full, the
 * queue makes room in this order:
 * - evict the oldest AudioLevel event (a new one is dropped if none is queued)
 * - evict the oldest running TranscriptUpdate (turn_complete == false)
 *
 * Status events and completed turns are never dropped. Past capacity the
 * backlog therefore grows by at most one event per finished turn plus the
 * handful of status changes a session makes.
 */
class EventQueue {
public:
    explicit EventQueue(size_t capacity);

    void publish(SessionEvent event);

    /**
     * @brief Take the oldest event, waiting at most `timeout`
     * @return False if nothing arrived in time
     */
    bool poll(SessionEvent& out, std::chrono::milliseconds timeout);

    size_t size() const;
    size_t capacity() const { return capacity_; }
    uint64_t dropped_levels() const;
    uint64_t dropped_transcripts() const;

private:
    /// @return False if `incoming` itself is to be dropped
    bool make_room_locked(const SessionEvent& incoming);

    size_t capacity_;
    std::deque<SessionEvent> events_;
    uint64_t dropped_levels_;
    uint64_t dropped_transcripts_;
    mutable std::mutex mutex_;
    std::condition_variable available_;
};

} // namespace duplex_voice
