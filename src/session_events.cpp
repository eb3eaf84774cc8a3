#include "session_events.h"
#include <algorithm>

namespace duplex_voice {

SessionEvent SessionEvent::status_changed(SessionState status, const std::string& message) {
    SessionEvent ev;
    ev.type = SessionEventType::StatusChanged;
    ev.status = status;
    ev.message = message;
    return ev;
}

SessionEvent SessionEvent::transcript(const std::string& text, bool is_local_speaker, bool turn_complete) {
    SessionEvent ev;
    ev.type = SessionEventType::TranscriptUpdate;
    ev.text = text;
    ev.is_local_speaker = is_local_speaker;
    ev.turn_complete = turn_complete;
    return ev;
}

SessionEvent SessionEvent::audio_level(float level) {
    SessionEvent ev;
    ev.type = SessionEventType::AudioLevel;
    ev.level = std::min(1.0f, std::max(0.0f, level));
    return ev;
}

void dispatch_event(const SessionEvent& event, const SessionCallbacks& callbacks) {
    switch (event.type) {
        case SessionEventType::StatusChanged:
            if (callbacks.on_status_change) {
                callbacks.on_status_change(event.status, event.message);
            }
            break;
        case SessionEventType::TranscriptUpdate:
            if (callbacks.on_transcript_update) {
                callbacks.on_transcript_update(event.text, event.is_local_speaker);
            }
            break;
        case SessionEventType::AudioLevel:
            if (callbacks.on_audio_level) {
                callbacks.on_audio_level(event.level);
            }
            break;
    }
}

EventQueue::EventQueue(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity), dropped_levels_(0), dropped_transcripts_(0) {}

bool EventQueue::make_room_locked(const SessionEvent& incoming) {
    auto oldest_level = std::find_if(events_.begin(), events_.end(), [](const SessionEvent& ev) {
        return ev.type == SessionEventType::AudioLevel;
    });
    if (oldest_level != events_.end()) {
        events_.erase(oldest_level);
        dropped_levels_++;
        return true;
    }
    if (incoming.type == SessionEventType::AudioLevel) {
        dropped_levels_++;
        return false;
    }
    // A running update is superseded by every later update of its turn
    auto oldest_running = std::find_if(events_.begin(), events_.end(), [](const SessionEvent& ev) {
        return ev.type == SessionEventType::TranscriptUpdate && !ev.turn_complete;
    });
    if (oldest_running != events_.end()) {
        events_.erase(oldest_running);
        dropped_transcripts_++;
    }
    return true;
}

void EventQueue::publish(SessionEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (events_.size() >= capacity_ && !make_room_locked(event)) {
            return;
        }
        events_.push_back(std::move(event));
    }
    available_.notify_one();
}

bool EventQueue::poll(SessionEvent& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!available_.wait_for(lock, timeout, [this] { return !events_.empty(); })) {
        return false;
    }
    out = std::move(events_.front());
    events_.pop_front();
    return true;
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

uint64_t EventQueue::dropped_levels() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_levels_;
}

uint64_t EventQueue::dropped_transcripts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_transcripts_;
}

} // namespace duplex_voice
