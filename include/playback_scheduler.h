#pragma once

#include "common.h"
#include "errors.h"
#include "audio/device_interface.h"
#include <memory>

namespace duplex_voice {

/**
 * @brief The gapless scheduling cursor
 *
 * Holds next_start_time, the earliest device time at which the next buffer may
 * begin. Never moves backwards except through reset().
 */
class PlaybackCursor {
public:
    PlaybackCursor() : next_start_time_(0.0), initialized_(false) {}

    /**
     * @brief Claim a start time for a buffer of `duration` seconds
     * @param now Current device clock
     * @return max(next_start_time, now); the cursor then advances by `duration`
     */
    double schedule(double now, double duration) {
        if (!initialized_ || next_start_time_ < now) {
            next_start_time_ = now;  // underrun: resync forward, never backdate
            initialized_ = true;
        }
        double start = next_start_time_;
        next_start_time_ += duration;
        return start;
    }

    void reset() {
        next_start_time_ = 0.0;
        initialized_ = false;
    }

    double next_start_time() const { return next_start_time_; }
    bool initialized() const { return initialized_; }

private:
    double next_start_time_;
    bool initialized_;
};

/**
 * @brief Turns irregularly arriving audio chunks into one continuous stream
 *
 * Owns the output device. enqueue() and reset() post commands to a worker
 * thread, which is the only writer of the PlaybackCursor. Buffers start in
 * arrival order, back to back, never overlapping and never in the past.
 */
class PlaybackScheduler {
public:
    /**
     * @param device Output device (opened by start())
     * @param sample_rate Output stream rate
     * @param queue_capacity Buffers held ahead of the worker before enqueue() drops
     */
    PlaybackScheduler(std::unique_ptr<audio::IOutputDevice> device, int sample_rate, size_t queue_capacity);
    ~PlaybackScheduler();

    PlaybackScheduler(const PlaybackScheduler&) = delete;
    PlaybackScheduler& operator=(const PlaybackScheduler&) = delete;

    /**
     * @brief Open the output device and start the worker
     * @return DeviceUnavailable if the device cannot be opened
     */
    Result<void> start();

    /**
     * @brief Queue a buffer for gapless playback; ownership moves to the scheduler
     * @return False if the scheduler is not running or its queue is full (buffer discarded)
     */
    bool enqueue(DecodedAudioBuffer buffer);

    /**
     * @brief Clear the cursor and discard every buffer that has not started
     */
    void reset();

    /**
     * @brief Stop scheduling, drop queued and pending buffers, release the device.
     * Safe to call more than once.
     */
    void stop();

    /**
     * @brief Block until every command posted so far has been processed
     */
    void wait_until_idle();

    bool is_running() const;
    bool device_open() const;
    uint64_t buffers_scheduled() const;
    /// Chunks refused because the queue was full (not those refused after stop())
    uint64_t buffers_dropped() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace duplex_voice
