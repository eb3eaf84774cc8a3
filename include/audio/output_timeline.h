#pragma once

/**
 * @file output_timeline.h
 * @brief Sample-accurate mixing of scheduled buffers into a render window
 *
 * The output device's render callback owns the clock (frames rendered so
 * far); the playback worker places buffers on it by absolute start frame.
 */

#include "common.h"
#include <cstdint>
#include <deque>
#include <mutex>

namespace duplex_voice {
namespace audio {

/**
 * @brief Buffers placed at absolute frame positions on the device clock
 *
 * A buffer always keeps the start frame it was scheduled at. If a render
 * window has already moved past that start, only the part still ahead of
 * the clock is played and the late head is dropped, so buffers scheduled
 * back to back stay back to back.
 *
 * Thread Safety: all methods lock; render() is short and allocation-free.
 */
class OutputTimeline {
public:
    void schedule(FloatSamples samples, int64_t start_frame);

    /// Drop every buffer that has not played a sample yet
    void cancel_pending();

    void clear();

    /**
     * @brief Mix the window [window_start, window_start + frame_count) into `out`
     *
     * `out` is overwritten, then clamped to [-1, 1]. Buffers that end inside
     * or before the window are retired.
     * @return Frames skipped because their start had already passed
     */
    uint64_t render(float* out, size_t frame_count, int64_t window_start);

    size_t pending() const;

private:
    struct Entry {
        int64_t start_frame;
        FloatSamples samples;
        bool started;
    };

    mutable std::mutex mutex_;
    std::deque<Entry> entries_;
};

} // namespace audio
} // namespace duplex_voice
