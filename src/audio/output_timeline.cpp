#include "audio/output_timeline.h"
#include <algorithm>

namespace duplex_voice {
namespace audio {

void OutputTimeline::schedule(FloatSamples samples, int64_t start_frame) {
    Entry entry;
    entry.start_frame = start_frame;
    entry.samples = std::move(samples);
    entry.started = false;

    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(std::move(entry));
}

void OutputTimeline::cancel_pending() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [](const Entry& e) { return !e.started; }),
                   entries_.end());
}

void OutputTimeline::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

uint64_t OutputTimeline::render(float* out, size_t frame_count, int64_t window_start) {
    if (frame_count == 0) {
        return 0;
    }
    std::fill(out, out + frame_count, 0.0f);
    const int64_t window_end = window_start + static_cast<int64_t>(frame_count);
    uint64_t late = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& e : entries_) {
        const int64_t e_end = e.start_frame + static_cast<int64_t>(e.samples.size());
        if (!e.started && e.start_frame < window_start) {
            // Head already behind the clock: skip it, keep the rest in place
            late += static_cast<uint64_t>(std::min(e_end, window_start) - e.start_frame);
        }
        const int64_t begin = std::max(e.start_frame, window_start);
        const int64_t end = std::min(e_end, window_end);
        if (begin >= end) {
            continue;
        }
        e.started = true;
        for (int64_t f = begin; f < end; ++f) {
            out[f - window_start] += e.samples[static_cast<size_t>(f - e.start_frame)];
        }
    }
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [window_end](const Entry& e) {
                                      return e.start_frame + static_cast<int64_t>(e.samples.size()) <= window_end;
                                  }),
                   entries_.end());

    for (size_t i = 0; i < frame_count; ++i) {
        out[i] = std::max(-1.0f, std::min(1.0f, out[i]));
    }
    return late;
}

size_t OutputTimeline::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace audio
} // namespace duplex_voice
