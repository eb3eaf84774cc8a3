/**
 * Output mixing on the device clock.
 * Asserts:
 * - Back-to-back buffers render back to back.
 * - A buffer whose start already passed keeps its position: the late head is
 *   skipped and the next buffer does not overlap it.
 * - cancel_pending() keeps the buffer that is playing.
 * - Mixed output is clamped.
 */

#include "audio/output_timeline.h"
#include <iostream>
#include <vector>

using namespace duplex_voice;
using namespace duplex_voice::audio;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static FloatSamples constant(size_t count, float value) {
    return FloatSamples(count, value);
}

static void test_back_to_back() {
    OutputTimeline timeline;
    timeline.schedule(constant(4, 0.1f), 0);
    timeline.schedule(constant(4, 0.2f), 4);

    std::vector<float> out(10, 9.0f);
    ASSERT(timeline.render(out.data(), out.size(), 0) == 0);
    for (size_t i = 0; i < 4; ++i) ASSERT(out[i] == 0.1f);
    for (size_t i = 4; i < 8; ++i) ASSERT(out[i] == 0.2f);
    ASSERT(out[8] == 0.0f && out[9] == 0.0f);
    ASSERT(timeline.pending() == 0);
}

static void test_late_start_keeps_alignment() {
    // The worker read the clock at frame 0, then a callback rendered [0, 4)
    // before the buffers were placed at 0 and 6
    OutputTimeline timeline;
    std::vector<float> out(4);
    timeline.render(out.data(), out.size(), 0);

    timeline.schedule(constant(6, 0.25f), 0);
    timeline.schedule(constant(4, 0.5f), 6);

    out.assign(8, 9.0f);
    ASSERT(timeline.render(out.data(), out.size(), 4) == 4);
    ASSERT(out[0] == 0.25f && out[1] == 0.25f);
    for (size_t i = 2; i < 6; ++i) ASSERT(out[i] == 0.5f);  // never summed with the late buffer
    ASSERT(out[6] == 0.0f && out[7] == 0.0f);
    ASSERT(timeline.pending() == 0);

    // Entirely in the past: dropped without playing
    timeline.schedule(constant(3, 0.75f), 2);
    out.assign(4, 9.0f);
    ASSERT(timeline.render(out.data(), out.size(), 12) == 3);
    for (float v : out) ASSERT(v == 0.0f);
    ASSERT(timeline.pending() == 0);
}

static void test_cancel_pending() {
    OutputTimeline timeline;
    timeline.schedule(constant(8, 0.1f), 0);
    timeline.schedule(constant(4, 0.2f), 8);

    std::vector<float> out(4);
    timeline.render(out.data(), out.size(), 0);
    timeline.cancel_pending();
    ASSERT(timeline.pending() == 1);

    out.assign(8, 9.0f);
    timeline.render(out.data(), out.size(), 4);
    for (size_t i = 0; i < 4; ++i) ASSERT(out[i] == 0.1f);
    for (size_t i = 4; i < 8; ++i) ASSERT(out[i] == 0.0f);
    ASSERT(timeline.pending() == 0);

    timeline.schedule(constant(4, 0.3f), 100);
    timeline.clear();
    ASSERT(timeline.pending() == 0);
}

static void test_clamp_and_empty_window() {
    OutputTimeline timeline;
    timeline.schedule(constant(2, 0.8f), 0);
    timeline.schedule(constant(2, 0.8f), 0);
    timeline.schedule(constant(2, -0.8f), 2);
    timeline.schedule(constant(2, -0.8f), 2);

    std::vector<float> out(4);
    ASSERT(timeline.render(out.data(), 0, 0) == 0);
    ASSERT(timeline.pending() == 4);
    timeline.render(out.data(), out.size(), 0);
    ASSERT(out[0] == 1.0f && out[1] == 1.0f);
    ASSERT(out[2] == -1.0f && out[3] == -1.0f);
}

int main() {
    test_back_to_back();
    test_late_start_keeps_alignment();
    test_cancel_pending();
    test_clamp_and_empty_window();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All output timeline tests passed.\n";
    return 0;
}
